#pragma once

#include <istream>
#include <string>
#include <vector>

namespace CSVUtils {
// Minimal RFC 4180 reading and writing for the audit log.
constexpr size_t kMaxRecordBytes = 1024 * 1024;

std::string trimUnquotedField(const std::string& value);
void skipBOM(std::istream& is);

// Reads one record; embedded newlines inside quotes are kept. Returns an
// empty vector at end of input or for a blank line.
std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed = nullptr);

std::string escapeField(const std::string& value, char delimiter = ',');
std::string formatRow(const std::vector<std::string>& fields, char delimiter = ',');
}
