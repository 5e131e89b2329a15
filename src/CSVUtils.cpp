#include "CSVUtils.h"

namespace CSVUtils {
std::string trimUnquotedField(const std::string& value) {
    if (value.empty()) return value;
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

void skipBOM(std::istream& is) {
    if (!is.good()) return;

    const int first = is.peek();
    if (first == EOF || static_cast<unsigned char>(first) != 0xEF) {
        return;
    }

    is.get();
    const int second = is.peek();
    if (second == EOF || static_cast<unsigned char>(second) != 0xBB) {
        is.clear(is.rdstate() & ~std::ios::eofbit);
        is.unget();
        return;
    }

    is.get();
    const int third = is.peek();
    if (third == EOF || static_cast<unsigned char>(third) != 0xBF) {
        is.clear(is.rdstate() & ~std::ios::eofbit);
        is.unget();
        is.unget();
        return;
    }

    is.get();
}

std::vector<std::string> parseCSVLine(std::istream& is, char delimiter, bool* malformed) {
    if (malformed) *malformed = false;
    if (is.peek() == EOF) return {};

    std::vector<std::string> row;
    std::string val;
    bool inQuotes = false;
    bool currentFieldQuoted = false;
    bool hadDelimiter = false;
    size_t recordBytes = 0;
    char c;

    auto pushField = [&]() {
        row.push_back(currentFieldQuoted ? val : trimUnquotedField(val));
        val.clear();
        currentFieldQuoted = false;
    };

    while (is.get(c)) {
        if (++recordBytes > kMaxRecordBytes) {
            if (malformed) *malformed = true;
            break;
        }

        if (c == '"') {
            if (!inQuotes && val.empty() && !currentFieldQuoted) {
                inQuotes = true;
                currentFieldQuoted = true;
            } else if (inQuotes && is.peek() == '"') {
                is.get();
                val += '"';
            } else if (inQuotes) {
                inQuotes = false;
            } else {
                val += c;
            }
        } else if (c == delimiter && !inQuotes) {
            pushField();
            hadDelimiter = true;
        } else if ((c == '\n' || c == '\r') && !inQuotes) {
            if (c == '\r' && is.peek() == '\n') is.get();
            break;
        } else {
            val += c;
        }
    }

    if (inQuotes && malformed) {
        *malformed = true;
    }

    if (!hadDelimiter && !currentFieldQuoted && trimUnquotedField(val).empty()) {
        return {};
    }
    pushField();
    return row;
}

std::string escapeField(const std::string& value, char delimiter) {
    if (value.find_first_of(std::string("\"\r\n") + delimiter) == std::string::npos) {
        return value;
    }
    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string formatRow(const std::vector<std::string>& fields, char delimiter) {
    std::string line;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) line += delimiter;
        line += escapeField(fields[i], delimiter);
    }
    line += '\n';
    return line;
}
} // namespace CSVUtils
