#pragma once

#include "HeliosExceptions.h"

#include <algorithm>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>

// Little-endian primitives and FNV-1a checksumming shared by the artifact
// file formats.
namespace BinaryIO {

constexpr uint64_t kChecksumOffsetBasis = 1469598103934665603ULL;
constexpr uint64_t kChecksumPrime = 1099511628211ULL;

inline bool isLittleEndian() {
    uint16_t number = 0x1;
    const auto* bytes = reinterpret_cast<const char*>(&number);
    return bytes[0] == 1;
}

template <typename T>
void swapEndian(T& val) {
    auto* first = reinterpret_cast<unsigned char*>(&val);
    std::reverse(first, first + sizeof(T));
}

template <typename T>
void updateChecksum(uint64_t& checksum, const T& value) {
    T copy = value;
    if (!isLittleEndian()) swapEndian(copy);
    const auto* bytes = reinterpret_cast<const unsigned char*>(&copy);
    for (size_t i = 0; i < sizeof(T); ++i) {
        checksum ^= static_cast<uint64_t>(bytes[i]);
        checksum *= kChecksumPrime;
    }
}

template <typename T>
void writeLE(std::ostream& out, T value) {
    if (!isLittleEndian()) swapEndian(value);
    out.write(reinterpret_cast<const char*>(&value), sizeof(T));
    if (!out) throw Helios::IOException("Binary write failed");
}

template <typename T>
void readLE(std::istream& in, T& value) {
    in.read(reinterpret_cast<char*>(&value), sizeof(T));
    if (!in) throw Helios::ArtifactException("Binary read failed or artifact file is truncated");
    if (!isLittleEndian()) swapEndian(value);
}

// Writer/reader pair that folds every value into the running checksum.
class ChecksumWriter {
public:
    explicit ChecksumWriter(std::ostream& outRef) : out(outRef) {}

    template <typename T>
    void put(T value) {
        writeLE(out, value);
        updateChecksum(checksum, value);
    }

    void finish() { writeLE(out, checksum); }

private:
    std::ostream& out;
    uint64_t checksum = kChecksumOffsetBasis;
};

class ChecksumReader {
public:
    explicit ChecksumReader(std::istream& inRef) : in(inRef) {}

    template <typename T>
    T get() {
        T value{};
        readLE(in, value);
        updateChecksum(checksum, value);
        return value;
    }

    /// @throws Helios::ArtifactException when the stored checksum differs.
    void verify(const std::string& source) {
        uint64_t stored = 0;
        readLE(in, stored);
        if (stored != checksum) {
            throw Helios::ArtifactException("Checksum mismatch (corrupt file): " + source);
        }
    }

private:
    std::istream& in;
    uint64_t checksum = kChecksumOffsetBasis;
};

} // namespace BinaryIO
