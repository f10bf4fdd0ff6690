//===----------------------------------------------------------------------===//
//                         DBRelay
//
// protocol/byte_buffer.hpp
//
// Little-endian payload writer/reader
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>

namespace dbrelay {

// Thrown when a payload is truncated or malformed
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {}
};

//===----------------------------------------------------------------------===//
// Writer
//===----------------------------------------------------------------------===//
class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(size_t reserve) { buffer.reserve(reserve); }

    void WriteUInt8(uint8_t v) { buffer.push_back(v); }
    void WriteBool(bool v) { buffer.push_back(v ? 1 : 0); }

    void WriteUInt16(uint16_t v) {
        buffer.push_back(v & 0xFF);
        buffer.push_back((v >> 8) & 0xFF);
    }

    void WriteUInt32(uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            buffer.push_back((v >> (i * 8)) & 0xFF);
        }
    }

    void WriteUInt64(uint64_t v) {
        for (int i = 0; i < 8; ++i) {
            buffer.push_back((v >> (i * 8)) & 0xFF);
        }
    }

    void WriteInt32(int32_t v) { WriteUInt32(static_cast<uint32_t>(v)); }
    void WriteInt64(int64_t v) { WriteUInt64(static_cast<uint64_t>(v)); }

    void WriteDouble(double v) {
        uint64_t bits;
        std::memcpy(&bits, &v, sizeof(bits));
        WriteUInt64(bits);
    }

    // u32 length + bytes
    void WriteString(const std::string& s) {
        WriteUInt32(static_cast<uint32_t>(s.size()));
        buffer.insert(buffer.end(), s.begin(), s.end());
    }

    void WriteBytes(const std::vector<uint8_t>& b) {
        WriteUInt32(static_cast<uint32_t>(b.size()));
        buffer.insert(buffer.end(), b.begin(), b.end());
    }

    void WriteBytes(const uint8_t* data, size_t len) {
        WriteUInt32(static_cast<uint32_t>(len));
        buffer.insert(buffer.end(), data, data + len);
    }

    size_t Size() const { return buffer.size(); }
    std::vector<uint8_t>& Buffer() { return buffer; }
    std::vector<uint8_t> Release() { return std::move(buffer); }

private:
    std::vector<uint8_t> buffer;
};

//===----------------------------------------------------------------------===//
// Reader
//===----------------------------------------------------------------------===//
class ByteReader {
public:
    ByteReader(const uint8_t* data_p, size_t len_p, const char* what_p = "payload")
        : data(data_p), len(len_p), pos(0), what(what_p) {}

    explicit ByteReader(const std::vector<uint8_t>& buf, const char* what_p = "payload")
        : data(buf.data()), len(buf.size()), pos(0), what(what_p) {}

    bool HasRemaining(size_t bytes = 1) const {
        return pos + bytes <= len;
    }

    size_t Remaining() const {
        return len - pos;
    }

    uint8_t ReadUInt8() {
        Require(1, "byte");
        return data[pos++];
    }

    bool ReadBool() {
        return ReadUInt8() != 0;
    }

    uint16_t ReadUInt16() {
        Require(2, "u16");
        uint16_t v = static_cast<uint16_t>(data[pos] | (data[pos + 1] << 8));
        pos += 2;
        return v;
    }

    uint32_t ReadUInt32() {
        Require(4, "u32");
        uint32_t v = 0;
        for (int i = 0; i < 4; ++i) {
            v |= static_cast<uint32_t>(data[pos + i]) << (i * 8);
        }
        pos += 4;
        return v;
    }

    uint64_t ReadUInt64() {
        Require(8, "u64");
        uint64_t v = 0;
        for (int i = 0; i < 8; ++i) {
            v |= static_cast<uint64_t>(data[pos + i]) << (i * 8);
        }
        pos += 8;
        return v;
    }

    int32_t ReadInt32() { return static_cast<int32_t>(ReadUInt32()); }
    int64_t ReadInt64() { return static_cast<int64_t>(ReadUInt64()); }

    double ReadDouble() {
        uint64_t bits = ReadUInt64();
        double v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    std::string ReadString() {
        uint32_t n = ReadUInt32();
        Require(n, "string");
        std::string s(reinterpret_cast<const char*>(data + pos), n);
        pos += n;
        return s;
    }

    std::vector<uint8_t> ReadBytes() {
        uint32_t n = ReadUInt32();
        Require(n, "bytes");
        std::vector<uint8_t> b(data + pos, data + pos + n);
        pos += n;
        return b;
    }

    // Element count that is about to be read; each element needs at least min_size bytes
    uint32_t ReadCount(size_t min_size = 1) {
        uint32_t n = ReadUInt32();
        if (min_size > 0 && static_cast<uint64_t>(n) * min_size > Remaining()) {
            throw DecodeError(std::string(what) + " truncated: count " + std::to_string(n) +
                              " exceeds remaining bytes");
        }
        return n;
    }

private:
    void Require(size_t n, const char* field) const {
        if (!HasRemaining(n)) {
            throw DecodeError(std::string(what) + " truncated at " + field);
        }
    }

    const uint8_t* data;
    size_t len;
    size_t pos;
    const char* what;
};

} // namespace dbrelay
