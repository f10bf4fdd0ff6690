//===----------------------------------------------------------------------===//
//                         DBRelay
//
// protocol/value.cpp
//
// Value encoding and conversions
//===----------------------------------------------------------------------===//

#include "protocol/value.hpp"
#include <cerrno>
#include <cinttypes>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace dbrelay {

const char* ValueTypeToString(ValueType type) {
    switch (type) {
        case ValueType::NULL_VALUE: return "NULL";
        case ValueType::BOOLEAN:    return "BOOLEAN";
        case ValueType::INT32:      return "INT32";
        case ValueType::INT64:      return "INT64";
        case ValueType::DOUBLE:     return "DOUBLE";
        case ValueType::STRING:     return "STRING";
        case ValueType::BYTES:      return "BYTES";
        case ValueType::DATE:       return "DATE";
        case ValueType::TIME:       return "TIME";
        case ValueType::TIMESTAMP:  return "TIMESTAMP";
        case ValueType::DECIMAL:    return "DECIMAL";
        case ValueType::LOB_REF:    return "LOB_REF";
        default:                    return "UNKNOWN";
    }
}

//===----------------------------------------------------------------------===//
// Date/time formatting
//===----------------------------------------------------------------------===//
namespace {

// Days since epoch -> civil date (proleptic Gregorian)
void CivilFromDays(int64_t z, int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    if (m <= 2) {
        y++;
    }
}

int64_t FloorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        q--;
    }
    return q;
}

std::string TimeOfDay(int64_t micros) {
    int64_t secs = micros / 1000000;
    int64_t frac = micros % 1000000;
    char buf[32];
    if (frac == 0) {
        std::snprintf(buf, sizeof(buf), "%02" PRId64 ":%02" PRId64 ":%02" PRId64,
                      secs / 3600, (secs / 60) % 60, secs % 60);
    } else {
        std::snprintf(buf, sizeof(buf), "%02" PRId64 ":%02" PRId64 ":%02" PRId64 ".%06" PRId64,
                      secs / 3600, (secs / 60) % 60, secs % 60, frac);
    }
    return buf;
}

} // namespace

std::string FormatDate(int32_t days) {
    int64_t y;
    unsigned m, d;
    CivilFromDays(days, y, m, d);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04" PRId64 "-%02u-%02u", y, m, d);
    return buf;
}

std::string FormatTime(int64_t micros) {
    return TimeOfDay(micros);
}

std::string FormatTimestamp(int64_t micros) {
    constexpr int64_t MICROS_PER_DAY = 86400LL * 1000000LL;
    int64_t days = FloorDiv(micros, MICROS_PER_DAY);
    int64_t rem = micros - days * MICROS_PER_DAY;
    return FormatDate(static_cast<int32_t>(days)) + " " + TimeOfDay(rem);
}

//===----------------------------------------------------------------------===//
// Conversions
//===----------------------------------------------------------------------===//
bool Value::AsBool() const {
    switch (GetType()) {
        case ValueType::NULL_VALUE: return false;
        case ValueType::BOOLEAN:    return GetBool();
        case ValueType::INT32:      return GetInt32() != 0;
        case ValueType::INT64:      return GetInt64() != 0;
        case ValueType::DOUBLE:     return GetDouble() != 0.0;
        case ValueType::DECIMAL:    return AsDouble() != 0.0;
        case ValueType::STRING: {
            const auto& s = GetString();
            if (s == "true" || s == "TRUE" || s == "t" || s == "1") return true;
            if (s == "false" || s == "FALSE" || s == "f" || s == "0") return false;
            break;
        }
        default:
            break;
    }
    throw std::invalid_argument(std::string("Cannot convert ") + ValueTypeToString(GetType()) +
                                " to BOOLEAN");
}

int64_t Value::AsInt64() const {
    switch (GetType()) {
        case ValueType::NULL_VALUE: return 0;
        case ValueType::BOOLEAN:    return GetBool() ? 1 : 0;
        case ValueType::INT32:      return GetInt32();
        case ValueType::INT64:      return GetInt64();
        case ValueType::DOUBLE: {
            double d = GetDouble();
            if (std::isnan(d) || d < -9.2233720368547758e18 || d >= 9.2233720368547758e18) {
                break;
            }
            return static_cast<int64_t>(d);
        }
        case ValueType::STRING:
        case ValueType::DECIMAL: {
            const std::string& s = GetType() == ValueType::STRING ? GetString() : GetDecimal().text;
            errno = 0;
            char* end = nullptr;
            long long v = std::strtoll(s.c_str(), &end, 10);
            if (errno == 0 && end != s.c_str() && (*end == '\0' || *end == '.')) {
                return v;
            }
            break;
        }
        default:
            break;
    }
    throw std::invalid_argument(std::string("Cannot convert ") + ValueTypeToString(GetType()) +
                                " to an integer");
}

double Value::AsDouble() const {
    switch (GetType()) {
        case ValueType::NULL_VALUE: return 0.0;
        case ValueType::BOOLEAN:    return GetBool() ? 1.0 : 0.0;
        case ValueType::INT32:      return GetInt32();
        case ValueType::INT64:      return static_cast<double>(GetInt64());
        case ValueType::DOUBLE:     return GetDouble();
        case ValueType::STRING:
        case ValueType::DECIMAL: {
            const std::string& s = GetType() == ValueType::STRING ? GetString() : GetDecimal().text;
            char* end = nullptr;
            double v = std::strtod(s.c_str(), &end);
            if (end != s.c_str() && *end == '\0') {
                return v;
            }
            break;
        }
        default:
            break;
    }
    throw std::invalid_argument(std::string("Cannot convert ") + ValueTypeToString(GetType()) +
                                " to DOUBLE");
}

std::string Value::ToString() const {
    switch (GetType()) {
        case ValueType::NULL_VALUE: return "";
        case ValueType::BOOLEAN:    return GetBool() ? "true" : "false";
        case ValueType::INT32:      return std::to_string(GetInt32());
        case ValueType::INT64:      return std::to_string(GetInt64());
        case ValueType::DOUBLE: {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%.17g", GetDouble());
            return buf;
        }
        case ValueType::STRING:     return GetString();
        case ValueType::BYTES: {
            const auto& b = GetBytes();
            return std::string(b.begin(), b.end());
        }
        case ValueType::DATE:       return FormatDate(GetDate().days);
        case ValueType::TIME:       return FormatTime(GetTime().micros);
        case ValueType::TIMESTAMP:  return FormatTimestamp(GetTimestamp().micros);
        case ValueType::DECIMAL:    return GetDecimal().text;
        case ValueType::LOB_REF:
            return "<lob:" + std::to_string(GetLob().handle_id) + ">";
        default:
            return "";
    }
}

std::vector<uint8_t> Value::AsBytes() const {
    switch (GetType()) {
        case ValueType::NULL_VALUE: return {};
        case ValueType::BYTES:      return GetBytes();
        case ValueType::STRING: {
            const auto& s = GetString();
            return std::vector<uint8_t>(s.begin(), s.end());
        }
        default:
            break;
    }
    throw std::invalid_argument(std::string("Cannot convert ") + ValueTypeToString(GetType()) +
                                " to BYTES");
}

//===----------------------------------------------------------------------===//
// Encoding: u8 tag followed by the type's body
//===----------------------------------------------------------------------===//
void Value::Encode(ByteWriter& out) const {
    out.WriteUInt8(static_cast<uint8_t>(GetType()));
    switch (GetType()) {
        case ValueType::NULL_VALUE: break;
        case ValueType::BOOLEAN:    out.WriteBool(GetBool()); break;
        case ValueType::INT32:      out.WriteInt32(GetInt32()); break;
        case ValueType::INT64:      out.WriteInt64(GetInt64()); break;
        case ValueType::DOUBLE:     out.WriteDouble(GetDouble()); break;
        case ValueType::STRING:     out.WriteString(GetString()); break;
        case ValueType::BYTES:      out.WriteBytes(GetBytes()); break;
        case ValueType::DATE:       out.WriteInt32(GetDate().days); break;
        case ValueType::TIME:       out.WriteInt64(GetTime().micros); break;
        case ValueType::TIMESTAMP:  out.WriteInt64(GetTimestamp().micros); break;
        case ValueType::DECIMAL:    out.WriteString(GetDecimal().text); break;
        case ValueType::LOB_REF: {
            const auto& lob = GetLob();
            out.WriteUInt64(lob.handle_id);
            out.WriteUInt8(static_cast<uint8_t>(lob.kind));
            out.WriteInt64(lob.length);
            break;
        }
    }
}

Value Value::Decode(ByteReader& in) {
    uint8_t tag = in.ReadUInt8();
    switch (static_cast<ValueType>(tag)) {
        case ValueType::NULL_VALUE: return Null();
        case ValueType::BOOLEAN:    return Boolean(in.ReadBool());
        case ValueType::INT32:      return Int32(in.ReadInt32());
        case ValueType::INT64:      return Int64(in.ReadInt64());
        case ValueType::DOUBLE:     return Double(in.ReadDouble());
        case ValueType::STRING:     return String(in.ReadString());
        case ValueType::BYTES:      return Bytes(in.ReadBytes());
        case ValueType::DATE:       return Date(in.ReadInt32());
        case ValueType::TIME:       return Time(in.ReadInt64());
        case ValueType::TIMESTAMP:  return Timestamp(in.ReadInt64());
        case ValueType::DECIMAL:    return Decimal(in.ReadString());
        case ValueType::LOB_REF: {
            uint64_t id = in.ReadUInt64();
            uint8_t kind = in.ReadUInt8();
            if (kind != static_cast<uint8_t>(LobKind::BLOB) && kind != static_cast<uint8_t>(LobKind::CLOB)) {
                throw DecodeError("Unknown LOB kind " + std::to_string(kind));
            }
            int64_t length = in.ReadInt64();
            return Lob(id, static_cast<LobKind>(kind), length);
        }
    }
    throw DecodeError("Unknown value type tag " + std::to_string(tag));
}

void ColumnInfo::Encode(ByteWriter& out) const {
    out.WriteString(name);
    out.WriteUInt8(static_cast<uint8_t>(type));
    out.WriteString(type_name);
    out.WriteUInt8(nullable);
    out.WriteInt32(precision);
    out.WriteInt32(scale);
}

ColumnInfo ColumnInfo::Decode(ByteReader& in) {
    ColumnInfo col;
    col.name = in.ReadString();
    uint8_t type = in.ReadUInt8();
    if (type > static_cast<uint8_t>(ValueType::LOB_REF)) {
        throw DecodeError("Unknown column type tag " + std::to_string(type));
    }
    col.type = static_cast<ValueType>(type);
    col.type_name = in.ReadString();
    col.nullable = in.ReadUInt8();
    col.precision = in.ReadInt32();
    col.scale = in.ReadInt32();
    return col;
}

} // namespace dbrelay
