//===----------------------------------------------------------------------===//
//                         DBRelay
//
// protocol/value.hpp
//
// Typed call arguments, return values and result cells
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/byte_buffer.hpp"
#include "protocol/message_types.hpp"
#include <string>
#include <variant>
#include <vector>

namespace dbrelay {

// Wire tags; the order matches Value::Storage alternatives
enum class ValueType : uint8_t {
    NULL_VALUE  = 0,
    BOOLEAN     = 1,
    INT32       = 2,
    INT64       = 3,
    DOUBLE      = 4,
    STRING      = 5,
    BYTES       = 6,
    DATE        = 7,   // days since 1970-01-01
    TIME        = 8,   // microseconds since midnight
    TIMESTAMP   = 9,   // microseconds since epoch
    DECIMAL     = 10,  // exact decimal text
    LOB_REF     = 11,  // server LOB handle
};

const char* ValueTypeToString(ValueType type);

struct DateValue {
    int32_t days = 0;
    bool operator==(const DateValue& o) const { return days == o.days; }
};

struct TimeValue {
    int64_t micros = 0;
    bool operator==(const TimeValue& o) const { return micros == o.micros; }
};

struct TimestampValue {
    int64_t micros = 0;
    bool operator==(const TimestampValue& o) const { return micros == o.micros; }
};

struct DecimalValue {
    std::string text;
    bool operator==(const DecimalValue& o) const { return text == o.text; }
};

struct LobRef {
    uint64_t handle_id = 0;
    LobKind kind = LobKind::BLOB;
    int64_t length = 0;
    bool operator==(const LobRef& o) const {
        return handle_id == o.handle_id && kind == o.kind && length == o.length;
    }
};

class Value {
public:
    using Storage = std::variant<std::monostate, bool, int32_t, int64_t, double, std::string,
                                 std::vector<uint8_t>, DateValue, TimeValue, TimestampValue,
                                 DecimalValue, LobRef>;

    Value() = default;

    static Value Null() { return Value(); }
    static Value Boolean(bool v) { return Value(Storage(v)); }
    static Value Int32(int32_t v) { return Value(Storage(v)); }
    static Value Int64(int64_t v) { return Value(Storage(v)); }
    static Value Double(double v) { return Value(Storage(v)); }
    static Value String(std::string v) { return Value(Storage(std::move(v))); }
    static Value Bytes(std::vector<uint8_t> v) { return Value(Storage(std::move(v))); }
    static Value Date(int32_t days) { return Value(Storage(DateValue{days})); }
    static Value Time(int64_t micros) { return Value(Storage(TimeValue{micros})); }
    static Value Timestamp(int64_t micros) { return Value(Storage(TimestampValue{micros})); }
    static Value Decimal(std::string text) { return Value(Storage(DecimalValue{std::move(text)})); }
    static Value Lob(uint64_t handle_id, LobKind kind, int64_t length) {
        return Value(Storage(LobRef{handle_id, kind, length}));
    }

    ValueType GetType() const { return static_cast<ValueType>(storage.index()); }
    bool IsNull() const { return storage.index() == 0; }

    // Exact accessors; throw std::bad_variant_access on a type mismatch
    bool GetBool() const { return std::get<bool>(storage); }
    int32_t GetInt32() const { return std::get<int32_t>(storage); }
    int64_t GetInt64() const { return std::get<int64_t>(storage); }
    double GetDouble() const { return std::get<double>(storage); }
    const std::string& GetString() const { return std::get<std::string>(storage); }
    const std::vector<uint8_t>& GetBytes() const { return std::get<std::vector<uint8_t>>(storage); }
    DateValue GetDate() const { return std::get<DateValue>(storage); }
    TimeValue GetTime() const { return std::get<TimeValue>(storage); }
    TimestampValue GetTimestamp() const { return std::get<TimestampValue>(storage); }
    const DecimalValue& GetDecimal() const { return std::get<DecimalValue>(storage); }
    const LobRef& GetLob() const { return std::get<LobRef>(storage); }

    // Converting accessors used by result getters; throw std::invalid_argument
    // when the value cannot be represented
    bool AsBool() const;
    int64_t AsInt64() const;
    double AsDouble() const;
    std::string ToString() const;
    std::vector<uint8_t> AsBytes() const;

    bool operator==(const Value& other) const { return storage == other.storage; }
    bool operator!=(const Value& other) const { return !(*this == other); }

    void Encode(ByteWriter& out) const;
    static Value Decode(ByteReader& in);

private:
    explicit Value(Storage s) : storage(std::move(s)) {}

    Storage storage;
};

//===----------------------------------------------------------------------===//
// Column metadata
//===----------------------------------------------------------------------===//
namespace Nullability {
    constexpr uint8_t NO_NULLS  = 0;
    constexpr uint8_t NULLABLE  = 1;
    constexpr uint8_t UNKNOWN   = 2;
}

struct ColumnInfo {
    std::string name;
    ValueType type = ValueType::NULL_VALUE;
    std::string type_name;  // backend type name, passed through
    uint8_t nullable = Nullability::UNKNOWN;
    int32_t precision = 0;
    int32_t scale = 0;

    void Encode(ByteWriter& out) const;
    static ColumnInfo Decode(ByteReader& in);
};

// Date/time text helpers (ISO-8601)
std::string FormatDate(int32_t days);
std::string FormatTime(int64_t micros);
std::string FormatTimestamp(int64_t micros);

} // namespace dbrelay
