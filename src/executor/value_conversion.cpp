//===----------------------------------------------------------------------===//
//                         DBRelay
//
// executor/value_conversion.cpp
//
// DuckDB <-> wire value mapping
//===----------------------------------------------------------------------===//

#include "executor/value_conversion.hpp"
#include "exception.hpp"

namespace dbrelay {

ValueType WireTypeFor(const duckdb::LogicalType& type) {
    switch (type.id()) {
        case duckdb::LogicalTypeId::BOOLEAN:
            return ValueType::BOOLEAN;
        case duckdb::LogicalTypeId::TINYINT:
        case duckdb::LogicalTypeId::SMALLINT:
        case duckdb::LogicalTypeId::INTEGER:
        case duckdb::LogicalTypeId::UTINYINT:
        case duckdb::LogicalTypeId::USMALLINT:
            return ValueType::INT32;
        case duckdb::LogicalTypeId::BIGINT:
        case duckdb::LogicalTypeId::UINTEGER:
            return ValueType::INT64;
        case duckdb::LogicalTypeId::UBIGINT:
        case duckdb::LogicalTypeId::HUGEINT:
        case duckdb::LogicalTypeId::UHUGEINT:
        case duckdb::LogicalTypeId::DECIMAL:
            return ValueType::DECIMAL;
        case duckdb::LogicalTypeId::FLOAT:
        case duckdb::LogicalTypeId::DOUBLE:
            return ValueType::DOUBLE;
        case duckdb::LogicalTypeId::BLOB:
            return ValueType::BYTES;
        case duckdb::LogicalTypeId::DATE:
            return ValueType::DATE;
        case duckdb::LogicalTypeId::TIME:
            return ValueType::TIME;
        case duckdb::LogicalTypeId::TIMESTAMP:
        case duckdb::LogicalTypeId::TIMESTAMP_TZ:
        case duckdb::LogicalTypeId::TIMESTAMP_SEC:
        case duckdb::LogicalTypeId::TIMESTAMP_MS:
        case duckdb::LogicalTypeId::TIMESTAMP_NS:
            return ValueType::TIMESTAMP;
        case duckdb::LogicalTypeId::SQLNULL:
            return ValueType::NULL_VALUE;
        default:
            // VARCHAR, UUID, INTERVAL, nested types: text
            return ValueType::STRING;
    }
}

ColumnInfo ColumnInfoFor(const std::string& name, const duckdb::LogicalType& type) {
    ColumnInfo info;
    info.name = name;
    info.type = WireTypeFor(type);
    info.type_name = type.ToString();
    // DuckDB results do not carry nullability
    info.nullable = Nullability::UNKNOWN;
    if (type.id() == duckdb::LogicalTypeId::DECIMAL) {
        info.precision = duckdb::DecimalType::GetWidth(type);
        info.scale = duckdb::DecimalType::GetScale(type);
    }
    return info;
}

Value FromDuckValue(const duckdb::Value& value) {
    if (value.IsNull()) {
        return Value::Null();
    }

    const auto& type = value.type();
    switch (type.id()) {
        case duckdb::LogicalTypeId::BOOLEAN:
            return Value::Boolean(value.GetValue<bool>());
        case duckdb::LogicalTypeId::TINYINT:
        case duckdb::LogicalTypeId::SMALLINT:
        case duckdb::LogicalTypeId::INTEGER:
        case duckdb::LogicalTypeId::UTINYINT:
        case duckdb::LogicalTypeId::USMALLINT:
            return Value::Int32(value.GetValue<int32_t>());
        case duckdb::LogicalTypeId::BIGINT:
        case duckdb::LogicalTypeId::UINTEGER:
            return Value::Int64(value.GetValue<int64_t>());
        case duckdb::LogicalTypeId::UBIGINT:
        case duckdb::LogicalTypeId::HUGEINT:
        case duckdb::LogicalTypeId::UHUGEINT:
        case duckdb::LogicalTypeId::DECIMAL:
            return Value::Decimal(value.ToString());
        case duckdb::LogicalTypeId::FLOAT:
        case duckdb::LogicalTypeId::DOUBLE:
            return Value::Double(value.GetValue<double>());
        case duckdb::LogicalTypeId::VARCHAR:
            return Value::String(duckdb::StringValue::Get(value));
        case duckdb::LogicalTypeId::BLOB: {
            const auto& raw = duckdb::StringValue::Get(value);
            return Value::Bytes(std::vector<uint8_t>(raw.begin(), raw.end()));
        }
        case duckdb::LogicalTypeId::DATE:
            return Value::Date(value.GetValue<duckdb::date_t>().days);
        case duckdb::LogicalTypeId::TIME:
            return Value::Time(value.GetValue<duckdb::dtime_t>().micros);
        case duckdb::LogicalTypeId::TIMESTAMP:
        case duckdb::LogicalTypeId::TIMESTAMP_TZ:
            return Value::Timestamp(value.GetValue<duckdb::timestamp_t>().value);
        case duckdb::LogicalTypeId::TIMESTAMP_SEC:
        case duckdb::LogicalTypeId::TIMESTAMP_MS:
        case duckdb::LogicalTypeId::TIMESTAMP_NS: {
            auto micros = value.DefaultCastAs(duckdb::LogicalType::TIMESTAMP);
            return Value::Timestamp(micros.GetValue<duckdb::timestamp_t>().value);
        }
        default:
            return Value::String(value.ToString());
    }
}

std::vector<ColumnInfo> ReadColumns(duckdb::MaterializedQueryResult& result) {
    std::vector<ColumnInfo> columns;
    columns.reserve(result.ColumnCount());
    for (duckdb::idx_t col = 0; col < result.ColumnCount(); ++col) {
        columns.push_back(ColumnInfoFor(result.ColumnName(col), result.types[col]));
    }
    return columns;
}

std::vector<std::vector<Value>> ReadRows(duckdb::MaterializedQueryResult& result, int64_t max_rows) {
    duckdb::idx_t count = result.RowCount();
    if (max_rows > 0 && static_cast<duckdb::idx_t>(max_rows) < count) {
        count = static_cast<duckdb::idx_t>(max_rows);
    }

    std::vector<std::vector<Value>> rows;
    rows.reserve(count);
    for (duckdb::idx_t row = 0; row < count; ++row) {
        std::vector<Value> values;
        values.reserve(result.ColumnCount());
        for (duckdb::idx_t col = 0; col < result.ColumnCount(); ++col) {
            values.push_back(FromDuckValue(result.GetValue(col, row)));
        }
        rows.push_back(std::move(values));
    }
    return rows;
}

duckdb::Value ToDuckValue(const Value& value, const LobResolver& resolve_lob) {
    switch (value.GetType()) {
        case ValueType::NULL_VALUE:
            return duckdb::Value();
        case ValueType::BOOLEAN:
            return duckdb::Value::BOOLEAN(value.GetBool());
        case ValueType::INT32:
            return duckdb::Value::INTEGER(value.GetInt32());
        case ValueType::INT64:
            return duckdb::Value::BIGINT(value.GetInt64());
        case ValueType::DOUBLE:
            return duckdb::Value::DOUBLE(value.GetDouble());
        case ValueType::STRING:
            return duckdb::Value(value.GetString());
        case ValueType::BYTES: {
            const auto& bytes = value.GetBytes();
            return duckdb::Value::BLOB(reinterpret_cast<duckdb::const_data_ptr_t>(bytes.data()),
                                       bytes.size());
        }
        case ValueType::DATE:
            return duckdb::Value::DATE(duckdb::date_t(value.GetDate().days));
        case ValueType::TIME:
            return duckdb::Value::TIME(duckdb::dtime_t(value.GetTime().micros));
        case ValueType::TIMESTAMP:
            return duckdb::Value::TIMESTAMP(duckdb::timestamp_t(value.GetTimestamp().micros));
        case ValueType::DECIMAL:
            return duckdb::Value(value.GetDecimal().text);
        case ValueType::LOB_REF:
            return resolve_lob(value.GetLob());
        default:
            throw RelayException(ErrorCode::INVALID_ARGUMENT,
                                 std::string("Unsupported parameter type ") + ValueTypeToString(value.GetType()));
    }
}

} // namespace dbrelay
