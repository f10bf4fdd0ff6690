//===----------------------------------------------------------------------===//
//                         DBRelay
//
// executor/value_conversion.hpp
//
// Conversion between DuckDB values and wire values
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/value.hpp"
#include "duckdb.hpp"
#include <functional>

namespace dbrelay {

// Wire type used for a DuckDB column type
ValueType WireTypeFor(const duckdb::LogicalType& type);

ColumnInfo ColumnInfoFor(const std::string& name, const duckdb::LogicalType& type);

// Result cell to wire value. Types without a wire form travel as their text.
Value FromDuckValue(const duckdb::Value& value);

// Materialize all rows of a result, stopping after max_rows (0 = all)
std::vector<std::vector<Value>> ReadRows(duckdb::MaterializedQueryResult& result, int64_t max_rows);

std::vector<ColumnInfo> ReadColumns(duckdb::MaterializedQueryResult& result);

// Resolves a LOB reference argument to its content
using LobResolver = std::function<duckdb::Value(const LobRef&)>;

// Parameter value to DuckDB. Decimals are bound as text and cast by the backend.
duckdb::Value ToDuckValue(const Value& value, const LobResolver& resolve_lob);

} // namespace dbrelay
