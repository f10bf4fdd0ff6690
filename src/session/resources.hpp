//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/resources.hpp
//
// Server objects addressed by resource handles
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/wire_codec.hpp"
#include "duckdb.hpp"
#include <optional>

namespace dbrelay {

class PhysicalConnection;

class Resource {
public:
    Resource(uint64_t id_p, HandleKind kind_p, uint64_t parent_id_p)
        : id(id_p), kind(kind_p), parent_id(parent_id_p) {}
    virtual ~Resource() = default;

    uint64_t GetId() const { return id; }
    HandleKind GetKind() const { return kind; }
    uint64_t GetParentId() const { return parent_id; }

private:
    uint64_t id;
    HandleKind kind;
    uint64_t parent_id;
};

const char* HandleKindToString(HandleKind kind);

//===----------------------------------------------------------------------===//
// Statement
//===----------------------------------------------------------------------===//
class ServerStatement : public Resource {
public:
    static constexpr HandleKind KIND = HandleKind::STATEMENT;

    ServerStatement(uint64_t id_p, uint64_t parent_p, std::optional<std::string> sql_p)
        : Resource(id_p, KIND, parent_p), sql(std::move(sql_p)) {}

    // Fixed SQL of a prepared statement; absent for plain statements
    const std::optional<std::string>& GetSql() const { return sql; }

    // Prepared form for the given connection, re-preparing when the statement
    // last ran on another connection or before a reset
    duckdb::PreparedStatement& PrepareOn(PhysicalConnection& conn);

    // Backend-reported parameter count; -1 until first prepared
    int32_t GetParameterCount() const { return parameter_count; }

    StatementOptions options;

    // SQL was extended with RETURNING for generated keys
    bool returns_keys = false;

private:
    std::optional<std::string> sql;
    duckdb::unique_ptr<duckdb::PreparedStatement> prepared;
    uint64_t prepared_conn_id = 0;
    uint64_t prepared_epoch = 0;
    int32_t parameter_count = -1;
};

//===----------------------------------------------------------------------===//
// Cursor (materialized result)
//===----------------------------------------------------------------------===//
class ServerCursor : public Resource {
public:
    static constexpr HandleKind KIND = HandleKind::CURSOR;

    ServerCursor(uint64_t id_p, uint64_t parent_p, ResultSetType type_p,
                 std::vector<ColumnInfo> columns_p, std::vector<std::vector<Value>> rows_p)
        : Resource(id_p, KIND, parent_p)
        , type(type_p)
        , columns(std::move(columns_p))
        , rows(std::move(rows_p)) {}

    ResultSetType GetType() const { return type; }
    bool IsScrollable() const { return type != ResultSetType::FORWARD_ONLY; }
    const std::vector<ColumnInfo>& GetColumns() const { return columns; }
    std::vector<std::vector<Value>>& MutableRows() { return rows; }
    uint64_t RowCount() const { return rows.size(); }

    // Rows [start_row, start_row + max_rows). Forward-only cursors refuse to
    // go back before rows already delivered.
    ResultBlock Fetch(uint64_t start_row, uint32_t max_rows);

    // Description plus first block for an execute response
    ResultSetInfo Describe(uint32_t first_block_rows);

private:
    ResultSetType type;
    std::vector<ColumnInfo> columns;
    std::vector<std::vector<Value>> rows;
    uint64_t delivered_until = 0;
};

//===----------------------------------------------------------------------===//
// Large object
//===----------------------------------------------------------------------===//
class ServerLob : public Resource {
public:
    static constexpr HandleKind KIND = HandleKind::LOB;

    ServerLob(uint64_t id_p, uint64_t parent_p, LobKind lob_kind_p, std::vector<uint8_t> data_p = {})
        : Resource(id_p, KIND, parent_p), lob_kind(lob_kind_p), data(std::move(data_p)) {}

    LobKind GetLobKind() const { return lob_kind; }
    int64_t Length() const { return static_cast<int64_t>(data.size()); }
    const std::vector<uint8_t>& Data() const { return data; }

    // Bytes [offset, offset + length) clipped to the value
    std::vector<uint8_t> Read(int64_t offset, int64_t length) const;

    void Truncate(int64_t length);

    // Chunked write: staged until the final chunk, then swapped in
    void BeginWrite(uint64_t request_id, bool replace);
    bool IsWriting(uint64_t request_id) const { return writing && write_request_id == request_id; }
    void AppendChunk(uint32_t sequence, const std::vector<uint8_t>& bytes);
    // Applies the staged value; throws if the stream was out of order
    int64_t FinishWrite(uint32_t sequence, const std::vector<uint8_t>& bytes);
    void AbortWrite();

    Value ToValue() const { return Value::Lob(GetId(), lob_kind, Length()); }

private:
    LobKind lob_kind;
    std::vector<uint8_t> data;

    bool writing = false;
    uint64_t write_request_id = 0;
    uint32_t next_sequence = 0;
    std::vector<uint8_t> staging;
    std::string write_error;
};

} // namespace dbrelay
