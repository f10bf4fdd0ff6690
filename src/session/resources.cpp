//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/resources.cpp
//
// Statement, cursor and LOB objects
//===----------------------------------------------------------------------===//

#include "session/resources.hpp"
#include "exception.hpp"
#include "session/physical_connection.hpp"
#include <algorithm>

namespace dbrelay {

const char* HandleKindToString(HandleKind kind) {
    switch (kind) {
        case HandleKind::SESSION:   return "session";
        case HandleKind::STATEMENT: return "statement";
        case HandleKind::CURSOR:    return "cursor";
        case HandleKind::LOB:       return "lob";
        default:                    return "unknown";
    }
}

//===----------------------------------------------------------------------===//
// ServerStatement
//===----------------------------------------------------------------------===//
duckdb::PreparedStatement& ServerStatement::PrepareOn(PhysicalConnection& conn) {
    if (!sql) {
        throw RelayException(ErrorCode::INVALID_STATE, "Statement has no SQL to prepare");
    }
    if (!prepared || prepared_conn_id != conn.GetId() || prepared_epoch != conn.GetEpoch()) {
        prepared.reset();
        prepared = conn.Prepare(*sql);
        prepared_conn_id = conn.GetId();
        prepared_epoch = conn.GetEpoch();
        parameter_count = static_cast<int32_t>(prepared->named_param_map.size());
    }
    return *prepared;
}

//===----------------------------------------------------------------------===//
// ServerCursor
//===----------------------------------------------------------------------===//
ResultBlock ServerCursor::Fetch(uint64_t start_row, uint32_t max_rows) {
    if (!IsScrollable() && start_row < delivered_until) {
        throw RelayException(ErrorCode::INVALID_STATE,
                             "Cursor " + std::to_string(GetId()) + " is forward-only; row " +
                             std::to_string(start_row) + " was already passed");
    }

    ResultBlock block;
    block.start_row = start_row;
    if (start_row < rows.size()) {
        uint64_t end = std::min<uint64_t>(rows.size(), start_row + max_rows);
        block.rows.assign(rows.begin() + static_cast<std::ptrdiff_t>(start_row),
                          rows.begin() + static_cast<std::ptrdiff_t>(end));
        block.last = end >= rows.size();
        delivered_until = std::max(delivered_until, end);
    } else {
        block.last = true;
        delivered_until = std::max<uint64_t>(delivered_until, rows.size());
    }
    return block;
}

ResultSetInfo ServerCursor::Describe(uint32_t first_block_rows) {
    ResultSetInfo info;
    info.cursor_id = GetId();
    info.type = type;
    info.total_rows = static_cast<int64_t>(rows.size());
    info.columns = columns;
    info.block = Fetch(0, first_block_rows);
    return info;
}

//===----------------------------------------------------------------------===//
// ServerLob
//===----------------------------------------------------------------------===//
std::vector<uint8_t> ServerLob::Read(int64_t offset, int64_t length) const {
    if (offset < 0 || length < 0) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT, "LOB offset and length must not be negative");
    }
    auto size = static_cast<int64_t>(data.size());
    if (offset >= size) {
        return {};
    }
    int64_t end = std::min(size, offset + length);
    return std::vector<uint8_t>(data.begin() + offset, data.begin() + end);
}

void ServerLob::Truncate(int64_t length) {
    if (length < 0) {
        throw RelayException(ErrorCode::INVALID_ARGUMENT, "LOB length must not be negative");
    }
    if (writing) {
        throw RelayException(ErrorCode::INVALID_STATE, "LOB is being written");
    }
    if (static_cast<uint64_t>(length) < data.size()) {
        data.resize(static_cast<size_t>(length));
    }
}

void ServerLob::BeginWrite(uint64_t request_id, bool replace) {
    if (writing) {
        throw RelayException(ErrorCode::INVALID_STATE,
                             "LOB " + std::to_string(GetId()) + " already has a write in progress");
    }
    writing = true;
    write_request_id = request_id;
    next_sequence = 0;
    write_error.clear();
    staging.clear();
    if (!replace) {
        staging = data;
    }
}

void ServerLob::AppendChunk(uint32_t sequence, const std::vector<uint8_t>& bytes) {
    if (!write_error.empty()) {
        return;
    }
    if (sequence != next_sequence) {
        write_error = "LOB chunk out of order: expected " + std::to_string(next_sequence) +
                      ", got " + std::to_string(sequence);
        staging.clear();
        return;
    }
    staging.insert(staging.end(), bytes.begin(), bytes.end());
    next_sequence++;
}

int64_t ServerLob::FinishWrite(uint32_t sequence, const std::vector<uint8_t>& bytes) {
    AppendChunk(sequence, bytes);
    writing = false;
    if (!write_error.empty()) {
        std::string error = std::move(write_error);
        write_error.clear();
        staging.clear();
        throw RelayException(ErrorCode::PROTOCOL_ERROR, error);
    }
    data.swap(staging);
    staging.clear();
    staging.shrink_to_fit();
    return Length();
}

void ServerLob::AbortWrite() {
    writing = false;
    write_error.clear();
    staging.clear();
}

} // namespace dbrelay
