//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/result_set.hpp
//
// Client view of a server cursor, fetched in blocks
//===----------------------------------------------------------------------===//

#pragma once

#include "client/call_dispatcher.hpp"

namespace dbrelay {
namespace client {

class Lob;

// Positions: before-first (-1), row N (0-based), after-last (total rows).
// Column indexes are 1-based.
class ResultSet : public ClientResource, public std::enable_shared_from_this<ResultSet> {
public:
    ResultSet(std::shared_ptr<CallDispatcher> dispatcher, ResultSetInfo info, uint32_t fetch_size);
    ~ResultSet() override;

    //===--------------------------------------------------------------------===//
    // Navigation
    //===--------------------------------------------------------------------===//
    bool Next();

    // Scrollable cursors only
    bool Previous();
    bool First();
    bool Last();
    bool Absolute(int64_t row);  // 1-based; negative counts from the end
    bool Relative(int64_t rows);
    void BeforeFirst();
    void AfterLast();

    bool IsBeforeFirst() const;
    bool IsAfterLast() const;
    bool IsFirst() const;
    bool IsLast() const;
    int64_t GetRow() const;  // 1-based, 0 when not on a row

    //===--------------------------------------------------------------------===//
    // Column access
    //===--------------------------------------------------------------------===//
    size_t GetColumnCount() const { return columns_.size(); }
    const std::vector<ColumnInfo>& GetColumns() const { return columns_; }
    const ColumnInfo& GetColumn(int32_t column) const;
    int32_t FindColumn(const std::string& name) const;

    const Value& GetValue(int32_t column);
    const Value& GetValue(const std::string& name) { return GetValue(FindColumn(name)); }

    bool IsNull(int32_t column) { return GetValue(column).IsNull(); }
    // Whether the last value read was SQL NULL
    bool WasNull() const { return was_null_; }

    std::string GetString(int32_t column);
    std::string GetString(const std::string& name) { return GetString(FindColumn(name)); }
    bool GetBool(int32_t column);
    int32_t GetInt32(int32_t column);
    int64_t GetInt64(int32_t column);
    int64_t GetInt64(const std::string& name) { return GetInt64(FindColumn(name)); }
    double GetDouble(int32_t column);
    std::vector<uint8_t> GetBytes(int32_t column);

    // LOB handle for a streamed value; nullptr for SQL NULL
    std::shared_ptr<Lob> GetLob(int32_t column);

    //===--------------------------------------------------------------------===//
    // Lifecycle
    //===--------------------------------------------------------------------===//
    void Close();
    bool IsClosed() const { return closed_; }
    void Invalidate() override { closed_ = true; }

    uint64_t GetCursorId() const { return cursor_id_; }
    ResultSetType GetType() const { return type_; }
    int64_t GetTotalRows() const { return total_rows_; }

private:
    void CheckOpen() const;
    void CheckScrollable(const char* operation) const;
    bool Seek(int64_t row);
    void FetchBlockFor(int64_t row);
    bool InBlock(int64_t row) const;
    int64_t AfterLastPosition() const;

private:
    std::shared_ptr<CallDispatcher> dispatcher_;
    uint64_t cursor_id_;
    ResultSetType type_;
    int64_t total_rows_;
    std::vector<ColumnInfo> columns_;
    ResultBlock block_;
    uint32_t fetch_size_;

    int64_t position_;
    bool was_null_;
    std::atomic<bool> closed_;
};

} // namespace client
} // namespace dbrelay
