//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/result_set.cpp
//
// Block-wise cursor navigation and typed getters
//===----------------------------------------------------------------------===//

#include "client/result_set.hpp"
#include "client/errors.hpp"
#include "client/lob.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace dbrelay {
namespace client {

namespace {

[[noreturn]] void ConversionFailed(int32_t column, const std::exception& e) {
    throw DatabaseError(ErrorCode::CONVERSION_ERROR,
                        "Column " + std::to_string(column) + ": " + e.what());
}

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

} // namespace

ResultSet::ResultSet(std::shared_ptr<CallDispatcher> dispatcher, ResultSetInfo info, uint32_t fetch_size)
    : dispatcher_(std::move(dispatcher))
    , cursor_id_(info.cursor_id)
    , type_(info.type)
    , total_rows_(info.total_rows)
    , columns_(std::move(info.columns))
    , block_(std::move(info.block))
    , fetch_size_(fetch_size > 0 ? fetch_size : DEFAULT_FETCH_SIZE)
    , position_(-1)
    , was_null_(false)
    , closed_(false) {
}

ResultSet::~ResultSet() = default;

void ResultSet::CheckOpen() const {
    if (closed_) {
        throw ResourceLifecycleError(ErrorCode::HANDLE_CLOSED,
                                     "Result set " + std::to_string(cursor_id_) + " is closed");
    }
}

void ResultSet::CheckScrollable(const char* operation) const {
    CheckOpen();
    if (type_ == ResultSetType::FORWARD_ONLY) {
        throw ProtocolError(ErrorCode::INVALID_STATE,
                            std::string(operation) + " requires a scrollable result set");
    }
}

bool ResultSet::InBlock(int64_t row) const {
    auto start = static_cast<int64_t>(block_.start_row);
    return row >= start && row < start + static_cast<int64_t>(block_.rows.size());
}

int64_t ResultSet::AfterLastPosition() const {
    if (total_rows_ >= 0) {
        return total_rows_;
    }
    return static_cast<int64_t>(block_.start_row + block_.rows.size());
}

void ResultSet::FetchBlockFor(int64_t row) {
    int64_t start = row;
    if (type_ != ResultSetType::FORWARD_ONLY) {
        start = (row / fetch_size_) * fetch_size_;
    }

    std::vector<Value> args;
    args.push_back(Value::Int64(start));
    args.push_back(Value::Int32(static_cast<int32_t>(fetch_size_)));
    auto response = dispatcher_->Invoke(OpCode::CURSOR_FETCH, cursor_id_, std::move(args));
    if (!response.block) {
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR, "CURSOR_FETCH response carries no rows");
    }
    block_ = std::move(*response.block);
    if (block_.last) {
        total_rows_ = static_cast<int64_t>(block_.start_row + block_.rows.size());
    }
}

bool ResultSet::Seek(int64_t row) {
    CheckOpen();
    if (row < 0) {
        position_ = -1;
        return false;
    }
    if (total_rows_ >= 0 && row >= total_rows_) {
        position_ = total_rows_;
        return false;
    }
    if (!InBlock(row)) {
        if (block_.last && row >= static_cast<int64_t>(block_.start_row + block_.rows.size())) {
            position_ = AfterLastPosition();
            return false;
        }
        FetchBlockFor(row);
        if (!InBlock(row)) {
            position_ = AfterLastPosition();
            return false;
        }
    }
    position_ = row;
    return true;
}

bool ResultSet::Next() {
    CheckOpen();
    if (position_ >= AfterLastPosition() && (total_rows_ >= 0 || block_.last)) {
        return false;
    }
    return Seek(position_ + 1);
}

bool ResultSet::Previous() {
    CheckScrollable("Previous");
    if (position_ < 0) {
        return false;
    }
    return Seek(position_ - 1);
}

bool ResultSet::First() {
    CheckScrollable("First");
    return Seek(0);
}

bool ResultSet::Last() {
    CheckScrollable("Last");
    if (total_rows_ < 0) {
        while (Next()) {
        }
    }
    return Seek(total_rows_ - 1);
}

bool ResultSet::Absolute(int64_t row) {
    CheckScrollable("Absolute");
    if (row == 0) {
        position_ = -1;
        return false;
    }
    if (row > 0) {
        return Seek(row - 1);
    }
    if (total_rows_ < 0) {
        Last();
    }
    int64_t target = total_rows_ + row;
    if (target < 0) {
        position_ = -1;
        return false;
    }
    return Seek(target);
}

bool ResultSet::Relative(int64_t rows) {
    CheckScrollable("Relative");
    int64_t target = position_ + rows;
    return Seek(target < -1 ? -1 : target);
}

void ResultSet::BeforeFirst() {
    CheckScrollable("BeforeFirst");
    position_ = -1;
}

void ResultSet::AfterLast() {
    CheckScrollable("AfterLast");
    if (total_rows_ < 0) {
        Last();
    }
    position_ = total_rows_;
}

bool ResultSet::IsBeforeFirst() const {
    return position_ < 0 && total_rows_ != 0;
}

bool ResultSet::IsAfterLast() const {
    return total_rows_ > 0 && position_ >= total_rows_;
}

bool ResultSet::IsFirst() const {
    return position_ == 0 && total_rows_ != 0;
}

bool ResultSet::IsLast() const {
    return total_rows_ > 0 && position_ == total_rows_ - 1;
}

int64_t ResultSet::GetRow() const {
    if (position_ < 0 || (total_rows_ >= 0 && position_ >= total_rows_)) {
        return 0;
    }
    return position_ + 1;
}

//===----------------------------------------------------------------------===//
// Column access
//===----------------------------------------------------------------------===//

const ColumnInfo& ResultSet::GetColumn(int32_t column) const {
    if (column < 1 || static_cast<size_t>(column) > columns_.size()) {
        throw ResourceLifecycleError(ErrorCode::COLUMN_OUT_OF_RANGE,
                                     "Column index " + std::to_string(column) + " out of range (1.." +
                                     std::to_string(columns_.size()) + ")");
    }
    return columns_[column - 1];
}

int32_t ResultSet::FindColumn(const std::string& name) const {
    for (size_t i = 0; i < columns_.size(); i++) {
        if (EqualsIgnoreCase(columns_[i].name, name)) {
            return static_cast<int32_t>(i + 1);
        }
    }
    throw ResourceLifecycleError(ErrorCode::COLUMN_OUT_OF_RANGE, "Unknown column " + name);
}

const Value& ResultSet::GetValue(int32_t column) {
    CheckOpen();
    GetColumn(column);
    if (position_ < 0 || !InBlock(position_)) {
        throw ProtocolError(ErrorCode::INVALID_STATE, "Result set is not positioned on a row");
    }
    const auto& value = block_.rows[position_ - block_.start_row][column - 1];
    was_null_ = value.IsNull();
    return value;
}

std::string ResultSet::GetString(int32_t column) {
    const Value& value = GetValue(column);
    if (value.GetType() == ValueType::LOB_REF) {
        auto lob = GetLob(column);
        auto bytes = lob->ReadAll();
        return std::string(bytes.begin(), bytes.end());
    }
    return value.ToString();
}

bool ResultSet::GetBool(int32_t column) {
    try {
        return GetValue(column).AsBool();
    } catch (const std::invalid_argument& e) {
        ConversionFailed(column, e);
    }
}

int32_t ResultSet::GetInt32(int32_t column) {
    int64_t v = GetInt64(column);
    if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
        throw DatabaseError(ErrorCode::CONVERSION_ERROR,
                            "Column " + std::to_string(column) + ": value " + std::to_string(v) +
                            " out of INT32 range");
    }
    return static_cast<int32_t>(v);
}

int64_t ResultSet::GetInt64(int32_t column) {
    try {
        return GetValue(column).AsInt64();
    } catch (const std::invalid_argument& e) {
        ConversionFailed(column, e);
    }
}

double ResultSet::GetDouble(int32_t column) {
    try {
        return GetValue(column).AsDouble();
    } catch (const std::invalid_argument& e) {
        ConversionFailed(column, e);
    }
}

std::vector<uint8_t> ResultSet::GetBytes(int32_t column) {
    const Value& value = GetValue(column);
    if (value.GetType() == ValueType::LOB_REF) {
        return GetLob(column)->ReadAll();
    }
    try {
        return value.AsBytes();
    } catch (const std::invalid_argument& e) {
        ConversionFailed(column, e);
    }
}

std::shared_ptr<Lob> ResultSet::GetLob(int32_t column) {
    const Value& value = GetValue(column);
    if (value.IsNull()) {
        return nullptr;
    }
    if (value.GetType() != ValueType::LOB_REF) {
        throw DatabaseError(ErrorCode::CONVERSION_ERROR,
                            "Column " + std::to_string(column) + " holds an inline " +
                            ValueTypeToString(value.GetType()) + " value, not a LOB");
    }
    const auto& ref = value.GetLob();
    auto lob = std::make_shared<Lob>(dispatcher_, ref.handle_id, ref.kind, ref.length);
    dispatcher_->Track(lob);
    return lob;
}

//===----------------------------------------------------------------------===//
// Lifecycle
//===----------------------------------------------------------------------===//

void ResultSet::Close() {
    if (closed_.exchange(true)) {
        return;
    }
    if (cursor_id_ != 0 && !dispatcher_->IsClosed()) {
        dispatcher_->Invoke(OpCode::HANDLE_CLOSE, cursor_id_, {});
    }
}

} // namespace client
} // namespace dbrelay
