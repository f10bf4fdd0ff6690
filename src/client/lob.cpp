//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/lob.cpp
//
// Chunked LOB transfer
//===----------------------------------------------------------------------===//

#include "client/lob.hpp"
#include "client/errors.hpp"
#include <algorithm>

namespace dbrelay {
namespace client {

namespace {

// Largest range requested by one LOB_READ
constexpr int64_t MAX_READ_RANGE = 16 * 1024 * 1024;

} // namespace

Lob::Lob(std::shared_ptr<CallDispatcher> dispatcher, uint64_t handle_id, LobKind kind, int64_t length)
    : dispatcher_(std::move(dispatcher))
    , handle_id_(handle_id)
    , kind_(kind)
    , length_(length)
    , closed_(false) {
}

void Lob::CheckOpen() const {
    if (closed_) {
        throw ResourceLifecycleError(ErrorCode::HANDLE_CLOSED,
                                     "LOB " + std::to_string(handle_id_) + " is closed");
    }
}

int64_t Lob::Length() {
    CheckOpen();
    auto response = dispatcher_->Invoke(OpCode::LOB_LENGTH, handle_id_, {});
    if (response.values.empty()) {
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR, "LOB_LENGTH response carries no length");
    }
    length_ = response.values[0].AsInt64();
    return length_;
}

std::vector<uint8_t> Lob::Read(int64_t offset, int32_t length) {
    CheckOpen();
    if (offset < 0 || length < 0) {
        throw ProtocolError(ErrorCode::INVALID_ARGUMENT, "LOB offset and length must not be negative");
    }
    std::vector<uint8_t> data;
    dispatcher_->ReadStream(handle_id_, offset, length, [&data](const std::vector<uint8_t>& chunk) {
        data.insert(data.end(), chunk.begin(), chunk.end());
    });
    return data;
}

std::vector<uint8_t> Lob::ReadAll() {
    int64_t total = Length();
    std::vector<uint8_t> data;
    data.reserve(static_cast<size_t>(total));
    for (int64_t offset = 0; offset < total; offset += MAX_READ_RANGE) {
        auto range = static_cast<int32_t>(std::min(MAX_READ_RANGE, total - offset));
        auto part = Read(offset, range);
        if (part.empty()) {
            break;
        }
        data.insert(data.end(), part.begin(), part.end());
    }
    return data;
}

std::string Lob::ReadString(int64_t offset, int32_t length) {
    auto bytes = Read(offset, length);
    return std::string(bytes.begin(), bytes.end());
}

std::string Lob::ReadAllString() {
    auto bytes = ReadAll();
    return std::string(bytes.begin(), bytes.end());
}

int64_t Lob::Stream(bool replace, const uint8_t* data, size_t size) {
    CheckOpen();
    length_ = dispatcher_->WriteStream(handle_id_, replace, data, size);
    return length_;
}

int64_t Lob::Write(const std::vector<uint8_t>& data) {
    return Stream(true, data.data(), data.size());
}

int64_t Lob::Write(const std::string& text) {
    return Stream(true, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

int64_t Lob::Append(const std::vector<uint8_t>& data) {
    return Stream(false, data.data(), data.size());
}

void Lob::Truncate(int64_t length) {
    CheckOpen();
    std::vector<Value> args;
    args.push_back(Value::Int64(length));
    dispatcher_->Invoke(OpCode::LOB_TRUNCATE, handle_id_, std::move(args));
    if (length < length_) {
        length_ = length;
    }
}

void Lob::Close() {
    if (closed_.exchange(true)) {
        return;
    }
    if (!dispatcher_->IsClosed()) {
        dispatcher_->Invoke(OpCode::HANDLE_CLOSE, handle_id_, {});
    }
}

} // namespace client
} // namespace dbrelay
