//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/call_dispatcher.cpp
//
// Remote invocation, streaming and session lifecycle
//===----------------------------------------------------------------------===//

#include "client/call_dispatcher.hpp"
#include "client/errors.hpp"
#include "client/transport.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace dbrelay {
namespace client {

namespace {

// Clears the in-flight request id on every exit path
struct InFlight {
    InFlight(std::atomic<uint64_t>& slot_p, uint64_t id) : slot(slot_p) { slot = id; }
    ~InFlight() { slot = 0; }
    std::atomic<uint64_t>& slot;
};

ResponsePayload DecodeResponse(const Message& frame) {
    try {
        return ResponsePayload::Deserialize(frame.GetPayload());
    } catch (const DecodeError& e) {
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR, std::string("Malformed response: ") + e.what());
    }
}

StreamChunkPayload DecodeChunk(const Message& frame) {
    try {
        return StreamChunkPayload::Deserialize(frame.GetPayload());
    } catch (const DecodeError& e) {
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR, std::string("Malformed stream frame: ") + e.what());
    }
}

} // namespace

CallDispatcher::CallDispatcher(const ConnectionConfig& config)
    : config_(config)
    , transport_(std::make_unique<Transport>(config))
    , closed_(true)
    , current_request_(0) {
}

CallDispatcher::~CallDispatcher() = default;

const std::string& CallDispatcher::Endpoint() const {
    return transport_->Endpoint();
}

void CallDispatcher::Open() {
    std::lock_guard<std::mutex> lock(call_mutex_);
    auto hello = transport_->Connect();

    server_info_.session_id = hello.session_id;
    server_info_.capabilities = hello.capabilities;
    server_info_.server_name = hello.server_name;
    server_info_.server_version = hello.server_version;
    server_info_.backend_name = hello.backend_name;
    server_info_.backend_version = hello.backend_version;
    closed_ = false;
}

void CallDispatcher::Close() {
    if (closed_.exchange(true)) {
        return;
    }

    InvalidateAll();

    std::lock_guard<std::mutex> lock(call_mutex_);
    std::exception_ptr failure;
    if (transport_->IsOpen()) {
        try {
            auto request = BuildRequest(OpCode::CONN_CLOSE, 0, {});
            auto response = Roundtrip(request, CallTimeout(std::chrono::milliseconds(0)));
            if (!response.IsOk()) {
                ThrowResponseError(response);
            }
        } catch (const DbRelayError& e) {
            LOG_DEBUG("client", "Closing session " + std::to_string(server_info_.session_id) +
                      " reported: " + e.what());
            failure = std::current_exception();
        }
    }
    transport_->Close();
    LOG_DEBUG("client", "Session " + std::to_string(server_info_.session_id) + " closed");

    if (failure) {
        std::rethrow_exception(failure);
    }
}

void CallDispatcher::CheckOpen() const {
    if (closed_) {
        throw ResourceLifecycleError(ErrorCode::CONNECTION_CLOSED, "Connection is closed");
    }
}

void CallDispatcher::Track(std::weak_ptr<ClientResource> resource) {
    std::lock_guard<std::mutex> lock(resources_mutex_);
    resources_.erase(std::remove_if(resources_.begin(), resources_.end(),
                                    [](const std::weak_ptr<ClientResource>& r) { return r.expired(); }),
                     resources_.end());
    resources_.push_back(std::move(resource));
}

void CallDispatcher::InvalidateAll() {
    std::vector<std::weak_ptr<ClientResource>> resources;
    {
        std::lock_guard<std::mutex> lock(resources_mutex_);
        resources.swap(resources_);
    }
    for (auto& weak : resources) {
        if (auto resource = weak.lock()) {
            resource->Invalidate();
        }
    }
}

std::chrono::milliseconds CallDispatcher::CallTimeout(std::chrono::milliseconds extra) const {
    if (config_.call_timeout_ms == 0) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::milliseconds(config_.call_timeout_ms) + extra;
}

RequestPayload CallDispatcher::BuildRequest(OpCode op, uint64_t handle_id, std::vector<Value> args) {
    RequestPayload request;
    request.request_id = transport_->NextRequestId();
    request.session_id = server_info_.session_id;
    request.handle_id = handle_id;
    request.opcode = op;
    request.args = std::move(args);
    return request;
}

ResponsePayload CallDispatcher::Roundtrip(const RequestPayload& request, std::chrono::milliseconds timeout) {
    InFlight in_flight(current_request_, request.request_id);

    LOG_TRACE("client", std::string("Call ") + OpCodeToString(request.opcode) + " request=" +
              std::to_string(request.request_id) + " handle=" + std::to_string(request.handle_id));

    transport_->SendFrame(MessageType::REQUEST, request.Serialize());
    Message frame = transport_->AwaitReply(request.request_id, timeout);
    if (frame.GetType() != MessageType::RESPONSE) {
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR,
                            std::string("Unexpected ") + MessageTypeToString(frame.GetType()) +
                            " for " + OpCodeToString(request.opcode));
    }
    return DecodeResponse(frame);
}

ResponsePayload CallDispatcher::InvokeRaw(OpCode op, uint64_t handle_id, std::vector<Value> args,
                                          std::chrono::milliseconds extra_timeout) {
    CheckOpen();
    std::lock_guard<std::mutex> lock(call_mutex_);
    auto request = BuildRequest(op, handle_id, std::move(args));
    return Roundtrip(request, CallTimeout(extra_timeout));
}

ResponsePayload CallDispatcher::Invoke(OpCode op, uint64_t handle_id, std::vector<Value> args,
                                       std::chrono::milliseconds extra_timeout) {
    auto response = InvokeRaw(op, handle_id, std::move(args), extra_timeout);
    if (!response.IsOk()) {
        LOG_DEBUG("client", std::string(OpCodeToString(op)) + " failed: " +
                  ErrorCodeToString(response.error.code) + ": " + response.error.message);
        ThrowResponseError(response);
    }
    return response;
}

ResponsePayload CallDispatcher::InvokeMetadata(OpCode op, std::vector<Value> args) {
    uint32_t attempt = 0;
    while (true) {
        try {
            return Invoke(op, 0, args);
        } catch (const TransportError& e) {
            if (!e.IsTimeout() || !transport_->IsOpen() || attempt >= config_.metadata_retries) {
                throw;
            }
            attempt++;
            LOG_DEBUG("client", std::string(OpCodeToString(op)) + " timed out, retry " +
                      std::to_string(attempt) + " of " + std::to_string(config_.metadata_retries));
        }
    }
}

void CallDispatcher::ReadStream(uint64_t handle_id, int64_t offset, int32_t length,
                                const std::function<void(const std::vector<uint8_t>&)>& on_chunk) {
    CheckOpen();
    std::lock_guard<std::mutex> lock(call_mutex_);

    std::vector<Value> args;
    args.push_back(Value::Int64(offset));
    args.push_back(Value::Int32(length));
    auto request = BuildRequest(OpCode::LOB_READ, handle_id, std::move(args));
    InFlight in_flight(current_request_, request.request_id);

    transport_->SendFrame(MessageType::REQUEST, request.Serialize());

    auto timeout = CallTimeout(std::chrono::milliseconds(0));
    uint32_t expected = 0;
    while (true) {
        Message frame = transport_->AwaitReply(request.request_id, timeout);
        if (frame.GetType() == MessageType::RESPONSE) {
            auto response = DecodeResponse(frame);
            if (response.IsOk()) {
                throw ProtocolError(ErrorCode::PROTOCOL_ERROR, "LOB_READ answered without a stream");
            }
            ThrowResponseError(response);
        }

        auto chunk = DecodeChunk(frame);
        if (chunk.sequence != expected) {
            throw ProtocolError(ErrorCode::PROTOCOL_ERROR,
                                "LOB chunk " + std::to_string(chunk.sequence) + " out of order, expected " +
                                std::to_string(expected));
        }
        expected++;
        on_chunk(chunk.data);
        if (frame.GetType() == MessageType::STREAM_END) {
            return;
        }
    }
}

int64_t CallDispatcher::WriteStream(uint64_t handle_id, bool replace, const uint8_t* data, size_t size) {
    CheckOpen();
    std::lock_guard<std::mutex> lock(call_mutex_);

    std::vector<Value> args;
    args.push_back(Value::Boolean(replace));
    auto request = BuildRequest(OpCode::LOB_WRITE_BEGIN, handle_id, std::move(args));
    InFlight in_flight(current_request_, request.request_id);

    transport_->SendFrame(MessageType::REQUEST, request.Serialize());

    size_t chunk_size = config_.lob_chunk_size > 0 ? config_.lob_chunk_size : DEFAULT_LOB_CHUNK_SIZE;
    StreamChunkPayload chunk;
    chunk.request_id = request.request_id;
    chunk.handle_id = handle_id;

    size_t pos = 0;
    do {
        size_t n = std::min(chunk_size, size - pos);
        chunk.data.assign(data + pos, data + pos + n);
        pos += n;
        auto type = pos >= size ? MessageType::STREAM_END : MessageType::STREAM_CHUNK;
        transport_->SendFrame(type, chunk.Serialize());
        chunk.sequence++;
    } while (pos < size);

    Message frame = transport_->AwaitReply(request.request_id, CallTimeout(std::chrono::milliseconds(0)));
    if (frame.GetType() != MessageType::RESPONSE) {
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR, "LOB write answered with a stream frame");
    }
    auto response = DecodeResponse(frame);
    if (!response.IsOk()) {
        ThrowResponseError(response);
    }
    if (response.values.empty()) {
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR, "LOB write response carries no length");
    }
    return response.values[0].AsInt64();
}

bool CallDispatcher::Cancel() {
    uint64_t request_id = current_request_.load();
    if (request_id == 0 || closed_) {
        return false;
    }
    LOG_DEBUG("client", "Cancelling request " + std::to_string(request_id));
    transport_->Cancel(request_id);
    return true;
}

bool CallDispatcher::Ping(std::chrono::milliseconds timeout) {
    CheckOpen();
    std::lock_guard<std::mutex> lock(call_mutex_);
    return transport_->Ping(timeout);
}

} // namespace client
} // namespace dbrelay
