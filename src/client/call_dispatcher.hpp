//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/call_dispatcher.hpp
//
// Marshals client API calls into remote invocations on one session
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/connection_config.hpp"
#include "protocol/wire_codec.hpp"

namespace dbrelay {
namespace client {

class Transport;

// Client object backed by server state; invalidated when the connection closes
class ClientResource {
public:
    virtual ~ClientResource() = default;

    // Mark closed without a round trip; the server released the handle with the session
    virtual void Invalidate() = 0;
};

struct ServerInfo {
    uint64_t session_id = 0;
    uint32_t capabilities = 0;
    std::string server_name;
    std::string server_version;
    std::string backend_name;
    std::string backend_version;
};

class CallDispatcher {
public:
    explicit CallDispatcher(const ConnectionConfig& config);
    ~CallDispatcher();

    CallDispatcher(const CallDispatcher&) = delete;
    CallDispatcher& operator=(const CallDispatcher&) = delete;

    // Connect and open the remote session
    void Open();

    // Release the remote session and the socket. Invalidates every tracked
    // resource first. Idempotent.
    void Close();

    bool IsClosed() const { return closed_; }

    // Throws ResourceLifecycleError(CONNECTION_CLOSED) once closed
    void CheckOpen() const;

    // One call; throws the mapped exception when the server reports an error
    ResponsePayload Invoke(OpCode op, uint64_t handle_id, std::vector<Value> args,
                           std::chrono::milliseconds extra_timeout = std::chrono::milliseconds(0));

    // Like Invoke, but returns error responses instead of throwing
    ResponsePayload InvokeRaw(OpCode op, uint64_t handle_id, std::vector<Value> args,
                              std::chrono::milliseconds extra_timeout = std::chrono::milliseconds(0));

    // Read-only metadata call, retried on transport timeouts
    ResponsePayload InvokeMetadata(OpCode op, std::vector<Value> args);

    // LOB_READ: chunks are handed to on_chunk in order until the end marker
    void ReadStream(uint64_t handle_id, int64_t offset, int32_t length,
                    const std::function<void(const std::vector<uint8_t>&)>& on_chunk);

    // LOB_WRITE_BEGIN followed by the chunk stream; returns the new length
    int64_t WriteStream(uint64_t handle_id, bool replace, const uint8_t* data, size_t size);

    // Cancel the call currently in flight, if any; callable from any thread
    bool Cancel();

    bool Ping(std::chrono::milliseconds timeout);

    void Track(std::weak_ptr<ClientResource> resource);

    const ConnectionConfig& GetConfig() const { return config_; }
    const ServerInfo& GetServerInfo() const { return server_info_; }
    uint64_t GetSessionId() const { return server_info_.session_id; }
    bool HasCapability(uint32_t bit) const { return (server_info_.capabilities & bit) != 0; }
    const std::string& Endpoint() const;

private:
    ResponsePayload Roundtrip(const RequestPayload& request, std::chrono::milliseconds timeout);
    RequestPayload BuildRequest(OpCode op, uint64_t handle_id, std::vector<Value> args);
    std::chrono::milliseconds CallTimeout(std::chrono::milliseconds extra) const;
    void InvalidateAll();

private:
    ConnectionConfig config_;
    std::unique_ptr<Transport> transport_;
    ServerInfo server_info_;

    std::atomic<bool> closed_;

    // At most one call in flight per session
    std::mutex call_mutex_;
    std::atomic<uint64_t> current_request_;

    std::mutex resources_mutex_;
    std::vector<std::weak_ptr<ClientResource>> resources_;
};

} // namespace client
} // namespace dbrelay
