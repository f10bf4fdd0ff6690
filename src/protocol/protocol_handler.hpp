//===----------------------------------------------------------------------===//
//                         DBRelay
//
// protocol/protocol_handler.hpp
//
// Frame handling for one client connection
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"
#include "protocol/wire_codec.hpp"
#include "session/session.hpp"

namespace dbrelay {

class TcpConnection;
class SessionManager;
class ExecutorPool;
class OperationExecutor;
class SerialQueue;

// One handler per TCP connection. The connection carries at most one
// session, created by HELLO; its calls run in order on a SerialQueue.
class ProtocolHandler : public std::enable_shared_from_this<ProtocolHandler> {
public:
    ProtocolHandler(std::shared_ptr<SessionManager> session_manager,
                    std::shared_ptr<ExecutorPool> executor_pool,
                    std::shared_ptr<OperationExecutor> executor);
    ~ProtocolHandler() = default;

    // Handle incoming message
    void HandleMessage(const Message& message,
                       std::shared_ptr<TcpConnection> connection);

    // Transport closed: interrupt the running call and release the session
    void OnDisconnect();

    uint64_t GetSessionId() const;

private:
    // Message handlers
    void HandleHello(const Message& message, std::shared_ptr<TcpConnection> connection);
    void HandlePing(const Message& message, std::shared_ptr<TcpConnection> connection);
    void HandleClose(const Message& message, std::shared_ptr<TcpConnection> connection);
    void HandleRequest(const Message& message, std::shared_ptr<TcpConnection> connection);
    void HandleCancel(const Message& message, std::shared_ptr<TcpConnection> connection);
    void HandleStream(const Message& message, std::shared_ptr<TcpConnection> connection);

    SessionPtr CurrentSession() const;

    // Release the session after its queued calls; safe to call twice
    void ReleaseSession();

    void SendResponse(const ResponsePayload& response, std::shared_ptr<TcpConnection> connection);
    void SendRequestError(uint64_t request_id, ErrorCode code, const std::string& message,
                          std::shared_ptr<TcpConnection> connection);

    // Connection-level ERROR frame
    void SendError(ErrorCode code,
                   const std::string& message,
                   std::shared_ptr<TcpConnection> connection);

private:
    std::shared_ptr<SessionManager> session_manager_;
    std::shared_ptr<ExecutorPool> executor_pool_;
    std::shared_ptr<OperationExecutor> executor_;
    std::shared_ptr<SerialQueue> queue_;

    mutable std::mutex session_mutex_;
    SessionPtr session_;
};

} // namespace dbrelay
