//===----------------------------------------------------------------------===//
//                         DBRelay
//
// protocol/protocol_handler.cpp
//
// Protocol message handler implementation
//===----------------------------------------------------------------------===//

#include "protocol/protocol_handler.hpp"
#include "network/tcp_connection.hpp"
#include "session/session_manager.hpp"
#include "executor/executor_pool.hpp"
#include "executor/operation_executor.hpp"
#include "executor/serial_queue.hpp"
#include "logging/logger.hpp"
#include "version.hpp"

namespace dbrelay {

ProtocolHandler::ProtocolHandler(std::shared_ptr<SessionManager> session_manager,
                                 std::shared_ptr<ExecutorPool> executor_pool,
                                 std::shared_ptr<OperationExecutor> executor)
    : session_manager_(session_manager)
    , executor_pool_(executor_pool)
    , executor_(executor)
    , queue_(std::make_shared<SerialQueue>(*executor_pool)) {
}

void ProtocolHandler::HandleMessage(const Message& message,
                                    std::shared_ptr<TcpConnection> connection) {
    switch (message.GetType()) {
        case MessageType::HELLO:
            HandleHello(message, connection);
            break;
        case MessageType::PING:
            HandlePing(message, connection);
            break;
        case MessageType::CLOSE:
            HandleClose(message, connection);
            break;
        case MessageType::REQUEST:
            HandleRequest(message, connection);
            break;
        case MessageType::CANCEL:
            HandleCancel(message, connection);
            break;
        case MessageType::STREAM_CHUNK:
        case MessageType::STREAM_END:
            HandleStream(message, connection);
            break;
        default:
            LOG_WARN("protocol", "Unknown message type: " +
                     std::to_string(static_cast<int>(message.GetType())));
            SendError(ErrorCode::PROTOCOL_ERROR, "Unknown message type", connection);
            break;
    }
}

SessionPtr ProtocolHandler::CurrentSession() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

uint64_t ProtocolHandler::GetSessionId() const {
    auto session = CurrentSession();
    return session ? session->GetSessionId() : 0;
}

void ProtocolHandler::HandleHello(const Message& message,
                                  std::shared_ptr<TcpConnection> connection) {
    HelloResponsePayload response;
    response.capabilities = OperationExecutor::Capabilities();
    response.server_name = executor_->GetConfig().server_name;
    response.server_version = DBRELAY_VERSION;
    response.backend_name = "DuckDB";
    response.backend_version = duckdb::DuckDB::LibraryVersion();

    try {
        HelloPayload hello = HelloPayload::Deserialize(message.GetPayload());

        LOG_DEBUG("protocol", "HELLO from " + hello.user + " (client=" + hello.client_name +
                  ", version=" + std::to_string(hello.protocol_version) + ")");

        if (hello.protocol_version != PROTOCOL_VERSION) {
            response.error_code = ErrorCode::VERSION_MISMATCH;
            response.message = "Protocol version mismatch. Server version: " +
                               std::to_string(PROTOCOL_VERSION);
            connection->Send(Message(MessageType::HELLO_RESPONSE, response.Serialize()));
            return;
        }

        if (CurrentSession()) {
            response.error_code = ErrorCode::INVALID_STATE;
            response.message = "Connection already carries a session";
            connection->Send(Message(MessageType::HELLO_RESPONSE, response.Serialize()));
            return;
        }

        auto session = session_manager_->CreateSession(hello.user, hello.client_name);
        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            session_ = session;
        }
        connection->SetSessionId(session->GetSessionId());

        response.session_id = session->GetSessionId();
        connection->Send(Message(MessageType::HELLO_RESPONSE, response.Serialize()));

        LOG_INFO("protocol", "Session " + std::to_string(session->GetSessionId()) +
                 " created for user " + hello.user + " from " + connection->GetRemoteAddress());

    } catch (const RelayException& e) {
        LOG_WARN("protocol", "HELLO rejected: " + std::string(e.what()));
        response.error_code = e.GetCode();
        response.message = e.what();
        connection->Send(Message(MessageType::HELLO_RESPONSE, response.Serialize()));
    } catch (const DecodeError& e) {
        LOG_WARN("protocol", "Malformed HELLO: " + std::string(e.what()));
        SendError(ErrorCode::PROTOCOL_ERROR, e.what(), connection);
    }
}

void ProtocolHandler::HandlePing(const Message& message,
                                 std::shared_ptr<TcpConnection> connection) {
    auto session = CurrentSession();
    if (session) {
        session->Touch();
    }
    connection->Send(Message(MessageType::PONG));
}

void ProtocolHandler::HandleClose(const Message& message,
                                  std::shared_ptr<TcpConnection> connection) {
    ReleaseSession();
    connection->Close();
}

void ProtocolHandler::HandleRequest(const Message& message,
                                    std::shared_ptr<TcpConnection> connection) {
    RequestPayload request;
    try {
        request = RequestPayload::Deserialize(message.GetPayload());
    } catch (const DecodeError& e) {
        LOG_WARN("protocol", "Malformed REQUEST: " + std::string(e.what()));
        uint64_t request_id = 0;
        if (RequestPayload::PeekRequestId(message.GetPayload(), request_id)) {
            SendRequestError(request_id, ErrorCode::PROTOCOL_ERROR, e.what(), connection);
        } else {
            SendError(ErrorCode::PROTOCOL_ERROR, e.what(), connection);
        }
        return;
    }

    auto session = CurrentSession();
    if (!session || session->GetSessionId() != request.session_id) {
        SendRequestError(request.request_id, ErrorCode::SESSION_NOT_FOUND,
                         "Session " + std::to_string(request.session_id) + " not found", connection);
        return;
    }

    LOG_TRACE("protocol", "REQUEST " + std::to_string(request.request_id) + " " +
              OpCodeToString(request.opcode) + " handle=" + std::to_string(request.handle_id) +
              " session=" + std::to_string(session->GetSessionId()));

    auto executor = executor_;
    auto self = shared_from_this();
    bool posted = queue_->Post([self, executor, session, connection, request]() {
        StreamSink sink = [connection](MessageType type, const StreamChunkPayload& chunk) {
            if (connection->IsConnected()) {
                connection->Send(Message(type, chunk.Serialize()));
            }
        };
        auto response = executor->Execute(*session, request, sink);
        if (response) {
            self->SendResponse(*response, connection);
        }
        // A close that reported a cleanup failure still ended the session
        if (request.opcode == OpCode::CONN_CLOSE && session->IsClosing()) {
            std::lock_guard<std::mutex> lock(self->session_mutex_);
            if (self->session_ == session) {
                self->session_.reset();
            }
        }
    });

    if (!posted) {
        SendRequestError(request.request_id, ErrorCode::SERVER_SHUTTING_DOWN,
                         "Server is shutting down", connection);
    }
}

void ProtocolHandler::HandleCancel(const Message& message,
                                   std::shared_ptr<TcpConnection> connection) {
    try {
        CancelPayload cancel = CancelPayload::Deserialize(message.GetPayload());
        auto session = CurrentSession();
        if (!session) {
            return;
        }
        // Runs on the IO thread so it overtakes the queued call
        bool interrupted = session->Cancel(cancel.request_id);
        LOG_DEBUG("protocol", "CANCEL " + std::to_string(cancel.request_id) + " on session " +
                  std::to_string(session->GetSessionId()) +
                  (interrupted ? " interrupted the running call" : " recorded"));
        if (!interrupted) {
            // A finished LOB_WRITE_BEGIN may still be waiting for its chunks
            auto executor = executor_;
            auto self = shared_from_this();
            uint64_t request_id = cancel.request_id;
            queue_->Post([self, executor, session, connection, request_id]() {
                auto response = executor->CancelLobWrite(*session, request_id);
                if (response) {
                    self->SendResponse(*response, connection);
                }
            });
        }
    } catch (const DecodeError& e) {
        LOG_WARN("protocol", "Malformed CANCEL: " + std::string(e.what()));
        SendError(ErrorCode::PROTOCOL_ERROR, e.what(), connection);
    }
}

void ProtocolHandler::HandleStream(const Message& message,
                                   std::shared_ptr<TcpConnection> connection) {
    StreamChunkPayload chunk;
    try {
        chunk = StreamChunkPayload::Deserialize(message.GetPayload());
    } catch (const DecodeError& e) {
        LOG_WARN("protocol", "Malformed stream frame: " + std::string(e.what()));
        SendError(ErrorCode::PROTOCOL_ERROR, e.what(), connection);
        return;
    }

    auto session = CurrentSession();
    if (!session) {
        return;
    }

    auto executor = executor_;
    auto self = shared_from_this();
    auto type = message.GetType();
    queue_->Post([self, executor, session, connection, type, chunk]() {
        auto response = executor->HandleStreamChunk(*session, type, chunk);
        if (response) {
            self->SendResponse(*response, connection);
        }
    });
}

void ProtocolHandler::OnDisconnect() {
    ReleaseSession();
    queue_->Close();
}

void ProtocolHandler::ReleaseSession() {
    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session.swap(session_);
    }
    if (!session) {
        return;
    }

    uint64_t session_id = session->GetSessionId();
    session->MarkClosing();
    session->InterruptCall();

    // The client is gone; a failed cleanup can only be logged
    auto manager = session_manager_;
    auto destroy = [manager, session_id]() {
        try {
            manager->DestroySession(session_id);
        } catch (const RelayException& e) {
            LOG_ERROR("protocol", "Session " + std::to_string(session_id) + " cleanup failed: " + e.what());
        }
    };
    if (!queue_->Post(destroy)) {
        destroy();
    }
    LOG_DEBUG("protocol", "Session " + std::to_string(session_id) + " released");
}

void ProtocolHandler::SendResponse(const ResponsePayload& response,
                                   std::shared_ptr<TcpConnection> connection) {
    if (!connection->IsConnected()) {
        return;
    }
    connection->Send(Message(MessageType::RESPONSE, response.Serialize()));
}

void ProtocolHandler::SendRequestError(uint64_t request_id, ErrorCode code, const std::string& message,
                                       std::shared_ptr<TcpConnection> connection) {
    SendResponse(ResponsePayload::Error(request_id, code, message), connection);
}

void ProtocolHandler::SendError(ErrorCode code,
                                const std::string& message,
                                std::shared_ptr<TcpConnection> connection) {
    ErrorPayload error(code, message);
    connection->Send(Message(MessageType::ERROR, error.Serialize()));
}

} // namespace dbrelay
