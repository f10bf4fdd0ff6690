//===----------------------------------------------------------------------===//
//                         DBRelay
//
// network/tcp_server.cpp
//
// Listener for relay clients
//===----------------------------------------------------------------------===//

#include "network/tcp_server.hpp"
#include "config/server_config.hpp"
#include "protocol/protocol_handler.hpp"
#include "logging/logger.hpp"

namespace dbrelay {

TcpServer::TcpServer(const ServerConfig& config,
                     std::shared_ptr<SessionManager> session_manager,
                     std::shared_ptr<ExecutorPool> executor_pool,
                     std::shared_ptr<OperationExecutor> executor)
    : config_(config)
    , session_manager_(std::move(session_manager))
    , executor_pool_(std::move(executor_pool))
    , executor_(std::move(executor))
    , lanes_(config.GetIoThreadCount())
    , acceptor_(accept_context_) {
}

TcpServer::~TcpServer() {
    Stop();
}

void TcpServer::Start() {
    if (running_) {
        return;
    }

    asio::ip::tcp::endpoint endpoint(asio::ip::make_address(config_.host), config_.port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    bound_port_ = acceptor_.local_endpoint().port();

    running_ = true;
    lanes_.Start();
    AcceptNext();
    accept_thread_ = std::thread([this]() { accept_context_.run(); });

    LOG_INFO("server", "Listening on " + config_.host + ":" + std::to_string(bound_port_.load()));
}

void TcpServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    asio::error_code ignored;
    acceptor_.close(ignored);
    accept_context_.stop();
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    // Close() calls back into Forget(), so work on a copy
    std::unordered_map<uint64_t, TcpConnectionPtr> open;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        open.swap(connections_);
    }
    for (auto& entry : open) {
        entry.second->Close();
    }

    lanes_.Stop();

    LOG_INFO("server", "Listener stopped after " + std::to_string(accepted_.load()) + " connections (" +
             std::to_string(rejected_.load()) + " rejected)");
}

size_t TcpServer::GetConnectionCount() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

void TcpServer::AcceptNext() {
    auto handler = std::make_shared<ProtocolHandler>(session_manager_, executor_pool_, executor_);
    auto conn = std::make_shared<TcpConnection>(
        lanes_.Next(), handler, config_.max_frame_bytes,
        [this](uint64_t connection_id) { Forget(connection_id); });

    acceptor_.async_accept(conn->GetSocket(), [this, conn](const asio::error_code& ec) {
        if (!running_) {
            return;
        }
        if (ec) {
            LOG_WARN("server", "Accept failed: " + ec.message());
        } else {
            Admit(conn);
        }
        AcceptNext();
    });
}

void TcpServer::Admit(TcpConnectionPtr conn) {
    bool full;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        full = connections_.size() >= config_.max_connections;
        if (!full) {
            connections_.emplace(conn->GetConnectionId(), conn);
        }
    }

    if (full) {
        rejected_++;
        LOG_WARN("server", "Refusing " + conn->GetRemoteAddress() + ": " +
                 std::to_string(config_.max_connections) + " connections open");
        conn->Refuse(ErrorCode::MAX_SESSIONS, "Too many connections");
        return;
    }
    accepted_++;
    conn->Start();
}

void TcpServer::Forget(uint64_t connection_id) {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.erase(connection_id);
}

} // namespace dbrelay
