//===----------------------------------------------------------------------===//
//                         DBRelay
//
// network/tcp_server.hpp
//
// Listener for relay clients
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "network/io_context_pool.hpp"
#include "network/tcp_connection.hpp"
#include <asio.hpp>
#include <unordered_map>

namespace dbrelay {

struct ServerConfig;
class SessionManager;
class ExecutorPool;
class OperationExecutor;

// Accepts on a dedicated thread and hands each socket to an IO lane. Every
// connection gets its own ProtocolHandler, hence its own session.
class TcpServer {
public:
    TcpServer(const ServerConfig& config,
              std::shared_ptr<SessionManager> session_manager,
              std::shared_ptr<ExecutorPool> executor_pool,
              std::shared_ptr<OperationExecutor> executor);
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    // Throws asio::system_error when the address cannot be bound
    void Start();

    // Closes the listener and every open connection
    void Stop();

    bool IsRunning() const { return running_; }

    // Useful when the configured port is 0
    uint16_t GetBoundPort() const { return bound_port_; }

    size_t GetConnectionCount() const;
    uint64_t GetAcceptedCount() const { return accepted_; }
    uint64_t GetRejectedCount() const { return rejected_; }

private:
    void AcceptNext();
    void Admit(TcpConnectionPtr conn);
    void Forget(uint64_t connection_id);

private:
    const ServerConfig& config_;

    std::shared_ptr<SessionManager> session_manager_;
    std::shared_ptr<ExecutorPool> executor_pool_;
    std::shared_ptr<OperationExecutor> executor_;

    IoContextPool lanes_;
    asio::io_context accept_context_;
    asio::ip::tcp::acceptor acceptor_;
    std::thread accept_thread_;

    mutable std::mutex connections_mutex_;
    std::unordered_map<uint64_t, TcpConnectionPtr> connections_;

    std::atomic<bool> running_{false};
    std::atomic<uint16_t> bound_port_{0};
    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> rejected_{0};
};

} // namespace dbrelay
