//===----------------------------------------------------------------------===//
//                         DBRelay
//
// network/tcp_connection.hpp
//
// Framed transport for one client: reads frames, queues outgoing ones
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/message.hpp"
#include <asio.hpp>
#include <array>
#include <deque>

namespace dbrelay {

class ProtocolHandler;

class TcpConnection : public std::enable_shared_from_this<TcpConnection> {
public:
    using Ptr = std::shared_ptr<TcpConnection>;
    using ClosedCallback = std::function<void(uint64_t connection_id)>;

    TcpConnection(asio::io_context& io_context,
                  std::shared_ptr<ProtocolHandler> handler,
                  uint32_t max_frame_bytes,
                  ClosedCallback on_closed);
    ~TcpConnection();

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;

    asio::ip::tcp::socket& GetSocket() { return socket_; }

    void Start();

    // Answer a connection that will not be served, without reading from it
    void Refuse(ErrorCode code, const std::string& message);

    // Idempotent; tells the handler so the session is released
    void Close();

    // Thread-safe; frames queued after Close() are dropped
    void Send(const Message& message);

    // Send one ERROR frame, then close once it has been written
    void SendErrorAndClose(ErrorCode code, const std::string& message);

    // "address:port" of the peer, "unknown" once the socket is gone
    std::string GetRemoteAddress() const;

    uint64_t GetConnectionId() const { return connection_id_; }
    bool IsConnected() const { return connected_; }

    uint64_t GetSessionId() const { return session_id_; }
    void SetSessionId(uint64_t id) { session_id_ = id; }

private:
    void ReadHeader();
    void ReadPayload();
    void Dispatch();

    // Returns false after rejecting the frame
    bool CheckHeader(const MessageHeader& header);

    void Enqueue(std::vector<uint8_t> frame);
    void WriteNext();

    void OnIoError(const char* stage, const asio::error_code& ec);

private:
    asio::ip::tcp::socket socket_;
    std::shared_ptr<ProtocolHandler> handler_;
    ClosedCallback on_closed_;

    const uint64_t connection_id_;
    const uint32_t max_frame_bytes_;
    std::atomic<uint64_t> session_id_{0};

    std::atomic<bool> connected_{false};
    std::atomic<bool> close_when_flushed_{false};

    std::array<uint8_t, MessageHeader::SIZE> header_bytes_;
    Message inbound_;

    std::mutex outbox_mutex_;
    std::deque<std::vector<uint8_t>> outbox_;
    bool write_in_flight_ = false;

    static std::atomic<uint64_t> next_connection_id_;
};

using TcpConnectionPtr = std::shared_ptr<TcpConnection>;

} // namespace dbrelay
