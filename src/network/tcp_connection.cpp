//===----------------------------------------------------------------------===//
//                         DBRelay
//
// network/tcp_connection.cpp
//
// Framed transport for one client
//===----------------------------------------------------------------------===//

#include "network/tcp_connection.hpp"
#include "protocol/protocol_handler.hpp"
#include "logging/logger.hpp"

namespace dbrelay {

std::atomic<uint64_t> TcpConnection::next_connection_id_{1};

TcpConnection::TcpConnection(asio::io_context& io_context,
                             std::shared_ptr<ProtocolHandler> handler,
                             uint32_t max_frame_bytes,
                             ClosedCallback on_closed)
    : socket_(io_context)
    , handler_(std::move(handler))
    , on_closed_(std::move(on_closed))
    , connection_id_(next_connection_id_.fetch_add(1))
    , max_frame_bytes_(max_frame_bytes) {
}

TcpConnection::~TcpConnection() {
    asio::error_code ignored;
    socket_.close(ignored);
}

void TcpConnection::Start() {
    connected_ = true;
    LOG_DEBUG("connection", "#" + std::to_string(connection_id_) + " accepted from " + GetRemoteAddress());
    ReadHeader();
}

void TcpConnection::Refuse(ErrorCode code, const std::string& message) {
    connected_ = true;
    SendErrorAndClose(code, message);
}

void TcpConnection::Close() {
    if (!connected_.exchange(false)) {
        return;
    }

    LOG_DEBUG("connection", "#" + std::to_string(connection_id_) + " closed");

    asio::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);

    if (handler_) {
        handler_->OnDisconnect();
    }
    if (on_closed_) {
        on_closed_(connection_id_);
    }
}

void TcpConnection::Send(const Message& message) {
    Enqueue(message.Serialize());
}

void TcpConnection::SendErrorAndClose(ErrorCode code, const std::string& message) {
    close_when_flushed_ = true;
    Enqueue(Message(MessageType::ERROR, ErrorPayload(code, message).Serialize()).Serialize());
}

std::string TcpConnection::GetRemoteAddress() const {
    asio::error_code ec;
    auto peer = socket_.remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return peer.address().to_string() + ":" + std::to_string(peer.port());
}

void TcpConnection::ReadHeader() {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(header_bytes_),
        [this, self](const asio::error_code& ec, size_t) {
            if (ec) {
                OnIoError("read", ec);
                return;
            }

            MessageHeader header = MessageHeader::Parse(header_bytes_.data());
            if (!CheckHeader(header)) {
                return;
            }

            inbound_ = Message(header, std::vector<uint8_t>(header.length));
            if (header.length == 0) {
                Dispatch();
            } else {
                ReadPayload();
            }
        });
}

bool TcpConnection::CheckHeader(const MessageHeader& header) {
    if (header.magic != PROTOCOL_MAGIC) {
        LOG_WARN("connection", "#" + std::to_string(connection_id_) + " sent a frame with bad magic");
        SendErrorAndClose(ErrorCode::PROTOCOL_ERROR, "Invalid frame magic");
        return false;
    }
    if (header.version != PROTOCOL_VERSION) {
        SendErrorAndClose(ErrorCode::VERSION_MISMATCH,
                          "Unsupported protocol version " + std::to_string(header.version));
        return false;
    }
    if (header.length > max_frame_bytes_) {
        LOG_WARN("connection", "#" + std::to_string(connection_id_) + " sent a " +
                 std::to_string(header.length) + " byte frame");
        SendErrorAndClose(ErrorCode::FRAME_TOO_LARGE,
                          "Frame exceeds " + std::to_string(max_frame_bytes_) + " bytes");
        return false;
    }
    return true;
}

void TcpConnection::ReadPayload() {
    auto self = shared_from_this();
    asio::async_read(socket_, asio::buffer(inbound_.GetPayload()),
        [this, self](const asio::error_code& ec, size_t) {
            if (ec) {
                OnIoError("read", ec);
                return;
            }
            Dispatch();
        });
}

void TcpConnection::Dispatch() {
    LOG_TRACE("connection", "#" + std::to_string(connection_id_) + " <- " +
              MessageTypeToString(inbound_.GetType()));

    Message message = std::move(inbound_);
    inbound_ = Message();
    if (handler_) {
        handler_->HandleMessage(message, shared_from_this());
    }

    if (connected_ && !close_when_flushed_) {
        ReadHeader();
    }
}

void TcpConnection::Enqueue(std::vector<uint8_t> frame) {
    if (!connected_) {
        return;
    }

    bool start_writer = false;
    {
        std::lock_guard<std::mutex> lock(outbox_mutex_);
        outbox_.push_back(std::move(frame));
        if (!write_in_flight_) {
            write_in_flight_ = true;
            start_writer = true;
        }
    }

    // Socket writes only happen on the connection's own io_context
    if (start_writer) {
        auto self = shared_from_this();
        asio::post(socket_.get_executor(), [this, self]() { WriteNext(); });
    }
}

void TcpConnection::WriteNext() {
    if (!connected_) {
        std::lock_guard<std::mutex> lock(outbox_mutex_);
        write_in_flight_ = false;
        outbox_.clear();
        return;
    }

    const std::vector<uint8_t>* front = nullptr;
    {
        std::lock_guard<std::mutex> lock(outbox_mutex_);
        if (outbox_.empty()) {
            write_in_flight_ = false;
        } else {
            front = &outbox_.front();
        }
    }
    if (front == nullptr) {
        if (close_when_flushed_) {
            Close();
        }
        return;
    }

    // The front frame stays queued until fully written
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(*front),
        [this, self](const asio::error_code& ec, size_t) {
            if (ec) {
                OnIoError("write", ec);
                return;
            }
            {
                std::lock_guard<std::mutex> lock(outbox_mutex_);
                outbox_.pop_front();
            }
            WriteNext();
        });
}

void TcpConnection::OnIoError(const char* stage, const asio::error_code& ec) {
    if (ec != asio::error::eof && ec != asio::error::operation_aborted && connected_) {
        LOG_WARN("connection", "#" + std::to_string(connection_id_) + " " + stage + " failed: " +
                 ec.message());
    }
    Close();
}

} // namespace dbrelay
