//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/transport.cpp
//
// Frame transport using ASIO
//===----------------------------------------------------------------------===//

#include "client/transport.hpp"
#include "client/errors.hpp"
#include "logging/logger.hpp"
#include "protocol/wire_codec.hpp"
#include <asio.hpp>
#include <array>

namespace dbrelay {
namespace client {

using asio::ip::tcp;

//===----------------------------------------------------------------------===//
// Socket Implementation (PIMPL)
//===----------------------------------------------------------------------===//

class Transport::SocketImpl {
public:
    asio::io_context io_context;
    tcp::socket socket;

    SocketImpl() : socket(io_context) {}

    // Drive io_context until the pending operation completes or the deadline passes
    void RunUntil(const asio::error_code& result, TimePoint deadline, bool deadline_set) {
        io_context.restart();
        if (!deadline_set) {
            io_context.run();
            return;
        }
        while (result == asio::error::would_block) {
            if (io_context.run_one_until(deadline) == 0) {
                break;
            }
        }
        // Finish a CANCEL write that became ready meanwhile
        io_context.poll();
    }

    // Abort the pending operation and let its handler run
    void Abort() {
        asio::error_code ec;
        socket.cancel(ec);
        io_context.restart();
        io_context.run();
    }
};

namespace {

// RESPONSE and STREAM payloads both start with the request id
uint64_t FrameRequestId(const Message& frame) {
    ByteReader reader(frame.GetPayload(), "frame");
    return reader.ReadUInt64();
}

} // namespace

//===----------------------------------------------------------------------===//
// Transport Implementation
//===----------------------------------------------------------------------===//

Transport::Transport(const ConnectionConfig& config)
    : impl_(std::make_unique<SocketImpl>())
    , config_(config)
    , endpoint_(config.Endpoint())
    , open_(false)
    , broken_(false)
    , next_request_id_(1) {
}

Transport::~Transport() {
    Close();
}

HelloResponsePayload Transport::Connect() {
    if (open_) {
        throw ProtocolError(ErrorCode::INVALID_STATE, "Already connected");
    }

    auto deadline = Clock::now() + std::chrono::milliseconds(config_.connect_timeout_ms);
    bool deadline_set = config_.connect_timeout_ms > 0;

    asio::error_code ec;
    tcp::resolver resolver(impl_->io_context);
    auto endpoints = resolver.resolve(config_.host, std::to_string(config_.port), ec);
    if (ec) {
        throw TransportError(ErrorCode::TRANSPORT_ERROR,
                             "Cannot resolve " + endpoint_ + ": " + ec.message());
    }

    asio::error_code result = asio::error::would_block;
    asio::async_connect(impl_->socket, endpoints,
        [&result](const asio::error_code& connect_ec, const tcp::endpoint&) {
            result = connect_ec;
        });
    impl_->RunUntil(result, deadline, deadline_set);
    if (result == asio::error::would_block) {
        impl_->Abort();
        impl_->socket.close(ec);
        throw TransportError(ErrorCode::TRANSPORT_TIMEOUT,
                             "Connection to " + endpoint_ + " timed out");
    }
    if (result) {
        impl_->socket.close(ec);
        throw TransportError(ErrorCode::TRANSPORT_ERROR,
                             "Connection to " + endpoint_ + " failed: " + result.message());
    }
    impl_->socket.set_option(tcp::no_delay(true), ec);

    open_ = true;
    broken_ = false;

    HelloPayload hello;
    hello.client_name = config_.client_name;
    hello.user = config_.user;
    SendFrame(MessageType::HELLO, hello.Serialize());

    Message reply = ReadFrame(deadline, deadline_set);
    if (reply.GetType() == MessageType::ERROR) {
        auto error = ErrorPayload::Deserialize(reply.GetPayload());
        Close();
        ThrowError(error.code, "Connection rejected: " + error.message, error.sql_state);
    }
    if (reply.GetType() != MessageType::HELLO_RESPONSE) {
        Close();
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR,
                            std::string("Unexpected response to HELLO: ") +
                            MessageTypeToString(reply.GetType()));
    }

    HelloResponsePayload response;
    try {
        response = HelloResponsePayload::Deserialize(reply.GetPayload());
    } catch (const DecodeError& e) {
        Close();
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR, e.what());
    }
    if (response.error_code != ErrorCode::OK) {
        Close();
        ThrowError(response.error_code, response.message);
    }

    LOG_DEBUG("client", "Connected to " + endpoint_ + ", session " +
              std::to_string(response.session_id));
    return response;
}

void Transport::Close() {
    if (!open_.exchange(false)) {
        return;
    }

    asio::error_code ec;
    if (!broken_) {
        auto frame = EncodeFrame(MessageType::CLOSE, {});
        asio::write(impl_->socket, asio::buffer(frame), ec);
        if (ec) {
            LOG_DEBUG("client", "CLOSE to " + endpoint_ + " not delivered: " + ec.message());
        }
    }
    impl_->socket.shutdown(tcp::socket::shutdown_both, ec);
    impl_->socket.close(ec);
    abandoned_.clear();
}

void Transport::CheckUsable() const {
    if (!open_) {
        throw TransportError(ErrorCode::TRANSPORT_ERROR, "Not connected to " + endpoint_);
    }
    if (broken_) {
        throw TransportError(ErrorCode::TRANSPORT_ERROR, "Connection to " + endpoint_ + " is broken");
    }
}

void Transport::Fail(ErrorCode code, const std::string& message) {
    broken_ = true;
    LOG_DEBUG("client", "Transport to " + endpoint_ + " failed: " + message);
    ThrowError(code, message);
}

void Transport::SendFrame(MessageType type, std::vector<uint8_t> payload) {
    CheckUsable();
    auto frame = EncodeFrame(type, std::move(payload));

    asio::error_code ec;
    asio::write(impl_->socket, asio::buffer(frame), ec);
    if (ec) {
        Fail(ErrorCode::TRANSPORT_ERROR, "Send to " + endpoint_ + " failed: " + ec.message());
    }
}

void Transport::ReadExactly(uint8_t* data, size_t size, TimePoint deadline, bool deadline_set,
                            bool mid_frame) {
    asio::error_code result = asio::error::would_block;
    size_t transferred = 0;
    asio::async_read(impl_->socket, asio::buffer(data, size),
        [&result, &transferred](const asio::error_code& ec, size_t n) {
            result = ec;
            transferred = n;
        });
    impl_->RunUntil(result, deadline, deadline_set);

    if (result == asio::error::would_block) {
        impl_->Abort();
        if (mid_frame || transferred > 0) {
            // The stream is no longer frame aligned
            Fail(ErrorCode::TRANSPORT_TIMEOUT, "Timed out inside a frame from " + endpoint_);
        }
        throw TransportError(ErrorCode::TRANSPORT_TIMEOUT,
                             "No response from " + endpoint_ + " within the call timeout");
    }
    if (result == asio::error::eof) {
        Fail(ErrorCode::TRANSPORT_ERROR, "Connection closed by " + endpoint_);
    }
    if (result) {
        Fail(ErrorCode::TRANSPORT_ERROR, "Receive from " + endpoint_ + " failed: " + result.message());
    }
}

Message Transport::ReadFrame(TimePoint deadline, bool deadline_set) {
    CheckUsable();

    std::array<uint8_t, MessageHeader::SIZE> header_buffer;
    ReadExactly(header_buffer.data(), header_buffer.size(), deadline, deadline_set, false);

    auto header = MessageHeader::Parse(header_buffer.data());
    if (!header.IsValid()) {
        Fail(ErrorCode::PROTOCOL_ERROR, "Invalid frame header from " + endpoint_);
    }
    if (header.length > config_.max_frame_bytes) {
        Fail(ErrorCode::FRAME_TOO_LARGE, "Frame of " + std::to_string(header.length) +
             " bytes exceeds limit");
    }

    std::vector<uint8_t> payload(header.length);
    if (header.length > 0) {
        ReadExactly(payload.data(), payload.size(), deadline, deadline_set, true);
    }
    return Message(header, std::move(payload));
}

bool Transport::IsStale(const Message& frame) {
    if (abandoned_.empty()) {
        return false;
    }
    auto type = frame.GetType();
    if (type != MessageType::RESPONSE && type != MessageType::STREAM_CHUNK &&
        type != MessageType::STREAM_END) {
        return false;
    }
    auto it = abandoned_.find(FrameRequestId(frame));
    if (it == abandoned_.end()) {
        return false;
    }
    if (type != MessageType::STREAM_CHUNK) {
        abandoned_.erase(it);
    }
    return true;
}

Message Transport::AwaitReply(uint64_t request_id, std::chrono::milliseconds timeout) {
    bool deadline_set = timeout.count() > 0;
    auto deadline = Clock::now() + timeout;

    while (true) {
        Message frame;
        try {
            frame = ReadFrame(deadline, deadline_set);
        } catch (const TransportError& e) {
            if (e.IsTimeout() && IsOpen()) {
                abandoned_.insert(request_id);
            }
            throw;
        }

        if (IsStale(frame)) {
            continue;
        }

        switch (frame.GetType()) {
            case MessageType::RESPONSE:
            case MessageType::STREAM_CHUNK:
            case MessageType::STREAM_END: {
                uint64_t id = FrameRequestId(frame);
                if (id != request_id) {
                    Fail(ErrorCode::PROTOCOL_ERROR, "Reply for request " + std::to_string(id) +
                         " while waiting for " + std::to_string(request_id));
                }
                return frame;
            }
            case MessageType::ERROR: {
                auto error = ErrorPayload::Deserialize(frame.GetPayload());
                broken_ = true;
                ThrowError(error.code, error.message, error.sql_state);
            }
            case MessageType::PONG:
                // Late reply to an abandoned ping
                continue;
            default:
                Fail(ErrorCode::PROTOCOL_ERROR, std::string("Unexpected frame ") +
                     MessageTypeToString(frame.GetType()));
        }
    }
}

bool Transport::Ping(std::chrono::milliseconds timeout) {
    SendFrame(MessageType::PING, {});

    bool deadline_set = timeout.count() > 0;
    auto deadline = Clock::now() + timeout;
    while (true) {
        Message frame = ReadFrame(deadline, deadline_set);
        if (frame.GetType() == MessageType::PONG) {
            return true;
        }
        if (!IsStale(frame)) {
            Fail(ErrorCode::PROTOCOL_ERROR, std::string("Unexpected frame ") +
                 MessageTypeToString(frame.GetType()) + " while waiting for PONG");
        }
    }
}

void Transport::Cancel(uint64_t request_id) {
    if (!IsOpen()) {
        return;
    }

    CancelPayload cancel;
    cancel.request_id = request_id;
    auto frame = std::make_shared<std::vector<uint8_t>>(EncodeFrame(MessageType::CANCEL, cancel.Serialize()));

    asio::post(impl_->io_context, [this, frame]() {
        asio::async_write(impl_->socket, asio::buffer(*frame),
            [this, frame](const asio::error_code& ec, size_t n) {
                if (ec) {
                    LOG_DEBUG("client", "CANCEL to " + endpoint_ + " not delivered: " + ec.message());
                    if (n > 0) {
                        broken_ = true;
                    }
                }
            });
    });
}

} // namespace client
} // namespace dbrelay
