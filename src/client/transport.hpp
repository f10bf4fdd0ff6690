//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/transport.hpp
//
// Blocking frame transport over one TCP connection
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "config/connection_config.hpp"
#include "protocol/message.hpp"
#include <set>

namespace dbrelay {
namespace client {

// Owns the socket of one logical connection. All socket operations run on
// the calling thread; Cancel() is the only method safe to call while another
// thread is blocked in a read.
class Transport {
public:
    explicit Transport(const ConnectionConfig& config);
    ~Transport();

    Transport(const Transport&) = delete;
    Transport& operator=(const Transport&) = delete;

    // TCP connect + HELLO; throws TransportError or the error the server reported
    HelloResponsePayload Connect();

    // Send CLOSE and shut the socket down; never throws
    void Close();

    bool IsOpen() const { return open_ && !broken_; }

    uint64_t NextRequestId() { return next_request_id_.fetch_add(1); }

    void SendFrame(MessageType type, std::vector<uint8_t> payload);

    // Next RESPONSE, STREAM_CHUNK or STREAM_END frame for request_id. Frames of
    // abandoned requests are skipped. On timeout the request is abandoned and
    // TransportError(TRANSPORT_TIMEOUT) is thrown.
    Message AwaitReply(uint64_t request_id, std::chrono::milliseconds timeout);

    // PING / PONG round trip
    bool Ping(std::chrono::milliseconds timeout);

    // Out-of-band CANCEL; written by the thread blocked in AwaitReply
    void Cancel(uint64_t request_id);

    const std::string& Endpoint() const { return endpoint_; }

private:
    Message ReadFrame(TimePoint deadline, bool deadline_set);
    void ReadExactly(uint8_t* data, size_t size, TimePoint deadline, bool deadline_set, bool mid_frame);
    void CheckUsable() const;
    [[noreturn]] void Fail(ErrorCode code, const std::string& message);

    // Frame for a request we stopped waiting for
    bool IsStale(const Message& frame);

private:
    class SocketImpl;
    std::unique_ptr<SocketImpl> impl_;

    ConnectionConfig config_;
    std::string endpoint_;

    std::atomic<bool> open_;
    std::atomic<bool> broken_;
    std::atomic<uint64_t> next_request_id_;

    std::set<uint64_t> abandoned_;
};

} // namespace client
} // namespace dbrelay
