//===----------------------------------------------------------------------===//
//                         DBRelay
//
// protocol/message.hpp
//
// Frame header, frame container and session-level payloads
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/byte_buffer.hpp"
#include "protocol/message_types.hpp"

namespace dbrelay {

//===----------------------------------------------------------------------===//
// Frame header: magic u32, version u8, type u8, flags u8, reserved u8, length u32
// All fields little-endian.
//===----------------------------------------------------------------------===//
struct MessageHeader {
    static constexpr size_t SIZE = 12;

    uint32_t magic = PROTOCOL_MAGIC;
    uint8_t version = PROTOCOL_VERSION;
    uint8_t type = static_cast<uint8_t>(MessageType::UNKNOWN);
    uint8_t flags = MessageFlags::NONE;
    uint32_t length = 0;

    MessageHeader() = default;
    MessageHeader(MessageType type_p, uint32_t length_p)
        : type(static_cast<uint8_t>(type_p)), length(length_p) {}

    bool IsValid() const { return magic == PROTOCOL_MAGIC && version == PROTOCOL_VERSION; }
    MessageType GetType() const { return static_cast<MessageType>(type); }

    void Encode(ByteWriter& out) const {
        out.WriteUInt32(magic);
        out.WriteUInt8(version);
        out.WriteUInt8(type);
        out.WriteUInt8(flags);
        out.WriteUInt8(0);
        out.WriteUInt32(length);
    }

    // data must hold SIZE bytes
    static MessageHeader Parse(const uint8_t* data) {
        ByteReader in(data, SIZE, "frame header");
        MessageHeader header;
        header.magic = in.ReadUInt32();
        header.version = in.ReadUInt8();
        header.type = in.ReadUInt8();
        header.flags = in.ReadUInt8();
        in.ReadUInt8();
        header.length = in.ReadUInt32();
        return header;
    }
};

//===----------------------------------------------------------------------===//
// One frame as read off or written to a socket
//===----------------------------------------------------------------------===//
class Message {
public:
    Message() = default;
    explicit Message(MessageType type) : header_(type, 0) {}
    Message(MessageType type, std::vector<uint8_t> payload)
        : header_(type, static_cast<uint32_t>(payload.size())), payload_(std::move(payload)) {}
    Message(const MessageHeader& header, std::vector<uint8_t> payload)
        : header_(header), payload_(std::move(payload)) {}

    MessageType GetType() const { return header_.GetType(); }
    const std::vector<uint8_t>& GetPayload() const { return payload_; }
    std::vector<uint8_t>& GetPayload() { return payload_; }

    std::vector<uint8_t> Serialize() const {
        ByteWriter out(MessageHeader::SIZE + payload_.size());
        MessageHeader header = header_;
        header.length = static_cast<uint32_t>(payload_.size());
        header.Encode(out);
        auto frame = out.Release();
        frame.insert(frame.end(), payload_.begin(), payload_.end());
        return frame;
    }

private:
    MessageHeader header_;
    std::vector<uint8_t> payload_;
};

inline std::vector<uint8_t> EncodeFrame(MessageType type, std::vector<uint8_t> payload) {
    return Message(type, std::move(payload)).Serialize();
}

//===----------------------------------------------------------------------===//
// Hello Payload (logical connect)
//===----------------------------------------------------------------------===//
struct HelloPayload {
    uint8_t  protocol_version = PROTOCOL_VERSION;
    std::string client_name;
    std::string user;
    uint32_t client_capabilities = 0;

    std::vector<uint8_t> Serialize() const;
    static HelloPayload Deserialize(const std::vector<uint8_t>& data);
};

//===----------------------------------------------------------------------===//
// Hello Response Payload
//===----------------------------------------------------------------------===//
struct HelloResponsePayload {
    ErrorCode error_code = ErrorCode::OK;
    uint64_t session_id = 0;
    uint8_t  protocol_version = PROTOCOL_VERSION;
    uint32_t capabilities = 0;
    std::string server_name;
    std::string server_version;
    std::string backend_name;
    std::string backend_version;
    std::string message;  // error text when error_code != OK

    std::vector<uint8_t> Serialize() const;
    static HelloResponsePayload Deserialize(const std::vector<uint8_t>& data);
};

//===----------------------------------------------------------------------===//
// Cancel Payload (out of band)
//===----------------------------------------------------------------------===//
struct CancelPayload {
    uint64_t request_id = 0;

    std::vector<uint8_t> Serialize() const;
    static CancelPayload Deserialize(const std::vector<uint8_t>& data);
};

//===----------------------------------------------------------------------===//
// Error Payload (connection level, no request context)
//===----------------------------------------------------------------------===//
struct ErrorPayload {
    ErrorCode code = ErrorCode::PROTOCOL_ERROR;
    std::string sql_state;
    std::string message;

    ErrorPayload() = default;
    ErrorPayload(ErrorCode code_p, std::string message_p)
        : code(code_p), sql_state(ErrorCodeToSqlState(code_p)), message(std::move(message_p)) {}

    std::vector<uint8_t> Serialize() const;
    static ErrorPayload Deserialize(const std::vector<uint8_t>& data);
};

} // namespace dbrelay
