//===----------------------------------------------------------------------===//
//                         DBRelay
//
// protocol/message.cpp
//
// Session-level payload encoding
//===----------------------------------------------------------------------===//

#include "protocol/message.hpp"

namespace dbrelay {

//===----------------------------------------------------------------------===//
// HelloPayload
//===----------------------------------------------------------------------===//
std::vector<uint8_t> HelloPayload::Serialize() const {
    ByteWriter out(16 + client_name.size() + user.size());
    out.WriteUInt8(protocol_version);
    out.WriteString(client_name);
    out.WriteString(user);
    out.WriteUInt32(client_capabilities);
    return out.Release();
}

HelloPayload HelloPayload::Deserialize(const std::vector<uint8_t>& data) {
    ByteReader in(data, "HelloPayload");
    HelloPayload payload;
    payload.protocol_version = in.ReadUInt8();
    payload.client_name = in.ReadString();
    payload.user = in.ReadString();
    payload.client_capabilities = in.ReadUInt32();
    return payload;
}

//===----------------------------------------------------------------------===//
// HelloResponsePayload
//===----------------------------------------------------------------------===//
std::vector<uint8_t> HelloResponsePayload::Serialize() const {
    ByteWriter out;
    out.WriteUInt32(static_cast<uint32_t>(error_code));
    out.WriteUInt64(session_id);
    out.WriteUInt8(protocol_version);
    out.WriteUInt32(capabilities);
    out.WriteString(server_name);
    out.WriteString(server_version);
    out.WriteString(backend_name);
    out.WriteString(backend_version);
    out.WriteString(message);
    return out.Release();
}

HelloResponsePayload HelloResponsePayload::Deserialize(const std::vector<uint8_t>& data) {
    ByteReader in(data, "HelloResponsePayload");
    HelloResponsePayload payload;
    payload.error_code = static_cast<ErrorCode>(in.ReadUInt32());
    payload.session_id = in.ReadUInt64();
    payload.protocol_version = in.ReadUInt8();
    payload.capabilities = in.ReadUInt32();
    payload.server_name = in.ReadString();
    payload.server_version = in.ReadString();
    payload.backend_name = in.ReadString();
    payload.backend_version = in.ReadString();
    payload.message = in.ReadString();
    return payload;
}

//===----------------------------------------------------------------------===//
// CancelPayload
//===----------------------------------------------------------------------===//
std::vector<uint8_t> CancelPayload::Serialize() const {
    ByteWriter out(8);
    out.WriteUInt64(request_id);
    return out.Release();
}

CancelPayload CancelPayload::Deserialize(const std::vector<uint8_t>& data) {
    ByteReader in(data, "CancelPayload");
    CancelPayload payload;
    payload.request_id = in.ReadUInt64();
    return payload;
}

//===----------------------------------------------------------------------===//
// ErrorPayload
//===----------------------------------------------------------------------===//
std::vector<uint8_t> ErrorPayload::Serialize() const {
    ByteWriter out(16 + message.size());
    out.WriteUInt32(static_cast<uint32_t>(code));
    out.WriteString(sql_state);
    out.WriteString(message);
    return out.Release();
}

ErrorPayload ErrorPayload::Deserialize(const std::vector<uint8_t>& data) {
    ByteReader in(data, "ErrorPayload");
    ErrorPayload payload;
    payload.code = static_cast<ErrorCode>(in.ReadUInt32());
    payload.sql_state = in.ReadString();
    payload.message = in.ReadString();
    return payload;
}

} // namespace dbrelay
