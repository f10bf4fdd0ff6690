//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/lob.hpp
//
// Client handle for a server-side BLOB or CLOB
//===----------------------------------------------------------------------===//

#pragma once

#include "client/call_dispatcher.hpp"

namespace dbrelay {
namespace client {

// Reads pull only the requested range; writes stream the value in chunks.
// CLOB offsets and lengths count UTF-8 bytes.
class Lob : public ClientResource, public std::enable_shared_from_this<Lob> {
public:
    Lob(std::shared_ptr<CallDispatcher> dispatcher, uint64_t handle_id, LobKind kind, int64_t length);

    uint64_t GetHandleId() const { return handle_id_; }
    LobKind GetKind() const { return kind_; }

    // Current length from the server
    int64_t Length();

    // Up to length bytes from offset (0-based); shorter at the end of the value
    std::vector<uint8_t> Read(int64_t offset, int32_t length);
    std::vector<uint8_t> ReadAll();
    std::string ReadString(int64_t offset, int32_t length);
    std::string ReadAllString();

    // Replace the whole value; returns the new length
    int64_t Write(const std::vector<uint8_t>& data);
    int64_t Write(const std::string& text);

    // Append to the current value
    int64_t Append(const std::vector<uint8_t>& data);

    void Truncate(int64_t length);

    // Reference for binding as a statement parameter
    Value ToValue() const { return Value::Lob(handle_id_, kind_, length_); }

    void Close();
    bool IsClosed() const { return closed_; }
    void Invalidate() override { closed_ = true; }

private:
    void CheckOpen() const;
    int64_t Stream(bool replace, const uint8_t* data, size_t size);

private:
    std::shared_ptr<CallDispatcher> dispatcher_;
    uint64_t handle_id_;
    LobKind kind_;
    int64_t length_;
    std::atomic<bool> closed_;
};

} // namespace client
} // namespace dbrelay
