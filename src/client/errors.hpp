//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/errors.hpp
//
// Client exception hierarchy
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/message_types.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace dbrelay {

struct ResponsePayload;

namespace client {

enum class ErrorKind : uint8_t {
    PROTOCOL,
    TRANSPORT,
    DATABASE,
    RESOURCE_LIFECYCLE,
};

const char* ErrorKindToString(ErrorKind kind);

class DbRelayError : public std::runtime_error {
public:
    DbRelayError(ErrorKind kind_p, ErrorCode code_p, const std::string& message,
                 std::string sql_state_p = std::string());

    ErrorKind Kind() const { return kind; }
    ErrorCode Code() const { return code; }
    const std::string& SqlState() const { return sql_state; }

private:
    ErrorKind kind;
    ErrorCode code;
    std::string sql_state;
};

// Malformed frame, unknown operation or handle kind, invalid state transition
class ProtocolError : public DbRelayError {
public:
    ProtocolError(ErrorCode code, const std::string& message, std::string sql_state = std::string())
        : DbRelayError(ErrorKind::PROTOCOL, code, message, std::move(sql_state)) {}
};

// Optional feature the server does not offer
class UnsupportedOperationError : public ProtocolError {
public:
    explicit UnsupportedOperationError(const std::string& message,
                                       ErrorCode code = ErrorCode::UNSUPPORTED_OPERATION,
                                       std::string sql_state = std::string())
        : ProtocolError(code, message, std::move(sql_state)) {}
};

// The remote call failed: connection lost, response timeout
class TransportError : public DbRelayError {
public:
    TransportError(ErrorCode code, const std::string& message)
        : DbRelayError(ErrorKind::TRANSPORT, code, message) {}

    bool IsTimeout() const { return Code() == ErrorCode::TRANSPORT_TIMEOUT; }
};

// Backend error; message, SQLSTATE and vendor code are passed through
class DatabaseError : public DbRelayError {
public:
    DatabaseError(ErrorCode code, const std::string& message,
                  std::string sql_state = std::string(), int32_t vendor_code_p = 0)
        : DbRelayError(ErrorKind::DATABASE, code, message, std::move(sql_state))
        , vendor_code(vendor_code_p) {}

    int32_t VendorCode() const { return vendor_code; }

private:
    int32_t vendor_code;
};

// A batch entry failed; carries the counts of the entries before it
class BatchUpdateError : public DatabaseError {
public:
    BatchUpdateError(ErrorCode code, const std::string& message, std::string sql_state,
                     int32_t vendor_code, std::vector<int64_t> update_counts_p)
        : DatabaseError(code, message, std::move(sql_state), vendor_code)
        , update_counts(std::move(update_counts_p)) {}

    const std::vector<int64_t>& UpdateCounts() const { return update_counts; }

private:
    std::vector<int64_t> update_counts;
};

// XA commit failed after a successful prepare; the outcome is unknown
class XaIndeterminateError : public DatabaseError {
public:
    XaIndeterminateError(const std::string& message, std::string sql_state = std::string(),
                         int32_t vendor_code = 0)
        : DatabaseError(ErrorCode::XA_INDETERMINATE, message, std::move(sql_state), vendor_code) {}
};

// Closed or unknown handle, index out of bounds
class ResourceLifecycleError : public DbRelayError {
public:
    ResourceLifecycleError(ErrorCode code, const std::string& message,
                           std::string sql_state = std::string())
        : DbRelayError(ErrorKind::RESOURCE_LIFECYCLE, code, message, std::move(sql_state)) {}
};

// Kind a server error code maps to
ErrorKind KindOf(ErrorCode code);

// Throw the exception class for a code
[[noreturn]] void ThrowError(ErrorCode code, const std::string& message,
                             const std::string& sql_state = std::string(), int32_t vendor_code = 0);

// Throw the error carried by a failed response
[[noreturn]] void ThrowResponseError(const ResponsePayload& response);

} // namespace client
} // namespace dbrelay
