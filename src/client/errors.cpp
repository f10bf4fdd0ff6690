//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/errors.cpp
//
// Error code to exception mapping
//===----------------------------------------------------------------------===//

#include "client/errors.hpp"
#include "protocol/wire_codec.hpp"

namespace dbrelay {
namespace client {

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PROTOCOL:           return "protocol error";
        case ErrorKind::TRANSPORT:          return "transport error";
        case ErrorKind::DATABASE:           return "database error";
        case ErrorKind::RESOURCE_LIFECYCLE: return "resource lifecycle error";
        default:                            return "error";
    }
}

DbRelayError::DbRelayError(ErrorKind kind_p, ErrorCode code_p, const std::string& message,
                           std::string sql_state_p)
    : std::runtime_error(message)
    , kind(kind_p)
    , code(code_p)
    , sql_state(sql_state_p.empty() ? ErrorCodeToSqlState(code_p) : std::move(sql_state_p)) {
}

ErrorKind KindOf(ErrorCode code) {
    switch (ErrorCategoryOf(code)) {
        case ErrorCategory::DATABASE:
        case ErrorCategory::SERVER:
        case ErrorCategory::XA:
            return ErrorKind::DATABASE;
        case ErrorCategory::RESOURCE:
            return ErrorKind::RESOURCE_LIFECYCLE;
        case ErrorCategory::TRANSPORT:
            return ErrorKind::TRANSPORT;
        default:
            return ErrorKind::PROTOCOL;
    }
}

void ThrowError(ErrorCode code, const std::string& message, const std::string& sql_state,
                int32_t vendor_code) {
    switch (ErrorCategoryOf(code)) {
        case ErrorCategory::DATABASE:
        case ErrorCategory::SERVER:
            throw DatabaseError(code, message, sql_state, vendor_code);
        case ErrorCategory::XA:
            if (code == ErrorCode::XA_INDETERMINATE) {
                throw XaIndeterminateError(message, sql_state, vendor_code);
            }
            throw DatabaseError(code, message, sql_state, vendor_code);
        case ErrorCategory::RESOURCE:
            throw ResourceLifecycleError(code, message, sql_state);
        case ErrorCategory::UNSUPPORTED:
            throw UnsupportedOperationError(message, code, sql_state);
        case ErrorCategory::TRANSPORT:
            throw TransportError(code, message);
        default:
            throw ProtocolError(code, message, sql_state);
    }
}

void ThrowResponseError(const ResponsePayload& response) {
    ThrowError(response.error.code, response.error.message, response.error.sql_state,
               response.error.vendor_code);
}

} // namespace client
} // namespace dbrelay
