//===----------------------------------------------------------------------===//
//                         DBRelay
//
// protocol/message_types.hpp
//
// Frame types, operation codes, status and error codes
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>

namespace dbrelay {

//===----------------------------------------------------------------------===//
// Frame Types
//===----------------------------------------------------------------------===//
enum class MessageType : uint8_t {
    // ===== Connection Management (0x01-0x0F) =====
    HELLO           = 0x01,  // Logical connect
    HELLO_RESPONSE  = 0x02,  // Session id + capabilities
    PING            = 0x03,  // Liveness check
    PONG            = 0x04,
    CLOSE           = 0x05,  // Transport shutdown

    // ===== Calls (0x10-0x1F) =====
    REQUEST         = 0x10,  // One API call
    RESPONSE        = 0x11,  // Outcome of one call
    ERROR           = 0x12,  // Connection-level error (no request context)
    CANCEL          = 0x14,  // Out-of-band cancel of an in-flight call

    // ===== Streams (0x40-0x4F) =====
    STREAM_CHUNK    = 0x40,  // One chunk of a LOB transfer
    STREAM_END      = 0x42,  // Final chunk, terminates the stream

    UNKNOWN         = 0xFF
};

//===----------------------------------------------------------------------===//
// Frame Flags
//===----------------------------------------------------------------------===//
namespace MessageFlags {
    constexpr uint8_t NONE = 0x00;
    // bits 0-7: reserved
}

//===----------------------------------------------------------------------===//
// Response Status
//===----------------------------------------------------------------------===//
enum class StatusCode : uint8_t {
    OK              = 0x00,
    DATABASE_ERROR  = 0x01,
    PROTOCOL_ERROR  = 0x02,
};

//===----------------------------------------------------------------------===//
// Handle Kinds
//===----------------------------------------------------------------------===//
enum class HandleKind : uint8_t {
    SESSION     = 0x01,  // handle id 0: the session itself
    STATEMENT   = 0x02,
    CURSOR      = 0x03,
    LOB         = 0x04,
};

//===----------------------------------------------------------------------===//
// Operation Codes
//
// The high byte selects the capability table (handle kind) an operation
// belongs to. Argument layouts are documented per operation.
//===----------------------------------------------------------------------===//
enum class OpCode : uint16_t {
    // ===== Any handle (0x00xx) =====
    HANDLE_CLOSE                = 0x0001,  // ()

    // ===== Connection / session (0x01xx), handle id 0 =====
    CONN_CLOSE                  = 0x0101,  // ()
    CONN_IS_VALID               = 0x0102,  // ()
    CONN_SET_AUTOCOMMIT         = 0x0103,  // (bool)
    CONN_GET_AUTOCOMMIT         = 0x0104,  // () -> bool
    CONN_COMMIT                 = 0x0105,  // ()
    CONN_ROLLBACK               = 0x0106,  // ()
    CONN_SET_SAVEPOINT          = 0x0107,  // (string|null name) -> int32 id, string name
    CONN_RELEASE_SAVEPOINT      = 0x0108,  // (string name)
    CONN_ROLLBACK_TO_SAVEPOINT  = 0x0109,  // (string name)
    CONN_SET_ISOLATION          = 0x010A,  // (int32 level)
    CONN_GET_ISOLATION          = 0x010B,  // () -> int32
    CONN_SET_READ_ONLY          = 0x010C,  // (bool)
    CONN_GET_READ_ONLY          = 0x010D,  // () -> bool
    CONN_GET_METADATA           = 0x010E,  // () -> product, version, server, server version
    CONN_GET_CAPABILITIES       = 0x010F,  // () -> int32 bits, int32 opcode...
    CONN_GET_TABLES             = 0x0110,  // (string|null schema, string|null table pattern) -> result
    CONN_GET_COLUMNS            = 0x0111,  // (string|null schema, string|null table pattern) -> result
    CONN_CREATE_LOB             = 0x0112,  // (int32 lob kind) -> new LOB handle

    // ===== Statement (0x02xx) =====
    STMT_EXECUTE                = 0x0201,  // ExecuteArgs; handle 0 allocates a statement
    STMT_EXECUTE_PREPARED       = 0x0202,  // ExecuteArgs; handle 0 allocates from sql
    STMT_EXECUTE_BATCH          = 0x0203,  // ExecuteArgs with several parameter sets
    STMT_DESCRIBE               = 0x0204,  // ExecuteArgs (sql only) -> int32 param count + columns

    // ===== Cursor (0x03xx) =====
    CURSOR_FETCH                = 0x0301,  // (int64 start row, int32 max rows) -> result block

    // ===== Large object (0x04xx) =====
    LOB_LENGTH                  = 0x0401,  // () -> int64
    LOB_READ                    = 0x0402,  // (int64 offset, int32 length) -> chunk stream
    LOB_WRITE_BEGIN             = 0x0403,  // (bool replace) then chunk stream -> int64 length
    LOB_TRUNCATE                = 0x0404,  // (int64 length)

    // ===== XA (0x05xx), handle id 0 =====
    XA_START                    = 0x0501,  // (xid, int32 flags)
    XA_END                      = 0x0502,  // (xid, int32 flags)
    XA_PREPARE                  = 0x0503,  // (xid) -> int32 vote
    XA_COMMIT                   = 0x0504,  // (xid, bool one_phase)
    XA_ROLLBACK                 = 0x0505,  // (xid)
    XA_RECOVER                  = 0x0506,  // (int32 flags) -> xid...
    XA_FORGET                   = 0x0507,  // (xid)
    XA_SET_TIMEOUT              = 0x0508,  // (int32 seconds) -> bool
    XA_GET_TIMEOUT              = 0x0509,  // () -> int32
};

inline uint8_t OpCodeTable(OpCode op) {
    return static_cast<uint8_t>(static_cast<uint16_t>(op) >> 8);
}

//===----------------------------------------------------------------------===//
// Statement execution enums (values match the JDBC constants)
//===----------------------------------------------------------------------===//
enum class ExecuteMode : int32_t {
    ANY     = 0,  // execute()
    QUERY   = 1,  // executeQuery()
    UPDATE  = 2,  // executeUpdate()
};

enum class ResultSetType : int32_t {
    FORWARD_ONLY        = 1003,
    SCROLL_INSENSITIVE  = 1004,
    SCROLL_SENSITIVE    = 1005,
};

enum class ResultSetConcurrency : int32_t {
    READ_ONLY   = 1007,
    UPDATABLE   = 1008,
};

enum class GeneratedKeysMode : int32_t {
    NONE            = 0,
    ALL             = 1,
    COLUMN_NAMES    = 2,
    COLUMN_INDEXES  = 3,
};

enum class IsolationLevel : int32_t {
    NONE                = 0,
    READ_UNCOMMITTED    = 1,
    READ_COMMITTED      = 2,
    REPEATABLE_READ     = 4,
    SERIALIZABLE        = 8,
};

enum class LobKind : int32_t {
    BLOB = 1,
    CLOB = 2,
};

//===----------------------------------------------------------------------===//
// XA constants (values match javax.transaction.xa)
//===----------------------------------------------------------------------===//
namespace XaFlags {
    constexpr int32_t TMNOFLAGS     = 0x00000000;
    constexpr int32_t TMENDRSCAN    = 0x00800000;
    constexpr int32_t TMSTARTRSCAN  = 0x01000000;
    constexpr int32_t TMSUSPEND     = 0x02000000;
    constexpr int32_t TMSUCCESS     = 0x04000000;
    constexpr int32_t TMRESUME      = 0x08000000;
    constexpr int32_t TMFAIL        = 0x20000000;
    constexpr int32_t TMONEPHASE    = 0x40000000;
    constexpr int32_t TMJOIN        = 0x00200000;

    constexpr int32_t XA_OK         = 0;
    constexpr int32_t XA_RDONLY     = 3;
}

//===----------------------------------------------------------------------===//
// Capabilities (HELLO_RESPONSE / CONN_GET_CAPABILITIES)
//===----------------------------------------------------------------------===//
namespace Capability {
    constexpr uint32_t SCROLLABLE_CURSORS       = 1u << 0;
    constexpr uint32_t UPDATABLE_CURSORS        = 1u << 1;
    constexpr uint32_t SAVEPOINTS               = 1u << 2;
    constexpr uint32_t XA_TRANSACTIONS          = 1u << 3;
    constexpr uint32_t GENERATED_KEYS           = 1u << 4;
    constexpr uint32_t GENERATED_KEYS_BY_INDEX  = 1u << 5;
    constexpr uint32_t BATCH_UPDATES            = 1u << 6;
    constexpr uint32_t LOB_STREAMING            = 1u << 7;
    constexpr uint32_t QUERY_TIMEOUT            = 1u << 8;
    constexpr uint32_t CANCEL                   = 1u << 9;
    constexpr uint32_t ISOLATION_LEVELS         = 1u << 10;
}

//===----------------------------------------------------------------------===//
// Error Codes
//
// The high 16 bits select the category, which decides the response status
// and the client exception class.
//===----------------------------------------------------------------------===//
enum class ErrorCode : uint32_t {
    // ===== 0x0000xxxx: Success =====
    OK                      = 0x00000000,

    // ===== 0x0001xxxx: Database errors (passed through from the backend) =====
    DATABASE_ERROR          = 0x00010001,
    SYNTAX_ERROR            = 0x00010002,
    CATALOG_ERROR           = 0x00010003,  // table/column not found
    CONSTRAINT_VIOLATION    = 0x00010004,
    CONVERSION_ERROR        = 0x00010005,
    TRANSACTION_CONFLICT    = 0x00010006,
    QUERY_CANCELLED         = 0x00010007,
    QUERY_TIMEOUT           = 0x00010008,
    BACKEND_NOT_SUPPORTED   = 0x00010009,  // backend refused a feature (e.g. SAVEPOINT)

    // ===== 0x0002xxxx: Server errors =====
    INTERNAL_ERROR          = 0x00020001,
    POOL_EXHAUSTED          = 0x00020002,
    SERVER_SHUTTING_DOWN    = 0x00020003,
    MAX_SESSIONS            = 0x00020004,
    XA_LIMIT_REACHED        = 0x00020005,

    // ===== 0x0003xxxx: Protocol errors =====
    PROTOCOL_ERROR          = 0x00030001,  // malformed frame or payload
    UNKNOWN_OPERATION       = 0x00030002,
    SESSION_NOT_FOUND       = 0x00030003,
    VERSION_MISMATCH        = 0x00030004,
    INVALID_STATE           = 0x00030005,
    INVALID_ARGUMENT        = 0x00030006,
    FRAME_TOO_LARGE         = 0x00030007,
    XA_PROTOCOL             = 0x00030010,  // XAER_PROTO
    XA_UNKNOWN_XID          = 0x00030011,  // XAER_NOTA
    XA_DUPLICATE_XID        = 0x00030012,  // XAER_DUPID

    // ===== 0x0004xxxx: Resource lifecycle errors =====
    INVALID_HANDLE          = 0x00040001,  // never allocated in this session
    HANDLE_CLOSED           = 0x00040002,
    WRONG_HANDLE_KIND       = 0x00040003,
    PARAMETER_OUT_OF_RANGE  = 0x00040004,
    COLUMN_OUT_OF_RANGE     = 0x00040005,
    SESSION_CLOSING         = 0x00040006,
    CONNECTION_CLOSED       = 0x00040007,  // client object used after Connection::Close

    // ===== 0x0005xxxx: XA outcomes =====
    XA_INDETERMINATE        = 0x00050001,  // commit failed after prepare
    XA_ROLLED_BACK          = 0x00050002,  // branch was rolled back (rollback-only, timeout)

    // ===== 0x0006xxxx: Unsupported features =====
    UNSUPPORTED_OPERATION   = 0x00060001,

    // ===== 0x0007xxxx: Transport (client side only) =====
    TRANSPORT_ERROR         = 0x00070001,
    TRANSPORT_TIMEOUT       = 0x00070002,
};

enum class ErrorCategory : uint16_t {
    NONE        = 0x0000,
    DATABASE    = 0x0001,
    SERVER      = 0x0002,
    PROTOCOL    = 0x0003,
    RESOURCE    = 0x0004,
    XA          = 0x0005,
    UNSUPPORTED = 0x0006,
    TRANSPORT   = 0x0007,
};

inline ErrorCategory ErrorCategoryOf(ErrorCode code) {
    return static_cast<ErrorCategory>(static_cast<uint32_t>(code) >> 16);
}

inline StatusCode StatusForError(ErrorCode code) {
    switch (ErrorCategoryOf(code)) {
        case ErrorCategory::NONE:       return StatusCode::OK;
        case ErrorCategory::DATABASE:
        case ErrorCategory::SERVER:
        case ErrorCategory::XA:         return StatusCode::DATABASE_ERROR;
        default:                        return StatusCode::PROTOCOL_ERROR;
    }
}

//===----------------------------------------------------------------------===//
// Utility Functions
//===----------------------------------------------------------------------===//
inline const char* MessageTypeToString(MessageType type) {
    switch (type) {
        case MessageType::HELLO:            return "HELLO";
        case MessageType::HELLO_RESPONSE:   return "HELLO_RESPONSE";
        case MessageType::PING:             return "PING";
        case MessageType::PONG:             return "PONG";
        case MessageType::CLOSE:            return "CLOSE";
        case MessageType::REQUEST:          return "REQUEST";
        case MessageType::RESPONSE:         return "RESPONSE";
        case MessageType::ERROR:            return "ERROR";
        case MessageType::CANCEL:           return "CANCEL";
        case MessageType::STREAM_CHUNK:     return "STREAM_CHUNK";
        case MessageType::STREAM_END:       return "STREAM_END";
        default:                            return "UNKNOWN";
    }
}

const char* OpCodeToString(OpCode op);

inline const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                     return "OK";
        case ErrorCode::DATABASE_ERROR:         return "DATABASE_ERROR";
        case ErrorCode::SYNTAX_ERROR:           return "SYNTAX_ERROR";
        case ErrorCode::CATALOG_ERROR:          return "CATALOG_ERROR";
        case ErrorCode::CONSTRAINT_VIOLATION:   return "CONSTRAINT_VIOLATION";
        case ErrorCode::CONVERSION_ERROR:       return "CONVERSION_ERROR";
        case ErrorCode::TRANSACTION_CONFLICT:   return "TRANSACTION_CONFLICT";
        case ErrorCode::QUERY_CANCELLED:        return "QUERY_CANCELLED";
        case ErrorCode::QUERY_TIMEOUT:          return "QUERY_TIMEOUT";
        case ErrorCode::BACKEND_NOT_SUPPORTED:  return "BACKEND_NOT_SUPPORTED";
        case ErrorCode::INTERNAL_ERROR:         return "INTERNAL_ERROR";
        case ErrorCode::POOL_EXHAUSTED:         return "POOL_EXHAUSTED";
        case ErrorCode::SERVER_SHUTTING_DOWN:   return "SERVER_SHUTTING_DOWN";
        case ErrorCode::MAX_SESSIONS:           return "MAX_SESSIONS";
        case ErrorCode::XA_LIMIT_REACHED:       return "XA_LIMIT_REACHED";
        case ErrorCode::PROTOCOL_ERROR:         return "PROTOCOL_ERROR";
        case ErrorCode::UNKNOWN_OPERATION:      return "UNKNOWN_OPERATION";
        case ErrorCode::SESSION_NOT_FOUND:      return "SESSION_NOT_FOUND";
        case ErrorCode::VERSION_MISMATCH:       return "VERSION_MISMATCH";
        case ErrorCode::INVALID_STATE:          return "INVALID_STATE";
        case ErrorCode::INVALID_ARGUMENT:       return "INVALID_ARGUMENT";
        case ErrorCode::FRAME_TOO_LARGE:        return "FRAME_TOO_LARGE";
        case ErrorCode::XA_PROTOCOL:            return "XA_PROTOCOL";
        case ErrorCode::XA_UNKNOWN_XID:         return "XA_UNKNOWN_XID";
        case ErrorCode::XA_DUPLICATE_XID:       return "XA_DUPLICATE_XID";
        case ErrorCode::INVALID_HANDLE:         return "INVALID_HANDLE";
        case ErrorCode::HANDLE_CLOSED:          return "HANDLE_CLOSED";
        case ErrorCode::WRONG_HANDLE_KIND:      return "WRONG_HANDLE_KIND";
        case ErrorCode::PARAMETER_OUT_OF_RANGE: return "PARAMETER_OUT_OF_RANGE";
        case ErrorCode::COLUMN_OUT_OF_RANGE:    return "COLUMN_OUT_OF_RANGE";
        case ErrorCode::SESSION_CLOSING:        return "SESSION_CLOSING";
        case ErrorCode::CONNECTION_CLOSED:      return "CONNECTION_CLOSED";
        case ErrorCode::XA_INDETERMINATE:       return "XA_INDETERMINATE";
        case ErrorCode::XA_ROLLED_BACK:         return "XA_ROLLED_BACK";
        case ErrorCode::UNSUPPORTED_OPERATION:  return "UNSUPPORTED_OPERATION";
        case ErrorCode::TRANSPORT_ERROR:        return "TRANSPORT_ERROR";
        case ErrorCode::TRANSPORT_TIMEOUT:      return "TRANSPORT_TIMEOUT";
        default:                                return "UNKNOWN_ERROR";
    }
}

// Map ErrorCode to SQLSTATE
inline const char* ErrorCodeToSqlState(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                     return "00000";
        case ErrorCode::SYNTAX_ERROR:           return "42000";
        case ErrorCode::CATALOG_ERROR:          return "42S02";
        case ErrorCode::CONSTRAINT_VIOLATION:   return "23000";
        case ErrorCode::CONVERSION_ERROR:       return "22018";
        case ErrorCode::TRANSACTION_CONFLICT:   return "40001";
        case ErrorCode::QUERY_CANCELLED:        return "57014";
        case ErrorCode::QUERY_TIMEOUT:          return "HYT00";
        case ErrorCode::BACKEND_NOT_SUPPORTED:  return "0A000";
        case ErrorCode::POOL_EXHAUSTED:         return "08004";
        case ErrorCode::MAX_SESSIONS:           return "08004";
        case ErrorCode::SESSION_NOT_FOUND:      return "08003";
        case ErrorCode::CONNECTION_CLOSED:      return "08003";
        case ErrorCode::INVALID_STATE:          return "25000";
        case ErrorCode::PARAMETER_OUT_OF_RANGE: return "07009";
        case ErrorCode::COLUMN_OUT_OF_RANGE:    return "07009";
        case ErrorCode::XA_ROLLED_BACK:         return "40000";
        case ErrorCode::UNSUPPORTED_OPERATION:  return "0A000";
        case ErrorCode::TRANSPORT_ERROR:        return "08006";
        case ErrorCode::TRANSPORT_TIMEOUT:      return "08006";
        default:                                return "HY000";
    }
}

} // namespace dbrelay
