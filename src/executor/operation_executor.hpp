//===----------------------------------------------------------------------===//
//                         DBRelay
//
// executor/operation_executor.hpp
//
// Runs client calls against the session's resources and connections
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include "protocol/wire_codec.hpp"
#include "session/session.hpp"
#include "session/session_manager.hpp"
#include "duckdb.hpp"
#include <optional>

namespace dbrelay {

class ServerStatement;
class ServerCursor;

// Pushes STREAM_CHUNK / STREAM_END frames for the current call
using StreamSink = std::function<void(MessageType, const StreamChunkPayload&)>;

// State of one call while it runs
struct CallContext {
    CallContext(Session& session_p, const RequestPayload& request_p,
                ResponsePayload& response_p, const StreamSink& sink_p)
        : session(session_p)
        , request(request_p)
        , args(request_p.args, request_p.opcode)
        , response(response_p)
        , sink(sink_p) {}

    Session& session;
    const RequestPayload& request;
    ArgumentList args;
    ResponsePayload& response;
    const StreamSink& sink;

    // Resolved handle, nullptr for session operations and allocating calls
    std::shared_ptr<Resource> target;

    // The answer went out as a chunk stream (or is deferred until one ends)
    bool streamed = false;
};

class OperationExecutor {
public:
    struct Config {
        uint32_t fetch_size;
        uint32_t lob_chunk_size;
        uint64_t lob_inline_limit;  // larger cells are returned as LOB handles
        std::chrono::milliseconds query_timeout;  // server cap, 0 = none
        std::string server_name;
        std::string server_version;

        Config()
            : fetch_size(DEFAULT_FETCH_SIZE)
            , lob_chunk_size(DEFAULT_LOB_CHUNK_SIZE)
            , lob_inline_limit(1024 * 1024)
            , query_timeout(DEFAULT_QUERY_TIMEOUT_MS)
            , server_name("dbrelayd") {}
    };

    OperationExecutor(SessionManager& manager_p, const Config& config_p);

    // Run one REQUEST. Returns nullopt when the answer was streamed
    // (LOB_READ) or is deferred to the end of a chunk stream (LOB_WRITE_BEGIN).
    std::optional<ResponsePayload> Execute(Session& session, const RequestPayload& request,
                                           const StreamSink& sink);

    // STREAM_CHUNK / STREAM_END of a LOB write. Returns the RESPONSE once the
    // stream ends; frames for unknown or idle LOBs are dropped.
    std::optional<ResponsePayload> HandleStreamChunk(Session& session, MessageType type,
                                                     const StreamChunkPayload& chunk);

    // CANCEL of an open chunked LOB write: drops the staged bytes and answers the write
    std::optional<ResponsePayload> CancelLobWrite(Session& session, uint64_t request_id);

    // Capability bits advertised in HELLO_RESPONSE and CONN_GET_CAPABILITIES
    static uint32_t Capabilities();
    static std::vector<OpCode> SupportedOperations();

    const Config& GetConfig() const { return config; }

private:
    using Handler = void (OperationExecutor::*)(CallContext& ctx);

    enum class Target : uint8_t {
        SESSION,           // handle id must be 0
        ANY_HANDLE,        // resolved by the handler
        STATEMENT_OR_NEW,  // 0 allocates a statement
        CURSOR,
        LOB,
    };

    struct OperationEntry {
        OpCode op;
        Target target;
        Handler handler;
    };

    static const std::vector<OperationEntry>& OperationTable();
    static const OperationEntry* FindOperation(OpCode op);

    std::shared_ptr<Resource> ResolveTarget(Session& session, const OperationEntry& entry,
                                            uint64_t handle_id);
    ResponsePayload ErrorResponse(Session& session, const RequestPayload& request,
                                  const RelayException& e);

    //===--------------------------------------------------------------------===//
    // Statement helpers
    //===--------------------------------------------------------------------===//
    std::shared_ptr<ServerStatement> StatementFor(CallContext& ctx, const ExecuteArgs& args,
                                                  bool prepared);
    duckdb::unique_ptr<duckdb::QueryResult> RunStatement(CallContext& ctx, CallConnection& call,
                                                         ServerStatement& stmt,
                                                         const std::string& sql,
                                                         const ParameterSet* params);
    duckdb::vector<duckdb::Value> BindParameters(Session& session, ServerStatement& stmt,
                                                 const ParameterSet* params);
    std::shared_ptr<ServerCursor> MakeCursor(CallContext& ctx, uint64_t parent_id,
                                             const StatementOptions& options, ResultSetType type,
                                             duckdb::MaterializedQueryResult& result);
    void ExternalizeLobs(Session& session, ServerCursor& cursor);
    void RunMetadataQuery(CallContext& ctx, const std::string& sql,
                          duckdb::vector<duckdb::Value> params);

    std::chrono::milliseconds EffectiveTimeout(const StatementOptions& options) const;
    uint32_t FetchSize(const StatementOptions& options) const;

    //===--------------------------------------------------------------------===//
    // Handlers
    //===--------------------------------------------------------------------===//
    void HandleClose(CallContext& ctx);

    void ConnClose(CallContext& ctx);
    void ConnIsValid(CallContext& ctx);
    void ConnSetAutoCommit(CallContext& ctx);
    void ConnGetAutoCommit(CallContext& ctx);
    void ConnCommit(CallContext& ctx);
    void ConnRollback(CallContext& ctx);
    void ConnSetSavepoint(CallContext& ctx);
    void ConnReleaseSavepoint(CallContext& ctx);
    void ConnRollbackToSavepoint(CallContext& ctx);
    void ConnSetIsolation(CallContext& ctx);
    void ConnGetIsolation(CallContext& ctx);
    void ConnSetReadOnly(CallContext& ctx);
    void ConnGetReadOnly(CallContext& ctx);
    void ConnGetMetadata(CallContext& ctx);
    void ConnGetCapabilities(CallContext& ctx);
    void ConnGetTables(CallContext& ctx);
    void ConnGetColumns(CallContext& ctx);
    void ConnCreateLob(CallContext& ctx);

    void StmtExecute(CallContext& ctx);
    void StmtExecuteBatch(CallContext& ctx);
    void StmtDescribe(CallContext& ctx);

    void CursorFetch(CallContext& ctx);

    void LobLength(CallContext& ctx);
    void LobRead(CallContext& ctx);
    void LobWriteBegin(CallContext& ctx);
    void LobTruncate(CallContext& ctx);

    void XaStart(CallContext& ctx);
    void XaEnd(CallContext& ctx);
    void XaPrepare(CallContext& ctx);
    void XaCommit(CallContext& ctx);
    void XaRollback(CallContext& ctx);
    void XaRecover(CallContext& ctx);
    void XaForget(CallContext& ctx);
    void XaSetTimeout(CallContext& ctx);
    void XaGetTimeout(CallContext& ctx);

private:
    SessionManager& manager;
    Config config;
};

} // namespace dbrelay
