//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/connection.hpp
//
// Logical connection to dbrelayd, mirrored by one server session
//===----------------------------------------------------------------------===//

#pragma once

#include "client/call_dispatcher.hpp"

namespace dbrelay {
namespace client {

class Statement;
class PreparedStatement;
class Lob;
class DatabaseMetadata;
class XaResource;

struct Savepoint {
    int32_t id = 0;
    std::string name;
};

class Connection : public std::enable_shared_from_this<Connection> {
public:
    static std::shared_ptr<Connection> Open(const ConnectionConfig& config);
    // dbrelay://[user@]host[:port][?key=value&...]
    static std::shared_ptr<Connection> Open(const std::string& url);

    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    //===--------------------------------------------------------------------===//
    // Statements and LOBs
    //===--------------------------------------------------------------------===//
    std::shared_ptr<Statement> CreateStatement(
        ResultSetType type = ResultSetType::FORWARD_ONLY,
        ResultSetConcurrency concurrency = ResultSetConcurrency::READ_ONLY);

    std::shared_ptr<PreparedStatement> PrepareStatement(
        const std::string& sql,
        ResultSetType type = ResultSetType::FORWARD_ONLY,
        ResultSetConcurrency concurrency = ResultSetConcurrency::READ_ONLY);
    std::shared_ptr<PreparedStatement> PrepareStatement(const std::string& sql, GeneratedKeysMode keys);
    std::shared_ptr<PreparedStatement> PrepareStatement(const std::string& sql,
                                                        const std::vector<std::string>& key_columns);

    std::shared_ptr<Lob> CreateBlob();
    std::shared_ptr<Lob> CreateClob();

    //===--------------------------------------------------------------------===//
    // Transactions
    //===--------------------------------------------------------------------===//
    // Re-enabling autocommit commits pending work, or throws if the backend refuses
    void SetAutoCommit(bool enabled);
    bool GetAutoCommit();
    void Commit();
    void Rollback();

    Savepoint SetSavepoint();
    Savepoint SetSavepoint(const std::string& name);
    void ReleaseSavepoint(const Savepoint& savepoint);
    void Rollback(const Savepoint& savepoint);

    void SetTransactionIsolation(IsolationLevel level);
    IsolationLevel GetTransactionIsolation();

    void SetReadOnly(bool read_only);
    bool IsReadOnly();

    //===--------------------------------------------------------------------===//
    // Lifecycle
    //===--------------------------------------------------------------------===//
    // PING round trip; false on any failure
    bool IsValid(uint32_t timeout_seconds);

    // Closes every statement, result set and LOB, then releases the session
    void Close();
    bool IsClosed() const;

    std::shared_ptr<DatabaseMetadata> GetMetaData();
    std::shared_ptr<XaResource> GetXaResource();

    uint64_t GetSessionId() const;
    const ConnectionConfig& GetConfig() const;
    bool HasCapability(uint32_t bit) const;

private:
    explicit Connection(std::shared_ptr<CallDispatcher> dispatcher);

    std::shared_ptr<Lob> CreateLob(LobKind kind);
    void CheckCursorSupport(ResultSetType type, ResultSetConcurrency concurrency) const;

    template <class T>
    std::shared_ptr<T> Tracked(std::shared_ptr<T> resource) {
        dispatcher_->Track(resource);
        return resource;
    }

private:
    std::shared_ptr<CallDispatcher> dispatcher_;
};

} // namespace client
} // namespace dbrelay
