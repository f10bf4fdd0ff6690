//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/xa_resource.hpp
//
// XA branch control for one connection
//===----------------------------------------------------------------------===//

#pragma once

#include "client/call_dispatcher.hpp"

namespace dbrelay {
namespace client {

// Branch states: Active -> Ended -> Prepared -> Committed | Rolled back.
// Transitions out of order fail with ProtocolError(XA_PROTOCOL) and never
// reach the backend. A commit failure after prepare throws XaIndeterminateError.
class XaResource {
public:
    explicit XaResource(std::shared_ptr<CallDispatcher> dispatcher);

    // flags: TMNOFLAGS, TMJOIN or TMRESUME
    void Start(const Xid& xid, int32_t flags = XaFlags::TMNOFLAGS);
    // flags: TMSUCCESS, TMFAIL or TMSUSPEND
    void End(const Xid& xid, int32_t flags = XaFlags::TMSUCCESS);
    // XA_OK or XA_RDONLY
    int32_t Prepare(const Xid& xid);
    void Commit(const Xid& xid, bool one_phase);
    void Rollback(const Xid& xid);
    // Prepared branches of this server
    std::vector<Xid> Recover(int32_t flags = XaFlags::TMSTARTRSCAN | XaFlags::TMENDRSCAN);
    void Forget(const Xid& xid);

    // 0 restores the server default
    bool SetTransactionTimeout(int32_t seconds);
    int32_t GetTransactionTimeout();

    // Same resource manager: same server endpoint
    bool IsSameRM(const XaResource& other) const;

private:
    std::vector<Value> XidArgs(const Xid& xid) const;

    std::shared_ptr<CallDispatcher> dispatcher_;
};

} // namespace client
} // namespace dbrelay
