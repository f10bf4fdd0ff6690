//===----------------------------------------------------------------------===//
//                         DBRelay
//
// client/xa_resource.cpp
//
// XA operations
//===----------------------------------------------------------------------===//

#include "client/xa_resource.hpp"
#include "client/errors.hpp"
#include "logging/logger.hpp"

namespace dbrelay {
namespace client {

XaResource::XaResource(std::shared_ptr<CallDispatcher> dispatcher)
    : dispatcher_(std::move(dispatcher)) {
}

std::vector<Value> XaResource::XidArgs(const Xid& xid) const {
    std::vector<Value> args;
    xid.AppendTo(args);
    return args;
}

void XaResource::Start(const Xid& xid, int32_t flags) {
    auto args = XidArgs(xid);
    args.push_back(Value::Int32(flags));
    dispatcher_->Invoke(OpCode::XA_START, 0, std::move(args));
    LOG_DEBUG("client", "XA start " + xid.ToString());
}

void XaResource::End(const Xid& xid, int32_t flags) {
    auto args = XidArgs(xid);
    args.push_back(Value::Int32(flags));
    dispatcher_->Invoke(OpCode::XA_END, 0, std::move(args));
}

int32_t XaResource::Prepare(const Xid& xid) {
    auto response = dispatcher_->Invoke(OpCode::XA_PREPARE, 0, XidArgs(xid));
    if (response.values.empty()) {
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR, "XA_PREPARE response carries no vote");
    }
    return static_cast<int32_t>(response.values[0].AsInt64());
}

void XaResource::Commit(const Xid& xid, bool one_phase) {
    auto args = XidArgs(xid);
    args.push_back(Value::Boolean(one_phase));
    dispatcher_->Invoke(OpCode::XA_COMMIT, 0, std::move(args));
    LOG_DEBUG("client", "XA commit " + xid.ToString());
}

void XaResource::Rollback(const Xid& xid) {
    dispatcher_->Invoke(OpCode::XA_ROLLBACK, 0, XidArgs(xid));
    LOG_DEBUG("client", "XA rollback " + xid.ToString());
}

std::vector<Xid> XaResource::Recover(int32_t flags) {
    std::vector<Value> args;
    args.push_back(Value::Int32(flags));
    auto response = dispatcher_->Invoke(OpCode::XA_RECOVER, 0, std::move(args));

    std::vector<Xid> xids;
    try {
        ArgumentList values(response.values, OpCode::XA_RECOVER);
        auto count = values.NextInt32("count");
        for (int32_t i = 0; i < count; i++) {
            xids.push_back(Xid::Read(values));
        }
    } catch (const DecodeError& e) {
        throw ProtocolError(ErrorCode::PROTOCOL_ERROR, std::string("Malformed XA_RECOVER response: ") + e.what());
    }
    return xids;
}

void XaResource::Forget(const Xid& xid) {
    dispatcher_->Invoke(OpCode::XA_FORGET, 0, XidArgs(xid));
}

bool XaResource::SetTransactionTimeout(int32_t seconds) {
    std::vector<Value> args;
    args.push_back(Value::Int32(seconds));
    auto response = dispatcher_->Invoke(OpCode::XA_SET_TIMEOUT, 0, std::move(args));
    return !response.values.empty() && response.values[0].AsBool();
}

int32_t XaResource::GetTransactionTimeout() {
    auto response = dispatcher_->Invoke(OpCode::XA_GET_TIMEOUT, 0, {});
    return static_cast<int32_t>(response.values.at(0).AsInt64());
}

bool XaResource::IsSameRM(const XaResource& other) const {
    return dispatcher_->Endpoint() == other.dispatcher_->Endpoint() &&
           dispatcher_->GetServerInfo().server_name == other.dispatcher_->GetServerInfo().server_name;
}

} // namespace client
} // namespace dbrelay
