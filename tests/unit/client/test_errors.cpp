//===----------------------------------------------------------------------===//
//                         DBRelay - Unit Tests
//
// tests/unit/client/test_errors.cpp
//
// Unit tests for mapping server error codes to client exceptions
//===----------------------------------------------------------------------===//

#include "client/errors.hpp"
#include "protocol/wire_codec.hpp"
#include <cassert>
#include <iostream>

using namespace dbrelay;
using namespace dbrelay::client;

// Runs f and returns the kind of the DbRelayError it threw
template <typename F>
static ErrorKind KindThrown(F&& f) {
    try {
        f();
    } catch (const DbRelayError& e) {
        return e.Kind();
    }
    assert(false && "no error thrown");
    return ErrorKind::PROTOCOL;
}

void TestKindOf() {
    std::cout << "  Testing error kinds by category..." << std::endl;

    assert(KindOf(ErrorCode::SYNTAX_ERROR) == ErrorKind::DATABASE);
    assert(KindOf(ErrorCode::POOL_EXHAUSTED) == ErrorKind::DATABASE);
    assert(KindOf(ErrorCode::XA_ROLLED_BACK) == ErrorKind::DATABASE);
    assert(KindOf(ErrorCode::HANDLE_CLOSED) == ErrorKind::RESOURCE_LIFECYCLE);
    assert(KindOf(ErrorCode::TRANSPORT_TIMEOUT) == ErrorKind::TRANSPORT);
    assert(KindOf(ErrorCode::XA_PROTOCOL) == ErrorKind::PROTOCOL);
    assert(KindOf(ErrorCode::UNKNOWN_OPERATION) == ErrorKind::PROTOCOL);
    assert(KindOf(ErrorCode::UNSUPPORTED_OPERATION) == ErrorKind::PROTOCOL);

    std::cout << "    PASSED" << std::endl;
}

void TestDatabaseErrors() {
    std::cout << "  Testing database errors keep SQLSTATE and vendor code..." << std::endl;

    try {
        ThrowError(ErrorCode::CONSTRAINT_VIOLATION, "duplicate key", "23505", 1062);
        assert(false);
    } catch (const DatabaseError& e) {
        assert(e.Kind() == ErrorKind::DATABASE);
        assert(e.Code() == ErrorCode::CONSTRAINT_VIOLATION);
        assert(e.SqlState() == "23505");
        assert(e.VendorCode() == 1062);
        assert(std::string(e.what()) == "duplicate key");
    }

    // Server-side failures surface as database errors
    try {
        ThrowError(ErrorCode::POOL_EXHAUSTED, "no connection");
        assert(false);
    } catch (const DatabaseError& e) {
        assert(e.SqlState() == ErrorCodeToSqlState(ErrorCode::POOL_EXHAUSTED));
    }

    std::cout << "    PASSED" << std::endl;
}

void TestXaErrors() {
    std::cout << "  Testing XA outcome errors..." << std::endl;

    try {
        ThrowError(ErrorCode::XA_INDETERMINATE, "commit failed after prepare");
        assert(false);
    } catch (const XaIndeterminateError& e) {
        assert(e.Code() == ErrorCode::XA_INDETERMINATE);
    }

    bool plain_database = false;
    try {
        ThrowError(ErrorCode::XA_ROLLED_BACK, "branch rolled back");
    } catch (const XaIndeterminateError&) {
        assert(false);
    } catch (const DatabaseError& e) {
        plain_database = e.Code() == ErrorCode::XA_ROLLED_BACK;
    }
    assert(plain_database);

    try {
        ThrowError(ErrorCode::XA_PROTOCOL, "end before start");
        assert(false);
    } catch (const ProtocolError& e) {
        assert(e.Code() == ErrorCode::XA_PROTOCOL);
    }

    std::cout << "    PASSED" << std::endl;
}

void TestOtherCategories() {
    std::cout << "  Testing protocol, lifecycle and transport errors..." << std::endl;

    assert(KindThrown([]() { ThrowError(ErrorCode::HANDLE_CLOSED, "closed"); }) ==
           ErrorKind::RESOURCE_LIFECYCLE);
    assert(KindThrown([]() { ThrowError(ErrorCode::INVALID_STATE, "state"); }) == ErrorKind::PROTOCOL);

    try {
        ThrowError(ErrorCode::UNSUPPORTED_OPERATION, "updatable result sets");
        assert(false);
    } catch (const UnsupportedOperationError& e) {
        assert(e.Kind() == ErrorKind::PROTOCOL);
    }

    try {
        ThrowError(ErrorCode::TRANSPORT_TIMEOUT, "no response");
        assert(false);
    } catch (const TransportError& e) {
        assert(e.IsTimeout());
    }

    try {
        ThrowError(ErrorCode::TRANSPORT_ERROR, "connection reset");
        assert(false);
    } catch (const TransportError& e) {
        assert(!e.IsTimeout());
    }

    std::cout << "    PASSED" << std::endl;
}

void TestResponseErrors() {
    std::cout << "  Testing failed responses..." << std::endl;

    auto response = ResponsePayload::Error(7, ErrorCode::CATALOG_ERROR, "Table t does not exist", "42P01", 3);
    try {
        ThrowResponseError(response);
        assert(false);
    } catch (const DatabaseError& e) {
        assert(e.Code() == ErrorCode::CATALOG_ERROR);
        assert(e.SqlState() == "42P01");
        assert(e.VendorCode() == 3);
    }

    BatchUpdateError batch(ErrorCode::CONSTRAINT_VIOLATION, "entry 3 failed", "23505", 0, {1, 1});
    assert(batch.UpdateCounts().size() == 2);
    assert(batch.Kind() == ErrorKind::DATABASE);

    assert(std::string(ErrorKindToString(ErrorKind::TRANSPORT)) == "transport error");

    std::cout << "    PASSED" << std::endl;
}

int main() {
    std::cout << "=== Client Error Unit Tests ===" << std::endl;

    std::cout << "\n1. Error Kinds:" << std::endl;
    TestKindOf();

    std::cout << "\n2. Exception Classes:" << std::endl;
    TestDatabaseErrors();
    TestXaErrors();
    TestOtherCategories();
    TestResponseErrors();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
