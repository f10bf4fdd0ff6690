//===----------------------------------------------------------------------===//
//                         DBRelay - Unit Tests
//
// tests/unit/logging/test_logger.cpp
//
// Unit tests for Logger and the backend log bridge
//===----------------------------------------------------------------------===//

#include "logging/logger.hpp"
#include "logging/backend_log_bridge.hpp"

#include <duckdb/main/database.hpp>
#include <duckdb/logging/log_manager.hpp>

#include <cassert>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <thread>
#include <chrono>

using namespace dbrelay;

static std::string ReadFile(const std::string& path) {
    std::ifstream file(path);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

//===----------------------------------------------------------------------===//
// Log Level Conversion Tests
//===----------------------------------------------------------------------===//

void TestLogLevelConversion() {
    std::cout << "  Testing level conversion..." << std::endl;

    assert(Logger::ToSpdlogLevel(LogLevel::TRACE) == spdlog::level::trace);
    assert(Logger::ToSpdlogLevel(LogLevel::WARN) == spdlog::level::warn);
    assert(Logger::ToSpdlogLevel(LogLevel::FATAL) == spdlog::level::critical);

    assert(Logger::ToSpdlogLevel("debug") == spdlog::level::debug);
    assert(Logger::ToSpdlogLevel("ERROR") == spdlog::level::err);
    assert(Logger::ToSpdlogLevel("Warning") == spdlog::level::warn);
    assert(Logger::ToSpdlogLevel("critical") == spdlog::level::critical);
    assert(Logger::ToSpdlogLevel("verbose") == spdlog::level::info);
    assert(Logger::ToSpdlogLevel("") == spdlog::level::info);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Initialization Tests
//===----------------------------------------------------------------------===//

void TestServerInitialize() {
    std::cout << "  Testing server initialization and auto-initialization..." << std::endl;

    Logger::Shutdown();
    assert(!Logger::IsInitialized());

    // Get() initializes with the server defaults
    assert(Logger::Get() != nullptr);
    assert(Logger::Get()->level() == spdlog::level::info);
    assert(Logger::Get()->name() == "dbrelay");
    Logger::Shutdown();

    Logger::Initialize("", "debug");
    assert(Logger::Get()->level() == spdlog::level::debug);

    // A second Initialize is ignored
    Logger::Initialize("", "error");
    assert(Logger::Get()->level() == spdlog::level::debug);

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

void TestClientInitialize() {
    std::cout << "  Testing client initialization..." << std::endl;

    Logger::Shutdown();
    Logger::InitializeClient();
    assert(Logger::IsInitialized());
    assert(Logger::Get()->name() == "dbrelay-client");
    assert(Logger::Get()->level() == spdlog::level::warn);

    // Opening a second connection must not reconfigure an embedding application's logger
    Logger::InitializeClient("trace");
    assert(Logger::Get()->level() == spdlog::level::warn);

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

void TestSetLevel() {
    std::cout << "  Testing SetLevel..." << std::endl;

    Logger::Shutdown();
    Logger::Initialize("", "info");

    Logger::SetLevel(LogLevel::ERROR);
    assert(Logger::Get()->level() == spdlog::level::err);

    Logger::SetLevel("trace");
    assert(Logger::Get()->level() == spdlog::level::trace);

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Output Tests
//===----------------------------------------------------------------------===//

void TestFileOutput() {
    std::cout << "  Testing file output and level filtering..." << std::endl;

    std::string path = "/tmp/dbrelay_test_logger.log";
    std::filesystem::remove(path);

    Logger::Shutdown();
    Logger::Initialize(path, "warn");

    LOG_INFO("session", "filtered session message");
    LOG_WARN("session", "Session 7 pinned to connection 3");
    DLOG_ERROR("xa", "Branch {} rolled back: {}", "1:ab:01", "timeout");
    Logger::Flush();

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    Logger::Shutdown();

    assert(std::filesystem::exists(path));
    auto content = ReadFile(path);
    assert(content.find("[session] Session 7 pinned to connection 3") != std::string::npos);
    assert(content.find("[xa] Branch 1:ab:01 rolled back: timeout") != std::string::npos);
    assert(content.find("filtered session message") == std::string::npos);

    std::filesystem::remove(path);
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Backend Log Bridge Tests
//===----------------------------------------------------------------------===//

void TestBridgeStorage() {
    std::cout << "  Testing BackendLogStorage..." << std::endl;

    BackendLogStorage storage(spdlog::default_logger(), spdlog::level::info);
    assert(storage.GetStorageName() == "dbrelay");
    assert(storage.IsEnabled(duckdb::LoggingTargetTable::ALL_LOGS));
    assert(!storage.IsEnabled(duckdb::LoggingTargetTable::QUERY_LOG));

    // A null logger drops entries and flushes are no-ops
    BackendLogStorage detached(nullptr, spdlog::level::trace);
    detached.Flush(duckdb::LoggingTargetTable::ALL_LOGS);
    detached.FlushAll();
    assert(detached.ForwardedCount() == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestInstallBridge() {
    std::cout << "  Testing InstallBackendLogBridge..." << std::endl;

    Logger::Shutdown();
    Logger::Initialize("", "debug");

    duckdb::DuckDB db(nullptr);
    bool installed = InstallBackendLogBridge(*db.instance, Logger::Get(), spdlog::level::debug);
    assert(installed);
    assert(db.instance->GetLogManager().LoggingEnabled());

    // Backend activity goes through the bridge without disturbing queries
    duckdb::Connection conn(db);
    auto result = conn.Query("SELECT 42");
    assert(!result->HasError());

    Logger::Shutdown();
    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Logger Unit Tests ===" << std::endl;

    std::cout << "\n1. Level Conversion:" << std::endl;
    TestLogLevelConversion();

    std::cout << "\n2. Initialization:" << std::endl;
    TestServerInitialize();
    TestClientInitialize();
    TestSetLevel();

    std::cout << "\n3. Output:" << std::endl;
    TestFileOutput();

    std::cout << "\n4. Backend Log Bridge:" << std::endl;
    TestBridgeStorage();
    TestInstallBridge();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
