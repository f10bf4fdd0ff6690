//===----------------------------------------------------------------------===//
//                         DBRelay
//
// common.hpp
//
// Clock aliases, frame constants and defaults used on both ends of the wire
//===----------------------------------------------------------------------===//

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dbrelay {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

class Session;
using SessionPtr = std::shared_ptr<Session>;

//===--------------------------------------------------------------------===//
// Frame header
//===--------------------------------------------------------------------===//

// Bytes "DBRL" read as a little-endian u32
constexpr uint32_t PROTOCOL_MAGIC = 0x4C524244;
constexpr uint8_t PROTOCOL_VERSION = 0x01;

//===--------------------------------------------------------------------===//
// Defaults, overridable through ServerConfig / ConnectionConfig
//===--------------------------------------------------------------------===//

constexpr uint16_t DEFAULT_PORT = 1059;
constexpr uint32_t DEFAULT_MAX_FRAME_BYTES = 64u << 20;

constexpr size_t DEFAULT_MAX_SESSIONS = 1000;
constexpr uint32_t DEFAULT_SESSION_TIMEOUT_MINUTES = 30;
// No server-side cap unless configured
constexpr uint32_t DEFAULT_QUERY_TIMEOUT_MS = 0;

// Rows per result block and bytes per LOB chunk
constexpr uint32_t DEFAULT_FETCH_SIZE = 100;
constexpr uint32_t DEFAULT_LOB_CHUNK_SIZE = 32u << 10;

} // namespace dbrelay
