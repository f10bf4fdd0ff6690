//===----------------------------------------------------------------------===//
//                         DBRelay
//
// config/connection_config.hpp
//
// Client connection settings, passed to Connection::Open
//===----------------------------------------------------------------------===//

#pragma once

#include "common.hpp"
#include <string>

namespace dbrelay {

struct ConnectionConfig {
    std::string host = "127.0.0.1";
    uint16_t port = DEFAULT_PORT;
    std::string user;
    std::string client_name = "dbrelay-client";

    uint32_t fetch_size = DEFAULT_FETCH_SIZE;
    uint32_t lob_chunk_size = DEFAULT_LOB_CHUNK_SIZE;
    // Bytes/string parameters above this size are streamed as LOBs at execution
    uint32_t lob_inline_limit = 1024 * 1024;

    uint32_t connect_timeout_ms = 5000;
    uint32_t call_timeout_ms = 0;  // 0 = wait forever
    uint32_t metadata_retries = 2;
    uint32_t max_frame_bytes = DEFAULT_MAX_FRAME_BYTES;

    std::string log_level = "warn";

    ConnectionConfig() = default;
    ConnectionConfig(std::string host_p, uint16_t port_p)
        : host(std::move(host_p)), port(port_p) {}

    // dbrelay://[user@]host[:port][?key=value&...]
    bool ParseUrl(const std::string& url, std::string& error);

    // YAML or INI like the server config, keys under client.*
    bool LoadFromFile(const std::string& path, std::string& error);

    bool Validate(std::string& error) const;

    std::string Endpoint() const {
        return host + ":" + std::to_string(port);
    }

private:
    bool ApplyOption(const std::string& key, const std::string& value, std::string& error);
};

} // namespace dbrelay
