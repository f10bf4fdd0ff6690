//===----------------------------------------------------------------------===//
//                         DBRelay
//
// config/connection_config.cpp
//
// Client connection settings
//===----------------------------------------------------------------------===//

#include "config/connection_config.hpp"
#include "config/settings.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <stdexcept>

namespace dbrelay {

namespace {

constexpr const char* URL_SCHEME = "dbrelay://";

bool ParseUnsigned(const std::string& text, uint64_t max, uint64_t& out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        out = std::stoull(text);
    } catch (const std::out_of_range&) {
        return false;
    }
    return out <= max;
}

std::string PercentDecode(const std::string& in) {
    std::string out;
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size() &&
            std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
            out.push_back(static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        } else {
            out.push_back(in[i]);
        }
    }
    return out;
}

} // namespace

bool ConnectionConfig::ApplyOption(const std::string& key, const std::string& value,
                                   std::string& error) {
    uint64_t n = 0;
    auto number = [&](uint64_t max) {
        if (!ParseUnsigned(value, max, n)) {
            error = "Invalid value for " + key + ": " + value;
            return false;
        }
        return true;
    };

    if (key == "user") {
        user = value;
    } else if (key == "client_name") {
        client_name = value;
    } else if (key == "log_level") {
        log_level = value;
    } else if (key == "fetch_size") {
        if (!number(UINT32_MAX)) return false;
        fetch_size = static_cast<uint32_t>(n);
    } else if (key == "lob_chunk_size") {
        if (!number(UINT32_MAX)) return false;
        lob_chunk_size = static_cast<uint32_t>(n);
    } else if (key == "lob_inline_limit") {
        if (!number(UINT32_MAX)) return false;
        lob_inline_limit = static_cast<uint32_t>(n);
    } else if (key == "connect_timeout_ms") {
        if (!number(UINT32_MAX)) return false;
        connect_timeout_ms = static_cast<uint32_t>(n);
    } else if (key == "call_timeout_ms") {
        if (!number(UINT32_MAX)) return false;
        call_timeout_ms = static_cast<uint32_t>(n);
    } else if (key == "metadata_retries") {
        if (!number(100)) return false;
        metadata_retries = static_cast<uint32_t>(n);
    } else if (key == "max_frame_bytes") {
        if (!number(UINT32_MAX)) return false;
        max_frame_bytes = static_cast<uint32_t>(n);
    } else {
        error = "Unknown connection option: " + key;
        return false;
    }
    return true;
}

bool ConnectionConfig::ParseUrl(const std::string& url, std::string& error) {
    std::string scheme(URL_SCHEME);
    if (url.compare(0, scheme.size(), scheme) != 0) {
        error = "URL must start with " + scheme;
        return false;
    }

    std::string rest = url.substr(scheme.size());
    std::string query;
    auto q = rest.find('?');
    if (q != std::string::npos) {
        query = rest.substr(q + 1);
        rest = rest.substr(0, q);
    }
    // Ignore a trailing path ("/" or "/dbname")
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }

    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        user = PercentDecode(rest.substr(0, at));
        rest = rest.substr(at + 1);
    }

    std::string host_part = rest;
    std::string port_part;
    if (!rest.empty() && rest[0] == '[') {
        // [ipv6]:port
        auto close = rest.find(']');
        if (close == std::string::npos) {
            error = "Unterminated IPv6 address in URL";
            return false;
        }
        host_part = rest.substr(1, close - 1);
        if (close + 1 < rest.size()) {
            if (rest[close + 1] != ':') {
                error = "Invalid URL authority: " + rest;
                return false;
            }
            port_part = rest.substr(close + 2);
        }
    } else {
        auto colon = rest.rfind(':');
        if (colon != std::string::npos) {
            host_part = rest.substr(0, colon);
            port_part = rest.substr(colon + 1);
        }
    }

    if (host_part.empty()) {
        error = "URL has no host";
        return false;
    }
    host = host_part;

    if (!port_part.empty()) {
        uint64_t p = 0;
        if (!ParseUnsigned(port_part, 65535, p) || p == 0) {
            error = "Invalid port in URL: " + port_part;
            return false;
        }
        port = static_cast<uint16_t>(p);
    }

    size_t start = 0;
    while (start < query.size()) {
        auto amp = query.find('&', start);
        std::string pair = query.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        start = amp == std::string::npos ? query.size() : amp + 1;
        if (pair.empty()) {
            continue;
        }
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            error = "Option without value: " + pair;
            return false;
        }
        if (!ApplyOption(PercentDecode(pair.substr(0, eq)), PercentDecode(pair.substr(eq + 1)), error)) {
            return false;
        }
    }

    return Validate(error);
}

bool ConnectionConfig::LoadFromFile(const std::string& path, std::string& error) {
    static const char* OPTION_KEYS[] = {
        "user", "client_name", "log_level", "fetch_size", "lob_chunk_size",
        "lob_inline_limit", "connect_timeout_ms", "call_timeout_ms",
        "metadata_retries", "max_frame_bytes"
    };

    Settings settings;
    if (!settings.LoadFile(path)) {
        error = settings.GetError();
        return false;
    }

    // The URL comes first so the individual keys can refine it
    std::string url;
    if (!settings.Read("client.url", url, error) ||
        (!url.empty() && !ParseUrl(url, error)) ||
        !settings.Read("client.host", host, error) ||
        !settings.Read("client.port", port, error)) {
        return false;
    }
    for (const char* key : OPTION_KEYS) {
        auto value = settings.Scalar(std::string("client.") + key);
        if (value && !ApplyOption(key, *value, error)) {
            return false;
        }
    }

    return Validate(error);
}

bool ConnectionConfig::Validate(std::string& error) const {
    if (host.empty()) {
        error = "Host must not be empty";
        return false;
    }
    if (port == 0) {
        error = "Invalid port number";
        return false;
    }
    if (fetch_size == 0) {
        error = "Fetch size must be greater than 0";
        return false;
    }
    if (lob_chunk_size == 0 || lob_chunk_size >= max_frame_bytes) {
        error = "LOB chunk size must be between 1 and max_frame_bytes";
        return false;
    }
    return true;
}

} // namespace dbrelay
