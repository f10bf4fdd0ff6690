//===----------------------------------------------------------------------===//
//                         DBRelay
//
// config/settings.hpp
//
// Flattened view of a configuration file: dotted keys to values
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dbrelay {

// Both file formats end up as dotted keys:
//
//   YAML                    INI
//   pool:                   [pool]
//     max: 20               max = 20
//     reset_sql:            reset_sql = SET a=1; SET b=2
//       - SET a=1
//       - SET b=2
//
// give pool.max and the two-element list pool.reset_sql. Later sources
// override earlier ones key by key, which is how command line flags win.
class Settings {
public:
    // .yaml/.yml is parsed as YAML, anything else as INI
    bool LoadFile(const std::string& path);
    bool LoadYaml(const std::string& text);
    bool LoadIni(std::istream& in);

    void Set(const std::string& key, std::string value);

    bool Has(const std::string& key) const { return entries_.count(key) > 0; }
    std::optional<std::string> Scalar(const std::string& key) const;
    std::vector<std::string> List(const std::string& key) const;

    const std::string& GetError() const { return error_; }

    // Leave `out` unchanged when the key is absent; false with `error` set
    // when the value does not convert
    bool Read(const std::string& key, std::string& out, std::string& error) const;
    bool Read(const std::string& key, bool& out, std::string& error) const;
    bool Read(const std::string& key, uint16_t& out, std::string& error) const;
    bool Read(const std::string& key, uint32_t& out, std::string& error) const;
    bool Read(const std::string& key, uint64_t& out, std::string& error) const;
    bool Read(const std::string& key, std::vector<std::string>& out, std::string& error) const;

private:
    struct Entry {
        std::vector<std::string> values;
        bool is_list = false;
    };

    bool ReadUnsigned(const std::string& key, uint64_t max, uint64_t& out, std::string& error) const;

    std::map<std::string, Entry> entries_;
    std::string error_;
};

} // namespace dbrelay
