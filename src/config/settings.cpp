//===----------------------------------------------------------------------===//
//                         DBRelay
//
// config/settings.cpp
//
// YAML (yaml-cpp) and INI loaders for Settings
//===----------------------------------------------------------------------===//

#include "config/settings.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

namespace dbrelay {

namespace {

std::string Trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return std::string();
    }
    auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::string Unquote(const std::string& s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ';' separates list items in INI files and on the command line, since SQL
// statements contain commas
std::vector<std::string> SplitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream in(text);
    std::string item;
    while (std::getline(in, item, ';')) {
        item = Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

} // namespace

bool Settings::LoadFile(const std::string& path) {
    auto dot = path.rfind('.');
    std::string ext = dot == std::string::npos ? std::string() : Lower(path.substr(dot));

    std::ifstream file(path);
    if (!file) {
        error_ = "Cannot open config file: " + path;
        return false;
    }
    if (ext == ".yaml" || ext == ".yml") {
        std::stringstream text;
        text << file.rdbuf();
        return LoadYaml(text.str());
    }
    return LoadIni(file);
}

bool Settings::LoadYaml(const std::string& text) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        error_ = "YAML parse error: " + std::string(e.what());
        return false;
    }
    if (!root || root.IsNull()) {
        return true;
    }
    if (!root.IsMap()) {
        error_ = "YAML config must be a mapping";
        return false;
    }

    // Depth-first over nested maps; sequences of scalars become lists
    std::vector<std::pair<std::string, YAML::Node>> pending{{"", root}};
    while (!pending.empty()) {
        auto prefix = pending.back().first;
        auto node = pending.back().second;
        pending.pop_back();

        for (const auto& child : node) {
            std::string key = prefix + child.first.as<std::string>();
            const YAML::Node& value = child.second;
            if (value.IsMap()) {
                pending.emplace_back(key + ".", value);
            } else if (value.IsSequence()) {
                Entry entry;
                entry.is_list = true;
                for (const auto& item : value) {
                    if (!item.IsScalar()) {
                        error_ = "Nested value in list " + key;
                        return false;
                    }
                    entry.values.push_back(item.as<std::string>());
                }
                entries_[key] = std::move(entry);
            } else if (value.IsScalar()) {
                entries_[key] = Entry{{value.as<std::string>()}, false};
            }
        }
    }
    return true;
}

bool Settings::LoadIni(std::istream& in) {
    std::string section;
    std::string line;
    int line_number = 0;
    while (std::getline(in, line)) {
        line_number++;
        line = Trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }
        if (line.front() == '[') {
            if (line.back() != ']') {
                error_ = "Unterminated section header at line " + std::to_string(line_number);
                return false;
            }
            section = Trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            error_ = "Expected key = value at line " + std::to_string(line_number);
            return false;
        }
        std::string key = Trim(line.substr(0, eq));
        if (!section.empty()) {
            key = section + "." + key;
        }
        entries_[key] = Entry{{Unquote(Trim(line.substr(eq + 1)))}, false};
    }
    return true;
}

void Settings::Set(const std::string& key, std::string value) {
    entries_[key] = Entry{{std::move(value)}, false};
}

std::optional<std::string> Settings::Scalar(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end() || it->second.is_list || it->second.values.empty()) {
        return std::nullopt;
    }
    return it->second.values.front();
}

std::vector<std::string> Settings::List(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return {};
    }
    if (it->second.is_list) {
        return it->second.values;
    }
    return it->second.values.empty() ? std::vector<std::string>() : SplitList(it->second.values.front());
}

bool Settings::Read(const std::string& key, std::string& out, std::string& error) const {
    auto value = Scalar(key);
    if (value) {
        out = *value;
    } else if (Has(key)) {
        error = key + " must be a single value";
        return false;
    }
    return true;
}

bool Settings::Read(const std::string& key, bool& out, std::string& error) const {
    auto value = Scalar(key);
    if (!value) {
        return true;
    }
    std::string v = Lower(*value);
    if (v == "true" || v == "yes" || v == "on" || v == "1") {
        out = true;
    } else if (v == "false" || v == "no" || v == "off" || v == "0") {
        out = false;
    } else {
        error = "Invalid boolean for " + key + ": " + *value;
        return false;
    }
    return true;
}

bool Settings::ReadUnsigned(const std::string& key, uint64_t max, uint64_t& out,
                            std::string& error) const {
    auto value = Scalar(key);
    if (!value) {
        error = key + " must be a single value";
        return false;
    }
    const std::string& text = *value;
    bool digits = !text.empty() && text.find_first_not_of("0123456789") == std::string::npos;
    if (digits) {
        try {
            out = std::stoull(text);
            if (out <= max) {
                return true;
            }
        } catch (const std::out_of_range&) {
            // reported below
        }
    }
    error = "Invalid value for " + key + ": " + text;
    return false;
}

bool Settings::Read(const std::string& key, uint16_t& out, std::string& error) const {
    uint64_t n = 0;
    if (!Has(key)) return true;
    if (!ReadUnsigned(key, std::numeric_limits<uint16_t>::max(), n, error)) return false;
    out = static_cast<uint16_t>(n);
    return true;
}

bool Settings::Read(const std::string& key, uint32_t& out, std::string& error) const {
    uint64_t n = 0;
    if (!Has(key)) return true;
    if (!ReadUnsigned(key, std::numeric_limits<uint32_t>::max(), n, error)) return false;
    out = static_cast<uint32_t>(n);
    return true;
}

bool Settings::Read(const std::string& key, uint64_t& out, std::string& error) const {
    if (!Has(key)) return true;
    return ReadUnsigned(key, std::numeric_limits<uint64_t>::max(), out, error);
}

bool Settings::Read(const std::string& key, std::vector<std::string>& out, std::string& /*error*/) const {
    if (Has(key)) {
        out = List(key);
    }
    return true;
}

} // namespace dbrelay
