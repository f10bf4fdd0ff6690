//===----------------------------------------------------------------------===//
//                         DBRelay - Unit Tests
//
// tests/unit/config/test_settings.cpp
//
// Unit tests for Settings (YAML and INI flattening, typed reads)
//===----------------------------------------------------------------------===//

#include "config/settings.hpp"
#include <cassert>
#include <iostream>
#include <sstream>

using namespace dbrelay;

void TestYamlFlattening() {
    std::cout << "  Testing nested YAML becomes dotted keys..." << std::endl;

    Settings settings;
    assert(settings.LoadYaml(
        "server:\n"
        "  port: 1059\n"
        "  tls:\n"
        "    enabled: false\n"
        "pool:\n"
        "  reset_sql: [\"SET a = 1\", \"SET b = 2\"]\n"
        "empty:\n"));

    assert(settings.Scalar("server.port") == std::string("1059"));
    assert(settings.Scalar("server.tls.enabled") == std::string("false"));
    assert(!settings.Has("server"));
    assert(!settings.Has("empty"));

    auto list = settings.List("pool.reset_sql");
    assert(list.size() == 2 && list[0] == "SET a = 1");
    // A list is not a scalar
    assert(!settings.Scalar("pool.reset_sql"));

    std::cout << "    PASSED" << std::endl;
}

void TestYamlErrors() {
    std::cout << "  Testing malformed YAML..." << std::endl;

    Settings settings;
    assert(!settings.LoadYaml("server: [unclosed\n"));
    assert(settings.GetError().find("YAML") != std::string::npos);

    Settings top_level_list;
    assert(!top_level_list.LoadYaml("- a\n- b\n"));

    Settings nested_list;
    assert(!nested_list.LoadYaml("pool:\n  reset_sql:\n    - {a: 1}\n"));

    Settings blank;
    assert(blank.LoadYaml(""));

    std::cout << "    PASSED" << std::endl;
}

void TestIniSections() {
    std::cout << "  Testing INI sections, comments and quotes..." << std::endl;

    std::istringstream in(
        "; comment\n"
        "# another\n"
        "top = 1\n"
        "\n"
        "[ client ]\n"
        "  url = 'dbrelay://app@db:1059'  \n"
        "statements = SELECT 1 ; SELECT 2;\n");

    Settings settings;
    assert(settings.LoadIni(in));
    assert(settings.Scalar("top") == std::string("1"));
    assert(settings.Scalar("client.url") == std::string("dbrelay://app@db:1059"));

    auto items = settings.List("client.statements");
    assert(items.size() == 2 && items[1] == "SELECT 2");

    std::istringstream broken("[client\nurl = x\n");
    Settings bad;
    assert(!bad.LoadIni(broken));

    std::istringstream no_equals("[client]\nurl\n");
    assert(!bad.LoadIni(no_equals));
    assert(bad.GetError().find("line 2") != std::string::npos);

    std::cout << "    PASSED" << std::endl;
}

void TestTypedReads() {
    std::cout << "  Testing typed reads..." << std::endl;

    Settings settings;
    settings.Set("n", "42");
    settings.Set("big", "4294967296");
    settings.Set("neg", "-1");
    settings.Set("flag", "Off");
    assert(settings.LoadYaml("list: [1, 2]\n"));

    std::string error;

    uint32_t n = 7;
    assert(settings.Read("missing", n, error) && n == 7);
    assert(settings.Read("n", n, error) && n == 42);

    assert(!settings.Read("big", n, error));
    assert(error == "Invalid value for big: 4294967296");
    uint64_t wide = 0;
    assert(settings.Read("big", wide, error) && wide == 4294967296ULL);

    uint16_t port = 0;
    assert(!settings.Read("neg", port, error));

    bool flag = true;
    assert(settings.Read("flag", flag, error) && !flag);

    std::string text;
    assert(!settings.Read("list", text, error));
    assert(error == "list must be a single value");

    std::vector<std::string> values;
    assert(settings.Read("list", values, error) && values.size() == 2);

    // Set overrides whatever was loaded
    settings.Set("n", "43");
    assert(settings.Read("n", n, error) && n == 43);

    std::cout << "    PASSED" << std::endl;
}

int main() {
    std::cout << "=== Settings Unit Tests ===" << std::endl;

    std::cout << "\n1. YAML:" << std::endl;
    TestYamlFlattening();
    TestYamlErrors();

    std::cout << "\n2. INI:" << std::endl;
    TestIniSections();

    std::cout << "\n3. Typed Reads:" << std::endl;
    TestTypedReads();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
