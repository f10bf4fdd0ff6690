//===----------------------------------------------------------------------===//
//                         DBRelay CLI
//
// programs/client/main.cpp
//
// Interactive SQL shell for a dbrelayd server.
//
// Usage:
//   dbrelay-cli dbrelay://localhost:7070
//   dbrelay-cli dbrelay://alice@db1:7070?fetch_size=500
//
// Statements end with ';'. Transactions follow the connection's autocommit
// mode, toggled with .autocommit.
//===----------------------------------------------------------------------===//

#include "client/connection.hpp"
#include "client/database_metadata.hpp"
#include "client/errors.hpp"
#include "client/result_set.hpp"
#include "client/statement.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <string>

#include <readline/readline.h>
#include <readline/history.h>

using namespace dbrelay;
using namespace dbrelay::client;

static std::string Trim(const std::string &s) {
    auto b = s.find_first_not_of(" \t\n\r");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\n\r");
    return s.substr(b, e - b + 1);
}

static void PrintHelp() {
    std::cout <<
        "\nMeta commands:\n"
        "  .help               Show this message\n"
        "  .quit / .exit       Exit the shell\n"
        "  .tables             List tables\n"
        "  .schema TABLE       Show column info for TABLE\n"
        "  .autocommit on|off  Switch autocommit mode\n"
        "  .commit             Commit the current transaction\n"
        "  .rollback           Roll back the current transaction\n"
        "\nTerminate SQL statements with ';'\n\n";
}

static void PrintResult(ResultSet &rs) {
    size_t ncols = rs.GetColumnCount();

    std::cout << "\n";
    for (size_t c = 0; c < ncols; c++) {
        if (c) std::cout << "\t";
        std::cout << rs.GetColumns()[c].name;
    }
    std::cout << "\n";
    for (size_t c = 0; c < ncols; c++) {
        if (c) std::cout << "\t";
        std::cout << std::string(rs.GetColumns()[c].name.size(), '-');
    }
    std::cout << "\n";

    int64_t rows = 0;
    while (rs.Next()) {
        for (size_t c = 0; c < ncols; c++) {
            if (c) std::cout << "\t";
            auto column = static_cast<int32_t>(c + 1);
            std::cout << (rs.IsNull(column) ? "NULL" : rs.GetString(column));
        }
        std::cout << "\n";
        rows++;
    }
    rs.Close();
    std::cout << "(" << rows << " row" << (rows != 1 ? "s" : "") << ")\n\n";
}

static void RunSql(Connection &conn, const std::string &sql) {
    auto stmt = conn.CreateStatement();
    if (stmt->Execute(sql)) {
        PrintResult(*stmt->GetResultSet());
    } else {
        auto count = stmt->GetUpdateCount();
        std::cout << count << " row" << (count != 1 ? "s" : "") << " affected\n\n";
    }
    stmt->Close();
}

static void PrintError(const DbRelayError &e) {
    std::cerr << "Error [" << ErrorKindToString(e.Kind()) << ", SQLSTATE " << e.SqlState()
              << "]: " << e.what() << "\n";
}

int main(int argc, char *argv[]) {
    std::string url = "dbrelay://localhost:7070";

    if (argc >= 2) {
        std::string a = argv[1];
        if (a == "--help" || a == "-h") {
            std::cout <<
                "Usage: " << argv[0] << " [dbrelay://[USER@]HOST[:PORT][?OPTIONS]]\n"
                "\n"
                "  Options: fetch_size, lob_chunk_size, lob_inline_limit,\n"
                "           connect_timeout_ms, call_timeout_ms, log_level\n";
            return 0;
        }
        url = a;
    }

    std::shared_ptr<Connection> conn;
    try {
        conn = Connection::Open(url);
    } catch (const DbRelayError &e) {
        std::cerr << "Failed to connect to " << url << ":\n";
        PrintError(e);
        return 1;
    }

    std::cout << "DBRelay CLI - connected to " << conn->GetConfig().Endpoint()
              << " (session " << conn->GetSessionId() << ")\n"
                 "Enter SQL followed by ';'  |  .help for tips  |  .quit to exit\n\n";

    using_history();

    std::string buf;
    bool multiline = false;

    while (true) {
        const char *prompt = multiline ? "    ...> " : "dbrelay> ";
        char *raw = readline(prompt);
        if (!raw) { std::cout << "\nBye!\n"; break; }

        std::string line(raw);
        free(raw);

        if (Trim(line).empty()) continue;
        add_history(line.c_str());

        try {
            // Meta commands (only at start of a fresh statement)
            if (!multiline && Trim(line)[0] == '.') {
                std::string low;
                low.resize(line.size());
                std::transform(line.begin(), line.end(), low.begin(), ::tolower);
                std::string trimlow = Trim(low);

                if (trimlow == ".quit" || trimlow == ".exit" || trimlow == ".q") {
                    std::cout << "Bye!\n"; break;
                }
                if (trimlow == ".help" || trimlow == ".h") {
                    PrintHelp();
                } else if (trimlow == ".tables") {
                    auto rs = conn->GetMetaData()->GetTables(std::nullopt, std::nullopt);
                    PrintResult(*rs);
                } else if (trimlow.substr(0, 7) == ".schema") {
                    std::string tbl = Trim(Trim(line).substr(7));
                    if (tbl.empty()) {
                        std::cerr << "Usage: .schema TABLENAME\n";
                    } else {
                        auto rs = conn->GetMetaData()->GetColumns(std::nullopt, tbl, std::nullopt);
                        PrintResult(*rs);
                    }
                } else if (trimlow == ".autocommit on" || trimlow == ".autocommit off") {
                    conn->SetAutoCommit(trimlow == ".autocommit on");
                } else if (trimlow == ".commit") {
                    conn->Commit();
                } else if (trimlow == ".rollback") {
                    conn->Rollback();
                } else {
                    std::cerr << "Unknown command " << Trim(line) << " (.help lists commands)\n";
                }
                continue;
            }

            buf += (multiline ? "\n" : "") + line;

            if (Trim(buf).back() != ';') { multiline = true; continue; }
            multiline = false;

            std::string sql = buf;
            buf.clear();
            RunSql(*conn, sql);
        } catch (const DbRelayError &e) {
            PrintError(e);
            buf.clear();
            multiline = false;
            if (conn->IsClosed() || e.Kind() == ErrorKind::TRANSPORT) {
                std::cerr << "Connection lost\n";
                break;
            }
        }
    }

    try {
        conn->Close();
    } catch (const DbRelayError &e) {
        PrintError(e);
        return 1;
    }
    return 0;
}
