//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/affinity_controller.cpp
//
// Statement classification for connection pinning
//===----------------------------------------------------------------------===//

#include "session/affinity_controller.hpp"
#include <cctype>
#include <vector>

namespace dbrelay {

const char* PinScopeToString(PinScope scope) {
    switch (scope) {
        case PinScope::NONE:        return "none";
        case PinScope::TRANSACTION: return "transaction";
        case PinScope::SESSION:     return "session";
        default:                    return "unknown";
    }
}

namespace {

// Skip whitespace, "--" line comments, "/* */" block comments and opening parens
size_t SkipNoise(const std::string& sql, size_t i) {
    const size_t len = sql.size();
    while (i < len) {
        char c = sql[i];
        if (std::isspace(static_cast<unsigned char>(c)) || c == '(' || c == ';') {
            i++;
        } else if (c == '-' && i + 1 < len && sql[i + 1] == '-') {
            while (i < len && sql[i] != '\n') i++;
        } else if (c == '/' && i + 1 < len && sql[i + 1] == '*') {
            i += 2;
            while (i + 1 < len && !(sql[i] == '*' && sql[i + 1] == '/')) i++;
            i = i + 2 <= len ? i + 2 : len;
        } else {
            break;
        }
    }
    return i;
}

std::vector<std::string> Words(const std::string& sql, size_t max_words) {
    std::vector<std::string> words;
    size_t i = SkipNoise(sql, 0);
    while (i < sql.size() && words.size() < max_words) {
        std::string word;
        while (i < sql.size()) {
            char c = sql[i];
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '@' || c == '#') {
                word.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
                i++;
            } else {
                break;
            }
        }
        if (word.empty()) {
            // Punctuation ends keyword scanning
            break;
        }
        words.push_back(word);
        i = SkipNoise(sql, i);
    }
    return words;
}

// "#name" outside quotes: a session-local temp table in T-SQL dialects
bool ReferencesHashTemp(const std::string& sql) {
    char quote = 0;
    for (size_t i = 0; i + 1 < sql.size(); i++) {
        char c = sql[i];
        if (quote) {
            if (c == quote) quote = 0;
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '#' && (std::isalpha(static_cast<unsigned char>(sql[i + 1])) || sql[i + 1] == '_')) {
            if (i == 0 || !std::isalnum(static_cast<unsigned char>(sql[i - 1]))) {
                return true;
            }
        }
    }
    return false;
}

bool IsTempKeyword(const std::string& w) {
    return w == "TEMP" || w == "TEMPORARY";
}

AffinityDecision Decision(PinScope scope, const char* reason) {
    AffinityDecision d;
    d.scope = scope;
    d.reason = reason;
    return d;
}

} // namespace

std::string AffinityController::LeadingKeywords(const std::string& sql, size_t max_words) {
    std::string out;
    for (const auto& w : Words(sql, max_words)) {
        if (!out.empty()) out.push_back(' ');
        out += w;
    }
    return out;
}

AffinityDecision AffinityController::ForManualCommit() {
    return Decision(PinScope::TRANSACTION, "autocommit disabled");
}

AffinityDecision AffinityController::Classify(const std::string& sql, bool autocommit) {
    auto words = Words(sql, 6);
    AffinityDecision d;
    const std::string first = words.empty() ? std::string() : words[0];
    const std::string second = words.size() > 1 ? words[1] : std::string();

    // Transaction control
    if (first == "BEGIN" || (first == "START" && second == "TRANSACTION")) {
        d = Decision(PinScope::TRANSACTION, "explicit transaction");
        d.begins_transaction = true;
    } else if (first == "COMMIT" || first == "END" || first == "ABORT" ||
               (first == "ROLLBACK" && second != "TO")) {
        d.ends_transaction = true;
        d.reason = "transaction end";
    } else if (first == "CREATE") {
        // CREATE [OR REPLACE] [LOCAL|GLOBAL] TEMP|TEMPORARY ...
        size_t i = 1;
        if (i + 1 < words.size() && words[i] == "OR" && words[i + 1] == "REPLACE") i += 2;
        if (i < words.size() && (words[i] == "LOCAL" || words[i] == "GLOBAL")) i++;
        if (i < words.size() && IsTempKeyword(words[i])) {
            d = Decision(PinScope::SESSION, "temporary object");
        }
    } else if (first == "DECLARE" && second == "GLOBAL" && words.size() > 2 && IsTempKeyword(words[2])) {
        d = Decision(PinScope::SESSION, "declared temporary table");
    } else if (first == "SET" || first == "RESET") {
        if (second == "GLOBAL") {
            // Database-wide setting, visible from every connection
        } else if (second == "LOCAL") {
            d = Decision(PinScope::TRANSACTION, "transaction-local setting");
        } else {
            // SET VARIABLE, SET SESSION, SET @var, SET name = ...
            d = Decision(PinScope::SESSION, "session setting");
        }
    } else if (first == "USE") {
        d = Decision(PinScope::SESSION, "default schema change");
    }

    if (d.scope != PinScope::SESSION && ReferencesHashTemp(sql)) {
        bool ends = d.ends_transaction;
        bool begins = d.begins_transaction;
        d = Decision(PinScope::SESSION, "#temp table");
        d.ends_transaction = ends;
        d.begins_transaction = begins;
    }

    // Manual commit: every statement belongs to the open transaction
    if (!autocommit && d.scope == PinScope::NONE && !d.ends_transaction) {
        d.scope = PinScope::TRANSACTION;
        d.reason = "autocommit disabled";
    }
    return d;
}

} // namespace dbrelay
