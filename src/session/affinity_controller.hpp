//===----------------------------------------------------------------------===//
//                         DBRelay
//
// session/affinity_controller.hpp
//
// Decides whether a statement needs the session pinned to one connection
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>

namespace dbrelay {

enum class PinScope : uint8_t {
    NONE        = 0,  // any pooled connection
    TRANSACTION = 1,  // until commit / rollback
    SESSION     = 2,  // until the session is destroyed
};

const char* PinScopeToString(PinScope scope);

struct AffinityDecision {
    PinScope scope = PinScope::NONE;
    bool begins_transaction = false;
    bool ends_transaction = false;
    const char* reason = "";
};

class AffinityController {
public:
    // Classify one SQL text. autocommit=false pins every statement to its transaction.
    static AffinityDecision Classify(const std::string& sql, bool autocommit);

    // Pin decision for non-SQL operations issued while autocommit is off
    static AffinityDecision ForManualCommit();

    // Leading keywords, upper-cased, after comments and whitespace; exposed for tests
    static std::string LeadingKeywords(const std::string& sql, size_t max_words);
};

} // namespace dbrelay
