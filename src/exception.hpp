//===----------------------------------------------------------------------===//
//                         DBRelay
//
// exception.hpp
//
// Server-side exception carrying a wire error code
//===----------------------------------------------------------------------===//

#pragma once

#include "protocol/message_types.hpp"
#include <stdexcept>
#include <string>

namespace dbrelay {

class RelayException : public std::runtime_error {
public:
    RelayException(ErrorCode code_p, const std::string& message)
        : std::runtime_error(message)
        , code(code_p)
        , sql_state(ErrorCodeToSqlState(code_p))
        , vendor_code(0) {}

    RelayException(ErrorCode code_p, const std::string& message,
                   std::string sql_state_p, int32_t vendor_code_p)
        : std::runtime_error(message)
        , code(code_p)
        , sql_state(std::move(sql_state_p))
        , vendor_code(vendor_code_p) {}

    ErrorCode GetCode() const { return code; }
    const std::string& GetSqlState() const { return sql_state; }
    int32_t GetVendorCode() const { return vendor_code; }

private:
    ErrorCode code;
    std::string sql_state;
    int32_t vendor_code;
};

} // namespace dbrelay
