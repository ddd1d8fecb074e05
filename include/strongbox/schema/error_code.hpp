#pragma once

#include <strongbox/schema/enum_string.hpp>

#include <cstdint>
#include <string_view>

// Schema type: ledger error code.
// Failure taxonomy: stable numeric codes returned in operation results. Zero
// is reserved for success.
namespace strongbox::schema {

enum class error_code : uint32_t {
  oracle_compromised = 1,
  oracle_stale = 2,
  per_transaction_limit_exceeded = 3,
  insufficient_balance = 4,
  global_limit_exceeded = 5,
  bank_capital_exceeded = 6,
  settlement_failed = 7,
  reentrant_call = 8,
  unauthorized = 9,
  zero_amount = 10,
  arithmetic_overflow = 11,
};

inline constexpr auto kErrorCodeNames = enum_names_t<error_code, 11>{
    std::pair<std::string_view, error_code>{"oracle_compromised",
                                            error_code::oracle_compromised},
    std::pair<std::string_view, error_code>{"oracle_stale",
                                            error_code::oracle_stale},
    std::pair<std::string_view, error_code>{
        "per_transaction_limit_exceeded",
        error_code::per_transaction_limit_exceeded},
    std::pair<std::string_view, error_code>{"insufficient_balance",
                                            error_code::insufficient_balance},
    std::pair<std::string_view, error_code>{"global_limit_exceeded",
                                            error_code::global_limit_exceeded},
    std::pair<std::string_view, error_code>{"bank_capital_exceeded",
                                            error_code::bank_capital_exceeded},
    std::pair<std::string_view, error_code>{"settlement_failed",
                                            error_code::settlement_failed},
    std::pair<std::string_view, error_code>{"reentrant_call",
                                            error_code::reentrant_call},
    std::pair<std::string_view, error_code>{"unauthorized",
                                            error_code::unauthorized},
    std::pair<std::string_view, error_code>{"zero_amount",
                                            error_code::zero_amount},
    std::pair<std::string_view, error_code>{"arithmetic_overflow",
                                            error_code::arithmetic_overflow},
};

inline constexpr std::string_view to_string(const error_code value) {
  return enum_name(value, kErrorCodeNames).value_or("unknown");
}

}  // namespace strongbox::schema
