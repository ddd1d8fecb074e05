#pragma once

#include <strongbox/schema/error_code.hpp>
#include <strongbox/schema/event_record.hpp>
#include <strongbox/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: operation result.
// Outcome of one ledger call. `code` is zero on success, otherwise an
// `error_code` value; `amount`, `limit` and `account` identify what was
// rejected.
namespace strongbox::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<amount_t> amount;
  std::optional<amount_t> limit;
  std::optional<address_t> account;
  std::vector<event_record_t> events;
};

using operation_result_t = operation_result<1>;

inline bool succeeded(const operation_result_t& result) {
  return result.code == 0;
}

inline bool failed_with(const operation_result_t& result,
                        const error_code code) {
  return result.code == static_cast<uint32_t>(code);
}

}  // namespace strongbox::schema
