#pragma once

#include <strongbox/schema/error_code.hpp>
#include <strongbox/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: failure.
// Typed rejection produced by guard functions and the oracle adapter. Carries
// the violated condition together with the amounts and identity involved.
namespace strongbox::schema {

struct failure_t final {
  error_code code{};
  std::string message;
  std::optional<amount_t> amount;
  std::optional<amount_t> limit;
  std::optional<address_t> account;
};

}  // namespace strongbox::schema
