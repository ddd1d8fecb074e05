#pragma once

#include <strongbox/schema/asset_id.hpp>
#include <strongbox/schema/failure.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/settlement/asset_channel.hpp>

#include <optional>

namespace strongbox::settlement {

/// Routes a ledger asset to the channel that settles it.
class settlement final {
 public:
  settlement(native_channel& native,
             stable_token& stable,
             strongbox::schema::address_t vault);

  /// Move `amount` of `asset` from `from` into the vault.
  std::optional<strongbox::schema::failure_t> pull(
      strongbox::schema::asset_id_t asset,
      const strongbox::schema::address_t& from,
      const strongbox::schema::amount_t& amount);

  /// Move `amount` of `asset` from the vault to `to`.
  std::optional<strongbox::schema::failure_t> push(
      strongbox::schema::asset_id_t asset,
      const strongbox::schema::address_t& to,
      const strongbox::schema::amount_t& amount);

  /// Value of `asset` the vault actually holds right now.
  strongbox::schema::amount_t on_hand(strongbox::schema::asset_id_t asset) const;

  const strongbox::schema::address_t& vault() const;

 private:
  native_channel& native_;
  stable_token& stable_;
  strongbox::schema::address_t vault_;
};

}  // namespace strongbox::settlement
