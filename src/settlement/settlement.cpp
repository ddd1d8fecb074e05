#include <spdlog/spdlog.h>
#include <strongbox/settlement/settlement.hpp>

using namespace strongbox::schema;

namespace strongbox::settlement {

namespace {

failure_t make_settlement_failure(const std::string_view direction,
                                  const asset_id_t asset,
                                  const address_t& account,
                                  const amount_t& amount) {
  auto message = std::string{direction} + " of " + amount.str() + " " +
                 std::string{strongbox::schema::to_string(asset)} +
                 " for " + strongbox::schema::to_string(account) +
                 " was refused";
  spdlog::warn("Settlement failed: {}", message);
  return failure_t{.code = error_code::settlement_failed,
                   .message = std::move(message),
                   .amount = amount,
                   .limit = std::nullopt,
                   .account = account};
}

}  // namespace

settlement::settlement(native_channel& native,
                       stable_token& stable,
                       address_t vault)
    : native_{native}, stable_{stable}, vault_{vault} {}

std::optional<failure_t> settlement::pull(const asset_id_t asset,
                                          const address_t& from,
                                          const amount_t& amount) {
  auto ok = false;
  switch (asset) {
    case asset_id_t::native:
      ok = native_.receive(from, amount);
      break;
    case asset_id_t::stable:
      ok = stable_.transfer_from(from, vault_, amount);
      break;
  }
  if (!ok) {
    return make_settlement_failure("pull", asset, from, amount);
  }
  return std::nullopt;
}

std::optional<failure_t> settlement::push(const asset_id_t asset,
                                          const address_t& to,
                                          const amount_t& amount) {
  auto ok = false;
  switch (asset) {
    case asset_id_t::native:
      ok = native_.send(to, amount);
      break;
    case asset_id_t::stable:
      ok = stable_.transfer(to, amount);
      break;
  }
  if (!ok) {
    return make_settlement_failure("push", asset, to, amount);
  }
  return std::nullopt;
}

amount_t settlement::on_hand(const asset_id_t asset) const {
  switch (asset) {
    case asset_id_t::native:
      return native_.vault_balance();
    case asset_id_t::stable:
      return stable_.balance_of(vault_);
  }
  return amount_t{0};
}

const address_t& settlement::vault() const {
  return vault_;
}

}  // namespace strongbox::settlement
