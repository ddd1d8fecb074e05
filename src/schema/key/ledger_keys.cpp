#include <strongbox/schema/key/builder.hpp>
#include <strongbox/schema/key/ledger_keys.hpp>

#include <algorithm>

using namespace strongbox::schema;

namespace strongbox::schema::key {

bytes_t make_balance_key(const address_t& user, const asset_id_t asset) {
  auto b = builder{};
  b.write(kBalanceKeyPrefix);
  b.write(user);
  b.write(asset);
  return b.data;
}

std::optional<std::pair<address_t, asset_id_t>> parse_balance_key(
    const bytes_view_t& key) {
  const auto expected_size = kBalanceKeyPrefix.size() + address_t{}.size() + 1;
  if (key.size() != expected_size) {
    return std::nullopt;
  }
  const auto prefix = make_string(key.first(kBalanceKeyPrefix.size()));
  if (prefix != kBalanceKeyPrefix) {
    return std::nullopt;
  }
  auto user = address_t{};
  auto address_bytes = key.subspan(kBalanceKeyPrefix.size(), user.size());
  std::copy(std::begin(address_bytes), std::end(address_bytes),
            std::begin(user));
  auto asset = try_make_asset_id(key.back());
  if (!asset) {
    return std::nullopt;
  }
  return std::pair{user, *asset};
}

bytes_t make_event_key(const uint64_t event_id) {
  auto b = builder{};
  b.write(kEventPrefix);
  b.write_ordered(event_id);
  return b.data;
}

bytes_t make_key(const std::string_view fixed_key) {
  return builder{}.write(fixed_key).data;
}

}  // namespace strongbox::schema::key
