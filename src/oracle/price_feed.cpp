#include <spdlog/spdlog.h>
#include <strongbox/oracle/price_feed.hpp>

using namespace strongbox::schema;

namespace strongbox::oracle {

fixed_price_feed::fixed_price_feed(const price_t answer,
                                   const timestamp_seconds_t updated_at) {
  publish(answer, updated_at);
}

round_data_t fixed_price_feed::latest_round_data() const {
  auto lock = std::scoped_lock{mutex_};
  return round_;
}

void fixed_price_feed::publish(const price_t answer,
                               const timestamp_seconds_t updated_at) {
  auto lock = std::scoped_lock{mutex_};
  round_.round_id += 1;
  round_.answer = answer;
  round_.started_at = updated_at;
  round_.updated_at = updated_at;
  round_.answered_in_round = round_.round_id;
}

void feed_registry::register_feed(const address_t& reference,
                                  std::shared_ptr<const price_feed> feed) {
  auto lock = std::scoped_lock{mutex_};
  feeds_[reference] = std::move(feed);
  spdlog::debug("Registered price feed at {}",
                strongbox::schema::to_string(reference));
}

std::shared_ptr<const price_feed> feed_registry::find(
    const address_t& reference) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = feeds_.find(reference);
  if (it == std::end(feeds_)) {
    return nullptr;
  }
  return it->second;
}

}  // namespace strongbox::oracle
