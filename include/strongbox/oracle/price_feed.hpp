#pragma once

#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/round_data.hpp>

#include <map>
#include <memory>
#include <mutex>

namespace strongbox::oracle {

/// Read-only aggregator boundary. Implementations answer the latest round;
/// they are never asked to mutate anything.
class price_feed {
 public:
  virtual ~price_feed() = default;

  virtual strongbox::schema::round_data_t latest_round_data() const = 0;
};

/// Feed whose round is set by hand. Backs the CLI and the tests.
class fixed_price_feed final : public price_feed {
 public:
  fixed_price_feed() = default;
  fixed_price_feed(strongbox::schema::price_t answer,
                   strongbox::schema::timestamp_seconds_t updated_at);

  strongbox::schema::round_data_t latest_round_data() const override;

  /// Publish a new round; the round id advances by one.
  void publish(strongbox::schema::price_t answer,
               strongbox::schema::timestamp_seconds_t updated_at);

 private:
  mutable std::mutex mutex_;
  strongbox::schema::round_data_t round_;
};

/// Resolves an oracle reference (feed address) to the feed deployed there.
class feed_registry final {
 public:
  void register_feed(const strongbox::schema::address_t& reference,
                     std::shared_ptr<const price_feed> feed);

  /// nullptr when nothing is deployed at `reference`.
  std::shared_ptr<const price_feed> find(
      const strongbox::schema::address_t& reference) const;

 private:
  mutable std::mutex mutex_;
  std::map<strongbox::schema::address_t, std::shared_ptr<const price_feed>>
      feeds_;
};

}  // namespace strongbox::oracle
