#pragma once

#include <strongbox/ledger/vault_ledger.hpp>
#include <strongbox/schema/event_record.hpp>
#include <strongbox/schema/ledger_event.hpp>
#include <strongbox/schema/primitives.hpp>

#include <cstdint>
#include <vector>

namespace strongbox::ledger {

/// Append-only audit stream persisted under `SYS|EVENT|`.
///
/// Each record carries a BLAKE3 chain hash over the previous record's hash
/// and its own encoded payload. Records are staged first so their rows can
/// join the ledger checkpoint's batch; `accept` advances the head once that
/// batch is durable.
class event_log final {
 public:
  struct staged_t final {
    strongbox::schema::event_record_t record;
    std::vector<strongbox::storage::key_value_entry_t> rows;
  };

  explicit event_log(storage_t& storage);

  event_log(const event_log&) = delete;
  event_log& operator=(const event_log&) = delete;

  staged_t stage(const strongbox::schema::ledger_event_t& event,
                 strongbox::schema::timestamp_seconds_t now) const;

  void accept(const strongbox::schema::event_record_t& record);

  /// Records with `from <= event_id <= to`, oldest first.
  std::vector<strongbox::schema::event_record_t> range(uint64_t from,
                                                       uint64_t to) const;

  uint64_t last_id() const;
  strongbox::schema::hash32_t head() const;

  /// Recompute the chain from the first record; false on any mismatch.
  bool verify() const;

 private:
  void load_head();

  storage_t& storage_;
  mutable encoder_t encoder_;
  uint64_t last_id_{};
  strongbox::schema::hash32_t head_{};
};

}  // namespace strongbox::ledger
