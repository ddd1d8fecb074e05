#pragma once
#include <strongbox/schema/ledger_event.hpp>
#include <strongbox/schema/primitives.hpp>

// Schema type: event record.
// Persisted audit-log entry. `chain_hash` commits to the previous record's
// hash and this record's encoded payload.
namespace strongbox::schema {

template <uint16_t Version>
struct event_record;

template <>
struct event_record<1> final {
  uint16_t version{1};
  uint64_t event_id{};
  timestamp_seconds_t recorded_at{};
  ledger_event_t event;
  hash32_t chain_hash{};
};

using event_record_t = event_record<1>;

}  // namespace strongbox::schema
