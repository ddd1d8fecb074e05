#include <spdlog/spdlog.h>
#include <strongbox/blake3/hash.hpp>
#include <strongbox/common/critical.hpp>
#include <strongbox/ledger/event_log.hpp>
#include <strongbox/schema/encoding/scale/rows.hpp>
#include <strongbox/schema/key/ledger_keys.hpp>

#include <algorithm>

using namespace strongbox::schema;

namespace strongbox::ledger {

event_log::event_log(storage_t& storage) : storage_{storage} {
  load_head();
}

event_log::staged_t event_log::stage(const ledger_event_t& event,
                                     const timestamp_seconds_t now) const {
  auto record = event_record_t{};
  record.event_id = last_id_ + 1;
  record.recorded_at = now;
  record.event = event;
  const auto payload = encoder_.encode(encoding::scale::to_payload_row(record));
  record.chain_hash = strongbox::blake3::chain(
      head_, bytes_view_t{payload.data(), payload.size()});

  auto staged = staged_t{.record = record, .rows = {}};
  staged.rows.push_back({key::make_event_key(record.event_id),
                         encoder_.encode(encoding::scale::to_row(record))});
  staged.rows.push_back(
      {key::make_key(key::kEventHeadKey),
       encoder_.encode(encoding::scale::event_head_row_t{record.event_id,
                                                         record.chain_hash})});
  return staged;
}

void event_log::accept(const event_record_t& record) {
  if (record.event_id != last_id_ + 1) {
    strongbox::common::critical("event accepted out of order");
  }
  last_id_ = record.event_id;
  head_ = record.chain_hash;
  spdlog::debug("Event {} {} recorded", record.event_id,
                event_type(record.event));
}

std::vector<event_record_t> event_log::range(const uint64_t from,
                                             const uint64_t to) const {
  auto records = std::vector<event_record_t>{};
  const auto first = std::max<uint64_t>(from, 1);
  const auto last = std::min(to, last_id_);
  for (auto id = first; id <= last; ++id) {
    const auto event_key = key::make_event_key(id);
    auto row = storage_.get<encoding::scale::event_row_t>(
        encoder_, bytes_view_t{event_key.data(), event_key.size()});
    if (!row) {
      strongbox::common::critical("audit log is missing an event row");
    }
    auto record = encoding::scale::from_row(*row);
    if (!record) {
      strongbox::common::critical("audit log holds an unknown event kind");
    }
    records.push_back(std::move(*record));
  }
  return records;
}

uint64_t event_log::last_id() const {
  return last_id_;
}

hash32_t event_log::head() const {
  return head_;
}

bool event_log::verify() const {
  auto previous = make_zero_hash();
  for (const auto& record : range(1, last_id_)) {
    const auto payload =
        encoder_.encode(encoding::scale::to_payload_row(record));
    const auto expected = strongbox::blake3::chain(
        previous, bytes_view_t{payload.data(), payload.size()});
    if (expected != record.chain_hash) {
      spdlog::error("Audit chain broken at event {}", record.event_id);
      return false;
    }
    previous = record.chain_hash;
  }
  return previous == head_;
}

void event_log::load_head() {
  const auto head_key = key::make_key(key::kEventHeadKey);
  if (auto row = storage_.get<encoding::scale::event_head_row_t>(
          encoder_, bytes_view_t{head_key.data(), head_key.size()})) {
    last_id_ = std::get<0>(*row);
    head_ = std::get<1>(*row);
  }
  spdlog::info("Audit log head at event {}", last_id_);
}

}  // namespace strongbox::ledger
