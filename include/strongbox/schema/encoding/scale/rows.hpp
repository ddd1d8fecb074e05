#pragma once
#include <strongbox/schema/event_record.hpp>
#include <strongbox/schema/ledger_totals.hpp>
#include <strongbox/schema/policy_parameters.hpp>
#include <strongbox/schema/primitives.hpp>

#include <optional>
#include <tuple>

// Row codecs: flatten schema types into tuples of SCALE primitives. Amounts
// travel as 32-byte little-endian words.
namespace strongbox::schema::encoding::scale {

using balance_row_t = amount_bytes_t;

using totals_row_t = std::tuple<uint16_t, amount_bytes_t, uint64_t, uint64_t>;

/// (version, global ceiling, capital ceiling, native withdrawal ceiling,
///  stable withdrawal ceiling)
using policy_row_t = std::tuple<uint16_t,
                                amount_bytes_t,
                                amount_bytes_t,
                                amount_bytes_t,
                                amount_bytes_t>;

/// (administrator, oracle reference)
using admin_row_t = std::tuple<address_t, address_t>;

/// (version, event_id, recorded_at, kind, address, asset, amount)
using event_payload_row_t = std::tuple<uint16_t,
                                       uint64_t,
                                       uint64_t,
                                       uint8_t,
                                       address_t,
                                       uint8_t,
                                       amount_bytes_t>;

using event_row_t = std::tuple<event_payload_row_t, hash32_t>;

/// (last assigned event id, chain hash of that event)
using event_head_row_t = std::tuple<uint64_t, hash32_t>;

totals_row_t to_row(const ledger_totals_t& totals);
ledger_totals_t from_row(const totals_row_t& row);

policy_row_t to_row(const policy_parameters_t& parameters);
policy_parameters_t from_row(const policy_row_t& row);

event_payload_row_t to_payload_row(const event_record_t& record);
event_row_t to_row(const event_record_t& record);
std::optional<event_record_t> from_row(const event_row_t& row);

}  // namespace strongbox::schema::encoding::scale
