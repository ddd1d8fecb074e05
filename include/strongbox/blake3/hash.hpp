#pragma once
#include <strongbox/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace strongbox::blake3 {

strongbox::schema::hash32_t hash(const std::string_view& str);
strongbox::schema::hash32_t hash(const strongbox::schema::bytes_view_t& bytes);

/// BLAKE3 over `previous || payload`; links one audit record to the next.
strongbox::schema::hash32_t chain(const strongbox::schema::hash32_t& previous,
                                  const strongbox::schema::bytes_view_t& payload);

}  // namespace strongbox::blake3
