#pragma once

#include <cstdint>
#include <string>
#include <unordered_set>

#include "sb/model.hpp"

namespace sb
{
using IpBlacklist = std::unordered_set<std::string>;

// True when the address belongs to the wildcard profile and the TTLs do not
// look independently configured (two different multiples of 60).
bool check_by_compare(const std::string &ip,
                      uint32_t ttl,
                      const WildcardProfile &profile);

// Checks in order: blacklist, wildcard profile, reuse ceiling.
ValidationVerdict is_valid_subdomain(const std::string &ip,
                                     uint32_t ttl,
                                     uint64_t times,
                                     const WildcardProfile &profile,
                                     const IpBlacklist &blacklist,
                                     uint64_t ip_appear_maximum);
} // namespace sb
