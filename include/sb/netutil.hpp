#pragma once

#include <string>
#include <string_view>

namespace sb
{
// "www.example.com." -> "www.example.com"
std::string strip_root_dot(std::string_view name);

std::string to_lower(std::string_view s);

std::string trim(std::string_view s);

// Random lowercase hex string of 2 * bytes characters.
std::string random_token(int bytes = 4);

// "<8 hex>.<domain>"
std::string random_subdomain(const std::string &domain);

// Number of dots in `name`.
int label_depth(std::string_view name);

// Dotted hostname whose labels are 1..63 chars of [a-z0-9-], not starting or
// ending with '-', total length <= 253.
bool is_valid_hostname(std::string_view name);

// False for private, loopback, link-local, shared, multicast and reserved IPv4
// ranges, true for any other parseable IPv4 address.
bool ip_is_public(const std::string &ip);
} // namespace sb
