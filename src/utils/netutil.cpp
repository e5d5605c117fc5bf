#include "sb/netutil.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <random>
#include <ranges>

#include <arpa/inet.h>
#include <netinet/in.h>

namespace sb
{
std::string strip_root_dot(std::string_view name)
{
    if (!name.empty() && name.back() == '.') name.remove_suffix(1);
    return std::string(name);
}

std::string to_lower(std::string_view s)
{
    std::string out(s);
    std::ranges::transform(
        out,
        out.begin(),
        [](unsigned char c)
        {
            return static_cast<char>(std::tolower(c));
        });
    return out;
}

std::string trim(std::string_view s)
{
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return std::string(s);
}

std::string random_token(int bytes)
{
    static constexpr char kHex[] = "0123456789abcdef";
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 15);
    std::string out;
    out.reserve(static_cast<size_t>(bytes) * 2);
    for (int i = 0; i < bytes * 2; ++i) out.push_back(kHex[dist(gen)]);
    return out;
}

std::string random_subdomain(const std::string &domain)
{
    return random_token(4) + '.' + domain;
}

int label_depth(std::string_view name)
{
    return static_cast<int>(std::ranges::count(name, '.'));
}

bool is_valid_hostname(std::string_view name)
{
    if (name.empty() || name.size() > 253) return false;
    size_t start = 0;
    while (start <= name.size())
    {
        size_t end = name.find('.', start);
        if (end == std::string_view::npos) end = name.size();
        std::string_view label = name.substr(start, end - start);
        if (label.empty() || label.size() > 63) return false;
        if (label.front() == '-' || label.back() == '-') return false;
        for (unsigned char c: label)
        {
            if (!(std::islower(c) || std::isdigit(c) || c == '-')) return false;
        }
        start = end + 1;
    }
    return true;
}

bool ip_is_public(const std::string &ip)
{
    in_addr addr{};
    if (inet_pton(AF_INET, ip.c_str(), &addr) != 1) return false;
    const uint32_t a = ntohl(addr.s_addr);

    struct Net { uint32_t base; int prefix; };
    static constexpr Net kNonPublic[] = {
        {0x00000000u, 8},  // 0.0.0.0/8
        {0x0A000000u, 8},  // 10.0.0.0/8
        {0x64400000u, 10}, // 100.64.0.0/10
        {0x7F000000u, 8},  // 127.0.0.0/8
        {0xA9FE0000u, 16}, // 169.254.0.0/16
        {0xAC100000u, 12}, // 172.16.0.0/12
        {0xC0000000u, 24}, // 192.0.0.0/24
        {0xC0000200u, 24}, // 192.0.2.0/24
        {0xC0A80000u, 16}, // 192.168.0.0/16
        {0xC6120000u, 15}, // 198.18.0.0/15
        {0xC6336400u, 24}, // 198.51.100.0/24
        {0xCB007100u, 24}, // 203.0.113.0/24
        {0xE0000000u, 4},  // 224.0.0.0/4
        {0xF0000000u, 4},  // 240.0.0.0/4
    };
    for (const auto &[base, prefix]: kNonPublic)
    {
        const uint32_t mask = prefix == 0 ? 0 : ~uint32_t{0} << (32 - prefix);
        if ((a & mask) == base) return false;
    }
    return true;
}
} // namespace sb
