#include "sb/classifier.hpp"

namespace sb
{
const char *reason_str(Reason r)
{
    switch (r)
    {
        case Reason::Ok: return "OK";
        case Reason::IpBlacklist: return "IP blacklist";
        case Reason::IpWildcard: return "IP wildcard";
        case Reason::IpExceeded: return "IP exceeded";
    }
    return "unknown";
}

bool check_by_compare(const std::string &ip,
                      uint32_t ttl,
                      const WildcardProfile &profile)
{
    if (!profile.ips.contains(ip)) return false;
    if (ttl != profile.ttl && ttl % 60 == 0 && profile.ttl % 60 == 0)
    {
        return false;
    }
    return true;
}

ValidationVerdict is_valid_subdomain(const std::string &ip,
                                     uint32_t ttl,
                                     uint64_t times,
                                     const WildcardProfile &profile,
                                     const IpBlacklist &blacklist,
                                     uint64_t ip_appear_maximum)
{
    if (blacklist.contains(ip)) return {false, Reason::IpBlacklist};
    if (!profile.empty() && check_by_compare(ip, ttl, profile))
    {
        return {false, Reason::IpWildcard};
    }
    if (times > ip_appear_maximum) return {false, Reason::IpExceeded};
    return {true, Reason::Ok};
}
} // namespace sb
