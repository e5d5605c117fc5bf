#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sb {

enum class Origin { Word, Fuzz };

// Wildcard IP set and TTL as seen on the authoritative nameservers.
// Empty ips means no wildcard filtering applies.
struct WildcardProfile {
    std::set<std::string> ips;
    uint32_t              ttl{};

    bool empty() const { return ips.empty(); }
};

struct ARecord {
    std::string name;      // owner name, trailing dot removed
    uint32_t    ttl{};
    std::string address;
};

struct OtherRecord {
    std::string type;
    std::string name;
    uint32_t    ttl{};
    std::string data;
};

using Answer = std::variant<ARecord, OtherRecord>;

struct ResolutionRecord {
    std::string         name;      // trailing dot removed
    std::string         status;    // NOERROR, NXDOMAIN, SERVFAIL, ...
    std::string         resolver;
    std::vector<Answer> answers;
};

using IpFrequencyTable = std::unordered_map<std::string, uint64_t>;

enum class Reason { Ok, IpBlacklist, IpWildcard, IpExceeded };

struct ValidationVerdict {
    bool   valid{};
    Reason reason{Reason::Ok};
};

struct SubdomainInfo {
    std::vector<uint32_t>    ttls;
    std::vector<std::string> cnames;
    std::vector<std::string> ips;
    std::vector<bool>        publics;
    std::vector<uint64_t>    times;    // frequency of each ip in the batch
    std::string              resolver;
    Reason                   reason{Reason::Ok};
};

struct DomainResult {
    std::string                          domain;
    std::vector<std::string>             subdomains; // accepted, in output order
    std::map<std::string, SubdomainInfo> infos;
};

const char *reason_str(Reason r);

} // namespace sb
