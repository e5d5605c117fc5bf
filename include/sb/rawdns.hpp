#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace sb {

enum class RawDnsErrorKind {
    None = 0,
    NotAvailable,
    InitFailed,
    InvalidQname,
    Timeout,
    NxDomain,
    NoAnswer,
    NoNameservers,
    QueryFailed,
};

struct DnsLookupResult {
    int rc{};                 // 0 on success, -1 on error
    std::string error;        // error message when rc != 0
    RawDnsErrorKind kind{RawDnsErrorKind::None};

    int rcode{};
    std::string name;         // owner name of the answer, trailing dot removed
    std::vector<std::string> records; // A addresses or NS host names
    uint32_t ttl{};           // minimum TTL across the returned records
};

using ResolveFn = std::function<DnsLookupResult(const std::string & /*qname*/)>;

// Definitive negative answers: the name has no data, which is not an error
// from the caller's point of view.
bool is_negative(RawDnsErrorKind kind);

// A lookup through the system resolver (resolv.conf).
DnsLookupResult query_a(const std::string &qname, int timeout_ms);

// A lookup pinned to the given nameserver addresses. Servers are picked in
// random order and nothing is cached.
DnsLookupResult query_a_at(const std::string &qname,
                           const std::vector<std::string> &nameservers,
                           int timeout_ms);

// NS lookup through the system resolver; records hold host names.
DnsLookupResult query_ns(const std::string &domain, int timeout_ms);

const char *raw_dns_kind_str(RawDnsErrorKind kind);

} // namespace sb
