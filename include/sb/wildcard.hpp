#pragma once

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "sb/http_fetch.hpp"
#include "sb/model.hpp"
#include "sb/rawdns.hpp"

namespace sb
{
using PinnedResolveFn = std::function<DnsLookupResult(
    const std::string & /*qname*/,
    const std::vector<std::string> & /*nameservers*/)>;
using FetchFn = std::function<HttpResponse(const std::string & /*url*/)>;
using SimilarFn = std::function<bool(const std::string &, const std::string &)>;

inline constexpr int kWildcardProbes = 3;

// Resolves three random labels; any that fails means no wildcard. Otherwise
// all three are fetched over HTTP: a failed fetch means wildcard, and so does
// any pair of similar bodies.
bool detect_wildcard(const std::string &domain,
                     const ResolveFn &resolve,
                     const FetchFn &fetch,
                     const SimilarFn &similar);

// detect_wildcard plus the operator-facing log line.
bool is_enable_wildcard(const std::string &domain,
                        const ResolveFn &resolve,
                        const FetchFn &fetch,
                        const SimilarFn &similar);

struct CollectorParams
{
    double ratio = 0.8;    // share of addresses seen at least twice
    int window = 5;        // outcomes per stability check
    int min_samples = 2;   // data outcomes required before convergence
    int max_attempts = 2;  // per query, only timeouts are retried
};

enum class SampleOutcome { Data, NoData, Error };

struct WildcardSample
{
    SampleOutcome outcome{SampleOutcome::NoData};
    std::set<std::string> ips;
    uint32_t ttl{};
    std::string error;
};

// One A query of `qname` on the pinned nameservers. Timeouts are retried up
// to max_attempts; when every attempt times out the outcome is NoData.
WildcardSample get_wildcard_record(const std::string &qname,
                                   const std::vector<std::string> &nameservers,
                                   const PinnedResolveFn &query,
                                   int max_attempts);

struct CollectResult
{
    int rc{};              // -1 when an unexpected DNS error aborted collection
    std::string error;
    WildcardProfile profile;
    int iterations{};
};

// Samples random labels on the authoritative nameservers until the wildcard
// answers converge, vanish, or show unstable TTLs. An empty nameserver list
// yields an empty profile.
CollectResult collect_wildcard_record(const std::string &domain,
                                      const std::vector<std::string> &authoritative_ns,
                                      const PinnedResolveFn &query,
                                      const CollectorParams &params = {});
} // namespace sb
