#include "sb/wildcard.hpp"

#include <algorithm>
#include <deque>
#include <map>
#include <optional>
#include <set>

#include <spdlog/fmt/ranges.h>

#include "sb/log.hpp"
#include "sb/netutil.hpp"

namespace sb
{
WildcardSample get_wildcard_record(const std::string &qname,
                                   const std::vector<std::string> &nameservers,
                                   const PinnedResolveFn &query,
                                   int max_attempts)
{
    spdlog::info("query {} 's wildcard dns record in authoritative name server", qname);
    WildcardSample sample{};
    for (int attempt = 1; attempt <= max_attempts; ++attempt)
    {
        const DnsLookupResult r = query(qname, nameservers);
        if (r.rc == 0 && r.records.empty())
        {
            spdlog::debug("no record of query result for {}", qname);
            sample.outcome = SampleOutcome::NoData;
            return sample;
        }
        if (r.rc == 0)
        {
            sample.outcome = SampleOutcome::Data;
            sample.ips.insert(r.records.begin(), r.records.end());
            sample.ttl = r.ttl;
            spdlog::info(
                "{} results on authoritative name server: {} IP: {} TTL: {}",
                qname,
                r.name,
                fmt::join(sample.ips, ","),
                sample.ttl);
            return sample;
        }
        if (r.kind == RawDnsErrorKind::Timeout)
        {
            spdlog::warn("query timeout ({}/{}), retrying", attempt, max_attempts);
            continue;
        }
        if (is_negative(r.kind))
        {
            spdlog::debug("{} dont have A record on authoritative name server: {}", qname, r.error);
            sample.outcome = SampleOutcome::NoData;
            return sample;
        }
        spdlog::error(
            "query {} wildcard dns record in authoritative name server error: {} ({})",
            qname,
            r.error,
            raw_dns_kind_str(r.kind));
        sample.outcome = SampleOutcome::Error;
        sample.error = r.error;
        return sample;
    }
    spdlog::warn("multiple query timeouts for {}, counting it as no data", qname);
    sample.outcome = SampleOutcome::NoData;
    return sample;
}

static bool all_distinct(const std::deque<std::optional<uint32_t>> &ttls)
{
    for (size_t i = 0; i < ttls.size(); ++i)
    {
        for (size_t j = i + 1; j < ttls.size(); ++j)
        {
            if (ttls[i] == ttls[j]) return false;
        }
    }
    return true;
}

CollectResult collect_wildcard_record(const std::string &domain,
                                      const std::vector<std::string> &authoritative_ns,
                                      const PinnedResolveFn &query,
                                      const CollectorParams &params)
{
    spdlog::info("collecting wildcard dns record for {}", domain);
    CollectResult out{};
    if (authoritative_ns.empty()) return out;

    const size_t window = static_cast<size_t>(std::max(1, params.window));
    std::set<std::string> ips;
    std::map<std::string, int> ips_stat;
    std::deque<std::optional<uint32_t>> ttls_check; // nullopt = no data
    uint32_t ttl = 0;
    int data_samples = 0;

    for (;;)
    {
        ++out.iterations;
        const std::string qname = random_subdomain(domain);
        const WildcardSample sample = get_wildcard_record(
            qname,
            authoritative_ns,
            query,
            params.max_attempts);
        if (sample.outcome == SampleOutcome::Error)
        {
            out.rc = -1;
            out.error = "wildcard collection for " + domain + " aborted: " + sample.error;
            return out;
        }

        const bool has_data = sample.outcome == SampleOutcome::Data;
        ttls_check.push_back(has_data ? std::optional<uint32_t>(sample.ttl) : std::nullopt);
        if (ttls_check.size() > window) ttls_check.pop_front();

        if (static_cast<size_t>(out.iterations) % window == 0)
        {
            const bool none = std::ranges::none_of(
                ttls_check,
                [](const auto &t) { return t.has_value(); });
            if (none)
            {
                spdlog::warn(
                    "the query ends because there are no results for {} consecutive queries",
                    window);
                out.profile = {};
                return out;
            }
            if (window > 1 && all_distinct(ttls_check))
            {
                spdlog::warn(
                    "the query ends because there are {} different TTL results for {} consecutive queries",
                    window,
                    window);
                out.profile = {};
                return out;
            }
        }

        if (!has_data) continue;
        ++data_samples;
        ttl = sample.ttl;
        for (const auto &addr: sample.ips)
        {
            ips.insert(addr);
            ++ips_stat[addr];
        }
        const auto stable = std::ranges::count_if(
            ips_stat,
            [](const auto &kv) { return kv.second >= 2; });
        const double share = static_cast<double>(stable) / static_cast<double>(ips.size());
        if (data_samples >= params.min_samples && share >= params.ratio)
        {
            break;
        }
    }

    out.profile.ips = std::move(ips);
    out.profile.ttl = ttl;
    spdlog::debug(
        "collected the wildcard dns record of {}: {} TTL {}",
        domain,
        fmt::join(out.profile.ips, ","),
        out.profile.ttl);
    return out;
}
} // namespace sb
