#include "sb/wildcard.hpp"

#include <set>
#include <vector>

#include <spdlog/fmt/ranges.h>

#include "sb/log.hpp"
#include "sb/netutil.hpp"

namespace sb
{
static std::vector<std::string> gen_random_subdomains(const std::string &domain,
                                                      int count)
{
    std::set<std::string> names;
    while (static_cast<int>(names.size()) < count)
    {
        names.insert(random_subdomain(domain));
    }
    return {names.begin(), names.end()};
}

static bool all_resolve_success(const std::vector<std::string> &subdomains,
                                const ResolveFn &resolve)
{
    bool all = true;
    for (const auto &name: subdomains)
    {
        const DnsLookupResult r = resolve(name);
        if (r.rc != 0)
        {
            spdlog::debug(
                "query {} wildcard dns record error: {}",
                name,
                r.error);
            all = false;
            continue;
        }
        spdlog::warn(
            "{} resolve to: {} IP: {} TTL: {}",
            name,
            r.name,
            fmt::join(r.records, ","),
            r.ttl);
    }
    return all;
}

bool detect_wildcard(const std::string &domain,
                     const ResolveFn &resolve,
                     const FetchFn &fetch,
                     const SimilarFn &similar)
{
    spdlog::info("detecting {} use wildcard dns record or not", domain);
    const auto subdomains = gen_random_subdomains(domain, kWildcardProbes);
    if (!all_resolve_success(subdomains, resolve)) return false;

    std::vector<std::string> bodies;
    bodies.reserve(subdomains.size());
    for (const auto &name: subdomains)
    {
        const std::string url = "http://" + name;
        const HttpResponse resp = fetch(url);
        if (!resp.ok())
        {
            spdlog::warn(
                "request: {} failed: {}",
                url,
                resp.rc != 0 ? resp.error : "status " + std::to_string(resp.status));
            return true;
        }
        spdlog::warn("request: {} status: {} size: {}", url, resp.status, resp.body.size());
        bodies.push_back(resp.body);
    }

    for (size_t i = 0; i < bodies.size(); ++i)
    {
        for (size_t j = i + 1; j < bodies.size(); ++j)
        {
            if (similar(bodies[i], bodies[j])) return true;
        }
    }
    return false;
}

bool is_enable_wildcard(const std::string &domain,
                        const ResolveFn &resolve,
                        const FetchFn &fetch,
                        const SimilarFn &similar)
{
    const bool enabled = detect_wildcard(domain, resolve, fetch, similar);
    if (enabled) spdlog::warn("the domain {} enables wildcard", domain);
    else spdlog::warn("the domain {} disables wildcard", domain);
    return enabled;
}
} // namespace sb
