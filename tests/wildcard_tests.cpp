#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "sb/similarity.hpp"
#include "sb/wildcard.hpp"

using namespace sb;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static DnsLookupResult answer(std::vector<std::string> ips, uint32_t ttl)
{
    DnsLookupResult r{};
    r.records = std::move(ips);
    r.ttl = ttl;
    return r;
}

static DnsLookupResult failure(RawDnsErrorKind kind)
{
    DnsLookupResult r{};
    r.rc = -1;
    r.kind = kind;
    r.error = raw_dns_kind_str(kind);
    return r;
}

static HttpResponse page(std::string body, long status = 200)
{
    HttpResponse r{};
    r.status = status;
    r.body = std::move(body);
    return r;
}

// Detector

static void test_detect_nxdomain_means_no_wildcard()
{
    int fetches = 0;
    const bool w = detect_wildcard(
        "example.com",
        [](const std::string &) { return failure(RawDnsErrorKind::NxDomain); },
        [&](const std::string &) { ++fetches; return page("x"); },
        [](const std::string &, const std::string &) { return true; });
    assert_true(!w, "random labels do not resolve");
    assert_true(fetches == 0, "no HTTP probing without resolution");
}

static void test_detect_one_failure_means_no_wildcard()
{
    int calls = 0;
    const bool w = detect_wildcard(
        "example.com",
        [&](const std::string &)
        {
            return ++calls == 2 ? failure(RawDnsErrorKind::Timeout) : answer({"1.2.3.4"}, 60);
        },
        [](const std::string &) { return page("x"); },
        [](const std::string &, const std::string &) { return true; });
    assert_true(!w, "any unresolved probe disables the wildcard");
    assert_true(calls == kWildcardProbes, "all probes are still resolved");
}

static void test_detect_failed_fetch_means_wildcard()
{
    const bool w = detect_wildcard(
        "example.com",
        [](const std::string &) { return answer({"1.2.3.4"}, 60); },
        [](const std::string &) { return page("gone", 404); },
        [](const std::string &, const std::string &) { return false; });
    assert_true(w, "resolvable but unreachable counts as wildcard");
}

static void test_detect_similar_pages_mean_wildcard()
{
    std::vector<std::string> urls;
    const bool w = detect_wildcard(
        "example.com",
        [](const std::string &) { return answer({"1.2.3.4"}, 60); },
        [&](const std::string &url) { urls.push_back(url); return page("<html><body>parked</body></html>"); },
        [](const std::string &a, const std::string &b) { return a == b; });
    assert_true(w, "identical parking pages");
    assert_true(urls.size() == 3, "three pages fetched");
    assert_true(urls[0].starts_with("http://") && urls[0].ends_with(".example.com"), "probe url");
}

static void test_detect_distinct_pages_mean_no_wildcard()
{
    int n = 0;
    const bool w = detect_wildcard(
        "example.com",
        [](const std::string &) { return answer({"1.2.3.4"}, 60); },
        [&](const std::string &) { return page("page " + std::to_string(n++)); },
        [](const std::string &a, const std::string &b) { return a == b; });
    assert_true(!w, "distinct pages");
}

// Collector

static void test_collect_empty_nameservers()
{
    int calls = 0;
    const CollectResult r = collect_wildcard_record(
        "example.com",
        {},
        [&](const std::string &, const std::vector<std::string> &) { ++calls; return answer({"1.1.1.1"}, 60); });
    assert_true(r.rc == 0 && r.profile.empty(), "nothing to ask");
    assert_true(calls == 0, "no queries");
}

static void test_collect_converges()
{
    std::vector<std::string> pinned;
    const CollectResult r = collect_wildcard_record(
        "example.com",
        {"9.9.9.9"},
        [&](const std::string &, const std::vector<std::string> &ns)
        {
            pinned = ns;
            return answer({"1.1.1.1", "2.2.2.2"}, 600);
        });
    assert_true(r.rc == 0, "rc 0");
    assert_true(r.iterations <= 10, "converges within 10 iterations");
    assert_true(r.profile.ips.size() == 2, "both wildcard ips");
    assert_true(r.profile.ips.contains("1.1.1.1") && r.profile.ips.contains("2.2.2.2"), "profile ips");
    assert_true(r.profile.ttl == 600, "profile ttl");
    assert_true(pinned.size() == 1 && pinned[0] == "9.9.9.9", "queries pinned to the authoritative servers");
}

static void test_collect_rotating_pool_converges()
{
    int n = 0;
    const std::vector<std::string> pool = {"1.1.1.1", "2.2.2.2", "3.3.3.3"};
    const CollectResult r = collect_wildcard_record(
        "example.com",
        {"9.9.9.9"},
        [&](const std::string &, const std::vector<std::string> &)
        {
            return answer({pool[static_cast<size_t>(n++) % pool.size()]}, 300);
        });
    assert_true(r.rc == 0, "rc 0");
    assert_true(r.profile.ips.size() == 3, "whole pool collected");
    assert_true(r.iterations <= 10, "bounded");
}

static void test_collect_no_data_gives_empty_profile()
{
    int calls = 0;
    const CollectResult r = collect_wildcard_record(
        "example.com",
        {"9.9.9.9"},
        [&](const std::string &, const std::vector<std::string> &)
        {
            ++calls;
            return failure(RawDnsErrorKind::NxDomain);
        });
    assert_true(r.rc == 0, "rc 0");
    assert_true(r.profile.empty() && r.profile.ttl == 0, "empty profile, ttl 0");
    assert_true(r.iterations == 5 && calls == 5, "stops after one window");
}

static void test_collect_timeouts_retried_then_no_data()
{
    int calls = 0;
    const CollectResult r = collect_wildcard_record(
        "example.com",
        {"9.9.9.9"},
        [&](const std::string &, const std::vector<std::string> &)
        {
            ++calls;
            return failure(RawDnsErrorKind::Timeout);
        });
    assert_true(r.rc == 0 && r.profile.empty(), "dead server ends collection");
    assert_true(calls == 10, "each of 5 samples retried once");
}

static void test_collect_distinct_ttls_give_empty_profile()
{
    uint32_t ttl = 100;
    int n = 0;
    const CollectResult r = collect_wildcard_record(
        "example.com",
        {"9.9.9.9"},
        [&](const std::string &, const std::vector<std::string> &)
        {
            return answer({"10.0.0." + std::to_string(++n)}, ttl++);
        });
    assert_true(r.rc == 0, "rc 0");
    assert_true(r.iterations == 5, "one window");
    assert_true(r.profile.empty(), "unstable ttls discard collected ips");
}

static void test_collect_error_aborts()
{
    int n = 0;
    const CollectResult r = collect_wildcard_record(
        "example.com",
        {"9.9.9.9"},
        [&](const std::string &, const std::vector<std::string> &)
        {
            return ++n == 1 ? answer({"1.1.1.1"}, 60) : failure(RawDnsErrorKind::QueryFailed);
        });
    assert_true(r.rc == -1, "unexpected error is surfaced");
    assert_true(!r.error.empty(), "error message");
}

static void test_get_wildcard_record_outcomes()
{
    auto q = [](DnsLookupResult res)
    {
        return [res](const std::string &, const std::vector<std::string> &) { return res; };
    };
    assert_true(get_wildcard_record("x.example.com", {"9.9.9.9"}, q(answer({"1.1.1.1"}, 5)), 2).outcome
                    == SampleOutcome::Data, "data");
    assert_true(get_wildcard_record("x.example.com", {"9.9.9.9"}, q(answer({}, 5)), 2).outcome
                    == SampleOutcome::NoData, "empty answer");
    assert_true(get_wildcard_record("x.example.com", {"9.9.9.9"}, q(failure(RawDnsErrorKind::NoAnswer)), 2).outcome
                    == SampleOutcome::NoData, "no answer");
    assert_true(get_wildcard_record("x.example.com", {"9.9.9.9"}, q(failure(RawDnsErrorKind::NoNameservers)), 2).outcome
                    == SampleOutcome::NoData, "no nameservers");
    assert_true(get_wildcard_record("x.example.com", {"9.9.9.9"}, q(failure(RawDnsErrorKind::InitFailed)), 2).outcome
                    == SampleOutcome::Error, "init failure");
}

// Similarity

static void test_similarity()
{
    const std::string a = "<html><head><title>A</title></head><body><div><p>x</p></div></body></html>";
    const std::string b = "<html><head><title>B</title></head><body><div><p>y</p></div></body></html>";
    const std::string c = "<html><body><table><tr><td>1</td></tr></table><form><input></form></body></html>";
    assert_true(is_similar(a, a), "identical");
    assert_true(is_similar(a, b), "same structure, different text");
    assert_true(!is_similar(a, c), "different structure");
    assert_true(is_similar("", ""), "two empty bodies");
    assert_true(!is_similar("", "something"), "empty vs non-empty");
    assert_true(cosine_similarity({}, {{"a", 1}}) == 0.0, "empty vector");
}

int main()
{
    test_detect_nxdomain_means_no_wildcard();
    test_detect_one_failure_means_no_wildcard();
    test_detect_failed_fetch_means_wildcard();
    test_detect_similar_pages_mean_wildcard();
    test_detect_distinct_pages_mean_no_wildcard();
    test_collect_empty_nameservers();
    test_collect_converges();
    test_collect_rotating_pool_converges();
    test_collect_no_data_gives_empty_profile();
    test_collect_timeouts_retried_then_no_data();
    test_collect_distinct_ttls_give_empty_profile();
    test_collect_error_aborts();
    test_get_wildcard_record_outcomes();
    test_similarity();
    std::cout << "wildcard tests: OK" << std::endl;
    return 0;
}
