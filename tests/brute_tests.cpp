#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "sb/brute.hpp"

using namespace sb;
namespace fs = std::filesystem;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static fs::path scratch_dir()
{
    const fs::path dir = fs::temp_directory_path() / "subbrute_brute_tests";
    fs::create_directories(dir);
    return dir;
}

static std::string write_file(const std::string &name, const std::string &content)
{
    const fs::path p = scratch_dir() / name;
    std::ofstream out(p, std::ios::trunc);
    out << content;
    return p.string();
}

static std::vector<std::string> read_lines(const std::string &path)
{
    std::vector<std::string> lines;
    std::ifstream in(path);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

static DnsLookupResult dns_answer(std::vector<std::string> records, uint32_t ttl)
{
    DnsLookupResult r{};
    r.records = std::move(records);
    r.ttl = ttl;
    return r;
}

static DnsLookupResult dns_failure(RawDnsErrorKind kind)
{
    DnsLookupResult r{};
    r.rc = -1;
    r.kind = kind;
    r.error = raw_dns_kind_str(kind);
    return r;
}

static std::string a_line(const std::string &name, const std::string &ip, int ttl)
{
    return R"({"name":")" + name + R"(.","type":"A","class":"IN","status":"NOERROR","data":{"answers":[{"ttl":)"
           + std::to_string(ttl) + R"(,"type":"A","class":"IN","name":")" + name + R"(.","data":")" + ip
           + R"("}]},"resolver":"8.8.8.8:53"})";
}

// Stands in for massdns: answers the names of `zone` found in the dictionary.
struct FakeMassdns
{
    std::map<std::string, std::pair<std::string, int> > zone;
    std::vector<MassdnsJob> jobs;
    std::vector<std::vector<std::string> > dictionaries;
    std::vector<std::vector<std::string> > nameservers;
    int rc = 0;

    BulkResolveFn fn()
    {
        return [this](const MassdnsJob &job)
        {
            jobs.push_back(job);
            dictionaries.push_back(read_lines(job.dict_path));
            nameservers.push_back(read_lines(job.ns_path));
            MassdnsResult res{};
            if (rc != 0)
            {
                res.rc = rc;
                res.error = "massdns exited with status 1";
                res.exit_code = 1;
                return res;
            }
            std::ofstream out(job.output_path, std::ios::trunc);
            for (const auto &name: dictionaries.back())
            {
                auto it = zone.find(name);
                if (it == zone.end()) continue;
                out << a_line(name, it->second.first, it->second.second) << '\n';
            }
            res.exit_code = 0;
            return res;
        };
    }
};

static Options base_options(const std::string &tag)
{
    Options opt{};
    opt.word = true;
    opt.wordlist = write_file(tag + "_words.txt", "www\napi\n");
    opt.nextlist = write_file(tag + "_next.txt", "dev\n");
    opt.temp_dir = (scratch_dir() / tag / "temp").string();
    opt.result_dir = (scratch_dir() / tag).string();
    return opt;
}

// No NS records, random labels do not resolve: no wildcard.
static BruteHooks plain_hooks(FakeMassdns &massdns, std::vector<DomainResult> &exported)
{
    BruteHooks hooks{};
    hooks.query_ns = [](const std::string &) { return dns_failure(RawDnsErrorKind::NoAnswer); };
    hooks.resolve = [](const std::string &) { return dns_failure(RawDnsErrorKind::NxDomain); };
    hooks.resolve_at = [](const std::string &, const std::vector<std::string> &)
    {
        return dns_failure(RawDnsErrorKind::NxDomain);
    };
    hooks.fetch = [](const std::string &) { return HttpResponse{}; };
    hooks.similar = [](const std::string &, const std::string &) { return false; };
    hooks.bulk_resolve = massdns.fn();
    hooks.export_result = [&exported](const DomainResult &r) { exported.push_back(r); };
    return hooks;
}

static void test_end_to_end_single_domain()
{
    FakeMassdns massdns;
    massdns.zone["www.example.com"] = {"93.184.216.34", 300};
    std::vector<DomainResult> exported;
    const Options opt = base_options("e2e");
    Brute brute(opt, plain_hooks(massdns, exported));

    assert_true(brute.run({"example.com"}) == RunStatus::Completed, "completed");
    assert_true(massdns.jobs.size() == 1, "one massdns run");
    auto dict = massdns.dictionaries[0];
    std::ranges::sort(dict);
    assert_true(dict == std::vector<std::string>({"api.example.com", "www.example.com"}), "dictionary");
    assert_true(std::ranges::find(massdns.nameservers[0], "8.8.8.8") != massdns.nameservers[0].end(),
                "general nameservers without wildcard");

    assert_true(exported.size() == 1, "exported once");
    const DomainResult &r = exported[0];
    assert_true(r.domain == "example.com", "domain");
    assert_true(r.subdomains == std::vector<std::string>({"www.example.com"}), "accepted names");
    assert_true(r.infos.at("www.example.com").reason == Reason::Ok, "reason OK");
    assert_true(r.infos.at("www.example.com").ips[0] == "93.184.216.34", "address");
    assert_true(brute.results().size() == 1, "kept in results()");

    const MassdnsJob &job = massdns.jobs[0];
    assert_true(!fs::exists(job.dict_path), "dictionary deleted");
    assert_true(!fs::exists(job.ns_path), "generated nameserver file deleted");
    assert_true(!fs::exists(job.output_path), "shard deleted");
    assert_true(fs::path(job.log_path).filename() == "massdns.log", "error log in result dir");
    assert_true(fs::path(job.dict_path).filename().string().starts_with("generated_subdomains_example.com_"),
                "dictionary name");
    assert_true(fs::path(job.output_path).filename().string().starts_with("resolved_result_example.com_"),
                "output name");
}

static void test_keep_files()
{
    FakeMassdns massdns;
    std::vector<DomainResult> exported;
    Options opt = base_options("keep");
    opt.delete_dict = false;
    opt.delete_result = false;
    opt.resolvers_path = write_file("keep_resolvers.txt", "1.1.1.1\n");
    Brute brute(opt, plain_hooks(massdns, exported));
    brute.run({"example.com"});
    const MassdnsJob &job = massdns.jobs.at(0);
    assert_true(fs::exists(job.dict_path), "dictionary kept");
    assert_true(fs::exists(job.output_path), "shard kept");
    assert_true(job.ns_path == opt.resolvers_path, "user resolver file used as is");
    assert_true(fs::exists(opt.resolvers_path), "user file untouched");
    assert_true(exported.at(0).subdomains.empty(), "nothing resolved");
}

static void test_wildcard_domain_filters_profile()
{
    FakeMassdns massdns;
    massdns.zone["www.example.com"] = {"93.184.216.34", 300};
    massdns.zone["api.example.com"] = {"7.7.7.7", 600};
    std::vector<DomainResult> exported;
    BruteHooks hooks = plain_hooks(massdns, exported);
    hooks.query_ns = [](const std::string &) { return dns_answer({"ns1.example.com"}, 3600); };
    hooks.resolve = [](const std::string &qname)
    {
        return qname == "ns1.example.com" ? dns_answer({"9.9.9.9"}, 3600) : dns_answer({"7.7.7.7"}, 600);
    };
    hooks.fetch = [](const std::string &)
    {
        HttpResponse r{};
        r.status = 200;
        r.body = "<html><body>parked</body></html>";
        return r;
    };
    hooks.similar = [](const std::string &a, const std::string &b) { return a == b; };
    std::vector<std::string> pinned;
    hooks.resolve_at = [&pinned](const std::string &, const std::vector<std::string> &ns)
    {
        pinned = ns;
        return dns_answer({"7.7.7.7"}, 600);
    };

    Brute brute(base_options("wild"), std::move(hooks));
    brute.run({"example.com"});
    assert_true(pinned == std::vector<std::string>({"9.9.9.9"}), "profile asked on authoritative servers");
    assert_true(massdns.nameservers.at(0) == std::vector<std::string>({"9.9.9.9"}),
                "massdns uses the authoritative servers");
    assert_true(fs::path(massdns.jobs.at(0).ns_path).filename().string().starts_with("authoritative_dns_"),
                "authoritative nameserver file");
    assert_true(exported.at(0).subdomains == std::vector<std::string>({"www.example.com"}),
                "wildcard answer filtered");
}

static void test_recursive_layers()
{
    FakeMassdns massdns;
    massdns.zone["www.example.com"] = {"93.184.216.34", 300};
    massdns.zone["dev.www.example.com"] = {"93.184.216.40", 300};
    std::vector<DomainResult> exported;
    Options opt = base_options("recursive");
    opt.recursive = true;
    opt.depth = 2;
    Brute brute(opt, plain_hooks(massdns, exported));
    brute.run({"example.com"});

    assert_true(massdns.jobs.size() == 2, "second layer brute for www only");
    assert_true(massdns.dictionaries[1] == std::vector<std::string>({"dev.www.example.com"}),
                "next layer uses the next wordlist");
    assert_true(exported.size() == 1, "one export per target");
    const auto &subs = exported[0].subdomains;
    assert_true(subs.size() == 2, "both layers merged");
    assert_true(subs[0] == "www.example.com" && subs[1] == "dev.www.example.com", "layer order");
}

static void test_depth_one_does_not_recurse()
{
    FakeMassdns massdns;
    massdns.zone["www.example.com"] = {"93.184.216.34", 300};
    std::vector<DomainResult> exported;
    Options opt = base_options("depth1");
    opt.recursive = true;
    opt.depth = 1;
    Brute brute(opt, plain_hooks(massdns, exported));
    brute.run({"example.com"});
    assert_true(massdns.jobs.size() == 1, "single layer");
}

static void test_massdns_failure_continues()
{
    FakeMassdns massdns;
    massdns.rc = -1;
    std::vector<DomainResult> exported;
    Brute brute(base_options("fail"), plain_hooks(massdns, exported));
    assert_true(brute.run({"example.com", "example.org"}) == RunStatus::Completed, "run completes");
    assert_true(massdns.jobs.size() == 2, "next domain still brute-forced");
    assert_true(exported.empty(), "failed domains are not exported");
    assert_true(brute.results().empty(), "failed domains have no result");
}

static void test_wildcard_collection_failure_skips_domain()
{
    FakeMassdns massdns;
    massdns.zone["www.example.org"] = {"93.184.216.34", 300};
    std::vector<DomainResult> exported;
    BruteHooks hooks = plain_hooks(massdns, exported);
    hooks.query_ns = [](const std::string &domain)
    {
        return domain == "example.com" ? dns_answer({"ns1.example.com"}, 3600)
                                       : dns_failure(RawDnsErrorKind::NoAnswer);
    };
    // example.com answers every label, example.org answers nothing
    hooks.resolve = [](const std::string &qname)
    {
        if (qname == "ns1.example.com") return dns_answer({"9.9.9.9"}, 3600);
        if (qname.ends_with(".example.com")) return dns_answer({"7.7.7.7"}, 600);
        return dns_failure(RawDnsErrorKind::NxDomain);
    };
    hooks.fetch = [](const std::string &)
    {
        HttpResponse r{};
        r.status = 404;
        return r;
    };
    int pinned_calls = 0;
    hooks.resolve_at = [&pinned_calls](const std::string &, const std::vector<std::string> &)
    {
        ++pinned_calls;
        return dns_failure(RawDnsErrorKind::QueryFailed);
    };

    Brute brute(base_options("collectfail"), std::move(hooks));
    assert_true(brute.run({"example.com", "example.org"}) == RunStatus::Completed, "run completes");
    assert_true(pinned_calls > 0, "wildcard profile collected");
    assert_true(massdns.jobs.size() == 1, "massdns skipped for the failed domain");
    for (const auto &name: massdns.dictionaries[0])
    {
        assert_true(name.ends_with(".example.org"), "massdns only for the next domain");
    }
    assert_true(exported.size() == 1 && exported[0].domain == "example.org", "only the next domain exported");
    assert_true(exported[0].subdomains == std::vector<std::string>({"www.example.org"}), "next domain resolved");
    assert_true(brute.results().size() == 1, "failed domain has no result");
}

static void test_dictionary_samples_resolved()
{
    FakeMassdns massdns;
    std::vector<DomainResult> exported;
    BruteHooks hooks = plain_hooks(massdns, exported);
    std::vector<std::string> asked;
    hooks.resolve = [&asked](const std::string &qname)
    {
        asked.push_back(qname);
        return dns_failure(RawDnsErrorKind::NxDomain);
    };
    Brute brute(base_options("samples"), std::move(hooks));
    brute.run({"example.com"});
    const bool www = std::ranges::find(asked, "www.example.com") != asked.end();
    const bool api = std::ranges::find(asked, "api.example.com") != asked.end();
    assert_true(www && api, "dictionary samples resolved before massdns");
    assert_true(massdns.jobs.size() == 1, "unresolvable samples do not stop the run");
}

static void test_user_resolvers_file_survives_cleanup()
{
    FakeMassdns massdns;
    std::vector<DomainResult> exported;
    Options opt = base_options("userns");
    opt.resolvers_path = write_file("userns_resolvers.txt", "1.1.1.1\n");
    Brute brute(opt, plain_hooks(massdns, exported));
    brute.run({"example.com"});
    assert_true(massdns.jobs.at(0).ns_path == opt.resolvers_path, "user resolver file used");
    assert_true(!fs::exists(massdns.jobs[0].dict_path), "dictionary deleted");
    assert_true(fs::exists(opt.resolvers_path), "user resolver file kept");
}

static void test_no_export()
{
    FakeMassdns massdns;
    std::vector<DomainResult> exported;
    Options opt = base_options("noexport");
    opt.do_export = false;
    Brute brute(opt, plain_hooks(massdns, exported));
    brute.run({"example.com"});
    assert_true(exported.empty(), "export hook not called");
}

static void test_interrupted_pause_aborts()
{
    FakeMassdns massdns;
    std::vector<DomainResult> exported;
    Options opt = base_options("abort");
    opt.check_dict = true;
    opt.check_seconds = 5;
    Brute brute(opt, plain_hooks(massdns, exported));
    brute.cancellation().cancel();
    assert_true(brute.run({"example.com"}) == RunStatus::Aborted, "aborted");
    assert_true(massdns.jobs.empty(), "massdns never started");
    assert_true(exported.empty(), "nothing exported");
}

static void test_unwritable_temp_dir_is_fatal()
{
    FakeMassdns massdns;
    std::vector<DomainResult> exported;
    Options opt = base_options("fatal");
    opt.temp_dir = write_file("fatal_is_a_file", "x");
    Brute brute(opt, plain_hooks(massdns, exported));
    bool fatal = false;
    try
    {
        brute.run({"example.com"});
    }
    catch (const FatalError &)
    {
        fatal = true;
    }
    assert_true(fatal, "FatalError raised");
}

static void test_gen_brute_dict_modes()
{
    FakeMassdns massdns;
    std::vector<DomainResult> exported;
    Options opt = base_options("dict");
    opt.word = false;
    opt.fuzz = true;
    opt.place = "m.*.example.com";
    opt.rule = "[a-z]";
    Brute brute(opt, plain_hooks(massdns, exported));
    const CandidateSet fuzz = brute.gen_brute_dict("example.com", 0);
    assert_true(fuzz.size() == 26 && fuzz.contains("m.q.example.com"), "fuzz place at depth 0");

    Options both = base_options("dict2");
    both.fuzz = true;
    both.rule = "x[0-1]";
    Brute brute2(both, plain_hooks(massdns, exported));
    const CandidateSet merged = brute2.gen_brute_dict("example.com", 0);
    assert_true(merged.size() == 4, "word + fuzz merged");
    const CandidateSet deeper = brute2.gen_brute_dict("www.example.com", 1);
    assert_true(deeper.contains("dev.www.example.com"), "next wordlist for deeper layers");
}

static void test_query_authoritative_ips()
{
    FakeMassdns massdns;
    std::vector<DomainResult> exported;
    BruteHooks hooks = plain_hooks(massdns, exported);
    hooks.query_ns = [](const std::string &) { return dns_answer({"ns1.example.com", "ns2.example.com"}, 3600); };
    hooks.resolve = [](const std::string &qname)
    {
        return qname == "ns1.example.com" ? dns_answer({"9.9.9.1", "9.9.9.2"}, 60)
                                          : dns_failure(RawDnsErrorKind::Timeout);
    };
    Brute brute(base_options("ns"), std::move(hooks));
    const auto ips = brute.query_authoritative_ips("example.com");
    assert_true(ips == std::vector<std::string>({"9.9.9.1", "9.9.9.2"}), "failed host skipped");
}

// Validation and loading

static void test_validate_options()
{
    std::string err;
    Options opt{};
    assert_true(!validate_options(opt, {}, err), "no domains");
    assert_true(!validate_options(opt, {"example.com"}, err), "no mode");
    assert_true(err == "please specify at least one brute mode", "mode message");

    opt.word = true;
    assert_true(validate_options(opt, {"example.com"}, err), "word mode ok");
    opt.depth = 0;
    assert_true(!validate_options(opt, {"example.com"}, err), "depth < 1");
    opt.depth = 2;
    opt.output_path = "out.txt";
    assert_true(!validate_options(opt, {"a.com", "b.com"}, err), "--output with several targets");
    opt.output_path.clear();

    Options fuzz{};
    fuzz.fuzz = true;
    assert_true(!validate_options(fuzz, {"example.com"}, err), "fuzz without place");
    fuzz.place = "m.*.example.com";
    assert_true(!validate_options(fuzz, {"example.com"}, err), "fuzz without rule or list");
    fuzz.rule = "[a-z]";
    assert_true(validate_options(fuzz, {"example.com"}, err), "fuzz ok");
    assert_true(!validate_options(fuzz, {"example.com", "example.org"}, err), "fuzz in bulk");
    fuzz.place = "m.*.*.example.com";
    assert_true(!validate_options(fuzz, {"example.com"}, err), "two fuzz positions");
    fuzz.place = "m.example.com";
    assert_true(!validate_options(fuzz, {"example.com"}, err), "no fuzz position");
    fuzz.place = "m.*.other.com";
    assert_true(!validate_options(fuzz, {"example.com"}, err), "place outside the domain");
    fuzz.place = "m.*.example.com";
    fuzz.recursive = true;
    assert_true(!validate_options(fuzz, {"example.com"}, err), "recursive fuzz");
    fuzz.recursive = false;
    fuzz.rule = "[a-";
    assert_true(!validate_options(fuzz, {"example.com"}, err), "bad rule");
}

static void test_load_domains()
{
    Options opt{};
    opt.target = "Example.COM.";
    opt.targets_path = write_file("targets.txt", "# comment\n\nexample.org\nEXAMPLE.com\n  example.net  \n");
    const auto domains = load_domains(opt);
    assert_true(domains == std::vector<std::string>({"example.com", "example.org", "example.net"}),
                "normalized, deduplicated, comments skipped");
}

// massdns command line

static void test_massdns_args()
{
    Options opt{};
    opt.quiet = true;
    opt.process = 2;
    const MassdnsJob job = make_massdns_job(opt, "dict.txt", "ns.txt", "out.json", "err.log");
    const auto args = build_massdns_args(job);
    const std::vector<std::string> expected = {
        "massdns", "--quiet", "--status-format", "ansi", "--processes", "2", "--socket-count", "1",
        "--hashmap-size", "2000", "--resolvers", "ns.txt", "--resolve-count", "50", "--type", "A",
        "--flush", "--output", "J", "--outfile", "out.json", "--root", "--error-log", "err.log",
        "dict.txt", "--filter", "OK", "--sndbuf", "0", "--rcvbuf", "0",
    };
    assert_true(args == expected, "massdns argv");

    assert_true(massdns_output_paths("out.json", 1) == std::vector<std::string>({"out.json"}), "single shard");
    assert_true(massdns_output_paths("out.json", 3)
                    == std::vector<std::string>({"out.json0", "out.json1", "out.json2"}),
                "per-process shards");
}

static void test_call_massdns_missing_binary()
{
    MassdnsJob job{};
    job.massdns_path = (scratch_dir() / "no-such-massdns").string();
    const MassdnsResult r = call_massdns(job);
    assert_true(r.rc == -1 && !r.error.empty(), "spawn failure reported");
}

int main()
{
    test_end_to_end_single_domain();
    test_keep_files();
    test_wildcard_domain_filters_profile();
    test_recursive_layers();
    test_depth_one_does_not_recurse();
    test_massdns_failure_continues();
    test_wildcard_collection_failure_skips_domain();
    test_dictionary_samples_resolved();
    test_user_resolvers_file_survives_cleanup();
    test_no_export();
    test_interrupted_pause_aborts();
    test_unwritable_temp_dir_is_fatal();
    test_gen_brute_dict_modes();
    test_query_authoritative_ips();
    test_validate_options();
    test_load_domains();
    test_massdns_args();
    test_call_massdns_missing_binary();
    fs::remove_all(scratch_dir());
    std::cout << "brute tests: OK" << std::endl;
    return 0;
}
