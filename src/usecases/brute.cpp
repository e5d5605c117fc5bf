#include "sb/brute.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <unordered_set>
#include <utility>

#include <spdlog/fmt/ranges.h>

#include "sb/http_fetch.hpp"
#include "sb/log.hpp"
#include "sb/netutil.hpp"
#include "sb/output.hpp"
#include "sb/rawdns.hpp"
#include "sb/regex_expand.hpp"
#include "sb/result_processor.hpp"
#include "sb/similarity.hpp"

namespace fs = std::filesystem;

namespace sb
{
BruteHooks default_hooks(const Options &opt)
{
    BruteHooks hooks{};
    const int timeout_ms = opt.timeout_ms;
    hooks.resolve = [timeout_ms](const std::string &qname)
    {
        return query_a(qname, timeout_ms);
    };
    hooks.resolve_at = [timeout_ms](const std::string &qname,
                                    const std::vector<std::string> &ns)
    {
        return query_a_at(qname, ns, timeout_ms);
    };
    hooks.query_ns = [timeout_ms](const std::string &domain)
    {
        return query_ns(domain, timeout_ms);
    };
    hooks.fetch = [timeout_ms](const std::string &url)
    {
        return http_get(url, timeout_ms * 5);
    };
    const double threshold = opt.similarity_threshold;
    hooks.similar = [threshold](const std::string &a, const std::string &b)
    {
        return is_similar(a, b, threshold);
    };
    hooks.bulk_resolve = call_massdns;
    hooks.export_result = [opt](const DomainResult &result)
    {
        std::string path;
        std::string error;
        if (export_result_file(opt, result, path, error))
        {
            spdlog::info("exported {} results of {} to {}", result.subdomains.size(), result.domain, path);
        }
        else
        {
            spdlog::error("exporting results of {} failed: {}", result.domain, error);
        }
    };
    return hooks;
}

static void add_domain(std::vector<std::string> &domains,
                       std::unordered_set<std::string> &seen,
                       const std::string &raw)
{
    std::string d = to_lower(trim(raw));
    if (d.empty() || d.front() == '#') return;
    d = strip_root_dot(d);
    if (seen.insert(d).second) domains.push_back(std::move(d));
}

std::vector<std::string> load_domains(const Options &opt)
{
    std::vector<std::string> domains;
    std::unordered_set<std::string> seen;
    if (!opt.target.empty()) add_domain(domains, seen, opt.target);
    if (!opt.targets_path.empty())
    {
        std::ifstream in(opt.targets_path);
        if (!in)
        {
            spdlog::error("cannot open targets file {}", opt.targets_path);
            return domains;
        }
        std::string line;
        while (std::getline(in, line)) add_domain(domains, seen, line);
    }
    return domains;
}

bool validate_options(const Options &opt,
                      const std::vector<std::string> &domains,
                      std::string &error)
{
    if (domains.empty())
    {
        error = "no target domain specified";
        return false;
    }
    if (!opt.word && !opt.fuzz)
    {
        error = "please specify at least one brute mode";
        return false;
    }
    if (opt.depth < 1 || opt.process < 1 || opt.concurrent < 1)
    {
        error = "depth, process and concurrent must be at least 1";
        return false;
    }
    if (!opt.output_path.empty() && domains.size() > 1)
    {
        error = "--output can only be used with a single target";
        return false;
    }
    if (!opt.fuzz) return true;

    const bool bulk = domains.size() > 1;
    if (opt.place.empty())
    {
        error = "no fuzz position specified";
        return false;
    }
    if (opt.rule.empty() && opt.fuzzlist.empty())
    {
        error = "no fuzz rules or fuzz dictionary specified";
        return false;
    }
    if (bulk)
    {
        error = "cannot use fuzz mode in the bulk brute";
        return false;
    }
    if (opt.recursive)
    {
        error = "cannot use recursive brute in fuzz mode";
        return false;
    }
    const auto stars = std::ranges::count(opt.place, '*');
    if (stars < 1)
    {
        error = "no fuzz position specified";
        return false;
    }
    if (stars > 1)
    {
        error = "only one fuzz position can be specified";
        return false;
    }
    if (opt.place.find(domains.front()) == std::string::npos)
    {
        error = "incorrect domain for fuzz";
        return false;
    }
    if (!opt.rule.empty())
    {
        try
        {
            RegexExpander probe(opt.rule);
        }
        catch (const RegexError &e)
        {
            error = e.what();
            return false;
        }
    }
    return true;
}

Brute::Brute(Options opt, BruteHooks hooks)
    : opt_(std::move(opt)), hooks_(std::move(hooks))
{
}

std::string Brute::next_tag(const std::string &root)
{
    const std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32]{};
    std::strftime(buf, sizeof(buf), "%Y%m%d_%H%M%S", &tm);
    return root + '_' + buf + '_' + std::to_string(++sequence_);
}

std::vector<std::string> Brute::query_authoritative_ips(const std::string &domain)
{
    spdlog::info("querying NS records of {}", domain);
    std::vector<std::string> ns_ips;
    const DnsLookupResult ns = hooks_.query_ns(domain);
    if (ns.rc != 0)
    {
        spdlog::error("querying NS records of {} error: {}", domain, ns.error);
        return ns_ips;
    }
    spdlog::info("{}'s authoritative name server is {}", domain, fmt::join(ns.records, ", "));
    for (const auto &host: ns.records)
    {
        const DnsLookupResult a = hooks_.resolve(host);
        if (a.rc != 0)
        {
            spdlog::error("query authoritative name server {} A record error: {}", host, a.error);
            continue;
        }
        ns_ips.insert(ns_ips.end(), a.records.begin(), a.records.end());
    }
    spdlog::info("authoritative name server A record result: {}", fmt::join(ns_ips, ", "));
    return ns_ips;
}

CandidateSet Brute::gen_brute_dict(const std::string &root, int depth) const
{
    spdlog::info("generating dictionary for {}", root);
    const std::string place = depth == 0 && !opt_.place.empty() ? opt_.place : "*." + root;
    const std::string &wordlist = depth == 0 ? opt_.wordlist : opt_.nextlist;

    CandidateSet dict;
    if (opt_.word)
    {
        CandidateSet words = gen_word_subdomains(place, wordlist);
        spdlog::debug("dictionary based on word mode size: {}", words.size());
        dict.merge(words);
    }
    if (opt_.fuzz)
    {
        try
        {
            CandidateSet fuzz = gen_fuzz_subdomains(place, opt_.rule, opt_.fuzzlist);
            dict.merge(fuzz);
        }
        catch (const RegexError &e)
        {
            throw FatalError(e.what());
        }
    }
    spdlog::info("dictionary size: {}", dict.size());
    if (dict.size() > kDictionaryAlertSize)
    {
        spdlog::warn("the generated dictionary is too large {} > {}", dict.size(), kDictionaryAlertSize);
    }
    return dict;
}

static std::string write_lines(const std::string &path, const std::vector<std::string> &lines)
{
    std::ofstream out(path, std::ios::trunc);
    for (const auto &l: lines) out << l << '\n';
    out.flush();
    if (!out) throw FatalError("cannot write nameserver file " + path);
    return path;
}

std::string Brute::nameservers_path(bool enable_wildcard,
                                    const std::vector<std::string> &ns_ips,
                                    const std::string &tag) const
{
    const fs::path temp_dir(opt_.temp_dir);
    if (enable_wildcard && !ns_ips.empty())
    {
        return write_lines((temp_dir / ("authoritative_dns_" + tag + ".txt")).string(), ns_ips);
    }
    if (!opt_.resolvers_path.empty()) return opt_.resolvers_path;
    return write_lines((temp_dir / ("nameservers_" + tag + ".txt")).string(), opt_.nameservers);
}

bool Brute::check_dict()
{
    spdlog::warn("you have {} seconds to check whether the configuration is correct or not", opt_.check_seconds);
    spdlog::warn("if you want to exit, please use `Ctrl + C`");
    InterruptGuard guard(cancel_);
    if (!wait_unless_cancelled(std::chrono::seconds(opt_.check_seconds), cancel_))
    {
        spdlog::info("due to configuration incorrect, exited");
        return false;
    }
    return true;
}

static void remove_file(const std::string &path)
{
    std::error_code ec;
    if (!fs::remove(path, ec) && ec)
    {
        spdlog::error("cannot delete {}: {}", path, ec.message());
    }
}

PipelineOutcome Brute::brute_domain(const std::string &target,
                                    const std::string &root,
                                    int depth)
{
    const auto start = std::chrono::steady_clock::now();
    spdlog::info("blasting {}", root);
    PipelineOutcome out{};
    out.result.domain = root;

    std::error_code ec;
    fs::create_directories(opt_.temp_dir, ec);
    if (ec) throw FatalError("cannot create " + opt_.temp_dir + ": " + ec.message());
    fs::create_directories(opt_.result_dir, ec);
    if (ec) throw FatalError("cannot create " + opt_.result_dir + ": " + ec.message());

    const std::vector<std::string> ns_ips = query_authoritative_ips(target);
    const bool enable_wildcard = is_enable_wildcard(
        root,
        hooks_.resolve,
        hooks_.fetch,
        hooks_.similar);

    WildcardProfile profile;
    if (enable_wildcard)
    {
        CollectorParams params{};
        params.ratio = opt_.wildcard_ratio;
        params.window = opt_.wildcard_window;
        params.min_samples = opt_.wildcard_min_samples;
        CollectResult collected = collect_wildcard_record(root, ns_ips, hooks_.resolve_at, params);
        if (collected.rc != 0)
        {
            out.rc = -1;
            out.error = std::move(collected.error);
            return out;
        }
        profile = std::move(collected.profile);
    }

    const std::string tag = next_tag(root);
    const std::string ns_path = nameservers_path(enable_wildcard, ns_ips, tag);
    const std::string dict_path = (fs::path(opt_.temp_dir) / ("generated_subdomains_" + tag + ".txt")).string();
    {
        const CandidateSet dict = gen_brute_dict(root, depth);
        if (!dict.empty() && hooks_.resolve)
        {
            const std::vector<std::string> bad = check_random_subdomain(dict, hooks_.resolve);
            if (bad.size() == std::min(dict.size(), kSampleCount))
            {
                spdlog::warn("no sampled candidate of {} resolves, check the dictionary and template", root);
            }
        }
        if (!save_dictionary(dict_path, dict))
        {
            throw FatalError("saving dictionary " + dict_path + " error");
        }
    }

    if (opt_.check_dict && !check_dict())
    {
        out.aborted = true;
        return out;
    }

    const std::string output_path = (fs::path(opt_.temp_dir) / ("resolved_result_" + tag + ".json")).string();
    const std::string log_path = (fs::path(opt_.result_dir) / "massdns.log").string();
    spdlog::info("running massdns to brute subdomains");
    const MassdnsResult massdns = hooks_.bulk_resolve(
        make_massdns_job(opt_, dict_path, ns_path, output_path, log_path));
    const std::vector<std::string> output_paths = massdns_output_paths(output_path, opt_.process);
    if (massdns.rc != 0)
    {
        out.rc = -1;
        out.error = "massdns failed for " + root + ": " + massdns.error;
        return out;
    }

    ProcessResult processed = deal_output(
        root,
        output_paths,
        profile,
        IpBlacklist(opt_.ip_blacklist.begin(), opt_.ip_blacklist.end()),
        static_cast<uint64_t>(opt_.ip_appear_maximum));
    if (processed.rc != 0)
    {
        out.rc = -1;
        out.error = std::move(processed.error);
        return out;
    }
    out.result = std::move(processed.result);

    if (opt_.delete_dict)
    {
        remove_file(dict_path);
        if (ns_path != opt_.resolvers_path) remove_file(ns_path);
    }
    if (opt_.delete_result)
    {
        for (const auto &p: output_paths) remove_file(p);
    }

    const double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    spdlog::warn(
        "brute takes {:.1f} seconds, found {} subdomains of {}",
        elapsed,
        out.result.subdomains.size(),
        root);
    spdlog::debug("found subdomains of {}: {}", root, fmt::join(out.result.subdomains, ", "));
    return out;
}

static void merge_into(DomainResult &into, DomainResult &&from)
{
    for (auto &name: from.subdomains)
    {
        auto node = from.infos.extract(name);
        if (node.empty()) continue;
        if (into.infos.insert_or_assign(name, std::move(node.mapped())).second)
        {
            into.subdomains.push_back(name);
        }
    }
}

RunStatus Brute::run(const std::vector<std::string> &domains)
{
    spdlog::info("start running brute module");
    for (const auto &domain: domains)
    {
        DomainResult merged{};
        merged.domain = domain;
        const int base_depth = label_depth(domain);

        // (template root, layer); layer 0 is the domain itself
        std::deque<std::pair<std::string, int>> work{{domain, 0}};
        std::unordered_set<std::string> scheduled{domain};
        bool failed = false;
        while (!work.empty())
        {
            auto [root, layer] = std::move(work.front());
            work.pop_front();
            if (opt_.recursive)
            {
                spdlog::info("start recursively brute the {} layer subdomain of {}", layer + 1, root);
            }

            PipelineOutcome outcome = brute_domain(domain, root, layer);
            if (outcome.aborted) return RunStatus::Aborted;
            if (outcome.rc != 0)
            {
                spdlog::error("{}", outcome.error);
                if (layer == 0)
                {
                    failed = true;
                    break;
                }
                continue;
            }

            if (opt_.recursive)
            {
                // a name n labels below the target is the root of layer n
                for (const auto &name: outcome.result.subdomains)
                {
                    const int next_layer = label_depth(name) - base_depth;
                    if (next_layer < 1 || next_layer >= opt_.depth) continue;
                    if (scheduled.insert(name).second) work.emplace_back(name, next_layer);
                }
            }
            merge_into(merged, std::move(outcome.result));
        }

        if (failed)
        {
            spdlog::error("brute {} failed, no result reported", domain);
            continue;
        }
        spdlog::info("finished brute {}", domain);
        if (opt_.do_export && hooks_.export_result) hooks_.export_result(merged);
        results_.push_back(std::move(merged));
    }
    return RunStatus::Completed;
}
} // namespace sb
