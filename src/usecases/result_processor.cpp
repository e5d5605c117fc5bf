#include "sb/result_processor.hpp"

#include <fstream>
#include <functional>

#include <nlohmann/json.hpp>

#include "sb/log.hpp"
#include "sb/netutil.hpp"

namespace sb
{
using json = nlohmann::json;

static bool read_ttl(const json &j, uint32_t &ttl)
{
    if (j.is_number_unsigned())
    {
        ttl = j.get<uint32_t>();
        return true;
    }
    if (j.is_number_integer() && j.get<int64_t>() >= 0)
    {
        ttl = static_cast<uint32_t>(j.get<int64_t>());
        return true;
    }
    return false;
}

static bool parse_answer(const json &j, Answer &out, std::string &error)
{
    if (!j.is_object())
    {
        error = "answer is not an object";
        return false;
    }
    const auto type = j.find("type");
    const auto name = j.find("name");
    const auto ttl = j.find("ttl");
    const auto data = j.find("data");
    if (type == j.end() || !type->is_string()
        || name == j.end() || !name->is_string()
        || data == j.end() || !data->is_string())
    {
        error = "answer lacks type/name/data";
        return false;
    }
    uint32_t ttl_value = 0;
    if (ttl == j.end() || !read_ttl(*ttl, ttl_value))
    {
        error = "answer ttl is not a non-negative integer";
        return false;
    }
    if (type->get<std::string>() == "A")
    {
        out = ARecord{
            strip_root_dot(name->get<std::string>()),
            ttl_value,
            data->get<std::string>()
        };
    }
    else
    {
        out = OtherRecord{
            type->get<std::string>(),
            strip_root_dot(name->get<std::string>()),
            ttl_value,
            data->get<std::string>()
        };
    }
    return true;
}

bool parse_resolution_line(std::string_view line,
                           ResolutionRecord &out,
                           std::string &error)
{
    const json j = json::parse(line.begin(), line.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object())
    {
        error = "not a JSON object";
        return false;
    }
    const auto name = j.find("name");
    const auto status = j.find("status");
    if (name == j.end() || !name->is_string()
        || status == j.end() || !status->is_string())
    {
        error = "record lacks name/status";
        return false;
    }

    out = ResolutionRecord{};
    out.name = strip_root_dot(name->get<std::string>());
    out.status = status->get<std::string>();
    if (const auto resolver = j.find("resolver");
        resolver != j.end() && resolver->is_string())
    {
        out.resolver = resolver->get<std::string>();
    }

    const auto data = j.find("data");
    if (data == j.end() || !data->is_object()) return true;
    const auto answers = data->find("answers");
    if (answers == data->end()) return true;
    if (!answers->is_array())
    {
        error = "data.answers is not an array";
        return false;
    }
    out.answers.reserve(answers->size());
    for (const auto &a: *answers)
    {
        Answer answer;
        if (!parse_answer(a, answer, error)) return false;
        out.answers.push_back(std::move(answer));
    }
    return true;
}

// Streams every parseable record of `path` into `fn`. Malformed lines are
// logged and counted in `skipped`.
static bool scan_shard(const std::string &path,
                       const std::function<void(const ResolutionRecord &)> &fn,
                       size_t &skipped,
                       std::string &error)
{
    std::ifstream in(path);
    if (!in)
    {
        error = "cannot open resolver output " + path;
        return false;
    }
    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line))
    {
        ++lineno;
        const std::string text = trim(line);
        if (text.empty()) continue;
        ResolutionRecord record;
        std::string why;
        if (!parse_resolution_line(text, record, why))
        {
            spdlog::error("error parsing {} line {}: {}; skip this line", path, lineno, why);
            ++skipped;
            continue;
        }
        fn(record);
    }
    return true;
}

StatResult stat_ip_times(const std::vector<std::string> &result_paths)
{
    spdlog::info("counting IP");
    StatResult out{};
    size_t skipped = 0;
    for (const auto &path: result_paths)
    {
        spdlog::debug("reading {}", path);
        const bool ok = scan_shard(
            path,
            [&](const ResolutionRecord &record)
            {
                if (record.status != "NOERROR") return;
                for (const auto &answer: record.answers)
                {
                    if (const auto *a = std::get_if<ARecord>(&answer))
                    {
                        ++out.times[a->address];
                    }
                }
            },
            skipped,
            out.error);
        if (!ok)
        {
            out.rc = -1;
            return out;
        }
    }
    return out;
}

bool gen_result_infos(const ResolutionRecord &record,
                      const ClassifyContext &ctx,
                      DomainResult &result)
{
    SubdomainInfo info{};
    info.resolver = record.resolver;
    bool have_a_record = false;
    bool all_valid = true;
    for (const auto &answer: record.answers)
    {
        const auto *a = std::get_if<ARecord>(&answer);
        if (!a)
        {
            spdlog::trace(
                "answer of {} is {} rather than A",
                record.name,
                std::get<OtherRecord>(answer).type);
            continue;
        }
        have_a_record = true;
        const auto found = ctx.times.find(a->address);
        const uint64_t times = found == ctx.times.end() ? 0 : found->second;
        const ValidationVerdict verdict = is_valid_subdomain(
            a->address,
            a->ttl,
            times,
            ctx.profile,
            ctx.blacklist,
            ctx.ip_appear_maximum);
        spdlog::trace(
            "{} of {} effective: {} reason: {}",
            a->address,
            record.name,
            verdict.valid,
            reason_str(verdict.reason));
        if (!verdict.valid)
        {
            all_valid = false;
            break;
        }
        info.ttls.push_back(a->ttl);
        info.cnames.push_back(a->name);
        info.ips.push_back(a->address);
        info.publics.push_back(ip_is_public(a->address));
        info.times.push_back(times);
        info.reason = verdict.reason;
    }
    if (!have_a_record)
    {
        spdlog::trace("no A record in the answers of {}", record.name);
        return false;
    }
    if (!all_valid) return false;

    if (result.infos.insert_or_assign(record.name, std::move(info)).second)
    {
        result.subdomains.push_back(record.name);
    }
    return true;
}

ProcessResult deal_output(const std::string &domain,
                          const std::vector<std::string> &output_paths,
                          const WildcardProfile &profile,
                          const IpBlacklist &blacklist,
                          uint64_t ip_appear_maximum)
{
    ProcessResult out{};
    out.result.domain = domain;

    StatResult stat = stat_ip_times(output_paths);
    if (stat.rc != 0)
    {
        out.rc = stat.rc;
        out.error = std::move(stat.error);
        return out;
    }

    spdlog::info("processing result");
    const ClassifyContext ctx{stat.times, profile, blacklist, ip_appear_maximum};
    for (const auto &path: output_paths)
    {
        spdlog::debug("processing {}", path);
        const bool ok = scan_shard(
            path,
            [&](const ResolutionRecord &record)
            {
                if (record.status != "NOERROR")
                {
                    spdlog::trace("found {}'s result {}", record.name, record.status);
                    return;
                }
                if (record.answers.empty())
                {
                    spdlog::trace("{} has no response", record.name);
                    return;
                }
                gen_result_infos(record, ctx, out.result);
            },
            out.skipped_lines,
            out.error);
        if (!ok)
        {
            out.rc = -1;
            out.result.subdomains.clear();
            out.result.infos.clear();
            return out;
        }
    }
    return out;
}
} // namespace sb
