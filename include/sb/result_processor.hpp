#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "sb/classifier.hpp"
#include "sb/model.hpp"

namespace sb
{
// Parses one massdns JSON line. Missing `data` or `data.answers` yields a
// record without answers. Returns false and fills `error` when the line is not
// JSON or lacks `name`/`status`, or an answer is malformed.
bool parse_resolution_line(std::string_view line,
                           ResolutionRecord &out,
                           std::string &error);

struct StatResult
{
    int rc{};                 // 0 on success, -1 when a shard cannot be read
    std::string error;
    IpFrequencyTable times;
};

// Pass 1: occurrences of every A address in NOERROR records across all shards.
StatResult stat_ip_times(const std::vector<std::string> &result_paths);

struct ClassifyContext
{
    const IpFrequencyTable &times;
    const WildcardProfile &profile;
    const IpBlacklist &blacklist;
    uint64_t ip_appear_maximum{};
};

// Adds `record` to `result` when it has at least one A answer and all of them
// pass is_valid_subdomain. Returns whether the name was accepted.
bool gen_result_infos(const ResolutionRecord &record,
                      const ClassifyContext &ctx,
                      DomainResult &result);

struct ProcessResult
{
    int rc{};
    std::string error;
    DomainResult result;
    size_t skipped_lines{};   // malformed lines skipped while classifying
};

// Both passes over the shards produced for one domain.
ProcessResult deal_output(const std::string &domain,
                          const std::vector<std::string> &output_paths,
                          const WildcardProfile &profile,
                          const IpBlacklist &blacklist,
                          uint64_t ip_appear_maximum);
} // namespace sb
