#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

#include "sb/rawdns.hpp"

namespace sb
{
using CandidateSet = std::unordered_set<std::string>;

// Rule cardinality and dictionary size above which an alert is logged.
inline constexpr uint64_t kDictionaryAlertSize = 10'000'000;

// Names sampled by check_random_subdomain.
inline constexpr size_t kSampleCount = 3;

// Only lowercase letters, digits, '.' and '-'.
bool is_subname(const std::string &word);

// Trims, lower-cases and strips one leading/trailing dot. Returns an empty
// string when the line is blank or carries characters outside is_subname.
std::string normalize_word(const std::string &line);

// Replaces the '*' in `place` with `word`.
std::string substitute(const std::string &place, const std::string &word);

// Word mode: one candidate per usable wordlist line.
CandidateSet gen_word_subdomains(const std::string &place,
                                 const std::string &wordlist_path);

// Fuzz mode: candidates from `fuzzlist` (may be empty) and from every
// alphanumeric string matched by `rule` (may be empty). Throws RegexError when
// the rule cannot be parsed.
CandidateSet gen_fuzz_subdomains(const std::string &place,
                                 const std::string &rule,
                                 const std::string &fuzzlist_path);

// Sanity resolve check on a few sampled names before the expensive bulk
// resolution. Returns the sampled names that are not valid hostnames or that
// did not resolve to an address.
std::vector<std::string> check_random_subdomain(const CandidateSet &subdomains,
                                                const ResolveFn &resolve);

// One name per line.
bool save_dictionary(const std::string &path, const CandidateSet &subdomains);
} // namespace sb
