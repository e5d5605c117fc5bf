#include "sb/dictionary.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <spdlog/fmt/ranges.h>

#include "sb/log.hpp"
#include "sb/netutil.hpp"
#include "sb/regex_expand.hpp"

namespace sb
{
bool is_subname(const std::string &word)
{
    return std::ranges::all_of(
        word,
        [](unsigned char c)
        {
            return std::islower(c) || std::isdigit(c) || c == '.' || c == '-';
        });
}

std::string normalize_word(const std::string &line)
{
    std::string word = to_lower(trim(line));
    if (word.empty() || !is_subname(word)) return {};
    if (word.front() == '.') word.erase(0, 1);
    if (!word.empty() && word.back() == '.') word.pop_back();
    return word;
}

std::string substitute(const std::string &place, const std::string &word)
{
    std::string out = place;
    if (const auto pos = out.find('*'); pos != std::string::npos)
    {
        out.replace(pos, 1, word);
    }
    return out;
}

// Adds every usable line of `path` to `out`; returns false when the file
// cannot be opened.
static bool add_wordlist(const std::string &place,
                         const std::string &path,
                         CandidateSet &out)
{
    std::ifstream in(path);
    if (!in)
    {
        spdlog::error("cannot open wordlist {}", path);
        return false;
    }
    std::string line;
    while (std::getline(in, line))
    {
        std::string word = normalize_word(line);
        if (word.empty()) continue;
        out.insert(substitute(place, word));
    }
    return true;
}

CandidateSet gen_word_subdomains(const std::string &place,
                                 const std::string &wordlist_path)
{
    CandidateSet subdomains;
    add_wordlist(place, wordlist_path, subdomains);
    spdlog::debug(
        "the size of the dictionary generated by {} is {}",
        wordlist_path,
        subdomains.size());
    if (subdomains.empty())
    {
        spdlog::warn("please check the dictionary content of {}", wordlist_path);
    }
    return subdomains;
}

CandidateSet gen_fuzz_subdomains(const std::string &place,
                                 const std::string &rule,
                                 const std::string &fuzzlist_path)
{
    CandidateSet subdomains;
    if (!fuzzlist_path.empty())
    {
        subdomains = gen_word_subdomains(place, fuzzlist_path);
    }
    if (!rule.empty())
    {
        RegexExpander expander(rule);
        if (const uint64_t n = expander.count(); n > kDictionaryAlertSize)
        {
            spdlog::warn(
                "the dictionary generated by rule {} is too large: {} > {}",
                rule,
                n,
                kDictionaryAlertSize);
        }
        expander.generate(
            [&](const std::string &s)
            {
                std::string fuzz = to_lower(s);
                if (fuzz.empty()) return;
                const bool alnum = std::ranges::all_of(
                    fuzz,
                    [](unsigned char c) { return std::isalnum(c) != 0; });
                if (!alnum) return;
                subdomains.insert(substitute(place, fuzz));
            });
    }
    spdlog::debug("dictionary size based on fuzz mode: {}", subdomains.size());
    return subdomains;
}

std::vector<std::string> check_random_subdomain(const CandidateSet &subdomains,
                                                const ResolveFn &resolve)
{
    std::vector<std::string> bad;
    if (subdomains.empty())
    {
        spdlog::warn("the generated dictionary is empty");
        return bad;
    }
    size_t sampled = 0;
    for (const auto &name: subdomains)
    {
        if (sampled++ == kSampleCount) break;
        if (!is_valid_hostname(name))
        {
            spdlog::warn("sample candidate {} is not a valid hostname", name);
            bad.push_back(name);
            continue;
        }
        const DnsLookupResult r = resolve(name);
        if (r.rc != 0 || r.records.empty())
        {
            spdlog::warn(
                "sample candidate {} does not resolve: {}",
                name,
                r.rc != 0 ? r.error : std::string("no address"));
            bad.push_back(name);
            continue;
        }
        spdlog::info("sample candidate {} resolves to {}", name, fmt::join(r.records, ", "));
    }
    return bad;
}

bool save_dictionary(const std::string &path, const CandidateSet &subdomains)
{
    std::ofstream out(path, std::ios::trunc);
    if (!out) return false;
    for (const auto &name: subdomains) out << name << '\n';
    out.flush();
    return static_cast<bool>(out);
}
} // namespace sb
