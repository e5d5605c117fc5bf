#include "sb/similarity.hpp"

#include <cctype>
#include <cmath>
#include <sstream>
#include <vector>

#include "sb/netutil.hpp"

namespace sb
{
static std::vector<std::string> tag_tokens(const std::string &html)
{
    std::vector<std::string> tokens;
    size_t i = 0;
    while ((i = html.find('<', i)) != std::string::npos)
    {
        ++i;
        std::string tok;
        if (i < html.size() && html[i] == '/')
        {
            tok.push_back('/');
            ++i;
        }
        while (i < html.size() && std::isalnum(static_cast<unsigned char>(html[i])))
        {
            tok.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(html[i]))));
            ++i;
        }
        if (!tok.empty() && tok != "/") tokens.push_back(std::move(tok));
    }
    return tokens;
}

static std::vector<std::string> word_tokens(const std::string &text)
{
    std::vector<std::string> tokens;
    std::istringstream is(text);
    std::string w;
    while (is >> w) tokens.push_back(to_lower(w));
    return tokens;
}

std::map<std::string, int> structure_features(const std::string &html,
                                              int dimension)
{
    std::vector<std::string> tokens = tag_tokens(html);
    if (tokens.empty()) tokens = word_tokens(html);

    std::map<std::string, int> features;
    const size_t n = dimension < 1 ? 1 : static_cast<size_t>(dimension);
    if (tokens.size() < n)
    {
        for (const auto &t: tokens) ++features[t];
        return features;
    }
    for (size_t i = 0; i + n <= tokens.size(); ++i)
    {
        std::string key = tokens[i];
        for (size_t k = 1; k < n; ++k) key += '>' + tokens[i + k];
        ++features[key];
    }
    return features;
}

double cosine_similarity(const std::map<std::string, int> &a,
                         const std::map<std::string, int> &b)
{
    if (a.empty() || b.empty()) return 0.0;
    double dot = 0.0;
    double na = 0.0;
    double nb = 0.0;
    for (const auto &[k, v]: a)
    {
        na += static_cast<double>(v) * v;
        if (auto it = b.find(k); it != b.end()) dot += static_cast<double>(v) * it->second;
    }
    for (const auto &[k, v]: b) nb += static_cast<double>(v) * v;
    return dot / (std::sqrt(na) * std::sqrt(nb));
}

bool is_similar(const std::string &a, const std::string &b, double threshold)
{
    if (a == b) return true;
    return cosine_similarity(structure_features(a), structure_features(b)) >= threshold;
}
} // namespace sb
