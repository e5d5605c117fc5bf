#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace sb {

class RegexError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Enumerates every string matched by a regular expression.
//
// Supported: literals, escapes (\d \w \s and escaped metacharacters), '.',
// [...] classes with ranges and negation, (...) and (?:...) groups, '|',
// and the quantifiers ? * + {n} {n,} {n,m}. Unbounded repetition stops at
// kRepeatLimit. Anchors ^ and $ are accepted and ignored.
class RegexExpander {
public:
    static constexpr int kRepeatLimit = 100;

    // Throws RegexError on syntax it cannot parse.
    explicit RegexExpander(const std::string& pattern);
    ~RegexExpander();

    RegexExpander(const RegexExpander&) = delete;
    RegexExpander& operator=(const RegexExpander&) = delete;

    // Size of the language; saturates at UINT64_MAX.
    uint64_t count() const;

    // Calls sink once per generated string, shortest repetitions first.
    void generate(const std::function<void(const std::string&)>& sink) const;

    const std::string& pattern() const { return pattern_; }

private:
    struct Node;
    using Sequence = std::vector<Node>;
    class Parser;

    std::string pattern_;
    std::vector<Sequence> alternatives_;
};

} // namespace sb
