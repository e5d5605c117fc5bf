#include "sb/regex_expand.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <optional>
#include <utility>

namespace sb {

struct RegexExpander::Node {
    enum class Kind { Chars, Group };

    Kind kind{Kind::Chars};
    std::string chars;            // Chars: candidate characters, one per output
    std::vector<Sequence> alts;   // Group: alternatives
    int min = 1;
    int max = 1;
};

namespace {

using CharSet = std::array<bool, 128>;

constexpr char kPrintableFirst = 32;
constexpr char kPrintableLast = 126;

uint64_t sat_add(uint64_t a, uint64_t b)
{
    const uint64_t limit = std::numeric_limits<uint64_t>::max();
    return a > limit - b ? limit : a + b;
}

uint64_t sat_mul(uint64_t a, uint64_t b)
{
    const uint64_t limit = std::numeric_limits<uint64_t>::max();
    if (a == 0 || b == 0) return 0;
    return a > limit / b ? limit : a * b;
}

void add_range(CharSet& set, char lo, char hi)
{
    for (int c = lo; c <= hi; ++c) set[static_cast<size_t>(c)] = true;
}

std::string to_chars(const CharSet& set)
{
    std::string out;
    for (size_t c = 0; c < set.size(); ++c)
        if (set[c]) out.push_back(static_cast<char>(c));
    return out;
}

CharSet complement(const CharSet& set)
{
    CharSet out{};
    for (int c = kPrintableFirst; c <= kPrintableLast; ++c)
        out[static_cast<size_t>(c)] = !set[static_cast<size_t>(c)];
    return out;
}

// \d \w \s and their negations; nullopt for other escapes.
std::optional<CharSet> class_escape(char c)
{
    CharSet set{};
    switch (c) {
    case 'd':
    case 'D':
        add_range(set, '0', '9');
        break;
    case 'w':
    case 'W':
        add_range(set, 'a', 'z');
        add_range(set, 'A', 'Z');
        add_range(set, '0', '9');
        set['_'] = true;
        break;
    case 's':
    case 'S':
        for (char ws : std::string(" \t\n\r\f\v")) set[static_cast<size_t>(ws)] = true;
        break;
    default:
        return std::nullopt;
    }
    if (c == 'D' || c == 'W' || c == 'S') return complement(set);
    return set;
}

char literal_escape(char c)
{
    switch (c) {
    case 't': return '\t';
    case 'n': return '\n';
    case 'r': return '\r';
    case 'f': return '\f';
    case 'v': return '\v';
    default: return c;
    }
}

} // namespace

class RegexExpander::Parser {
public:
    explicit Parser(const std::string& pattern) : p_(pattern) {}

    std::vector<Sequence> parse()
    {
        auto alts = parse_alternation();
        if (!eof()) fail("unbalanced ')'");
        return alts;
    }

private:
    bool eof() const { return pos_ >= p_.size(); }
    char peek() const { return p_[pos_]; }
    char next() { return p_[pos_++]; }

    [[noreturn]] void fail(const std::string& what) const
    {
        throw RegexError("regex '" + p_ + "' at " + std::to_string(pos_) + ": " + what);
    }

    std::vector<Sequence> parse_alternation()
    {
        std::vector<Sequence> alts;
        alts.push_back(parse_sequence());
        while (!eof() && peek() == '|') {
            ++pos_;
            alts.push_back(parse_sequence());
        }
        return alts;
    }

    Sequence parse_sequence()
    {
        Sequence seq;
        while (!eof() && peek() != '|' && peek() != ')') {
            std::optional<Node> atom = parse_atom();
            if (!atom) continue;
            parse_quantifier(*atom);
            seq.push_back(std::move(*atom));
        }
        return seq;
    }

    std::optional<Node> parse_atom()
    {
        Node node;
        const char c = next();
        switch (c) {
        case '^':
        case '$':
            return std::nullopt;
        case '(':
            if (!eof() && peek() == '?') {
                if (pos_ + 1 < p_.size() && p_[pos_ + 1] == ':')
                    pos_ += 2;
                else
                    fail("unsupported group syntax");
            }
            node.kind = Node::Kind::Group;
            node.alts = parse_alternation();
            if (eof() || next() != ')') fail("missing ')'");
            return node;
        case '[':
            node.chars = to_chars(parse_class());
            if (node.chars.empty()) fail("empty character class");
            return node;
        case '.': {
            CharSet all{};
            add_range(all, kPrintableFirst, kPrintableLast);
            node.chars = to_chars(all);
            return node;
        }
        case '\\': {
            if (eof()) fail("dangling escape");
            const char e = next();
            if (auto set = class_escape(e))
                node.chars = to_chars(*set);
            else
                node.chars = std::string(1, literal_escape(e));
            return node;
        }
        case '*':
        case '+':
        case '?':
        case '{':
            fail("nothing to repeat");
        default:
            if (static_cast<unsigned char>(c) >= 128) fail("non-ASCII character");
            node.chars = std::string(1, c);
            return node;
        }
    }

    CharSet parse_class()
    {
        CharSet set{};
        bool negate = false;
        if (!eof() && peek() == '^') {
            negate = true;
            ++pos_;
        }
        bool first = true;
        while (true) {
            if (eof()) fail("missing ']'");
            char c = next();
            if (c == ']' && !first) break;
            first = false;
            if (c == '\\') {
                if (eof()) fail("dangling escape");
                const char e = next();
                if (auto esc = class_escape(e)) {
                    for (size_t i = 0; i < set.size(); ++i) set[i] = set[i] || (*esc)[i];
                    continue;
                }
                c = literal_escape(e);
            }
            if (static_cast<unsigned char>(c) >= 128) fail("non-ASCII character");
            if (pos_ + 1 < p_.size() && peek() == '-' && p_[pos_ + 1] != ']') {
                ++pos_;
                char hi = next();
                if (hi == '\\') {
                    if (eof()) fail("dangling escape");
                    hi = literal_escape(next());
                }
                if (static_cast<unsigned char>(hi) >= 128 || hi < c) fail("bad character range");
                add_range(set, c, hi);
            } else {
                set[static_cast<size_t>(c)] = true;
            }
        }
        return negate ? complement(set) : set;
    }

    int parse_number()
    {
        const size_t start = pos_;
        long value = 0;
        while (!eof() && peek() >= '0' && peek() <= '9') {
            value = value * 10 + (next() - '0');
            if (value > kRepeatLimit * 100L) fail("repeat count too large");
        }
        if (pos_ == start) return -1;
        return static_cast<int>(value);
    }

    void parse_quantifier(Node& node)
    {
        if (eof()) return;
        switch (peek()) {
        case '?':
            node.min = 0;
            node.max = 1;
            break;
        case '*':
            node.min = 0;
            node.max = kRepeatLimit;
            break;
        case '+':
            node.min = 1;
            node.max = kRepeatLimit;
            break;
        case '{': {
            ++pos_;
            const int lo = parse_number();
            if (lo < 0) fail("bad repeat count");
            int hi = lo;
            if (!eof() && peek() == ',') {
                ++pos_;
                hi = parse_number();
                if (hi < 0) hi = std::max(lo, kRepeatLimit);
            }
            if (eof() || peek() != '}') fail("missing '}'");
            if (hi < lo) fail("min repeat greater than max repeat");
            node.min = lo;
            node.max = hi;
            break;
        }
        default:
            return;
        }
        ++pos_;
        // lazy / possessive markers do not change the language
        if (!eof() && (peek() == '?' || peek() == '+')) ++pos_;
        if (!eof() && (peek() == '?' || peek() == '*' || peek() == '+' || peek() == '{'))
            fail("multiple repeat");
    }

    const std::string& p_;
    size_t pos_ = 0;
};

RegexExpander::RegexExpander(const std::string& pattern)
    : pattern_(pattern)
{
    alternatives_ = Parser(pattern_).parse();
}

RegexExpander::~RegexExpander() = default;

namespace {

using Sink = std::function<void(std::string&)>;

template <typename NodeT>
uint64_t count_seq(const std::vector<NodeT>& seq);

template <typename NodeT>
uint64_t count_once(const NodeT& node)
{
    if (node.kind == NodeT::Kind::Chars) return node.chars.size();
    uint64_t total = 0;
    for (const auto& alt : node.alts) total = sat_add(total, count_seq(alt));
    return total;
}

template <typename NodeT>
uint64_t count_seq(const std::vector<NodeT>& seq)
{
    uint64_t total = 1;
    for (const auto& node : seq) {
        const uint64_t once = count_once(node);
        uint64_t reps = 0;
        uint64_t power = 1;
        for (int r = 0; r <= node.max; ++r) {
            if (r >= node.min) reps = sat_add(reps, power);
            power = sat_mul(power, once);
            if (power == 0 && r >= node.min) break;
        }
        total = sat_mul(total, reps);
    }
    return total;
}

template <typename NodeT>
void emit_seq(const std::vector<NodeT>& seq, size_t i, std::string& acc, const Sink& k);

template <typename NodeT>
void emit_once(const NodeT& node, std::string& acc, const Sink& k)
{
    if (node.kind == NodeT::Kind::Chars) {
        for (char c : node.chars) {
            acc.push_back(c);
            k(acc);
            acc.pop_back();
        }
        return;
    }
    for (const auto& alt : node.alts) emit_seq(alt, 0, acc, k);
}

template <typename NodeT>
void emit_repeated(const NodeT& node, int reps, std::string& acc, const Sink& k)
{
    if (reps == 0) {
        k(acc);
        return;
    }
    emit_once(node, acc, [&](std::string& a) { emit_repeated(node, reps - 1, a, k); });
}

template <typename NodeT>
void emit_seq(const std::vector<NodeT>& seq, size_t i, std::string& acc, const Sink& k)
{
    if (i == seq.size()) {
        k(acc);
        return;
    }
    const NodeT& node = seq[i];
    for (int reps = node.min; reps <= node.max; ++reps)
        emit_repeated(node, reps, acc, [&](std::string& a) { emit_seq(seq, i + 1, a, k); });
}

} // namespace

uint64_t RegexExpander::count() const
{
    uint64_t total = 0;
    for (const auto& alt : alternatives_) total = sat_add(total, count_seq(alt));
    return total;
}

void RegexExpander::generate(const std::function<void(const std::string&)>& sink) const
{
    std::string acc;
    const Sink emit = [&](std::string& s) { sink(s); };
    for (const auto& alt : alternatives_) emit_seq(alt, 0, acc, emit);
}

} // namespace sb
