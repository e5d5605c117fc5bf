#include "sb/output.hpp"

#include <sstream>

#include "sb/json.hpp"
#include "sb/model.hpp"

namespace sb
{
template <typename T, typename F>
static void json_array(std::ostringstream &os, const std::vector<T> &items, F &&fmt)
{
    os << '[';
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i) os << ',';
        fmt(os, items[i]);
    }
    os << ']';
}

static void build_subdomain_json(std::ostringstream &os,
                                 const std::string &name,
                                 const SubdomainInfo &info)
{
    os << R"({"subdomain":)" << json_quote(name);
    os << R"(,"ips":)";
    json_array(os, info.ips, [](auto &o, const std::string &ip) { o << json_quote(ip); });
    os << R"(,"ttls":)";
    json_array(os, info.ttls, [](auto &o, uint32_t t) { o << t; });
    os << R"(,"public":)";
    json_array(os, info.publics, [](auto &o, bool p) { o << (p ? "true" : "false"); });
    os << R"(,"times":)";
    json_array(os, info.times, [](auto &o, uint64_t t) { o << t; });
    os << R"(,"cnames":)";
    json_array(os, info.cnames, [](auto &o, const std::string &c) { o << json_quote(c); });
    os << R"(,"resolver":)" << json_quote(info.resolver);
    os << R"(,"reason":)" << json_quote(reason_str(info.reason));
    os << '}';
}

std::string build_result_json(const DomainResult &result)
{
    std::ostringstream os;
    os << R"({"domain":)" << json_quote(result.domain);
    os << R"(,"count":)" << result.subdomains.size();
    os << R"(,"subdomains":[)";
    bool first = true;
    for (const auto &name: result.subdomains)
    {
        auto it = result.infos.find(name);
        if (it == result.infos.end()) continue;
        if (!first) os << ',';
        first = false;
        build_subdomain_json(os, name, it->second);
    }
    os << "]}";
    return os.str();
}
} // namespace sb
