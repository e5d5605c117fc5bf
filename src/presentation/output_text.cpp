#include "sb/output.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "sb/model.hpp"
#include "sb/options.hpp"

namespace sb {

template <typename T, typename F>
static void join_into(std::ostringstream &os, const std::vector<T> &items, F &&fmt)
{
    if (items.empty())
    {
        os << '-';
        return;
    }
    for (size_t i = 0; i < items.size(); ++i)
    {
        if (i) os << ',';
        fmt(os, items[i]);
    }
}

std::string format_result_text(const DomainResult &result)
{
    std::ostringstream os;
    os << "# " << result.domain << ": " << result.subdomains.size()
       << (result.subdomains.size() == 1 ? " subdomain" : " subdomains") << '\n';
    for (const auto &name : result.subdomains)
    {
        auto it = result.infos.find(name);
        if (it == result.infos.end()) continue;
        const SubdomainInfo &info = it->second;
        os << name;
        os << "  ips=";
        join_into(os, info.ips, [](auto &o, const std::string &ip) { o << ip; });
        os << "  ttl=";
        join_into(os, info.ttls, [](auto &o, uint32_t t) { o << t; });
        os << "  public=";
        join_into(os, info.publics, [](auto &o, bool p) { o << (p ? "yes" : "no"); });
        os << "  times=";
        join_into(os, info.times, [](auto &o, uint64_t t) { o << t; });
        os << "  cname=";
        join_into(os, info.cnames, [](auto &o, const std::string &c) { o << c; });
        os << "  resolver=" << (info.resolver.empty() ? "-" : info.resolver);
        os << "  reason=" << reason_str(info.reason) << '\n';
    }
    return os.str();
}

std::string result_export_path(const Options &opt, const std::string &domain)
{
    if (!opt.output_path.empty()) return opt.output_path;
    const char *ext = opt.format == OutputFormat::Json ? ".json" : ".txt";
    return (std::filesystem::path(opt.result_dir) / (domain + "_brute_result" + ext)).string();
}

bool export_result_file(const Options &opt,
                        const DomainResult &result,
                        std::string &path,
                        std::string &error)
{
    path = result_export_path(opt, result.domain);
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (!parent.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec)
        {
            error = "cannot create " + parent.string() + ": " + ec.message();
            return false;
        }
    }
    std::ofstream out(path, std::ios::trunc);
    if (!out)
    {
        error = "cannot open " + path;
        return false;
    }
    out << (opt.format == OutputFormat::Json ? build_result_json(result) + "\n"
                                             : format_result_text(result));
    out.flush();
    if (!out)
    {
        error = "cannot write " + path;
        return false;
    }
    return true;
}

} // namespace sb
