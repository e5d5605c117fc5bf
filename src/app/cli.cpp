#include "sb/cli.hpp"

#include <algorithm>
#include <cctype>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>

using namespace std::string_view_literals;

namespace sb {

void print_usage(const char *prog)
{
    std::println("Subdomain brute forcer driving massdns");
    std::println("Usage: {} [options] (--target DOMAIN | --targets FILE)", prog);
    std::println("Targets:");
    std::println("  --target D         Domain to brute");
    std::println("  --targets FILE     File with one domain per line");
    std::println("Modes:");
    std::println("  --word             Word mode: substitute wordlist entries");
    std::println("  --wordlist FILE    Wordlist for the first layer (default: data/subnames.txt)");
    std::println("  --nextlist FILE    Wordlist for deeper layers (default: data/subnames_next.txt)");
    std::println("  --fuzz             Fuzz mode: regex rule and/or fuzz wordlist");
    std::println("  --place P          Template with one '*', e.g. m.*.example.com");
    std::println("  --rule R           Regex rule enumerated in fuzz mode, e.g. [a-z]{{2}}");
    std::println("  --fuzzlist FILE    Wordlist for fuzz mode");
    std::println("  --recursive        Brute the subdomains found, layer by layer");
    std::println("  --depth N          Layers including the first (default: 2)");
    std::println("massdns:");
    std::println("  --massdns PATH     massdns binary (default: massdns)");
    std::println("  --process N        massdns processes (default: 1)");
    std::println("  --concurrent N     massdns hashmap size (default: 2000)");
    std::println("  --resolvers FILE   Nameserver file used without wildcard");
    std::println("  --timeout MS       DNS/HTTP probe timeout in milliseconds (default: 2000)");
    std::println("Workflow:");
    std::println("  --check-dict       Pause before massdns so the run can be aborted");
    std::println("  --keep-dict        Keep the generated dictionary");
    std::println("  --keep-result      Keep the massdns output files");
    std::println("  --temp-dir DIR     Temporary files (default: results/temp)");
    std::println("  --result-dir DIR   Results and massdns.log (default: results)");
    std::println("Output:");
    std::println("  --format F         text|json (default: text)");
    std::println("  --output FILE      Export file (single target only)");
    std::println("  --no-export        Do not write result files");
    std::println("  -v, --verbose      Debug logging");
    std::println("  --quiet            Warnings only; also silences massdns");
    std::println("  -h, --help         Show this help");
    std::println("");
    std::println("Examples:");
    std::println("  {} --word --target example.com", prog);
    std::println("  {} --word --recursive --depth 3 --targets domains.txt", prog);
    std::println("  {} --fuzz --place m.*.example.com --rule '[a-z]' --target example.com", prog);
}

// Accepts both "--name VALUE" and "--name=VALUE".
static bool take_value(std::string_view a,
                       std::string_view name,
                       int &i,
                       int argc,
                       char **argv,
                       std::string &val)
{
    if (a == name)
    {
        if (i + 1 >= argc)
        {
            std::println("missing value for {}", name);
            return false;
        }
        val = argv[++i];
        return true;
    }
    if (a.size() > name.size() && a[name.size()] == '=')
    {
        val = std::string(a.substr(name.size() + 1));
        return true;
    }
    std::println("invalid {} usage", name);
    return false;
}

static bool take_int(std::string_view a,
                     std::string_view name,
                     int &i,
                     int argc,
                     char **argv,
                     int &out)
{
    std::string val;
    if (!take_value(a, name, i, argc, argv, val)) return false;
    try
    {
        size_t used = 0;
        out = std::stoi(val, &used);
        if (used != val.size()) throw std::invalid_argument(val);
    }
    catch (const std::exception &)
    {
        std::println("invalid {} value: {}", name, val);
        return false;
    }
    return true;
}

static bool is_option(std::string_view a, std::string_view name)
{
    return a == name || (a.rfind(name, 0) == 0 && a.size() > name.size() && a[name.size()] == '=');
}

bool parse_args(int argc, char **argv, Options &opt)
{
    for (int i = 1; i < argc; ++i)
    {
        std::string_view a = argv[i];
        if (a == "-h"sv || a == "--help"sv)
        {
            print_usage(argv[0]);
            return false;
        }
        if (a == "--word"sv)
        {
            opt.word = true;
        }
        else if (a == "--fuzz"sv)
        {
            opt.fuzz = true;
        }
        else if (a == "--recursive"sv)
        {
            opt.recursive = true;
        }
        else if (a == "--check-dict"sv)
        {
            opt.check_dict = true;
        }
        else if (a == "--keep-dict"sv)
        {
            opt.delete_dict = false;
        }
        else if (a == "--keep-result"sv)
        {
            opt.delete_result = false;
        }
        else if (a == "--no-export"sv)
        {
            opt.do_export = false;
        }
        else if (a == "-v"sv || a == "--verbose"sv)
        {
            opt.log_level = LogLevel::Debug;
        }
        else if (a == "--quiet"sv)
        {
            opt.quiet = true;
            opt.log_level = LogLevel::Warn;
        }
        else if (is_option(a, "--targets"sv))
        {
            if (!take_value(a, "--targets"sv, i, argc, argv, opt.targets_path)) return false;
        }
        else if (is_option(a, "--target"sv))
        {
            if (!take_value(a, "--target"sv, i, argc, argv, opt.target)) return false;
        }
        else if (is_option(a, "--wordlist"sv))
        {
            if (!take_value(a, "--wordlist"sv, i, argc, argv, opt.wordlist)) return false;
        }
        else if (is_option(a, "--nextlist"sv))
        {
            if (!take_value(a, "--nextlist"sv, i, argc, argv, opt.nextlist)) return false;
        }
        else if (is_option(a, "--place"sv))
        {
            if (!take_value(a, "--place"sv, i, argc, argv, opt.place)) return false;
        }
        else if (is_option(a, "--rule"sv))
        {
            if (!take_value(a, "--rule"sv, i, argc, argv, opt.rule)) return false;
        }
        else if (is_option(a, "--fuzzlist"sv))
        {
            if (!take_value(a, "--fuzzlist"sv, i, argc, argv, opt.fuzzlist)) return false;
        }
        else if (is_option(a, "--massdns"sv))
        {
            if (!take_value(a, "--massdns"sv, i, argc, argv, opt.massdns_path)) return false;
        }
        else if (is_option(a, "--resolvers"sv))
        {
            if (!take_value(a, "--resolvers"sv, i, argc, argv, opt.resolvers_path)) return false;
        }
        else if (is_option(a, "--temp-dir"sv))
        {
            if (!take_value(a, "--temp-dir"sv, i, argc, argv, opt.temp_dir)) return false;
        }
        else if (is_option(a, "--result-dir"sv))
        {
            if (!take_value(a, "--result-dir"sv, i, argc, argv, opt.result_dir)) return false;
        }
        else if (is_option(a, "--output"sv))
        {
            if (!take_value(a, "--output"sv, i, argc, argv, opt.output_path)) return false;
        }
        else if (is_option(a, "--depth"sv))
        {
            if (!take_int(a, "--depth"sv, i, argc, argv, opt.depth)) return false;
        }
        else if (is_option(a, "--process"sv))
        {
            if (!take_int(a, "--process"sv, i, argc, argv, opt.process)) return false;
        }
        else if (is_option(a, "--concurrent"sv))
        {
            if (!take_int(a, "--concurrent"sv, i, argc, argv, opt.concurrent)) return false;
        }
        else if (is_option(a, "--timeout"sv))
        {
            if (!take_int(a, "--timeout"sv, i, argc, argv, opt.timeout_ms)) return false;
            if (opt.timeout_ms < 0) opt.timeout_ms = 0;
        }
        else if (is_option(a, "--format"sv))
        {
            std::string val;
            if (!take_value(a, "--format"sv, i, argc, argv, val)) return false;
            std::ranges::transform(
                val,
                val.begin(),
                [](unsigned char c)
                {
                    return static_cast<char>(std::tolower(c));
                });
            if (val == "text" || val == "txt") opt.format = OutputFormat::Text;
            else if (val == "json") opt.format = OutputFormat::Json;
            else
            {
                std::println("unknown format: {}", val);
                return false;
            }
        }
        else if (!a.empty() && a[0] == '-')
        {
            std::println("unknown option: {}", a);
            return false;
        }
        else if (opt.target.empty())
        {
            opt.target = std::string(a);
        }
        else
        {
            std::println("unexpected argument: {}", a);
            return false;
        }
    }
    if (opt.target.empty() && opt.targets_path.empty())
    {
        std::println("no target specified (use --target or --targets)");
        return false;
    }
    return true;
}

} // namespace sb
