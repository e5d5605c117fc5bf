#pragma once

#include <string>
#include <vector>

namespace sb
{
enum class OutputFormat { Text, Json };

enum class LogLevel { Trace, Debug, Info, Warn, Error };

struct Options
{
    // targets
    std::string target;            // single domain
    std::string targets_path;      // file with one domain per line
    // brute modes
    bool word = false;             // word mode (wordlist substitution)
    bool fuzz = false;             // fuzz mode (regex rule / fuzz wordlist)
    std::string wordlist = "data/subnames.txt";
    std::string nextlist = "data/subnames_next.txt"; // wordlist for layers >= 2
    std::string place;             // template with a single '*', e.g. m.*.d.com
    std::string rule;              // regex rule for fuzz mode
    std::string fuzzlist;          // wordlist for fuzz mode
    // recursion
    bool recursive = false;
    int depth = 2;                 // number of layers including the first
    // massdns
    std::string massdns_path = "massdns";
    int process = 1;               // massdns --processes
    int concurrent = 2000;         // massdns --hashmap-size
    int socket_count = 1;          // massdns --socket-count
    int resolve_count = 50;        // massdns --resolve-count
    std::string status_format = "ansi";
    bool quiet = false;
    // nameservers
    std::string resolvers_path;    // general nameserver file; overrides `nameservers`
    std::vector<std::string> nameservers = {
        "8.8.8.8", "8.8.4.4", "1.1.1.1", "1.0.0.1",
        "9.9.9.9", "149.112.112.112", "208.67.222.222", "208.67.220.220",
    };
    int timeout_ms = 2000;         // per-query timeout for detection/profiling
    // classification
    std::vector<std::string> ip_blacklist = {"0.0.0.0", "0.0.0.1"};
    int ip_appear_maximum = 100;   // reuse ceiling for a single address
    double similarity_threshold = 0.8;
    // wildcard collection
    double wildcard_ratio = 0.8;   // share of addresses seen >= 2 times
    int wildcard_window = 5;       // outcomes per stability check
    int wildcard_min_samples = 2;  // data iterations before convergence may fire
    // workflow
    bool check_dict = false;       // pause before massdns so the run can be aborted
    int check_seconds = 10;
    bool delete_dict = true;
    bool delete_result = true;
    std::string temp_dir = "results/temp";
    std::string result_dir = "results";
    // export
    bool do_export = true;
    OutputFormat format = OutputFormat::Text;
    std::string output_path;       // explicit export file (single target only)
    LogLevel log_level = LogLevel::Info;
};
} // namespace sb
