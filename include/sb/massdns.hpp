#pragma once

#include <functional>
#include <string>
#include <vector>

#include "sb/options.hpp"

namespace sb
{
struct MassdnsJob
{
    std::string massdns_path;
    std::string dict_path;
    std::string ns_path;
    std::string output_path;
    std::string log_path;
    bool quiet = false;
    int process = 1;
    int concurrent = 2000;
    int socket_count = 1;
    int resolve_count = 50;
    std::string status_format = "ansi";
};

struct MassdnsResult
{
    int rc{};              // 0 when massdns exited with status 0
    std::string error;
    int exit_code{-1};
    int signal{};
};

using BulkResolveFn = std::function<MassdnsResult(const MassdnsJob &)>;

MassdnsJob make_massdns_job(const Options &opt,
                            const std::string &dict_path,
                            const std::string &ns_path,
                            const std::string &output_path,
                            const std::string &log_path);

// argv for massdns, argv[0] included.
std::vector<std::string> build_massdns_args(const MassdnsJob &job);

// The files massdns writes: `output_path` for a single process, otherwise
// `output_path` + index for each process.
std::vector<std::string> massdns_output_paths(const std::string &output_path,
                                              int process);

// Spawns massdns and blocks until it exits.
MassdnsResult call_massdns(const MassdnsJob &job);
} // namespace sb
