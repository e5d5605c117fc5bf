#include "sb/massdns.hpp"

#include <cerrno>
#include <cstring>

#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>

#include <spdlog/fmt/ranges.h>

#include "sb/log.hpp"

extern char **environ;

namespace sb
{
MassdnsJob make_massdns_job(const Options &opt,
                            const std::string &dict_path,
                            const std::string &ns_path,
                            const std::string &output_path,
                            const std::string &log_path)
{
    MassdnsJob job{};
    job.massdns_path = opt.massdns_path;
    job.dict_path = dict_path;
    job.ns_path = ns_path;
    job.output_path = output_path;
    job.log_path = log_path;
    job.quiet = opt.quiet;
    job.process = opt.process;
    job.concurrent = opt.concurrent;
    job.socket_count = opt.socket_count;
    job.resolve_count = opt.resolve_count;
    job.status_format = opt.status_format;
    return job;
}

std::vector<std::string> build_massdns_args(const MassdnsJob &job)
{
    std::vector<std::string> args{job.massdns_path};
    if (job.quiet) args.emplace_back("--quiet");
    args.insert(
        args.end(),
        {
            "--status-format", job.status_format,
            "--processes", std::to_string(job.process),
            "--socket-count", std::to_string(job.socket_count),
            "--hashmap-size", std::to_string(job.concurrent),
            "--resolvers", job.ns_path,
            "--resolve-count", std::to_string(job.resolve_count),
            "--type", "A",
            "--flush",
            "--output", "J",
            "--outfile", job.output_path,
            "--root",
            "--error-log", job.log_path,
            job.dict_path,
            "--filter", "OK",
            "--sndbuf", "0",
            "--rcvbuf", "0",
        });
    return args;
}

std::vector<std::string> massdns_output_paths(const std::string &output_path,
                                              int process)
{
    if (process <= 1) return {output_path};
    std::vector<std::string> paths;
    paths.reserve(static_cast<size_t>(process));
    for (int i = 0; i < process; ++i) paths.push_back(output_path + std::to_string(i));
    return paths;
}

static pid_t waitpid_eintr(pid_t pid, int *status)
{
    for (;;)
    {
        const pid_t r = waitpid(pid, status, 0);
        if (r == -1 && errno == EINTR) continue;
        return r;
    }
}

MassdnsResult call_massdns(const MassdnsJob &job)
{
    MassdnsResult out{};
    std::vector<std::string> args = build_massdns_args(job);
    spdlog::debug("massdns command: {}", fmt::join(args, " "));

    std::vector<char *> argv;
    argv.reserve(args.size() + 1);
    for (auto &a: args) argv.push_back(a.data());
    argv.push_back(nullptr);

    pid_t pid = 0;
    const int rc = posix_spawnp(&pid, argv[0], nullptr, nullptr, argv.data(), environ);
    if (rc != 0)
    {
        out.rc = -1;
        out.error = "cannot start " + job.massdns_path + ": " + std::strerror(rc);
        return out;
    }

    int status = 0;
    if (waitpid_eintr(pid, &status) == -1)
    {
        out.rc = -1;
        out.error = std::string("waitpid failed: ") + std::strerror(errno);
        return out;
    }
    if (WIFEXITED(status))
    {
        out.exit_code = WEXITSTATUS(status);
        if (out.exit_code != 0)
        {
            out.rc = -1;
            out.error = "massdns exited with status " + std::to_string(out.exit_code);
        }
    }
    else if (WIFSIGNALED(status))
    {
        out.signal = WTERMSIG(status);
        out.rc = -1;
        out.error = "massdns killed by signal " + std::to_string(out.signal);
    }
    else
    {
        out.rc = -1;
        out.error = "massdns ended abnormally";
    }
    return out;
}
} // namespace sb
