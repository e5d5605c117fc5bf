// Subdomain brute forcer (C++23)

#include <string>
#include <vector>

#include "sb/brute.hpp"
#include "sb/cli.hpp"
#include "sb/log.hpp"
#include "sb/options.hpp"

int main(int argc, char **argv)
{
    sb::Options opt;
    if (argc <= 1)
    {
        sb::print_usage(argv[0]);
        return 0;
    }
    if (!sb::parse_args(argc, argv, opt)) return 1;

    sb::init_logging(opt.log_level);

    const std::vector<std::string> domains = sb::load_domains(opt);
    std::string error;
    if (!sb::validate_options(opt, domains, error))
    {
        spdlog::critical("{}", error);
        return 1;
    }

    try
    {
        sb::Brute brute(opt, sb::default_hooks(opt));
        if (brute.run(domains) == sb::RunStatus::Aborted) return 0;
    }
    catch (const sb::FatalError &e)
    {
        spdlog::critical("{}", e.what());
        return 1;
    }
    return 0;
}
