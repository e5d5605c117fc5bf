#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

#include "sb/cancellation.hpp"
#include "sb/dictionary.hpp"
#include "sb/massdns.hpp"
#include "sb/model.hpp"
#include "sb/options.hpp"
#include "sb/wildcard.hpp"

namespace sb
{
// Unrecoverable condition: main logs it and exits with status 1.
class FatalError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

using ExportFn = std::function<void(const DomainResult &)>;

// Every outside collaborator of the orchestrator.
struct BruteHooks
{
    ResolveFn resolve;          // A through the system resolver
    PinnedResolveFn resolve_at; // A through the authoritative nameservers
    ResolveFn query_ns;         // NS through the system resolver
    FetchFn fetch;
    SimilarFn similar;
    BulkResolveFn bulk_resolve;
    ExportFn export_result;
};

// ldns, libcurl, massdns and the result file writer.
BruteHooks default_hooks(const Options &opt);

// `--target` plus the lines of `--targets`, lower-cased, without blanks,
// comments and duplicates.
std::vector<std::string> load_domains(const Options &opt);

// Upfront checks; on failure `error` says what is wrong and the run must not
// start.
bool validate_options(const Options &opt,
                      const std::vector<std::string> &domains,
                      std::string &error);

enum class RunStatus { Completed, Aborted };

struct PipelineOutcome
{
    int rc{};            // -1 when the pipeline stopped on a recoverable error
    std::string error;
    bool aborted{};      // operator interrupted the pause before massdns
    DomainResult result;
};

class Brute
{
public:
    Brute(Options opt, BruteHooks hooks);

    // Brutes every domain in turn, recursing when enabled, and hands the
    // merged result of each domain to the export hook.
    RunStatus run(const std::vector<std::string> &domains);

    // One pass of the pipeline with `*.<root>` (or the configured place) as
    // template. `depth` is the recursion layer, 0 for the target itself.
    PipelineOutcome brute_domain(const std::string &target,
                                 const std::string &root,
                                 int depth);

    // A records of the target's authoritative nameservers; empty on failure.
    std::vector<std::string> query_authoritative_ips(const std::string &domain);

    CandidateSet gen_brute_dict(const std::string &root, int depth) const;

    // Results merged per target domain, in the order they were brute-forced.
    const std::vector<DomainResult> &results() const { return results_; }

    Cancellation &cancellation() { return cancel_; }

private:
    std::string next_tag(const std::string &root);
    std::string nameservers_path(bool enable_wildcard,
                                 const std::vector<std::string> &ns_ips,
                                 const std::string &tag) const;
    bool check_dict();

    Options opt_;
    BruteHooks hooks_;
    Cancellation cancel_;
    std::vector<DomainResult> results_;
    int sequence_ = 0;
};
} // namespace sb
