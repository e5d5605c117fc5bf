#pragma once

#include <string>

namespace sb
{
struct Options;
struct DomainResult;

// One line per accepted subdomain, preceded by a summary line.
std::string format_result_text(const DomainResult &result);

// Single JSON document with the domain and every accepted subdomain.
std::string build_result_json(const DomainResult &result);

// `--output` when given, otherwise <result_dir>/<domain>_brute_result.<txt|json>.
std::string result_export_path(const Options &opt, const std::string &domain);

// Renders `result` in the configured format and writes it to
// result_export_path. On failure `error` is filled and false is returned.
bool export_result_file(const Options &opt,
                        const DomainResult &result,
                        std::string &path,
                        std::string &error);
} // namespace sb
