#pragma once

#include <string>

namespace sb
{
struct HttpResponse
{
    int rc{};                 // 0 when a response arrived, -1 on transport error
    std::string error;
    long status{};
    std::string body;

    // A response counts as a success only below 400.
    bool ok() const { return rc == 0 && status > 0 && status < 400; }
};

// GET with redirects followed and TLS verification off; the body is capped
// at a few megabytes.
HttpResponse http_get(const std::string &url, int timeout_ms);
} // namespace sb
