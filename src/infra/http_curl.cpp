#include "sb/http_fetch.hpp"

#include <curl/curl.h>

namespace sb
{
static constexpr size_t kMaxBody = 4 * 1024 * 1024;

static size_t write_body(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    auto *body = static_cast<std::string *>(userdata);
    const size_t n = size * nmemb;
    if (body->size() + n > kMaxBody) return 0; // aborts the transfer
    body->append(ptr, n);
    return n;
}

// curl_global_init is not thread-safe; run it once before the first handle.
static bool ensure_curl_global()
{
    static const bool ok = curl_global_init(CURL_GLOBAL_DEFAULT) == CURLE_OK;
    return ok;
}

HttpResponse http_get(const std::string &url, int timeout_ms)
{
    HttpResponse out{};
    if (!ensure_curl_global())
    {
        out.rc = -1;
        out.error = "curl_global_init failed";
        return out;
    }
    CURL *curl = curl_easy_init();
    if (!curl)
    {
        out.rc = -1;
        out.error = "curl_easy_init failed";
        return out;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "Mozilla/5.0 (X11; Linux x86_64)");

    const CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK)
    {
        out.rc = -1;
        out.error = curl_easy_strerror(res);
    }
    else
    {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.status);
    }
    curl_easy_cleanup(curl);
    return out;
}
} // namespace sb
