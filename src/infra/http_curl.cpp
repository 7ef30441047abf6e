#include "fq/http.hpp"

#include <memory>
#include <mutex>
#include <string>

#include <curl/curl.h>

namespace fq
{
namespace
{
struct EasyDeleter
{
    void operator()(CURL *h) const { curl_easy_cleanup(h); }
};

using EasyPtr = std::unique_ptr<CURL, EasyDeleter>;

size_t append_body(char *data, size_t size, size_t nmemb, void *userp)
{
    auto *body = static_cast<std::string *>(userp);
    body->append(data, size * nmemb);
    return size * nmemb;
}

bool is_body_error(CURLcode cc)
{
    switch (cc)
    {
        case CURLE_PARTIAL_FILE:
        case CURLE_RECV_ERROR:
        case CURLE_WRITE_ERROR:
        case CURLE_BAD_CONTENT_ENCODING:
        case CURLE_OPERATION_TIMEDOUT:
            return true;
        default:
            return false;
    }
}

std::once_flag g_curl_init;
} // namespace

CurlHttpClient::CurlHttpClient()
{
    // curl_global_init is not thread-safe on older libcurl
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

CurlHttpClient::~CurlHttpClient() = default;

HttpResult CurlHttpClient::get(const std::string &url,
                               std::chrono::milliseconds timeout)
{
    HttpResult out{};

    EasyPtr h(curl_easy_init());
    if (!h)
    {
        out.rc = -1;
        out.error = "curl_easy_init failed";
        return out;
    }

    char errbuf[CURL_ERROR_SIZE]{};
    curl_easy_setopt(h.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(h.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(h.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, append_body);
    curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &out.body);
    if (timeout.count() > 0)
    {
        curl_easy_setopt(h.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    }

    const CURLcode cc = curl_easy_perform(h.get());
    curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &out.status);
    if (cc != CURLE_OK)
    {
        out.rc = -1;
        out.kind = out.status > 0 && is_body_error(cc) ? HttpErrorKind::BodyRead
                                                      : HttpErrorKind::Transport;
        out.error = errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(cc));
        out.body.clear();
        return out;
    }

    out.rc = 0;
    return out;
}
} // namespace fq
