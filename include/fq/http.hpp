#pragma once

#include <chrono>
#include <string>

namespace fq {

enum class HttpErrorKind {
    None = 0,
    Transport, // no response (connect, TLS, timeout before headers)
    BodyRead,  // response started but the body could not be read
};

struct HttpResult {
    int rc{};          // 0 on success, -1 on error
    std::string error; // error message when rc != 0
    HttpErrorKind kind{HttpErrorKind::None};
    long status{};     // HTTP status code
    std::string body;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResult get(const std::string& url,
                           std::chrono::milliseconds timeout) = 0;
};

// Blocking GET through a libcurl easy handle.
class CurlHttpClient : public HttpClient {
public:
    CurlHttpClient();
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResult get(const std::string& url,
                   std::chrono::milliseconds timeout) override;
};

} // namespace fq
