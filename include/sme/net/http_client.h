#pragma once

#include <sme/core/types.h>

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace sme::net {

struct Header {
    std::string name;
    std::string value;
};

struct HttpResponse {
    long status = 0;
    std::string body;

    bool ok() const noexcept { return status >= 200 && status < 300; }
};

struct HttpClientConfig {
    std::chrono::milliseconds timeout{30000};
    bool verifyTls = true;
    std::string userAgent = "sme/1.0";
};

/**
 * Blocking JSON-over-HTTP transport used by the external-service clients.
 *
 * Transport failures are returned as errors; any HTTP status is returned as a response and
 * classified by the caller (see statusToError).
 */
class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    virtual Result<HttpResponse> get(const std::string& url, const std::vector<Header>& headers) = 0;

    virtual Result<HttpResponse> post(const std::string& url, const std::string& body,
                                      const std::vector<Header>& headers) = 0;
};

// libcurl easy-handle implementation; safe to call from several threads
class CurlHttpClient final : public IHttpClient {
public:
    explicit CurlHttpClient(HttpClientConfig config = {});

    Result<HttpResponse> get(const std::string& url, const std::vector<Header>& headers) override;

    Result<HttpResponse> post(const std::string& url, const std::string& body,
                              const std::vector<Header>& headers) override;

private:
    Result<HttpResponse> perform(const std::string& url, const std::string* body,
                                 const std::vector<Header>& headers);

    HttpClientConfig config_;
};

// Non-2xx status to error: 429/5xx ServiceUnavailable, 401/403 PermissionDenied,
// 404 NotFound, other 4xx InvalidArgument
Error statusToError(const HttpResponse& response, std::string_view where);

std::shared_ptr<IHttpClient> createHttpClient(HttpClientConfig config = {});

} // namespace sme::net
