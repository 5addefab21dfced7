#include <sme/core/format.h>
#include <sme/net/http_client.h>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace sme::net {

namespace {

std::once_flag g_curlInit;

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            err.code = ErrorCode::NetworkError;
            break;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            err.code = ErrorCode::ConfigurationError;
            break;
        default:
            err.code = ErrorCode::NetworkError;
            break;
    }
    return err;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr) {
        return 0;
    }
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

// Owns the easy handle and header list for one request
struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* headers = nullptr;

    ~CurlRequest() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

} // namespace

CurlHttpClient::CurlHttpClient(HttpClientConfig config) : config_(std::move(config)) {
    std::call_once(g_curlInit, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

Result<HttpResponse> CurlHttpClient::get(const std::string& url,
                                         const std::vector<Header>& headers) {
    return perform(url, nullptr, headers);
}

Result<HttpResponse> CurlHttpClient::post(const std::string& url, const std::string& body,
                                          const std::vector<Header>& headers) {
    return perform(url, &body, headers);
}

Result<HttpResponse> CurlHttpClient::perform(const std::string& url, const std::string* body,
                                             const std::vector<Header>& headers) {
    CurlRequest req;
    if (!req.curl) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    for (const auto& h : headers) {
        req.headers = curl_slist_append(req.headers, (h.name + ": " + h.value).c_str());
    }
    if (body) {
        req.headers = curl_slist_append(req.headers, "Content-Type: application/json");
    }
    req.headers = curl_slist_append(req.headers, "Accept: application/json");

    HttpResponse response;
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.headers);
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(req.curl, CURLOPT_USERAGENT, config_.userAgent.c_str());
    curl_easy_setopt(req.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.timeout.count()));
    curl_easy_setopt(req.curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(config_.timeout.count(), 30000)));
    curl_easy_setopt(req.curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(req.curl, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(req.curl, CURLOPT_SSL_VERIFYPEER, config_.verifyTls ? 1L : 0L);
    curl_easy_setopt(req.curl, CURLOPT_SSL_VERIFYHOST, config_.verifyTls ? 2L : 0L);
    if (body) {
        curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
        curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body->data());
        curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
    } else {
        curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    }

    CURLcode rc = curl_easy_perform(req.curl);
    if (rc != CURLE_OK) {
        return makeCurlError(rc, body ? "POST " + url : "GET " + url);
    }
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status);
    spdlog::trace("{} {} -> {}", body ? "POST" : "GET", url, response.status);
    return response;
}

Error statusToError(const HttpResponse& response, std::string_view where) {
    ErrorCode code = ErrorCode::InvalidArgument;
    if (response.status == 429 || response.status >= 500) {
        code = ErrorCode::ServiceUnavailable;
    } else if (response.status == 401 || response.status == 403) {
        code = ErrorCode::PermissionDenied;
    } else if (response.status == 404) {
        code = ErrorCode::NotFound;
    }
    std::string snippet = response.body.substr(0, std::min<size_t>(response.body.size(), 256));
    return Error{code, sme::format("{}: HTTP {} {}", where, response.status, snippet)};
}

std::shared_ptr<IHttpClient> createHttpClient(HttpClientConfig config) {
    return std::make_shared<CurlHttpClient>(std::move(config));
}

} // namespace sme::net
