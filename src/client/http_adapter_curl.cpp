/*
 * http_adapter_curl.cpp
 *
 * Notes
 * - Blocking request/response over the libcurl easy API, one easy handle per
 *   call so a single adapter can be shared by concurrent workers.
 * - Honors the per-request timeout; nothing is retried.
 * - HTTP status is returned to the caller; only transfer failures are errors.
 *
 * Build
 * - Linked via CURL::libcurl.
 * - Depends on spdlog for logging.
 */

#include <vectra/client/http_adapter.h>

#include <spdlog/spdlog.h>
#include <curl/curl.h>

#include <algorithm>
#include <mutex>
#include <string_view>

namespace vectra {

// Map CURLcode to Error
static Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OK:
            err.code = ErrorCode::Success;
            break;
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

// CURL write callback: append body bytes to a std::string
static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, total);
    return total;
}

// Helper to build curl_slist from headers
static curl_slist* build_header_list(const std::vector<HttpHeader>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string line = h.name;
        line.append(": ");
        line.append(h.value);
        list = curl_slist_append(list, line.c_str());
    }
    return list;
}

static void configure_common(CURL* curl, std::chrono::milliseconds timeout) {
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min<long>(timeout.count(), 30000)));
    // Worker threads must not receive SIGALRM from the resolver.
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
}

class CurlHttpAdapter final : public IHttpAdapter {
public:
    CurlHttpAdapter() {
        static std::once_flag once;
        std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
    }
    ~CurlHttpAdapter() override = default;

    Result<HttpResponse> send(const HttpRequest& request) override {
        CURL* curl = curl_easy_init();
        if (!curl) {
            return Error{ErrorCode::InternalError, "curl_easy_init failed"};
        }

        curl_slist* list = build_header_list(request.headers);
        HttpResponse response;

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        if (request.method == "POST") {
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        } else if (request.method == "GET") {
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
        } else {
            curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
            if (!request.body.empty()) {
                curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
                curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE,
                                 static_cast<long>(request.body.size()));
            }
        }
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, list);
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);

        configure_common(curl, request.timeout);

        CURLcode rc = curl_easy_perform(curl);
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);

        if (list)
            curl_slist_free_all(list);
        curl_easy_cleanup(curl);

        if (rc != CURLE_OK) {
            spdlog::debug("HTTP {} {} failed: {}", request.method, request.url,
                          curl_easy_strerror(rc));
            return makeCurlError(rc, request.method + " " + request.url);
        }
        spdlog::trace("HTTP {} {} -> {} ({} bytes)", request.method, request.url,
                      response.status, response.body.size());
        return response;
    }
};

std::shared_ptr<IHttpAdapter> makeCurlHttpAdapter() {
    return std::make_shared<CurlHttpAdapter>();
}

} // namespace vectra
