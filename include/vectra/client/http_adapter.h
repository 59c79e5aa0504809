#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <vectra/core/types.h>

namespace vectra {

struct HttpHeader {
    std::string name;
    std::string value;
};

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    std::string body;
    std::vector<HttpHeader> headers;
    std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
    long status{0};
    std::string body;
};

// Blocking request/response exchange. A non-2xx status is a successful
// exchange here; only failures to complete it (connect, timeout, I/O) are
// errors, reported as NetworkError or Timeout.
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;
    virtual Result<HttpResponse> send(const HttpRequest& request) = 0;
};

std::shared_ptr<IHttpAdapter> makeCurlHttpAdapter();

} // namespace vectra
