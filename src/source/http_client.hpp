#pragma once

#include "source_types.hpp"
#include <libsoup/soup.h>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace Shio {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::pair<std::string, std::string>> query;
    std::map<std::string, std::string> headers;

    /**
     * URL with the query parameters percent-encoded and appended
     */
    std::string full_url() const;
};

struct HttpResponse {
    unsigned int status = 0;
    std::string body;
};

using FetchCallback = ResultCallback<HttpResponse>;

/**
 * Outbound request capability. The only place network I/O happens.
 * Implementations never retry and never interpret payloads; non-2xx
 * responses are reported as BadStatus errors.
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * Issue a request. The callback is invoked exactly once on the
     * thread-default main context, also when the request is cancelled.
     * @param cancellable Optional; cancelling aborts the request
     */
    virtual void fetch(const HttpRequest& request, GCancellable* cancellable,
                       FetchCallback callback) = 0;
};

/**
 * libsoup-backed transport sharing one SoupSession across calls
 */
class HttpClient : public Transport {
public:
    explicit HttpClient(unsigned int timeout_seconds = 12);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    void fetch(const HttpRequest& request, GCancellable* cancellable,
               FetchCallback callback) override;

private:
    SoupSession* session_;
};

} // namespace Shio
