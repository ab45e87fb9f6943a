#include "http_client.hpp"
#include <glib.h>
#include <sstream>

namespace Shio {

static std::string escape_component(const std::string& value) {
    g_autofree gchar* escaped = g_uri_escape_string(value.c_str(), nullptr, FALSE);
    return escaped ? escaped : "";
}

std::string HttpRequest::full_url() const {
    if (query.empty()) {
        return url;
    }

    std::ostringstream oss;
    oss << url << (url.find('?') == std::string::npos ? '?' : '&');

    bool first = true;
    for (const auto& [key, value] : query) {
        if (!first) oss << "&";
        first = false;
        oss << escape_component(key) << "=" << escape_component(value);
    }
    return oss.str();
}

HttpClient::HttpClient(unsigned int timeout_seconds) {
    session_ = soup_session_new();
    g_object_set(session_, "timeout", timeout_seconds, nullptr);
}

HttpClient::~HttpClient() {
    if (session_) {
        soup_session_abort(session_);
        g_object_unref(session_);
    }
}

void HttpClient::fetch(const HttpRequest& request, GCancellable* cancellable,
                       FetchCallback callback) {
    std::string url = request.full_url();
    SoupMessage* msg = soup_message_new(request.method.c_str(), url.c_str());
    if (!msg) {
        callback(std::nullopt, Error::transport_error(TransportFailure::InvalidRequest,
                                                      "Invalid URL: " + request.url));
        return;
    }

    SoupMessageHeaders* headers = soup_message_get_request_headers(msg);
    for (const auto& [name, value] : request.headers) {
        soup_message_headers_replace(headers, name.c_str(), value.c_str());
    }

    g_debug("[Http] %s %s", request.method.c_str(), request.url.c_str());

    struct RequestData {
        FetchCallback callback;
        SoupMessage* msg;
        std::string url;
    };
    auto* data = new RequestData{std::move(callback), msg, request.url};

    soup_session_send_and_read_async(
        session_,
        msg,
        G_PRIORITY_DEFAULT,
        cancellable,
        [](GObject* source, GAsyncResult* result, gpointer user_data) {
            auto* data = static_cast<RequestData*>(user_data);
            g_autoptr(GError) error = nullptr;

            GBytes* bytes = soup_session_send_and_read_finish(
                SOUP_SESSION(source), result, &error);

            if (error) {
                TransportFailure failure = TransportFailure::Connection;
                if (g_error_matches(error, G_IO_ERROR, G_IO_ERROR_CANCELLED)) {
                    failure = TransportFailure::Cancelled;
                } else if (g_error_matches(error, G_IO_ERROR, G_IO_ERROR_TIMED_OUT)) {
                    failure = TransportFailure::Timeout;
                } else {
                    g_info("[Http] Request to %s failed: %s", data->url.c_str(), error->message);
                }
                data->callback(std::nullopt, Error::transport_error(failure, error->message));
                g_object_unref(data->msg);
                delete data;
                return;
            }

            guint status = soup_message_get_status(data->msg);

            gsize size = 0;
            const char* body_data = static_cast<const char*>(g_bytes_get_data(bytes, &size));
            HttpResponse response;
            response.status = status;
            if (body_data) {
                response.body.assign(body_data, size);
            }
            g_bytes_unref(bytes);

            if (status < 200 || status >= 300) {
                g_info("[Http] %s returned HTTP %u", data->url.c_str(), status);
                data->callback(std::nullopt,
                               Error::transport_error(TransportFailure::BadStatus,
                                                      "HTTP error: " + std::to_string(status),
                                                      status));
            } else {
                data->callback(std::move(response), Error{});
            }

            g_object_unref(data->msg);
            delete data;
        },
        data
    );
}

} // namespace Shio
