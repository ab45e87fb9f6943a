#include <gtest/gtest.h>
#include "source/http_client.hpp"
#include "test_support.hpp"
#include <libsoup/soup.h>

using namespace ShioTest;
using Shio::Error;
using Shio::ErrorKind;
using Shio::HttpClient;
using Shio::HttpRequest;
using Shio::HttpResponse;
using Shio::TransportFailure;

static const char* VARIABLES = R"({"search":{"query":"one piece & co"},"translationType":"sub"})";

struct PendingFetch {
    bool done = false;
    int calls = 0;
    std::optional<HttpResponse> response;
    Error error;
};

class HttpClientTest : public ::testing::Test
{
protected:
    SoupServer* server = nullptr;
    std::string base_url;
    std::vector<SoupServerMessage*> held;
    int requests = 0;

    static void SetUpTestSuite()
    {
        // Keep loopback requests off any proxy configured in the environment
        g_setenv("no_proxy", "127.0.0.1,localhost", TRUE);
        g_setenv("NO_PROXY", "127.0.0.1,localhost", TRUE);
    }

    void SetUp() override
    {
        server = soup_server_new(nullptr, nullptr);
        soup_server_add_handler(server, nullptr, handle_request, this, nullptr);

        g_autoptr(GError) error = nullptr;
        ASSERT_TRUE(soup_server_listen_local(server, 0, SOUP_SERVER_LISTEN_IPV4_ONLY, &error))
            << (error ? error->message : "");

        GSList* uris = soup_server_get_uris(server);
        ASSERT_NE(uris, nullptr);
        base_url = "http://127.0.0.1:" + std::to_string(g_uri_get_port(static_cast<GUri*>(uris->data)));
        g_slist_free_full(uris, reinterpret_cast<GDestroyNotify>(g_uri_unref));
    }

    void TearDown() override
    {
        soup_server_disconnect(server);
        g_object_unref(server);
        for (SoupServerMessage* msg : held) {
            g_object_unref(msg);
        }
        drain();
    }

    static void handle_request(SoupServer*, SoupServerMessage* msg, const char* path,
                               GHashTable* query, gpointer user_data)
    {
        auto* self = static_cast<HttpClientTest*>(user_data);
        self->requests++;
        std::string route = path;

        if (route == "/ok") {
            reply(msg, 200, "hello");
        } else if (route == "/unavailable") {
            reply(msg, 503, "try later");
        } else if (route == "/echo") {
            const char* variables = query ? static_cast<const char*>(g_hash_table_lookup(query, "variables")) : nullptr;
            SoupMessageHeaders* headers = soup_server_message_get_request_headers(msg);
            const char* referer = soup_message_headers_get_one(headers, "Referer");
            const char* agent = soup_message_headers_get_one(headers, "User-Agent");
            std::string body = std::string(variables ? variables : "") + "\n" +
                               (referer ? referer : "") + "\n" + (agent ? agent : "");
            reply(msg, 200, body);
        } else if (route == "/hang") {
            g_object_ref(msg);
            self->held.push_back(msg);
            soup_server_message_pause(msg);
        } else {
            reply(msg, 404, "");
        }
    }

    static void reply(SoupServerMessage* msg, guint status, const std::string& body)
    {
        soup_server_message_set_status(msg, status, nullptr);
        soup_server_message_set_response(msg, "text/plain", SOUP_MEMORY_COPY,
                                         body.data(), body.size());
    }

    HttpRequest request(const std::string& path)
    {
        HttpRequest req;
        req.url = base_url + path;
        return req;
    }

    std::shared_ptr<PendingFetch> start(HttpClient& client, const HttpRequest& req,
                                        GCancellable* cancellable = nullptr)
    {
        auto pending = std::make_shared<PendingFetch>();
        client.fetch(req, cancellable,
            [pending](std::optional<HttpResponse> response, const Error& error) {
                pending->calls++;
                pending->done = true;
                pending->response = std::move(response);
                pending->error = error;
            });
        return pending;
    }

    std::shared_ptr<PendingFetch> fetch(HttpClient& client, const HttpRequest& req)
    {
        auto pending = start(client, req);
        EXPECT_TRUE(run_until([&] { return pending->done; }, 5000));
        return pending;
    }
};

TEST(HttpRequestTest, FullUrlEncodesQuery)
{
    HttpRequest req;
    req.url = "https://api.allanime.day/api";
    req.query = {{"variables", R"({"id":"a b&c"})"}, {"query", "x=1"}};

    EXPECT_EQ(req.full_url(),
              "https://api.allanime.day/api?variables=%7B%22id%22%3A%22a%20b%26c%22%7D&query=x%3D1");
}

TEST(HttpRequestTest, FullUrlAppendsToExistingQuery)
{
    HttpRequest req;
    req.url = "https://example.com/clock.json?id=abc";
    req.query = {{"page", "2"}};

    EXPECT_EQ(req.full_url(), "https://example.com/clock.json?id=abc&page=2");

    req.query.clear();
    EXPECT_EQ(req.full_url(), "https://example.com/clock.json?id=abc");
}

TEST_F(HttpClientTest, ReturnsBodyOnSuccess)
{
    HttpClient client(5);
    auto result = fetch(client, request("/ok"));

    ASSERT_TRUE(result->response.has_value()) << result->error.message;
    EXPECT_EQ(result->response->status, 200u);
    EXPECT_EQ(result->response->body, "hello");
    EXPECT_FALSE(result->error);
    EXPECT_EQ(result->calls, 1);
}

TEST_F(HttpClientTest, ServerErrorIsTransientBadStatus)
{
    HttpClient client(5);
    auto result = fetch(client, request("/unavailable"));

    EXPECT_FALSE(result->response.has_value());
    EXPECT_EQ(result->error.kind, ErrorKind::Transport);
    EXPECT_EQ(result->error.transport, TransportFailure::BadStatus);
    EXPECT_EQ(result->error.http_status, 503u);
    EXPECT_TRUE(result->error.is_transient());
}

TEST_F(HttpClientTest, NotFoundStatusIsNotTransient)
{
    HttpClient client(5);
    auto result = fetch(client, request("/nothing-here"));

    EXPECT_FALSE(result->response.has_value());
    EXPECT_EQ(result->error.transport, TransportFailure::BadStatus);
    EXPECT_EQ(result->error.http_status, 404u);
    EXPECT_FALSE(result->error.is_transient());
}

TEST_F(HttpClientTest, SendsQueryAndHeaders)
{
    HttpClient client(5);
    HttpRequest req = request("/echo");
    req.query = {{"variables", VARIABLES}};
    req.headers["Referer"] = "https://allmanga.to";
    req.headers["User-Agent"] = "shio-test/1.0";

    auto result = fetch(client, req);

    ASSERT_TRUE(result->response.has_value()) << result->error.message;
    EXPECT_EQ(result->response->body,
              std::string(VARIABLES) + "\nhttps://allmanga.to\nshio-test/1.0");
}

TEST_F(HttpClientTest, UnresponsiveServerTimesOut)
{
    HttpClient client(1);
    auto result = fetch(client, request("/hang"));

    ASSERT_TRUE(result->done);
    EXPECT_EQ(result->error.kind, ErrorKind::Transport);
    EXPECT_EQ(result->error.transport, TransportFailure::Timeout);
    EXPECT_TRUE(result->error.is_transient());
}

TEST_F(HttpClientTest, CancelReportsCancelled)
{
    HttpClient client(5);
    g_autoptr(GCancellable) cancellable = g_cancellable_new();

    auto pending = start(client, request("/hang"), cancellable);
    ASSERT_TRUE(run_until([&] { return requests == 1; }));
    EXPECT_FALSE(pending->done);

    g_cancellable_cancel(cancellable);
    ASSERT_TRUE(run_until([&] { return pending->done; }));

    EXPECT_TRUE(pending->error.is_cancelled());
    EXPECT_FALSE(pending->error.is_transient());
    EXPECT_EQ(pending->calls, 1);
}

TEST_F(HttpClientTest, RefusedConnectionIsTransient)
{
    HttpClient client(5);
    HttpRequest req;
    req.url = "http://127.0.0.1:1/";

    auto result = fetch(client, req);

    EXPECT_EQ(result->error.kind, ErrorKind::Transport);
    EXPECT_EQ(result->error.transport, TransportFailure::Connection);
    EXPECT_TRUE(result->error.is_transient());
}

TEST_F(HttpClientTest, InvalidUrlFailsImmediately)
{
    HttpClient client(5);
    HttpRequest req;
    req.url = "not a url";

    auto pending = start(client, req);

    ASSERT_TRUE(pending->done);
    EXPECT_EQ(pending->error.transport, TransportFailure::InvalidRequest);
    EXPECT_EQ(requests, 0);
}
