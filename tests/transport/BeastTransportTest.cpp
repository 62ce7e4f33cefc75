#include "reqkit/AnyRequest.hpp"
#include "reqkit/transport/BeastTransport.hpp"
#include <gtest/gtest.h>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace reqkit;
using namespace std::chrono_literals;
namespace p = reqkit::params;

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace {

using ServerRequest = http::request<http::string_body>;
using ServerResponse = http::response<http::string_body>;
using Handler = std::function<ServerResponse(const ServerRequest&)>;

// Blocking HTTP/1.1 server on 127.0.0.1 that answers `connections` requests, one per connection.
class LoopbackServer {
public:
    LoopbackServer(int connections, Handler handler)
        : acceptor_(ioc_, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0))
        , handler_(std::move(handler)) {
        port_ = acceptor_.local_endpoint().port();
        thread_ = std::thread([this, connections]{
            for (int i = 0; i < connections; ++i) serveOne();
        });
    }

    ~LoopbackServer() { thread_.join(); }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

    std::vector<ServerRequest> received() {
        std::lock_guard<std::mutex> lk(mx_);
        return received_;
    }

private:
    void serveOne() {
        beast::error_code ec;
        tcp::socket sock(ioc_);
        acceptor_.accept(sock, ec);
        if (ec) return;

        beast::flat_buffer buf;
        ServerRequest req;
        http::read(sock, buf, req, ec);
        if (ec) return;
        {
            std::lock_guard<std::mutex> lk(mx_);
            received_.push_back(req);
        }

        ServerResponse res = handler_(req);
        res.version(11);
        res.keep_alive(false);
        res.prepare_payload();
        http::write(sock, res, ec);
        sock.shutdown(tcp::socket::shutdown_send, ec);
    }

    net::io_context ioc_;
    tcp::acceptor acceptor_;
    Handler handler_;
    unsigned short port_{0};
    std::thread thread_;
    std::mutex mx_;
    std::vector<ServerRequest> received_;
};

std::string str(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

ServerResponse reply(http::status status, std::string body) {
    ServerResponse res{status, 11};
    res.set(http::field::content_type, "application/json");
    res.body() = std::move(body);
    return res;
}

// Waits for the one result a single call produces.
struct Outcome {
    std::mutex mx;
    std::condition_variable cv;
    bool done = false;
    int status = 0;
    std::string body;
    std::optional<Error> error;

    template <typename T>
    AnyRequest<T> attach(const AnyRequest<T>& req) {
        return req
            .onData([this](const std::string& b){ std::lock_guard<std::mutex> lk(mx); body = b; })
            .onStatusCode([this](int s){ finish([&]{ status = s; }); })
            .onError([this](const Error& e){ finish([&]{ error = e; }); });
    }

    template <typename Fn>
    void finish(Fn fn) {
        std::lock_guard<std::mutex> lk(mx);
        fn();
        done = true;
        cv.notify_all();
    }

    bool wait(std::chrono::milliseconds limit = 5000ms) {
        std::unique_lock<std::mutex> lk(mx);
        return cv.wait_for(lk, limit, [this]{ return done; });
    }
};

} // namespace

TEST(BeastTransportTest, RoundTripsMethodTargetHeadersAndBody) {
    LoopbackServer server(1, [](const ServerRequest& req){
        return reply(http::status::created, "{\"echo\":\"" + req.body() + "\"}");
    });

    Outcome out;
    util::Config cfg;
    cfg.userAgent = "reqkit-test/1";
    Client client(cfg);

    auto req = out.attach(Request{
        p::url(server.url("/items")),
        p::method(Method::Put),
        p::query("tag", "a b"),
        p::header("X-Dup", "first"),
        p::header("X-Dup", "second"),
        p::contentType("text/plain"),
        p::body("hello"),
        p::sessionHeader("X-Session", "s"),
    });
    req.call(client);
    ASSERT_TRUE(out.wait());

    EXPECT_FALSE(out.error.has_value());
    EXPECT_EQ(out.status, 201);
    EXPECT_EQ(out.body, "{\"echo\":\"hello\"}");

    auto seen = server.received();
    ASSERT_EQ(seen.size(), 1u);
    const auto& r = seen[0];
    EXPECT_EQ(r.method(), http::verb::put);
    EXPECT_EQ(str(r.target()), "/items?tag=a%20b");
    EXPECT_EQ(str(r[http::field::user_agent]), "reqkit-test/1");
    EXPECT_EQ(str(r["X-Dup"]), "second");
    EXPECT_EQ(str(r["X-Session"]), "s");
    EXPECT_EQ(str(r[http::field::content_type]), "text/plain");
    EXPECT_EQ(r.body(), "hello");
}

TEST(BeastTransportTest, FollowsRedirectsWhenAsked) {
    LoopbackServer server(2, [](const ServerRequest& req){
        if (req.target() == "/old") {
            ServerResponse res{http::status::found, 11};
            res.set(http::field::location, "/new");
            return res;
        }
        return reply(http::status::ok, "moved here");
    });

    Outcome out;
    Client client;
    out.attach(Request{p::url(server.url("/old")), p::followRedirects(true)}).call(client);
    ASSERT_TRUE(out.wait());

    EXPECT_EQ(out.status, 200);
    EXPECT_EQ(out.body, "moved here");
    auto seen = server.received();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(str(seen[1].target()), "/new");
}

TEST(BeastTransportTest, RedirectReturnedAsIsByDefault) {
    LoopbackServer server(1, [](const ServerRequest&){
        ServerResponse res{http::status::moved_permanently, 11};
        res.set(http::field::location, "/elsewhere");
        return res;
    });

    Outcome out;
    Client client;
    out.attach(Request{p::url(server.url("/here"))}).call(client);
    ASSERT_TRUE(out.wait());
    EXPECT_EQ(out.status, 301);
}

TEST(BeastTransportTest, ConnectionRefusedIsTransportError) {
    // Bind then close to get a port nobody listens on.
    unsigned short port = 0;
    {
        net::io_context ioc;
        tcp::acceptor a(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
        port = a.local_endpoint().port();
    }

    Outcome out;
    Client client;
    out.attach(Request{p::url("http://127.0.0.1:" + std::to_string(port) + "/")}).call(client);
    ASSERT_TRUE(out.wait());

    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->kind, ErrorKind::Transport);
    EXPECT_EQ(out.error->message.rfind("connect:", 0), 0u);
    EXPECT_EQ(out.status, 0);
}

TEST(BeastTransportTest, SessionTimeoutIsTransportError) {
    LoopbackServer server(1, [](const ServerRequest&){
        std::this_thread::sleep_for(400ms);
        return reply(http::status::ok, "too late");
    });

    Outcome out;
    Client client;
    out.attach(Request{p::url(server.url("/slow")), p::timeout(100ms)}).call(client);
    ASSERT_TRUE(out.wait());

    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ(out.error->kind, ErrorKind::Transport);
    EXPECT_NE(out.error->message.find("timed out"), std::string::npos);
}

TEST(BeastTransportTest, RejectsNonHttpTargetWithoutThrowing) {
    net::io_context ioc;
    BeastTransport transport(ioc, util::Config{});
    std::optional<Result<Response>> got;
    RequestDescriptor d;
    d.target = "mailto:someone@example.com";
    transport.perform(d, SessionConfig{}, [&](Result<Response> r){ got = std::move(r); });
    ASSERT_TRUE(got.has_value());
    ASSERT_FALSE(*got);
    EXPECT_EQ(got->error().kind, ErrorKind::Transport);
}
