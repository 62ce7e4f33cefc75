#include "reqkit/transport/BeastTransport.hpp"
#include "reqkit/util/Logger.hpp"
#include "reqkit/util/Url.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace reqkit {

namespace beast = boost::beast;
namespace http  = boost::beast::http;
namespace net   = boost::asio;
namespace ssl   = boost::asio::ssl;
using tcp       = boost::asio::ip::tcp;

namespace {

using SslStream = beast::ssl_stream<beast::tcp_stream>;
using Strand    = net::strand<net::io_context::executor_type>;
// Returns true when it took over the completion (redirect followed).
using Intercept = std::function<bool(const Response&, const ITransport::Completion&)>;

http::verb toVerb(Method m) {
  switch (m) {
    case Method::Get:     return http::verb::get;
    case Method::Head:    return http::verb::head;
    case Method::Post:    return http::verb::post;
    case Method::Put:     return http::verb::put;
    case Method::Delete:  return http::verb::delete_;
    case Method::Connect: return http::verb::connect;
    case Method::Options: return http::verb::options;
    case Method::Trace:   return http::verb::trace;
    case Method::Patch:   return http::verb::patch;
  }
  return http::verb::get;
}

inline std::string toStd(beast::string_view sv) {
  return std::string(sv.data(), sv.size());
}

http::request<http::string_body> buildRequest(const RequestDescriptor& rq,
                                              const SessionConfig& s,
                                              const util::Url& url,
                                              const std::string& userAgent)
{
  http::request<http::string_body> req{toVerb(rq.method), url.target, 11};
  req.set(http::field::host, url.hostHeader());
  req.set(http::field::user_agent, userAgent);

  // Session defaults first; the descriptor's headers override them, and
  // within the descriptor the last value for a name wins.
  for (const auto& h : s.defaultHeaders) req.set(h.first, h.second);
  for (const auto& h : rq.headers) req.set(h.first, h.second);

  if (s.cachePolicy == CachePolicy::ReloadIgnoringCache &&
      req.find(http::field::cache_control) == req.end()) {
    req.set(http::field::cache_control, "no-cache");
  }

  req.keep_alive(false);
  req.body() = rq.body;
  req.prepare_payload();
  return req;
}

bool isRedirect(int status) {
  return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

std::string resolveLocation(const util::Url& base, const std::string& loc) {
  if (util::parseUrl(loc)) return loc;
  if (loc.rfind("//", 0) == 0) return base.scheme + ":" + loc;

  const std::string origin = base.scheme + "://" + base.hostHeader();
  if (!loc.empty() && loc.front() == '/') return origin + loc;

  const std::string path = base.target.substr(0, base.target.find('?'));
  return origin + path.substr(0, path.rfind('/') + 1) + loc;
}

template <typename Stream>
class Exchange : public std::enable_shared_from_this<Exchange<Stream>> {
  static constexpr bool kTls = std::is_same_v<Stream, SslStream>;

public:
  template <typename... StreamArgs>
  Exchange(util::Url url,
           http::request<http::string_body> req,
           std::chrono::milliseconds timeout,
           std::size_t maxBody,
           ITransport::Completion done,
           Intercept intercept,
           Strand ex,
           StreamArgs&&... streamArgs)
    : url_(std::move(url))
    , req_(std::move(req))
    , timeout_(timeout)
    , done_(std::move(done))
    , intercept_(std::move(intercept))
    , resolver_(ex)
    , stream_(ex, std::forward<StreamArgs>(streamArgs)...)
  {
    parser_.body_limit(maxBody);
    if (req_.method() == http::verb::head) parser_.skip(true);
  }

  void run() {
    if constexpr (kTls) {
      if (!SSL_set_tlsext_host_name(stream_.native_handle(), url_.host.c_str())) {
        beast::error_code ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
        return fail(ec, "sni");
      }
      stream_.set_verify_callback(ssl::host_name_verification(url_.host));
    }
    resolver_.async_resolve(
      url_.host, std::to_string(url_.port),
      beast::bind_front_handler(&Exchange::onResolve, this->shared_from_this()));
  }

private:
  void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) return fail(ec, "resolve");

    // One deadline for connect + handshake + write + read.
    beast::get_lowest_layer(stream_).expires_after(timeout_);
    beast::get_lowest_layer(stream_).async_connect(
      results,
      beast::bind_front_handler(&Exchange::onConnect, this->shared_from_this()));
  }

  void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type) {
    if (ec) return fail(ec, "connect");

    if constexpr (kTls) {
      stream_.async_handshake(
        ssl::stream_base::client,
        beast::bind_front_handler(&Exchange::onHandshake, this->shared_from_this()));
    } else {
      write();
    }
  }

  void onHandshake(beast::error_code ec) {
    if (ec) return fail(ec, "handshake");
    write();
  }

  void write() {
    http::async_write(
      stream_, req_,
      beast::bind_front_handler(&Exchange::onWrite, this->shared_from_this()));
  }

  void onWrite(beast::error_code ec, std::size_t) {
    if (ec) return fail(ec, "write");
    http::async_read(
      stream_, buffer_, parser_,
      beast::bind_front_handler(&Exchange::onRead, this->shared_from_this()));
  }

  void onRead(beast::error_code ec, std::size_t) {
    if (ec) return fail(ec, "read");

    auto& res = parser_.get();
    Response out;
    out.status = static_cast<int>(res.result_int());
    for (const auto& f : res) {
      out.headers.emplace_back(toStd(f.name_string()), toStd(f.value()));
    }
    out.body = std::move(res.body());

    close();

    if (intercept_ && intercept_(out, done_)) return;
    deliver(std::move(out));
  }

  void close() {
    if constexpr (kTls) {
      // Peers rarely answer close_notify; eof / stream_truncated are expected here.
      auto self = this->shared_from_this();
      stream_.async_shutdown([self](beast::error_code ec) {
        util::logger().log(util::LogLevel::Trace, "tls shutdown", {{"ec", ec.message()}});
      });
    } else {
      beast::error_code ec;
      stream_.socket().shutdown(tcp::socket::shutdown_both, ec);
      if (ec && ec != beast::errc::not_connected) {
        util::logger().log(util::LogLevel::Debug, "socket shutdown", {{"ec", ec.message()}});
      }
    }
  }

  void fail(beast::error_code ec, const char* what) {
    const std::string reason = ec == beast::error::timeout ? std::string("timed out") : ec.message();
    deliver(Error{ErrorKind::Transport,
                  std::string(what) + ": " + reason,
                  url_.scheme + "://" + url_.hostHeader() + url_.target});
  }

  void deliver(Result<Response> r) {
    if (!done_) return;
    auto d = std::move(done_);
    done_ = nullptr;
    d(std::move(r));
  }

  util::Url                                  url_;
  http::request<http::string_body>           req_;
  std::chrono::milliseconds                  timeout_;
  ITransport::Completion                     done_;
  Intercept                                  intercept_;
  tcp::resolver                              resolver_;
  Stream                                     stream_;
  beast::flat_buffer                         buffer_;
  http::response_parser<http::string_body>   parser_;
};

} // namespace

BeastTransport::BeastTransport(net::io_context& ioc, const util::Config& cfg)
  : ioc_(ioc)
  , ssl_(ssl::context::tls_client)
  , defaultTimeout_(cfg.timeoutMs)
  , userAgent_(cfg.userAgent)
  , maxBodyBytes_(cfg.maxBodyBytes)
{
  ssl_.set_default_verify_paths();
  ssl_.set_verify_mode(ssl::verify_peer);
}

void BeastTransport::perform(const RequestDescriptor& request,
                             const SessionConfig& session,
                             Completion done)
{
  start(request, session, std::move(done), kMaxRedirects);
}

void BeastTransport::start(const RequestDescriptor& request,
                           const SessionConfig& session,
                           Completion done,
                           int redirectsLeft)
{
  auto url = util::parseUrl(request.target);
  if (!url) {
    done(Error{ErrorKind::Transport, "not an absolute http(s) URL", request.target});
    return;
  }

  auto req = buildRequest(request, session, *url, userAgent_);
  const auto timeout = session.timeout.value_or(defaultTimeout_);

  Intercept intercept;
  if (session.followRedirects && redirectsLeft > 0) {
    intercept = [this, request, session, base = *url, redirectsLeft]
                (const Response& r, const Completion& d) {
      if (!isRedirect(r.status)) return false;
      auto loc = r.headerValue("Location");
      if (!loc || loc->empty()) return false;

      RequestDescriptor next = request;
      next.target = resolveLocation(base, *loc);
      if (r.status == 303 ||
          ((r.status == 301 || r.status == 302) && request.method == Method::Post)) {
        next.method = Method::Get;
        next.body.clear();
      }
      util::logger().log(util::LogLevel::Debug, "redirect",
                         {{"status", std::to_string(r.status)}, {"to", next.target}});
      start(next, session, d, redirectsLeft - 1);
      return true;
    };
  }

  auto strand = net::make_strand(ioc_);
  if (url->secure()) {
    std::make_shared<Exchange<SslStream>>(
      std::move(*url), std::move(req), timeout, maxBodyBytes_,
      std::move(done), std::move(intercept), strand, ssl_)->run();
  } else {
    std::make_shared<Exchange<beast::tcp_stream>>(
      std::move(*url), std::move(req), timeout, maxBodyBytes_,
      std::move(done), std::move(intercept), strand)->run();
  }
}

} // namespace reqkit
