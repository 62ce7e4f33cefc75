#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>

#include "reqkit/transport/ITransport.hpp"
#include "reqkit/util/Config.hpp"

namespace reqkit {

/// HTTP/1.1 over Boost.Beast. One connection per request, closed afterwards.
/// https uses the system trust store, peer and host name verification, SNI.
class BeastTransport final : public ITransport {
public:
  BeastTransport(boost::asio::io_context& ioc, const util::Config& cfg);

  void perform(const RequestDescriptor& request,
               const SessionConfig& session,
               Completion done) override;

  static constexpr int kMaxRedirects = 10;

private:
  void start(const RequestDescriptor& request,
             const SessionConfig& session,
             Completion done,
             int redirectsLeft);

  boost::asio::io_context&  ioc_;
  boost::asio::ssl::context ssl_;
  std::chrono::milliseconds defaultTimeout_;
  std::string               userAgent_;
  std::size_t               maxBodyBytes_;
};

} // namespace reqkit
