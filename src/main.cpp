// File: src/main.cpp
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/signal_set.hpp>

#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

#include "reqkit/AnyRequest.hpp"
#include "reqkit/Client.hpp"
#include "reqkit/Describe.hpp"
#include "reqkit/Method.hpp"
#include "reqkit/params/Params.hpp"
#include "reqkit/rt/ShutdownCoordinator.hpp"
#include "reqkit/util/Config.hpp"
#include "reqkit/util/Logger.hpp"

namespace {

constexpr int kExitOk        = 0;
constexpr int kExitUsage     = 1;
constexpr int kExitBuild     = 2;
constexpr int kExitTransport = 3;

struct Options {
  std::string url;
  std::optional<reqkit::Method> method;
  std::vector<std::pair<std::string, std::string>> headers;
  std::vector<std::pair<std::string, std::string>> query;
  std::optional<std::string> body;
  std::optional<std::string> basic;
  std::optional<std::string> bearer;
  long everyMs = 0;
  std::string configPath;
  bool dump = false;
  bool json = false;
};

void usage(std::ostream& os) {
  os << "usage: reqkit [options] <url>\n"
        "  -X METHOD           request method (default GET)\n"
        "  -H 'Name: value'    add a header (repeatable)\n"
        "  -q name=value       add a query item (repeatable)\n"
        "  -d BODY             request body\n"
        "  -u user:password    basic authorization\n"
        "  -t TOKEN            bearer authorization\n"
        "  --every MS          re-run every MS milliseconds until interrupted\n"
        "  --config FILE       key=value configuration file\n"
        "  --dump              print the request and exit\n"
        "  --json              pretty-print the response document\n";
}

std::string trim(const std::string& s) {
  auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return {};
  auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

bool splitPair(const std::string& s, char sep, std::pair<std::string, std::string>& out) {
  auto pos = s.find(sep);
  if (pos == std::string::npos || pos == 0) return false;
  out = {trim(s.substr(0, pos)), trim(s.substr(pos + 1))};
  return !out.first.empty();
}

// Returns false (after printing why) on a usage error.
bool parseArgs(int argc, char* argv[], Options& o) {
  auto need = [&](int& i, const std::string& flag) -> const char* {
    if (i + 1 >= argc) {
      std::cerr << "reqkit: " << flag << " needs an argument\n";
      return nullptr;
    }
    return argv[++i];
  };

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    const char* v = nullptr;

    if (a == "-h" || a == "--help") {
      usage(std::cout);
      std::exit(kExitOk);
    } else if (a == "-X") {
      if (!(v = need(i, a))) return false;
      o.method = reqkit::parseMethod(v);
      if (!o.method) { std::cerr << "reqkit: unknown method '" << v << "'\n"; return false; }
    } else if (a == "-H") {
      if (!(v = need(i, a))) return false;
      std::pair<std::string, std::string> h;
      if (!splitPair(v, ':', h)) { std::cerr << "reqkit: bad header '" << v << "'\n"; return false; }
      o.headers.push_back(std::move(h));
    } else if (a == "-q") {
      if (!(v = need(i, a))) return false;
      std::pair<std::string, std::string> q;
      if (!splitPair(v, '=', q)) { std::cerr << "reqkit: bad query item '" << v << "'\n"; return false; }
      o.query.push_back(std::move(q));
    } else if (a == "-d") {
      if (!(v = need(i, a))) return false;
      o.body = v;
    } else if (a == "-u") {
      if (!(v = need(i, a))) return false;
      o.basic = v;
    } else if (a == "-t") {
      if (!(v = need(i, a))) return false;
      o.bearer = v;
    } else if (a == "--every") {
      if (!(v = need(i, a))) return false;
      char* end = nullptr;
      o.everyMs = std::strtol(v, &end, 10);
      if (!end || *end != '\0' || o.everyMs <= 0) {
        std::cerr << "reqkit: --every needs a positive number of milliseconds\n";
        return false;
      }
    } else if (a == "--config") {
      if (!(v = need(i, a))) return false;
      o.configPath = v;
    } else if (a == "--dump") {
      o.dump = true;
    } else if (a == "--json") {
      o.json = true;
    } else if (!a.empty() && a[0] == '-') {
      std::cerr << "reqkit: unknown option '" << a << "'\n";
      return false;
    } else if (o.url.empty()) {
      o.url = a;
    } else {
      std::cerr << "reqkit: more than one URL given\n";
      return false;
    }
  }

  if (o.url.empty()) {
    std::cerr << "reqkit: no URL given\n";
    return false;
  }
  return true;
}

reqkit::Request makeRequest(const Options& o) {
  namespace p = reqkit::params;

  std::vector<reqkit::Param> tree;
  tree.push_back(p::url(o.url));
  if (o.method) tree.push_back(p::method(*o.method));
  if (!o.query.empty()) tree.push_back(p::query(o.query));
  if (o.json) tree.push_back(p::accept("application/json"));
  for (const auto& [name, value] : o.headers) tree.push_back(p::header(name, value));
  if (o.body) tree.push_back(p::body(*o.body));

  reqkit::Request req{p::combined(std::move(tree))};

  if (o.basic) {
    std::pair<std::string, std::string> up;
    auto pos = o.basic->find(':');
    up.first  = o.basic->substr(0, pos);
    up.second = pos == std::string::npos ? std::string{} : o.basic->substr(pos + 1);
    req = req.withAuthorization(reqkit::Auth::basic(up.first, up.second));
  }
  if (o.bearer) {
    req = req.withAuthorization(reqkit::Auth::bearer(*o.bearer));
  }
  return req;
}

std::string prettyDocument(const rapidjson::Document& doc) {
  rapidjson::StringBuffer sb;
  rapidjson::PrettyWriter<rapidjson::StringBuffer> w(sb);
  w.SetIndent(' ', 2);
  doc.Accept(w);
  return sb.GetString();
}

} // namespace

int main(int argc, char* argv[]) {
  using reqkit::util::logger;
  using reqkit::util::LogLevel;

  Options opts;
  if (!parseArgs(argc, argv, opts)) {
    usage(std::cerr);
    return kExitUsage;
  }

  reqkit::util::Config cfg;
  if (!opts.configPath.empty() && !cfg.loadFromFile(opts.configPath)) {
    std::cerr << "[config] warning: failed to load file: " << opts.configPath << "\n";
  }
  cfg.applyLogging();

  std::optional<reqkit::Request> req = makeRequest(opts);

  if (opts.dump) {
    auto folded = req->build();
    if (!folded) {
      std::cerr << "reqkit: " << folded.error().describe() << "\n";
      return kExitBuild;
    }
    std::cout << reqkit::describe(*folded);
    return kExitOk;
  }

  std::mutex outMx;
  std::condition_variable doneCv;
  bool done = false;
  std::atomic<int> exitCode{kExitOk};

  auto finish = [&](int code) {
    exitCode.store(code);
    if (opts.everyMs > 0) return;
    std::lock_guard<std::mutex> lk(outMx);
    done = true;
    doneCv.notify_all();
  };

  // Status is dispatched last on success; errors other than decode failures
  // are the only thing dispatched on failure.
  *req = req->onStatusCode([&](int status) {
      {
        std::lock_guard<std::mutex> lk(outMx);
        std::cerr << "HTTP " << status << "\n";
      }
      finish(kExitOk);
    })
    .onError([&](const reqkit::Error& err) {
      {
        std::lock_guard<std::mutex> lk(outMx);
        std::cerr << "reqkit: " << err.describe() << "\n";
      }
      if (err.kind == reqkit::ErrorKind::Decode) return;
      finish(err.isBuildError() ? kExitBuild : kExitTransport);
    });

  if (opts.json) {
    *req = req->onJson([&](const rapidjson::Document& doc) {
      std::lock_guard<std::mutex> lk(outMx);
      std::cout << prettyDocument(doc) << std::endl;
    });
  } else {
    *req = req->onData([&](const std::string& bytes) {
      std::lock_guard<std::mutex> lk(outMx);
      std::cout << bytes << std::endl;
    });
  }

  if (opts.everyMs > 0) {
    *req = req->updateEvery(std::chrono::milliseconds(opts.everyMs));
  }

  reqkit::Client client(cfg);
  reqkit::rt::ShutdownCoordinator shutdown;

  shutdown.registerStep("release-request", 10, [&] {
    std::lock_guard<std::mutex> lk(outMx);
    req.reset();
  });
  shutdown.registerStep("wake-main", 20, [&] {
    std::lock_guard<std::mutex> lk(outMx);
    done = true;
    doneCv.notify_all();
  });

  boost::asio::signal_set signals(client.ioContext(), SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code& ec, int sig) {
    if (ec) return;
    logger().log(LogLevel::Info, "signal", {{"sig", std::to_string(sig)}});
    shutdown.stop();
  });

  logger().log(LogLevel::Debug, "call", {{"id", req->id()}});
  req->call(client);

  {
    std::unique_lock<std::mutex> lk(outMx);
    doneCv.wait(lk, [&]{ return done; });
  }

  boost::system::error_code ignored;
  signals.cancel(ignored);
  shutdown.stop();
  client.shutdown();
  return exitCode.load();
}
