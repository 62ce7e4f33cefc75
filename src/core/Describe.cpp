#include "reqkit/Describe.hpp"
#include "reqkit/util/Encoding.hpp"

#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace reqkit {

namespace {

std::string describeBody(const std::string& body) {
  if (body.empty()) return "<empty>";

  rapidjson::Document doc;
  doc.Parse(body.data(), body.size());
  if (!doc.HasParseError()) {
    rapidjson::StringBuffer sb;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> w(sb);
    w.SetIndent(' ', 2);
    doc.Accept(w);
    return sb.GetString();
  }

  if (util::isValidUtf8(body)) return body;
  return "<" + std::to_string(body.size()) + " bytes>";
}

} // namespace

std::string describe(const RequestDescriptor& request) {
  std::ostringstream os;
  os << toString(request.method) << ' ' << request.target << '\n';
  for (const auto& [name, value] : request.headers) {
    os << name << ": " << value << '\n';
  }
  if (!request.body.empty()) {
    os << '\n' << describeBody(request.body) << '\n';
  }
  return os.str();
}

std::string describe(const SessionConfig& session) {
  std::ostringstream os;
  os << "timeout: ";
  if (session.timeout) os << session.timeout->count() << "ms";
  else                 os << "default";
  os << '\n';
  os << "cache: " << toString(session.cachePolicy) << '\n';
  os << "redirects: " << (session.followRedirects ? "follow" : "no") << '\n';
  for (const auto& [name, value] : session.defaultHeaders) {
    os << "default " << name << ": " << value << '\n';
  }
  for (const auto& [key, value] : session.options) {
    os << "option " << key << '=' << value << '\n';
  }
  return os.str();
}

std::string describe(const Folded& folded) {
  return describe(folded.request) + "--\n" + describe(folded.session);
}

} // namespace reqkit
