#include "reqkit/params/Params.hpp"
#include "reqkit/params/Fold.hpp"
#include "reqkit/util/Encoding.hpp"

#include <algorithm>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace reqkit {

const char* toString(ParamKind k) noexcept {
  switch (k) {
    case ParamKind::Target:        return "Target";
    case ParamKind::Method:        return "Method";
    case ParamKind::Header:        return "Header";
    case ParamKind::Query:         return "Query";
    case ParamKind::Body:          return "Body";
    case ParamKind::SessionOption: return "SessionOption";
    case ParamKind::Composite:     return "Composite";
    case ParamKind::Custom:        return "Custom";
  }
  return "Custom";
}

Param::Param(std::shared_ptr<const IParam> impl) : impl_(std::move(impl)) {}

namespace params {
namespace {

class TargetParam final : public IParam {
public:
  explicit TargetParam(std::string url) : url_(std::move(url)) {}
  ParamKind kind() const noexcept override { return ParamKind::Target; }
  void buildParam(FoldContext& ctx) const override { ctx.setTarget(url_); }
private:
  std::string url_;
};

class MethodParam final : public IParam {
public:
  explicit MethodParam(Method m) : m_(m) {}
  ParamKind kind() const noexcept override { return ParamKind::Method; }
  void buildParam(FoldContext& ctx) const override { ctx.setMethod(m_); }
private:
  Method m_;
};

class HeaderParam final : public IParam {
public:
  HeaderParam(std::string name, ValueFn value) : name_(std::move(name)), value_(std::move(value)) {}
  ParamKind kind() const noexcept override { return ParamKind::Header; }
  void buildParam(FoldContext& ctx) const override {
    ctx.addHeader(name_, value_ ? value_() : std::string{});
  }
private:
  std::string name_;
  ValueFn value_;
};

class QueryParam final : public IParam {
public:
  QueryParam(std::string name, ValueFn value) : name_(std::move(name)), value_(std::move(value)) {}
  ParamKind kind() const noexcept override { return ParamKind::Query; }
  void buildParam(FoldContext& ctx) const override {
    ctx.addQueryItem(name_, value_ ? value_() : std::string{});
  }
private:
  std::string name_;
  ValueFn value_;
};

class BodyParam final : public IParam {
public:
  explicit BodyParam(std::string bytes) : bytes_(std::move(bytes)) {}
  ParamKind kind() const noexcept override { return ParamKind::Body; }
  void buildParam(FoldContext& ctx) const override { ctx.setBody(bytes_); }
private:
  std::string bytes_;
};

// Session-only: no effect on the descriptor.
class SessionParam final : public IParam {
public:
  using Apply = std::function<void(SessionConfig&)>;
  explicit SessionParam(Apply apply) : apply_(std::move(apply)) {}
  ParamKind kind() const noexcept override { return ParamKind::SessionOption; }
  void buildParam(FoldContext&) const override {}
  bool affectsSession() const noexcept override { return true; }
  void buildConfiguration(SessionConfig& cfg) const override { apply_(cfg); }
private:
  Apply apply_;
};

class CombinedParam final : public IParam {
public:
  explicit CombinedParam(std::vector<Param> children)
    : children_(std::move(children))
    , session_(std::any_of(children_.begin(), children_.end(),
                           [](const Param& p){ return p.affectsSession(); }))
  {}
  ParamKind kind() const noexcept override { return ParamKind::Composite; }
  void buildParam(FoldContext&) const override {}
  bool affectsSession() const noexcept override { return session_; }
  const std::vector<Param>* children() const noexcept override { return &children_; }
private:
  std::vector<Param> children_;
  bool session_;
};

template <typename P, typename... Args>
Param make(Args&&... args) {
  return Param(std::make_shared<const P>(std::forward<Args>(args)...));
}

ValueFn constant(std::string v) {
  return [v = std::move(v)]{ return v; };
}

} // namespace

Param url(std::string address) { return make<TargetParam>(std::move(address)); }
Param method(Method m) { return make<MethodParam>(m); }

Param header(std::string name, std::string value) {
  return make<HeaderParam>(std::move(name), constant(std::move(value)));
}
Param header(std::string name, ValueFn value) {
  return make<HeaderParam>(std::move(name), std::move(value));
}

Param accept(std::string mediaType)        { return header("Accept", std::move(mediaType)); }
Param contentType(std::string mediaType)   { return header("Content-Type", std::move(mediaType)); }
Param userAgent(std::string agent)         { return header("User-Agent", std::move(agent)); }
Param cacheControl(std::string directives) { return header("Cache-Control", std::move(directives)); }
Param authorization(const Auth& auth)      { return header("Authorization", auth.value()); }

Param query(std::string name, std::string value) {
  return make<QueryParam>(std::move(name), constant(std::move(value)));
}
Param query(std::string name, ValueFn value) {
  return make<QueryParam>(std::move(name), std::move(value));
}
Param query(std::vector<std::pair<std::string, std::string>> items) {
  std::vector<Param> out;
  out.reserve(items.size());
  for (auto& kv : items) out.push_back(query(std::move(kv.first), std::move(kv.second)));
  return combined(std::move(out));
}

Param body(std::string bytes) { return make<BodyParam>(std::move(bytes)); }

Param json(const rapidjson::Value& value) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  value.Accept(w);
  return body(std::string(sb.GetString(), sb.GetSize()));
}

Param form(const std::vector<std::pair<std::string, std::string>>& fields) {
  std::string out;
  for (const auto& kv : fields) {
    if (!out.empty()) out.push_back('&');
    out += util::percentEncode(kv.first);
    out.push_back('=');
    out += util::percentEncode(kv.second);
  }
  return body(std::move(out));
}

Param timeout(std::chrono::milliseconds t) {
  return make<SessionParam>([t](SessionConfig& c){ c.timeout = t; });
}
Param cachePolicy(CachePolicy p) {
  return make<SessionParam>([p](SessionConfig& c){ c.cachePolicy = p; });
}
Param sessionHeader(std::string name, std::string value) {
  return make<SessionParam>([n = std::move(name), v = std::move(value)](SessionConfig& c){
    c.defaultHeaders.emplace_back(n, v);
  });
}
Param followRedirects(bool follow) {
  return make<SessionParam>([follow](SessionConfig& c){ c.followRedirects = follow; });
}
Param sessionOption(std::string key, std::string value) {
  return make<SessionParam>([k = std::move(key), v = std::move(value)](SessionConfig& c){
    c.options[k] = v;
  });
}

Param combined(std::vector<Param> children) { return make<CombinedParam>(std::move(children)); }
Param combined(std::initializer_list<Param> children) {
  return combined(std::vector<Param>(children));
}

} // namespace params
} // namespace reqkit
