#include "reqkit/params/Fold.hpp"
#include "reqkit/util/Encoding.hpp"
#include "reqkit/util/Url.hpp"

#include <exception>

namespace reqkit {

void FoldContext::setTarget(const std::string& url) {
  if (++targets_ > 1) {
    fail(ErrorKind::DuplicateTarget, "more than one target node (first at " + targetPath_ + ")");
    return;
  }
  targetPath_ = path_;
  if (!util::parseUrl(url)) {
    fail(ErrorKind::InvalidTarget, "not an absolute http(s) URL: '" + url + "'");
    return;
  }
  request_.target = url;
}

void FoldContext::addHeader(std::string name, std::string value) {
  request_.headers.emplace_back(std::move(name), std::move(value));
}

void FoldContext::addQueryItem(std::string name, std::string value) {
  query_.emplace_back(std::move(name), std::move(value));
}

void FoldContext::fail(ErrorKind kind, std::string message) {
  if (failed_) return;
  failed_ = true;
  error_ = Error{kind, std::move(message), path_};
}

void FoldContext::visit(const Param& p) {
  const IParam& n = p.node();
  try {
    n.buildParam(*this);
    if (n.affectsSession()) n.buildConfiguration(session_);
  } catch (const std::exception& ex) {
    fail(ErrorKind::InvalidParam, ex.what());
  }

  const auto* kids = n.children();
  if (!kids) return;

  const std::string saved = path_;
  for (std::size_t i = 0; i < kids->size(); ++i) {
    path_ = saved + "/" + std::to_string(i);
    visit((*kids)[i]);
  }
  path_ = saved;
}

static void appendQuery(std::string& target,
                        const std::vector<std::pair<std::string, std::string>>& items)
{
  if (items.empty()) return;

  std::string fragment;
  const auto hash = target.find('#');
  if (hash != std::string::npos) {
    fragment = target.substr(hash);
    target.erase(hash);
  }

  const bool hasQuery = target.find('?') != std::string::npos;
  char sep = hasQuery ? '&' : '?';
  if (hasQuery && (target.back() == '?' || target.back() == '&')) sep = '\0';

  for (const auto& kv : items) {
    if (sep != '\0') target.push_back(sep);
    sep = '&';
    target += util::percentEncode(kv.first);
    target.push_back('=');
    target += util::percentEncode(kv.second);
  }
  target += fragment;
}

Result<Folded> fold(const Param& root) {
  FoldContext ctx;
  ctx.visit(root);

  if (!ctx.failed_ && ctx.targets_ == 0) {
    ctx.fail(ErrorKind::MissingTarget, "parameter tree has no target node");
  }
  if (ctx.failed_) return ctx.error_;

  appendQuery(ctx.request_.target, ctx.query_);

  return Folded{std::move(ctx.request_), std::move(ctx.session_)};
}

} // namespace reqkit
