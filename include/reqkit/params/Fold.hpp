#pragma once

#include <string>
#include <utility>
#include <vector>

#include "reqkit/RequestDescriptor.hpp"
#include "reqkit/Result.hpp"
#include "reqkit/SessionConfig.hpp"
#include "reqkit/params/IParam.hpp"

namespace reqkit {

struct Folded {
  RequestDescriptor request;
  SessionConfig     session;
};

/// In-progress state handed to every node during one traversal.
class FoldContext {
public:
  void setTarget(const std::string& url);
  void setMethod(Method m) { request_.method = m; }
  void addHeader(std::string name, std::string value);
  void addQueryItem(std::string name, std::string value);
  void setBody(std::string bytes) { request_.body = std::move(bytes); }

  // Records a build error. The first failure wins; later nodes still run.
  void fail(ErrorKind kind, std::string message);

  // Slash-separated child indices of the node being visited, e.g. "root/1/0".
  const std::string& path() const noexcept { return path_; }

  SessionConfig& session() noexcept { return session_; }

private:
  friend Result<Folded> fold(const Param& root);

  void visit(const Param& p);

  RequestDescriptor request_;
  SessionConfig     session_;
  std::vector<std::pair<std::string, std::string>> query_;
  std::string       path_{"root"};
  std::string       targetPath_;
  int               targets_{0};
  bool              failed_{false};
  Error             error_;
};

/// Folds a tree depth-first, left to right, into a descriptor and session config.
/// Fails with MissingTarget / DuplicateTarget / InvalidTarget, or InvalidParam
/// when a node throws while it is applied.
Result<Folded> fold(const Param& root);

} // namespace reqkit
