// include/reqkit/params/IParam.hpp
#pragma once

#include <memory>
#include <vector>

namespace reqkit {

struct SessionConfig;
class FoldContext;
class Param;

enum class ParamKind : int {
  Target = 0,
  Method,
  Header,
  Query,
  Body,
  SessionOption,
  Composite,
  Custom
};

const char* toString(ParamKind k) noexcept;

/// One request-building instruction. Implementations are immutable once built
/// and may be shared by any number of trees.
class IParam {
public:
  IParam() = default;
  virtual ~IParam() = default;

  IParam(const IParam&) = delete;
  IParam& operator=(const IParam&) = delete;

  virtual ParamKind kind() const noexcept = 0;

  // Descriptor side of the fold. Composites leave this empty; the fold walks children().
  virtual void buildParam(FoldContext& ctx) const = 0;

  // Session side of the fold. Only consulted when affectsSession() is true.
  virtual bool affectsSession() const noexcept { return false; }
  virtual void buildConfiguration(SessionConfig&) const {}

  virtual const std::vector<Param>* children() const noexcept { return nullptr; }
};

/// Value handle over an immutable IParam. Cheap to copy.
class Param {
public:
  explicit Param(std::shared_ptr<const IParam> impl);

  ParamKind kind() const noexcept { return impl_->kind(); }
  bool affectsSession() const noexcept { return impl_->affectsSession(); }

  const IParam& node() const noexcept { return *impl_; }

private:
  std::shared_ptr<const IParam> impl_;
};

} // namespace reqkit
