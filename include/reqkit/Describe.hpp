#pragma once

#include <string>

#include "reqkit/RequestDescriptor.hpp"
#include "reqkit/SessionConfig.hpp"
#include "reqkit/params/Fold.hpp"

namespace reqkit {

// Human-readable dumps for logs and the CLI's --dump. A JSON body is
// pretty-printed; other text verbatim; binary as a byte count.
std::string describe(const RequestDescriptor& request);
std::string describe(const SessionConfig& session);
std::string describe(const Folded& folded);

} // namespace reqkit
