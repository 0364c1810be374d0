#include "pnode/core/Errors.hpp"

#include <fmt/core.h>

namespace pnode {

FilterDivergenceError::FilterDivergenceError(std::size_t index, double time, const std::string& reason)
    : PnodeError(fmt::format("filter diverged at step {} (t = {:.6g}): {}", index, time, reason)),
      failedIndex(index),
      failedTime(time) {}

} // namespace pnode
