#include "pnode/core/TimeGrid.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/core.h>

#include "pnode/core/Errors.hpp"

namespace pnode {

TimeGrid::TimeGrid(std::vector<double> pointsInput) : points(std::move(pointsInput)) {
  if (points.empty()) {
    throw InvalidStepSizeError("TimeGrid: grid must contain at least t_0");
  }
  if (!std::isfinite(points.front())) {
    throw InvalidStepSizeError(fmt::format("TimeGrid: non-finite t_0 = {}", points.front()));
  }
  for (std::size_t i = 1; i < points.size(); ++i) {
    try {
      validateStep(points[i - 1], points[i]);
    } catch (const InvalidStepSizeError& ex) {
      throw InvalidStepSizeError(fmt::format("TimeGrid: entry {}: {}", i, ex.what()));
    }
  }
}

TimeGrid TimeGrid::uniform(double t0, double tmax, double step) {
  if (!(step > 0.0) || !std::isfinite(step)) {
    throw InvalidStepSizeError(fmt::format("TimeGrid::uniform: step {} must be positive", step));
  }
  if (!std::isfinite(t0) || !std::isfinite(tmax) || tmax < t0) {
    throw InvalidStepSizeError(fmt::format("TimeGrid::uniform: invalid interval [{}, {}]", t0, tmax));
  }
  // Round so that [0, 1] with step 0.1 yields exactly 11 points ending at tmax.
  auto intervals = static_cast<std::size_t>(std::llround((tmax - t0) / step));
  if (intervals == 0 && tmax > t0) {
    intervals = 1;
  }
  std::vector<double> grid;
  grid.reserve(intervals + 1);
  for (std::size_t i = 0; i <= intervals; ++i) {
    grid.push_back(t0 + static_cast<double>(i) * step);
  }
  if (intervals > 0) {
    grid.back() = tmax;
  }
  return TimeGrid(std::move(grid));
}

std::size_t TimeGrid::locate(double t) const {
  if (points.empty() || t <= points.front()) {
    return 0;
  }
  const auto it = std::upper_bound(points.begin(), points.end(), t);
  return static_cast<std::size_t>(std::distance(points.begin(), it)) - 1;
}

void TimeGrid::validateStep(double previous, double next) {
  if (!std::isfinite(previous) || !std::isfinite(next)) {
    throw InvalidStepSizeError(fmt::format("non-finite time point ({} -> {})", previous, next));
  }
  if (!(next > previous)) {
    throw InvalidStepSizeError(
        fmt::format("time points must be strictly increasing ({} -> {}, step {})", previous, next, next - previous));
  }
}

} // namespace pnode
