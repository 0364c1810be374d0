#pragma once

#include <cstddef>
#include <vector>

namespace pnode {

// Strictly increasing, finite sequence of time points t_0 < ... < t_N.
class TimeGrid {
public:
  TimeGrid() = default;
  // Throws InvalidStepSizeError on empty, non-finite or non-increasing input.
  explicit TimeGrid(std::vector<double> points);

  static TimeGrid uniform(double t0, double tmax, double step);

  std::size_t size() const { return points.size(); }
  bool empty() const { return points.empty(); }
  double operator[](std::size_t index) const { return points[index]; }
  double front() const { return points.front(); }
  double back() const { return points.back(); }
  const std::vector<double>& values() const { return points; }

  // Index i with t_i <= t < t_{i+1}; clamps to [0, size() - 1].
  std::size_t locate(double t) const;

  // Throws InvalidStepSizeError unless previous < next and both are finite.
  static void validateStep(double previous, double next);

private:
  std::vector<double> points;
};

} // namespace pnode
