#pragma once

#include <vector>

#include "pnode/core/GaussianBelief.hpp"
#include "pnode/core/LinearAlgebra.hpp"
#include "pnode/filtsmooth/OdeFilter.hpp"

namespace pnode {

struct TimedBelief_t {
  double time = 0.0;
  GaussianBelief belief;
};

// Fixed-interval Rauch-Tung-Striebel smoother in square-root form.
class RtsSmoother {
public:
  explicit RtsSmoother(NumericalTolerance_t tolerance = {});

  // Backward pass over the filtered sequence. The last smoothed belief is
  // the last filtered belief, copied unchanged.
  std::vector<TimedBelief_t> smooth(const FilterResult_t& result) const;

  // One backward step: refines `filtered` at t_i with the smoothed belief
  // at t_{i+1}, given the prediction t_i -> t_{i+1} and its dynamics.
  GaussianBelief smoothingStep(const GaussianBelief& filtered,
                               const GaussianBelief& predicted,
                               const DiscreteTransition_t& transition,
                               const GaussianBelief& smoothedNext) const;

private:
  NumericalTolerance_t tolerance;
};

} // namespace pnode
