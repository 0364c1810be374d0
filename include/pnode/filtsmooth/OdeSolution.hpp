#pragma once

#include <memory>
#include <vector>

#include "pnode/core/GaussianBelief.hpp"
#include "pnode/core/TimeGrid.hpp"
#include "pnode/filtsmooth/RtsSmoother.hpp"
#include "pnode/prior/StochasticPrior.hpp"

namespace pnode {

// Posterior over the ODE solution on a grid, with dense output between
// and beyond grid points.
class OdeSolution {
public:
  OdeSolution(std::shared_ptr<const StochasticPrior> prior,
              std::vector<TimedBelief_t> beliefs,
              bool smoothed,
              NumericalTolerance_t tolerance = {});

  // Diffusion per interval (t_i, t_{i+1}] and per-state std multipliers
  // applied to the process noise when interpolating.
  void setProcessNoiseScaling(std::vector<double> intervalDiffusions, Vector stateScales);

  std::size_t size() const { return entries.size(); }
  bool isSmoothed() const { return smoothed; }
  const TimedBelief_t& at(std::size_t index) const { return entries.at(index); }
  const std::vector<TimedBelief_t>& beliefs() const { return entries; }
  const TimeGrid& grid() const { return timeGrid; }

  // Full-state belief at t >= t_0.
  GaussianBelief interpolate(double t) const;
  // Belief over y(t) only (zeroth derivative).
  GaussianBelief solutionBelief(double t) const;
  Vector solutionMean(double t) const;
  Vector solutionStdDev(double t) const;

private:
  DiscreteTransition_t scaledTransition(std::size_t interval, double step) const;

  std::shared_ptr<const StochasticPrior> prior;
  std::vector<TimedBelief_t> entries;
  TimeGrid timeGrid;
  bool smoothed = false;
  RtsSmoother smoother;
  std::vector<double> diffusions;
  Vector noiseScales;
};

} // namespace pnode
