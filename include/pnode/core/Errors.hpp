#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace pnode {

// Base class of every error raised by the filtering core.
class PnodeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Non-positive, non-finite or non-increasing step in a time grid.
class InvalidStepSizeError : public PnodeError {
public:
  using PnodeError::PnodeError;
};

// Innovation or prediction covariance not invertible within tolerance.
class SingularCovarianceError : public PnodeError {
public:
  using PnodeError::PnodeError;
};

// State/observation dimensions disagree between components.
class DimensionMismatchError : public PnodeError {
public:
  using PnodeError::PnodeError;
};

// Failure during the forward pass, tagged with the failing grid index.
class FilterDivergenceError : public PnodeError {
public:
  FilterDivergenceError(std::size_t index, double time, const std::string& reason);

  std::size_t index() const { return failedIndex; }
  double time() const { return failedTime; }

private:
  std::size_t failedIndex = 0;
  double failedTime = 0.0;
};

} // namespace pnode
