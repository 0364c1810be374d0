#pragma once

#include <functional>
#include <string>

#include "pnode/core/Types.hpp"

namespace pnode {

// Right-hand side f(t, y) of dy/dt = f(t, y). Assumed pure.
using VectorField = std::function<Vector(double, const Vector&)>;
// Jacobian df/dy(t, y).
using JacobianField = std::function<Matrix(double, const Vector&)>;
// Closed-form solution y(t), when known.
using SolutionField = std::function<Vector(double)>;

struct InitialValueProblem_t {
  std::string name;
  VectorField field;
  // Optional; finite differences are used when empty.
  JacobianField jacobian;
  double t0 = 0.0;
  double tmax = 1.0;
  Vector y0;
  // Optional reference solution for diagnostics and tests.
  SolutionField solution;
};

} // namespace pnode
