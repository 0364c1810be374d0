#pragma once

#include <string>
#include <vector>

#include "pnode/measurement/OdeProblem.hpp"

namespace pnode::problems {

// dy/dt = rate * y, y(t0) = y0.
InitialValueProblem_t exponentialDecay(double rate = -1.0, double y0 = 1.0, double t0 = 0.0, double tmax = 1.0);

// dy/dt = r y (1 - y / k).
InitialValueProblem_t logistic(double growth = 3.0,
                               double capacity = 1.0,
                               double y0 = 0.1,
                               double t0 = 0.0,
                               double tmax = 2.0);

// Predator-prey system; no closed-form solution.
InitialValueProblem_t lotkaVolterra(double a = 0.5,
                                    double b = 0.05,
                                    double c = 0.5,
                                    double d = 0.05,
                                    double t0 = 0.0,
                                    double tmax = 20.0);

// y'' = -omega^2 y written as a first-order system.
InitialValueProblem_t harmonicOscillator(double omega = 1.0, double t0 = 0.0, double tmax = 6.283185307179586);

// Looks up one of the problems above by name with default parameters.
// Throws PnodeError for unknown names.
InitialValueProblem_t byName(const std::string& name);

std::vector<std::string> names();

} // namespace pnode::problems
