#include "pnode/problems/Problems.hpp"

#include <cmath>

#include "pnode/core/Errors.hpp"

namespace pnode::problems {

InitialValueProblem_t exponentialDecay(double rate, double y0, double t0, double tmax) {
  InitialValueProblem_t ivp;
  ivp.name = "exponential";
  ivp.field = [rate](double /*t*/, const Vector& y) -> Vector { return rate * y; };
  ivp.jacobian = [rate](double /*t*/, const Vector& /*y*/) -> Matrix { return Matrix::Constant(1, 1, rate); };
  ivp.t0 = t0;
  ivp.tmax = tmax;
  ivp.y0 = Vector::Constant(1, y0);
  ivp.solution = [rate, y0, t0](double t) -> Vector { return Vector::Constant(1, y0 * std::exp(rate * (t - t0))); };
  return ivp;
}

InitialValueProblem_t logistic(double growth, double capacity, double y0, double t0, double tmax) {
  InitialValueProblem_t ivp;
  ivp.name = "logistic";
  ivp.field = [growth, capacity](double /*t*/, const Vector& y) -> Vector {
    return growth * y.cwiseProduct((Vector::Ones(y.size()) - y / capacity));
  };
  ivp.jacobian = [growth, capacity](double /*t*/, const Vector& y) -> Matrix {
    return Matrix::Constant(1, 1, growth * (1.0 - 2.0 * y(0) / capacity));
  };
  ivp.t0 = t0;
  ivp.tmax = tmax;
  ivp.y0 = Vector::Constant(1, y0);
  ivp.solution = [growth, capacity, y0, t0](double t) -> Vector {
    const double e = std::exp(growth * (t - t0));
    return Vector::Constant(1, capacity * y0 * e / (capacity + y0 * (e - 1.0)));
  };
  return ivp;
}

InitialValueProblem_t lotkaVolterra(double a, double b, double c, double d, double t0, double tmax) {
  InitialValueProblem_t ivp;
  ivp.name = "lotkavolterra";
  ivp.field = [a, b, c, d](double /*t*/, const Vector& y) -> Vector {
    Vector out(2);
    out << a * y(0) - b * y(0) * y(1), -c * y(1) + d * y(0) * y(1);
    return out;
  };
  ivp.jacobian = [a, b, c, d](double /*t*/, const Vector& y) -> Matrix {
    Matrix out(2, 2);
    out << a - b * y(1), -b * y(0), d * y(1), -c + d * y(0);
    return out;
  };
  ivp.t0 = t0;
  ivp.tmax = tmax;
  ivp.y0 = Vector(2);
  ivp.y0 << 20.0, 20.0;
  return ivp;
}

InitialValueProblem_t harmonicOscillator(double omega, double t0, double tmax) {
  InitialValueProblem_t ivp;
  ivp.name = "oscillator";
  Matrix system(2, 2);
  system << 0.0, 1.0, -omega * omega, 0.0;
  ivp.field = [system](double /*t*/, const Vector& y) -> Vector { return system * y; };
  ivp.jacobian = [system](double /*t*/, const Vector& /*y*/) -> Matrix { return system; };
  ivp.t0 = t0;
  ivp.tmax = tmax;
  ivp.y0 = Vector(2);
  ivp.y0 << 1.0, 0.0;
  ivp.solution = [omega, t0](double t) -> Vector {
    Vector out(2);
    out << std::cos(omega * (t - t0)), -omega * std::sin(omega * (t - t0));
    return out;
  };
  return ivp;
}

InitialValueProblem_t byName(const std::string& name) {
  if (name == "exponential") {
    return exponentialDecay();
  }
  if (name == "logistic") {
    return logistic();
  }
  if (name == "lotkavolterra") {
    return lotkaVolterra();
  }
  if (name == "oscillator") {
    return harmonicOscillator();
  }
  throw PnodeError("unknown problem '" + name + "'");
}

std::vector<std::string> names() {
  return {"exponential", "logistic", "lotkavolterra", "oscillator"};
}

} // namespace pnode::problems
