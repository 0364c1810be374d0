#include "pnode/prior/IntegratedWienerProcess.hpp"

#include <cmath>

namespace pnode {

namespace {

double factorial(int n) {
  double out = 1.0;
  for (int i = 2; i <= n; ++i) {
    out *= static_cast<double>(i);
  }
  return out;
}

} // namespace

IntegratedWienerProcess::IntegratedWienerProcess(int order,
                                                 int spatialDimension,
                                                 double diffusion,
                                                 double initialVariance)
    : StochasticPrior(order, spatialDimension, diffusion, initialVariance) {}

void IntegratedWienerProcess::discretizeBlock(double step, Matrix& transition, Matrix& processNoise) const {
  const int q = order();
  const double sigma2 = diffusion() * diffusion();
  transition = Matrix::Zero(q + 1, q + 1);
  processNoise = Matrix::Zero(q + 1, q + 1);

  for (int row = 0; row <= q; ++row) {
    for (int col = row; col <= q; ++col) {
      transition(row, col) = std::pow(step, col - row) / factorial(col - row);
    }
  }
  for (int row = 0; row <= q; ++row) {
    for (int col = 0; col <= q; ++col) {
      const int power = 2 * q + 1 - row - col;
      processNoise(row, col) =
          sigma2 * std::pow(step, power) / (static_cast<double>(power) * factorial(q - row) * factorial(q - col));
    }
  }
}

} // namespace pnode
