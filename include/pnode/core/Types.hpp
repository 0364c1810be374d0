#pragma once

#include <Eigen/Dense>

namespace pnode {
using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;
} // namespace pnode
