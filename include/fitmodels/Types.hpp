#pragma once
#include <Eigen/Dense>
namespace fitmodels {
	using Real   = double;
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;
} // namespace fitmodels
