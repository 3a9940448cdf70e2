#pragma once
#include <Eigen/Dense>
namespace droview {
	using Real     = double;
	using Vector   = Eigen::VectorXd;
	using Matrix   = Eigen::MatrixXd;
	using IndexMap = Eigen::MatrixXi;
} // namespace droview
