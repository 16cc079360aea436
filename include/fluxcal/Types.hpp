#pragma once
#include <Eigen/Dense>
namespace fluxcal {
	using Real   = double;
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;   // rows = fibres, cols = wavelength slices
} // namespace fluxcal
