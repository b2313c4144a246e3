#pragma once
#include <Eigen/Dense>
#include <limits>

namespace photnorm {
	using Real   = double;
	using Vector = Eigen::VectorXd;

	/* written wherever a magnitude or flux error is unavailable */
	constexpr Real kMissingValue = -999.0;

	/* instrumental zero point carried on every output row */
	constexpr Real kInstrumentalZeroPoint = 25.0;

	inline Real missing() { return std::numeric_limits<Real>::quiet_NaN(); }
} // namespace photnorm
