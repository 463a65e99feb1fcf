#include "downscale/transform/transformers.hpp"

#include <Eigen/Dense>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace downscale::transform {

namespace {

constexpr double kBoundsThreshold = 1e-7;

// Piecewise linear interpolation with constant extrapolation. With repeated
// knots the last knot equal to x wins.
double interpolate(double x, const std::vector<double> &xp, const std::vector<double> &fp) {
	if (x < xp.front()) {
		return fp.front();
	}
	if (x >= xp.back()) {
		return fp.back();
	}
	const auto upper = std::upper_bound(xp.begin(), xp.end(), x);
	const auto j = static_cast<std::size_t>(std::distance(xp.begin(), upper)) - 1;
	const double span = xp[j + 1] - xp[j];
	return fp[j] + (fp[j + 1] - fp[j]) * (x - xp[j]) / span;
}

double percentile(const std::vector<double> &sorted, double probability) {
	const double position = probability * static_cast<double>(sorted.size() - 1);
	const auto lower = static_cast<std::size_t>(std::floor(position));
	if (lower + 1 >= sorted.size()) {
		return sorted.back();
	}
	const double fraction = position - static_cast<double>(lower);
	return sorted[lower] + fraction * (sorted[lower + 1] - sorted[lower]);
}

} // namespace

// ============================================================================
// QuantileTransformer
// ============================================================================

QuantileTransformer::QuantileTransformer() : n_quantiles_(1000) {
}

QuantileTransformer &QuantileTransformer::withQuantileCount(std::size_t n_quantiles) {
	if (n_quantiles == 0) {
		throw std::invalid_argument("QuantileTransformer requires at least one quantile.");
	}
	n_quantiles_ = n_quantiles;
	return *this;
}

QuantileTransformer &QuantileTransformer::withQuantiles(std::vector<double> references,
                                                        std::vector<double> quantiles) {
	if (references.empty() || references.size() != quantiles.size()) {
		throw std::invalid_argument("Quantile references and values must be non-empty and equal length.");
	}
	if (!std::is_sorted(references.begin(), references.end()) || !std::is_sorted(quantiles.begin(), quantiles.end())) {
		throw std::invalid_argument("Quantile references and values must be non-decreasing.");
	}
	if (references.front() < 0.0 || references.back() > 1.0) {
		throw std::invalid_argument("Quantile references must lie within [0, 1].");
	}
	n_quantiles_ = references.size();
	references_ = std::move(references);
	quantiles_ = std::move(quantiles);
	return *this;
}

void QuantileTransformer::fit(const std::vector<double> &data) {
	std::vector<double> sorted;
	sorted.reserve(data.size());
	for (double value : data) {
		if (std::isfinite(value)) {
			sorted.push_back(value);
		}
	}
	if (sorted.empty()) {
		throw std::invalid_argument("QuantileTransformer requires at least one finite value.");
	}
	std::sort(sorted.begin(), sorted.end());

	const std::size_t count = std::min(n_quantiles_, sorted.size());
	references_.assign(count, 0.0);
	quantiles_.assign(count, 0.0);
	for (std::size_t i = 0; i < count; ++i) {
		references_[i] = count == 1 ? 0.0 : static_cast<double>(i) / static_cast<double>(count - 1);
		quantiles_[i] = percentile(sorted, references_[i]);
	}
	// Interpolation round-off must not break monotonicity.
	for (std::size_t i = 1; i < count; ++i) {
		quantiles_[i] = std::max(quantiles_[i], quantiles_[i - 1]);
	}
}

void QuantileTransformer::transform(std::vector<double> &data) const {
	ensureFitted();
	const double lower_bound = quantiles_.front();
	const double upper_bound = quantiles_.back();

	if (lower_bound == upper_bound) {
		// A degenerate distribution carries no rank information. It ranks at 0.5
		// so a constant query maps to the reference median, not its minimum.
		for (double &value : data) {
			if (std::isfinite(value)) {
				value = 0.5;
			}
		}
		return;
	}

	std::vector<double> reversed_quantiles(quantiles_.rbegin(), quantiles_.rend());
	std::vector<double> reversed_references(references_.rbegin(), references_.rend());
	for (double &v : reversed_quantiles) {
		v = -v;
	}
	for (double &v : reversed_references) {
		v = -v;
	}

	for (double &value : data) {
		if (!std::isfinite(value)) {
			continue;
		}
		if (value - kBoundsThreshold < lower_bound) {
			value = 0.0;
			continue;
		}
		if (value + kBoundsThreshold > upper_bound) {
			value = 1.0;
			continue;
		}
		const double forward = interpolate(value, quantiles_, references_);
		const double backward = -interpolate(-value, reversed_quantiles, reversed_references);
		value = 0.5 * (forward + backward);
	}
}

void QuantileTransformer::inverseTransform(std::vector<double> &data) const {
	ensureFitted();
	for (double &value : data) {
		if (!std::isfinite(value)) {
			continue;
		}
		value = interpolate(std::clamp(value, 0.0, 1.0), references_, quantiles_);
	}
}

void QuantileTransformer::ensureFitted() const {
	if (quantiles_.empty()) {
		throw std::runtime_error("QuantileTransformer must be fitted before use.");
	}
}

// ============================================================================
// LinearTrendTransformer
// ============================================================================

LinearTrendTransformer &LinearTrendTransformer::withParameters(LinearTrendParams params) {
	params_ = params;
	return *this;
}

void LinearTrendTransformer::fit(const std::vector<double> &data) {
	std::vector<std::size_t> positions;
	positions.reserve(data.size());
	for (std::size_t i = 0; i < data.size(); ++i) {
		if (std::isfinite(data[i])) {
			positions.push_back(i);
		}
	}
	if (positions.empty()) {
		throw std::invalid_argument("LinearTrendTransformer requires at least one finite value.");
	}
	if (positions.size() == 1) {
		params_ = LinearTrendParams{data[positions.front()], 0.0};
		return;
	}

	const auto rows = static_cast<Eigen::Index>(positions.size());
	Eigen::MatrixXd design(rows, 2);
	Eigen::VectorXd response(rows);
	for (Eigen::Index r = 0; r < rows; ++r) {
		const auto position = positions[static_cast<std::size_t>(r)];
		design(r, 0) = 1.0;
		design(r, 1) = static_cast<double>(position);
		response(r) = data[position];
	}
	const Eigen::VectorXd coefficients = design.colPivHouseholderQr().solve(response);
	params_ = LinearTrendParams{coefficients(0), coefficients(1)};
}

void LinearTrendTransformer::transform(std::vector<double> &data) const {
	ensureParams();
	for (std::size_t i = 0; i < data.size(); ++i) {
		data[i] -= params_->intercept + params_->slope * static_cast<double>(i);
	}
}

void LinearTrendTransformer::inverseTransform(std::vector<double> &data) const {
	ensureParams();
	for (std::size_t i = 0; i < data.size(); ++i) {
		data[i] += params_->intercept + params_->slope * static_cast<double>(i);
	}
}

void LinearTrendTransformer::ensureParams() const {
	if (!params_) {
		throw std::runtime_error("LinearTrendTransformer parameters are not set.");
	}
}

} // namespace downscale::transform
