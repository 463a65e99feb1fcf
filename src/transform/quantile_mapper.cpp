#include "downscale/transform/quantile_mapper.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace downscale::transform {

void QuantileMapperOptions::validate() const {
	if (n_quantiles == 0) {
		throw std::invalid_argument("Quantile mapper requires n_quantiles >= 1.");
	}
	if (min_samples == 0) {
		throw std::invalid_argument("Quantile mapper requires min_samples >= 1.");
	}
}

std::string QuantileMapperOptions::describe() const {
	return "n_quantiles=" + std::to_string(n_quantiles) + ", detrend=" + (detrend ? "true" : "false") +
	       ", min_samples=" + std::to_string(min_samples);
}

QuantileMapper::QuantileMapper(QuantileMapperOptions options) : options_(options) {
	options_.validate();
	reference_.withQuantileCount(options_.n_quantiles);
}

QuantileMapper QuantileMapper::fromReference(QuantileMapperOptions options, QuantileTransformer reference) {
	if (!reference.isFitted()) {
		throw std::invalid_argument("Cannot rebuild a quantile mapper from an unfitted reference.");
	}
	QuantileMapper mapper(options);
	mapper.reference_ = std::move(reference);
	return mapper;
}

void QuantileMapper::fit(const std::vector<double> &reference) {
	const auto finite = static_cast<std::size_t>(
	    std::count_if(reference.begin(), reference.end(), [](double v) { return std::isfinite(v); }));
	if (finite < options_.min_samples) {
		throw std::invalid_argument("Quantile mapper needs at least " + std::to_string(options_.min_samples) +
		                            " finite samples, got " + std::to_string(finite) + ".");
	}
	reference_.fit(reference);
}

void QuantileMapper::transform(std::vector<double> &data) const {
	if (!isFitted()) {
		throw std::runtime_error("QuantileMapper must be fitted before transform.");
	}
	const bool any_finite = std::any_of(data.begin(), data.end(), [](double v) { return std::isfinite(v); });
	if (!any_finite) {
		return;
	}

	LinearTrendTransformer trend;
	if (options_.detrend) {
		trend.fitTransform(data);
	}

	// A constant or single-sample query ranks at 0.5 and lands on the reference median.
	QuantileTransformer query;
	query.withQuantileCount(options_.n_quantiles);
	query.fitTransform(data);
	reference_.inverseTransform(data);

	if (options_.detrend) {
		trend.inverseTransform(data);
	}
}

} // namespace downscale::transform
