#pragma once

#include "downscale/transform/transformer.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace downscale::transform {

/**
 * @class QuantileTransformer
 * @brief Maps values onto their empirical cumulative probability.
 *
 * Fitting records evenly spaced reference probabilities on [0, 1] and the
 * matching sample quantiles. transform() interpolates a value to a
 * probability (ties receive the middle of their probability range, values
 * outside the fitted range clip to 0 or 1); inverseTransform() maps a
 * probability back to a value. Non-finite values pass through untouched.
 */
class QuantileTransformer final : public Transformer {
public:
	QuantileTransformer();

	QuantileTransformer &withQuantileCount(std::size_t n_quantiles);
	QuantileTransformer &withQuantiles(std::vector<double> references, std::vector<double> quantiles);

	void fit(const std::vector<double> &data) override;
	void transform(std::vector<double> &data) const override;
	void inverseTransform(std::vector<double> &data) const override;

	bool isFitted() const {
		return !quantiles_.empty();
	}
	std::size_t quantileCount() const {
		return n_quantiles_;
	}
	const std::vector<double> &references() const {
		return references_;
	}
	const std::vector<double> &quantiles() const {
		return quantiles_;
	}

private:
	void ensureFitted() const;

	std::size_t n_quantiles_;
	std::vector<double> references_;
	std::vector<double> quantiles_;
};

struct LinearTrendParams {
	double intercept = 0.0;
	double slope = 0.0;
};

/**
 * @class LinearTrendTransformer
 * @brief Removes an ordinary least squares line fitted against sample position.
 */
class LinearTrendTransformer final : public Transformer {
public:
	LinearTrendTransformer() = default;

	LinearTrendTransformer &withParameters(LinearTrendParams params);

	void fit(const std::vector<double> &data) override;
	void transform(std::vector<double> &data) const override;
	void inverseTransform(std::vector<double> &data) const override;

	const std::optional<LinearTrendParams> &parameters() const {
		return params_;
	}

private:
	void ensureParams() const;

	std::optional<LinearTrendParams> params_;
};

} // namespace downscale::transform
