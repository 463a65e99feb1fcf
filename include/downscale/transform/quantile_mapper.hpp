#pragma once

#include "downscale/transform/transformers.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace downscale::transform {

/**
 * @brief Options forwarded verbatim from the BCSD models to every per-group mapper.
 */
struct QuantileMapperOptions {
	/// Upper bound on the number of quantiles stored per distribution.
	std::size_t n_quantiles = 1000;
	/// Remove a linear trend from the query before ranking it, restore it afterwards.
	bool detrend = false;
	/// Fewest finite reference samples accepted by fit().
	std::size_t min_samples = 2;

	/**
	 * @throws std::invalid_argument For a zero quantile count or minimum sample count.
	 */
	void validate() const;
	std::string describe() const;
};

/**
 * @class QuantileMapper
 * @brief Empirical quantile mapping onto a fitted reference distribution.
 *
 * fit() stores the reference (observed) distribution. transform() ranks the
 * query within its own empirical distribution and replaces each value with
 * the reference quantile of the same rank.
 */
class QuantileMapper {
public:
	explicit QuantileMapper(QuantileMapperOptions options = {});

	/**
	 * @brief Rebuilds a mapper from a previously fitted reference transformer.
	 */
	static QuantileMapper fromReference(QuantileMapperOptions options, QuantileTransformer reference);

	/**
	 * @throws std::invalid_argument If @p reference holds fewer than min_samples finite values.
	 */
	void fit(const std::vector<double> &reference);

	/**
	 * @brief Maps @p data in place onto the reference distribution.
	 * @throws std::runtime_error If called before fit().
	 */
	void transform(std::vector<double> &data) const;

	bool isFitted() const {
		return reference_.isFitted();
	}
	const QuantileMapperOptions &options() const {
		return options_;
	}
	const QuantileTransformer &reference() const {
		return reference_;
	}

private:
	QuantileMapperOptions options_;
	QuantileTransformer reference_;
};

} // namespace downscale::transform
