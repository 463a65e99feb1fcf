#pragma once

#include "downscale/core/time_series.hpp"
#include "downscale/utils/metrics.hpp"

#include <stdexcept>
#include <string>

namespace downscale::models {

/**
 * @class IDownscaler
 * @brief An interface for pointwise downscaling models.
 *
 * A downscaler is fitted on a paired source (simulated) and target (observed)
 * training series and then corrects new source series. Predictions are
 * index-aligned to the query.
 */
class IDownscaler {
public:
	virtual ~IDownscaler() = default;

	/**
	 * @brief Fits the model on paired training series.
	 * @param source The biased series, e.g. a climate model simulation.
	 * @param target The reference series, e.g. station observations.
	 */
	virtual void fit(const core::TimeSeries &source, const core::TimeSeries &target) = 0;

	/**
	 * @brief Corrects a new source series.
	 * @return A series with exactly the query's timestamps.
	 */
	virtual core::TimeSeries predict(const core::TimeSeries &source) const = 0;

	virtual bool isFitted() const = 0;

	/**
	 * @brief Accuracy of predict(@p source) against @p observed.
	 *
	 * Only meaningful for models predicting absolute values rather than anomalies.
	 */
	virtual utils::AccuracyMetrics score(const core::TimeSeries &source, const core::TimeSeries &observed) const {
		const auto predicted = predict(source);
		if (predicted.getTimestamps() != observed.getTimestamps()) {
			throw std::invalid_argument("Observed series must share the query's timestamps.");
		}
		return utils::Metrics::summarize(observed.getValues(), predicted.getValues());
	}

	virtual std::string getName() const = 0;
};

} // namespace downscale::models
