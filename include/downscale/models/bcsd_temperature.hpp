#pragma once

#include "downscale/models/bcsd_base.hpp"

#include <vector>

namespace downscale::models {

/**
 * @brief Every intermediate column of a temperature prediction.
 */
struct TemperatureDecomposition {
	std::vector<core::TimeSeries::TimePoint> timestamps;
	/// Centered rolling mean of the query within each calendar month.
	std::vector<double> trend;
	/// trend minus the source climatology.
	std::vector<double> shift;
	/// query minus shift.
	std::vector<double> detrended;
	/// detrended after quantile mapping.
	std::vector<double> mapped;
	/// mapped plus shift.
	std::vector<double> restored;
	/// restored, or its anomaly against the target climatology.
	std::vector<double> result;

	/// All columns as one labelled multivariate series.
	core::TimeSeries toTimeSeries() const;
};

/**
 * @class BcsdTemperature
 * @brief BCSD bias correction for temperature with trend preservation.
 *
 * The query's long-term shift relative to the source climatology is removed
 * before quantile mapping and added back afterwards, so the model-projected
 * warming survives the correction. Anomalies are differences against the
 * target climatology.
 */
class BcsdTemperature final : public BcsdBase {
public:
	explicit BcsdTemperature(BcsdConfig config = {});

	static BcsdBuilder<BcsdTemperature> builder() {
		return {};
	}

	void fit(const core::TimeSeries &source, const core::TimeSeries &target) override;
	core::TimeSeries predict(const core::TimeSeries &source) const override;

	/**
	 * @brief Runs the prediction pipeline and keeps each stage.
	 * @throws core::NotFittedError Before fit().
	 * @throws core::GroupKeyMismatchError If the query has a group unseen during fit.
	 */
	TemperatureDecomposition decompose(const core::TimeSeries &source) const;

	const Climatology &sourceClimatology() const;

	void restoreState(BcsdState state) override;

	std::string getName() const override {
		return "BcsdTemperature";
	}

protected:
	std::string missingState() const override;

private:
	std::vector<double> extractTrend(const core::TimeSeries &query) const;
};

} // namespace downscale::models
