#pragma once

#include "downscale/models/bcsd_base.hpp"

namespace downscale::models {

/**
 * @class BcsdPrecipitation
 * @brief Classic BCSD bias correction for precipitation.
 *
 * Quantile maps each time group of the query onto the observed distribution
 * of that group. Anomalies are ratios against the observed climatology, as
 * precipitation is non-negative and ratio scaled.
 */
class BcsdPrecipitation final : public BcsdBase {
public:
	explicit BcsdPrecipitation(BcsdConfig config = {});

	static BcsdBuilder<BcsdPrecipitation> builder() {
		return {};
	}

	/**
	 * @throws core::DomainValidityError If any group's target mean is not strictly positive.
	 * @throws core::InsufficientDataError If a group is too small to fit a mapper.
	 * @throws core::MalformedInputError For unusable inputs.
	 */
	void fit(const core::TimeSeries &source, const core::TimeSeries &target) override;

	/**
	 * @throws core::NotFittedError Before fit().
	 * @throws core::GroupKeyMismatchError If the query has a group unseen during fit.
	 */
	core::TimeSeries predict(const core::TimeSeries &source) const override;

	void restoreState(BcsdState state) override;

	std::string getName() const override {
		return "BcsdPrecipitation";
	}

private:
	static void validateClimatology(const Climatology &climatology);
};

} // namespace downscale::models
