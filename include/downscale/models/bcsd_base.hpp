#pragma once

#include "downscale/core/series_checks.hpp"
#include "downscale/grouping/time_grouper.hpp"
#include "downscale/models/climatology.hpp"
#include "downscale/models/grouped_quantile_mappers.hpp"
#include "downscale/models/idownscaler.hpp"
#include "downscale/transform/quantile_mapper.hpp"
#include "downscale/utils/logging.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace downscale::models {

/**
 * @brief Configuration shared by the BCSD models. Validated once by the
 * model constructor and immutable afterwards.
 */
struct BcsdConfig {
	/// Grouping of the data; MonthOfYear for monthly data, a daily grouping otherwise.
	grouping::TimeGrouping time_grouping = grouping::MonthOfYear{};
	/// Temperature climatology and mapping grouping used at daily resolution.
	grouping::TimeGrouping climate_trend_grouping = grouping::DayOfMonth{};
	/// Return anomalies against the target climatology instead of absolute values.
	bool return_anoms = true;
	/// Centered rolling-mean window (in samples of one calendar month group).
	std::size_t trend_window = 9;
	std::size_t trend_min_periods = 1;
	/// Column to use when inputs carry several labelled columns.
	std::optional<std::string> value_column;
	transform::QuantileMapperOptions qm_options;

	/**
	 * @throws std::invalid_argument For out-of-range settings.
	 */
	void validate() const;

	core::Resolution resolution() const {
		return grouping::resolutionOf(time_grouping);
	}

	std::string describe() const;
};

/**
 * @brief The complete fitted state of a BCSD model.
 */
struct BcsdState {
	Climatology target_climatology;
	/// Temperature only.
	std::optional<Climatology> source_climatology;
	std::map<GroupKey, transform::QuantileMapper> quantile_mappers;
};

/**
 * @class BcsdBuilder
 * @brief Fluent configuration of a BCSD model.
 */
template <typename Model>
class BcsdBuilder {
public:
	BcsdBuilder &withTimeGrouping(grouping::TimeGrouping grouping) {
		config_.time_grouping = grouping;
		return *this;
	}
	BcsdBuilder &withClimateTrendGrouping(grouping::TimeGrouping grouping) {
		config_.climate_trend_grouping = grouping;
		return *this;
	}
	BcsdBuilder &withReturnAnoms(bool return_anoms) {
		config_.return_anoms = return_anoms;
		return *this;
	}
	BcsdBuilder &withTrendWindow(std::size_t window, std::size_t min_periods = 1) {
		config_.trend_window = window;
		config_.trend_min_periods = min_periods;
		return *this;
	}
	BcsdBuilder &withValueColumn(std::string column) {
		config_.value_column = std::move(column);
		return *this;
	}
	BcsdBuilder &withQuantileMapperOptions(transform::QuantileMapperOptions options) {
		config_.qm_options = options;
		return *this;
	}

	Model build() const {
		DOWNSCALE_DEBUG("Building BCSD model: {}.", config_.describe());
		return Model(config_);
	}

private:
	BcsdConfig config_;
};

/**
 * @class BcsdBase
 * @brief Lifecycle and fitted state shared by the precipitation and temperature models.
 */
class BcsdBase : public IDownscaler {
public:
	enum class FitState { Unfit, Fitted };

	const BcsdConfig &config() const {
		return config_;
	}
	FitState state() const {
		return state_;
	}
	bool isFitted() const override {
		return state_ == FitState::Fitted;
	}

	/**
	 * @throws core::NotFittedError Before a successful fit.
	 */
	const Climatology &targetClimatology() const;
	const GroupedQuantileMappers &quantileMappers() const;

	BcsdState exportState() const;

	/**
	 * @brief Replaces the fitted state, e.g. with one exported from another instance.
	 * @throws std::invalid_argument If the state is incomplete or inconsistent.
	 */
	virtual void restoreState(BcsdState state);

protected:
	explicit BcsdBase(BcsdConfig config);

	void requireFitted() const;

	/// Single-column, index-checked copy of @p series.
	core::TimeSeries prepareInput(const core::TimeSeries &series) const;

	/// Grouping used for climatologies and quantile mapping.
	const grouping::TimeGrouping &mappingGrouping(bool climate_trend) const;

	void resetFit();
	void commitFit(Climatology target, std::optional<Climatology> source, GroupedQuantileMappers mappers);

	/// Fitted fields missing in the current state, for error messages.
	virtual std::string missingState() const;

	static void checkShape(const core::TimeSeries &input, std::size_t output_size, const char *stage);

	BcsdConfig config_;
	FitState state_ = FitState::Unfit;
	Climatology target_climatology_;
	std::optional<Climatology> source_climatology_;
	GroupedQuantileMappers quantile_mappers_;
};

} // namespace downscale::models
