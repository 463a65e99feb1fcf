#include "downscale/models/bcsd_base.hpp"

#include "downscale/core/errors.hpp"

#include <stdexcept>

namespace downscale::models {

// --- Configuration ---

void BcsdConfig::validate() const {
	grouping::validate(time_grouping);
	grouping::validate(climate_trend_grouping);
	if (grouping::resolutionOf(climate_trend_grouping) != core::Resolution::Daily) {
		throw std::invalid_argument("Climate trend grouping must be a daily grouping, got " +
		                            grouping::describe(climate_trend_grouping) + ".");
	}
	if (trend_window == 0) {
		throw std::invalid_argument("Trend window must be at least 1.");
	}
	if (trend_min_periods == 0 || trend_min_periods > trend_window) {
		throw std::invalid_argument("Trend min_periods must be within 1..trend_window.");
	}
	if (value_column && value_column->empty()) {
		throw std::invalid_argument("Value column name must not be empty.");
	}
	qm_options.validate();
}

std::string BcsdConfig::describe() const {
	std::string text = "time_grouping=" + grouping::describe(time_grouping);
	if (resolution() == core::Resolution::Daily) {
		text += ", climate_trend_grouping=" + grouping::describe(climate_trend_grouping);
	}
	text += ", return_anoms=";
	text += return_anoms ? "true" : "false";
	text += ", trend_window=" + std::to_string(trend_window) +
	        ", trend_min_periods=" + std::to_string(trend_min_periods) + ", " + qm_options.describe();
	return text;
}

// --- Model lifecycle ---

BcsdBase::BcsdBase(BcsdConfig config) : config_(std::move(config)), quantile_mappers_(config_.qm_options) {
	config_.validate();
}

const Climatology &BcsdBase::targetClimatology() const {
	requireFitted();
	return target_climatology_;
}

const GroupedQuantileMappers &BcsdBase::quantileMappers() const {
	requireFitted();
	return quantile_mappers_;
}

BcsdState BcsdBase::exportState() const {
	requireFitted();
	BcsdState state;
	state.target_climatology = target_climatology_;
	state.source_climatology = source_climatology_;
	state.quantile_mappers = quantile_mappers_.mappers();
	return state;
}

void BcsdBase::restoreState(BcsdState state) {
	if (state.target_climatology.empty()) {
		throw std::invalid_argument("Restored state has no target climatology.");
	}
	if (state.quantile_mappers.empty()) {
		throw std::invalid_argument("Restored state has no quantile mappers.");
	}
	for (const auto &entry : state.quantile_mappers) {
		if (!state.target_climatology.contains(entry.first)) {
			throw std::invalid_argument("Restored quantile mapper for group key " + std::to_string(entry.first) +
			                            " has no target climatology.");
		}
	}
	if (state.quantile_mappers.size() != state.target_climatology.size()) {
		throw std::invalid_argument("Restored climatology and quantile mappers cover different group keys.");
	}

	GroupedQuantileMappers mappers(config_.qm_options);
	mappers.assign(std::move(state.quantile_mappers));
	commitFit(std::move(state.target_climatology), std::move(state.source_climatology), std::move(mappers));
	DOWNSCALE_INFO("{} restored with {} groups.", getName(), target_climatology_.size());
}

void BcsdBase::requireFitted() const {
	if (state_ != FitState::Fitted) {
		throw core::NotFittedError(getName() + " is not fitted: missing " + missingState() +
		                           ". Call fit() before using the model.");
	}
}

std::string BcsdBase::missingState() const {
	return "target climatology, quantile mappers";
}

core::TimeSeries BcsdBase::prepareInput(const core::TimeSeries &series) const {
	auto univariate = core::ensureUnivariate(series, config_.value_column);
	core::checkDatetimeIndex(univariate, config_.resolution());
	return univariate;
}

const grouping::TimeGrouping &BcsdBase::mappingGrouping(bool climate_trend) const {
	if (climate_trend && config_.resolution() == core::Resolution::Daily) {
		return config_.climate_trend_grouping;
	}
	return config_.time_grouping;
}

void BcsdBase::resetFit() {
	state_ = FitState::Unfit;
	target_climatology_ = Climatology();
	source_climatology_.reset();
	quantile_mappers_.clear();
}

void BcsdBase::commitFit(Climatology target, std::optional<Climatology> source, GroupedQuantileMappers mappers) {
	target_climatology_ = std::move(target);
	source_climatology_ = std::move(source);
	quantile_mappers_ = std::move(mappers);
	state_ = FitState::Fitted;
}

void BcsdBase::checkShape(const core::TimeSeries &input, std::size_t output_size, const char *stage) {
	if (output_size != input.size()) {
		throw std::logic_error(std::string("Reassembled output of ") + stage + " has " +
		                       std::to_string(output_size) + " samples, input has " +
		                       std::to_string(input.size()) + ".");
	}
}

} // namespace downscale::models
