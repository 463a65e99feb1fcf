#include "downscale/models/bcsd_temperature.hpp"

#include "downscale/utils/rolling.hpp"

#include <stdexcept>

namespace downscale::models {

core::TimeSeries TemperatureDecomposition::toTimeSeries() const {
	return core::TimeSeries(timestamps, {trend, shift, detrended, mapped, restored, result},
	                        core::TimeSeries::ValueLayout::ByColumn,
	                        {"trend", "shift", "detrended", "mapped", "restored", "result"});
}

BcsdTemperature::BcsdTemperature(BcsdConfig config) : BcsdBase(std::move(config)) {
}

void BcsdTemperature::fit(const core::TimeSeries &source, const core::TimeSeries &target) {
	resetFit();
	const auto source_series = prepareInput(source);
	const auto target_series = prepareInput(target);
	const auto &grouping = mappingGrouping(true);

	auto source_climatology = Climatology::fromGroups(
	    source_series.getValues(), grouping::fitGroups(grouping, source_series.getTimestamps()));

	const auto target_groups = grouping::fitGroups(grouping, target_series.getTimestamps());
	auto target_climatology = Climatology::fromGroups(target_series.getValues(), target_groups);

	GroupedQuantileMappers mappers(config_.qm_options);
	mappers.fit(target_series.getValues(), target_groups);

	commitFit(std::move(target_climatology), std::move(source_climatology), std::move(mappers));
	DOWNSCALE_INFO("BcsdTemperature fitted on {} source / {} target samples in {} groups ({}).",
	               source_series.size(), target_series.size(), target_groups.size(), grouping::describe(grouping));
}

core::TimeSeries BcsdTemperature::predict(const core::TimeSeries &source) const {
	auto decomposition = decompose(source);
	return core::TimeSeries(std::move(decomposition.timestamps), std::move(decomposition.result));
}

TemperatureDecomposition BcsdTemperature::decompose(const core::TimeSeries &source) const {
	requireFitted();
	const auto query = prepareInput(source);
	const auto &grouping = mappingGrouping(true);
	const auto &timestamps = query.getTimestamps();
	const auto &values = query.getValues();
	const auto keys = grouping::groupKeys(grouping, timestamps);
	const std::size_t n = query.size();

	TemperatureDecomposition out;
	out.timestamps = timestamps;
	out.trend = extractTrend(query);

	const auto source_climatology = source_climatology_->lookup(keys);
	out.shift.resize(n);
	out.detrended.resize(n);
	for (std::size_t i = 0; i < n; ++i) {
		out.shift[i] = out.trend[i] - source_climatology[i];
		out.detrended[i] = values[i] - out.shift[i];
	}

	out.mapped = quantile_mappers_.transform(out.detrended, grouping::transformGroups(grouping, timestamps));
	checkShape(query, out.mapped.size(), "quantile mapping");

	out.restored.resize(n);
	for (std::size_t i = 0; i < n; ++i) {
		out.restored[i] = out.mapped[i] + out.shift[i];
	}

	if (config_.return_anoms) {
		const auto target_climatology = target_climatology_.lookup(keys);
		out.result.resize(n);
		for (std::size_t i = 0; i < n; ++i) {
			out.result[i] = out.restored[i] - target_climatology[i];
		}
	} else {
		out.result = out.restored;
	}
	checkShape(query, out.result.size(), "anomaly calculation");

	DOWNSCALE_DEBUG("BcsdTemperature predicted {} samples.", n);
	return out;
}

std::vector<double> BcsdTemperature::extractTrend(const core::TimeSeries &query) const {
	const auto &values = query.getValues();
	std::vector<double> trend(values.size());
	std::size_t covered = 0;
	// The long-term trend is always taken per calendar month.
	for (const auto &group : grouping::transformGroups(grouping::MonthOfYear{}, query.getTimestamps())) {
		const auto rolled = utils::centeredRollingMean(grouping::gather(values, group.rows), config_.trend_window,
		                                               config_.trend_min_periods);
		for (std::size_t i = 0; i < group.rows.size(); ++i) {
			trend[group.rows[i]] = rolled[i];
		}
		covered += group.rows.size();
	}
	checkShape(query, covered, "trend extraction");
	return trend;
}

const Climatology &BcsdTemperature::sourceClimatology() const {
	requireFitted();
	return *source_climatology_;
}

void BcsdTemperature::restoreState(BcsdState state) {
	if (!state.source_climatology || state.source_climatology->empty()) {
		throw std::invalid_argument("Restored temperature state has no source climatology.");
	}
	BcsdBase::restoreState(std::move(state));
}

std::string BcsdTemperature::missingState() const {
	return "source climatology, target climatology, quantile mappers";
}

} // namespace downscale::models
