#include "downscale/models/bcsd_precipitation.hpp"

#include "downscale/core/errors.hpp"

#include <sstream>
#include <stdexcept>

namespace downscale::models {

BcsdPrecipitation::BcsdPrecipitation(BcsdConfig config) : BcsdBase(std::move(config)) {
}

void BcsdPrecipitation::fit(const core::TimeSeries &source, const core::TimeSeries &target) {
	resetFit();
	// The source series is validated but not used: the mappers take the
	// query's own distribution as the source side at predict time.
	prepareInput(source);
	const auto target_series = prepareInput(target);

	const auto &grouping = mappingGrouping(false);
	const auto groups = grouping::fitGroups(grouping, target_series.getTimestamps());
	auto climatology = Climatology::fromGroups(target_series.getValues(), groups);
	validateClimatology(climatology);

	GroupedQuantileMappers mappers(config_.qm_options);
	mappers.fit(target_series.getValues(), groups);

	commitFit(std::move(climatology), std::nullopt, std::move(mappers));
	DOWNSCALE_INFO("BcsdPrecipitation fitted on {} samples in {} groups ({}).", target_series.size(), groups.size(),
	               grouping::describe(grouping));
}

core::TimeSeries BcsdPrecipitation::predict(const core::TimeSeries &source) const {
	requireFitted();
	const auto query = prepareInput(source);
	const auto &grouping = mappingGrouping(false);
	const auto &timestamps = query.getTimestamps();

	auto mapped = quantile_mappers_.transform(query.getValues(), grouping::transformGroups(grouping, timestamps));
	checkShape(query, mapped.size(), "quantile mapping");

	if (config_.return_anoms) {
		const auto climatology = target_climatology_.lookup(grouping::groupKeys(grouping, timestamps));
		for (std::size_t i = 0; i < mapped.size(); ++i) {
			mapped[i] /= climatology[i];
		}
		checkShape(query, mapped.size(), "ratio anomalies");
	}

	DOWNSCALE_DEBUG("BcsdPrecipitation predicted {} samples.", mapped.size());
	return query.withValues(std::move(mapped));
}

void BcsdPrecipitation::restoreState(BcsdState state) {
	validateClimatology(state.target_climatology);
	state.source_climatology.reset();
	BcsdBase::restoreState(std::move(state));
}

void BcsdPrecipitation::validateClimatology(const Climatology &climatology) {
	if (climatology.empty()) {
		throw std::invalid_argument("Target climatology is empty.");
	}
	if (climatology.minValue() > 0.0) {
		return;
	}
	for (const auto &entry : climatology.values()) {
		if (!(entry.second > 0.0)) {
			std::ostringstream message;
			message << "Invalid value in target climatology: group key " << entry.first << " has mean "
			        << entry.second << ", precipitation climatology must be strictly positive.";
			DOWNSCALE_WARN("{}", message.str());
			throw core::DomainValidityError(message.str());
		}
	}
}

} // namespace downscale::models
