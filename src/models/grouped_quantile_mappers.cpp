#include "downscale/models/grouped_quantile_mappers.hpp"

#include "downscale/utils/logging.hpp"

#include <stdexcept>
#include <string>

namespace downscale::models {

GroupedQuantileMappers::GroupedQuantileMappers(transform::QuantileMapperOptions options) : options_(options) {
	options_.validate();
}

void GroupedQuantileMappers::fit(const std::vector<double> &values, const grouping::GroupIndex &groups) {
	std::map<GroupKey, transform::QuantileMapper> fitted;
	for (const auto &group : groups) {
		if (group.rows.size() < options_.min_samples) {
			DOWNSCALE_WARN("Group {} has {} samples, {} required.", group.key, group.rows.size(),
			               options_.min_samples);
			throw core::InsufficientDataError(group.key, "Insufficient data to fit quantile mapper for group key " +
			                                                 std::to_string(group.key) + ": " +
			                                                 std::to_string(group.rows.size()) + " samples.");
		}
		transform::QuantileMapper mapper(options_);
		try {
			mapper.fit(grouping::gather(values, group.rows));
		} catch (const std::invalid_argument &e) {
			throw core::InsufficientDataError(group.key, "Insufficient data to fit quantile mapper for group key " +
			                                                 std::to_string(group.key) + ": " + e.what());
		}
		fitted.emplace(group.key, std::move(mapper));
	}
	mappers_ = std::move(fitted);
	DOWNSCALE_DEBUG("Fitted {} quantile mappers ({}).", mappers_.size(), options_.describe());
}

std::vector<double> GroupedQuantileMappers::transform(const std::vector<double> &values,
                                                      const grouping::GroupIndex &groups) const {
	std::vector<double> result(values.size());
	std::vector<unsigned char> written(values.size(), 0);

	for (const auto &group : groups) {
		const auto &mapper = at(group.key);
		auto subset = grouping::gather(values, group.rows);
		mapper.transform(subset);
		for (std::size_t i = 0; i < group.rows.size(); ++i) {
			const auto row = group.rows[i];
			if (written[row]) {
				throw std::logic_error("Row " + std::to_string(row) + " belongs to more than one group.");
			}
			result[row] = subset[i];
			written[row] = 1;
		}
	}
	for (std::size_t row = 0; row < written.size(); ++row) {
		if (!written[row]) {
			throw std::logic_error("Row " + std::to_string(row) + " was not assigned to any group.");
		}
	}
	return result;
}

const transform::QuantileMapper &GroupedQuantileMappers::at(GroupKey key) const {
	const auto it = mappers_.find(key);
	if (it == mappers_.end()) {
		DOWNSCALE_WARN("No quantile mapper fitted for group key {}.", key);
		throw core::GroupKeyMismatchError(key, "No mapper fit for group key " + std::to_string(key) + ".");
	}
	return it->second;
}

std::vector<GroupKey> GroupedQuantileMappers::keys() const {
	std::vector<GroupKey> keys;
	keys.reserve(mappers_.size());
	for (const auto &entry : mappers_) {
		keys.push_back(entry.first);
	}
	return keys;
}

void GroupedQuantileMappers::assign(std::map<GroupKey, transform::QuantileMapper> mappers) {
	for (const auto &entry : mappers) {
		if (!entry.second.isFitted()) {
			throw std::invalid_argument("Quantile mapper for group key " + std::to_string(entry.first) +
			                            " is not fitted.");
		}
	}
	mappers_ = std::move(mappers);
}

} // namespace downscale::models
