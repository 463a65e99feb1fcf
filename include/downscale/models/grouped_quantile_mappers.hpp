#pragma once

#include "downscale/core/errors.hpp"
#include "downscale/grouping/time_grouper.hpp"
#include "downscale/transform/quantile_mapper.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace downscale::models {

using core::GroupKey;

/**
 * @class GroupedQuantileMappers
 * @brief One fitted quantile mapper per group key.
 *
 * Grouped data is addressed by row positions, so transform() writes every
 * mapped value straight back to the row it came from and the output keeps
 * the input's time order without re-sorting.
 */
class GroupedQuantileMappers {
public:
	explicit GroupedQuantileMappers(transform::QuantileMapperOptions options = {});

	/**
	 * @brief Fits one mapper per group on the selected rows of @p values.
	 *
	 * The stored mappers are only replaced once every group has been fitted.
	 * @throws core::InsufficientDataError Naming the first group with too few samples.
	 */
	void fit(const std::vector<double> &values, const grouping::GroupIndex &groups);

	/**
	 * @brief Maps each group through its mapper; returns one value per input row.
	 * @throws core::GroupKeyMismatchError If a group has no fitted mapper.
	 * @throws std::logic_error If the groups do not cover every row exactly once.
	 */
	std::vector<double> transform(const std::vector<double> &values, const grouping::GroupIndex &groups) const;

	/**
	 * @throws core::GroupKeyMismatchError If no mapper was fitted for @p key.
	 */
	const transform::QuantileMapper &at(GroupKey key) const;

	bool contains(GroupKey key) const {
		return mappers_.count(key) != 0;
	}
	bool empty() const {
		return mappers_.empty();
	}
	std::size_t size() const {
		return mappers_.size();
	}
	std::vector<GroupKey> keys() const;
	const std::map<GroupKey, transform::QuantileMapper> &mappers() const {
		return mappers_;
	}
	const transform::QuantileMapperOptions &options() const {
		return options_;
	}

	/**
	 * @brief Installs previously fitted mappers, e.g. when restoring a model.
	 * @throws std::invalid_argument If any mapper is unfitted.
	 */
	void assign(std::map<GroupKey, transform::QuantileMapper> mappers);
	void clear() {
		mappers_.clear();
	}

private:
	transform::QuantileMapperOptions options_;
	std::map<GroupKey, transform::QuantileMapper> mappers_;
};

} // namespace downscale::models
