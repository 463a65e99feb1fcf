#pragma once

#include "downscale/core/errors.hpp"
#include "downscale/grouping/time_grouper.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace downscale::models {

using core::GroupKey;

/**
 * @class Climatology
 * @brief Long-run mean per recurring time group.
 */
class Climatology {
public:
	Climatology() = default;
	explicit Climatology(std::map<GroupKey, double> means);

	/**
	 * @brief Arithmetic mean of @p values over each group's rows.
	 * @throws std::invalid_argument If a group has no finite value.
	 */
	static Climatology fromGroups(const std::vector<double> &values, const grouping::GroupIndex &groups);

	/**
	 * @throws core::GroupKeyMismatchError If @p key was not part of the fitted data.
	 */
	double at(GroupKey key) const;

	bool contains(GroupKey key) const {
		return means_.count(key) != 0;
	}
	bool empty() const {
		return means_.empty();
	}
	std::size_t size() const {
		return means_.size();
	}
	std::vector<GroupKey> keys() const;
	const std::map<GroupKey, double> &values() const {
		return means_;
	}
	/**
	 * @brief Smallest mean; NaN if any mean is NaN.
	 * @throws std::logic_error If the climatology is empty.
	 */
	double minValue() const;

	/**
	 * @brief Per-row climatology for the given row keys.
	 */
	std::vector<double> lookup(const std::vector<GroupKey> &keys) const;

	bool operator==(const Climatology &other) const {
		return means_ == other.means_;
	}

private:
	std::map<GroupKey, double> means_;
};

} // namespace downscale::models
