#include "downscale/models/climatology.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace downscale::models {

Climatology::Climatology(std::map<GroupKey, double> means) : means_(std::move(means)) {
}

Climatology Climatology::fromGroups(const std::vector<double> &values, const grouping::GroupIndex &groups) {
	std::map<GroupKey, double> means;
	for (const auto &group : groups) {
		double sum = 0.0;
		std::size_t count = 0;
		for (auto row : group.rows) {
			const double value = values.at(row);
			if (std::isfinite(value)) {
				sum += value;
				++count;
			}
		}
		if (count == 0) {
			throw std::invalid_argument("Cannot compute climatology for group " + std::to_string(group.key) +
			                            ": no finite values.");
		}
		means[group.key] = sum / static_cast<double>(count);
	}
	return Climatology(std::move(means));
}

double Climatology::at(GroupKey key) const {
	const auto it = means_.find(key);
	if (it == means_.end()) {
		throw core::GroupKeyMismatchError(key, "No climatology for group key " + std::to_string(key) + ".");
	}
	return it->second;
}

std::vector<GroupKey> Climatology::keys() const {
	std::vector<GroupKey> keys;
	keys.reserve(means_.size());
	for (const auto &entry : means_) {
		keys.push_back(entry.first);
	}
	return keys;
}

double Climatology::minValue() const {
	if (means_.empty()) {
		throw std::logic_error("Climatology is empty.");
	}
	double minimum = std::numeric_limits<double>::infinity();
	for (const auto &entry : means_) {
		if (std::isnan(entry.second)) {
			return entry.second;
		}
		minimum = std::min(minimum, entry.second);
	}
	return minimum;
}

std::vector<double> Climatology::lookup(const std::vector<GroupKey> &keys) const {
	std::vector<double> result;
	result.reserve(keys.size());
	for (auto key : keys) {
		result.push_back(at(key));
	}
	return result;
}

} // namespace downscale::models
