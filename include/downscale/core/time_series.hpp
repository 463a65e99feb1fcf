#pragma once

#include <chrono>
#include <cmath>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace downscale::core {

/**
 * @class TimeSeries
 * @brief A sequence of observations indexed by strictly increasing timestamps.
 *
 * Values are stored column-wise, one vector per dimension, so per-column
 * numerical work can run over contiguous memory. The number of values in
 * every column always matches the number of timestamps.
 */
class TimeSeries {
public:
	using TimePoint = std::chrono::system_clock::time_point;
	using Value = double;
	enum class ValueLayout { ByRow, ByColumn };
	using Metadata = std::unordered_map<std::string, std::string>;

	/**
	 * @brief Constructs a univariate TimeSeries.
	 * @throws std::invalid_argument If sizes differ or timestamps are not strictly increasing.
	 */
	TimeSeries(std::vector<TimePoint> timestamps, std::vector<Value> values, std::vector<std::string> labels = {},
	           Metadata metadata = {})
	    : timestamps_(std::move(timestamps)), values_by_dimension_(1), metadata_(std::move(metadata)) {
		if (timestamps_.size() != values.size()) {
			throw std::invalid_argument("Timestamps and values vectors must have the same size.");
		}
		values_by_dimension_[0] = std::move(values);
		validateTimestampOrder();
		if (!labels.empty() && labels.size() != 1) {
			throw std::invalid_argument("Labels must match the number of dimensions.");
		}
		labels_ = std::move(labels);
	}

	TimeSeries(std::vector<TimePoint> timestamps, std::vector<std::vector<Value>> values, ValueLayout layout,
	           std::vector<std::string> labels = {}, Metadata metadata = {})
	    : timestamps_(std::move(timestamps)), metadata_(std::move(metadata)) {
		if (layout == ValueLayout::ByRow) {
			initializeFromRows(std::move(values));
		} else {
			initializeFromColumns(std::move(values));
		}
		validateTimestampOrder();
		if (!labels.empty() && labels.size() != values_by_dimension_.size()) {
			throw std::invalid_argument("Labels must match the number of dimensions.");
		}
		labels_ = std::move(labels);
	}

	const std::vector<TimePoint> &getTimestamps() const {
		return timestamps_;
	}

	/**
	 * @brief Gets the primary value column (dimension 0).
	 */
	const std::vector<Value> &getValues() const {
		if (values_by_dimension_.empty()) {
			throw std::runtime_error("TimeSeries contains no value dimensions.");
		}
		return values_by_dimension_.front();
	}

	const std::vector<Value> &getValues(std::size_t dimension) const {
		if (dimension >= values_by_dimension_.size()) {
			throw std::out_of_range("Requested dimension exceeds the number of value dimensions.");
		}
		return values_by_dimension_[dimension];
	}

	std::size_t dimensions() const {
		return values_by_dimension_.size();
	}

	bool isMultivariate() const {
		return dimensions() > 1;
	}

	const std::vector<std::string> &labels() const {
		return labels_;
	}

	void setLabels(std::vector<std::string> labels) {
		if (!labels.empty() && labels.size() != dimensions()) {
			throw std::invalid_argument("Labels must match the number of dimensions.");
		}
		labels_ = std::move(labels);
	}

	/**
	 * @brief Position of the column carrying @p label, if any.
	 */
	std::optional<std::size_t> dimensionIndex(const std::string &label) const {
		for (std::size_t i = 0; i < labels_.size(); ++i) {
			if (labels_[i] == label) {
				return i;
			}
		}
		return std::nullopt;
	}

	const Metadata &metadata() const {
		return metadata_;
	}

	void setMetadata(Metadata metadata) {
		metadata_ = std::move(metadata);
	}

	size_t size() const {
		return timestamps_.size();
	}

	bool isEmpty() const {
		return size() == 0;
	}

	/**
	 * @brief Extracts one column as a univariate series sharing this index.
	 */
	TimeSeries selectDimension(std::size_t dimension) const {
		std::vector<std::string> labels;
		if (!labels_.empty()) {
			labels.push_back(labels_.at(dimension));
		}
		return TimeSeries(timestamps_, getValues(dimension), std::move(labels), metadata_);
	}

	/**
	 * @brief Builds a univariate series on this index with new values.
	 * @throws std::invalid_argument If the value count differs from the index length.
	 */
	TimeSeries withValues(std::vector<Value> values) const {
		std::vector<std::string> labels;
		if (labels_.size() == 1) {
			labels = labels_;
		}
		return TimeSeries(timestamps_, std::move(values), std::move(labels), metadata_);
	}

	TimeSeries slice(std::size_t start, std::size_t end) const {
		if (start > end) {
			throw std::invalid_argument("Slice start index must not exceed end index.");
		}
		if (end > size()) {
			throw std::out_of_range("Slice end index exceeds the length of the time series.");
		}

		std::vector<TimePoint> sliced_timestamps(timestamps_.begin() + static_cast<std::ptrdiff_t>(start),
		                                         timestamps_.begin() + static_cast<std::ptrdiff_t>(end));
		std::vector<std::vector<Value>> sliced_columns;
		sliced_columns.reserve(dimensions());
		for (const auto &dimension : values_by_dimension_) {
			sliced_columns.emplace_back(dimension.begin() + static_cast<std::ptrdiff_t>(start),
			                            dimension.begin() + static_cast<std::ptrdiff_t>(end));
		}
		return TimeSeries(std::move(sliced_timestamps), std::move(sliced_columns), ValueLayout::ByColumn, labels_,
		                  metadata_);
	}

	bool hasMissingValues() const {
		for (const auto &dimension : values_by_dimension_) {
			for (double v : dimension) {
				if (!std::isfinite(v)) {
					return true;
				}
			}
		}
		return false;
	}

private:
	void initializeFromRows(std::vector<std::vector<Value>> rows) {
		if (rows.size() != timestamps_.size()) {
			throw std::invalid_argument("Row-major values must match the number of timestamps.");
		}
		if (rows.empty()) {
			values_by_dimension_.clear();
			return;
		}
		const auto dimension_count = rows.front().size();
		for (const auto &row : rows) {
			if (row.size() != dimension_count) {
				throw std::invalid_argument("All rows must have the same number of dimensions.");
			}
		}
		values_by_dimension_.assign(dimension_count, std::vector<Value>(rows.size()));
		for (std::size_t i = 0; i < rows.size(); ++i) {
			for (std::size_t j = 0; j < dimension_count; ++j) {
				values_by_dimension_[j][i] = rows[i][j];
			}
		}
	}

	void initializeFromColumns(std::vector<std::vector<Value>> columns) {
		if (columns.empty()) {
			values_by_dimension_.clear();
			return;
		}
		for (const auto &column : columns) {
			if (column.size() != timestamps_.size()) {
				throw std::invalid_argument("Column-major values must align with the number of timestamps.");
			}
		}
		values_by_dimension_ = std::move(columns);
	}

	void validateTimestampOrder() const {
		for (std::size_t i = 1; i < timestamps_.size(); ++i) {
			if (!(timestamps_[i] > timestamps_[i - 1])) {
				throw std::invalid_argument("TimeSeries timestamps must be strictly increasing and unique.");
			}
		}
	}

	std::vector<TimePoint> timestamps_;
	std::vector<std::vector<Value>> values_by_dimension_;
	std::vector<std::string> labels_;
	Metadata metadata_;
};

} // namespace downscale::core
