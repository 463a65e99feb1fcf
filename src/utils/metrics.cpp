#include "downscale/utils/metrics.hpp"

#include <algorithm>
#include <numeric>

namespace downscale::utils {

namespace {

void validate_lengths(const std::vector<double> &actual, const std::vector<double> &predicted) {
	if (actual.size() != predicted.size() || actual.empty()) {
		throw std::invalid_argument("Actual and predicted vectors must be non-empty and equal length.");
	}
}

double sample_quantile(std::vector<double> values, double q) {
	std::sort(values.begin(), values.end());
	const double position = q * static_cast<double>(values.size() - 1);
	const auto lower = static_cast<std::size_t>(std::floor(position));
	const auto upper = std::min(lower + 1, values.size() - 1);
	const double fraction = position - static_cast<double>(lower);
	return values[lower] + fraction * (values[upper] - values[lower]);
}

} // namespace

double Metrics::mae(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		sum += std::abs(actual[i] - predicted[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::mse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff = actual[i] - predicted[i];
		sum += diff * diff;
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::rmse(const std::vector<double> &actual, const std::vector<double> &predicted) {
	return std::sqrt(mse(actual, predicted));
}

std::optional<double> Metrics::r2(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);

	const double mean_actual = std::accumulate(actual.begin(), actual.end(), 0.0) / static_cast<double>(actual.size());

	double ss_res = 0.0;
	double ss_tot = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		const double diff_res = actual[i] - predicted[i];
		ss_res += diff_res * diff_res;

		const double diff_tot = actual[i] - mean_actual;
		ss_tot += diff_tot * diff_tot;
	}

	if (std::abs(ss_tot) < std::numeric_limits<double>::epsilon()) {
		return std::nullopt;
	}

	return 1.0 - (ss_res / ss_tot);
}

double Metrics::bias(const std::vector<double> &actual, const std::vector<double> &predicted) {
	validate_lengths(actual, predicted);
	double sum = 0.0;
	for (size_t i = 0; i < actual.size(); ++i) {
		sum += (predicted[i] - actual[i]);
	}
	return sum / static_cast<double>(actual.size());
}

double Metrics::quantileBias(const std::vector<double> &actual, const std::vector<double> &predicted, double q) {
	if (actual.empty() || predicted.empty()) {
		throw std::invalid_argument("Quantile bias requires non-empty samples.");
	}
	if (q < 0.0 || q > 1.0) {
		throw std::invalid_argument("Quantile must lie within [0, 1].");
	}
	return sample_quantile(predicted, q) - sample_quantile(actual, q);
}

AccuracyMetrics Metrics::summarize(const std::vector<double> &actual, const std::vector<double> &predicted) {
	AccuracyMetrics metrics;
	metrics.n = actual.size();
	metrics.mae = mae(actual, predicted);
	metrics.rmse = rmse(actual, predicted);
	metrics.bias = bias(actual, predicted);
	metrics.r_squared = r2(actual, predicted);
	return metrics;
}

} // namespace downscale::utils
