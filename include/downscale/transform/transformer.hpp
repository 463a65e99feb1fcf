#pragma once

#include <vector>

namespace downscale::transform {

/**
 * @brief A fitted, invertible element-wise transform of a value column.
 */
class Transformer {
public:
	virtual ~Transformer() = default;

	virtual void fit(const std::vector<double> &data) = 0;
	virtual void transform(std::vector<double> &data) const = 0;
	virtual void inverseTransform(std::vector<double> &data) const = 0;

	virtual void fitTransform(std::vector<double> &data) {
		fit(data);
		transform(data);
	}
};

} // namespace downscale::transform
