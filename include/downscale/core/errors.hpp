#pragma once

#include <stdexcept>
#include <string>

namespace downscale::core {

using GroupKey = int;

/**
 * @brief Raised when a model is used before it has been fitted.
 */
class NotFittedError : public std::logic_error {
public:
	explicit NotFittedError(const std::string &what) : std::logic_error(what) {
	}
};

/**
 * @brief Raised when fitted statistics fall outside their physical domain,
 * e.g. a non-positive precipitation climatology.
 */
class DomainValidityError : public std::domain_error {
public:
	explicit DomainValidityError(const std::string &what) : std::domain_error(what) {
	}
};

/**
 * @brief Raised when a group key has no fitted counterpart.
 */
class GroupKeyMismatchError : public std::out_of_range {
public:
	GroupKeyMismatchError(GroupKey key, const std::string &what) : std::out_of_range(what), key_(key) {
	}

	GroupKey key() const noexcept {
		return key_;
	}

private:
	GroupKey key_;
};

/**
 * @brief Raised when a group holds too few samples to fit a stable transform.
 */
class InsufficientDataError : public std::invalid_argument {
public:
	InsufficientDataError(GroupKey key, const std::string &what) : std::invalid_argument(what), key_(key) {
	}

	GroupKey key() const noexcept {
		return key_;
	}

private:
	GroupKey key_;
};

/**
 * @brief Raised for inputs that are not a single, regularly indexed value column.
 */
class MalformedInputError : public std::invalid_argument {
public:
	explicit MalformedInputError(const std::string &what) : std::invalid_argument(what) {
	}
};

} // namespace downscale::core
