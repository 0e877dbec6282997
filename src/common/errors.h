#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Cadence {

/**
 * Invalid run or histogram configuration. Raised before any tick is issued.
 */
class ConfigurationError : public std::runtime_error {
public:
	explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}

	ConfigurationError(const std::string& what, std::vector<std::string> errors)
		: std::runtime_error(Join(what, errors)), errors_(std::move(errors)) {}

	const std::vector<std::string>& errors() const { return errors_; }

private:
	static std::string Join(const std::string& what, const std::vector<std::string>& errors) {
		std::string out = what;
		for (const auto& e : errors) {
			out += "\n  - " + e;
		}
		return out;
	}

	std::vector<std::string> errors_;
};

}  // namespace Cadence
