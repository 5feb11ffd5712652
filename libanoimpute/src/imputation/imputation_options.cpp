#include "libanoimpute/imputation/imputation_options.hpp"
#include <cctype>
#include <stdexcept>

namespace libanoimpute {
namespace imputation {

namespace {

std::string ToLower(std::string s) {
	for (auto &c : s) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return s;
}

bool ParseBool(const std::string &key, const std::string &value) {
	const std::string v = ToLower(value);
	if (v == "true" || v == "t" || v == "1" || v == "yes") {
		return true;
	}
	if (v == "false" || v == "f" || v == "0" || v == "no") {
		return false;
	}
	throw std::invalid_argument("Option '" + key + "' must be a boolean, got '" + value + "'");
}

double ParseDouble(const std::string &key, const std::string &value) {
	try {
		size_t consumed = 0;
		const double parsed = std::stod(value, &consumed);
		if (consumed != value.size()) {
			throw std::invalid_argument(value);
		}
		return parsed;
	} catch (const std::logic_error &) {
		throw std::invalid_argument("Option '" + key + "' must be a number, got '" + value + "'");
	}
}

uint64_t ParseUnsigned(const std::string &key, const std::string &value) {
	try {
		if (value.empty() || value[0] == '-') {
			throw std::invalid_argument(value);
		}
		size_t consumed = 0;
		const unsigned long long parsed = std::stoull(value, &consumed);
		if (consumed != value.size()) {
			throw std::invalid_argument(value);
		}
		return static_cast<uint64_t>(parsed);
	} catch (const std::logic_error &) {
		throw std::invalid_argument("Option '" + key + "' must be a non-negative integer, got '" + value + "'");
	}
}

} // namespace

ImputationOptions ImputationOptions::ParseFromMap(const std::map<std::string, std::string> &options_map) {
	ImputationOptions opts;

	for (const auto &entry : options_map) {
		const std::string key = ToLower(entry.first);
		const std::string &value = entry.second;

		if (key == "family") {
			opts.family = core::ParseFamily(value);
		} else if (key == "robust") {
			opts.robust = ParseBool(key, value);
		} else if (key == "imp_var") {
			opts.imp_var = ParseBool(key, value);
		} else if (key == "imp_suffix") {
			opts.imp_suffix = value;
		} else if (key == "mod_cat") {
			opts.mod_cat = ParseBool(key, value);
		} else if (key == "fit_trace") {
			const std::string mode = ToLower(value);
			if (mode == "discard") {
				opts.fit_trace = FitTrace::DISCARD;
			} else if (mode == "surface") {
				opts.fit_trace = FitTrace::SURFACE;
			} else {
				throw std::invalid_argument("Option 'fit_trace' must be 'discard' or 'surface', got '" + value + "'");
			}
		} else if (key == "intercept") {
			opts.regression.intercept = ParseBool(key, value);
		} else if (key == "max_iterations") {
			opts.regression.max_iterations = static_cast<size_t>(ParseUnsigned(key, value));
		} else if (key == "tolerance") {
			opts.regression.tolerance = ParseDouble(key, value);
		} else if (key == "qr_tolerance") {
			opts.regression.qr_tolerance = ParseDouble(key, value);
		} else if (key == "huber_k") {
			opts.regression.huber_k = ParseDouble(key, value);
		} else if (key == "bisquare_c") {
			opts.regression.bisquare_c = ParseDouble(key, value);
		} else if (key == "robust_max_iterations") {
			opts.regression.robust_max_iterations = static_cast<size_t>(ParseUnsigned(key, value));
		} else if (key == "seed") {
			opts.seed = ParseUnsigned(key, value);
		} else {
			throw std::invalid_argument("Unknown option: '" + entry.first +
			                            "'. Valid options are: family, robust, imp_var, imp_suffix, mod_cat, "
			                            "fit_trace, intercept, max_iterations, tolerance, qr_tolerance, huber_k, "
			                            "bisquare_c, robust_max_iterations, seed");
		}
	}

	opts.Validate();
	return opts;
}

void ImputationOptions::Validate() const {
	if (imp_var && imp_suffix.empty()) {
		throw std::invalid_argument("imp_suffix must not be empty when imp_var is set");
	}
	if (!core::IsAuto(family)) {
		std::get<core::FamilySpec>(family).Validate();
	}
	regression.Validate();
}

} // namespace imputation
} // namespace libanoimpute
