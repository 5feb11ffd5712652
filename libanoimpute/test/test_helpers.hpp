#pragma once

#include "libanoimpute/core/dataset.hpp"
#include <Eigen/Dense>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace libanoimpute {
namespace testing {

using json = nlohmann::json;

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

inline json LoadFixture(const std::string &name) {
	const std::string path = std::string(ANOIMPUTE_TEST_DATA_DIR) + "/" + name;
	std::ifstream file(path);
	if (!file.is_open()) {
		throw std::runtime_error("Failed to open file: " + path);
	}
	json j;
	file >> j;
	return j;
}

/// x1, x2, y numeric; b1 categorical (no, yes); m1 categorical (a, b, c)
inline core::Dataset FixtureDataset(const json &fixture) {
	core::Dataset data;
	data.AddNumeric("x1", fixture["x1"].get<std::vector<double>>());
	data.AddNumeric("x2", fixture["x2"].get<std::vector<double>>());
	data.AddNumeric("y", fixture["y"].get<std::vector<double>>());
	data.AddCategorical("b1", fixture["b1"].get<std::vector<std::string>>(), {"no", "yes"});
	data.AddCategorical("m1", fixture["m1"].get<std::vector<std::string>>(), {"a", "b", "c"});
	return data;
}

inline Eigen::MatrixXd FixtureDesign(const json &fixture) {
	const auto x1 = fixture["x1"].get<std::vector<double>>();
	const auto x2 = fixture["x2"].get<std::vector<double>>();
	Eigen::MatrixXd X(static_cast<Eigen::Index>(x1.size()), 2);
	for (size_t i = 0; i < x1.size(); i++) {
		X(static_cast<Eigen::Index>(i), 0) = x1[i];
		X(static_cast<Eigen::Index>(i), 1) = x2[i];
	}
	return X;
}

inline Eigen::VectorXd ToVector(const std::vector<double> &values) {
	return Eigen::Map<const Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
}

} // namespace testing
} // namespace libanoimpute
