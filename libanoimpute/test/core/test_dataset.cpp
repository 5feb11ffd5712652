#include <catch2/catch_test_macros.hpp>

#include "libanoimpute/core/dataset.hpp"
#include "../test_helpers.hpp"

using namespace libanoimpute::core;
using libanoimpute::testing::kNaN;

TEST_CASE("Dataset - Column construction", "[core][dataset]") {
	Dataset data;
	data.AddNumeric("x", {1.0, kNaN, 3.0});
	data.AddCategorical("g", {"b", "", "a"});
	data.AddLogical("flag", {true, false, true}, {false, false, true});

	SECTION("Numeric NaN marks missing") {
		const Column &x = data.GetColumn("x");
		REQUIRE(x.Type() == ColumnType::NUMERIC);
		REQUIRE(x.MissingCount() == 1);
		REQUIRE(x.IsMissing(1));
		REQUIRE(x.Value(2) == 3.0);
	}

	SECTION("Categorical levels are inferred in order of appearance") {
		const Column &g = data.GetColumn("g");
		REQUIRE(g.Levels() == std::vector<std::string> {"b", "a"});
		REQUIRE(g.LevelCode(0) == 0);
		REQUIRE(g.LevelCode(2) == 1);
		REQUIRE(g.IsMissing(1));
		REQUIRE(g.Label(2) == "a");
		REQUIRE(g.Label(1) == kMissingLabel);
	}

	SECTION("Logical columns have two levels") {
		const Column &flag = data.GetColumn("flag");
		REQUIRE(flag.LevelCount() == 2);
		REQUIRE(flag.LogicalValue(0));
		REQUIRE(flag.IsMissing(2));
		REQUIRE(flag.Label(1) == "FALSE");
	}

	SECTION("Lookup") {
		REQUIRE(data.RowCount() == 3);
		REQUIRE(data.ColumnCount() == 3);
		REQUIRE(data.FindColumnIndex("g") == 1);
		REQUIRE(data.FindColumnIndex("nope") == -1);
		REQUIRE_THROWS_AS(data.GetColumn("nope"), std::invalid_argument);
		REQUIRE(data.ColumnNames() == std::vector<std::string> {"x", "g", "flag"});
	}
}

TEST_CASE("Dataset - Invalid construction", "[core][dataset]") {
	Dataset data;
	data.AddNumeric("x", {1.0, 2.0});

	REQUIRE_THROWS_AS(data.AddNumeric("x", {1.0, 2.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(data.AddNumeric("z", {1.0, 2.0, 3.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(data.AddCategorical("g", {"a", "c"}, {"a", "b"}), std::invalid_argument);
	REQUIRE_THROWS_AS(Column::Categorical("g", {"a"}, {0, 1}), std::invalid_argument);
}

TEST_CASE("Dataset - Cell updates", "[core][dataset]") {
	Dataset data;
	data.AddNumeric("x", {kNaN, 2.0});
	data.AddCategorical("g", {"", "lo"}, {"lo", "hi"});
	data.AddLogical("flag", {false, false}, {true, false});

	SECTION("Setting a value clears the missing flag") {
		data.GetColumn("x").SetNumeric(0, 5.0);
		data.GetColumn("g").SetLevel(0, 1);
		data.GetColumn("flag").SetLevel(0, 1);
		REQUIRE_FALSE(data.GetColumn("x").HasMissing());
		REQUIRE(data.GetColumn("g").Label(0) == "hi");
		REQUIRE(data.GetColumn("flag").LogicalValue(0));
		REQUIRE_FALSE(data.GetColumn("flag").HasMissing());
	}

	SECTION("Placeholders") {
		data.GetColumn("x").SetPlaceholder(0);
		data.GetColumn("g").SetPlaceholder(0);
		data.GetColumn("flag").SetPlaceholder(0);
		REQUIRE(data.GetColumn("x").Value(0) == 1.0);
		REQUIRE(data.GetColumn("g").Label(0) == "lo");
		REQUIRE_FALSE(data.GetColumn("flag").LogicalValue(0));
		REQUIRE_FALSE(data.GetColumn("flag").IsMissing(0));
	}

	SECTION("Type checks") {
		REQUIRE_THROWS_AS(data.GetColumn("g").SetNumeric(0, 1.0), std::invalid_argument);
		REQUIRE_THROWS_AS(data.GetColumn("x").SetLevel(0, 0), std::invalid_argument);
		REQUIRE_THROWS_AS(data.GetColumn("g").SetLevel(0, 2), std::invalid_argument);
	}
}

TEST_CASE("Dataset - Coercion to logical", "[core][dataset]") {
	Dataset data;
	data.AddCategorical("s", {"TRUE", "F", "maybe", ""});
	data.AddNumeric("n", {0.0, 2.5, kNaN, 1.0});

	Column &s = data.GetColumn("s");
	s.CoerceToLogical();
	REQUIRE(s.Type() == ColumnType::LOGICAL);
	REQUIRE(s.LogicalValue(0));
	REQUIRE_FALSE(s.LogicalValue(1));
	REQUIRE(s.IsMissing(2));
	REQUIRE(s.IsMissing(3));

	Column &n = data.GetColumn("n");
	n.CoerceToLogical();
	REQUIRE_FALSE(n.LogicalValue(0));
	REQUIRE(n.LogicalValue(1));
	REQUIRE(n.IsMissing(2));
}

TEST_CASE("Dataset - Subset and matrix input", "[core][dataset]") {
	Eigen::MatrixXd values(3, 2);
	values << 1.0, 10.0, kNaN, 20.0, 3.0, kNaN;
	Dataset data = Dataset::FromMatrix(values, {"a", "b"});

	REQUIRE(data.GetColumn("a").IsMissing(1));
	REQUIRE(data.GetColumn("b").IsMissing(2));
	REQUIRE_THROWS_AS(Dataset::FromMatrix(values, {"a"}), std::invalid_argument);

	Dataset sub = data.Subset({2, 0});
	REQUIRE(sub.RowCount() == 2);
	REQUIRE(sub.GetColumn("a").Value(0) == 3.0);
	REQUIRE(sub.GetColumn("b").IsMissing(0));
	REQUIRE(sub.GetColumn("b").Value(1) == 10.0);
	REQUIRE_THROWS_AS(data.Subset({3}), std::invalid_argument);
}
