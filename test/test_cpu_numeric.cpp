#include "catch2/catch.hpp"

#include <cmath>
#include <vector>

#include "stats/numeric.hpp"

TEST_CASE("sum") {

  SECTION("empty") {
    std::vector<double> a;
    REQUIRE(0.0 == stats::sum(a.data(), a.size()));
    REQUIRE(0.0 == stats::sum_squares(a.data(), a.size()));
    REQUIRE(0.0 == stats::sum_squared_deviations(a.data(), a.size(), 1.0));
  }

  SECTION("int") {
    std::vector<int> a{1, -2, 3, 4};
    REQUIRE(6 == stats::sum(a.data(), a.size()));
    REQUIRE(30 == stats::sum_squares(a.data(), a.size()));
  }

  SECTION("double") {
    std::vector<double> a{-3.0, 4.0};
    REQUIRE(1.0 == stats::sum(a.data(), a.size()));
    REQUIRE(25.0 == stats::sum_squares(a.data(), a.size()));
  }

  SECTION("deviations") {
    std::vector<double> a{1.0, 2.0, 3.0};
    REQUIRE(2.0 == stats::sum_squared_deviations(a.data(), a.size(), 2.0));
    REQUIRE(14.0 == stats::sum_squared_deviations(a.data(), a.size(), 0.0));
  }

  SECTION("left to right") {
    // 1e16 + 1 + 1 loses both ones when summed in order
    std::vector<double> a{1e16, 1.0, 1.0};
    REQUIRE(1e16 == stats::sum(a.data(), a.size()));
  }
}

TEST_CASE("max_abs_error") {

  using namespace Catch::literals;

  SECTION("empty") {
    std::vector<double> a;
    REQUIRE(0.0 == stats::max_abs_error(a.data(), a.data(), a.size()));
  }

  SECTION("largest of mixed signs") {
    std::vector<double> a{1.0, -2.0, 3.0};
    std::vector<double> b{1.1, 2.0, 2.5};
    REQUIRE(4.0_a == stats::max_abs_error(a.data(), b.data(), a.size()));
  }

  SECTION("nan") {
    std::vector<double> a{1.0, std::nan(""), 3.0};
    std::vector<double> b{1.0, 2.0, 3.0};
    REQUIRE(std::isnan(stats::max_abs_error(a.data(), b.data(), a.size())));
  }
}
