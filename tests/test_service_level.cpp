// test_service_level.cpp - 服务水平与安全库存计算

#include <catch2/catch.hpp>

#include "service_level.h"

TEST_CASE("A1: InverseNormalCdf::KnownQuantiles", "[service_level]") {
    CHECK(InverseNormalCdf(0.5) == Approx(0.0).margin(1e-12));
    CHECK(InverseNormalCdf(0.95) == Approx(1.6448536269514722).epsilon(1e-9));
    CHECK(InverseNormalCdf(0.975) == Approx(1.959963984540054).epsilon(1e-9));
    CHECK(InverseNormalCdf(0.999) == Approx(3.090232306167813).epsilon(1e-9));
    CHECK(InverseNormalCdf(0.01) == Approx(-2.326347874040841).epsilon(1e-9));
}

TEST_CASE("A2: InverseNormalCdf::Symmetry", "[service_level]") {
    for (double p : {0.01, 0.1, 0.3, 0.45}) {
        CHECK(InverseNormalCdf(p) == Approx(-InverseNormalCdf(1.0 - p)).epsilon(1e-9));
    }
}

TEST_CASE("A3: InverseNormalCdf::InvertsCdf", "[service_level]") {
    for (double p : {0.001, 0.02425, 0.2, 0.5, 0.8, 0.97575, 0.999}) {
        CHECK(NormalCdf(InverseNormalCdf(p)) == Approx(p).epsilon(1e-8));
    }
}

TEST_CASE("A4: InverseNormalCdf::RejectsOutOfRange", "[service_level]") {
    CHECK_THROWS_AS(InverseNormalCdf(0.0), std::invalid_argument);
    CHECK_THROWS_AS(InverseNormalCdf(1.0), std::invalid_argument);
    CHECK_THROWS_AS(InverseNormalCdf(-0.2), std::invalid_argument);
}

TEST_CASE("B1: NormalSafetyStock::ScalesWithSigma", "[service_level]") {
    CHECK(NormalSafetyStock(0.95, 0.0) == 0.0);
    CHECK(NormalSafetyStock(0.95, 100.0) == Approx(16.448536269514722).epsilon(1e-9));
    CHECK(NormalSafetyStock(0.95, 400.0) == Approx(2.0 * NormalSafetyStock(0.95, 100.0)));
}

TEST_CASE("B2: NormalSafetyStock::NeverNegative", "[service_level]") {
    CHECK(NormalSafetyStock(0.5, 100.0) == Approx(0.0).margin(1e-12));
    CHECK(NormalSafetyStock(0.3, 100.0) == 0.0);
}

TEST_CASE("C1: InterpolateQuantile::LinearBetweenPoints", "[service_level]") {
    vector<QuantilePoint> q = {{0.5, 100.0}, {0.9, 120.0}, {0.99, 150.0}};
    double value = 0.0;

    REQUIRE(InterpolateQuantile(q, 0.9, value));
    CHECK(value == Approx(120.0));

    REQUIRE(InterpolateQuantile(q, 0.7, value));
    CHECK(value == Approx(110.0));

    REQUIRE(InterpolateQuantile(q, 0.95, value));
    CHECK(value == Approx(120.0 + 30.0 * 0.05 / 0.09));

    CHECK_FALSE(InterpolateQuantile(q, 0.995, value));
    CHECK_FALSE(InterpolateQuantile(q, 0.4, value));
    CHECK_FALSE(InterpolateQuantile({}, 0.5, value));
}

TEST_CASE("C2: EmpiricalSafetyExcess::QuantileOrFallback", "[service_level]") {
    vector<QuantilePoint> q = {{0.5, 100.0}, {0.95, 125.0}};
    CHECK(EmpiricalSafetyExcess(q, 100.0, 10.0, 0.95) == Approx(25.0));

    // 分位数低于均值时不产生负的安全余量
    vector<QuantilePoint> low = {{0.5, 80.0}, {0.95, 90.0}};
    CHECK(EmpiricalSafetyExcess(low, 100.0, 10.0, 0.95) == 0.0);

    // 不覆盖目标水平时退化为正态近似
    CHECK(EmpiricalSafetyExcess({}, 100.0, 10.0, 0.95) == Approx(NormalSafetyStock(0.95, 100.0)));
}
