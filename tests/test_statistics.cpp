#include <catch2/catch.hpp>
#include <cmath>
#include <vector>
#include "errors.hpp"
#include "random_source.hpp"
#include "statistics.hpp"

using namespace litisim;
using Catch::Matchers::WithinRel;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Descriptive statistics
// ============================================================================

TEST_CASE("Mean of known values", "[statistics]") {
    std::vector<double> values = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    REQUIRE_THAT(stats::mean(values), WithinRel(5.0, 1e-12));
}

TEST_CASE("Population standard deviation of known values", "[statistics]") {
    // Population variance of this set is exactly 4
    std::vector<double> values = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
    REQUIRE_THAT(stats::std_dev(values), WithinRel(2.0, 1e-12));
}

TEST_CASE("Standard deviation of a single value is zero", "[statistics]") {
    REQUIRE(stats::std_dev({42.0}) == 0.0);
}

TEST_CASE("Median of odd-sized input is the middle value", "[statistics]") {
    REQUIRE(stats::median({9.0, 1.0, 5.0}) == 5.0);
}

TEST_CASE("Median of even-sized input averages the two middle values", "[statistics]") {
    REQUIRE_THAT(stats::median({4.0, 1.0, 3.0, 2.0}), WithinRel(2.5, 1e-12));
}

TEST_CASE("Median of sorted input matches the general median", "[statistics]") {
    REQUIRE(stats::median_sorted({1.0, 5.0, 9.0}) == stats::median({9.0, 1.0, 5.0}));
    REQUIRE_THAT(stats::median_sorted({1.0, 2.0, 3.0, 4.0}), WithinRel(2.5, 1e-12));
}

TEST_CASE("Min and max", "[statistics]") {
    std::vector<double> values = {3.0, -1.0, 8.5, 0.0};
    REQUIRE(stats::min_value(values) == -1.0);
    REQUIRE(stats::max_value(values) == 8.5);
}

// ============================================================================
// Percentiles
// ============================================================================

TEST_CASE("Nearest-rank percentile on ten values", "[statistics][percentile]") {
    std::vector<double> values = {10, 20, 30, 40, 50, 60, 70, 80, 90, 100};

    REQUIRE(stats::percentile(values, 10.0) == 10.0);
    REQUIRE(stats::percentile(values, 25.0) == 30.0);   // ceil(2.5) - 1 = 2
    REQUIRE(stats::percentile(values, 50.0) == 50.0);
    REQUIRE(stats::percentile(values, 75.0) == 80.0);   // ceil(7.5) - 1 = 7
    REQUIRE(stats::percentile(values, 90.0) == 90.0);
    REQUIRE(stats::percentile(values, 100.0) == 100.0);
}

TEST_CASE("Percentile 0 returns the minimum", "[statistics][percentile]") {
    REQUIRE(stats::percentile({5.0, 3.0, 9.0}, 0.0) == 3.0);
}

TEST_CASE("Percentile outside [0, 100] is clamped", "[statistics][percentile]") {
    std::vector<double> values = {1.0, 2.0, 3.0};
    REQUIRE(stats::percentile(values, -20.0) == 1.0);
    REQUIRE(stats::percentile(values, 250.0) == 3.0);
}

TEST_CASE("Percentile does not reorder the caller's data", "[statistics][percentile]") {
    std::vector<double> values = {5.0, 1.0, 4.0, 2.0, 3.0};
    std::vector<double> original = values;

    stats::percentile(values, 50.0);
    stats::median(values);

    REQUIRE(values == original);
}

TEST_CASE("Percentile is monotone in p", "[statistics][percentile]") {
    std::vector<double> values = {12, 3, 45, 7, 19, 28, 1, 33, 8, 50, 22};
    double previous = stats::percentile(values, 0.0);
    for (int p = 5; p <= 100; p += 5) {
        double current = stats::percentile(values, p);
        REQUIRE(current >= previous);
        previous = current;
    }
}

TEST_CASE("Percentile of a single value", "[statistics][percentile]") {
    REQUIRE(stats::percentile({7.0}, 1.0) == 7.0);
    REQUIRE(stats::percentile({7.0}, 99.0) == 7.0);
}

// ============================================================================
// Empty input
// ============================================================================

TEST_CASE("Statistics on empty input throw EmptyInputError", "[statistics][error]") {
    std::vector<double> empty;

    REQUIRE_THROWS_AS(stats::mean(empty), EmptyInputError);
    REQUIRE_THROWS_AS(stats::median(empty), EmptyInputError);
    REQUIRE_THROWS_AS(stats::median_sorted(empty), EmptyInputError);
    REQUIRE_THROWS_AS(stats::std_dev(empty), EmptyInputError);
    REQUIRE_THROWS_AS(stats::percentile(empty, 50.0), EmptyInputError);
    REQUIRE_THROWS_AS(stats::min_value(empty), EmptyInputError);
    REQUIRE_THROWS_AS(stats::max_value(empty), EmptyInputError);
}

// ============================================================================
// Normal sampling
// ============================================================================

TEST_CASE("sample_normal is never negative", "[statistics][sampling]") {
    RandomSource rng(7);
    for (int i = 0; i < 10000; ++i) {
        REQUIRE(stats::sample_normal(rng, 100.0, 500.0) >= 0.0);
    }
}

TEST_CASE("sample_normal with zero spread returns the mean", "[statistics][sampling]") {
    RandomSource rng(7);
    REQUIRE(stats::sample_normal(rng, 1234.0, 0.0) == 1234.0);
}

TEST_CASE("sample_normal matches the requested moments", "[statistics][sampling]") {
    RandomSource rng(2024);
    std::vector<double> samples;
    samples.reserve(50000);
    for (int i = 0; i < 50000; ++i) {
        samples.push_back(stats::sample_normal(rng, 50000.0, 5000.0));
    }

    // Mean 10 sd away from zero, so clamping is negligible
    REQUIRE_THAT(stats::mean(samples), WithinAbs(50000.0, 100.0));
    REQUIRE_THAT(stats::std_dev(samples), WithinRel(5000.0, 0.03));
}

// ============================================================================
// RandomSource
// ============================================================================

TEST_CASE("RandomSource with the same seed reproduces the sequence", "[statistics][random]") {
    RandomSource a(42);
    RandomSource b(42);
    for (int i = 0; i < 100; ++i) {
        REQUIRE(a.uniform() == b.uniform());
    }
    REQUIRE(a.seed() == 42);
}

TEST_CASE("RandomSource uniform draws stay in range", "[statistics][random]") {
    RandomSource rng(1);
    for (int i = 0; i < 10000; ++i) {
        double u = rng.uniform();
        REQUIRE(u >= 0.0);
        REQUIRE(u < 1.0);
        double v = rng.uniform_open_zero();
        REQUIRE(v > 0.0);
        REQUIRE(v <= 1.0);
    }
}

TEST_CASE("Derived streams are deterministic and distinct", "[statistics][random]") {
    RandomSource s0 = RandomSource::for_stream(99, 0);
    RandomSource s0_again = RandomSource::for_stream(99, 0);
    RandomSource s1 = RandomSource::for_stream(99, 1);

    REQUIRE(s0.seed() == s0_again.seed());
    REQUIRE(s0.seed() != s1.seed());
    REQUIRE(s0.next_u64() == s0_again.next_u64());
}
