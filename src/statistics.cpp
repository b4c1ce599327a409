#include "statistics.hpp"
#include "errors.hpp"
#include "random_source.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace litisim {
namespace stats {

namespace {

constexpr double kTwoPi = 6.283185307179586476925286766559;

void require_non_empty(const std::vector<double>& values, const char* what) {
    if (values.empty()) {
        throw EmptyInputError(std::string(what) + " of an empty sequence");
    }
}

std::vector<double> sorted_copy(const std::vector<double>& values) {
    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    return sorted;
}

} // anonymous namespace

double mean(const std::vector<double>& values) {
    require_non_empty(values, "mean");
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double median(const std::vector<double>& values) {
    require_non_empty(values, "median");
    return median_sorted(sorted_copy(values));
}

double median_sorted(const std::vector<double>& sorted_values) {
    require_non_empty(sorted_values, "median");
    size_t mid = sorted_values.size() / 2;
    if (sorted_values.size() % 2 == 1) {
        return sorted_values[mid];
    }
    return (sorted_values[mid - 1] + sorted_values[mid]) / 2.0;
}

double std_dev(const std::vector<double>& values) {
    require_non_empty(values, "std_dev");
    double m = mean(values);
    double sum_sq_diff = 0.0;
    for (double v : values) {
        double diff = v - m;
        sum_sq_diff += diff * diff;
    }
    return std::sqrt(sum_sq_diff / static_cast<double>(values.size()));
}

double percentile(const std::vector<double>& values, double p) {
    require_non_empty(values, "percentile");
    return percentile_sorted(sorted_copy(values), p);
}

double percentile_sorted(const std::vector<double>& sorted_values, double p) {
    require_non_empty(sorted_values, "percentile");
    p = std::max(0.0, std::min(100.0, p));

    double n = static_cast<double>(sorted_values.size());
    double rank = std::ceil((p / 100.0) * n) - 1.0;
    size_t index = rank <= 0.0 ? 0 : static_cast<size_t>(rank);
    if (index >= sorted_values.size()) {
        index = sorted_values.size() - 1;
    }
    return sorted_values[index];
}

double min_value(const std::vector<double>& values) {
    require_non_empty(values, "min");
    return *std::min_element(values.begin(), values.end());
}

double max_value(const std::vector<double>& values) {
    require_non_empty(values, "max");
    return *std::max_element(values.begin(), values.end());
}

double sample_normal(RandomSource& rng, double mean, double std_dev) {
    double u1 = rng.uniform_open_zero();
    double u2 = rng.uniform();
    double z = std::sqrt(-2.0 * std::log(u1)) * std::cos(kTwoPi * u2);
    return std::max(0.0, mean + z * std_dev);
}

} // namespace stats
} // namespace litisim
