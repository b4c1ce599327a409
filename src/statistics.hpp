#ifndef LITISIM_STATISTICS_HPP
#define LITISIM_STATISTICS_HPP

#include <vector>

namespace litisim {

class RandomSource;

namespace stats {

// Arithmetic mean. Throws EmptyInputError on empty input.
double mean(const std::vector<double>& values);

// Median of an ascending-sorted copy; even-sized input averages the two
// middle values. Throws EmptyInputError on empty input.
double median(const std::vector<double>& values);

// Same as median() but for input already sorted ascending
double median_sorted(const std::vector<double>& sorted_values);

// Population standard deviation. Throws EmptyInputError on empty input.
double std_dev(const std::vector<double>& values);

// Nearest-rank percentile, p in [0, 100] (clamped).
// Index into the sorted copy is ceil(p/100 * n) - 1, floored at 0.
// The caller's vector is never reordered. Throws EmptyInputError on empty input.
double percentile(const std::vector<double>& values, double p);

// Same as percentile() but for input already sorted ascending
double percentile_sorted(const std::vector<double>& sorted_values, double p);

double min_value(const std::vector<double>& values);
double max_value(const std::vector<double>& values);

// Box-Muller draw around mean, clamped at zero since money and durations
// cannot be negative. Never throws.
double sample_normal(RandomSource& rng, double mean, double std_dev);

} // namespace stats
} // namespace litisim

#endif // LITISIM_STATISTICS_HPP
