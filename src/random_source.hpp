#ifndef LITISIM_RANDOM_SOURCE_HPP
#define LITISIM_RANDOM_SOURCE_HPP

#include <cstdint>
#include <random>

namespace litisim {

// Seedable uniform random source handed to the simulator.
// A fixed seed reproduces the same sequence bit-for-bit on the same platform.
class RandomSource {
public:
    // Unseeded: draws the seed from std::random_device
    RandomSource();
    explicit RandomSource(uint64_t seed);

    // Independent stream for one partition of work (e.g. a block of trials),
    // derived from the master seed and the partition index.
    static RandomSource for_stream(uint64_t master_seed, uint64_t stream_index);

    // Uniform draw in [0, 1)
    double uniform();

    // Uniform draw in (0, 1], safe as a log() argument
    double uniform_open_zero();

    // Raw 64-bit draw, used to seed derived streams
    uint64_t next_u64();

    uint64_t seed() const { return seed_; }

private:
    uint64_t seed_;
    std::mt19937_64 engine_;
    std::uniform_real_distribution<double> unit_;
};

} // namespace litisim

#endif // LITISIM_RANDOM_SOURCE_HPP
