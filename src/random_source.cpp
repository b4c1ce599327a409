#include "random_source.hpp"

namespace litisim {

RandomSource::RandomSource()
    : RandomSource(static_cast<uint64_t>(std::random_device{}()) << 32 |
                   static_cast<uint64_t>(std::random_device{}())) {}

RandomSource::RandomSource(uint64_t seed)
    : seed_(seed), engine_(seed), unit_(0.0, 1.0) {}

RandomSource RandomSource::for_stream(uint64_t master_seed, uint64_t stream_index) {
    // seed_seq mixes both words so neighbouring stream indices do not
    // produce correlated engine states
    std::seed_seq seq{
        static_cast<uint32_t>(master_seed & 0xFFFFFFFFu),
        static_cast<uint32_t>(master_seed >> 32),
        static_cast<uint32_t>(stream_index & 0xFFFFFFFFu),
        static_cast<uint32_t>(stream_index >> 32)
    };
    uint32_t words[2];
    seq.generate(words, words + 2);
    uint64_t derived = (static_cast<uint64_t>(words[0]) << 32) | words[1];
    return RandomSource(derived);
}

double RandomSource::uniform() {
    double u = unit_(engine_);
    // Some standard library versions can return exactly 1.0
    return u < 1.0 ? u : 0.0;
}

double RandomSource::uniform_open_zero() {
    return 1.0 - uniform();
}

uint64_t RandomSource::next_u64() {
    return engine_();
}

} // namespace litisim
