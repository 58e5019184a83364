#include "swissim/core/game/RandomSource.h"

#include <algorithm>

namespace swissim::core::game {

namespace {

long long PairKey(int a, int b) {
    const int low = std::min(a, b);
    const int high = std::max(a, b);
    return (static_cast<long long>(low) << 32) | static_cast<unsigned int>(high);
}

std::mt19937_64 MakeEngine(std::uint64_t seed, std::uint64_t stream) {
    std::seed_seq sequence{static_cast<std::uint32_t>(seed),
                           static_cast<std::uint32_t>(seed >> 32),
                           static_cast<std::uint32_t>(stream),
                           static_cast<std::uint32_t>(stream >> 32)};
    return std::mt19937_64(sequence);
}

}  // namespace

SeededRandomSource::SeededRandomSource(std::uint64_t seed) : engine_(seed) {}

SeededRandomSource::SeededRandomSource(std::uint64_t seed, std::uint64_t stream)
    : engine_(MakeEngine(seed, stream)) {}

double SeededRandomSource::Next() {
    // 53 random bits scaled into [0, 1); the product stays below 100.
    const double unit = static_cast<double>(engine_() >> 11) * (1.0 / 9007199254740992.0);
    return unit * 100.0;
}

std::uint64_t RandomSeed() {
    std::random_device device;
    return (static_cast<std::uint64_t>(device()) << 32) | device();
}

DrawCache::DrawCache(IRandomSource& source) : source_(source) {}

double DrawCache::DrawFor(int first_id, int second_id) {
    const long long key = PairKey(first_id, second_id);
    const auto it = draws_.find(key);
    if (it != draws_.end()) {
        return it->second;
    }
    const double draw = source_.Next();
    draws_.emplace(key, draw);
    return draw;
}

}  // namespace swissim::core::game
