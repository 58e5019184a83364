#pragma once

#include <cstdint>
#include <random>
#include <unordered_map>

namespace swissim::core::game {

class IRandomSource {
public:
    virtual ~IRandomSource() = default;
    // Uniform in [0, 100).
    virtual double Next() = 0;
};

class SeededRandomSource final : public IRandomSource {
public:
    explicit SeededRandomSource(std::uint64_t seed);
    SeededRandomSource(std::uint64_t seed, std::uint64_t stream);

    double Next() override;

private:
    std::mt19937_64 engine_;
};

std::uint64_t RandomSeed();

// One draw per unordered pair of competitor ids, generated on first request.
class DrawCache {
public:
    explicit DrawCache(IRandomSource& source);

    double DrawFor(int first_id, int second_id);
    void Clear() { draws_.clear(); }
    size_t size() const { return draws_.size(); }

private:
    IRandomSource& source_;
    std::unordered_map<long long, double> draws_;
};

}  // namespace swissim::core::game
