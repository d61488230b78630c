// Deterministic LCG random source. Every randomized engine call takes one of these by reference.
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Forge {

class SeededRandom {
public:
    explicit SeededRandom(std::uint32_t seed = 0) : state_(seed) {}

    // Stable 32-bit string hash (h = h * 31 + c, signed wrap, absolute value).
    static std::uint32_t hashString(std::string_view text);
    static SeededRandom fromString(std::string_view text) { return SeededRandom(hashString(text)); }

    // Uniform in [0, 1).
    double next();
    // Inclusive on both ends; returns min when max < min.
    int nextInt(int min, int max);
    double nextFloat(double min, double max);
    bool chance(double probability) { return next() < probability; }
    // Lowercase hex token drawn from the sequence; used for reproducible entity ids.
    std::string nextToken(std::size_t hexDigits = 8);

    template <typename T>
    const T& pick(const std::vector<T>& items) {
        const std::size_t idx = static_cast<std::size_t>(next() * static_cast<double>(items.size()));
        return items[idx < items.size() ? idx : items.size() - 1];
    }

    template <typename T>
    void shuffle(std::vector<T>& items) {
        for (std::size_t i = items.size(); i > 1; --i) {
            const std::size_t j = static_cast<std::size_t>(next() * static_cast<double>(i));
            std::swap(items[i - 1], items[j < i ? j : i - 1]);
        }
    }

    std::uint32_t state() const { return state_; }
    void reseed(std::uint32_t seed) { state_ = seed; }

private:
    std::uint32_t state_;
};

}  // namespace Forge
