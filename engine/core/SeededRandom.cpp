#include "SeededRandom.h"

#include <cmath>

namespace Forge {

namespace {
constexpr std::uint32_t kMultiplier = 1664525u;
constexpr std::uint32_t kIncrement = 1013904223u;
constexpr double kModulus = 4294967296.0;  // 2^32
}  // namespace

std::uint32_t SeededRandom::hashString(std::string_view text) {
    std::uint32_t h = 0;
    for (char c : text) {
        h = h * 31u + static_cast<std::uint32_t>(static_cast<unsigned char>(c));
    }
    const auto signedHash = static_cast<std::int64_t>(static_cast<std::int32_t>(h));
    return static_cast<std::uint32_t>(signedHash < 0 ? -signedHash : signedHash);
}

double SeededRandom::next() {
    state_ = state_ * kMultiplier + kIncrement;
    return static_cast<double>(state_) / kModulus;
}

int SeededRandom::nextInt(int min, int max) {
    if (max < min) return min;
    const double span = static_cast<double>(max) - static_cast<double>(min) + 1.0;
    return min + static_cast<int>(std::floor(next() * span));
}

std::string SeededRandom::nextToken(std::size_t hexDigits) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(hexDigits);
    for (std::size_t i = 0; i < hexDigits; ++i) {
        out.push_back(kHex[static_cast<std::size_t>(next() * 16.0) & 15u]);
    }
    return out;
}

double SeededRandom::nextFloat(double min, double max) {
    return min + next() * (max - min);
}

}  // namespace Forge
