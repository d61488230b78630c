// Rarity ladder and its per-tier configuration (slot counts, stat ranges, ability cost scaling).
#pragma once

#include <array>
#include <optional>
#include <string_view>

#include "../../engine/core/SeededRandom.h"
#include "../../engine/gameplay/CombatStats.h"

namespace Pets {

enum class Rarity { Basic = 0, Rare, SuperRare, Legendary, Mythic, Prismatic, Omega };

constexpr int kRarityCount = 7;

struct IntRange {
    int min{0};
    int max{0};
};

struct RarityConfig {
    const char* name{""};
    IntRange hp{};
    IntRange attack{};
    IntRange defense{};
    IntRange speed{};
    int passiveCount{0};
    int activeCount{1};
    int ultimateCount{0};
    float abilityCostMultiplier{1.0f};  // energy cost and cooldown scaling
};

const std::array<RarityConfig, kRarityCount>& rarityTable();
const RarityConfig& rarityConfig(Rarity rarity);

inline int rarityIndex(Rarity rarity) { return static_cast<int>(rarity); }
// Clamps out-of-range indices into [Basic, Omega].
Rarity rarityFromIndex(int index);
inline Rarity nextRarity(Rarity rarity) { return rarityFromIndex(rarityIndex(rarity) + 1); }

const char* rarityName(Rarity rarity);
std::optional<Rarity> parseRarityKey(std::string_view key);

// Uniform roll inside the rarity's stat ranges (used for starters and shop creatures).
Forge::Gameplay::Stats rollStatsForRarity(Rarity rarity, Forge::SeededRandom& rng);

}  // namespace Pets
