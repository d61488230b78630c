#include "Rarity.h"

#include <algorithm>

namespace Pets {

const std::array<RarityConfig, kRarityCount>& rarityTable() {
    static const std::array<RarityConfig, kRarityCount> table{{
        {"Basic", {500, 750}, {45, 65}, {35, 50}, {60, 80}, 0, 2, 0, 0.8f},
        {"Rare", {850, 1200}, {75, 100}, {60, 85}, {70, 90}, 1, 2, 0, 0.9f},
        {"SuperRare", {1400, 1900}, {120, 160}, {100, 140}, {80, 100}, 2, 2, 0, 1.0f},
        {"Legendary", {2200, 3000}, {180, 240}, {160, 220}, {90, 110}, 2, 3, 1, 1.1f},
        {"Mythic", {3500, 4800}, {280, 360}, {240, 320}, {100, 120}, 3, 3, 1, 1.2f},
        {"Prismatic", {5000, 6500}, {400, 520}, {360, 480}, {110, 130}, 4, 4, 2, 1.3f},
        {"Omega", {7000, 9000}, {600, 800}, {500, 700}, {130, 150}, 5, 5, 3, 1.5f},
    }};
    return table;
}

const RarityConfig& rarityConfig(Rarity rarity) {
    return rarityTable()[static_cast<std::size_t>(rarityIndex(rarity))];
}

Rarity rarityFromIndex(int index) {
    return static_cast<Rarity>(std::clamp(index, 0, kRarityCount - 1));
}

const char* rarityName(Rarity rarity) { return rarityConfig(rarity).name; }

std::optional<Rarity> parseRarityKey(std::string_view key) {
    for (int i = 0; i < kRarityCount; ++i) {
        if (key == rarityTable()[static_cast<std::size_t>(i)].name) return static_cast<Rarity>(i);
    }
    if (key == "SR") return Rarity::SuperRare;
    return std::nullopt;
}

Forge::Gameplay::Stats rollStatsForRarity(Rarity rarity, Forge::SeededRandom& rng) {
    const auto& cfg = rarityConfig(rarity);
    const int hp = rng.nextInt(cfg.hp.min, cfg.hp.max);
    const int atk = rng.nextInt(cfg.attack.min, cfg.attack.max);
    const int def = rng.nextInt(cfg.defense.min, cfg.defense.max);
    const int spd = rng.nextInt(cfg.speed.min, cfg.speed.max);
    return Forge::Gameplay::makeStats(hp, atk, def, spd);
}

}  // namespace Pets
