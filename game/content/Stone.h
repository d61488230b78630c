// Fusion stones (modifier items): type, tier, bonuses and generation helpers.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "../../engine/core/SeededRandom.h"
#include "../../engine/gameplay/CombatStats.h"
#include "../../engine/gameplay/Element.h"

namespace Pets {

enum class StoneType { Ruby, Sapphire, Emerald, Topaz, Amethyst, Pearl, Onyx, Opal };

constexpr int kStoneTypeCount = 8;
constexpr int kMinStoneTier = 1;
constexpr int kMaxStoneTier = 5;

struct Stone {
    std::string id;
    std::optional<std::string> owner;  // unset while listed on the market
    StoneType type{StoneType::Ruby};
    int tier{1};                       // I..V
    Forge::Gameplay::StatBonuses statBonuses{};
    int elementalPower{10};
    bool isCorrupted{false};
    std::int64_t createdAt{0};
};

Forge::Gameplay::Element stoneElement(StoneType type);
const char* stoneTypeName(StoneType type);
std::optional<StoneType> parseStoneTypeKey(std::string_view key);
// "I".."V"
const char* tierNumeral(int tier);

// Tier scaling used when a stone is minted: 0.10 .. 0.30 on the favoured stat.
float tierStatMultiplier(int tier);
int tierElementalPower(int tier);

// Mints a fresh stone; the id comes from the rng so generation is reproducible.
Stone generateStone(StoneType type, int tier, std::optional<std::string> owner, Forge::SeededRandom& rng,
                    std::int64_t createdAt = 0);

}  // namespace Pets
