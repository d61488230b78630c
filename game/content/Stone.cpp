#include "Stone.h"

#include <algorithm>
#include <array>

namespace Pets {

using Forge::Gameplay::Element;
using Forge::Gameplay::StatKind;

namespace {
constexpr std::array<float, 5> kTierStatMultipliers{0.10f, 0.15f, 0.20f, 0.25f, 0.30f};
constexpr std::array<int, 5> kTierElementalPower{10, 20, 30, 40, 50};

int tierSlot(int tier) { return std::clamp(tier, kMinStoneTier, kMaxStoneTier) - 1; }

StatKind favouredStat(StoneType type) {
    switch (type) {
        case StoneType::Ruby:
        case StoneType::Amethyst:
            return StatKind::Attack;
        case StoneType::Sapphire:
        case StoneType::Emerald:
            return StatKind::MaxHp;
        case StoneType::Topaz:
            return StatKind::Speed;
        case StoneType::Pearl:
        case StoneType::Onyx:
        case StoneType::Opal:
        default:
            return StatKind::Defense;
    }
}
}  // namespace

Element stoneElement(StoneType type) {
    switch (type) {
        case StoneType::Ruby: return Element::Fire;
        case StoneType::Sapphire: return Element::Water;
        case StoneType::Emerald: return Element::Nature;
        case StoneType::Topaz: return Element::Lightning;
        case StoneType::Amethyst: return Element::Shadow;
        case StoneType::Pearl: return Element::Light;
        case StoneType::Onyx: return Element::Shadow;
        case StoneType::Opal:
        default: return Element::Chaos;
    }
}

const char* stoneTypeName(StoneType type) {
    switch (type) {
        case StoneType::Ruby: return "RUBY";
        case StoneType::Sapphire: return "SAPPHIRE";
        case StoneType::Emerald: return "EMERALD";
        case StoneType::Topaz: return "TOPAZ";
        case StoneType::Amethyst: return "AMETHYST";
        case StoneType::Pearl: return "PEARL";
        case StoneType::Onyx: return "ONYX";
        case StoneType::Opal:
        default: return "OPAL";
    }
}

std::optional<StoneType> parseStoneTypeKey(std::string_view key) {
    for (int i = 0; i < kStoneTypeCount; ++i) {
        const auto t = static_cast<StoneType>(i);
        if (key == stoneTypeName(t)) return t;
    }
    return std::nullopt;
}

const char* tierNumeral(int tier) {
    static constexpr std::array<const char*, 5> kNumerals{"I", "II", "III", "IV", "V"};
    return kNumerals[static_cast<std::size_t>(tierSlot(tier))];
}

float tierStatMultiplier(int tier) { return kTierStatMultipliers[static_cast<std::size_t>(tierSlot(tier))]; }

int tierElementalPower(int tier) { return kTierElementalPower[static_cast<std::size_t>(tierSlot(tier))]; }

Stone generateStone(StoneType type, int tier, std::optional<std::string> owner, Forge::SeededRandom& rng,
                    std::int64_t createdAt) {
    Stone s{};
    s.id = "stone-" + rng.nextToken();
    s.owner = std::move(owner);
    s.type = type;
    s.tier = std::clamp(tier, kMinStoneTier, kMaxStoneTier);
    // Half the tier multiplier lands on the stone's favoured stat; Opal spreads a smaller share everywhere.
    if (type == StoneType::Opal) {
        for (int i = 0; i < static_cast<int>(StatKind::Count); ++i) {
            s.statBonuses.set(static_cast<StatKind>(i), tierStatMultiplier(s.tier) * 0.2f);
        }
    } else {
        s.statBonuses.set(favouredStat(type), tierStatMultiplier(s.tier) * 0.5f);
    }
    s.elementalPower = tierElementalPower(s.tier);
    s.isCorrupted = false;
    s.createdAt = createdAt;
    return s;
}

}  // namespace Pets
