// Creature (pet) model plus its fusion ancestry records.
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../../engine/gameplay/Ability.h"
#include "../../engine/gameplay/CombatStats.h"
#include "Family.h"
#include "Rarity.h"
#include "Stone.h"

namespace Pets {

using Forge::Gameplay::Ability;
using Forge::Gameplay::Stats;

struct FusionRecord {
    int generation{1};
    std::array<std::string, 2> parentIds{};
    std::array<Family, 2> parentFamilies{Family::PyroKin, Family::PyroKin};
    std::array<std::string, 2> itemIds{};
    // Kept alongside the ids so domain effects never need an item lookup.
    std::array<StoneType, 2> itemTypes{StoneType::Ruby, StoneType::Ruby};
    std::array<int, 2> itemTiers{1, 1};
    std::string fusionSeed;
    int mutationCount{0};
    std::int64_t timestamp{0};
};

struct Appearance {
    std::vector<std::string> visualTags;
    std::optional<std::string> glowColor;
};

struct BattleRecord {
    int wins{0};
    int losses{0};
    std::int64_t damageDealt{0};
    std::int64_t damageTaken{0};
};

struct Pet {
    std::string id;
    std::string owner;
    std::optional<std::string> templateId;  // unset for fusion products
    std::string name;
    Family family{Family::PyroKin};
    Rarity rarity{Rarity::Basic};
    Stats stats{};
    std::vector<Ability> passiveAbilities;
    std::vector<Ability> activeAbilities;
    std::optional<Ability> ultimateAbility;
    std::vector<FusionRecord> fusionHistory;
    Appearance appearance{};
    std::optional<BattleRecord> battleStats;
    std::int64_t collectedAt{0};
    bool isCorrupted{false};
    std::string lore;

    bool isFusion() const { return !templateId.has_value(); }
    // 0 for base creatures, otherwise the latest record's generation.
    int generation() const;
    int totalMutations() const;
};

// Element of the first elemental ability (actives, then ultimate, then passives), else the family element.
Forge::Gameplay::Element primaryElement(const Pet& pet);

// Active abilities plus the ultimate, in declaration order.
std::vector<const Ability*> castableAbilities(const Pet& pet);

// Validation messages for the creature invariants (hp <= maxHp, at least one active).
std::vector<std::string> checkPetInvariants(const Pet& pet);

}  // namespace Pets
