// Data-first ability and effect definitions re-used by fusion assembly, encounters and combat.
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "CombatStats.h"
#include "Element.h"
#include "../status/StatusTypes.h"

namespace Forge::Gameplay {

enum class EffectType { Damage, Heal, Buff, Debuff, Status, Special };
enum class TargetKind { Self, SingleEnemy, AllEnemies, RandomAlly, AllAllies };
enum class AbilityType { Passive, Active, Ultimate };

struct Effect {
    EffectType type{EffectType::Damage};
    TargetKind target{TargetKind::SingleEnemy};
    float value{1.0f};
    std::optional<StatKind> scalingStat{};     // buff/debuff: the stat being modified
    std::optional<Element> element{};
    std::optional<float> statusChance{};       // percent, 0..100
    std::optional<Status::StatusType> statusType{};
    std::optional<int> statusDuration{};       // turns
    std::optional<float> lifesteal{};          // percent of damage dealt
};

struct Ability {
    std::string id;
    std::string name;
    std::string description;
    AbilityType type{AbilityType::Active};
    std::optional<int> energyCost{};  // unset for passives
    std::optional<int> cooldown{};    // unset for passives
    int currentCooldown{0};
    std::vector<Effect> effects;
    std::vector<std::string> tags;
    std::optional<Element> element{};

    bool usable() const { return type != AbilityType::Passive; }
    // Ready to cast with the given energy (cooldown elapsed and cost affordable).
    bool isAvailable(int energy) const;
};

// Hard-coded last-resort attack: single enemy, 1.0x attack.
Ability basicStrike(std::string id = "basic-strike", int energyCost = 20);

// Human-readable summary ("Deal 1.2x fire damage, Lifesteal: 20%").
std::string describeEffect(const Effect& effect);

const char* effectTypeName(EffectType type);
const char* targetKindName(TargetKind target);
const char* abilityTypeName(AbilityType type);
const char* statusTypeName(Status::StatusType type);

std::optional<EffectType> parseEffectTypeKey(std::string_view key);
std::optional<TargetKind> parseTargetKindKey(std::string_view key);
std::optional<AbilityType> parseAbilityTypeKey(std::string_view key);
std::optional<Status::StatusType> parseStatusTypeKey(std::string_view key);

}  // namespace Forge::Gameplay
