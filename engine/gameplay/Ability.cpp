#include "Ability.h"

#include <sstream>

namespace Forge::Gameplay {

bool Ability::isAvailable(int energy) const {
    if (type == AbilityType::Passive) return false;
    if (currentCooldown > 0) return false;
    return energyCost.value_or(0) <= energy;
}

Ability basicStrike(std::string id, int energyCost) {
    Ability a{};
    a.id = std::move(id);
    a.name = "Basic Strike";
    a.description = "A simple attack that scales with attack.";
    a.type = AbilityType::Active;
    a.energyCost = energyCost;
    a.cooldown = 0;
    a.currentCooldown = 0;
    Effect hit{};
    hit.type = EffectType::Damage;
    hit.target = TargetKind::SingleEnemy;
    hit.value = 1.0f;
    hit.scalingStat = StatKind::Attack;
    a.effects.push_back(hit);
    a.tags = {"basic", "fallback"};
    return a;
}

std::string describeEffect(const Effect& effect) {
    std::ostringstream out;
    out.setf(std::ios::fixed);
    out.precision(2);
    switch (effect.type) {
        case EffectType::Damage:
            out << "Deal " << effect.value << "x ";
            if (effect.element) out << elementName(*effect.element) << ' ';
            out << "damage";
            break;
        case EffectType::Heal:
            out << "Heal " << effect.value;
            break;
        case EffectType::Buff:
            out << "Buff " << targetKindName(effect.target);
            break;
        case EffectType::Debuff:
            out << "Debuff " << targetKindName(effect.target);
            break;
        case EffectType::Status:
            out << "Apply " << (effect.statusType ? statusTypeName(*effect.statusType) : "status") << " ("
                << effect.statusChance.value_or(0.0f) << "% chance)";
            break;
        case EffectType::Special:
            out << "Cleanse " << targetKindName(effect.target);
            break;
    }
    if (effect.lifesteal) out << ", Lifesteal: " << *effect.lifesteal << '%';
    if (effect.scalingStat) out << ", Scales with " << statKindName(*effect.scalingStat);
    return out.str();
}

const char* effectTypeName(EffectType type) {
    switch (type) {
        case EffectType::Damage: return "damage";
        case EffectType::Heal: return "heal";
        case EffectType::Buff: return "buff";
        case EffectType::Debuff: return "debuff";
        case EffectType::Status: return "status";
        case EffectType::Special:
        default: return "special";
    }
}

const char* targetKindName(TargetKind target) {
    switch (target) {
        case TargetKind::Self: return "self";
        case TargetKind::SingleEnemy: return "single-enemy";
        case TargetKind::AllEnemies: return "all-enemies";
        case TargetKind::RandomAlly: return "random-ally";
        case TargetKind::AllAllies:
        default: return "all-allies";
    }
}

const char* abilityTypeName(AbilityType type) {
    switch (type) {
        case AbilityType::Passive: return "passive";
        case AbilityType::Active: return "active";
        case AbilityType::Ultimate:
        default: return "ultimate";
    }
}

const char* statusTypeName(Status::StatusType type) {
    using Status::StatusType;
    switch (type) {
        case StatusType::Burn: return "burn";
        case StatusType::Poison: return "poison";
        case StatusType::Stun: return "stun";
        case StatusType::Freeze: return "freeze";
        case StatusType::Stealth: return "stealth";
        case StatusType::Regeneration:
        default: return "regeneration";
    }
}

std::optional<EffectType> parseEffectTypeKey(std::string_view key) {
    if (key == "damage") return EffectType::Damage;
    if (key == "heal") return EffectType::Heal;
    if (key == "buff") return EffectType::Buff;
    if (key == "debuff") return EffectType::Debuff;
    if (key == "status") return EffectType::Status;
    if (key == "special") return EffectType::Special;
    return std::nullopt;
}

std::optional<TargetKind> parseTargetKindKey(std::string_view key) {
    if (key == "self") return TargetKind::Self;
    if (key == "single-enemy") return TargetKind::SingleEnemy;
    if (key == "all-enemies") return TargetKind::AllEnemies;
    if (key == "random-ally") return TargetKind::RandomAlly;
    if (key == "all-allies") return TargetKind::AllAllies;
    return std::nullopt;
}

std::optional<AbilityType> parseAbilityTypeKey(std::string_view key) {
    if (key == "passive") return AbilityType::Passive;
    if (key == "active") return AbilityType::Active;
    if (key == "ultimate") return AbilityType::Ultimate;
    return std::nullopt;
}

std::optional<Status::StatusType> parseStatusTypeKey(std::string_view key) {
    using Status::StatusType;
    if (key == "burn") return StatusType::Burn;
    if (key == "poison") return StatusType::Poison;
    if (key == "stun") return StatusType::Stun;
    if (key == "freeze") return StatusType::Freeze;
    if (key == "stealth") return StatusType::Stealth;
    if (key == "regeneration") return StatusType::Regeneration;
    return std::nullopt;
}

}  // namespace Forge::Gameplay
