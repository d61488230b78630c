#include "Battle.h"

#include <algorithm>

namespace Pets {

using Forge::Gameplay::StatKind;

const char* sideName(Side side) { return side == Side::Team1 ? "team1" : "team2"; }

const char* positionName(Position position) { return position == Position::Front ? "front" : "back"; }

const char* winnerName(Winner winner) {
    switch (winner) {
        case Winner::None: return "none";
        case Winner::Team1: return "team1";
        case Winner::Team2: return "team2";
        case Winner::Draw: return "draw";
    }
    return "none";
}

const char* lineageKindName(LineageKind kind) {
    switch (kind) {
        case LineageKind::DamageBoost: return "damage_boost";
        case LineageKind::HealingBoost: return "healing_boost";
        case LineageKind::DefenseBoost: return "defense_boost";
        case LineageKind::SpeedBoost: return "speed_boost";
        case LineageKind::CritChance: return "crit_chance";
        case LineageKind::Evasion: return "evasion";
    }
    return "damage_boost";
}

float lineageTotal(const std::vector<LineageModifier>& mods, LineageKind kind) {
    float total = 0.0f;
    for (const auto& m : mods) {
        if (m.kind == kind) total += m.value;
    }
    return total;
}

float CombatPet::effectiveStat(StatKind kind) const {
    const float base = kind == StatKind::MaxHp ? static_cast<float>(pet.stats.maxHp)
                                               : static_cast<float>(pet.stats.get(kind));
    const float percent = Forge::Status::modifierTotal(buffs, kind) - Forge::Status::modifierTotal(debuffs, kind);
    return base * std::max(0.1f, 1.0f + percent / 100.0f);
}

float CombatPet::hpFraction() const {
    if (pet.stats.maxHp <= 0) return 0.0f;
    return static_cast<float>(currentHp) / static_cast<float>(pet.stats.maxHp);
}

CombatPet* Battle::find(const std::string& petId) {
    for (auto* t : {&team1, &team2}) {
        for (auto& c : *t) {
            if (c.id() == petId) return &c;
        }
    }
    return nullptr;
}

const CombatPet* Battle::find(const std::string& petId) const {
    for (const auto* t : {&team1, &team2}) {
        for (const auto& c : *t) {
            if (c.id() == petId) return &c;
        }
    }
    return nullptr;
}

bool Battle::hasLiving(Side side) const {
    const auto& t = team(side);
    return std::any_of(t.begin(), t.end(), [](const CombatPet& c) { return c.alive(); });
}

float Battle::hpFraction(Side side) const {
    const auto& t = team(side);
    if (t.empty()) return 0.0f;
    float sum = 0.0f;
    for (const auto& c : t) sum += c.hpFraction();
    return sum / static_cast<float>(t.size());
}

}  // namespace Pets
