#include "BattleInitializer.h"

#include <algorithm>
#include <set>

#include "../../engine/core/Logger.h"
#include "../../engine/core/SeededRandom.h"
#include "DomainEffects.h"
#include "Lineage.h"

namespace Pets {

using Forge::ErrorKind;
using Forge::Gameplay::AbilityType;
using Forge::Gameplay::EffectType;

float effectiveSpeed(const CombatPet& combatant) {
    return static_cast<float>(combatant.pet.stats.speed) *
           (1.0f + lineageTotal(combatant.lineageModifiers, LineageKind::SpeedBoost));
}

CombatPet BattleInitializer::makeCombatant(const Pet& pet, Side side, std::size_t index, std::size_t teamSize) const {
    CombatPet c{};
    c.pet = pet;
    c.side = side;
    c.position = index < (teamSize + 1) / 2 ? Position::Front : Position::Back;
    c.currentHp = pet.stats.maxHp;
    c.currentEnergy = std::min(tuning_.startingEnergy, tuning_.maxEnergy);
    c.lineageModifiers = lineageModifiers(pet);
    for (auto& a : c.pet.activeAbilities) a.currentCooldown = 0;
    if (c.pet.ultimateAbility) c.pet.ultimateAbility->currentCooldown = 0;

    // Passive buffs hold for the whole battle.
    for (const auto& passive : pet.passiveAbilities) {
        if (passive.type != AbilityType::Passive) continue;
        for (const auto& effect : passive.effects) {
            if (effect.type != EffectType::Buff || !effect.scalingStat) continue;
            Forge::Status::StatModifier mod{};
            mod.stat = *effect.scalingStat;
            mod.percent = effect.value;
            mod.permanent = true;
            mod.source = passive.name;
            c.buffs.push_back(mod);
        }
    }
    return c;
}

BattleInitOutcome BattleInitializer::initialize(const std::vector<Pet>& team1, const std::vector<Pet>& team2,
                                                std::uint32_t seed, std::int64_t createdAt) const {
    BattleInitOutcome out{};
    Forge::ErrorList errors;
    const auto checkSize = [&](const std::vector<Pet>& team, const char* label) {
        const int n = static_cast<int>(team.size());
        if (n < kMinTeamSize || n > kMaxTeamSize) {
            errors.add(ErrorKind::Validation,
                       std::string(label) + " must have between 1 and 4 creatures (got " + std::to_string(n) + ")");
        }
    };
    checkSize(team1, "team1");
    checkSize(team2, "team2");
    std::set<std::string> seen;
    for (const auto* team : {&team1, &team2}) {
        for (const auto& p : *team) {
            if (!seen.insert(p.id).second) errors.add(ErrorKind::Validation, "duplicate combatant id " + p.id);
            if (p.stats.maxHp <= 0) errors.add(ErrorKind::Validation, "creature " + p.id + " has no hit points");
        }
    }
    if (auto err = errors.finish()) {
        Forge::logWarn("Battle rejected: " + err->describe());
        out.error = std::move(err);
        return out;
    }

    Forge::SeededRandom rng(seed);
    Battle battle{};
    battle.id = "battle-" + rng.nextToken(12);
    battle.createdAt = createdAt;
    for (std::size_t i = 0; i < team1.size(); ++i) battle.team1.push_back(makeCombatant(team1[i], Side::Team1, i, team1.size()));
    for (std::size_t i = 0; i < team2.size(); ++i) battle.team2.push_back(makeCombatant(team2[i], Side::Team2, i, team2.size()));

    std::vector<const CombatPet*> order;
    for (const auto& c : battle.team1) order.push_back(&c);
    for (const auto& c : battle.team2) order.push_back(&c);
    std::stable_sort(order.begin(), order.end(),
                     [](const CombatPet* a, const CombatPet* b) { return effectiveSpeed(*a) > effectiveSpeed(*b); });
    for (const auto* c : order) battle.turnOrder.push_back(c->id());

    for (const auto* team : {&battle.team1, &battle.team2}) {
        for (const auto& c : *team) {
            if (auto effect = domainEffectFor(c.pet, c.side)) {
                Forge::logInfo(std::string("Domain active: ") + effect->description + " (" + sideName(effect->owner) + ")");
                battle.domainEffects.push_back(*effect);
            }
        }
    }
    applyStaticDomains(battle);

    battle.rngState = rng.state();
    Forge::logInfo("Battle " + battle.id + " initialized: " + std::to_string(team1.size()) + " vs " +
                   std::to_string(team2.size()));
    out.battle = std::move(battle);
    return out;
}

}  // namespace Pets
