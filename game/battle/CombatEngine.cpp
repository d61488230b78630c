#include "CombatEngine.h"

#include <algorithm>
#include <cmath>

#include "../../engine/core/Logger.h"
#include "CombatAI.h"
#include "DomainEffects.h"

namespace Pets {

using Forge::Gameplay::Ability;
using Forge::Gameplay::Effect;
using Forge::Gameplay::EffectType;
using Forge::Gameplay::Element;
using Forge::Gameplay::StatKind;
using Forge::Gameplay::TargetKind;
using Forge::Gameplay::clampHp;

namespace {

Ability* findCastable(Pet& pet, const std::string& abilityId) {
    for (auto& a : pet.activeAbilities) {
        if (a.id == abilityId) return &a;
    }
    if (pet.ultimateAbility && pet.ultimateAbility->id == abilityId) return &*pet.ultimateAbility;
    return nullptr;
}

std::vector<CombatPet*> livingOf(Battle& battle, Side side) {
    std::vector<CombatPet*> out;
    for (auto& c : battle.team(side)) {
        if (c.alive()) out.push_back(&c);
    }
    return out;
}

}  // namespace

bool advanceCursor(Battle& battle) {
    if (battle.turnOrder.empty()) return false;
    battle.currentActorIndex += 1;
    if (battle.currentActorIndex >= battle.turnOrder.size()) {
        battle.currentActorIndex = 0;
        battle.currentTurn += 1;
        return true;
    }
    return false;
}

CombatEngine::CombatEngine(CombatTuning tuning, StatusCatalog catalog)
    : tuning_(tuning), catalog_(std::move(catalog)), basicAttack_(Forge::Gameplay::basicStrike("basic-attack", 0)) {
    basicAttack_.name = "Basic Attack";
}

std::vector<CombatPet*> CombatEngine::resolveTargets(TargetKind target, CombatPet& actor, Battle& battle,
                                                     Forge::SeededRandom& rng) const {
    switch (target) {
        case TargetKind::Self:
            return {&actor};
        case TargetKind::SingleEnemy: {
            const CombatPet* pick = pickSingleEnemy(battle, actor.side);
            if (!pick) return {};
            return {battle.find(pick->id())};
        }
        case TargetKind::AllEnemies:
            return livingOf(battle, opposing(actor.side));
        case TargetKind::RandomAlly: {
            std::vector<CombatPet*> others;
            for (auto* c : livingOf(battle, actor.side)) {
                if (c != &actor) others.push_back(c);
            }
            if (others.empty()) return {&actor};
            return {rng.pick(others)};
        }
        case TargetKind::AllAllies:
            return livingOf(battle, actor.side);
    }
    return {};
}

void CombatEngine::applyDamage(const Effect& effect, const Ability& ability, CombatPet& actor, CombatPet& target,
                               Forge::SeededRandom& rng, EffectResult& result) const {
    float hitChance = 1.0f;
    if (target.statuses.isStealthed()) hitChance *= tuning_.stealthHitChance;
    hitChance *= 1.0f - lineageTotal(target.lineageModifiers, LineageKind::Evasion);
    if (hitChance < 1.0f && !rng.chance(hitChance)) {
        result.missed = true;
        return;
    }
    const bool critical = rng.chance(tuning_.critChance + lineageTotal(actor.lineageModifiers, LineageKind::CritChance));

    const StatKind scaling = effect.scalingStat.value_or(StatKind::Attack);
    float raw = actor.effectiveStat(scaling) * effect.value *
                (1.0f + lineageTotal(actor.lineageModifiers, LineageKind::DamageBoost));
    if (scaling == StatKind::Speed) raw *= actor.domain.speedScaling;
    const float mitigation = target.effectiveStat(StatKind::Defense) * tuning_.defenseFactor *
                             (1.0f + lineageTotal(target.lineageModifiers, LineageKind::DefenseBoost));

    float dmg = raw - mitigation;
    dmg *= target.position == Position::Front ? tuning_.frontRowMultiplier : tuning_.backRowMultiplier;

    const std::optional<Element> element = effect.element ? effect.element : ability.element;
    const Element defending = primaryElement(target.pet);
    dmg *= Forge::Gameplay::elementEffectiveness(element, defending);
    if (auto reaction = Forge::Gameplay::findReaction(element, defending)) {
        dmg *= reaction->damageMultiplier;
        result.reaction = std::string(reaction->name);
    }
    float domain = 1.0f;
    if (element == Element::Fire) domain += actor.domain.fireDamage;
    if (element == Element::Shadow) domain += target.domain.shadowVulnerability;
    dmg *= domain;
    dmg *= 1.0f - target.domain.damageReduction;
    dmg = std::max(1.0f, dmg);
    if (critical) dmg *= tuning_.critMultiplier;

    const int amount = static_cast<int>(std::lround(dmg));
    const int before = target.currentHp;
    target.currentHp = clampHp(target.currentHp - amount, target.maxHp());
    result.damage = amount;
    result.critical = critical;

    if (effect.lifesteal && *effect.lifesteal > 0.0f && actor.alive()) {
        const int dealt = before - target.currentHp;
        const int healed = static_cast<int>(std::lround(static_cast<float>(dealt) * *effect.lifesteal / 100.0f));
        const int actorBefore = actor.currentHp;
        actor.currentHp = clampHp(actor.currentHp + healed, actor.maxHp());
        result.lifesteal = actor.currentHp - actorBefore;
    }
}

void CombatEngine::applyEffect(const Effect& effect, const Ability& ability, CombatPet& actor, CombatPet& target,
                               Forge::SeededRandom& rng, EffectResult& result) const {
    switch (effect.type) {
        case EffectType::Damage:
            applyDamage(effect, ability, actor, target, rng, result);
            break;
        case EffectType::Heal: {
            const StatKind scaling = effect.scalingStat.value_or(StatKind::MaxHp);
            float amount = actor.effectiveStat(scaling) * effect.value *
                           (1.0f + lineageTotal(actor.lineageModifiers, LineageKind::HealingBoost));
            if (scaling == StatKind::Speed) amount *= actor.domain.speedScaling;
            const int before = target.currentHp;
            target.currentHp = clampHp(target.currentHp + static_cast<int>(std::lround(amount)), target.maxHp());
            result.healing = target.currentHp - before;
            break;
        }
        case EffectType::Buff:
        case EffectType::Debuff: {
            Forge::Status::StatModifier mod{};
            mod.stat = effect.scalingStat.value_or(StatKind::Attack);
            mod.percent = effect.value;
            mod.remaining = effect.statusDuration.value_or(tuning_.defaultBuffDuration);
            mod.source = actor.id();
            if (effect.type == EffectType::Buff) {
                target.buffs.push_back(mod);
                result.buffApplied = mod;
            } else {
                target.debuffs.push_back(mod);
                result.debuffApplied = mod;
            }
            break;
        }
        case EffectType::Status: {
            if (!effect.statusType) break;
            const float chance = effect.statusChance.value_or(100.0f) / 100.0f;
            if (!rng.chance(chance)) break;
            std::optional<float> magnitude;
            if (effect.value > 0.0f) magnitude = effect.value;
            const auto spec = catalog_.make(*effect.statusType,
                                            effect.statusDuration.value_or(tuning_.defaultStatusDuration), magnitude);
            target.statuses.apply(spec, actor.id());
            result.statusApplied = *effect.statusType;
            break;
        }
        case EffectType::Special:
            target.debuffs.clear();
            target.statuses.purgeIf([](const Forge::Status::StatusInstance& s) { return s.spec.isDebuff; });
            result.cleansed = true;
            break;
    }
}

void CombatEngine::tickAll(Battle& battle, const std::string& actorId, const std::string& usedAbilityId,
                           std::vector<std::string>& events) const {
    for (auto* team : {&battle.team1, &battle.team2}) {
        for (auto& c : *team) {
            auto tickCooldown = [&](Ability& a) {
                if (a.currentCooldown <= 0) return;
                if (c.id() == actorId && a.id == usedAbilityId) return;
                a.currentCooldown -= 1;
            };
            for (auto& a : c.pet.activeAbilities) tickCooldown(a);
            if (c.pet.ultimateAbility) tickCooldown(*c.pet.ultimateAbility);

            const auto tick = c.statuses.tick(c.maxHp());
            if (c.alive() && (tick.damage > 0 || tick.healing > 0)) {
                c.currentHp = clampHp(c.currentHp - tick.damage, c.maxHp());
                if (c.alive()) c.currentHp = clampHp(c.currentHp + tick.healing, c.maxHp());
                if (tick.damage > 0) events.push_back(c.pet.name + " suffers " + std::to_string(tick.damage) + " over time");
                if (tick.healing > 0) events.push_back(c.pet.name + " regenerates " + std::to_string(tick.healing));
            }
            Forge::Status::tickModifiers(c.buffs);
            Forge::Status::tickModifiers(c.debuffs);
        }
    }
}

void CombatEngine::checkDefeat(Battle& battle) const {
    const bool team1Alive = battle.hasLiving(Side::Team1);
    const bool team2Alive = battle.hasLiving(Side::Team2);
    if (team1Alive && team2Alive) return;
    battle.isComplete = true;
    if (!team1Alive && !team2Alive) {
        battle.winner = Winner::Draw;
    } else {
        battle.winner = team1Alive ? Winner::Team1 : Winner::Team2;
    }
}

void CombatEngine::checkTurnLimit(Battle& battle) const {
    if (battle.isComplete || battle.currentTurn <= tuning_.turnLimit) return;
    const float f1 = battle.hpFraction(Side::Team1);
    const float f2 = battle.hpFraction(Side::Team2);
    battle.isComplete = true;
    if (f1 > f2) {
        battle.winner = Winner::Team1;
    } else if (f2 > f1) {
        battle.winner = Winner::Team2;
    } else {
        battle.winner = Winner::Draw;
    }
    Forge::logInfo("Battle " + battle.id + " reached the turn limit");
}

TurnOutcome CombatEngine::executeTurn(const Battle& battle) const {
    if (battle.isComplete) return {battle, false};

    Battle b = battle;
    Forge::SeededRandom rng(b.rngState);
    ResolvedAction action{};

    // A round starts at cursor 0, either on entry or when skipping past the last slot wraps around.
    if (b.currentActorIndex == 0) applyRoundStartDomains(b, tuning_, rng, action.events);

    CombatPet* actor = nullptr;
    for (std::size_t step = 0; step < b.turnOrder.size(); ++step) {
        CombatPet* c = b.find(b.turnOrder[b.currentActorIndex]);
        if (c && c->canAct()) {
            actor = c;
            break;
        }
        if (advanceCursor(b)) applyRoundStartDomains(b, tuning_, rng, action.events);
    }
    action.turn = b.currentTurn;

    std::string usedAbilityId;
    if (!actor) {
        action.skipped = "no combatant can act";
    } else {
        action.actorId = actor->id();
        const Ability* chosen = chooseAbility(*actor, b);
        const Ability ability = chosen ? *chosen : basicAttack_;
        action.abilityId = ability.id;
        action.abilityName = ability.name;

        for (const auto& effect : ability.effects) {
            for (CombatPet* target : resolveTargets(effect.target, *actor, b, rng)) {
                if (!target || !target->alive()) continue;
                EffectResult r{};
                r.targetId = target->id();
                applyEffect(effect, ability, *actor, *target, rng, r);
                action.results.push_back(std::move(r));
            }
        }

        actor->currentEnergy = std::max(0, actor->currentEnergy - ability.energyCost.value_or(0));
        if (chosen) {
            if (Ability* owned = findCastable(actor->pet, ability.id)) {
                owned->currentCooldown = ability.cooldown.value_or(0);
                usedAbilityId = ability.id;
            }
        }
    }

    tickAll(b, action.actorId, usedAbilityId, action.events);

    for (auto* team : {&b.team1, &b.team2}) {
        for (auto& c : *team) {
            if (c.alive()) c.currentEnergy = std::min(tuning_.maxEnergy, c.currentEnergy + tuning_.energyRegen);
        }
    }

    checkDefeat(b);
    b.log.push_back(std::move(action));
    advanceCursor(b);
    checkTurnLimit(b);
    b.rngState = rng.state();

    if (b.isComplete) {
        Forge::logInfo("Battle " + b.id + " complete after " + std::to_string(b.log.size()) + " actions, winner " +
                       winnerName(b.winner));
    }
    return {std::move(b), true};
}

Battle CombatEngine::runToCompletion(Battle battle, int maxSteps) const {
    for (int i = 0; i < maxSteps && !battle.isComplete; ++i) {
        battle = executeTurn(battle).battle;
    }
    return battle;
}

}  // namespace Pets
