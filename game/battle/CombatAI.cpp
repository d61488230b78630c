#include "CombatAI.h"

namespace Pets {

using Forge::Gameplay::Ability;
using Forge::Gameplay::EffectType;
using Forge::Gameplay::StatKind;
using Forge::Gameplay::TargetKind;

namespace {

std::vector<const CombatPet*> livingOf(const Battle& battle, Side side) {
    std::vector<const CombatPet*> out;
    for (const auto& c : battle.team(side)) {
        if (c.alive()) out.push_back(&c);
    }
    return out;
}

bool needsCleanse(const CombatPet& c) {
    if (!c.debuffs.empty()) return true;
    for (const auto& s : c.statuses.all()) {
        if (s.spec.isDebuff) return true;
    }
    return false;
}

}  // namespace

const CombatPet* pickSingleEnemy(const Battle& battle, Side actorSide) {
    const CombatPet* best = nullptr;
    for (const auto& c : battle.team(opposing(actorSide))) {
        if (!c.alive()) continue;
        if (!best || c.currentHp < best->currentHp) best = &c;
    }
    return best;
}

float scoreAbility(const Ability& ability, const CombatPet& actor, const Battle& battle) {
    const auto allies = livingOf(battle, actor.side);
    const auto enemies = livingOf(battle, opposing(actor.side));
    const CombatPet* focus = pickSingleEnemy(battle, actor.side);

    float score = 0.0f;
    for (const auto& effect : ability.effects) {
        switch (effect.type) {
            case EffectType::Damage: {
                float dmg = actor.effectiveStat(effect.scalingStat.value_or(StatKind::Attack)) * effect.value / 10.0f;
                const auto element = effect.element ? effect.element : ability.element;
                if (focus) {
                    dmg += (Forge::Gameplay::elementEffectiveness(element, primaryElement(focus->pet)) - 1.0f) * 100.0f;
                }
                if (effect.target == TargetKind::AllEnemies) dmg += 20.0f * static_cast<float>(enemies.size());
                score += dmg;
                break;
            }
            case EffectType::Heal: {
                float missing = 0.0f;
                bool urgent = false;
                for (const auto* a : allies) {
                    missing += 1.0f - a->hpFraction();
                    if (a->hpFraction() < 0.5f) urgent = true;
                }
                score += actor.effectiveStat(effect.scalingStat.value_or(StatKind::MaxHp)) * effect.value / 10.0f * missing;
                if (urgent) score += 100.0f;
                break;
            }
            case EffectType::Buff:
                score += 40.0f;
                break;
            case EffectType::Debuff:
                score += 30.0f;
                break;
            case EffectType::Status:
                score += effect.statusChance.value_or(0.0f) * 0.5f;
                break;
            case EffectType::Special: {
                bool any = false;
                for (const auto* a : allies) any = any || needsCleanse(*a);
                if (any) score += 25.0f;
                break;
            }
        }
    }
    score -= 0.5f * static_cast<float>(ability.energyCost.value_or(0));
    return score;
}

const Ability* chooseAbility(const CombatPet& actor, const Battle& battle) {
    const Ability* best = nullptr;
    float bestScore = 0.0f;
    for (const Ability* a : castableAbilities(actor.pet)) {
        if (!a->isAvailable(actor.currentEnergy)) continue;
        const float s = scoreAbility(*a, actor, battle);
        if (!best || s > bestScore) {
            best = a;
            bestScore = s;
        }
    }
    return best;
}

}  // namespace Pets
