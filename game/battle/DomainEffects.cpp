#include "DomainEffects.h"

#include <algorithm>
#include <cmath>

namespace Pets {

namespace {

constexpr float kRubyFireBoost = 0.3f;
constexpr float kAmethystShadowBoost = 0.2f;
constexpr float kPearlReduction = 0.1f;
constexpr float kTopazScaling = 1.15f;

int percentOf(int value, float fraction) { return static_cast<int>(std::floor(static_cast<float>(value) * fraction)); }

std::vector<CombatPet*> living(Battle& battle, Side side) {
    std::vector<CombatPet*> out;
    for (auto& c : battle.team(side)) {
        if (c.alive()) out.push_back(&c);
    }
    return out;
}

}  // namespace

const char* domainDescription(StoneType type) {
    switch (type) {
        case StoneType::Ruby: return "Inferno Domain: fire damage +30%";
        case StoneType::Sapphire: return "Tidal Domain: allies heal 5% max hp each round";
        case StoneType::Emerald: return "Verdant Domain: allies gain 20% energy each round";
        case StoneType::Topaz: return "Storm Domain: speed-scaled effects +15%";
        case StoneType::Amethyst: return "Shadow Domain: enemies take +20% shadow damage";
        case StoneType::Pearl: return "Light Domain: allies take 10% less damage";
        case StoneType::Onyx: return "Void Domain: enemies lose 5% max hp each round";
        case StoneType::Opal: return "Chaos Domain: a random effect strikes each round";
    }
    return "";
}

std::optional<DomainEffect> domainEffectFor(const Pet& pet, Side side) {
    if (pet.fusionHistory.empty()) return std::nullopt;
    const auto& latest = pet.fusionHistory.back();
    if (latest.itemTiers[0] != kMaxStoneTier || latest.itemTiers[1] != kMaxStoneTier) return std::nullopt;
    DomainEffect effect{};
    effect.type = latest.itemTypes[0];
    effect.owner = side;
    effect.sourcePetId = pet.id;
    effect.description = domainDescription(effect.type);
    return effect;
}

void applyStaticDomains(Battle& battle) {
    for (const auto& effect : battle.domainEffects) {
        switch (effect.type) {
            case StoneType::Ruby:
                for (auto& c : battle.team(effect.owner)) c.domain.fireDamage = kRubyFireBoost;
                break;
            case StoneType::Topaz:
                for (auto& c : battle.team(effect.owner)) c.domain.speedScaling = kTopazScaling;
                break;
            case StoneType::Pearl:
                for (auto& c : battle.team(effect.owner)) c.domain.damageReduction = kPearlReduction;
                break;
            case StoneType::Amethyst:
                for (auto& c : battle.team(opposing(effect.owner))) c.domain.shadowVulnerability = kAmethystShadowBoost;
                break;
            default:
                break;
        }
    }
}

void applyRoundStartDomains(Battle& battle, const CombatTuning& tuning, Forge::SeededRandom& rng,
                            std::vector<std::string>& events) {
    for (const auto& effect : battle.domainEffects) {
        switch (effect.type) {
            case StoneType::Sapphire:
                for (auto* c : living(battle, effect.owner)) {
                    c->currentHp = Forge::Gameplay::clampHp(c->currentHp + percentOf(c->maxHp(), 0.05f), c->maxHp());
                }
                events.push_back(std::string("Tidal Domain heals ") + sideName(effect.owner));
                break;
            case StoneType::Emerald:
                for (auto* c : living(battle, effect.owner)) {
                    c->currentEnergy = std::min(tuning.maxEnergy, c->currentEnergy + percentOf(c->currentEnergy, 0.2f));
                }
                events.push_back(std::string("Verdant Domain energizes ") + sideName(effect.owner));
                break;
            case StoneType::Onyx:
                for (auto* c : living(battle, opposing(effect.owner))) {
                    c->currentHp = std::max(1, c->currentHp - percentOf(c->maxHp(), 0.05f));
                }
                events.push_back(std::string("Void Domain drains ") + sideName(opposing(effect.owner)));
                break;
            case StoneType::Opal: {
                std::vector<CombatPet*> all = living(battle, Side::Team1);
                const auto more = living(battle, Side::Team2);
                all.insert(all.end(), more.begin(), more.end());
                if (all.empty()) break;
                CombatPet* target = rng.pick(all);
                switch (rng.nextInt(0, 3)) {
                    case 0:
                        target->currentHp =
                            Forge::Gameplay::clampHp(target->currentHp + percentOf(target->maxHp(), 0.1f), target->maxHp());
                        events.push_back("Chaos Domain heals " + target->pet.name);
                        break;
                    case 1:
                        target->currentHp = std::max(1, target->currentHp - percentOf(target->maxHp(), 0.05f));
                        events.push_back("Chaos Domain wounds " + target->pet.name);
                        break;
                    case 2:
                        target->currentEnergy = std::min(tuning.maxEnergy, target->currentEnergy + 20);
                        events.push_back("Chaos Domain energizes " + target->pet.name);
                        break;
                    default: {
                        Forge::Status::StatModifier mod{};
                        mod.stat = Forge::Gameplay::StatKind::Attack;
                        mod.percent = 10.0f;
                        mod.remaining = tuning.defaultBuffDuration;
                        mod.source = effect.sourcePetId;
                        target->buffs.push_back(mod);
                        events.push_back("Chaos Domain empowers " + target->pet.name);
                        break;
                    }
                }
                break;
            }
            default:
                break;
        }
    }
}

}  // namespace Pets
