#include "AbilityLibrary.h"

#include <algorithm>
#include <cmath>

namespace Pets {

using Forge::Gameplay::Ability;
using Forge::Gameplay::AbilityType;
using Forge::Gameplay::Effect;
using Forge::Gameplay::EffectType;
using Forge::Gameplay::Element;
using Forge::Gameplay::StatKind;
using Forge::Gameplay::TargetKind;
using Forge::Status::StatusType;

namespace {

EffectTemplate damage(float value, TargetKind target, std::optional<Element> element = std::nullopt) {
    EffectTemplate t{};
    t.effect.type = EffectType::Damage;
    t.effect.target = target;
    t.effect.value = value;
    t.effect.scalingStat = StatKind::Attack;
    t.effect.element = element;
    return t;
}

EffectTemplate ranged(EffectTemplate t, float lo, float hi) {
    t.valueRange = std::make_pair(lo, hi);
    return t;
}

EffectTemplate drain(EffectTemplate t, float lifestealPct) {
    t.effect.lifesteal = lifestealPct;
    return t;
}

EffectTemplate heal(float value, TargetKind target) {
    EffectTemplate t{};
    t.effect.type = EffectType::Heal;
    t.effect.target = target;
    t.effect.value = value;
    t.effect.scalingStat = StatKind::MaxHp;
    return t;
}

EffectTemplate modifier(EffectType type, StatKind stat, float percent, TargetKind target, int duration = 3) {
    EffectTemplate t{};
    t.effect.type = type;
    t.effect.target = target;
    t.effect.value = percent;
    t.effect.scalingStat = stat;
    t.effect.statusDuration = duration;
    return t;
}

EffectTemplate status(StatusType type, float chance, int duration, TargetKind target = TargetKind::SingleEnemy) {
    EffectTemplate t{};
    t.effect.type = EffectType::Status;
    t.effect.target = target;
    t.effect.value = 0.0f;  // catalog magnitude
    t.effect.statusType = type;
    t.effect.statusChance = chance;
    t.effect.statusDuration = duration;
    return t;
}

AbilityTemplate make(std::string key, std::string name, std::string description, AbilityType type,
                     std::optional<int> energy, std::optional<int> cooldown, std::vector<EffectTemplate> effects,
                     std::vector<std::string> tags, std::optional<Element> element = std::nullopt,
                     Rarity minRarity = Rarity::Basic, bool glitched = false) {
    AbilityTemplate t{};
    t.key = std::move(key);
    t.name = std::move(name);
    t.description = std::move(description);
    t.type = type;
    t.energyCost = type == AbilityType::Passive ? std::nullopt : energy;
    t.cooldown = type == AbilityType::Passive ? std::nullopt : cooldown;
    t.effects = std::move(effects);
    t.tags = std::move(tags);
    t.element = element;
    t.minRarity = minRarity;
    t.glitched = glitched;
    return t;
}

constexpr auto kActive = AbilityType::Active;
constexpr auto kPassive = AbilityType::Passive;
constexpr auto kUltimate = AbilityType::Ultimate;

}  // namespace

std::vector<const AbilityTemplate*> AbilityLibrary::filter(AbilityType type, std::optional<Element> element,
                                                           Rarity rarity) const {
    std::vector<const AbilityTemplate*> out;
    for (const auto& t : templates) {
        if (t.glitched || t.type != type) continue;
        if (rarityIndex(t.minRarity) > rarityIndex(rarity)) continue;
        if (element && t.element != element) continue;
        out.push_back(&t);
    }
    return out;
}

std::vector<const AbilityTemplate*> AbilityLibrary::glitched(AbilityType type) const {
    std::vector<const AbilityTemplate*> out;
    for (const auto& t : templates) {
        if (t.glitched && t.type == type) out.push_back(&t);
    }
    return out;
}

AbilityLibrary defaultAbilityLibrary() {
    using T = TargetKind;
    AbilityLibrary lib{};
    auto& v = lib.templates;

    // Elemental actives.
    v.push_back(make("flame_burst", "Flame Burst", "A burst of flame that may set the target ablaze.", kActive, 30, 1,
                     {damage(1.2f, T::SingleEnemy, Element::Fire), status(StatusType::Burn, 30.0f, 2)},
                     {"fire", "burn"}, Element::Fire));
    v.push_back(make("tidal_crash", "Tidal Crash", "A crushing wave.", kActive, 25, 1,
                     {ranged(damage(1.1f, T::SingleEnemy, Element::Water), 0.9f, 1.1f)}, {"water"}, Element::Water));
    v.push_back(make("soothing_rain", "Soothing Rain", "Gentle rain mends the whole team.", kActive, 35, 2,
                     {heal(0.08f, T::AllAllies)}, {"water", "support"}, Element::Water));
    v.push_back(make("rock_slam", "Rock Slam", "Heavy blow that cracks armor.", kActive, 30, 2,
                     {damage(1.3f, T::SingleEnemy, Element::Earth),
                      modifier(EffectType::Debuff, StatKind::Defense, 15.0f, T::SingleEnemy)},
                     {"earth", "debuff"}, Element::Earth));
    v.push_back(make("thunder_jolt", "Thunder Jolt", "A jolt that can leave the target stunned.", kActive, 30, 2,
                     {damage(1.1f, T::SingleEnemy, Element::Lightning), status(StatusType::Stun, 20.0f, 1)},
                     {"lightning", "stun"}, Element::Lightning));
    v.push_back(make("shade_fang", "Shade Fang", "A draining bite from the dark.", kActive, 30, 1,
                     {drain(damage(1.15f, T::SingleEnemy, Element::Shadow), 20.0f)}, {"shadow", "lifesteal"},
                     Element::Shadow));
    v.push_back(make("veil_step", "Veil Step", "Slip into the shadows.", kActive, 20, 3,
                     {status(StatusType::Stealth, 100.0f, 2, T::Self)}, {"shadow", "stealth"}, Element::Shadow));
    v.push_back(make("radiant_beam", "Radiant Beam", "A focused beam of light.", kActive, 25, 1,
                     {damage(1.1f, T::SingleEnemy, Element::Light)}, {"light"}, Element::Light));
    v.push_back(make("mending_light", "Mending Light", "Restores an ally.", kActive, 30, 2,
                     {heal(0.12f, T::RandomAlly)}, {"light", "support"}, Element::Light));
    v.push_back(make("iron_bash", "Iron Bash", "Strike, then brace.", kActive, 30, 2,
                     {damage(1.2f, T::SingleEnemy, Element::Metal),
                      modifier(EffectType::Buff, StatKind::Defense, 15.0f, T::Self)},
                     {"metal", "buff"}, Element::Metal));
    v.push_back(make("arcane_bolt", "Arcane Bolt", "An unstable bolt of raw arcana.", kActive, 30, 1,
                     {ranged(damage(1.25f, T::SingleEnemy, Element::Arcane), 0.9f, 1.1f)}, {"arcane"},
                     Element::Arcane));
    v.push_back(make("gale_slice", "Gale Slice", "Cutting winds hit every enemy.", kActive, 35, 2,
                     {damage(0.8f, T::AllEnemies, Element::Air)}, {"air", "aoe"}, Element::Air));
    v.push_back(make("chaos_spark", "Chaos Spark", "Nobody knows how hard this will hit.", kActive, 25, 1,
                     {ranged(damage(1.1f, T::SingleEnemy, Element::Chaos), 0.6f, 1.5f)}, {"chaos"}, Element::Chaos));
    v.push_back(make("thorn_lash", "Thorn Lash", "Barbed vines that may poison.", kActive, 25, 1,
                     {damage(1.0f, T::SingleEnemy, Element::Nature), status(StatusType::Poison, 40.0f, 3)},
                     {"nature", "poison"}, Element::Nature));

    // Neutral actives.
    v.push_back(make("quick_jab", "Quick Jab", "A fast, cheap strike.", kActive, 15, 0,
                     {damage(0.9f, T::SingleEnemy)}, {"basic"}));
    v.push_back(make("war_cry", "War Cry", "Rallies allies to hit harder.", kActive, 30, 3,
                     {modifier(EffectType::Buff, StatKind::Attack, 20.0f, T::AllAllies)}, {"support", "buff"}));
    v.push_back(make("weaken", "Weaken", "Saps the target's strength.", kActive, 25, 2,
                     {damage(0.5f, T::SingleEnemy), modifier(EffectType::Debuff, StatKind::Attack, 20.0f, T::SingleEnemy)},
                     {"debuff"}));
    v.push_back(make("purify", "Purify", "Cleanses an ally of afflictions.", kActive, 25, 3,
                     {[] {
                         EffectTemplate t{};
                         t.effect.type = EffectType::Special;
                         t.effect.target = TargetKind::AllAllies;
                         t.effect.value = 0.0f;
                         return t;
                     }()},
                     {"support", "cleanse"}, std::nullopt, Rarity::Rare));

    // Passives: self buffs that last the whole battle.
    v.push_back(make("thick_hide", "Thick Hide", "Tougher than it looks.", kPassive, std::nullopt, std::nullopt,
                     {modifier(EffectType::Buff, StatKind::Defense, 10.0f, T::Self)}, {"passive"}));
    v.push_back(make("keen_instinct", "Keen Instinct", "Always finds the weak spot.", kPassive, std::nullopt,
                     std::nullopt, {modifier(EffectType::Buff, StatKind::Attack, 10.0f, T::Self)}, {"passive"}));
    v.push_back(make("swift_feet", "Swift Feet", "Light on its feet.", kPassive, std::nullopt, std::nullopt,
                     {modifier(EffectType::Buff, StatKind::Speed, 10.0f, T::Self)}, {"passive"}));
    v.push_back(make("ember_heart", "Ember Heart", "A core of living flame.", kPassive, std::nullopt, std::nullopt,
                     {modifier(EffectType::Buff, StatKind::Attack, 12.0f, T::Self)}, {"passive", "fire"},
                     Element::Fire));
    v.push_back(make("stone_skin", "Stone Skin", "Skin like bedrock.", kPassive, std::nullopt, std::nullopt,
                     {modifier(EffectType::Buff, StatKind::Defense, 15.0f, T::Self)}, {"passive", "earth"},
                     Element::Earth));
    v.push_back(make("storm_reflexes", "Storm Reflexes", "Reacts at the speed of lightning.", kPassive,
                     std::nullopt, std::nullopt, {modifier(EffectType::Buff, StatKind::Speed, 12.0f, T::Self)},
                     {"passive", "lightning"}, Element::Lightning));
    v.push_back(make("lumen_ward", "Lumen Ward", "A faint protective glow.", kPassive, std::nullopt, std::nullopt,
                     {modifier(EffectType::Buff, StatKind::Defense, 12.0f, T::Self)}, {"passive", "light"},
                     Element::Light));

    // Ultimates.
    v.push_back(make("cataclysm", "Cataclysm", "Devastates the entire enemy line.", kUltimate, 60, 4,
                     {damage(1.8f, T::AllEnemies)}, {"ultimate", "aoe"}, std::nullopt, Rarity::Legendary));
    v.push_back(make("sanctuary", "Sanctuary", "Heals and shelters every ally.", kUltimate, 60, 4,
                     {heal(0.2f, T::AllAllies), status(StatusType::Regeneration, 100.0f, 3, T::AllAllies)},
                     {"ultimate", "support"}, std::nullopt, Rarity::Legendary));
    v.push_back(make("inferno_storm", "Inferno Storm", "A firestorm that scorches all foes.", kUltimate, 65, 4,
                     {damage(1.6f, T::AllEnemies, Element::Fire), status(StatusType::Burn, 50.0f, 3, T::AllEnemies)},
                     {"ultimate", "fire"}, Element::Fire, Rarity::Legendary));
    v.push_back(make("judgement", "Judgement", "A pillar of light strikes one foe.", kUltimate, 60, 4,
                     {damage(2.5f, T::SingleEnemy, Element::Light)}, {"ultimate", "light"}, Element::Light,
                     Rarity::Legendary));
    v.push_back(make("abyssal_maw", "Abyssal Maw", "The dark swallows and returns strength.", kUltimate, 60, 4,
                     {drain(damage(2.2f, T::SingleEnemy, Element::Shadow), 30.0f)}, {"ultimate", "shadow"},
                     Element::Shadow, Rarity::Legendary));

    // Glitched content for corrupted fusions.
    v.push_back(make("glitch_strike", "Glitch Strike", "An attack that flickers between realities.", kActive, 30, 1,
                     {ranged(damage(1.4f, T::SingleEnemy, Element::Chaos), 0.5f, 2.0f)}, {"glitched"}, Element::Chaos,
                     Rarity::Basic, true));
    v.push_back(make("reality_tear", "Reality Tear", "Rips the battlefield open.", kActive, 40, 2,
                     {damage(1.0f, T::AllEnemies, Element::Chaos), status(StatusType::Stun, 25.0f, 1, T::AllEnemies)},
                     {"glitched", "aoe"}, Element::Chaos, Rarity::Basic, true));
    v.push_back(make("paradox_blast", "Paradox Blast", "Damage that unravels defenses.", kActive, 35, 2,
                     {damage(1.6f, T::SingleEnemy, Element::Arcane),
                      modifier(EffectType::Debuff, StatKind::Defense, 25.0f, T::SingleEnemy)},
                     {"glitched"}, Element::Arcane, Rarity::Basic, true));
    v.push_back(make("corrupted_core", "Corrupted Core", "Unstable power leaks from within.", kPassive,
                     std::nullopt, std::nullopt, {modifier(EffectType::Buff, StatKind::Attack, 20.0f, T::Self)},
                     {"glitched", "passive"}, std::nullopt, Rarity::Basic, true));
    v.push_back(make("reality_collapse", "Reality Collapse", "Everything stops. Then breaks.", kUltimate, 70, 5,
                     {damage(2.0f, T::AllEnemies, Element::Chaos),
                      status(StatusType::Freeze, 30.0f, 1, T::AllEnemies)},
                     {"glitched", "ultimate"}, Element::Chaos, Rarity::Basic, true));
    v.push_back(make("system_override", "System Override", "Rewrites the rules of the fight.", kUltimate, 70, 5,
                     {modifier(EffectType::Buff, StatKind::Attack, 40.0f, T::AllAllies),
                      damage(1.2f, T::AllEnemies, Element::Chaos)},
                     {"glitched", "ultimate"}, Element::Chaos, Rarity::Basic, true));
    return lib;
}

Ability instantiateAbility(const AbilityTemplate& tpl, Rarity rarity, Forge::SeededRandom& rng) {
    Ability a{};
    a.id = tpl.key + "-" + rng.nextToken(6);
    a.name = tpl.name;
    a.description = tpl.description;
    a.type = tpl.type;
    a.tags = tpl.tags;
    a.element = tpl.element;
    a.currentCooldown = 0;

    for (const auto& et : tpl.effects) {
        Effect e = et.effect;
        if (et.valueRange) {
            e.value *= static_cast<float>(rng.nextFloat(et.valueRange->first, et.valueRange->second));
        }
        a.effects.push_back(e);
    }

    if (tpl.type != AbilityType::Passive) {
        // Higher rarity pays more per cast but hits harder through its stats.
        const float mult = rarityConfig(rarity).abilityCostMultiplier;
        if (tpl.energyCost) {
            a.energyCost = std::max(10, static_cast<int>(std::lround(static_cast<float>(*tpl.energyCost) * mult)));
        }
        if (tpl.cooldown) {
            a.cooldown = std::max(1, static_cast<int>(std::lround(static_cast<float>(*tpl.cooldown) * mult)));
        }
    }
    return a;
}

}  // namespace Pets
