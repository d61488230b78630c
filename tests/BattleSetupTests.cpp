// Battle initialization: rows, turn order, lineage modifiers and tier-V domains.
#include <cassert>
#include <cmath>
#include <string>
#include <vector>

#include "../engine/core/Logger.h"
#include "../game/battle/BattleInitializer.h"
#include "../game/battle/DomainEffects.h"
#include "../game/battle/Lineage.h"

using namespace Pets;
using Forge::ErrorKind;

namespace {

Pet makeFighter(const std::string& id, int speed, Family family = Family::PyroKin) {
    Pet p{};
    p.id = id;
    p.owner = "owner";
    p.templateId = "base-test";
    p.name = id;
    p.family = family;
    p.stats = Forge::Gameplay::makeStats(500, 50, 20, speed);
    p.activeAbilities.push_back(Forge::Gameplay::basicStrike(id + "-strike"));
    return p;
}

FusionRecord record(int generation, Family a, Family b) {
    FusionRecord r{};
    r.generation = generation;
    r.parentFamilies = {a, b};
    return r;
}

Pet withDomain(Pet pet, StoneType type) {
    FusionRecord r = record(1, Family::PyroKin, Family::AquaBorn);
    r.itemTypes = {type, StoneType::Pearl};
    r.itemTiers = {5, 5};
    pet.fusionHistory.push_back(r);
    pet.templateId.reset();
    return pet;
}

bool near(float a, float b) { return std::fabs(a - b) < 1e-4f; }

}  // namespace

int main() {
    Forge::Logger::setMinLevel(Forge::LogLevel::Silent);
    const BattleInitializer init{};

    // Faster creature first; everyone starts full with starting energy.
    {
        const auto out = init.initialize({makeFighter("fast", 80)}, {makeFighter("slow", 40)}, 42u);
        assert(out.battle && !out.error);
        const Battle& b = *out.battle;
        assert(b.turnOrder.size() == 2);
        assert(b.turnOrder[0] == "fast" && b.turnOrder[1] == "slow");
        assert(b.currentTurn == 1 && b.currentActorIndex == 0);
        assert(!b.isComplete && b.winner == Winner::None);
        assert(b.team1[0].currentHp == 500 && b.team1[0].currentEnergy == 50);
        assert(b.team2[0].side == Side::Team2);
        assert(b.id.rfind("battle-", 0) == 0);

        const auto again = init.initialize({makeFighter("fast", 80)}, {makeFighter("slow", 40)}, 42u);
        assert(again.battle->id == b.id && again.battle->rngState == b.rngState);
    }

    // Ties keep team1 before team2, each in listed order.
    {
        const auto out = init.initialize({makeFighter("a1", 50), makeFighter("a2", 50)},
                                         {makeFighter("b1", 50), makeFighter("b2", 60)}, 1u);
        const auto& order = out.battle->turnOrder;
        assert(order[0] == "b2");
        assert(order[1] == "a1" && order[2] == "a2" && order[3] == "b1");
    }

    // First ceil(n/2) are front row.
    {
        const auto out = init.initialize({makeFighter("a", 1), makeFighter("b", 2), makeFighter("c", 3)},
                                         {makeFighter("x", 1), makeFighter("y", 1), makeFighter("z", 1),
                                          makeFighter("w", 1)},
                                         1u);
        const Battle& b = *out.battle;
        assert(b.team1[0].position == Position::Front && b.team1[1].position == Position::Front);
        assert(b.team1[2].position == Position::Back);
        assert(b.team2[1].position == Position::Front && b.team2[2].position == Position::Back);
    }

    // Team size and id checks report everything.
    {
        std::vector<Pet> five;
        for (int i = 0; i < 5; ++i) five.push_back(makeFighter("m" + std::to_string(i), 10));
        const auto out = init.initialize(five, {}, 1u);
        assert(!out.battle);
        assert(out.error && out.error->kind == ErrorKind::Validation);
        assert(out.error->messages.size() == 2);

        const auto dup = init.initialize({makeFighter("same", 10)}, {makeFighter("same", 20)}, 1u);
        assert(dup.error && dup.error->kind == ErrorKind::Validation);
    }

    // Passive buffs become permanent modifiers.
    {
        Pet p = makeFighter("tank", 30);
        Forge::Gameplay::Ability hide{};
        hide.id = "thick-hide";
        hide.name = "Thick Hide";
        hide.type = Forge::Gameplay::AbilityType::Passive;
        Forge::Gameplay::Effect buff{};
        buff.type = Forge::Gameplay::EffectType::Buff;
        buff.target = Forge::Gameplay::TargetKind::Self;
        buff.scalingStat = Forge::Gameplay::StatKind::Defense;
        buff.value = 20.0f;
        hide.effects.push_back(buff);
        p.passiveAbilities.push_back(hide);
        const auto out = init.initialize({p}, {makeFighter("foe", 10)}, 1u);
        const CombatPet& c = out.battle->team1[0];
        assert(c.buffs.size() == 1 && c.buffs[0].permanent);
        assert(near(c.effectiveStat(Forge::Gameplay::StatKind::Defense), 24.0f));
    }

    // Lineage: counts per ancestor family.
    {
        Pet p = makeFighter("heir", 50);
        p.fusionHistory = {record(1, Family::PyroKin, Family::AquaBorn), record(2, Family::PyroKin, Family::AquaBorn),
                           record(3, Family::PyroKin, Family::AquaBorn)};
        const auto inf = lineageInfluence(p);
        assert(inf.totalAncestors == 6);
        assert(inf.count(Forge::Gameplay::Element::Fire) == 3);
        assert(inf.dominant && *inf.dominant == Forge::Gameplay::Element::Fire);
        assert(inf.generation == 3);
        const auto mods = lineageModifiers(p);
        assert(near(lineageTotal(mods, LineageKind::DamageBoost), 0.06f));
        assert(near(lineageTotal(mods, LineageKind::HealingBoost), 0.05f));
        assert(near(lineageTotal(mods, LineageKind::DefenseBoost), 0.0f));

        p.fusionHistory.back().generation = 10;
        const auto ancient = lineageModifiers(p);
        assert(near(lineageTotal(ancient, LineageKind::DamageBoost), 0.16f));
        assert(near(lineageTotal(ancient, LineageKind::DefenseBoost), 0.10f));
    }
    {
        Pet shade = makeFighter("shade", 50);
        for (int i = 0; i < 10; ++i) shade.fusionHistory.push_back(record(i + 1, Family::ShadowVeil, Family::ShadowVeil));
        assert(near(lineageTotal(lineageModifiers(shade), LineageKind::Evasion), 0.15f));

        Pet saint = makeFighter("saint", 50);
        for (int i = 0; i < 2; ++i) saint.fusionHistory.push_back(record(i + 1, Family::Lumina, Family::Lumina));
        assert(near(lineageTotal(lineageModifiers(saint), LineageKind::CritChance), 0.09f));
        saint.fusionHistory.push_back(record(3, Family::PyroKin, Family::PyroKin));
        saint.fusionHistory.push_back(record(4, Family::PyroKin, Family::PyroKin));
        // Fire ties light and was counted first, so light is no longer dominant.
        assert(near(lineageTotal(lineageModifiers(saint), LineageKind::CritChance), 0.0f));
    }

    // Lightning ancestry speeds up the turn order.
    {
        Pet bolt = makeFighter("bolt", 100);
        bolt.fusionHistory = {record(1, Family::VoltStream, Family::VoltStream),
                              record(2, Family::VoltStream, Family::VoltStream)};
        const auto out = init.initialize({makeFighter("plain", 100)}, {bolt}, 3u);
        assert(out.battle->turnOrder[0] == "bolt");
        assert(near(effectiveSpeed(out.battle->team2[0]), 108.0f));
    }

    // Static domains: owner side only, never stacked; Amethyst hits the other side.
    {
        const Pet ruby1 = withDomain(makeFighter("r1", 50), StoneType::Ruby);
        const Pet ruby2 = withDomain(makeFighter("r2", 50), StoneType::Ruby);
        const Pet amethyst = withDomain(makeFighter("am", 50), StoneType::Amethyst);
        const auto out = init.initialize({ruby1, ruby2}, {amethyst, makeFighter("plain", 50)}, 1u);
        const Battle& b = *out.battle;
        assert(b.domainEffects.size() == 3);
        assert(b.domainEffects[0].type == StoneType::Ruby && b.domainEffects[0].owner == Side::Team1);
        assert(b.domainEffects[0].sourcePetId == "r1");
        for (const auto& c : b.team1) {
            assert(near(c.domain.fireDamage, 0.3f));
            assert(near(c.domain.shadowVulnerability, 0.2f));
        }
        for (const auto& c : b.team2) {
            assert(near(c.domain.fireDamage, 0.0f));
            assert(near(c.domain.shadowVulnerability, 0.0f));
        }
    }
    {
        Pet lowTier = withDomain(makeFighter("low", 50), StoneType::Ruby);
        lowTier.fusionHistory.back().itemTiers = {5, 4};
        assert(!domainEffectFor(lowTier, Side::Team1));
        const Pet topaz = withDomain(makeFighter("tz", 50), StoneType::Topaz);
        const Pet pearl = withDomain(makeFighter("pl", 50), StoneType::Pearl);
        const auto out = init.initialize({topaz, pearl}, {makeFighter("foe", 50)}, 1u);
        assert(near(out.battle->team1[1].domain.speedScaling, 1.15f));
        assert(near(out.battle->team1[0].domain.damageReduction, 0.1f));
        assert(near(out.battle->team2[0].domain.speedScaling, 1.0f));
    }

    // Round-start domains.
    {
        const Pet sapphire = withDomain(makeFighter("sa", 50), StoneType::Sapphire);
        const Pet onyx = withDomain(makeFighter("on", 50), StoneType::Onyx);
        const Pet emerald = withDomain(makeFighter("em", 50), StoneType::Emerald);
        auto out = init.initialize({sapphire, onyx}, {emerald, makeFighter("foe", 40)}, 1u);
        Battle b = std::move(*out.battle);
        b.team1[0].currentHp = 100;
        b.team2[1].currentHp = 10;
        std::vector<std::string> events;
        Forge::SeededRandom rng(b.rngState);
        applyRoundStartDomains(b, CombatTuning{}, rng, events);
        assert(events.size() == 3);
        assert(b.team1[0].currentHp == 125);
        assert(b.team1[1].currentHp == 500);
        assert(b.team2[0].currentHp == 475);
        assert(b.team2[1].currentHp == 1);
        assert(b.team2[0].currentEnergy == 60 && b.team2[1].currentEnergy == 60);
        assert(b.team1[0].currentEnergy == 50);
    }

    // Opal picks one living combatant and one of four effects.
    {
        const Pet opal = withDomain(makeFighter("op", 50), StoneType::Opal);
        auto out = init.initialize({opal}, {makeFighter("foe", 40)}, 1u);
        for (std::uint32_t seed = 1; seed <= 20; ++seed) {
            Battle b = *out.battle;
            std::vector<std::string> events;
            Forge::SeededRandom rng(seed);
            applyRoundStartDomains(b, CombatTuning{}, rng, events);
            assert(events.size() == 1);
            for (const auto* team : {&b.team1, &b.team2}) {
                for (const auto& c : *team) {
                    assert(c.currentHp >= 1 && c.currentHp <= c.maxHp());
                    assert(c.currentEnergy <= 100);
                }
            }
        }
    }

    return 0;
}
