// Turn resolution: actor order, costs, cooldowns, statuses, win checks and determinism.
#include <cassert>
#include <string>
#include <vector>

#include "../engine/core/Logger.h"
#include "../game/battle/BattleInitializer.h"
#include "../game/battle/CombatAI.h"
#include "../game/battle/CombatEngine.h"
#include "../game/content/CreatureFactory.h"

using namespace Pets;
using Forge::Gameplay::Ability;
using Forge::Gameplay::Effect;
using Forge::Gameplay::EffectType;
using Forge::Gameplay::TargetKind;

namespace {

Pet makeFighter(const std::string& id, int speed, int defense = 20, int maxHp = 500) {
    Pet p{};
    p.id = id;
    p.owner = "owner";
    p.templateId = "base-test";
    p.name = id;
    p.family = Family::PyroKin;
    p.stats = Forge::Gameplay::makeStats(maxHp, 50, defense, speed);
    p.activeAbilities.push_back(Forge::Gameplay::basicStrike(id + "-strike"));
    return p;
}

Battle start(const std::vector<Pet>& team1, const std::vector<Pet>& team2, std::uint32_t seed = 42u,
             CombatTuning tuning = {}) {
    auto out = BattleInitializer(tuning).initialize(team1, team2, seed);
    assert(out.battle);
    return std::move(*out.battle);
}

void checkHpInvariant(const Battle& b) {
    for (const auto* team : {&b.team1, &b.team2}) {
        for (const auto& c : *team) {
            assert(c.currentHp >= 0);
            assert(c.currentHp <= c.maxHp());
            assert(c.currentEnergy >= 0 && c.currentEnergy <= 100);
        }
    }
}

CombatTuning noCrits() {
    CombatTuning t{};
    t.critChance = 0.0f;
    return t;
}

}  // namespace

int main() {
    Forge::Logger::setMinLevel(Forge::LogLevel::Silent);

    // Speed 80 acts before speed 40; damage follows the formula.
    {
        const CombatEngine engine(noCrits());
        const Battle b = start({makeFighter("fast", 80)}, {makeFighter("slow", 40)}, 42u, noCrits());
        assert(b.turnOrder[0] == "fast");
        const auto step = engine.executeTurn(b);
        assert(step.turnCompleted);
        const Battle& after = step.battle;
        assert(after.log.size() == 1);
        const auto& action = after.log[0];
        assert(action.actorId == "fast");
        assert(action.turn == 1);
        assert(action.results.size() == 1 && action.results[0].targetId == "slow");
        // (50 * 1.0 - 20 * 0.5) * 1.5 front row
        assert(action.results[0].damage == 60);
        assert(after.find("slow")->currentHp == 440);
        // Cost 20 paid, then everyone regenerates 10.
        assert(after.find("fast")->currentEnergy == 40);
        assert(after.find("slow")->currentEnergy == 60);
        assert(after.currentActorIndex == 1 && after.currentTurn == 1);
        // The input battle is untouched.
        assert(b.log.empty() && b.find("slow")->currentHp == 500);

        const auto second = engine.executeTurn(after);
        assert(second.battle.log[1].actorId == "slow");
        assert(second.battle.currentActorIndex == 0 && second.battle.currentTurn == 2);
    }

    // A completed battle is a no-op.
    {
        const CombatEngine engine;
        Battle done = engine.runToCompletion(start({makeFighter("a", 80)}, {makeFighter("b", 40)}));
        assert(done.isComplete);
        assert(done.winner != Winner::None);
        const auto again = engine.executeTurn(done);
        assert(!again.turnCompleted);
        assert(again.battle.log.size() == done.log.size());
        assert(again.battle.winner == done.winner);
        assert(again.battle.rngState == done.rngState);
        assert(again.battle.currentTurn == done.currentTurn);
    }

    // Out of energy: the free Basic Attack is used.
    {
        const CombatEngine engine(noCrits());
        Battle b = start({makeFighter("tired", 80)}, {makeFighter("foe", 40)}, 1u, noCrits());
        b.find("tired")->currentEnergy = 0;
        const auto step = engine.executeTurn(b);
        assert(step.battle.log[0].abilityName == "Basic Attack");
        assert(step.battle.find("tired")->currentEnergy == 10);
    }

    // Cooldowns: the ability just used does not tick on its own turn.
    {
        Pet slammer = makeFighter("slammer", 80);
        slammer.activeAbilities[0].cooldown = 2;
        const CombatEngine engine;
        const Battle b = start({slammer}, {makeFighter("foe", 40)});
        const Battle t1 = engine.executeTurn(b).battle;
        assert(t1.find("slammer")->pet.activeAbilities[0].currentCooldown == 2);
        const Battle t2 = engine.executeTurn(t1).battle;
        assert(t2.find("slammer")->pet.activeAbilities[0].currentCooldown == 1);
        const Battle t3 = engine.executeTurn(t2).battle;
        // Still cooling down, so the basic attack fills in.
        assert(t3.log[2].abilityName == "Basic Attack");
    }

    // Stun skips the target's next turn.
    {
        Pet stunner = makeFighter("stunner", 80);
        Effect stun{};
        stun.type = EffectType::Status;
        stun.target = TargetKind::SingleEnemy;
        stun.value = 0.0f;
        stun.statusChance = 100.0f;
        stun.statusType = Forge::Status::StatusType::Stun;
        stun.statusDuration = 2;
        stunner.activeAbilities[0].effects.push_back(stun);
        stunner.activeAbilities[0].cooldown = 2;
        const CombatEngine engine;
        Battle b = start({stunner}, {makeFighter("victim", 40, 20, 5000)});
        b = engine.executeTurn(b).battle;
        assert(b.log[0].results.size() == 2);
        assert(b.log[0].results[1].statusApplied);
        assert(b.find("victim")->statuses.isIncapacitated());
        b = engine.executeTurn(b).battle;
        assert(b.log[1].actorId == "stunner");
        assert(b.log[1].abilityName == "Basic Attack");
        assert(b.log[1].turn == 2);
        b = engine.executeTurn(b).battle;
        assert(b.log[2].actorId == "victim");
    }

    // Nobody able to act: the turn is recorded as skipped.
    {
        Pet frozen = makeFighter("frozen", 80);
        const CombatEngine engine;
        Battle b = start({frozen}, {makeFighter("also", 40)});
        StatusCatalog catalog;
        b.team1[0].statuses.apply(catalog.make(Forge::Status::StatusType::Freeze, 3), "test");
        b.team2[0].statuses.apply(catalog.make(Forge::Status::StatusType::Stun, 3), "test");
        b = engine.executeTurn(b).battle;
        assert(b.log.size() == 1);
        assert(b.log[0].skipped);
        assert(b.log[0].actorId.empty());
        assert(!b.isComplete);
    }

    // Stealth: a guaranteed miss when the hit chance is zero.
    {
        CombatTuning tuning = noCrits();
        tuning.stealthHitChance = 0.0f;
        const CombatEngine engine(tuning);
        Battle b = start({makeFighter("seeker", 80)}, {makeFighter("ghost", 40)}, 1u, tuning);
        StatusCatalog catalog;
        b.team2[0].statuses.apply(catalog.make(Forge::Status::StatusType::Stealth, 5), "ghost");
        b = engine.executeTurn(b).battle;
        assert(b.log[0].results[0].missed);
        assert(b.log[0].results[0].damage == 0);
        assert(b.find("ghost")->currentHp == 500);
    }

    // Both sides falling in the same step is a draw.
    {
        const CombatEngine engine;
        Battle b = start({makeFighter("burning", 80)}, {makeFighter("fragile", 40)});
        b.team1[0].currentHp = 1;
        b.team2[0].currentHp = 1;
        Forge::Status::StatusSpec burn{};
        burn.type = Forge::Status::StatusType::Burn;
        burn.tags = {Forge::Status::StatusTag::DamageOverTime};
        burn.duration = 3;
        burn.magnitude = 0.1f;
        b.team1[0].statuses.apply(burn, "test");
        const auto step = engine.executeTurn(b);
        assert(step.battle.isComplete);
        assert(step.battle.winner == Winner::Draw);
        checkHpInvariant(step.battle);
    }

    // One side wiped out.
    {
        const CombatEngine engine;
        Battle b = start({makeFighter("hero", 80)}, {makeFighter("minion", 40)});
        b.team2[0].currentHp = 1;
        const auto step = engine.executeTurn(b);
        assert(step.battle.isComplete && step.battle.winner == Winner::Team1);
        assert(step.battle.find("minion")->currentHp == 0);
    }

    // Turn limit: equal hp fractions draw, otherwise the healthier side wins.
    {
        CombatTuning tuning = noCrits();
        tuning.turnLimit = 3;
        const CombatEngine engine(tuning);
        const Battle even = engine.runToCompletion(
            start({makeFighter("a", 80, 20, 10000)}, {makeFighter("b", 40, 20, 10000)}, 1u, tuning));
        assert(even.isComplete);
        assert(even.log.size() == 6);
        assert(even.winner == Winner::Draw);
        assert(even.currentTurn == 4);

        const Battle uneven = engine.runToCompletion(
            start({makeFighter("a", 80, 0, 10000)}, {makeFighter("b", 40, 40, 10000)}, 1u, tuning));
        assert(uneven.isComplete);
        assert(uneven.winner == Winner::Team2);
    }

    // Round-start domains keep firing when the last slot in the order is skipped.
    {
        Pet carrier = makeFighter("carrier", 50, 20, 10000);
        FusionRecord r{};
        r.generation = 1;
        r.parentFamilies = {Family::AquaBorn, Family::AquaBorn};
        r.itemTypes = {StoneType::Sapphire, StoneType::Pearl};
        r.itemTiers = {5, 5};
        carrier.fusionHistory.push_back(r);
        carrier.templateId.reset();

        const CombatEngine engine(noCrits());
        Battle b = start({carrier}, {makeFighter("quick", 80, 20, 10000), makeFighter("fallen", 10)}, 1u, noCrits());
        assert(b.turnOrder[2] == "fallen");
        b.find("fallen")->currentHp = 0;
        for (int i = 0; i < 9; ++i) b = engine.executeTurn(b).battle;
        assert(!b.isComplete);
        int fired = 0;
        for (const auto& action : b.log) {
            for (const auto& e : action.events) fired += e.rfind("Tidal Domain", 0) == 0 ? 1 : 0;
        }
        assert(b.currentTurn == 5);
        assert(fired == 5);
    }

    // Rolled 4v4 teams: hp stays in range every step and the run is reproducible.
    {
        const AbilityLibrary library = defaultAbilityLibrary();
        Forge::SeededRandom roll(2024);
        std::vector<Pet> team1;
        std::vector<Pet> team2;
        const Family families[] = {Family::PyroKin, Family::AquaBorn, Family::TerraForged, Family::VoltStream,
                                   Family::ShadowVeil, Family::Lumina, Family::SteelWorks, Family::ArcaneRift};
        for (int i = 0; i < 8; ++i) {
            const Rarity rarity = rarityFromIndex(i % 4);
            Pet p = rollCreature("owner", families[i], rarity, library, roll);
            (i < 4 ? team1 : team2).push_back(std::move(p));
        }

        const CombatEngine engine;
        Battle b = start(team1, team2, 7u);
        Battle replay = b;
        int steps = 0;
        while (!b.isComplete && steps < 2000) {
            b = engine.executeTurn(b).battle;
            checkHpInvariant(b);
            ++steps;
        }
        assert(b.isComplete);

        replay = engine.runToCompletion(replay);
        assert(replay.log.size() == b.log.size());
        assert(replay.winner == b.winner);
        assert(replay.rngState == b.rngState);
        for (std::size_t i = 0; i < b.log.size(); ++i) {
            assert(replay.log[i].actorId == b.log[i].actorId);
            assert(replay.log[i].abilityId == b.log[i].abilityId);
            assert(replay.log[i].results.size() == b.log[i].results.size());
            for (std::size_t r = 0; r < b.log[i].results.size(); ++r) {
                assert(replay.log[i].results[r].damage == b.log[i].results[r].damage);
                assert(replay.log[i].results[r].healing == b.log[i].results[r].healing);
            }
        }
    }

    // Targeting and ability choice.
    {
        const Battle b = start({makeFighter("me", 80)}, {makeFighter("tough", 40), makeFighter("weak", 30)});
        Battle hurt = b;
        hurt.find("weak")->currentHp = 100;
        assert(pickSingleEnemy(hurt, Side::Team1)->id() == "weak");
        hurt.find("weak")->currentHp = 0;
        assert(pickSingleEnemy(hurt, Side::Team1)->id() == "tough");

        Battle broke = b;
        broke.find("me")->currentEnergy = 5;
        assert(chooseAbility(*broke.find("me"), broke) == nullptr);
        assert(chooseAbility(*b.find("me"), b) != nullptr);
    }

    return 0;
}
