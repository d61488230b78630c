// Rarity escalation, stat blending and the fusion preview.
#include <cassert>
#include <cmath>
#include <string>

#include "../engine/core/Logger.h"
#include "../game/fusion/FusionCalculator.h"

using namespace Pets;

namespace {

Pet makeParent(const std::string& id, Rarity rarity, int maxHp, int attack, int defense, int speed) {
    Pet p{};
    p.id = id;
    p.owner = "owner";
    p.templateId = "base-test";
    p.name = id;
    p.rarity = rarity;
    p.stats = Forge::Gameplay::makeStats(maxHp, attack, defense, speed);
    p.activeAbilities.push_back(Forge::Gameplay::basicStrike());
    return p;
}

Stone makeStone(const std::string& id, StoneType type, int tier) {
    Stone s{};
    s.id = id;
    s.owner = "owner";
    s.type = type;
    s.tier = tier;
    return s;
}

bool sameStats(const Stats& a, const Stats& b) {
    return a.hp == b.hp && a.maxHp == b.maxHp && a.attack == b.attack && a.defense == b.defense && a.speed == b.speed;
}

}  // namespace

int main() {
    Forge::Logger::setMinLevel(Forge::LogLevel::Silent);
    const FusionTuning tuning{};
    const FusionCalculator calc(tuning);

    // Rare + Rare, tier III + tier III, seed 42.
    {
        const Pet a = makeParent("a", Rarity::Rare, 1000, 80, 60, 50);
        const Pet b = makeParent("b", Rarity::Rare, 1000, 70, 55, 30);
        const Stone s1 = makeStone("s1", StoneType::Ruby, 3);
        const Stone s2 = makeStone("s2", StoneType::Sapphire, 3);

        Forge::SeededRandom rng1(42);
        Forge::SeededRandom rng2(42);
        const auto r1 = calc.calculate(a, b, s1, s2, rng1);
        const auto r2 = calc.calculate(a, b, s1, s2, rng2);
        assert(r1.rarity.finalRarity == Rarity::Rare || r1.rarity.finalRarity == Rarity::SuperRare);
        assert(r1.rarity.finalRarity == r2.rarity.finalRarity);
        assert(r1.rarity.roll == r2.rarity.roll);
        assert(sameStats(r1.finalStats, r2.finalStats));
        assert(r1.finalStats.hp == r1.finalStats.maxHp);
        // 0.15 + 0.10 same rarity + 0.025 * 4 tier steps
        assert(std::fabs(r1.rarity.upgradeChance - 0.35f) < 1e-4f);
        // Average then the III+III tier multiplier of 1.15.
        assert(r1.baseStats.maxHp == 1000);
        assert(r1.baseStats.speed == 40);
        assert(r1.enhancedStats.maxHp == 1150);
        assert(rng1.state() == rng2.state());
    }

    // Rarity never drops below the weaker parent and never exceeds Omega.
    {
        for (int r1 = 0; r1 < kRarityCount; ++r1) {
            for (int r2 = 0; r2 < kRarityCount; ++r2) {
                for (std::uint32_t seed = 1; seed <= 25; ++seed) {
                    const Pet a = makeParent("a", rarityFromIndex(r1), 800, 60, 50, 40);
                    const Pet b = makeParent("b", rarityFromIndex(r2), 700, 50, 45, 60);
                    Forge::SeededRandom rng(seed);
                    const auto r = calc.calculate(a, b, makeStone("s1", StoneType::Opal, 5),
                                                  makeStone("s2", StoneType::Pearl, 1), rng);
                    const int weaker = r1 < r2 ? r1 : r2;
                    assert(rarityIndex(r.rarity.finalRarity) >= weaker);
                    assert(rarityIndex(r.rarity.finalRarity) <= weaker + 1);
                    assert(rarityIndex(r.rarity.finalRarity) <= rarityIndex(Rarity::Omega));
                    if (weaker == rarityIndex(Rarity::Omega)) assert(!r.rarity.upgraded);
                }
            }
        }
    }

    // Upgrade chance is monotone in tier sum and fusion count, and capped.
    {
        const RarityEscalator esc(tuning.escalator);
        RarityInput in{};
        in.parent1 = Rarity::Basic;
        in.parent2 = Rarity::Rare;
        float last = 0.0f;
        for (int t = 1; t <= 5; ++t) {
            in.tier1 = t;
            in.tier2 = t;
            const float c = esc.upgradeChance(in);
            assert(c >= last);
            last = c;
        }
        for (int f = 0; f <= 30; ++f) {
            in.fusionCount = f;
            const float c = esc.upgradeChance(in);
            assert(c >= last - 1e-6f);
            assert(c <= tuning.escalator.maxChance + 1e-6f);
            last = c;
        }
    }

    // Exactly one draw per escalator roll.
    {
        const RarityEscalator esc(tuning.escalator);
        Forge::SeededRandom rng(5);
        Forge::SeededRandom probe(5);
        const auto r = esc.roll(RarityInput{}, rng);
        assert(r.roll == probe.next());
        assert(rng.state() == probe.state());
    }

    // Preview bounds the rolled stats and needs no rng.
    {
        const Pet a = makeParent("a", Rarity::SuperRare, 1400, 110, 90, 70);
        const Pet b = makeParent("b", Rarity::Legendary, 1900, 150, 120, 95);
        Stone s1 = makeStone("s1", StoneType::Emerald, 4);
        s1.statBonuses.set(Forge::Gameplay::StatKind::Defense, 0.2f);
        const Stone s2 = makeStone("s2", StoneType::Topaz, 2);
        const auto preview = calc.preview(a, b, s1, s2);
        assert(preview.rarity.minRarity == Rarity::SuperRare);
        assert(preview.rarity.maxRarity == Rarity::Legendary);
        assert(preview.minSlots == &rarityConfig(Rarity::SuperRare));
        assert(preview.maxSlots == &rarityConfig(Rarity::Legendary));
        for (std::uint32_t seed = 1; seed <= 50; ++seed) {
            Forge::SeededRandom rng(seed);
            const auto r = calc.calculate(a, b, s1, s2, rng);
            assert(r.finalStats.maxHp >= preview.hp.min && r.finalStats.maxHp <= preview.hp.max);
            assert(r.finalStats.attack >= preview.attack.min && r.finalStats.attack <= preview.attack.max);
            assert(r.finalStats.defense >= preview.defense.min && r.finalStats.defense <= preview.defense.max);
            assert(r.finalStats.speed >= preview.speed.min && r.finalStats.speed <= preview.speed.max);
        }
    }

    // Stat bias buckets.
    {
        assert(determineStatBias(Forge::Gameplay::makeStats(100, 20, 20, 60)) == StatBias::Speed);
        assert(determineStatBias(Forge::Gameplay::makeStats(100, 90, 20, 10)) == StatBias::Offensive);
        assert(determineStatBias(Forge::Gameplay::makeStats(100, 20, 90, 10)) == StatBias::Defensive);
        assert(determineStatBias(Forge::Gameplay::makeStats(400, 100, 80, 60)) == StatBias::Balanced);
    }

    return 0;
}
