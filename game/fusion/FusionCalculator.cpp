#include "FusionCalculator.h"

#include <algorithm>
#include <array>
#include <cmath>

namespace Pets {

using Forge::Gameplay::StatKind;

namespace {

int roundAvg(int a, int b) { return static_cast<int>(std::lround((a + b) / 2.0)); }

int scaled(int value, double factor, int floor) {
    return std::max(floor, static_cast<int>(std::lround(static_cast<double>(value) * factor)));
}

double meanBonus(const Stone& s1, const Stone& s2, StatKind kind) {
    return (s1.statBonuses.get(kind).value_or(0.0f) + s2.statBonuses.get(kind).value_or(0.0f)) / 2.0;
}

Stats withStats(int maxHp, int attack, int defense, int speed) {
    Stats s{};
    s.maxHp = maxHp;
    s.hp = maxHp;
    s.attack = attack;
    s.defense = defense;
    s.speed = speed;
    return s;
}

}  // namespace

const char* statBiasName(StatBias bias) {
    switch (bias) {
        case StatBias::Balanced: return "balanced";
        case StatBias::Offensive: return "offensive";
        case StatBias::Defensive: return "defensive";
        case StatBias::Speed: return "speed";
    }
    return "balanced";
}

StatBias determineStatBias(const Stats& stats) {
    const int total = stats.total();
    if (total <= 0) return StatBias::Balanced;
    const double atk = static_cast<double>(stats.attack) / total;
    const double def = static_cast<double>(stats.defense) / total;
    const double spd = static_cast<double>(stats.speed) / total;
    if (spd > 0.25) return StatBias::Speed;
    if (atk > 0.3 && atk > def + 0.1) return StatBias::Offensive;
    if (def > 0.3 && def > atk + 0.1) return StatBias::Defensive;
    return StatBias::Balanced;
}

Stats FusionCalculator::averageStats(const Pet& parent1, const Pet& parent2) const {
    const auto& a = parent1.stats;
    const auto& b = parent2.stats;
    return withStats(roundAvg(a.maxHp, b.maxHp), roundAvg(a.attack, b.attack), roundAvg(a.defense, b.defense),
                     roundAvg(a.speed, b.speed));
}

Stats FusionCalculator::enhance(const Stats& base, const Stone& stone1, const Stone& stone2) const {
    const double tierMult =
        1.0 + (calc_.tierStatStep * stone1.tier + calc_.tierStatStep * stone2.tier) / 2.0;
    auto factor = [&](StatKind k) { return tierMult * (1.0 + meanBonus(stone1, stone2, k)); };
    return withStats(scaled(base.maxHp, factor(StatKind::MaxHp), 1), scaled(base.attack, factor(StatKind::Attack), 0),
                     scaled(base.defense, factor(StatKind::Defense), 0),
                     scaled(base.speed, factor(StatKind::Speed), 0));
}

RarityInput FusionCalculator::rarityInput(const Pet& parent1, const Pet& parent2, const Stone& stone1,
                                          const Stone& stone2) const {
    RarityInput in{};
    in.parent1 = parent1.rarity;
    in.parent2 = parent2.rarity;
    in.tier1 = stone1.tier;
    in.tier2 = stone2.tier;
    in.fusionCount = static_cast<int>(parent1.fusionHistory.size() + parent2.fusionHistory.size());
    return in;
}

FusionStatResult FusionCalculator::calculate(const Pet& parent1, const Pet& parent2, const Stone& stone1,
                                             const Stone& stone2, Forge::SeededRandom& rng) const {
    FusionStatResult out{};
    out.baseStats = averageStats(parent1, parent2);
    out.enhancedStats = enhance(out.baseStats, stone1, stone2);

    std::array<double, 4> jitter{};
    for (auto& j : jitter) j = 1.0 + (2.0 * rng.next() - 1.0) * calc_.variance;

    const auto& e = out.enhancedStats;
    out.finalStats = withStats(scaled(e.maxHp, jitter[0], 1), scaled(e.attack, jitter[1], 0),
                               scaled(e.defense, jitter[2], 0), scaled(e.speed, jitter[3], 0));
    out.rarity = escalator_.roll(rarityInput(parent1, parent2, stone1, stone2), rng);
    out.statBias = determineStatBias(out.finalStats);
    return out;
}

FusionPreview FusionCalculator::preview(const Pet& parent1, const Pet& parent2, const Stone& stone1,
                                        const Stone& stone2) const {
    const Stats e = enhance(averageStats(parent1, parent2), stone1, stone2);
    const double lo = 1.0 - calc_.variance;
    const double hi = 1.0 + calc_.variance;

    FusionPreview p{};
    p.hp = {scaled(e.maxHp, lo, 1), scaled(e.maxHp, hi, 1)};
    p.attack = {scaled(e.attack, lo, 0), scaled(e.attack, hi, 0)};
    p.defense = {scaled(e.defense, lo, 0), scaled(e.defense, hi, 0)};
    p.speed = {scaled(e.speed, lo, 0), scaled(e.speed, hi, 0)};
    p.rarity = escalator_.preview(rarityInput(parent1, parent2, stone1, stone2));
    p.minSlots = &rarityConfig(p.rarity.minRarity);
    p.maxSlots = &rarityConfig(p.rarity.maxRarity);
    return p;
}

}  // namespace Pets
