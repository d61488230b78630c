#include "RarityEscalator.h"

#include <algorithm>

namespace Pets {

namespace {
Rarity weaker(Rarity a, Rarity b) { return rarityIndex(a) <= rarityIndex(b) ? a : b; }
}  // namespace

float RarityEscalator::upgradeChance(const RarityInput& input) const {
    float chance = tuning_.baseChance;
    if (input.parent1 == input.parent2) chance += tuning_.sameRarityBonus;
    const int tierSum = std::clamp(input.tier1, 1, 5) + std::clamp(input.tier2, 1, 5);
    chance += tuning_.perTierStep * static_cast<float>(tierSum - 2);
    chance += tuning_.perFusion * static_cast<float>(std::clamp(input.fusionCount, 0, tuning_.fusionCountCap));
    return std::min(tuning_.maxChance, chance);
}

RarityResult RarityEscalator::roll(const RarityInput& input, Forge::SeededRandom& rng) const {
    RarityResult r{};
    r.baseRarity = weaker(input.parent1, input.parent2);
    r.minRarity = r.baseRarity;
    r.upgradeChance = upgradeChance(input);
    r.roll = rng.next();
    r.upgraded = r.roll < static_cast<double>(r.upgradeChance) && r.baseRarity != Rarity::Omega;
    r.finalRarity = r.upgraded ? nextRarity(r.baseRarity) : r.baseRarity;
    r.maxRarity = nextRarity(r.finalRarity);
    return r;
}

RarityBounds RarityEscalator::preview(const RarityInput& input) const {
    RarityBounds b{};
    b.minRarity = weaker(input.parent1, input.parent2);
    b.maxRarity = nextRarity(b.minRarity);
    b.upgradeChance = b.minRarity == Rarity::Omega ? 0.0f : upgradeChance(input);
    return b;
}

}  // namespace Pets
