// Stat blending for fusions: parent average, stone scaling, seeded jitter, then the rarity roll.
#pragma once

#include "../../engine/core/SeededRandom.h"
#include "../content/Creature.h"
#include "../content/FusionTuning.h"
#include "../content/Stone.h"
#include "RarityEscalator.h"

namespace Pets {

enum class StatBias { Balanced, Offensive, Defensive, Speed };

const char* statBiasName(StatBias bias);
StatBias determineStatBias(const Stats& stats);

struct FusionStatResult {
    Stats baseStats{};      // parent average
    Stats enhancedStats{};  // after stone tier and bonus scaling
    Stats finalStats{};     // after jitter
    RarityResult rarity{};
    StatBias statBias{StatBias::Balanced};
};

struct StatRange {
    int min{0};
    int max{0};
};

struct FusionPreview {
    StatRange hp{};
    StatRange attack{};
    StatRange defense{};
    StatRange speed{};
    RarityBounds rarity{};
    const RarityConfig* minSlots{nullptr};
    const RarityConfig* maxSlots{nullptr};
};

class FusionCalculator {
public:
    explicit FusionCalculator(const FusionTuning& tuning) : calc_(tuning.calculator), escalator_(tuning.escalator) {}

    // Draws four jitter values (hp, attack, defense, speed) and then the rarity roll.
    FusionStatResult calculate(const Pet& parent1, const Pet& parent2, const Stone& stone1, const Stone& stone2,
                               Forge::SeededRandom& rng) const;

    // Same formula without randomness: enhanced stats widened by the jitter band.
    FusionPreview preview(const Pet& parent1, const Pet& parent2, const Stone& stone1, const Stone& stone2) const;

    Stats averageStats(const Pet& parent1, const Pet& parent2) const;
    Stats enhance(const Stats& base, const Stone& stone1, const Stone& stone2) const;

    const RarityEscalator& escalator() const { return escalator_; }

private:
    RarityInput rarityInput(const Pet& parent1, const Pet& parent2, const Stone& stone1, const Stone& stone2) const;

    CalculatorTuning calc_;
    RarityEscalator escalator_;
};

}  // namespace Pets
