// Tunable constants for fusion and combat (kept data-driven but with sane defaults).
#pragma once

#include <string>

namespace Pets {

struct EscalatorTuning {
    float baseChance{0.15f};
    float sameRarityBonus{0.10f};
    float perTierStep{0.025f};   // per tier point above I+I
    float perFusion{0.01f};      // per fusion already in the parents' combined history
    int fusionCountCap{10};
    float maxChance{0.5f};
};

struct CalculatorTuning {
    float variance{0.15f};       // +/- jitter width
    float tierStatStep{0.05f};   // per tier, averaged across both stones
};

struct CorruptionTuning {
    float itemBaseChance{0.01f};
    float itemHighTierBonus{0.02f};   // tier IV+
    float itemDualTierVBonus{0.05f};  // both stones tier V
    float itemPerFusion{0.005f};
    float itemFusionBonusCap{0.10f};
    float itemMaxChance{0.15f};
    float statBonusMultiplier{1.5f};
    int minPowerBoost{10};            // percent
    int maxPowerBoost{30};
    int generationThreshold{5};
    float generationBaseChance{0.05f};
    float generationStep{0.02f};
    int mutationThreshold{10};
    float mutationBaseChance{0.1f};
    float mutationStep{0.01f};
    float mutationMaxChance{0.3f};
    int fusionCountThreshold{20};
    float fusionCountBaseChance{0.05f};
    float fusionCountStep{0.005f};
    float fusionCountMaxChance{0.2f};
};

struct CombatTuning {
    int startingEnergy{50};
    int maxEnergy{100};
    int energyRegen{10};
    int turnLimit{50};
    float frontRowMultiplier{1.5f};
    float backRowMultiplier{0.75f};
    float defenseFactor{0.5f};
    float critChance{0.05f};
    float critMultiplier{1.5f};
    float stealthHitChance{0.5f};
    int defaultBuffDuration{3};
    int defaultStatusDuration{2};
};

struct FusionTuning {
    EscalatorTuning escalator{};
    CalculatorTuning calculator{};
    CorruptionTuning corruption{};
    CombatTuning combat{};
};

// Reads data/tuning.json; missing file or fields keep the defaults above.
FusionTuning loadFusionTuning(const std::string& path);

}  // namespace Pets
