// Fusion rarity: weaker parent's rarity plus one probabilistic upgrade step.
#pragma once

#include "../../engine/core/SeededRandom.h"
#include "../content/FusionTuning.h"
#include "../content/Rarity.h"

namespace Pets {

struct RarityInput {
    Rarity parent1{Rarity::Basic};
    Rarity parent2{Rarity::Basic};
    int tier1{1};
    int tier2{1};
    int fusionCount{0};  // combined history length of both parents
};

struct RarityResult {
    Rarity baseRarity{Rarity::Basic};
    Rarity finalRarity{Rarity::Basic};
    Rarity minRarity{Rarity::Basic};
    Rarity maxRarity{Rarity::Basic};  // min(final + 1, Omega)
    bool upgraded{false};
    float upgradeChance{0.0f};
    double roll{0.0};
};

struct RarityBounds {
    Rarity minRarity{Rarity::Basic};
    Rarity maxRarity{Rarity::Basic};
    float upgradeChance{0.0f};
};

class RarityEscalator {
public:
    explicit RarityEscalator(EscalatorTuning tuning = {}) : tuning_(tuning) {}

    float upgradeChance(const RarityInput& input) const;
    // Consumes exactly one rng draw.
    RarityResult roll(const RarityInput& input, Forge::SeededRandom& rng) const;
    RarityBounds preview(const RarityInput& input) const;

private:
    EscalatorTuning tuning_;
};

}  // namespace Pets
