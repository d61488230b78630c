// Informational novelty score for a fusion product. Never fails, never blocks a fusion.
#pragma once

#include <string>
#include <vector>

#include "../content/Creature.h"
#include "../content/Stone.h"

namespace Pets {

struct UniquenessBreakdown {
    float ability{0.0f};             // cap 30
    float statDivergence{0.0f};      // cap 20
    float visualNovelty{0.0f};       // cap 15
    float elementCombination{0.0f};  // cap 15
    float rarity{0.0f};              // cap 10
    float name{0.0f};                // cap 10
};

struct UniquenessScore {
    UniquenessBreakdown breakdown{};
    float total{0.0f};       // 0..100
    float percentile{0.0f};  // 0..100 against the population
    std::string rank;        // Common .. Mythic
};

// 50 * sum |ratio - ideal| over the stat total, capped at 20.
float statDivergenceScore(const Stats& stats);
const char* uniquenessRank(float total);

UniquenessScore scoreUniqueness(const Pet& result, const Pet& parent1, const Pet& parent2, const Stone& stone1,
                                const Stone& stone2, const std::vector<Pet>& population);

}  // namespace Pets
