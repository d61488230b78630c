// Corruption rolls: stones that destabilise during a fusion, and fusions that come out "glitched".
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../../engine/core/SeededRandom.h"
#include "../content/Creature.h"
#include "../content/FusionTuning.h"
#include "../content/Stone.h"

namespace Pets {

enum class CorruptionLevel { Low, Medium, High, Extreme };

const char* corruptionLevelName(CorruptionLevel level);
std::optional<CorruptionLevel> parseCorruptionLevelKey(std::string_view key);
// <30 low, <60 medium, <85 high, else extreme
CorruptionLevel corruptionLevelFor(int severity);

struct ItemCorruption {
    std::string originalId;
    Stone corrupted{};
    int severity{0};
    int powerBoost{0};  // percent added to elemental power
};

float itemCorruptionChance(const Stone& stone, bool bothTierFive, int fusionCount, const CorruptionTuning& tuning);

// One roll per call; already-corrupted stones never re-corrupt and consume no draws.
std::optional<ItemCorruption> rollItemCorruption(const Stone& stone, bool bothTierFive, int fusionCount,
                                                 const CorruptionTuning& tuning, Forge::SeededRandom& rng,
                                                 std::int64_t now);

struct FusionCorruption {
    bool corrupted{false};
    std::vector<std::string> reasons;
    int severity{0};  // 0..100
    CorruptionLevel level{CorruptionLevel::Low};
};

bool isUnstableStoneCombination(StoneType a, StoneType b);

// Checks run in a fixed order and each chance-based check draws only when its threshold is met.
FusionCorruption evaluateFusionCorruption(const Pet& parent1, const Pet& parent2, const Stone& stone1,
                                          const Stone& stone2, int fusionCount, const CorruptionTuning& tuning,
                                          Forge::SeededRandom& rng);

}  // namespace Pets
