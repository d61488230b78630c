#include "Corruption.h"

#include <algorithm>
#include <cmath>

#include "../../engine/core/Logger.h"

namespace Pets {

using Forge::Gameplay::StatKind;

const char* corruptionLevelName(CorruptionLevel level) {
    switch (level) {
        case CorruptionLevel::Low: return "low";
        case CorruptionLevel::Medium: return "medium";
        case CorruptionLevel::High: return "high";
        case CorruptionLevel::Extreme: return "extreme";
    }
    return "low";
}

std::optional<CorruptionLevel> parseCorruptionLevelKey(std::string_view key) {
    if (key == "low") return CorruptionLevel::Low;
    if (key == "medium") return CorruptionLevel::Medium;
    if (key == "high") return CorruptionLevel::High;
    if (key == "extreme") return CorruptionLevel::Extreme;
    return std::nullopt;
}

CorruptionLevel corruptionLevelFor(int severity) {
    if (severity < 30) return CorruptionLevel::Low;
    if (severity < 60) return CorruptionLevel::Medium;
    if (severity < 85) return CorruptionLevel::High;
    return CorruptionLevel::Extreme;
}

float itemCorruptionChance(const Stone& stone, bool bothTierFive, int fusionCount, const CorruptionTuning& tuning) {
    float chance = tuning.itemBaseChance;
    if (stone.tier >= 4) chance += tuning.itemHighTierBonus;
    if (bothTierFive) chance += tuning.itemDualTierVBonus;
    chance += std::min(tuning.itemPerFusion * static_cast<float>(std::max(0, fusionCount)), tuning.itemFusionBonusCap);
    return std::min(tuning.itemMaxChance, chance);
}

std::optional<ItemCorruption> rollItemCorruption(const Stone& stone, bool bothTierFive, int fusionCount,
                                                 const CorruptionTuning& tuning, Forge::SeededRandom& rng,
                                                 std::int64_t now) {
    if (stone.isCorrupted) return std::nullopt;
    if (!rng.chance(itemCorruptionChance(stone, bothTierFive, fusionCount, tuning))) return std::nullopt;

    ItemCorruption out{};
    out.originalId = stone.id;
    out.powerBoost = rng.nextInt(tuning.minPowerBoost, tuning.maxPowerBoost);
    out.severity = std::min(100, stone.tier * 15 + static_cast<int>(std::lround(rng.next() * 20.0)));

    Stone& c = out.corrupted;
    c = stone;
    c.id = "stone-" + rng.nextToken();
    c.isCorrupted = true;
    c.createdAt = now;
    for (int i = 0; i < static_cast<int>(StatKind::Count); ++i) {
        const auto kind = static_cast<StatKind>(i);
        if (auto v = stone.statBonuses.get(kind)) c.statBonuses.set(kind, *v * tuning.statBonusMultiplier);
    }
    c.elementalPower =
        static_cast<int>(std::lround(stone.elementalPower * (1.0 + out.powerBoost / 100.0)));

    Forge::logInfo(std::string("Stone ") + stone.id + " corrupted into " + c.id + " (severity " +
                   std::to_string(out.severity) + ")");
    return out;
}

bool isUnstableStoneCombination(StoneType a, StoneType b) {
    auto is = [&](StoneType x, StoneType y) { return (a == x && b == y) || (a == y && b == x); };
    return is(StoneType::Opal, StoneType::Opal) || is(StoneType::Amethyst, StoneType::Opal) ||
           is(StoneType::Pearl, StoneType::Onyx);
}

FusionCorruption evaluateFusionCorruption(const Pet& parent1, const Pet& parent2, const Stone& stone1,
                                          const Stone& stone2, int fusionCount, const CorruptionTuning& tuning,
                                          Forge::SeededRandom& rng) {
    FusionCorruption out{};
    const int maxGen = std::max(parent1.generation(), parent2.generation());
    const int mutations = parent1.totalMutations() + parent2.totalMutations();
    const bool combo = isUnstableStoneCombination(stone1.type, stone2.type);

    if (stone1.isCorrupted && stone2.isCorrupted) out.reasons.emplace_back("both stones corrupted");

    if (maxGen >= tuning.generationThreshold) {
        const float chance =
            tuning.generationBaseChance + static_cast<float>(maxGen - tuning.generationThreshold) * tuning.generationStep;
        if (rng.chance(chance)) out.reasons.emplace_back("generation " + std::to_string(maxGen) + " instability");
    }

    if (combo) {
        out.reasons.push_back(std::string("unstable combination ") + stoneTypeName(stone1.type) + "+" +
                              stoneTypeName(stone2.type));
    }

    if (mutations >= tuning.mutationThreshold) {
        const float chance = std::min(tuning.mutationBaseChance + static_cast<float>(mutations) * tuning.mutationStep,
                                      tuning.mutationMaxChance);
        if (rng.chance(chance)) out.reasons.emplace_back(std::to_string(mutations) + " accumulated mutations");
    }

    if (fusionCount >= tuning.fusionCountThreshold) {
        const float chance = std::min(tuning.fusionCountBaseChance +
                                          static_cast<float>(fusionCount - tuning.fusionCountThreshold) *
                                              tuning.fusionCountStep,
                                      tuning.fusionCountMaxChance);
        if (rng.chance(chance)) out.reasons.emplace_back(std::to_string(fusionCount) + " prior fusions");
    }

    out.corrupted = !out.reasons.empty();
    if (!out.corrupted) return out;

    int severity = 0;
    if (stone1.isCorrupted && stone2.isCorrupted) {
        severity += 50;
    } else if (stone1.isCorrupted || stone2.isCorrupted) {
        severity += 25;
    }
    severity += maxGen * 5;
    severity += std::min(mutations * 2, 20);
    if (combo) severity += 30;
    severity += static_cast<int>(std::lround(rng.next() * 20.0));
    out.severity = std::min(100, severity);
    out.level = corruptionLevelFor(out.severity);
    return out;
}

}  // namespace Pets
