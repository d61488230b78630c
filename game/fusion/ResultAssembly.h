// Turns a fusion signature and rarity into name, lore, abilities and visual tags.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../../engine/core/SeededRandom.h"
#include "../content/AbilityLibrary.h"
#include "../content/Creature.h"
#include "Corruption.h"
#include "FusionSignature.h"

namespace Pets {

struct FusionResult {
    std::string name;
    std::string lore;
    std::vector<Ability> passives;
    std::vector<Ability> actives;
    std::optional<Ability> ultimate;
    std::vector<std::string> visualTags;
    int fallbackLevel{0};  // 0 = regular slots, 1..3 = which active fallback fired
};

// Problems that disqualify a result (empty/placeholder name, no active ability).
std::vector<std::string> validateFusionResult(const FusionResult& result);

// Optional best-effort producer of an alternative result (e.g. a text-generation backend).
class EnhancementService {
public:
    virtual ~EnhancementService() = default;

    virtual std::optional<FusionResult> enhance(const std::string& serializedSignature, Rarity rarity) = 0;
};

class ResultAssembler {
public:
    explicit ResultAssembler(const AbilityLibrary& library) : library_(library) {}

    // Never fails: at least one active ability is always present.
    FusionResult assemble(const FusionSignature& signature, Rarity rarity, const FusionCorruption& corruption,
                          Forge::SeededRandom& rng) const;

private:
    std::string makeName(const FusionSignature& signature, const FusionCorruption& corruption,
                         Forge::SeededRandom& rng) const;
    std::vector<Ability> fillSlots(Forge::Gameplay::AbilityType type, int count, const FusionSignature& signature,
                                   Rarity rarity, Forge::SeededRandom& rng) const;
    std::vector<Ability> fallbackActive(const FusionSignature& signature, Rarity rarity, Forge::SeededRandom& rng,
                                        int& level) const;
    void applyCorruption(FusionResult& result, Rarity rarity, Forge::SeededRandom& rng) const;

    const AbilityLibrary& library_;
};

// Always-available enhancer: re-parses the serialized signature and runs the procedural assembler.
class ProceduralEnhancer : public EnhancementService {
public:
    explicit ProceduralEnhancer(const AbilityLibrary& library) : library_(library) {}

    std::optional<FusionResult> enhance(const std::string& serializedSignature, Rarity rarity) override;

private:
    const AbilityLibrary& library_;
};

std::string blendParentNames(const std::string& name1, const std::string& name2, std::optional<FusionIntent> intent,
                             Forge::SeededRandom& rng);

// Case-insensitive against existing names: appends " N" for N in 1..99, then a base-36 time suffix.
std::string makeUniqueName(const std::string& name, const std::vector<Pet>& existing, std::int64_t nowMs);

std::string toBase36(std::uint64_t value);

}  // namespace Pets
