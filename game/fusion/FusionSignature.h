// Canonical description of a fusion request; drives naming and abilities and is what enhancers receive.
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "../content/Creature.h"
#include "../content/ElementInteractions.h"
#include "../content/Stone.h"
#include "Corruption.h"

namespace Pets {

// Player-chosen bias for naming and personality.
enum class FusionIntent { Dominance, Resilience, Volatility, Symbiosis, Corruption };

const char* fusionIntentName(FusionIntent intent);
std::optional<FusionIntent> parseFusionIntentKey(std::string_view key);

struct AbilitySignature {
    std::string name;
    Forge::Gameplay::AbilityType type{Forge::Gameplay::AbilityType::Active};
    std::optional<Forge::Gameplay::Element> element{};
    std::vector<std::string> tags;
    std::vector<std::string> effects;  // describeEffect() text
};

struct PetSignature {
    std::string id;
    std::string name;
    Family family{Family::PyroKin};
    Rarity rarity{Rarity::Basic};
    int generation{0};
    Stats stats{};
    Forge::Gameplay::Element element{Forge::Gameplay::Element::Fire};
    std::vector<AbilitySignature> abilities;
    std::vector<std::string> visualTags;
};

struct StoneSignature {
    std::string id;
    StoneType type{StoneType::Ruby};
    int tier{1};
    bool isCorrupted{false};
};

struct FusionSignature {
    PetSignature parent1{};
    PetSignature parent2{};
    std::array<StoneSignature, 2> stones{};
    std::array<Forge::Gameplay::Element, 2> elementPair{Forge::Gameplay::Element::Fire,
                                                        Forge::Gameplay::Element::Water};
    std::optional<ElementInteraction> interaction{};
    std::optional<FusionIntent> intent{};
    int generation{1};
    std::string seedString;  // "p1|p2|s1|s2[|intent]"
    std::uint32_t seedHash{0};
    // Attached once corruption has been evaluated so enhancers see the same branch.
    std::optional<FusionCorruption> corruption{};

    // Interaction affinity when there is one, else the first parent's element.
    Forge::Gameplay::Element preferredElement() const;
};

std::string fusionSeedString(const std::string& parent1Id, const std::string& parent2Id, const std::string& stone1Id,
                             const std::string& stone2Id, std::optional<FusionIntent> intent);

FusionSignature buildFusionSignature(const Pet& parent1, const Pet& parent2, const Stone& stone1, const Stone& stone2,
                                     std::optional<FusionIntent> intent = std::nullopt);

// Explicit seed wins; otherwise the seed-string hash, mixed with the clock unless reproducible.
std::uint32_t resolveFusionSeed(const FusionSignature& signature, std::optional<std::uint32_t> explicitSeed,
                                bool reproducible, std::int64_t nowMs);

nlohmann::json signatureToJson(const FusionSignature& signature);
std::string serializeSignature(const FusionSignature& signature);
// Tolerant parse used by the procedural enhancer; nullopt on malformed input.
std::optional<FusionSignature> parseSignature(const std::string& text);

}  // namespace Pets
