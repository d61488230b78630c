// Ability templates and their instantiation into concrete abilities for a given rarity.
#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../../engine/core/SeededRandom.h"
#include "../../engine/gameplay/Ability.h"
#include "Rarity.h"

namespace Pets {

struct EffectTemplate {
    Forge::Gameplay::Effect effect{};
    std::optional<std::pair<float, float>> valueRange{};  // multiplier band applied to effect.value
};

struct AbilityTemplate {
    std::string key;
    std::string name;
    std::string description;
    Forge::Gameplay::AbilityType type{Forge::Gameplay::AbilityType::Active};
    std::optional<int> energyCost{};
    std::optional<int> cooldown{};
    std::vector<EffectTemplate> effects;
    std::vector<std::string> tags;
    std::optional<Forge::Gameplay::Element> element{};
    Rarity minRarity{Rarity::Basic};
    bool glitched{false};  // only drawn by corrupted fusions
};

struct AbilityLibrary {
    std::vector<AbilityTemplate> templates;

    // Non-glitched templates of a type usable at this rarity; element filter when given.
    std::vector<const AbilityTemplate*> filter(Forge::Gameplay::AbilityType type,
                                               std::optional<Forge::Gameplay::Element> element,
                                               Rarity rarity) const;
    std::vector<const AbilityTemplate*> glitched(Forge::Gameplay::AbilityType type) const;
};

AbilityLibrary defaultAbilityLibrary();
// Reads data/abilities.json; falls back to defaultAbilityLibrary() on any problem.
AbilityLibrary loadAbilityLibrary(const std::string& path);

// Rolls value ranges and scales cost/cooldown by the rarity multiplier (floors 10 and 1).
Forge::Gameplay::Ability instantiateAbility(const AbilityTemplate& tpl, Rarity rarity, Forge::SeededRandom& rng);

}  // namespace Pets
