// Pairwise element interaction table that drives fusion naming and ability themes.
#pragma once

#include <string>
#include <vector>

#include "../../engine/gameplay/Element.h"

namespace Pets {

struct ElementInteraction {
    Forge::Gameplay::Element element1{Forge::Gameplay::Element::Fire};
    Forge::Gameplay::Element element2{Forge::Gameplay::Element::Water};
    std::string result;                       // "steam", "lava", ...
    Forge::Gameplay::Element affinity{Forge::Gameplay::Element::Fire};  // preferred ability element
    std::vector<std::string> abilityThemes;
    std::vector<std::string> namePrefixes;
    std::vector<std::string> nameSuffixes;
    std::string description;
    float damageMultiplier{1.1f};
};

const std::vector<ElementInteraction>& elementInteractions();

// Order-insensitive lookup; nullptr when the pair has no interaction.
const ElementInteraction* findElementInteraction(Forge::Gameplay::Element a, Forge::Gameplay::Element b);

}  // namespace Pets
