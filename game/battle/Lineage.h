// Combat modifiers inherited from a creature's fusion ancestry.
#pragma once

#include <array>
#include <optional>
#include <vector>

#include "../../engine/gameplay/Element.h"
#include "../content/Creature.h"
#include "Battle.h"

namespace Pets {

struct LineageInfluence {
    std::array<int, static_cast<std::size_t>(Forge::Gameplay::Element::Count)> elementCounts{};
    int totalAncestors{0};
    std::optional<Forge::Gameplay::Element> dominant;  // first element with the highest count
    int generation{0};

    int count(Forge::Gameplay::Element e) const { return elementCounts[static_cast<std::size_t>(e)]; }
};

// Counts every parent family of every record, mapped to its element.
LineageInfluence lineageInfluence(const Pet& pet);

std::vector<LineageModifier> lineageModifiers(const Pet& pet);

}  // namespace Pets
