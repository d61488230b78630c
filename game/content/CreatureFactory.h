// Rolls base (non-fusion) creatures: family name, rarity stats and template abilities.
#pragma once

#include <cstdint>
#include <string>

#include "../../engine/core/SeededRandom.h"
#include "AbilityLibrary.h"
#include "Creature.h"

namespace Pets {

// Family prefix + creature suffix, e.g. "Emberfang".
std::string generateCreatureName(Family family, Forge::SeededRandom& rng);

// Stats from the rarity table, abilities from the library preferring the family element.
// Draw order: id, name, stats, passives, actives, ultimate.
Pet rollCreature(const std::string& owner, Family family, Rarity rarity, const AbilityLibrary& library,
                 Forge::SeededRandom& rng, std::int64_t now = 0);

}  // namespace Pets
