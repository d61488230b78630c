// Ability and target choice for a combatant; deterministic, no rng draws.
#pragma once

#include <vector>

#include "Battle.h"

namespace Pets {

// Heuristic value of casting the ability now; higher is better.
float scoreAbility(const Forge::Gameplay::Ability& ability, const CombatPet& actor, const Battle& battle);

// Best affordable, ready ability (actives then ultimate, ties to the earlier one); nullptr when none.
const Forge::Gameplay::Ability* chooseAbility(const CombatPet& actor, const Battle& battle);

// Living enemy with the lowest current hp, first listed on ties.
const CombatPet* pickSingleEnemy(const Battle& battle, Side actorSide);

}  // namespace Pets
