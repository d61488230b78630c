// Tier-V stone domains: detected once per battle, static boosts at init, periodic effects per round.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../../engine/core/SeededRandom.h"
#include "../content/FusionTuning.h"
#include "Battle.h"

namespace Pets {

const char* domainDescription(StoneType type);

// A domain when the creature's latest fusion used two tier-V stones; keyed by the first stone.
std::optional<DomainEffect> domainEffectFor(const Pet& pet, Side side);

// Ruby, Topaz and Pearl for the owner's side, Amethyst for the other. The same type never stacks.
void applyStaticDomains(Battle& battle);

// Sapphire, Emerald, Onyx and Opal. Opal draws the combatant, then the effect.
void applyRoundStartDomains(Battle& battle, const CombatTuning& tuning, Forge::SeededRandom& rng,
                            std::vector<std::string>& events);

}  // namespace Pets
