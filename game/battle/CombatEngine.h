// Turn-by-turn combat resolution. Each call is a pure transition on a Battle value.
#pragma once

#include <string>
#include <vector>

#include "../../engine/core/SeededRandom.h"
#include "../content/FusionTuning.h"
#include "../status/StatusCatalog.h"
#include "Battle.h"

namespace Pets {

struct TurnOutcome {
    Battle battle;
    bool turnCompleted{false};
};

class CombatEngine {
public:
    explicit CombatEngine(CombatTuning tuning = {}, StatusCatalog catalog = {});

    // A completed battle comes back unchanged with turnCompleted == false.
    TurnOutcome executeTurn(const Battle& battle) const;

    // Repeats executeTurn until the battle completes or maxSteps calls were made.
    Battle runToCompletion(Battle battle, int maxSteps = 10000) const;

    const Forge::Gameplay::Ability& basicAttack() const { return basicAttack_; }
    const CombatTuning& tuning() const { return tuning_; }

private:
    std::vector<CombatPet*> resolveTargets(Forge::Gameplay::TargetKind target, CombatPet& actor, Battle& battle,
                                           Forge::SeededRandom& rng) const;
    void applyEffect(const Forge::Gameplay::Effect& effect, const Forge::Gameplay::Ability& ability,
                     CombatPet& actor, CombatPet& target, Forge::SeededRandom& rng, EffectResult& result) const;
    void applyDamage(const Forge::Gameplay::Effect& effect, const Forge::Gameplay::Ability& ability, CombatPet& actor,
                     CombatPet& target, Forge::SeededRandom& rng, EffectResult& result) const;
    void tickAll(Battle& battle, const std::string& actorId, const std::string& usedAbilityId,
                 std::vector<std::string>& events) const;
    void checkDefeat(Battle& battle) const;
    void checkTurnLimit(Battle& battle) const;

    CombatTuning tuning_;
    StatusCatalog catalog_;
    Forge::Gameplay::Ability basicAttack_;
};

// Moves the cursor to the next slot; returns true when wrapping starts a new round.
bool advanceCursor(Battle& battle);

}  // namespace Pets
