// Turns a dungeon floor's wave or boss into combat-ready enemy creatures.
#pragma once

#include <optional>
#include <vector>

#include "../../engine/core/Error.h"
#include "../../engine/core/SeededRandom.h"
#include "../content/AbilityLibrary.h"
#include "Dungeon.h"

namespace Pets {

inline constexpr const char* kDungeonEnemyOwner = "DUNGEON_ENEMY";

struct EncounterRequest {
    int floorIndex{0};
    int waveIndex{0};  // >= wave count selects the boss
    int playerTeamSize{1};
};

struct EncounterOutcome {
    std::vector<Pet> enemies;
    bool isBoss{false};
    std::optional<Forge::Error> error;
};

class EncounterGenerator {
public:
    explicit EncounterGenerator(const AbilityLibrary& library) : library_(library) {}

    EncounterOutcome generate(const Dungeon& dungeon, const EncounterRequest& request, Forge::SeededRandom& rng) const;

    // hp, attack and defense scale (rounded, hp >= 1); speed never does.
    Pet instantiate(const EnemyTemplate& tpl, float difficultyMultiplier, Forge::SeededRandom& rng) const;

private:
    const AbilityLibrary& library_;
};

}  // namespace Pets
