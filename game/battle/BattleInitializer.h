// Builds a Battle from two creature teams: rows, lineage, domains and the fixed turn order.
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "../../engine/core/Error.h"
#include "../content/FusionTuning.h"
#include "Battle.h"

namespace Pets {

constexpr int kMinTeamSize = 1;
constexpr int kMaxTeamSize = 4;

struct BattleInitOutcome {
    std::optional<Battle> battle;
    std::optional<Forge::Error> error;
};

// speed * (1 + lineage speed boosts)
float effectiveSpeed(const CombatPet& combatant);

class BattleInitializer {
public:
    explicit BattleInitializer(CombatTuning tuning = {}) : tuning_(tuning) {}

    BattleInitOutcome initialize(const std::vector<Pet>& team1, const std::vector<Pet>& team2, std::uint32_t seed,
                                 std::int64_t createdAt = 0) const;

private:
    CombatPet makeCombatant(const Pet& pet, Side side, std::size_t index, std::size_t teamSize) const;

    CombatTuning tuning_;
};

}  // namespace Pets
