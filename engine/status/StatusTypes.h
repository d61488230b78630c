#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "../gameplay/CombatStats.h"

namespace Forge::Status {

// Enumerations describing supported status effects and semantic tags.
enum class StatusType {
    Burn,
    Poison,
    Stun,
    Freeze,
    Stealth,
    Regeneration
};

enum class StatusTag {
    DamageOverTime,
    HealOverTime,
    Incapacitate,
    Evasion
};

struct StatusSpec {
    StatusType type{StatusType::Burn};
    std::vector<StatusTag> tags;
    int duration{2};          // turns; <= 0 means infinite.
    int maxStacks{1};
    bool refreshOnReapply{true};
    bool isDebuff{true};
    float magnitude{0.0f};    // fraction of maxHp per tick for DoT/HoT.
};

struct StatusInstance {
    StatusSpec spec;
    std::string source;  // creature id of the applier
    int remaining{0};
    int stacks{1};

    bool infinite() const { return spec.duration <= 0; }
};

// Percent stat modifier produced by buff/debuff effects.
struct StatModifier {
    Gameplay::StatKind stat{Gameplay::StatKind::Attack};
    float percent{0.0f};  // 20 == +20% (buff) or -20% (debuff, sign applied by caller)
    int remaining{3};
    bool permanent{false};  // passive-granted; never ticks down
    std::string source;
};

// Aggregate hp change produced by one tick of all periodic statuses.
struct TickResult {
    int damage{0};
    int healing{0};
    int expired{0};
};

}  // namespace Forge::Status
