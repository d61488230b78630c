#pragma once

#include <functional>
#include <string>
#include <vector>

#include "StatusTypes.h"

namespace Forge::Status {

// Container owned per-combatant, manages application, stacking, and turn-based expiry.
class StatusContainer {
public:
    bool apply(const StatusSpec& spec, const std::string& source);
    void remove(StatusType type);
    void clear(bool includePermanent = false);

    // One turn elapses: computes DoT/HoT for the given maxHp, decrements durations, prunes expired.
    TickResult tick(int maxHp);

    bool has(StatusType type) const;
    bool hasTag(StatusTag tag) const;
    int stacks(StatusType type) const;
    bool isIncapacitated() const;
    bool isStealthed() const;
    bool empty() const { return statuses_.empty(); }

    // Utility hook to purge all statuses matching predicate (used by cleanse effects).
    void purgeIf(const std::function<bool(const StatusInstance&)>& pred);

    const std::vector<StatusInstance>& all() const { return statuses_; }

private:
    std::vector<StatusInstance> statuses_;
};

// Sum of active modifier percents for one stat.
float modifierTotal(const std::vector<StatModifier>& mods, Gameplay::StatKind stat);

// Decrements modifier durations and drops expired ones; returns how many expired.
int tickModifiers(std::vector<StatModifier>& mods);

}  // namespace Forge::Status
