#include "StatusContainer.h"

#include <algorithm>
#include <cmath>

namespace Forge::Status {

namespace {
bool specHasTag(const StatusSpec& spec, StatusTag tag) {
    return std::find(spec.tags.begin(), spec.tags.end(), tag) != spec.tags.end();
}

int periodicAmount(const StatusInstance& inst, int maxHp) {
    const float raw = static_cast<float>(maxHp) * inst.spec.magnitude * static_cast<float>(inst.stacks);
    return std::max(1, static_cast<int>(std::lround(raw)));
}
}  // namespace

bool StatusContainer::apply(const StatusSpec& spec, const std::string& source) {
    for (auto& inst : statuses_) {
        if (inst.spec.type == spec.type) {
            inst.source = source;
            if (spec.refreshOnReapply) {
                inst.remaining = spec.duration;
            }
            if (inst.spec.maxStacks > 1 || spec.maxStacks > 1) {
                const int maxStacks = std::max(inst.spec.maxStacks, spec.maxStacks);
                inst.stacks = std::clamp(inst.stacks + 1, 1, maxStacks);
            } else {
                inst.stacks = 1;
            }
            inst.spec = spec;
            return true;
        }
    }

    StatusInstance inst;
    inst.spec = spec;
    inst.source = source;
    inst.remaining = spec.duration;
    inst.stacks = 1;
    statuses_.push_back(inst);
    return true;
}

void StatusContainer::remove(StatusType type) {
    statuses_.erase(std::remove_if(statuses_.begin(), statuses_.end(),
                                   [type](const StatusInstance& inst) { return inst.spec.type == type; }),
                    statuses_.end());
}

void StatusContainer::clear(bool includePermanent) {
    statuses_.erase(
        std::remove_if(statuses_.begin(), statuses_.end(),
                       [includePermanent](const StatusInstance& inst) {
                           if (!includePermanent && inst.infinite()) return false;
                           return true;
                       }),
        statuses_.end());
}

TickResult StatusContainer::tick(int maxHp) {
    TickResult out{};
    for (auto& inst : statuses_) {
        if (specHasTag(inst.spec, StatusTag::DamageOverTime)) {
            out.damage += periodicAmount(inst, maxHp);
        } else if (specHasTag(inst.spec, StatusTag::HealOverTime)) {
            out.healing += periodicAmount(inst, maxHp);
        }
        if (!inst.infinite()) {
            inst.remaining -= 1;
        }
    }
    const auto before = statuses_.size();
    statuses_.erase(std::remove_if(statuses_.begin(), statuses_.end(),
                                   [](const StatusInstance& inst) {
                                       if (inst.infinite()) return false;
                                       return inst.remaining <= 0;
                                   }),
                    statuses_.end());
    out.expired = static_cast<int>(before - statuses_.size());
    return out;
}

bool StatusContainer::has(StatusType type) const {
    for (const auto& inst : statuses_) {
        if (inst.spec.type == type) return true;
    }
    return false;
}

bool StatusContainer::hasTag(StatusTag tag) const {
    for (const auto& inst : statuses_) {
        if (specHasTag(inst.spec, tag)) return true;
    }
    return false;
}

int StatusContainer::stacks(StatusType type) const {
    for (const auto& inst : statuses_) {
        if (inst.spec.type == type) return inst.stacks;
    }
    return 0;
}

bool StatusContainer::isIncapacitated() const {
    return hasTag(StatusTag::Incapacitate);
}

bool StatusContainer::isStealthed() const {
    return has(StatusType::Stealth);
}

void StatusContainer::purgeIf(const std::function<bool(const StatusInstance&)>& pred) {
    statuses_.erase(std::remove_if(statuses_.begin(), statuses_.end(),
                                   [&](const StatusInstance& inst) { return pred(inst); }),
                    statuses_.end());
}

float modifierTotal(const std::vector<StatModifier>& mods, Gameplay::StatKind stat) {
    float total = 0.0f;
    for (const auto& m : mods) {
        if (m.stat == stat) total += m.percent;
    }
    return total;
}

int tickModifiers(std::vector<StatModifier>& mods) {
    for (auto& m : mods) {
        if (!m.permanent) m.remaining -= 1;
    }
    const auto before = mods.size();
    mods.erase(std::remove_if(mods.begin(), mods.end(),
                              [](const StatModifier& m) { return !m.permanent && m.remaining <= 0; }),
               mods.end());
    return static_cast<int>(before - mods.size());
}

}  // namespace Forge::Status
