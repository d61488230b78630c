// Integer stat block shared by creatures, fusion math and combat.
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace Forge::Gameplay {

// Stat channels. Also used as the scaling stat of effects and the target stat of buffs.
enum class StatKind : std::uint8_t {
    MaxHp = 0,
    Attack,
    Defense,
    Speed,
    Count
};

struct Stats {
    int hp{0};
    int maxHp{0};
    int attack{0};
    int defense{0};
    int speed{0};

    int get(StatKind kind) const;
    int total() const { return maxHp + attack + defense + speed; }
};

// Partial per-stat fractional bonus (0.10 == +10%). Unset entries mean "no bonus".
struct StatBonuses {
    std::array<std::optional<float>, static_cast<std::size_t>(StatKind::Count)> values{};

    std::optional<float> get(StatKind kind) const {
        return values[static_cast<std::size_t>(kind)];
    }
    void set(StatKind kind, float v) {
        values[static_cast<std::size_t>(kind)] = v;
    }
    bool empty() const;
};

// hp starts at maxHp; negative inputs clamp to zero.
Stats makeStats(int maxHp, int attack, int defense, int speed);

// Re-establishes 0 <= hp <= maxHp and non-negative attack/defense/speed.
void clampStats(Stats& stats);

// Clamp helper used by every hp mutation in combat.
inline int clampHp(int hp, int maxHp) {
    if (hp < 0) return 0;
    return hp > maxHp ? maxHp : hp;
}

const char* statKindName(StatKind kind);
std::optional<StatKind> parseStatKindKey(std::string_view key);

}  // namespace Forge::Gameplay
