#include "CombatStats.h"

#include <algorithm>

namespace Forge::Gameplay {

int Stats::get(StatKind kind) const {
    switch (kind) {
        case StatKind::MaxHp:
            return maxHp;
        case StatKind::Attack:
            return attack;
        case StatKind::Defense:
            return defense;
        case StatKind::Speed:
            return speed;
        case StatKind::Count:
        default:
            return 0;
    }
}

bool StatBonuses::empty() const {
    return std::none_of(values.begin(), values.end(), [](const std::optional<float>& v) { return v.has_value(); });
}

Stats makeStats(int maxHp, int attack, int defense, int speed) {
    Stats s{};
    s.maxHp = std::max(0, maxHp);
    s.hp = s.maxHp;
    s.attack = std::max(0, attack);
    s.defense = std::max(0, defense);
    s.speed = std::max(0, speed);
    return s;
}

void clampStats(Stats& stats) {
    stats.maxHp = std::max(0, stats.maxHp);
    stats.hp = clampHp(stats.hp, stats.maxHp);
    stats.attack = std::max(0, stats.attack);
    stats.defense = std::max(0, stats.defense);
    stats.speed = std::max(0, stats.speed);
}

const char* statKindName(StatKind kind) {
    switch (kind) {
        case StatKind::MaxHp:
            return "hp";
        case StatKind::Attack:
            return "attack";
        case StatKind::Defense:
            return "defense";
        case StatKind::Speed:
            return "speed";
        case StatKind::Count:
        default:
            return "none";
    }
}

std::optional<StatKind> parseStatKindKey(std::string_view key) {
    if (key == "hp" || key == "maxHp") return StatKind::MaxHp;
    if (key == "attack") return StatKind::Attack;
    if (key == "defense") return StatKind::Defense;
    if (key == "speed") return StatKind::Speed;
    return std::nullopt;
}

}  // namespace Forge::Gameplay
