// Static dungeon content: floors of minion waves plus a boss, loaded from JSON.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../content/Creature.h"

namespace Pets {

struct EnemyTemplate {
    std::string id;
    std::string name;
    Family family{Family::PyroKin};
    Rarity rarity{Rarity::Basic};
    Stats baseStats{};
    std::vector<std::string> abilityKeys;  // library template keys; passives, actives and ultimates mixed
    std::vector<std::string> visualTags;
    std::string lore;
};

struct DungeonFloor {
    std::vector<std::vector<EnemyTemplate>> waves;
    EnemyTemplate boss{};
    float difficultyMultiplier{1.5f};
};

struct Dungeon {
    std::string id;
    std::string name;
    std::vector<DungeonFloor> floors;
};

// {"id","name","floors":[{"difficultyMultiplier","boss":{...},"waves":[[{...}]]}]}
// Unknown enum keys drop the entry with a warning; nullopt when the file is unusable.
std::optional<Dungeon> loadDungeon(const std::string& path);

}  // namespace Pets
