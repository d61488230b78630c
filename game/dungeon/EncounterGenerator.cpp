#include "EncounterGenerator.h"

#include <algorithm>
#include <cmath>
#include <set>

#include "../../engine/core/Logger.h"

namespace Pets {

using Forge::ErrorKind;
using Forge::Gameplay::AbilityType;

namespace {

int scaled(int value, float multiplier) {
    return static_cast<int>(std::lround(static_cast<float>(value) * multiplier));
}

const AbilityTemplate* findTemplate(const AbilityLibrary& library, const std::string& key) {
    for (const auto& t : library.templates) {
        if (t.key == key) return &t;
    }
    return nullptr;
}

}  // namespace

Pet EncounterGenerator::instantiate(const EnemyTemplate& tpl, float difficultyMultiplier,
                                    Forge::SeededRandom& rng) const {
    Pet pet{};
    pet.id = "enemy-" + rng.nextToken(12);
    pet.owner = kDungeonEnemyOwner;
    pet.templateId = tpl.id;
    pet.name = tpl.name;
    pet.family = tpl.family;
    pet.rarity = tpl.rarity;

    const int hp = std::max(1, scaled(tpl.baseStats.maxHp, difficultyMultiplier));
    pet.stats = Forge::Gameplay::makeStats(hp, scaled(tpl.baseStats.attack, difficultyMultiplier),
                                           scaled(tpl.baseStats.defense, difficultyMultiplier), tpl.baseStats.speed);

    for (const auto& key : tpl.abilityKeys) {
        const AbilityTemplate* at = findTemplate(library_, key);
        if (!at) {
            Forge::logWarn("Enemy " + tpl.id + " references unknown ability " + key);
            continue;
        }
        auto ability = instantiateAbility(*at, tpl.rarity, rng);
        switch (ability.type) {
            case AbilityType::Passive:
                pet.passiveAbilities.push_back(std::move(ability));
                break;
            case AbilityType::Active:
                pet.activeAbilities.push_back(std::move(ability));
                break;
            case AbilityType::Ultimate:
                if (!pet.ultimateAbility) pet.ultimateAbility = std::move(ability);
                break;
        }
    }
    if (pet.activeAbilities.empty()) {
        pet.activeAbilities.push_back(Forge::Gameplay::basicStrike("basic-strike-" + rng.nextToken(6)));
    }
    pet.appearance.visualTags = tpl.visualTags;
    pet.lore = tpl.lore;
    return pet;
}

EncounterOutcome EncounterGenerator::generate(const Dungeon& dungeon, const EncounterRequest& request,
                                              Forge::SeededRandom& rng) const {
    EncounterOutcome out{};
    Forge::ErrorList errors;
    if (request.playerTeamSize < 1 || request.playerTeamSize > 4) {
        errors.add(ErrorKind::Validation,
                   "player team size must be between 1 and 4 (got " + std::to_string(request.playerTeamSize) + ")");
    }
    if (request.waveIndex < 0) errors.add(ErrorKind::Validation, "wave index cannot be negative");
    if (request.floorIndex < 0 || request.floorIndex >= static_cast<int>(dungeon.floors.size())) {
        errors.add(ErrorKind::NotFound,
                   "floor " + std::to_string(request.floorIndex) + " not found in dungeon " + dungeon.id);
    }
    if (auto err = errors.finish()) {
        out.error = std::move(err);
        return out;
    }

    const DungeonFloor& floor = dungeon.floors[static_cast<std::size_t>(request.floorIndex)];
    if (request.waveIndex >= static_cast<int>(floor.waves.size())) {
        out.isBoss = true;
        for (int i = 0; i < request.playerTeamSize; ++i) {
            out.enemies.push_back(instantiate(floor.boss, floor.difficultyMultiplier, rng));
        }
    } else {
        const auto& wave = floor.waves[static_cast<std::size_t>(request.waveIndex)];
        const std::size_t count = std::min(wave.size(), static_cast<std::size_t>(request.playerTeamSize));
        for (std::size_t i = 0; i < count; ++i) {
            out.enemies.push_back(instantiate(wave[i], 1.0f, rng));
        }
    }

    // Ids come from the rng; redraw on the unlikely clash so they stay unique per call.
    std::set<std::string> ids;
    for (auto& e : out.enemies) {
        while (!ids.insert(e.id).second) e.id = "enemy-" + rng.nextToken(12);
    }
    Forge::logInfo("Encounter on floor " + std::to_string(request.floorIndex) + ": " +
                   std::to_string(out.enemies.size()) + (out.isBoss ? " boss copies" : " minions"));
    return out;
}

}  // namespace Pets
