// Data loading: tuning, ability library, dungeon and status catalog, shipped files and fallbacks.
#include <cassert>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

#include "../engine/core/Logger.h"
#include "../game/content/AbilityLibrary.h"
#include "../game/content/FusionTuning.h"
#include "../game/dungeon/Dungeon.h"
#include "../game/status/StatusCatalog.h"

#ifndef PIXELFORGE_DATA_DIR
#define PIXELFORGE_DATA_DIR "data"
#endif

using namespace Pets;

namespace {

const std::string kDataDir = PIXELFORGE_DATA_DIR;

std::string writeTemp(const std::string& name, const std::string& body) {
    const auto path = std::filesystem::temp_directory_path() / ("pixelforge-" + name);
    std::ofstream out(path);
    out << body;
    return path.string();
}

}  // namespace

int main() {
    Forge::Logger::setMinLevel(Forge::LogLevel::Silent);

    // Tuning: missing and broken files keep every default.
    {
        const FusionTuning missing = loadFusionTuning("/nonexistent/tuning.json");
        assert(missing.combat.turnLimit == 50);
        assert(missing.escalator.maxChance == 0.5f);

        const std::string broken = writeTemp("broken.json", "{ \"combat\": ");
        const FusionTuning bad = loadFusionTuning(broken);
        assert(bad.combat.maxEnergy == 100);
        assert(bad.calculator.variance == 0.15f);
        std::remove(broken.c_str());
    }

    // Tuning: a partial file only overrides what it names.
    {
        const std::string partial = writeTemp("partial.json", "{\"combat\": {\"turnLimit\": 7}}");
        const FusionTuning t = loadFusionTuning(partial);
        assert(t.combat.turnLimit == 7);
        assert(t.combat.startingEnergy == 50);
        assert(t.corruption.itemMaxChance == 0.15f);
        std::remove(partial.c_str());

        const std::string silly = writeTemp("silly.json", "{\"combat\": {\"maxEnergy\": 0, \"turnLimit\": 9}}");
        const FusionTuning reset = loadFusionTuning(silly);
        assert(reset.combat.maxEnergy == 100 && reset.combat.turnLimit == 50);
        std::remove(silly.c_str());
    }

    // A mistyped field drops only its own section back to the defaults.
    {
        const std::string mistyped = writeTemp(
            "mistyped.json", "{\"escalator\": {\"baseChance\": \"high\", \"maxChance\": 0.9}, \"combat\": {\"turnLimit\": 12}}");
        const FusionTuning t = loadFusionTuning(mistyped);
        assert(t.escalator.baseChance == 0.15f);
        assert(t.escalator.maxChance == 0.5f);
        assert(t.combat.turnLimit == 12);
        std::remove(mistyped.c_str());
    }

    // Shipped tuning matches the built-in defaults.
    {
        const FusionTuning shipped = loadFusionTuning(kDataDir + "/tuning.json");
        assert(shipped.escalator.baseChance == 0.15f);
        assert(shipped.combat.energyRegen == 10);
        assert(shipped.corruption.generationThreshold == 5);
    }

    // Ability library: fallback and the shipped file.
    {
        const AbilityLibrary fallback = loadAbilityLibrary("/nonexistent/abilities.json");
        assert(fallback.templates.size() == defaultAbilityLibrary().templates.size());
        assert(!fallback.templates.empty());

        const std::string noArray = writeTemp("abilities.json", "{\"abilities\": 3}");
        assert(loadAbilityLibrary(noArray).templates.size() == fallback.templates.size());
        std::remove(noArray.c_str());

        const std::string oneBad = writeTemp(
            "abilities-mixed.json",
            "{\"abilities\": ["
            "{\"key\": \"poke\", \"name\": \"Poke\", \"type\": \"active\", \"energyCost\": 10,"
            " \"effects\": [{\"type\": \"damage\", \"target\": \"single-enemy\", \"value\": 1.0}]},"
            "{\"key\": \"shove\", \"name\": \"Shove\", \"type\": \"active\", \"energyCost\": \"lots\","
            " \"effects\": [{\"type\": \"damage\", \"target\": \"single-enemy\", \"value\": 1.0}]}]}");
        const AbilityLibrary mixed = loadAbilityLibrary(oneBad);
        assert(mixed.templates.size() == 1 && mixed.templates[0].key == "poke");
        std::remove(oneBad.c_str());

        const AbilityLibrary shipped = loadAbilityLibrary(kDataDir + "/abilities.json");
        assert(shipped.templates.size() == 13);
        assert(!shipped.filter(Forge::Gameplay::AbilityType::Active, std::nullopt, Rarity::Basic).empty());
        assert(!shipped.glitched(Forge::Gameplay::AbilityType::Active).empty());
        bool sawJab = false;
        for (const auto& t : shipped.templates) sawJab = sawJab || t.key == "quick_jab";
        assert(sawJab);
    }

    // Dungeon: missing file and the shipped caves.
    {
        assert(!loadDungeon("/nonexistent/dungeon.json"));
        const auto caves = loadDungeon(kDataDir + "/dungeon.json");
        assert(caves);
        assert(caves->id == "ember-caves");
        assert(caves->floors.size() == 1);
        const DungeonFloor& floor = caves->floors[0];
        assert(floor.waves.size() == 2);
        assert(floor.waves[0].size() == 2 && floor.waves[1].size() == 1);
        assert(floor.boss.rarity == Rarity::Rare);
        assert(floor.boss.family == Family::PyroKin);
        assert(floor.difficultyMultiplier == 1.5f);
        assert(floor.waves[0][1].baseStats.maxHp == 600);

        // A mistyped minion is skipped; a mistyped floor field rejects the file.
        const std::string badMinion = writeTemp(
            "dungeon-minion.json",
            "{\"id\": \"pit\", \"floors\": [{\"boss\": {\"id\": \"king\", \"stats\": {\"hp\": 50}},"
            " \"waves\": [[{\"id\": \"rat\"}, {\"id\": \"ghost\", \"stats\": {\"hp\": \"many\"}}]]}]}");
        const auto pit = loadDungeon(badMinion);
        assert(pit && pit->floors[0].waves.size() == 1 && pit->floors[0].waves[0].size() == 1);
        assert(pit->floors[0].waves[0][0].id == "rat");
        std::remove(badMinion.c_str());

        const std::string badFloor = writeTemp(
            "dungeon-floor.json",
            "{\"floors\": [{\"difficultyMultiplier\": \"steep\", \"boss\": {\"id\": \"king\"}}]}");
        assert(!loadDungeon(badFloor));
        std::remove(badFloor.c_str());
    }

    // Status catalog: defaults without a file, overrides from the shipped one.
    {
        StatusCatalog empty;
        assert(!empty.load("/nonexistent/statuses.json"));
        assert(empty.make(Forge::Status::StatusType::Stun).duration == 1);

        StatusCatalog shipped;
        assert(shipped.load(kDataDir + "/statuses.json"));
        const auto stun = shipped.make(Forge::Status::StatusType::Stun);
        assert(stun.duration == 2);
        assert(stun.tags.size() == 1 && stun.tags[0] == Forge::Status::StatusTag::Incapacitate);
        assert(shipped.make(Forge::Status::StatusType::Poison).maxStacks == 5);

        const std::string mistyped = writeTemp(
            "statuses.json", "{\"stun\": {\"duration\": \"long\"}, \"burn\": {\"duration\": 4}}");
        StatusCatalog partial;
        assert(partial.load(mistyped));
        assert(partial.make(Forge::Status::StatusType::Stun).duration == 1);
        assert(partial.make(Forge::Status::StatusType::Burn).duration == 4);
        std::remove(mistyped.c_str());
    }

    return 0;
}
