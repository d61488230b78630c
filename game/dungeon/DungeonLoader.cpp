#include <fstream>

#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"
#include "Dungeon.h"

namespace Pets {

namespace {

std::optional<EnemyTemplate> readEnemyFields(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    EnemyTemplate t{};
    t.id = j.value("id", std::string{});
    t.name = j.value("name", t.id);
    const std::string familyKey = j.value("family", std::string("PYRO_KIN"));
    const std::string rarityKey = j.value("rarity", std::string("Basic"));
    auto family = parseFamilyKey(familyKey);
    auto rarity = parseRarityKey(rarityKey);
    if (t.id.empty() || !family || !rarity) {
        Forge::logWarn("Skipping enemy template '" + t.id + "' (family " + familyKey + ", rarity " + rarityKey + ")");
        return std::nullopt;
    }
    t.family = *family;
    t.rarity = *rarity;
    if (j.contains("stats") && j["stats"].is_object()) {
        const auto& s = j["stats"];
        t.baseStats = Forge::Gameplay::makeStats(s.value("hp", 100), s.value("attack", 10), s.value("defense", 10),
                                                 s.value("speed", 10));
    } else {
        t.baseStats = Forge::Gameplay::makeStats(100, 10, 10, 10);
    }
    if (j.contains("abilities") && j["abilities"].is_array()) {
        for (const auto& k : j["abilities"]) {
            if (k.is_string()) t.abilityKeys.push_back(k.get<std::string>());
        }
    }
    if (j.contains("visualTags") && j["visualTags"].is_array()) {
        for (const auto& v : j["visualTags"]) {
            if (v.is_string()) t.visualTags.push_back(v.get<std::string>());
        }
    }
    t.lore = j.value("lore", std::string{});
    return t;
}

std::optional<EnemyTemplate> readEnemy(const nlohmann::json& j) {
    try {
        return readEnemyFields(j);
    } catch (const nlohmann::json::exception& e) {
        Forge::logWarn(std::string("Skipping enemy template with a mistyped field: ") + e.what());
        return std::nullopt;
    }
}

std::optional<Dungeon> readDungeon(const nlohmann::json& j, const std::string& path) {
    Dungeon d{};
    d.id = j.value("id", std::string("dungeon"));
    d.name = j.value("name", d.id);
    if (!j.contains("floors") || !j["floors"].is_array()) {
        Forge::logWarn("Dungeon has no floors: " + path);
        return std::nullopt;
    }
    for (const auto& fj : j["floors"]) {
        if (!fj.is_object()) continue;
        auto boss = fj.contains("boss") ? readEnemy(fj["boss"]) : std::nullopt;
        if (!boss) {
            Forge::logWarn("Skipping dungeon floor without a valid boss");
            continue;
        }
        DungeonFloor floor{};
        floor.boss = std::move(*boss);
        floor.difficultyMultiplier = fj.value("difficultyMultiplier", floor.difficultyMultiplier);
        if (fj.contains("waves") && fj["waves"].is_array()) {
            for (const auto& wj : fj["waves"]) {
                if (!wj.is_array()) continue;
                std::vector<EnemyTemplate> wave;
                for (const auto& ej : wj) {
                    if (auto e = readEnemy(ej)) wave.push_back(std::move(*e));
                }
                if (!wave.empty()) floor.waves.push_back(std::move(wave));
            }
        }
        d.floors.push_back(std::move(floor));
    }
    if (d.floors.empty()) {
        Forge::logWarn("Dungeon has no usable floors: " + path);
        return std::nullopt;
    }
    return d;
}

}  // namespace

std::optional<Dungeon> loadDungeon(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        Forge::logWarn("Missing dungeon file: " + path);
        return std::nullopt;
    }
    const nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        Forge::logWarn("Invalid dungeon JSON: " + path);
        return std::nullopt;
    }

    try {
        return readDungeon(j, path);
    } catch (const nlohmann::json::exception& e) {
        Forge::logWarn("Invalid dungeon field in " + path + ": " + e.what());
        return std::nullopt;
    }
}

}  // namespace Pets
