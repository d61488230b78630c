// JSON loaders for tuning constants and the ability template library.
#include <algorithm>
#include <fstream>

#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"
#include "AbilityLibrary.h"
#include "FusionTuning.h"

namespace Pets {

namespace {

using Forge::Gameplay::AbilityType;
using Forge::Gameplay::EffectType;
using Forge::Gameplay::TargetKind;

std::optional<nlohmann::json> readJson(const std::string& path, const char* what) {
    std::ifstream f(path);
    if (!f.is_open()) {
        Forge::logWarn(std::string("Missing ") + what + " file, using defaults: " + path);
        return std::nullopt;
    }
    nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        Forge::logWarn(std::string("Invalid ") + what + " JSON, using defaults: " + path);
        return std::nullopt;
    }
    return j;
}

void readEscalator(const nlohmann::json& j, EscalatorTuning& t) {
    t.baseChance = j.value("baseChance", t.baseChance);
    t.sameRarityBonus = j.value("sameRarityBonus", t.sameRarityBonus);
    t.perTierStep = j.value("perTierStep", t.perTierStep);
    t.perFusion = j.value("perFusion", t.perFusion);
    t.fusionCountCap = j.value("fusionCountCap", t.fusionCountCap);
    t.maxChance = j.value("maxChance", t.maxChance);
}

void readCalculator(const nlohmann::json& j, CalculatorTuning& t) {
    t.variance = j.value("variance", t.variance);
    t.tierStatStep = j.value("tierStatStep", t.tierStatStep);
}

void readCorruption(const nlohmann::json& j, CorruptionTuning& t) {
    t.itemBaseChance = j.value("itemBaseChance", t.itemBaseChance);
    t.itemHighTierBonus = j.value("itemHighTierBonus", t.itemHighTierBonus);
    t.itemDualTierVBonus = j.value("itemDualTierVBonus", t.itemDualTierVBonus);
    t.itemPerFusion = j.value("itemPerFusion", t.itemPerFusion);
    t.itemFusionBonusCap = j.value("itemFusionBonusCap", t.itemFusionBonusCap);
    t.itemMaxChance = j.value("itemMaxChance", t.itemMaxChance);
    t.statBonusMultiplier = j.value("statBonusMultiplier", t.statBonusMultiplier);
    t.minPowerBoost = j.value("minPowerBoost", t.minPowerBoost);
    t.maxPowerBoost = j.value("maxPowerBoost", t.maxPowerBoost);
    t.generationThreshold = j.value("generationThreshold", t.generationThreshold);
    t.generationBaseChance = j.value("generationBaseChance", t.generationBaseChance);
    t.generationStep = j.value("generationStep", t.generationStep);
    t.mutationThreshold = j.value("mutationThreshold", t.mutationThreshold);
    t.mutationBaseChance = j.value("mutationBaseChance", t.mutationBaseChance);
    t.mutationStep = j.value("mutationStep", t.mutationStep);
    t.mutationMaxChance = j.value("mutationMaxChance", t.mutationMaxChance);
    t.fusionCountThreshold = j.value("fusionCountThreshold", t.fusionCountThreshold);
    t.fusionCountBaseChance = j.value("fusionCountBaseChance", t.fusionCountBaseChance);
    t.fusionCountStep = j.value("fusionCountStep", t.fusionCountStep);
    t.fusionCountMaxChance = j.value("fusionCountMaxChance", t.fusionCountMaxChance);
}

void readCombat(const nlohmann::json& j, CombatTuning& t) {
    t.startingEnergy = j.value("startingEnergy", t.startingEnergy);
    t.maxEnergy = j.value("maxEnergy", t.maxEnergy);
    t.energyRegen = j.value("energyRegen", t.energyRegen);
    t.turnLimit = j.value("turnLimit", t.turnLimit);
    t.frontRowMultiplier = j.value("frontRowMultiplier", t.frontRowMultiplier);
    t.backRowMultiplier = j.value("backRowMultiplier", t.backRowMultiplier);
    t.defenseFactor = j.value("defenseFactor", t.defenseFactor);
    t.critChance = j.value("critChance", t.critChance);
    t.critMultiplier = j.value("critMultiplier", t.critMultiplier);
    t.stealthHitChance = j.value("stealthHitChance", t.stealthHitChance);
    t.defaultBuffDuration = j.value("defaultBuffDuration", t.defaultBuffDuration);
    t.defaultStatusDuration = j.value("defaultStatusDuration", t.defaultStatusDuration);
}

// A wrong-typed field makes json::value throw; the whole section then keeps its defaults.
template <typename Section, typename Reader>
void readSection(const nlohmann::json& root, const char* key, Section& section, Reader reader) {
    if (!root.contains(key) || !root[key].is_object()) return;
    Section parsed = section;
    try {
        reader(root[key], parsed);
    } catch (const nlohmann::json::exception& e) {
        Forge::logWarn(std::string("Ignoring tuning section '") + key + "': " + e.what());
        return;
    }
    section = parsed;
}

std::optional<EffectTemplate> readEffect(const nlohmann::json& e) {
    if (!e.is_object()) return std::nullopt;
    auto type = Forge::Gameplay::parseEffectTypeKey(e.value("type", std::string{}));
    auto target = Forge::Gameplay::parseTargetKindKey(e.value("target", std::string{"single-enemy"}));
    if (!type || !target) return std::nullopt;

    EffectTemplate t{};
    t.effect.type = *type;
    t.effect.target = *target;
    t.effect.value = e.value("value", t.effect.value);
    if (e.contains("scaling") && e["scaling"].is_string()) {
        t.effect.scalingStat = Forge::Gameplay::parseStatKindKey(e["scaling"].get<std::string>());
    }
    if (e.contains("element") && e["element"].is_string()) {
        t.effect.element = Forge::Gameplay::parseElementKey(e["element"].get<std::string>());
    }
    if (e.contains("statusType") && e["statusType"].is_string()) {
        t.effect.statusType = Forge::Gameplay::parseStatusTypeKey(e["statusType"].get<std::string>());
        if (!t.effect.statusType) return std::nullopt;
    }
    if (e.contains("statusChance")) t.effect.statusChance = e.value("statusChance", 100.0f);
    if (e.contains("statusDuration")) t.effect.statusDuration = e.value("statusDuration", 2);
    if (e.contains("lifesteal")) t.effect.lifesteal = e.value("lifesteal", 0.0f);
    if (e.contains("valueRange") && e["valueRange"].is_array() && e["valueRange"].size() == 2) {
        const auto& r = e["valueRange"];
        if (r[0].is_number() && r[1].is_number()) {
            t.valueRange = std::make_pair(r[0].get<float>(), r[1].get<float>());
        }
    }
    if (t.effect.type == EffectType::Status && !t.effect.statusType) return std::nullopt;
    return t;
}

std::optional<AbilityTemplate> readTemplate(const nlohmann::json& a) {
    if (!a.is_object()) return std::nullopt;
    AbilityTemplate t{};
    t.key = a.value("key", std::string{});
    t.name = a.value("name", std::string{});
    if (t.key.empty() || t.name.empty()) return std::nullopt;
    t.description = a.value("description", std::string{});

    auto type = Forge::Gameplay::parseAbilityTypeKey(a.value("type", std::string{"active"}));
    if (!type) return std::nullopt;
    t.type = *type;
    if (t.type != AbilityType::Passive) {
        t.energyCost = a.value("energyCost", 20);
        t.cooldown = a.value("cooldown", 1);
    }
    if (a.contains("element") && a["element"].is_string()) {
        t.element = Forge::Gameplay::parseElementKey(a["element"].get<std::string>());
    }
    if (a.contains("minRarity") && a["minRarity"].is_string()) {
        t.minRarity = parseRarityKey(a["minRarity"].get<std::string>()).value_or(Rarity::Basic);
    }
    t.glitched = a.value("glitched", false);
    if (a.contains("tags") && a["tags"].is_array()) {
        for (const auto& tag : a["tags"]) {
            if (tag.is_string()) t.tags.push_back(tag.get<std::string>());
        }
    }
    if (!a.contains("effects") || !a["effects"].is_array()) return std::nullopt;
    for (const auto& e : a["effects"]) {
        auto eff = readEffect(e);
        if (!eff) {
            Forge::logWarn("Skipping malformed effect in ability " + t.key);
            continue;
        }
        t.effects.push_back(*eff);
    }
    if (t.effects.empty()) return std::nullopt;
    return t;
}

}  // namespace

FusionTuning loadFusionTuning(const std::string& path) {
    FusionTuning tuning{};
    auto j = readJson(path, "tuning");
    if (!j) return tuning;

    readSection(*j, "escalator", tuning.escalator, readEscalator);
    readSection(*j, "calculator", tuning.calculator, readCalculator);
    readSection(*j, "corruption", tuning.corruption, readCorruption);
    readSection(*j, "combat", tuning.combat, readCombat);

    if (tuning.escalator.maxChance < 0.0f || tuning.escalator.maxChance > 1.0f) {
        Forge::logWarn("escalator.maxChance out of range, clamping");
        tuning.escalator.maxChance = std::min(1.0f, std::max(0.0f, tuning.escalator.maxChance));
    }
    if (tuning.combat.maxEnergy <= 0 || tuning.combat.turnLimit <= 0) {
        Forge::logWarn("combat tuning has non-positive limits, restoring defaults");
        tuning.combat = CombatTuning{};
    }
    Forge::logInfo("Loaded tuning from " + path);
    return tuning;
}

AbilityLibrary loadAbilityLibrary(const std::string& path) {
    auto j = readJson(path, "ability library");
    if (!j) return defaultAbilityLibrary();
    if (!j->contains("abilities") || !(*j)["abilities"].is_array()) {
        Forge::logWarn("Ability library has no 'abilities' array, using defaults: " + path);
        return defaultAbilityLibrary();
    }

    AbilityLibrary lib{};
    for (const auto& a : (*j)["abilities"]) {
        std::optional<AbilityTemplate> tpl;
        try {
            tpl = readTemplate(a);
        } catch (const nlohmann::json::exception& e) {
            Forge::logWarn(std::string("Ability template has a mistyped field: ") + e.what());
        }
        if (!tpl) {
            Forge::logWarn("Skipping malformed ability template in " + path);
            continue;
        }
        lib.templates.push_back(std::move(*tpl));
    }
    // Assembly needs at least one non-glitched active at Basic rarity.
    if (lib.filter(AbilityType::Active, std::nullopt, Rarity::Basic).empty()) {
        Forge::logWarn("Ability library has no basic actives, using defaults: " + path);
        return defaultAbilityLibrary();
    }
    Forge::logInfo("Loaded " + std::to_string(lib.templates.size()) + " ability templates from " + path);
    return lib;
}

}  // namespace Pets
