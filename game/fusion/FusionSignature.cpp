#include "FusionSignature.h"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"

namespace Pets {

using Forge::Gameplay::Ability;
using Forge::Gameplay::Element;

namespace {

AbilitySignature abilitySignature(const Ability& a) {
    AbilitySignature s{};
    s.name = a.name;
    s.type = a.type;
    s.element = a.element;
    s.tags = a.tags;
    for (const auto& e : a.effects) s.effects.push_back(Forge::Gameplay::describeEffect(e));
    return s;
}

PetSignature petSignature(const Pet& pet) {
    PetSignature s{};
    s.id = pet.id;
    s.name = pet.name;
    s.family = pet.family;
    s.rarity = pet.rarity;
    s.generation = pet.generation();
    s.stats = pet.stats;
    s.element = primaryElement(pet);
    for (const auto& a : pet.passiveAbilities) s.abilities.push_back(abilitySignature(a));
    for (const auto& a : pet.activeAbilities) s.abilities.push_back(abilitySignature(a));
    if (pet.ultimateAbility) s.abilities.push_back(abilitySignature(*pet.ultimateAbility));
    s.visualTags = pet.appearance.visualTags;
    return s;
}

StoneSignature stoneSignature(const Stone& stone) {
    StoneSignature s{};
    s.id = stone.id;
    s.type = stone.type;
    s.tier = stone.tier;
    s.isCorrupted = stone.isCorrupted;
    return s;
}

nlohmann::json statsJson(const Stats& st) {
    return {{"hp", st.hp}, {"maxHp", st.maxHp}, {"attack", st.attack}, {"defense", st.defense}, {"speed", st.speed}};
}

nlohmann::json petJson(const PetSignature& p) {
    nlohmann::json j;
    j["id"] = p.id;
    j["name"] = p.name;
    j["family"] = familyName(p.family);
    j["rarity"] = rarityName(p.rarity);
    j["generation"] = p.generation;
    j["stats"] = statsJson(p.stats);
    j["element"] = Forge::Gameplay::elementName(p.element);
    j["visualTags"] = p.visualTags;
    nlohmann::json abilities = nlohmann::json::array();
    for (const auto& a : p.abilities) {
        nlohmann::json aj;
        aj["name"] = a.name;
        aj["type"] = Forge::Gameplay::abilityTypeName(a.type);
        if (a.element) aj["element"] = Forge::Gameplay::elementName(*a.element);
        aj["tags"] = a.tags;
        aj["effects"] = a.effects;
        abilities.push_back(std::move(aj));
    }
    j["abilities"] = std::move(abilities);
    return j;
}

std::vector<std::string> stringList(const nlohmann::json& j, const char* key) {
    std::vector<std::string> out;
    if (!j.contains(key) || !j[key].is_array()) return out;
    for (const auto& v : j[key]) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

std::optional<PetSignature> petFromJson(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    PetSignature p{};
    p.id = j.value("id", std::string{});
    p.name = j.value("name", std::string{});
    auto family = parseFamilyKey(j.value("family", std::string{}));
    auto rarity = parseRarityKey(j.value("rarity", std::string{}));
    auto element = Forge::Gameplay::parseElementKey(j.value("element", std::string{}));
    if (p.name.empty() || !family || !rarity || !element) return std::nullopt;
    p.family = *family;
    p.rarity = *rarity;
    p.element = *element;
    p.generation = j.value("generation", 0);
    if (j.contains("stats") && j["stats"].is_object()) {
        const auto& s = j["stats"];
        p.stats.maxHp = s.value("maxHp", 0);
        p.stats.hp = s.value("hp", p.stats.maxHp);
        p.stats.attack = s.value("attack", 0);
        p.stats.defense = s.value("defense", 0);
        p.stats.speed = s.value("speed", 0);
    }
    p.visualTags = stringList(j, "visualTags");
    if (j.contains("abilities") && j["abilities"].is_array()) {
        for (const auto& aj : j["abilities"]) {
            if (!aj.is_object()) continue;
            AbilitySignature a{};
            a.name = aj.value("name", std::string{});
            a.type = Forge::Gameplay::parseAbilityTypeKey(aj.value("type", std::string{"active"}))
                         .value_or(Forge::Gameplay::AbilityType::Active);
            if (aj.contains("element") && aj["element"].is_string()) {
                a.element = Forge::Gameplay::parseElementKey(aj["element"].get<std::string>());
            }
            a.tags = stringList(aj, "tags");
            a.effects = stringList(aj, "effects");
            p.abilities.push_back(std::move(a));
        }
    }
    return p;
}

const ElementInteraction* interactionByResult(const std::string& result) {
    for (const auto& i : elementInteractions()) {
        if (i.result == result) return &i;
    }
    return nullptr;
}

}  // namespace

const char* fusionIntentName(FusionIntent intent) {
    switch (intent) {
        case FusionIntent::Dominance: return "dominance";
        case FusionIntent::Resilience: return "resilience";
        case FusionIntent::Volatility: return "volatility";
        case FusionIntent::Symbiosis: return "symbiosis";
        case FusionIntent::Corruption: return "corruption";
    }
    return "dominance";
}

std::optional<FusionIntent> parseFusionIntentKey(std::string_view key) {
    for (auto intent : {FusionIntent::Dominance, FusionIntent::Resilience, FusionIntent::Volatility,
                        FusionIntent::Symbiosis, FusionIntent::Corruption}) {
        if (key == fusionIntentName(intent)) return intent;
    }
    return std::nullopt;
}

Element FusionSignature::preferredElement() const {
    if (interaction) return interaction->affinity;
    return parent1.element;
}

std::string fusionSeedString(const std::string& parent1Id, const std::string& parent2Id, const std::string& stone1Id,
                             const std::string& stone2Id, std::optional<FusionIntent> intent) {
    std::string seed = parent1Id + "|" + parent2Id + "|" + stone1Id + "|" + stone2Id;
    if (intent) seed += std::string("|") + fusionIntentName(*intent);
    return seed;
}

FusionSignature buildFusionSignature(const Pet& parent1, const Pet& parent2, const Stone& stone1, const Stone& stone2,
                                     std::optional<FusionIntent> intent) {
    FusionSignature sig{};
    sig.parent1 = petSignature(parent1);
    sig.parent2 = petSignature(parent2);
    sig.stones = {stoneSignature(stone1), stoneSignature(stone2)};
    sig.intent = intent;
    sig.generation = std::max(parent1.generation(), parent2.generation()) + 1;

    // Stones always carry an element, so the parent fallback only matters to enhancers reading the pair.
    sig.elementPair = {stoneElement(stone1.type), stoneElement(stone2.type)};
    if (const auto* hit = findElementInteraction(sig.elementPair[0], sig.elementPair[1])) sig.interaction = *hit;

    sig.seedString = fusionSeedString(parent1.id, parent2.id, stone1.id, stone2.id, intent);
    sig.seedHash = Forge::SeededRandom::hashString(sig.seedString);
    return sig;
}

std::uint32_t resolveFusionSeed(const FusionSignature& signature, std::optional<std::uint32_t> explicitSeed,
                                bool reproducible, std::int64_t nowMs) {
    if (explicitSeed) return *explicitSeed;
    if (reproducible) return signature.seedHash;
    return signature.seedHash ^ static_cast<std::uint32_t>(nowMs) ^ static_cast<std::uint32_t>(nowMs >> 32);
}

nlohmann::json signatureToJson(const FusionSignature& sig) {
    nlohmann::json j;
    j["parents"] = nlohmann::json::array({petJson(sig.parent1), petJson(sig.parent2)});
    nlohmann::json stones = nlohmann::json::array();
    for (const auto& s : sig.stones) {
        stones.push_back({{"id", s.id}, {"type", stoneTypeName(s.type)}, {"tier", s.tier},
                          {"isCorrupted", s.isCorrupted}});
    }
    j["stones"] = std::move(stones);
    j["elementPair"] = {Forge::Gameplay::elementName(sig.elementPair[0]),
                        Forge::Gameplay::elementName(sig.elementPair[1])};
    if (sig.interaction) {
        j["interaction"] = {{"result", sig.interaction->result},
                            {"affinity", Forge::Gameplay::elementName(sig.interaction->affinity)},
                            {"namePrefixes", sig.interaction->namePrefixes},
                            {"nameSuffixes", sig.interaction->nameSuffixes},
                            {"abilityThemes", sig.interaction->abilityThemes},
                            {"description", sig.interaction->description}};
    } else {
        j["interaction"] = nullptr;
    }
    j["intent"] = sig.intent ? nlohmann::json(fusionIntentName(*sig.intent)) : nlohmann::json(nullptr);
    j["generation"] = sig.generation;
    j["fusionSeed"] = sig.seedString;
    j["seedHash"] = sig.seedHash;
    if (sig.corruption) {
        j["corruption"] = {{"corrupted", sig.corruption->corrupted},
                           {"severity", sig.corruption->severity},
                           {"level", corruptionLevelName(sig.corruption->level)},
                           {"reasons", sig.corruption->reasons}};
    }
    return j;
}

std::string serializeSignature(const FusionSignature& signature) { return signatureToJson(signature).dump(2); }

namespace {

std::optional<FusionSignature> signatureFromJson(const nlohmann::json& j) {
    if (!j.contains("parents") || !j["parents"].is_array() || j["parents"].size() != 2) return std::nullopt;
    if (!j.contains("stones") || !j["stones"].is_array() || j["stones"].size() != 2) return std::nullopt;

    FusionSignature sig{};
    auto p1 = petFromJson(j["parents"][0]);
    auto p2 = petFromJson(j["parents"][1]);
    if (!p1 || !p2) return std::nullopt;
    sig.parent1 = std::move(*p1);
    sig.parent2 = std::move(*p2);

    for (std::size_t i = 0; i < 2; ++i) {
        const auto& sj = j["stones"][i];
        if (!sj.is_object()) return std::nullopt;
        auto type = parseStoneTypeKey(sj.value("type", std::string{}));
        if (!type) return std::nullopt;
        sig.stones[i].id = sj.value("id", std::string{});
        sig.stones[i].type = *type;
        sig.stones[i].tier = std::clamp(sj.value("tier", 1), kMinStoneTier, kMaxStoneTier);
        sig.stones[i].isCorrupted = sj.value("isCorrupted", false);
        sig.elementPair[i] = stoneElement(*type);
    }

    if (j.contains("interaction") && j["interaction"].is_object()) {
        if (const auto* hit = interactionByResult(j["interaction"].value("result", std::string{}))) {
            sig.interaction = *hit;
        }
    }
    if (j.contains("intent") && j["intent"].is_string()) {
        sig.intent = parseFusionIntentKey(j["intent"].get<std::string>());
    }
    sig.generation = j.value("generation", 1);
    sig.seedString = j.value("fusionSeed", std::string{});
    sig.seedHash = j.value("seedHash", Forge::SeededRandom::hashString(sig.seedString));
    if (j.contains("corruption") && j["corruption"].is_object()) {
        const auto& cj = j["corruption"];
        FusionCorruption c{};
        c.corrupted = cj.value("corrupted", false);
        c.severity = std::clamp(cj.value("severity", 0), 0, 100);
        c.level = parseCorruptionLevelKey(cj.value("level", std::string{"low"})).value_or(corruptionLevelFor(c.severity));
        c.reasons = stringList(cj, "reasons");
        sig.corruption = std::move(c);
    }
    return sig;
}

}  // namespace

std::optional<FusionSignature> parseSignature(const std::string& text) {
    const nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return std::nullopt;
    try {
        return signatureFromJson(j);
    } catch (const nlohmann::json::exception& e) {
        Forge::logWarn(std::string("Fusion signature has a mistyped field: ") + e.what());
        return std::nullopt;
    }
}

}  // namespace Pets
