#include "CreatureFactory.h"

#include <algorithm>
#include <array>
#include <vector>

namespace Pets {

using Forge::Gameplay::AbilityType;

namespace {

const std::vector<std::string>& familyPrefixes(Family family) {
    static const std::array<std::vector<std::string>, kFamilyCount> table{{
        {"Blaze", "Ember", "Cinder", "Pyre", "Scorch", "Magma"},
        {"Aqua", "Tide", "Coral", "Reef", "Cascade", "Kelp"},
        {"Terra", "Quake", "Granite", "Boulder", "Flint", "Basalt"},
        {"Volt", "Surge", "Bolt", "Static", "Pulse", "Arc"},
        {"Umbra", "Dusk", "Nox", "Gloom", "Eclipse", "Murk"},
        {"Lux", "Aurora", "Halo", "Gleam", "Dawn", "Prism"},
        {"Steel", "Chrome", "Rivet", "Cobalt", "Brass", "Gear"},
        {"Rune", "Mystic", "Hex", "Sigil", "Aether", "Cipher"},
        {"Zephyr", "Gale", "Nimbus", "Gust", "Squall", "Cirrus"},
        {"Glitch", "Quirk", "Wobble", "Jitter", "Warp", "Fuzz"},
    }};
    return table[static_cast<std::size_t>(family)];
}

const std::vector<std::string>& creatureSuffixes() {
    static const std::vector<std::string> suffixes{"ling", "drake", "wyrm", "fang", "claw", "wing",
                                                   "tail", "heart", "wisp", "hound", "titan", "paw"};
    return suffixes;
}

std::vector<Forge::Gameplay::Ability> drawAbilities(AbilityType type, int count, Family family, Rarity rarity,
                                                     const AbilityLibrary& library, Forge::SeededRandom& rng) {
    std::vector<Forge::Gameplay::Ability> out;
    if (count <= 0) return out;
    auto pool = library.filter(type, familyElement(family), rarity);
    if (pool.empty()) pool = library.filter(type, std::nullopt, rarity);
    for (int i = 0; i < count && !pool.empty(); ++i) {
        const std::size_t idx = static_cast<std::size_t>(rng.nextInt(0, static_cast<int>(pool.size()) - 1));
        out.push_back(instantiateAbility(*pool[idx], rarity, rng));
        pool.erase(pool.begin() + static_cast<std::ptrdiff_t>(idx));
    }
    return out;
}

}  // namespace

std::string generateCreatureName(Family family, Forge::SeededRandom& rng) {
    return rng.pick(familyPrefixes(family)) + rng.pick(creatureSuffixes());
}

Pet rollCreature(const std::string& owner, Family family, Rarity rarity, const AbilityLibrary& library,
                 Forge::SeededRandom& rng, std::int64_t now) {
    Pet pet{};
    pet.id = "pet-" + rng.nextToken(12);
    pet.owner = owner;
    pet.templateId = std::string("base-") + familyName(family);
    pet.name = generateCreatureName(family, rng);
    pet.family = family;
    pet.rarity = rarity;
    pet.stats = rollStatsForRarity(rarity, rng);
    pet.collectedAt = now;

    const RarityConfig& cfg = rarityConfig(rarity);
    pet.passiveAbilities = drawAbilities(AbilityType::Passive, cfg.passiveCount, family, rarity, library, rng);
    pet.activeAbilities = drawAbilities(AbilityType::Active, cfg.activeCount, family, rarity, library, rng);
    auto ultimates = drawAbilities(AbilityType::Ultimate, std::min(1, cfg.ultimateCount), family, rarity, library, rng);
    if (!ultimates.empty()) pet.ultimateAbility = std::move(ultimates.front());
    if (pet.activeAbilities.empty()) pet.activeAbilities.push_back(Forge::Gameplay::basicStrike("basic-strike-" + rng.nextToken(6)));

    pet.appearance.visualTags = {Forge::Gameplay::elementName(familyElement(family))};
    pet.lore = "A wild " + std::string(rarityName(rarity)) + " creature of the " + familyName(family) + " family.";
    return pet;
}

}  // namespace Pets
