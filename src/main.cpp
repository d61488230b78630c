// Headless demo: roll starters, fuse two of them, then fight the first dungeon wave.
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>

#include "../engine/core/Logger.h"
#include "../engine/core/SeededRandom.h"
#include "../game/battle/BattleInitializer.h"
#include "../game/battle/CombatEngine.h"
#include "../game/content/AbilityLibrary.h"
#include "../game/content/CreatureFactory.h"
#include "../game/dungeon/EncounterGenerator.h"
#include "../game/fusion/FusionService.h"
#include "../game/status/StatusCatalog.h"
#include "../game/store/MemoryStores.h"

namespace {

const char* kPlayer = "player-1";

std::string describeAction(const Pets::Battle& battle, const Pets::ResolvedAction& action) {
    if (action.skipped) return "turn " + std::to_string(action.turn) + ": skipped (" + *action.skipped + ")";
    const auto* actor = battle.find(action.actorId);
    std::string out = "turn " + std::to_string(action.turn) + ": " + (actor ? actor->pet.name : action.actorId) +
                      " uses " + action.abilityName;
    for (const auto& r : action.results) {
        const auto* target = battle.find(r.targetId);
        const std::string name = target ? target->pet.name : r.targetId;
        if (r.missed) {
            out += " | misses " + name;
        } else if (r.damage > 0) {
            out += " | " + name + " -" + std::to_string(r.damage) + (r.critical ? " (crit)" : "");
        } else if (r.healing > 0) {
            out += " | " + name + " +" + std::to_string(r.healing);
        }
        if (r.statusApplied) out += std::string(" [") + Forge::Gameplay::statusTypeName(*r.statusApplied) + "]";
    }
    return out;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string dataDir = argc > 1 ? argv[1] : "data";
    const std::uint32_t seed = argc > 2 ? static_cast<std::uint32_t>(std::strtoul(argv[2], nullptr, 10)) : 42u;

    const Pets::FusionTuning tuning = Pets::loadFusionTuning(dataDir + "/tuning.json");
    const Pets::AbilityLibrary library = Pets::loadAbilityLibrary(dataDir + "/abilities.json");
    Pets::StatusCatalog catalog;
    if (!catalog.load(dataDir + "/statuses.json")) Forge::logWarn("Using built-in status definitions");

    Forge::SeededRandom rng(seed);
    Pets::MemoryCreatureStore creatures;
    Pets::MemoryStoneStore stones;

    const Pets::Pet first = Pets::rollCreature(kPlayer, Pets::Family::PyroKin, Pets::Rarity::Rare, library, rng);
    const Pets::Pet second = Pets::rollCreature(kPlayer, Pets::Family::AquaBorn, Pets::Rarity::Rare, library, rng);
    const Pets::Pet partner = Pets::rollCreature(kPlayer, Pets::Family::Lumina, Pets::Rarity::Basic, library, rng);
    const Pets::Stone ruby = Pets::generateStone(Pets::StoneType::Ruby, 3, std::string(kPlayer), rng);
    // Dropped unowned, claimed below.
    const Pets::Stone sapphire = Pets::generateStone(Pets::StoneType::Sapphire, 3, std::nullopt, rng);
    for (const auto* p : {&first, &second, &partner}) {
        if (!creatures.save(*p)) return 1;
        Forge::logInfo("Rolled " + p->name + " (" + Pets::rarityName(p->rarity) + ")");
    }
    if (!stones.save(ruby) || !stones.save(sapphire)) return 1;
    if (!stones.transferOwnership(sapphire.id, std::nullopt, std::string(kPlayer))) {
        Forge::logError("Could not claim stone " + sapphire.id);
        return 1;
    }

    Pets::FusionService fusion(creatures, stones, library, tuning);
    Pets::ProceduralEnhancer enhancer(library);
    fusion.setEnhancer(&enhancer);

    Pets::FusionRequest request{};
    request.parent1Id = first.id;
    request.parent2Id = second.id;
    request.stone1Id = ruby.id;
    request.stone2Id = sapphire.id;
    request.requestingOwner = kPlayer;
    request.intent = Pets::FusionIntent::Dominance;
    request.seed = seed;

    const auto preview = fusion.preview(request);
    if (preview.preview) {
        Forge::logInfo(std::string("Preview: rarity ") + Pets::rarityName(preview.preview->rarity.minRarity) + ".." +
                       Pets::rarityName(preview.preview->rarity.maxRarity) + ", attack " +
                       std::to_string(preview.preview->attack.min) + ".." + std::to_string(preview.preview->attack.max));
    }

    const auto outcome = fusion.perform(request);
    if (!outcome.ok() || !outcome.product) {
        Forge::logError("Fusion failed: " + (outcome.error ? outcome.error->describe() : std::string("interrupted")));
        return 1;
    }
    const Pets::Pet& product = *outcome.product;
    Forge::logInfo("Fusion product: " + product.name + ", " + std::to_string(product.activeAbilities.size()) +
                   " actives, lore: " + product.lore);
    if (outcome.uniqueness) {
        Forge::logInfo("Uniqueness " + std::to_string(static_cast<int>(outcome.uniqueness->total)) + " (" +
                       outcome.uniqueness->rank + ")");
    }

    const auto dungeon = Pets::loadDungeon(dataDir + "/dungeon.json");
    if (!dungeon) {
        Forge::logError("No dungeon to fight in");
        return 1;
    }
    Pets::EncounterGenerator encounters(library);
    const auto encounter = encounters.generate(*dungeon, Pets::EncounterRequest{0, 0, 2}, rng);
    if (encounter.error) {
        Forge::logError(encounter.error->describe());
        return 1;
    }

    const Pets::BattleInitializer initializer(tuning.combat);
    auto init = initializer.initialize({product, partner}, encounter.enemies, rng.state());
    if (!init.battle) {
        Forge::logError(init.error ? init.error->describe() : std::string("battle setup failed"));
        return 1;
    }

    const Pets::CombatEngine engine(tuning.combat, catalog);
    Pets::Battle battle = std::move(*init.battle);
    while (!battle.isComplete) {
        auto step = engine.executeTurn(battle);
        battle = std::move(step.battle);
        Forge::logInfo(describeAction(battle, battle.log.back()));
    }
    Forge::logInfo(std::string("Winner: ") + Pets::winnerName(battle.winner));
    return 0;
}
