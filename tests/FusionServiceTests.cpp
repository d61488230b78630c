// Fusion orchestration: validation, create-before-destroy, crash recovery, conflicts and corruption.
#include <cassert>
#include <optional>
#include <string>

#include "../engine/core/Logger.h"
#include "../game/fusion/FusionService.h"
#include "../game/store/MemoryStores.h"

using namespace Pets;
using Forge::ErrorKind;

namespace {

Pet makeParent(const std::string& id, const std::string& name, Family family, int attack) {
    Pet p{};
    p.id = id;
    p.owner = "alice";
    p.templateId = "base-test";
    p.name = name;
    p.family = family;
    p.rarity = Rarity::Rare;
    p.stats = Forge::Gameplay::makeStats(1000, attack, 60, 50);
    p.activeAbilities.push_back(Forge::Gameplay::basicStrike());
    return p;
}

Stone makeStone(const std::string& id, StoneType type, int tier) {
    Stone s{};
    s.id = id;
    s.owner = "alice";
    s.type = type;
    s.tier = tier;
    return s;
}

FusionRecord makeRecord(int generation) {
    FusionRecord r{};
    r.generation = generation;
    r.parentIds = {"old-a", "old-b"};
    r.parentFamilies = {Family::PyroKin, Family::TerraForged};
    r.itemIds = {"old-s1", "old-s2"};
    return r;
}

struct Fixture {
    MemoryCreatureStore creatures;
    MemoryStoneStore stones;
    AbilityLibrary library = defaultAbilityLibrary();

    explicit Fixture(StoneType t1 = StoneType::Ruby, StoneType t2 = StoneType::Sapphire) {
        Pet p1 = makeParent("p1", "Emberfang", Family::PyroKin, 90);
        p1.fusionHistory = {makeRecord(1), makeRecord(2)};
        creatures.save(p1);
        creatures.save(makeParent("p2", "Tidewhisker", Family::AquaBorn, 70));
        stones.save(makeStone("s1", t1, 3));
        stones.save(makeStone("s2", t2, 3));
    }
};

FusionRequest makeRequest() {
    FusionRequest r{};
    r.parent1Id = "p1";
    r.parent2Id = "p2";
    r.stone1Id = "s1";
    r.stone2Id = "s2";
    r.requestingOwner = "alice";
    r.seed = 42u;
    return r;
}

FusionService makeService(Fixture& fx) {
    FusionService service(fx.creatures, fx.stones, fx.library, FusionTuning{});
    service.setClock([] { return std::int64_t{1700000000000}; });
    return service;
}

class RejectedEnhancer : public EnhancementService {
public:
    std::optional<FusionResult> enhance(const std::string&, Rarity) override {
        FusionResult r{};
        r.name = "???";
        r.actives.push_back(Forge::Gameplay::basicStrike());
        return r;
    }
};

class FixedEnhancer : public EnhancementService {
public:
    std::optional<FusionResult> enhance(const std::string& serialized, Rarity) override {
        sawSignature = parseSignature(serialized).has_value();
        FusionResult r{};
        r.name = "Steamlord";
        r.lore = "Written elsewhere.";
        r.actives.push_back(Forge::Gameplay::basicStrike("steam-strike", 25));
        return r;
    }
    bool sawSignature{false};
};

}  // namespace

int main() {
    Forge::Logger::setMinLevel(Forge::LogLevel::Silent);

    // Successful fusion: product persisted, inputs consumed, history concatenated.
    {
        Fixture fx;
        auto service = makeService(fx);
        const auto out = service.perform(makeRequest());
        assert(out.ok());
        assert(out.stageReached == FusionStage::Done);
        assert(out.product);
        const Pet& product = *out.product;
        assert(fx.creatures.exists(product.id));
        assert(!fx.creatures.exists("p1") && !fx.creatures.exists("p2"));
        assert(!fx.stones.exists("s1") && !fx.stones.exists("s2"));
        assert(product.fusionHistory.size() == 2 + 0 + 1);
        assert(product.generation() == 3);
        assert(!product.templateId);
        assert(product.owner == "alice");
        assert(!product.activeAbilities.empty());
        // Higher-attack parent decides the family.
        assert(product.family == Family::PyroKin);
        const auto& record = product.fusionHistory.back();
        assert(record.parentIds[0] == "p1" && record.parentIds[1] == "p2");
        assert(record.itemIds[0] == "s1" && record.itemIds[1] == "s2");
        assert(record.parentFamilies[1] == Family::AquaBorn);
        assert(record.fusionSeed == "p1|p2|s1|s2");
        assert(record.timestamp == 1700000000000);
        assert(out.rarity);
        assert(product.rarity == out.rarity->finalRarity);
        assert(product.rarity == Rarity::Rare || product.rarity == Rarity::SuperRare);
        assert(out.uniqueness);
        assert(out.uniqueness->total >= 0.0f && out.uniqueness->total <= 100.0f);
        assert(!out.uniqueness->rank.empty());
    }

    // Same seed and inputs, same product.
    {
        Fixture a;
        Fixture b;
        auto sa = makeService(a);
        auto sb = makeService(b);
        const auto ra = sa.perform(makeRequest());
        const auto rb = sb.perform(makeRequest());
        assert(ra.ok() && rb.ok());
        assert(ra.product->id == rb.product->id);
        assert(ra.product->name == rb.product->name);
        assert(ra.product->stats.maxHp == rb.product->stats.maxHp);
        assert(ra.product->stats.attack == rb.product->stats.attack);
        assert(ra.product->rarity == rb.product->rarity);
        assert(ra.product->activeAbilities.size() == rb.product->activeAbilities.size());
        assert(ra.corruptedStoneIds == rb.corruptedStoneIds);
    }

    // Every violation is reported; Validation wins over NotFound; nothing is touched.
    {
        Fixture fx;
        auto service = makeService(fx);
        FusionRequest req = makeRequest();
        req.parent2Id = "p1";
        req.stone1Id = "ghost";
        req.stone2Id = "ghost";
        const auto out = service.perform(req);
        assert(out.error);
        assert(out.error->kind == ErrorKind::Validation);
        assert(out.error->messages.size() == 4);
        assert(!out.product);
        assert(fx.creatures.size() == 2 && fx.stones.size() == 2);
    }

    // Missing entities alone give NotFound.
    {
        Fixture fx;
        auto service = makeService(fx);
        FusionRequest req = makeRequest();
        req.parent2Id = "nobody";
        const auto out = service.perform(req);
        assert(out.error && out.error->kind == ErrorKind::NotFound);
        assert(out.error->messages.size() == 1);
        assert(fx.creatures.exists("p1"));
    }

    // Ownership check.
    {
        Fixture fx;
        Stone foreign = makeStone("s3", StoneType::Topaz, 2);
        foreign.owner = "bob";
        fx.stones.save(foreign);
        auto service = makeService(fx);
        FusionRequest req = makeRequest();
        req.stone2Id = "s3";
        const auto out = service.perform(req);
        assert(out.error && out.error->kind == ErrorKind::Validation);

        req.requestingOwner = std::nullopt;
        assert(service.perform(req).ok());
    }

    // Crash between persist and delete, then cleanup.
    {
        Fixture fx;
        auto service = makeService(fx);
        service.setStageListener([](FusionStage stage) { return stage != FusionStage::ConsumeInputs; });
        const auto out = service.perform(makeRequest());
        assert(out.interrupted);
        assert(!out.ok());
        assert(out.stageReached == FusionStage::ConsumeInputs);
        assert(out.product);
        const std::string productId = out.product->id;
        assert(fx.creatures.exists(productId));
        assert(fx.creatures.exists("p1") && fx.creatures.exists("p2"));
        assert(fx.stones.exists("s1") && fx.stones.exists("s2"));

        const auto first = service.completePendingConsumption({"p1", "p2"}, {"s1", "s2"});
        assert(!first.error);
        assert(first.deleted.size() == 4);
        assert(fx.creatures.exists(productId));

        const auto retry = service.completePendingConsumption({"p1", "p2"}, {"s1", "s2"});
        assert(!retry.error);
        assert(retry.deleted.empty());
        assert(retry.alreadyGone.size() == 4);
        assert(fx.creatures.exists(productId));
    }

    // Crash before persisting leaves no product behind.
    {
        Fixture fx;
        auto service = makeService(fx);
        service.setStageListener([](FusionStage stage) { return stage != FusionStage::PersistResult; });
        const auto out = service.perform(makeRequest());
        assert(out.interrupted && !out.product);
        assert(fx.creatures.size() == 2);
    }

    // A parent consumed elsewhere right before deletion: Conflict, nothing deleted, product kept.
    {
        Fixture fx;
        auto service = makeService(fx);
        service.setStageListener([&fx](FusionStage stage) {
            if (stage == FusionStage::ConsumeInputs) fx.creatures.remove("p2");
            return true;
        });
        const auto out = service.perform(makeRequest());
        assert(out.error && out.error->kind == ErrorKind::Conflict);
        assert(out.product);
        assert(fx.creatures.exists(out.product->id));
        assert(fx.creatures.exists("p1"));
        assert(fx.stones.exists("s1") && fx.stones.exists("s2"));
    }

    // Store write failures surface as Conflict before anything is consumed.
    {
        Fixture fx;
        fx.creatures.failSaves(true);
        auto service = makeService(fx);
        const auto out = service.perform(makeRequest());
        assert(out.error && out.error->kind == ErrorKind::Conflict);
        assert(out.stageReached == FusionStage::PersistResult);
        assert(fx.creatures.exists("p1") && fx.creatures.exists("p2"));
    }

    // Corrupted stone copies are only written together with the product.
    {
        FusionTuning certain{};
        certain.corruption.itemBaseChance = 1.0f;
        certain.corruption.itemMaxChance = 1.0f;

        Fixture ok;
        FusionService service(ok.creatures, ok.stones, ok.library, certain);
        service.setClock([] { return std::int64_t{1700000000000}; });
        const auto out = service.perform(makeRequest());
        assert(out.ok());
        assert(out.corruptedStoneIds.size() == 2);
        assert(ok.stones.size() == 2);
        for (const auto& id : out.corruptedStoneIds) assert(ok.stones.findById(id)->isCorrupted);

        Fixture noProduct;
        noProduct.creatures.failSaves(true);
        FusionService failing(noProduct.creatures, noProduct.stones, noProduct.library, certain);
        const auto failed = failing.perform(makeRequest());
        assert(failed.error && failed.error->kind == ErrorKind::Conflict);
        assert(failed.corruptedStoneIds.empty());
        assert(noProduct.stones.size() == 2);
        assert(noProduct.stones.exists("s1") && noProduct.stones.exists("s2"));
        assert(noProduct.creatures.size() == 2);

        Fixture noStones;
        noStones.stones.failSaves(true);
        FusionService stoneless(noStones.creatures, noStones.stones, noStones.library, certain);
        const auto refused = stoneless.perform(makeRequest());
        assert(refused.error && refused.error->kind == ErrorKind::Conflict);
        assert(noStones.creatures.size() == 2 && noStones.stones.size() == 2);

        Fixture interrupted;
        FusionService crashing(interrupted.creatures, interrupted.stones, interrupted.library, certain);
        crashing.setStageListener([](FusionStage stage) { return stage != FusionStage::PersistResult; });
        assert(crashing.perform(makeRequest()).interrupted);
        assert(interrupted.stones.size() == 2);
    }

    // A failed delete is reported and can be retried.
    {
        Fixture fx;
        fx.stones.failRemovalOf("s2");
        auto service = makeService(fx);
        const auto out = service.perform(makeRequest());
        assert(out.error && out.error->kind == ErrorKind::Conflict);
        assert(fx.stones.exists("s2"));
        fx.stones.clearFailures();
        const auto retry = service.completePendingConsumption({"p1", "p2"}, {"s1", "s2"});
        assert(!retry.error);
        assert(retry.deleted.size() == 1 && retry.deleted[0] == "s2");
        assert(retry.alreadyGone.size() == 3);
    }

    // Preview validates and mutates nothing.
    {
        Fixture fx;
        auto service = makeService(fx);
        const auto p = service.preview(makeRequest());
        assert(!p.error && p.preview);
        assert(p.preview->rarity.minRarity == Rarity::Rare);
        assert(p.preview->rarity.maxRarity == Rarity::SuperRare);
        assert(fx.creatures.size() == 2 && fx.stones.size() == 2);
        FusionRequest bad = makeRequest();
        bad.parent1Id.clear();
        assert(service.preview(bad).error);
    }

    // Invalid enhanced results are ignored; valid ones win.
    {
        Fixture fx;
        auto service = makeService(fx);
        RejectedEnhancer rejected;
        service.setEnhancer(&rejected);
        const auto out = service.perform(makeRequest());
        assert(out.ok());
        assert(!out.enhanced);
        assert(out.product->name != "???");
    }
    {
        Fixture fx;
        auto service = makeService(fx);
        FixedEnhancer fixed;
        service.setEnhancer(&fixed);
        const auto out = service.perform(makeRequest());
        assert(out.ok());
        assert(out.enhanced);
        assert(fixed.sawSignature);
        assert(out.product->name == "Steamlord");
        assert(out.product->activeAbilities[0].id == "steam-strike");
    }

    // Unstable stone pairs always corrupt the fusion; stats are untouched by it.
    {
        Fixture fx(StoneType::Opal, StoneType::Opal);
        auto service = makeService(fx);
        const auto out = service.perform(makeRequest());
        assert(out.ok());
        assert(out.corruption.corrupted);
        assert(out.corruption.severity >= 30 && out.corruption.severity <= 100);
        assert(out.product->isCorrupted);
        assert(out.product->appearance.glowColor && *out.product->appearance.glowColor == "#ff00ff");
    }

    // Item corruption chances and the never-twice rule.
    {
        const CorruptionTuning tuning{};
        Stone low = makeStone("a", StoneType::Ruby, 1);
        Stone high = makeStone("b", StoneType::Ruby, 5);
        assert(itemCorruptionChance(low, false, 0, tuning) < 0.0101f);
        assert(itemCorruptionChance(high, true, 100, tuning) <= 0.15f + 1e-6f);
        assert(itemCorruptionChance(high, false, 0, tuning) > itemCorruptionChance(low, false, 0, tuning));

        high.isCorrupted = true;
        Forge::SeededRandom rng(1);
        const auto before = rng.state();
        assert(!rollItemCorruption(high, true, 100, tuning, rng, 0));
        assert(rng.state() == before);

        // A certain hit: copy gets a new id and boosted bonuses.
        CorruptionTuning always = tuning;
        always.itemBaseChance = 1.0f;
        always.itemMaxChance = 1.0f;
        Stone bonus = makeStone("c", StoneType::Emerald, 4);
        bonus.statBonuses.set(Forge::Gameplay::StatKind::Defense, 0.2f);
        const auto hit = rollItemCorruption(bonus, false, 0, always, rng, 5);
        assert(hit);
        assert(hit->corrupted.id != "c" && hit->corrupted.isCorrupted);
        assert(hit->powerBoost >= 10 && hit->powerBoost <= 30);
        assert(*hit->corrupted.statBonuses.get(Forge::Gameplay::StatKind::Defense) > 0.29f);
        assert(hit->corrupted.elementalPower >= bonus.elementalPower);
    }

    // Claiming a listed stone is a check-and-set on its owner.
    {
        Fixture fx;
        Stone listed = makeStone("s3", StoneType::Sapphire, 3);
        listed.owner.reset();
        fx.stones.save(listed);
        assert(!fx.stones.transferOwnership("s3", std::string("bob"), std::string("alice")));
        assert(fx.stones.transferOwnership("s3", std::nullopt, std::string("alice")));
        assert(!fx.stones.transferOwnership("s3", std::nullopt, std::string("bob")));
        assert(!fx.stones.transferOwnership("missing", std::nullopt, std::string("bob")));
        assert(fx.stones.findById("s3")->owner == std::optional<std::string>("alice"));

        auto service = makeService(fx);
        FusionRequest claimed = makeRequest();
        claimed.stone2Id = "s3";
        assert(service.perform(claimed).ok());
    }

    // Error lists report their most severe kind.
    {
        Forge::ErrorList conflicts;
        conflicts.add(ErrorKind::Conflict, "a");
        conflicts.add(ErrorKind::Conflict, "b");
        assert(conflicts.finish()->kind == ErrorKind::Conflict);
        conflicts.add(ErrorKind::NotFound, "c");
        assert(conflicts.finish()->kind == ErrorKind::NotFound);
        conflicts.add(ErrorKind::Validation, "d");
        const auto all = conflicts.finish();
        assert(all->kind == ErrorKind::Validation && all->messages.size() == 4);
        assert(!Forge::ErrorList{}.finish());
    }

    // Mutation counting.
    {
        const Pet a = makeParent("a", "A", Family::PyroKin, 100);
        const Pet b = makeParent("b", "B", Family::PyroKin, 100);
        const Stats avg = Forge::Gameplay::makeStats(1000, 100, 60, 50);
        assert(countMutations(avg, avg, {}, a, b) == 0);
        const Stats moved = Forge::Gameplay::makeStats(1200, 100, 60, 40);
        assert(countMutations(moved, avg, {"steam"}, a, b) == 3);
        const Pet c = makeParent("c", "C", Family::Lumina, 100);
        assert(countMutations(avg, avg, {}, a, c) == 1);
    }

    return 0;
}
