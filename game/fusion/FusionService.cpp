#include "FusionService.h"

#include <algorithm>
#include <chrono>
#include <cmath>

#include "../../engine/core/Logger.h"

namespace Pets {

using Forge::ErrorKind;

namespace {

std::int64_t wallClockMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

bool differsByMoreThanTenPercent(int base, int value) {
    return std::abs(value - base) > 0.1 * std::abs(base);
}

}  // namespace

const char* fusionStageName(FusionStage stage) {
    switch (stage) {
        case FusionStage::Validate: return "Validate";
        case FusionStage::ComputeCorruption: return "ComputeCorruption";
        case FusionStage::ComputeStatsAndRarity: return "ComputeStats&Rarity";
        case FusionStage::AssembleResult: return "AssembleResult";
        case FusionStage::PersistResult: return "PersistResult";
        case FusionStage::ConsumeInputs: return "ConsumeInputs";
        case FusionStage::Done: return "Done";
    }
    return "Validate";
}

int countMutations(const Stats& parentAverage, const Stats& result, const std::vector<std::string>& resultTags,
                   const Pet& parent1, const Pet& parent2) {
    int count = 0;
    if (differsByMoreThanTenPercent(parentAverage.maxHp, result.maxHp)) ++count;
    if (differsByMoreThanTenPercent(parentAverage.attack, result.attack)) ++count;
    if (differsByMoreThanTenPercent(parentAverage.defense, result.defense)) ++count;
    if (differsByMoreThanTenPercent(parentAverage.speed, result.speed)) ++count;

    auto parentHas = [&](const std::string& tag) {
        const auto& a = parent1.appearance.visualTags;
        const auto& b = parent2.appearance.visualTags;
        return std::find(a.begin(), a.end(), tag) != a.end() || std::find(b.begin(), b.end(), tag) != b.end();
    };
    for (const auto& t : resultTags) {
        if (!parentHas(t)) ++count;
    }
    if (parent1.family != parent2.family) ++count;
    return count;
}

FusionService::FusionService(CreatureStore& creatures, StoneStore& stones, const AbilityLibrary& library,
                             FusionTuning tuning)
    : creatures_(creatures),
      stones_(stones),
      library_(library),
      tuning_(tuning),
      calculator_(tuning_),
      clock_(wallClockMs) {}

bool FusionService::enter(FusionOutcome& outcome, FusionStage stage) {
    outcome.stageReached = stage;
    Forge::logDebug(std::string("Fusion stage: ") + fusionStageName(stage));
    if (listener_ && !listener_(stage)) {
        outcome.interrupted = true;
        Forge::logWarn(std::string("Fusion interrupted at ") + fusionStageName(stage));
        return false;
    }
    return true;
}

std::optional<Forge::Error> FusionService::validate(const FusionRequest& req, std::optional<Inputs>& out) const {
    Forge::ErrorList errors;
    if (req.parent1Id.empty() || req.parent2Id.empty()) errors.add(ErrorKind::Validation, "two creature ids are required");
    if (req.stone1Id.empty() || req.stone2Id.empty()) errors.add(ErrorKind::Validation, "two stone ids are required");
    if (!req.parent1Id.empty() && req.parent1Id == req.parent2Id) {
        errors.add(ErrorKind::Validation, "a creature cannot fuse with itself (" + req.parent1Id + ")");
    }
    if (!req.stone1Id.empty() && req.stone1Id == req.stone2Id) {
        errors.add(ErrorKind::Validation, "the same stone cannot be used twice (" + req.stone1Id + ")");
    }

    auto p1 = req.parent1Id.empty() ? std::nullopt : creatures_.findById(req.parent1Id);
    auto p2 = req.parent2Id.empty() ? std::nullopt : creatures_.findById(req.parent2Id);
    auto s1 = req.stone1Id.empty() ? std::nullopt : stones_.findById(req.stone1Id);
    auto s2 = req.stone2Id.empty() ? std::nullopt : stones_.findById(req.stone2Id);
    if (!req.parent1Id.empty() && !p1) errors.add(ErrorKind::NotFound, "creature " + req.parent1Id + " not found");
    if (!req.parent2Id.empty() && !p2) errors.add(ErrorKind::NotFound, "creature " + req.parent2Id + " not found");
    if (!req.stone1Id.empty() && !s1) errors.add(ErrorKind::NotFound, "stone " + req.stone1Id + " not found");
    if (!req.stone2Id.empty() && !s2) errors.add(ErrorKind::NotFound, "stone " + req.stone2Id + " not found");

    if (req.requestingOwner) {
        const auto& owner = *req.requestingOwner;
        for (const auto* p : {&p1, &p2}) {
            if (*p && (*p)->owner != owner) {
                errors.add(ErrorKind::Validation, "creature " + (*p)->id + " is not owned by " + owner);
            }
        }
        for (const auto* s : {&s1, &s2}) {
            if (*s && (*s)->owner != owner) {
                errors.add(ErrorKind::Validation, "stone " + (*s)->id + " is not owned by " + owner);
            }
        }
    }

    if (auto err = errors.finish()) return err;
    out = Inputs{std::move(*p1), std::move(*p2), std::move(*s1), std::move(*s2)};
    return std::nullopt;
}

PreviewOutcome FusionService::preview(const FusionRequest& request) const {
    PreviewOutcome out{};
    std::optional<Inputs> in;
    out.error = validate(request, in);
    if (out.error) return out;
    out.preview = calculator_.preview(in->parent1, in->parent2, in->stone1, in->stone2);
    return out;
}

FusionResult FusionService::chooseResult(const FusionSignature& signature, Rarity rarity,
                                         const FusionCorruption& corruption, Forge::SeededRandom& rng,
                                         bool& enhanced) const {
    FusionResult procedural = ResultAssembler(library_).assemble(signature, rarity, corruption, rng);
    enhanced = false;
    if (!enhancer_) return procedural;

    auto candidate = enhancer_->enhance(serializeSignature(signature), rarity);
    if (!candidate) {
        Forge::logWarn("Enhancement service returned nothing; keeping procedural result");
        return procedural;
    }
    const auto problems = validateFusionResult(*candidate);
    if (!problems.empty()) {
        std::string joined;
        for (const auto& p : problems) joined += (joined.empty() ? "" : "; ") + p;
        Forge::logWarn("Rejected enhanced fusion result (" + joined + "); keeping procedural result");
        return procedural;
    }
    enhanced = true;
    return std::move(*candidate);
}

Pet FusionService::buildProduct(const Inputs& in, const Stone& final1, const Stone& final2,
                                const FusionStatResult& stats, FusionResult result,
                                const FusionCorruption& corruption, const FusionSignature& signature,
                                Forge::SeededRandom& rng, std::int64_t now) const {
    Pet product{};
    product.id = "pet-" + rng.nextToken(12);
    product.owner = in.parent1.owner;
    product.templateId = std::nullopt;
    product.name = makeUniqueName(result.name, creatures_.findAll(), now);
    product.family = in.parent2.stats.attack > in.parent1.stats.attack ? in.parent2.family : in.parent1.family;
    product.rarity = stats.rarity.finalRarity;
    product.stats = stats.finalStats;
    product.passiveAbilities = std::move(result.passives);
    product.activeAbilities = std::move(result.actives);
    product.ultimateAbility = std::move(result.ultimate);
    product.appearance.visualTags = std::move(result.visualTags);
    if (corruption.corrupted) product.appearance.glowColor = "#ff00ff";
    product.collectedAt = now;
    product.isCorrupted = corruption.corrupted;
    product.lore = std::move(result.lore);

    FusionRecord record{};
    record.generation = std::max(in.parent1.generation(), in.parent2.generation()) + 1;
    record.parentIds = {in.parent1.id, in.parent2.id};
    record.parentFamilies = {in.parent1.family, in.parent2.family};
    record.itemIds = {in.stone1.id, in.stone2.id};
    record.itemTypes = {final1.type, final2.type};
    record.itemTiers = {final1.tier, final2.tier};
    record.fusionSeed = signature.seedString;
    record.mutationCount =
        countMutations(stats.baseStats, stats.finalStats, product.appearance.visualTags, in.parent1, in.parent2);
    record.timestamp = now;

    product.fusionHistory = in.parent1.fusionHistory;
    product.fusionHistory.insert(product.fusionHistory.end(), in.parent2.fusionHistory.begin(),
                                 in.parent2.fusionHistory.end());
    product.fusionHistory.push_back(record);
    return product;
}

FusionOutcome FusionService::perform(const FusionRequest& request) {
    FusionOutcome outcome{};
    const std::int64_t now = clock_();

    if (!enter(outcome, FusionStage::Validate)) return outcome;
    std::optional<Inputs> in;
    if (auto err = validate(request, in)) {
        Forge::logWarn("Fusion rejected: " + err->describe());
        outcome.error = std::move(err);
        return outcome;
    }

    const FusionSignature seedSignature =
        buildFusionSignature(in->parent1, in->parent2, in->stone1, in->stone2, request.intent);
    Forge::SeededRandom rng(resolveFusionSeed(seedSignature, request.seed, request.reproducible, now));
    const int fusionCount = static_cast<int>(in->parent1.fusionHistory.size() + in->parent2.fusionHistory.size());

    if (!enter(outcome, FusionStage::ComputeCorruption)) return outcome;
    Stone final1 = in->stone1;
    Stone final2 = in->stone2;
    // Corrupted copies stay in memory until the product is persisted.
    std::vector<Stone> corruptedStones;
    const bool bothTierFive = in->stone1.tier == kMaxStoneTier && in->stone2.tier == kMaxStoneTier;
    for (Stone* stone : {&final1, &final2}) {
        auto hit = rollItemCorruption(*stone, bothTierFive, fusionCount, tuning_.corruption, rng, now);
        if (!hit) continue;
        corruptedStones.push_back(hit->corrupted);
        *stone = hit->corrupted;
    }
    outcome.corruption =
        evaluateFusionCorruption(in->parent1, in->parent2, final1, final2, fusionCount, tuning_.corruption, rng);
    if (outcome.corruption.corrupted) {
        Forge::logInfo(std::string("Fusion corrupted (") + corruptionLevelName(outcome.corruption.level) +
                       ", severity " + std::to_string(outcome.corruption.severity) + ")");
    }

    if (!enter(outcome, FusionStage::ComputeStatsAndRarity)) return outcome;
    const FusionStatResult stats = calculator_.calculate(in->parent1, in->parent2, final1, final2, rng);
    outcome.rarity = stats.rarity;

    if (!enter(outcome, FusionStage::AssembleResult)) return outcome;
    FusionSignature signature = buildFusionSignature(in->parent1, in->parent2, final1, final2, request.intent);
    signature.seedString = seedSignature.seedString;
    signature.seedHash = seedSignature.seedHash;
    signature.corruption = outcome.corruption;

    FusionResult result = chooseResult(signature, stats.rarity.finalRarity, outcome.corruption, rng, outcome.enhanced);
    Pet product = buildProduct(*in, final1, final2, stats, std::move(result), outcome.corruption, signature, rng, now);
    const auto problems = checkPetInvariants(product);
    if (!problems.empty()) {
        Forge::Error err{ErrorKind::GenerationFailure, problems};
        Forge::logError("Fusion produced an invalid creature: " + err.describe());
        outcome.error = std::move(err);
        return outcome;
    }

    if (!enter(outcome, FusionStage::PersistResult)) return outcome;
    std::vector<std::string> savedStoneIds;
    for (const auto& stone : corruptedStones) {
        if (!stones_.save(stone)) {
            rollBackStones(savedStoneIds);
            outcome.error = Forge::makeError(ErrorKind::Conflict, "could not persist corrupted stone " + stone.id);
            Forge::logError(outcome.error->describe());
            return outcome;
        }
        savedStoneIds.push_back(stone.id);
    }
    if (!creatures_.save(product)) {
        rollBackStones(savedStoneIds);
        outcome.error = Forge::makeError(ErrorKind::Conflict, "could not persist fusion product " + product.id);
        Forge::logError(outcome.error->describe());
        return outcome;
    }
    outcome.corruptedStoneIds = std::move(savedStoneIds);
    outcome.product = product;

    if (!enter(outcome, FusionStage::ConsumeInputs)) return outcome;
    Forge::ErrorList conflicts;
    if (!creatures_.exists(in->parent1.id)) conflicts.add(ErrorKind::Conflict, "creature " + in->parent1.id + " was already consumed");
    if (!creatures_.exists(in->parent2.id)) conflicts.add(ErrorKind::Conflict, "creature " + in->parent2.id + " was already consumed");
    if (auto err = conflicts.finish()) {
        Forge::logWarn("Fusion consumption aborted: " + err->describe());
        outcome.error = std::move(err);
        return outcome;
    }
    auto consumed = completePendingConsumption({in->parent1.id, in->parent2.id}, {in->stone1.id, in->stone2.id});
    if (consumed.error) {
        outcome.error = std::move(consumed.error);
        return outcome;
    }

    if (!enter(outcome, FusionStage::Done)) return outcome;
    outcome.uniqueness = scoreUniqueness(product, in->parent1, in->parent2, final1, final2, creatures_.findAll());
    Forge::logInfo("Fused " + in->parent1.name + " + " + in->parent2.name + " into " + product.name + " (" +
                   rarityName(product.rarity) + ", gen " + std::to_string(product.generation()) + ")");
    return outcome;
}

void FusionService::rollBackStones(const std::vector<std::string>& stoneIds) {
    for (const auto& id : stoneIds) {
        if (!stones_.remove(id)) Forge::logError("Could not roll back corrupted stone " + id);
    }
}

ConsumptionOutcome FusionService::completePendingConsumption(const std::array<std::string, 2>& parentIds,
                                                             const std::array<std::string, 2>& stoneIds) {
    ConsumptionOutcome out{};
    Forge::ErrorList failures;
    for (const auto& id : parentIds) {
        if (!creatures_.exists(id)) {
            out.alreadyGone.push_back(id);
        } else if (creatures_.remove(id)) {
            out.deleted.push_back(id);
        } else {
            failures.add(ErrorKind::Conflict, "could not delete creature " + id);
        }
    }
    for (const auto& id : stoneIds) {
        if (!stones_.exists(id)) {
            out.alreadyGone.push_back(id);
        } else if (stones_.remove(id)) {
            out.deleted.push_back(id);
        } else {
            failures.add(ErrorKind::Conflict, "could not delete stone " + id);
        }
    }
    if (auto err = failures.finish()) {
        Forge::logWarn("Pending consumption incomplete: " + err->describe());
        out.error = std::move(err);
    }
    return out;
}

}  // namespace Pets
