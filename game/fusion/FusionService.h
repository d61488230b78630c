// Fusion orchestration over the creature and stone stores: validate, roll, assemble, persist, then consume.
#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "../../engine/core/Error.h"
#include "../content/AbilityLibrary.h"
#include "../content/FusionTuning.h"
#include "../store/Stores.h"
#include "Corruption.h"
#include "FusionCalculator.h"
#include "FusionSignature.h"
#include "ResultAssembly.h"
#include "UniquenessScorer.h"

namespace Pets {

enum class FusionStage { Validate, ComputeCorruption, ComputeStatsAndRarity, AssembleResult, PersistResult, ConsumeInputs, Done };

const char* fusionStageName(FusionStage stage);

struct FusionRequest {
    std::string parent1Id;
    std::string parent2Id;
    std::string stone1Id;
    std::string stone2Id;
    std::optional<std::string> requestingOwner;  // when set, every input must belong to it
    std::optional<FusionIntent> intent;
    std::optional<std::uint32_t> seed;
    bool reproducible{false};  // seed from the signature hash alone
};

struct FusionOutcome {
    std::optional<Pet> product;
    std::optional<UniquenessScore> uniqueness;
    FusionCorruption corruption{};
    std::optional<RarityResult> rarity;
    std::vector<std::string> corruptedStoneIds;
    FusionStage stageReached{FusionStage::Validate};
    bool interrupted{false};  // the stage listener stopped the run
    bool enhanced{false};     // the enhancement service's result was used
    std::optional<Forge::Error> error;

    bool ok() const { return !error && !interrupted; }
};

struct PreviewOutcome {
    std::optional<FusionPreview> preview;
    std::optional<Forge::Error> error;
};

struct ConsumptionOutcome {
    std::vector<std::string> deleted;
    std::vector<std::string> alreadyGone;
    std::optional<Forge::Error> error;
};

class FusionService {
public:
    // Called on entry to every stage; returning false stops the run there (used to simulate crashes).
    using StageListener = std::function<bool(FusionStage)>;
    using Clock = std::function<std::int64_t()>;

    FusionService(CreatureStore& creatures, StoneStore& stones, const AbilityLibrary& library, FusionTuning tuning);

    void setEnhancer(EnhancementService* enhancer) { enhancer_ = enhancer; }
    void setStageListener(StageListener listener) { listener_ = std::move(listener); }
    void setClock(Clock clock) { clock_ = std::move(clock); }

    FusionOutcome perform(const FusionRequest& request);
    PreviewOutcome preview(const FusionRequest& request) const;

    // Retries the deletion left behind by an interrupted fusion; inputs already gone are fine.
    ConsumptionOutcome completePendingConsumption(const std::array<std::string, 2>& parentIds,
                                                  const std::array<std::string, 2>& stoneIds);

private:
    struct Inputs {
        Pet parent1;
        Pet parent2;
        Stone stone1;
        Stone stone2;
    };

    std::optional<Forge::Error> validate(const FusionRequest& request, std::optional<Inputs>& out) const;
    bool enter(FusionOutcome& outcome, FusionStage stage);
    void rollBackStones(const std::vector<std::string>& stoneIds);
    FusionResult chooseResult(const FusionSignature& signature, Rarity rarity, const FusionCorruption& corruption,
                              Forge::SeededRandom& rng, bool& enhanced) const;
    Pet buildProduct(const Inputs& in, const Stone& final1, const Stone& final2, const FusionStatResult& stats,
                     FusionResult result, const FusionCorruption& corruption, const FusionSignature& signature,
                     Forge::SeededRandom& rng, std::int64_t now) const;

    CreatureStore& creatures_;
    StoneStore& stones_;
    const AbilityLibrary& library_;
    FusionTuning tuning_;
    FusionCalculator calculator_;
    EnhancementService* enhancer_{nullptr};
    StageListener listener_;
    Clock clock_;
};

// Stats that moved more than 10% from the parent average, plus new visual tags, plus one for mixed families.
int countMutations(const Stats& parentAverage, const Stats& result, const std::vector<std::string>& resultTags,
                   const Pet& parent1, const Pet& parent2);

}  // namespace Pets
