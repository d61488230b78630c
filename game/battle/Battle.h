// Battle state: combat wrappers around creatures, the action log and the battle-scoped rng state.
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "../../engine/status/StatusContainer.h"
#include "../content/Creature.h"
#include "../content/Stone.h"

namespace Pets {

enum class Side { Team1, Team2 };
enum class Position { Front, Back };
enum class Winner { None, Team1, Team2, Draw };

const char* sideName(Side side);
const char* positionName(Position position);
const char* winnerName(Winner winner);

inline Side opposing(Side side) { return side == Side::Team1 ? Side::Team2 : Side::Team1; }

enum class LineageKind { DamageBoost, HealingBoost, DefenseBoost, SpeedBoost, CritChance, Evasion };

const char* lineageKindName(LineageKind kind);

struct LineageModifier {
    LineageKind kind{LineageKind::DamageBoost};
    float value{0.0f};  // fraction, 0.1 == +10%
    std::string source;
};

// Sum of one kind across a modifier list.
float lineageTotal(const std::vector<LineageModifier>& mods, LineageKind kind);

// One tier-V domain, owned by the side of the combatant that carries it.
struct DomainEffect {
    StoneType type{StoneType::Ruby};
    Side owner{Side::Team1};
    std::string sourcePetId;
    std::string description;
};

// Static boosts written once at initialization.
struct DomainBoosts {
    float fireDamage{0.0f};           // added to the multiplier of fire damage dealt
    float shadowVulnerability{0.0f};  // added to the multiplier of shadow damage taken
    float damageReduction{0.0f};      // fraction removed from damage taken
    float speedScaling{1.0f};         // multiplier for speed-scaled effects
};

struct CombatPet {
    Pet pet;  // snapshot; cooldowns live on its abilities
    Side side{Side::Team1};
    Position position{Position::Front};
    int currentHp{0};
    int currentEnergy{0};
    Forge::Status::StatusContainer statuses;
    std::vector<Forge::Status::StatModifier> buffs;
    std::vector<Forge::Status::StatModifier> debuffs;
    std::vector<LineageModifier> lineageModifiers;
    DomainBoosts domain{};

    const std::string& id() const { return pet.id; }
    bool alive() const { return currentHp > 0; }
    bool canAct() const { return alive() && !statuses.isIncapacitated(); }
    int maxHp() const { return pet.stats.maxHp; }
    // Base stat scaled by active buffs and debuffs (never below 10% of base).
    float effectiveStat(Forge::Gameplay::StatKind kind) const;
    float hpFraction() const;
};

struct EffectResult {
    std::string targetId;
    int damage{0};
    int healing{0};
    bool missed{false};
    bool critical{false};
    std::optional<Forge::Status::StatusType> statusApplied;
    std::optional<Forge::Status::StatModifier> buffApplied;
    std::optional<Forge::Status::StatModifier> debuffApplied;
    int lifesteal{0};
    bool cleansed{false};
    std::string reaction;  // elemental reaction name, empty when none
};

struct ResolvedAction {
    int turn{1};
    std::string actorId;  // empty when nobody could act
    std::string abilityId;
    std::string abilityName;
    std::optional<std::string> skipped;
    std::vector<EffectResult> results;
    std::vector<std::string> events;  // round-start domain effects and status ticks
};

struct Battle {
    std::string id;
    std::vector<CombatPet> team1;
    std::vector<CombatPet> team2;
    int currentTurn{1};
    std::vector<std::string> turnOrder;
    std::size_t currentActorIndex{0};
    std::vector<ResolvedAction> log;
    std::vector<DomainEffect> domainEffects;
    bool isComplete{false};
    Winner winner{Winner::None};
    std::int64_t createdAt{0};
    std::uint32_t rngState{0};

    CombatPet* find(const std::string& petId);
    const CombatPet* find(const std::string& petId) const;
    std::vector<CombatPet>& team(Side side) { return side == Side::Team1 ? team1 : team2; }
    const std::vector<CombatPet>& team(Side side) const { return side == Side::Team1 ? team1 : team2; }
    bool hasLiving(Side side) const;
    // Mean current/max hp over the whole team.
    float hpFraction(Side side) const;
};

}  // namespace Pets
