#include "Creature.h"

namespace Pets {

int Pet::generation() const {
    if (fusionHistory.empty()) return 0;
    return fusionHistory.back().generation;
}

int Pet::totalMutations() const {
    int total = 0;
    for (const auto& rec : fusionHistory) total += rec.mutationCount;
    return total;
}

Forge::Gameplay::Element primaryElement(const Pet& pet) {
    for (const auto& a : pet.activeAbilities) {
        if (a.element) return *a.element;
    }
    if (pet.ultimateAbility && pet.ultimateAbility->element) {
        return *pet.ultimateAbility->element;
    }
    for (const auto& a : pet.passiveAbilities) {
        if (a.element) return *a.element;
    }
    return familyElement(pet.family);
}

std::vector<const Ability*> castableAbilities(const Pet& pet) {
    std::vector<const Ability*> out;
    out.reserve(pet.activeAbilities.size() + 1);
    for (const auto& a : pet.activeAbilities) out.push_back(&a);
    if (pet.ultimateAbility) out.push_back(&*pet.ultimateAbility);
    return out;
}

std::vector<std::string> checkPetInvariants(const Pet& pet) {
    std::vector<std::string> problems;
    if (pet.name.empty()) problems.emplace_back("name is empty");
    if (pet.activeAbilities.empty()) problems.emplace_back("no active ability");
    if (pet.stats.hp > pet.stats.maxHp) problems.emplace_back("hp exceeds maxHp");
    if (pet.stats.maxHp <= 0) problems.emplace_back("maxHp must be positive");
    if (pet.stats.attack < 0 || pet.stats.defense < 0 || pet.stats.speed < 0) {
        problems.emplace_back("negative stat");
    }
    return problems;
}

}  // namespace Pets
