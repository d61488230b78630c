#include "UniquenessScorer.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>

#include "../content/ElementInteractions.h"

namespace Pets {

namespace {

std::set<std::string> lowerWords(const std::string& text) {
    std::set<std::string> out;
    std::istringstream in(text);
    std::string w;
    while (in >> w) {
        std::transform(w.begin(), w.end(), w.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        out.insert(w);
    }
    return out;
}

std::vector<const Ability*> allAbilities(const Pet& pet) {
    std::vector<const Ability*> out;
    for (const auto& a : pet.passiveAbilities) out.push_back(&a);
    for (const auto& a : pet.activeAbilities) out.push_back(&a);
    if (pet.ultimateAbility) out.push_back(&*pet.ultimateAbility);
    return out;
}

bool sharesWord(const std::set<std::string>& a, const std::set<std::string>& b) {
    return std::any_of(a.begin(), a.end(), [&](const std::string& w) { return b.count(w) > 0; });
}

float abilityScore(const Pet& result, const Pet& p1, const Pet& p2) {
    std::set<std::string> parentNames;
    std::vector<std::set<std::string>> parentWords;
    for (const Pet* p : {&p1, &p2}) {
        for (const auto* a : allAbilities(*p)) {
            parentNames.insert(a->name);
            parentWords.push_back(lowerWords(a->name));
        }
    }
    float score = 0.0f;
    for (const auto* a : allAbilities(result)) {
        if (parentNames.count(a->name)) continue;
        score += 5.0f;
        // A new ability that still echoes a parent ability counts as a mutation.
        const auto words = lowerWords(a->name);
        if (std::any_of(parentWords.begin(), parentWords.end(),
                        [&](const std::set<std::string>& pw) { return sharesWord(words, pw); })) {
            score += 3.0f;
        }
    }
    return std::min(30.0f, score);
}

float visualScore(const Pet& result, const Pet& p1, const Pet& p2) {
    std::set<std::string> parentTags(p1.appearance.visualTags.begin(), p1.appearance.visualTags.end());
    parentTags.insert(p2.appearance.visualTags.begin(), p2.appearance.visualTags.end());
    float score = 0.0f;
    for (const auto& t : result.appearance.visualTags) {
        if (!parentTags.count(t)) score += 2.0f;
    }
    return std::min(15.0f, score);
}

float elementScore(const Stone& s1, const Stone& s2) {
    const auto e1 = stoneElement(s1.type);
    const auto e2 = stoneElement(s2.type);
    if (findElementInteraction(e1, e2)) return 15.0f;
    if (e1 != e2) return 10.0f;
    return 5.0f;
}

float nameScore(const Pet& result, const Pet& p1, const Pet& p2) {
    const auto words = lowerWords(result.name);
    if (sharesWord(words, lowerWords(p1.name)) || sharesWord(words, lowerWords(p2.name))) return 5.0f;
    return 10.0f;
}

// Parent-independent part of the score, comparable across the whole population.
float intrinsicScore(const Pet& pet) {
    return statDivergenceScore(pet.stats) + std::min(15.0f, 2.0f * static_cast<float>(pet.appearance.visualTags.size())) +
           std::min(10.0f, static_cast<float>(rarityIndex(pet.rarity)) * 1.5f);
}

}  // namespace

float statDivergenceScore(const Stats& stats) {
    const int total = stats.total();
    if (total <= 0) return 0.0f;
    const double t = static_cast<double>(total);
    const double deviation = std::abs(stats.maxHp / t - 0.40) + std::abs(stats.attack / t - 0.25) +
                             std::abs(stats.defense / t - 0.20) + std::abs(stats.speed / t - 0.15);
    return static_cast<float>(std::min(20.0, deviation * 50.0));
}

const char* uniquenessRank(float total) {
    if (total >= 80.0f) return "Mythic";
    if (total >= 65.0f) return "Legendary";
    if (total >= 50.0f) return "Epic";
    if (total >= 35.0f) return "Rare";
    if (total >= 20.0f) return "Uncommon";
    return "Common";
}

UniquenessScore scoreUniqueness(const Pet& result, const Pet& parent1, const Pet& parent2, const Stone& stone1,
                                const Stone& stone2, const std::vector<Pet>& population) {
    UniquenessScore s{};
    auto& b = s.breakdown;
    b.ability = abilityScore(result, parent1, parent2);
    b.statDivergence = statDivergenceScore(result.stats);
    b.visualNovelty = visualScore(result, parent1, parent2);
    b.elementCombination = elementScore(stone1, stone2);
    b.rarity = std::min(10.0f, static_cast<float>(rarityIndex(result.rarity)) * 1.5f);
    b.name = nameScore(result, parent1, parent2);
    s.total = std::min(100.0f, b.ability + b.statDivergence + b.visualNovelty + b.elementCombination + b.rarity + b.name);
    s.rank = uniquenessRank(s.total);

    const float mine = intrinsicScore(result);
    int compared = 0;
    int below = 0;
    for (const auto& other : population) {
        if (other.id == result.id) continue;
        ++compared;
        if (intrinsicScore(other) < mine) ++below;
    }
    s.percentile = compared == 0 ? std::round(s.total) : std::round(100.0f * below / compared);
    return s;
}

}  // namespace Pets
