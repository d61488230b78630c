#include "ResultAssembly.h"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "../../engine/core/Logger.h"

namespace Pets {

using Forge::Gameplay::AbilityType;

namespace {

const std::vector<std::string>& intentTitles(FusionIntent intent) {
    static const std::vector<std::string> dominance{"the Dominator", "the Conqueror", "the Tyrant"};
    static const std::vector<std::string> resilience{"the Guardian", "the Protector", "the Unbreakable"};
    static const std::vector<std::string> volatility{"the Unstable", "the Chaotic", "the Explosive"};
    static const std::vector<std::string> symbiosis{"the Harmonious", "the Unified", "the Balanced"};
    static const std::vector<std::string> corruption{"the Corruptor", "the Decayed", "the Transformed"};
    switch (intent) {
        case FusionIntent::Dominance: return dominance;
        case FusionIntent::Resilience: return resilience;
        case FusionIntent::Volatility: return volatility;
        case FusionIntent::Symbiosis: return symbiosis;
        case FusionIntent::Corruption: return corruption;
    }
    return dominance;
}

const std::vector<std::string>& intentAdjectives(FusionIntent intent) {
    static const std::vector<std::string> dominance{"Fierce", "Ruthless", "Brutal", "Savage"};
    static const std::vector<std::string> resilience{"Stalwart", "Enduring", "Immutable", "Steadfast"};
    static const std::vector<std::string> volatility{"Chaotic", "Unstable", "Volatile", "Erratic"};
    static const std::vector<std::string> symbiosis{"Harmonious", "Unified", "Balanced", "Synergistic"};
    static const std::vector<std::string> corruption{"Corrupted", "Decayed", "Transformed", "Twisted"};
    switch (intent) {
        case FusionIntent::Dominance: return dominance;
        case FusionIntent::Resilience: return resilience;
        case FusionIntent::Volatility: return volatility;
        case FusionIntent::Symbiosis: return symbiosis;
        case FusionIntent::Corruption: return corruption;
    }
    return dominance;
}

const std::vector<std::string>& glitchTokens() {
    static const std::vector<std::string> tokens{"Gl1tch", "Null", "Err0r", "Fractured", "0xDEAD"};
    return tokens;
}

const std::vector<std::string>& glitchedLoreTemplates(CorruptionLevel level) {
    static const std::vector<std::string> low{
        "{p1} and {p2} fused with {s1} and {s2} stones, but something went wrong. The fusion flickers "
        "between states, never quite settling into reality.",
        "A minor glitch occurred during the fusion of {p1} and {p2}. The {s1} and {s2} stones created an "
        "unstable bond that distorts reality now and then."};
    static const std::vector<std::string> medium{
        "The fusion of {p1} and {p2} was corrupted by the {s1} and {s2} stones. Reality bends around this "
        "creature, and its abilities are unpredictable.",
        "Something broke during the fusion. {p1} and {p2} merged, but the {s1} and {s2} stones left a "
        "chaotic resonance behind."};
    static const std::vector<std::string> high{
        "The fusion of {p1} and {p2} with {s1} and {s2} stones created a paradox. This creature exists in "
        "several states at once.",
        "Reality rejected this fusion. {p1} and {p2} were forced together by {s1} and {s2} stones into a "
        "being that should not exist."};
    static const std::vector<std::string> extreme{
        "The Grid itself screamed when {p1} and {p2} fused with {s1} and {s2} stones. This creature is a "
        "glitch in the code of existence.",
        "This fusion should have been impossible. {p1} and {p2}, bound by {s1} and {s2} stones, became an "
        "error that cannot be fixed."};
    switch (level) {
        case CorruptionLevel::Low: return low;
        case CorruptionLevel::Medium: return medium;
        case CorruptionLevel::High: return high;
        case CorruptionLevel::Extreme: return extreme;
    }
    return low;
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> splitWords(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string word;
    while (in >> word) out.push_back(word);
    return out;
}

void replaceAll(std::string& text, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

void eraseTemplate(std::vector<const AbilityTemplate*>& pool, const AbilityTemplate* tpl) {
    pool.erase(std::remove(pool.begin(), pool.end(), tpl), pool.end());
}

std::string stoneWord(StoneType type) { return toLower(stoneTypeName(type)); }

std::string makeLore(const FusionSignature& sig, Rarity rarity, const FusionCorruption& corruption,
                     Forge::SeededRandom& rng) {
    std::string lore;
    if (corruption.corrupted) {
        lore = rng.pick(glitchedLoreTemplates(corruption.level));
        replaceAll(lore, "{p1}", sig.parent1.name);
        replaceAll(lore, "{p2}", sig.parent2.name);
        replaceAll(lore, "{s1}", stoneWord(sig.stones[0].type));
        replaceAll(lore, "{s2}", stoneWord(sig.stones[1].type));
        return lore;
    }

    const std::string stones = stoneWord(sig.stones[0].type) + " and " + stoneWord(sig.stones[1].type);
    if (sig.interaction) {
        lore = sig.interaction->description + " A fusion of " + sig.parent1.name + " and " + sig.parent2.name +
               ", empowered by " + stones + " stones, it embodies the " + sig.interaction->result + " element.";
    } else {
        lore = "A fusion of " + sig.parent1.name + " and " + sig.parent2.name + ", empowered by " + stones +
               " stones. It combines the strengths of both parents into something new.";
    }
    if (rarityIndex(rarity) >= rarityIndex(Rarity::Mythic)) {
        lore += " This mythical being transcends mortal understanding.";
    } else if (rarity == Rarity::Legendary) {
        lore += " Few have witnessed its true power.";
    } else if (rarity == Rarity::SuperRare) {
        lore += " Stories of its deeds inspire many.";
    }
    return lore;
}

std::vector<std::string> makeVisualTags(const FusionSignature& sig, const FusionCorruption& corruption) {
    std::vector<std::string> tags;
    auto add = [&](const std::string& t) {
        if (!t.empty() && std::find(tags.begin(), tags.end(), t) == tags.end()) tags.push_back(t);
    };
    for (const auto& t : sig.parent1.visualTags) add(t);
    for (const auto& t : sig.parent2.visualTags) add(t);
    if (sig.interaction) add(sig.interaction->result);
    if (corruption.corrupted) add(std::string("glitched-") + corruptionLevelName(corruption.level));
    return tags;
}

}  // namespace

std::vector<std::string> validateFusionResult(const FusionResult& result) {
    std::vector<std::string> problems;
    const std::string lowered = toLower(result.name);
    if (splitWords(result.name).empty()) {
        problems.emplace_back("name is empty");
    } else if (lowered == "unknown" || lowered == "fusion" || lowered == "???") {
        problems.push_back("placeholder name '" + result.name + "'");
    }
    if (result.actives.empty()) problems.emplace_back("no active ability");
    for (const auto& a : result.actives) {
        if (a.type != AbilityType::Active) problems.push_back("ability " + a.name + " in active slot is not active");
    }
    if (result.ultimate && result.ultimate->type != AbilityType::Ultimate) {
        problems.emplace_back("ultimate slot holds a non-ultimate ability");
    }
    return problems;
}

std::string blendParentNames(const std::string& name1, const std::string& name2, std::optional<FusionIntent> intent,
                             Forge::SeededRandom& rng) {
    auto meaningful = [](const std::string& name) {
        std::vector<std::string> out;
        for (auto& w : splitWords(name)) {
            const std::string l = toLower(w);
            if (l != "the" && l != "of" && l != "a" && l != "an") out.push_back(w);
        }
        return out;
    };
    const auto m1 = meaningful(name1);
    const auto m2 = meaningful(name2);
    const std::string first1 = m1.empty() ? name1.substr(0, 4) : m1.front();
    const std::string first2 = m2.empty() ? name2.substr(0, 4) : m2.front();

    std::string blended;
    switch (rng.nextInt(0, 3)) {
        case 0:  // portmanteau
            blended = first1.substr(0, (first1.size() + 1) / 2) + first2.substr(first2.size() / 2);
            break;
        case 1:
            blended = first1 + first2.substr(first2.size() > 3 ? first2.size() - 3 : 0);
            break;
        case 2:
            blended = first1.substr(first1.size() > 3 ? first1.size() - 3 : 0) + first2;
            break;
        default:
            blended = first1 + first2;
            break;
    }
    blended = toLower(blended);
    if (!blended.empty()) blended[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(blended[0])));

    if (intent) blended += " " + rng.pick(intentTitles(*intent));
    return blended;
}

std::string toBase36(std::uint64_t value) {
    static constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) return "0";
    std::string out;
    while (value > 0) {
        out.insert(out.begin(), kDigits[value % 36]);
        value /= 36;
    }
    return out;
}

std::string makeUniqueName(const std::string& name, const std::vector<Pet>& existing, std::int64_t nowMs) {
    auto taken = [&](const std::string& candidate) {
        const std::string l = toLower(candidate);
        return std::any_of(existing.begin(), existing.end(), [&](const Pet& p) { return toLower(p.name) == l; });
    };
    if (!taken(name)) return name;
    for (int n = 1; n <= 99; ++n) {
        const std::string candidate = name + " " + std::to_string(n);
        if (!taken(candidate)) return candidate;
    }
    return name + " " + toBase36(static_cast<std::uint64_t>(nowMs < 0 ? -nowMs : nowMs));
}

std::string ResultAssembler::makeName(const FusionSignature& sig, const FusionCorruption& corruption,
                                      Forge::SeededRandom& rng) const {
    std::string name;
    if (sig.interaction && !sig.interaction->namePrefixes.empty() && !sig.interaction->nameSuffixes.empty()) {
        name = rng.pick(sig.interaction->namePrefixes) + " " + rng.pick(sig.interaction->nameSuffixes);
        if (sig.intent) name = rng.pick(intentAdjectives(*sig.intent)) + " " + name;
    } else {
        name = blendParentNames(sig.parent1.name, sig.parent2.name, sig.intent, rng);
    }
    if (corruption.corrupted) name = rng.pick(glitchTokens()) + " " + name;
    return name;
}

std::vector<Ability> ResultAssembler::fillSlots(AbilityType type, int count, const FusionSignature& sig,
                                                Rarity rarity, Forge::SeededRandom& rng) const {
    auto preferred = library_.filter(type, sig.preferredElement(), rarity);
    auto general = library_.filter(type, std::nullopt, rarity);

    std::vector<Ability> out;
    for (int i = 0; i < count; ++i) {
        const bool usePreferred = !preferred.empty() && (general.empty() || rng.chance(0.6));
        auto& pool = usePreferred ? preferred : general;
        if (pool.empty()) break;
        const AbilityTemplate* tpl = pool[static_cast<std::size_t>(rng.nextInt(0, static_cast<int>(pool.size()) - 1))];
        eraseTemplate(preferred, tpl);
        eraseTemplate(general, tpl);

        Ability a = instantiateAbility(*tpl, rarity, rng);
        if (sig.interaction && type != AbilityType::Passive) {
            const auto& themes = sig.interaction->abilityThemes;
            for (std::size_t t = 0; t < themes.size() && t < 2; ++t) a.tags.push_back(themes[t]);
        }
        out.push_back(std::move(a));
    }
    return out;
}

std::vector<Ability> ResultAssembler::fallbackActive(const FusionSignature& sig, Rarity rarity,
                                                     Forge::SeededRandom& rng, int& level) const {
    // Keep the element, drop the rarity gate.
    auto filtered = library_.filter(AbilityType::Active, sig.preferredElement(), Rarity::Omega);
    if (!filtered.empty()) {
        level = 1;
        return {instantiateAbility(*rng.pick(filtered), rarity, rng)};
    }
    // Ignore both gates.
    auto any = library_.filter(AbilityType::Active, std::nullopt, Rarity::Omega);
    if (!any.empty()) {
        level = 2;
        return {instantiateAbility(*rng.pick(any), rarity, rng)};
    }
    level = 3;
    return {Forge::Gameplay::basicStrike("basic-strike-" + rng.nextToken(6), 20)};
}

void ResultAssembler::applyCorruption(FusionResult& result, Rarity rarity, Forge::SeededRandom& rng) const {
    const auto glitchedActives = library_.glitched(AbilityType::Active);
    if (!glitchedActives.empty() && !result.actives.empty()) {
        const auto slot = static_cast<std::size_t>(rng.nextInt(0, static_cast<int>(result.actives.size()) - 1));
        result.actives[slot] = instantiateAbility(*rng.pick(glitchedActives), rarity, rng);
    }
    const auto glitchedUltimates = library_.glitched(AbilityType::Ultimate);
    if (!glitchedUltimates.empty() && result.ultimate) {
        result.ultimate = instantiateAbility(*rng.pick(glitchedUltimates), rarity, rng);
    }
}

FusionResult ResultAssembler::assemble(const FusionSignature& sig, Rarity rarity, const FusionCorruption& corruption,
                                       Forge::SeededRandom& rng) const {
    const auto& slots = rarityConfig(rarity);
    FusionResult result{};
    result.name = makeName(sig, corruption, rng);
    result.passives = fillSlots(AbilityType::Passive, slots.passiveCount, sig, rarity, rng);
    result.actives = fillSlots(AbilityType::Active, slots.activeCount, sig, rarity, rng);
    if (result.actives.empty()) {
        result.actives = fallbackActive(sig, rarity, rng, result.fallbackLevel);
        Forge::logWarn("No active abilities from templates, used fallback level " +
                       std::to_string(result.fallbackLevel));
    }
    // A creature carries at most one ultimate.
    if (slots.ultimateCount > 0) {
        auto ultimates = fillSlots(AbilityType::Ultimate, 1, sig, rarity, rng);
        if (!ultimates.empty()) result.ultimate = std::move(ultimates.front());
    }
    if (corruption.corrupted) applyCorruption(result, rarity, rng);

    result.lore = makeLore(sig, rarity, corruption, rng);
    result.visualTags = makeVisualTags(sig, corruption);
    return result;
}

std::optional<FusionResult> ProceduralEnhancer::enhance(const std::string& serializedSignature, Rarity rarity) {
    auto sig = parseSignature(serializedSignature);
    if (!sig) return std::nullopt;
    // Separate stream from the fusion's own rng so the two results differ.
    Forge::SeededRandom rng(sig->seedHash ^ 0x9e3779b9u);
    const FusionCorruption corruption = sig->corruption.value_or(FusionCorruption{});
    return ResultAssembler(library_).assemble(*sig, rarity, corruption, rng);
}

}  // namespace Pets
