#include "Element.h"

#include <array>

namespace Forge::Gameplay {

namespace {

constexpr std::size_t kCount = static_cast<std::size_t>(Element::Count);
using Chart = std::array<std::array<float, kCount>, kCount>;

// Rows: attacker. Columns: fire, water, earth, lightning, shadow, light, metal, arcane, air, chaos, nature.
const Chart& chart() {
    static const Chart table = [] {
        Chart c{};
        c[0] = {1.0f, 0.5f, 1.5f, 1.0f, 1.0f, 1.0f, 1.5f, 1.0f, 1.2f, 1.0f, 1.0f};  // fire
        c[1] = {1.5f, 1.0f, 1.5f, 0.5f, 1.0f, 1.0f, 0.8f, 1.0f, 1.0f, 1.0f, 1.0f};  // water
        c[2] = {0.5f, 0.5f, 1.0f, 1.5f, 1.0f, 1.0f, 0.8f, 1.0f, 1.5f, 1.0f, 1.0f};  // earth
        c[3] = {1.0f, 1.5f, 0.5f, 1.0f, 1.5f, 1.0f, 1.5f, 1.2f, 0.8f, 1.0f, 1.0f};  // lightning
        c[4] = {1.0f, 1.0f, 1.0f, 0.5f, 1.0f, 0.5f, 1.0f, 1.5f, 1.0f, 1.2f, 1.0f};  // shadow
        c[5] = {1.0f, 1.0f, 1.0f, 1.0f, 1.5f, 1.0f, 1.0f, 1.0f, 1.0f, 1.5f, 1.0f};  // light
        c[6] = {0.8f, 1.2f, 1.2f, 0.8f, 1.0f, 1.0f, 1.0f, 0.8f, 1.0f, 1.0f, 1.0f};  // metal
        c[7] = {1.0f, 1.0f, 1.0f, 1.2f, 1.5f, 1.0f, 1.2f, 1.0f, 1.0f, 0.8f, 1.0f};  // arcane
        c[8] = {0.8f, 1.0f, 0.5f, 1.2f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f, 1.0f};  // air
        c[9] = {1.0f, 1.0f, 1.0f, 1.0f, 1.2f, 0.8f, 1.0f, 1.2f, 1.0f, 1.0f, 1.0f};  // chaos
        c[10].fill(1.0f);                                                           // nature
        return c;
    }();
    return table;
}

struct ReactionEntry {
    Element attacker;
    Element defender;
    Reaction reaction;
};

constexpr float kGenericReaction = 1.1f;

const std::array<ReactionEntry, 30>& reactions() {
    static const std::array<ReactionEntry, 30> table{{
        {Element::Fire, Element::Water, {"steam", 1.1f}},
        {Element::Fire, Element::Earth, {"lava", 1.2f}},
        {Element::Fire, Element::Air, {"inferno", 1.3f}},
        {Element::Fire, Element::Lightning, {"plasma", kGenericReaction}},
        {Element::Fire, Element::Shadow, {"ash", kGenericReaction}},
        {Element::Water, Element::Fire, {"steam", 1.1f}},
        {Element::Water, Element::Earth, {"mud", 1.1f}},
        {Element::Water, Element::Lightning, {"storm", 1.2f}},
        {Element::Water, Element::Light, {"prism", kGenericReaction}},
        {Element::Earth, Element::Fire, {"lava", 1.2f}},
        {Element::Earth, Element::Water, {"mud", 1.1f}},
        {Element::Earth, Element::Lightning, {"crystal", kGenericReaction}},
        {Element::Earth, Element::Metal, {"alloy", kGenericReaction}},
        {Element::Lightning, Element::Water, {"electrified", 1.25f}},
        {Element::Lightning, Element::Earth, {"crystal", kGenericReaction}},
        {Element::Lightning, Element::Air, {"storm", 1.2f}},
        {Element::Lightning, Element::Metal, {"magnetic", kGenericReaction}},
        {Element::Shadow, Element::Light, {"twilight", 1.15f}},
        {Element::Shadow, Element::Arcane, {"void", 1.3f}},
        {Element::Shadow, Element::Chaos, {"entropy", kGenericReaction}},
        {Element::Light, Element::Shadow, {"twilight", 1.15f}},
        {Element::Light, Element::Arcane, {"divine", kGenericReaction}},
        {Element::Light, Element::Chaos, {"purification", kGenericReaction}},
        {Element::Metal, Element::Fire, {"molten", kGenericReaction}},
        {Element::Arcane, Element::Chaos, {"reality", kGenericReaction}},
        {Element::Air, Element::Water, {"mist", kGenericReaction}},
        {Element::Chaos, Element::Fire, {"anomaly", kGenericReaction}},
        {Element::Chaos, Element::Water, {"flux", kGenericReaction}},
        {Element::Metal, Element::Lightning, {"magnetic", kGenericReaction}},
        {Element::Arcane, Element::Light, {"divine", kGenericReaction}},
    }};
    return table;
}

}  // namespace

const char* elementName(Element element) {
    switch (element) {
        case Element::Fire: return "fire";
        case Element::Water: return "water";
        case Element::Earth: return "earth";
        case Element::Lightning: return "lightning";
        case Element::Shadow: return "shadow";
        case Element::Light: return "light";
        case Element::Metal: return "metal";
        case Element::Arcane: return "arcane";
        case Element::Air: return "air";
        case Element::Chaos: return "chaos";
        case Element::Nature: return "nature";
        case Element::Count:
        default: return "none";
    }
}

std::optional<Element> parseElementKey(std::string_view key) {
    for (std::size_t i = 0; i < kCount; ++i) {
        const auto e = static_cast<Element>(i);
        if (key == elementName(e)) return e;
    }
    return std::nullopt;
}

float elementEffectiveness(std::optional<Element> attacker, std::optional<Element> defender) {
    if (!attacker || !defender) return 1.0f;
    return chart()[static_cast<std::size_t>(*attacker)][static_cast<std::size_t>(*defender)];
}

std::optional<Reaction> findReaction(std::optional<Element> attacker, std::optional<Element> defender) {
    if (!attacker || !defender) return std::nullopt;
    for (const auto& entry : reactions()) {
        if (entry.attacker == *attacker && entry.defender == *defender) return entry.reaction;
    }
    for (const auto& entry : reactions()) {
        if (entry.attacker == *defender && entry.defender == *attacker) return entry.reaction;
    }
    return std::nullopt;
}

}  // namespace Forge::Gameplay
