// Elemental typing: effectiveness chart and combat reactions between elements.
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace Forge::Gameplay {

enum class Element : std::uint8_t {
    Fire = 0,
    Water,
    Earth,
    Lightning,
    Shadow,
    Light,
    Metal,
    Arcane,
    Air,
    Chaos,
    Nature,  // stone-only element; neutral in the chart
    Count
};

const char* elementName(Element element);
std::optional<Element> parseElementKey(std::string_view key);

// Attacker-vs-defender multiplier (0.5 .. 1.5). Missing elements are neutral.
float elementEffectiveness(std::optional<Element> attacker, std::optional<Element> defender);

// Named combat reaction when an attacking element meets a defending one (fire on water = steam).
struct Reaction {
    std::string_view name;
    float damageMultiplier{1.0f};
};

// Checks the attacker->defender direction first, then the reverse.
std::optional<Reaction> findReaction(std::optional<Element> attacker, std::optional<Element> defender);

}  // namespace Forge::Gameplay
