#pragma once

#include <optional>
#include <string_view>

#include "../../engine/gameplay/Element.h"

namespace Pets {

enum class Family {
    PyroKin,
    AquaBorn,
    TerraForged,
    VoltStream,
    ShadowVeil,
    Lumina,
    SteelWorks,
    ArcaneRift,
    AeroFlight,
    Weirdos
};

constexpr int kFamilyCount = 10;

Forge::Gameplay::Element familyElement(Family family);
const char* familyName(Family family);
std::optional<Family> parseFamilyKey(std::string_view key);

}  // namespace Pets
