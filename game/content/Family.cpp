#include "Family.h"

namespace Pets {

using Forge::Gameplay::Element;

Element familyElement(Family family) {
    switch (family) {
        case Family::PyroKin: return Element::Fire;
        case Family::AquaBorn: return Element::Water;
        case Family::TerraForged: return Element::Earth;
        case Family::VoltStream: return Element::Lightning;
        case Family::ShadowVeil: return Element::Shadow;
        case Family::Lumina: return Element::Light;
        case Family::SteelWorks: return Element::Metal;
        case Family::ArcaneRift: return Element::Arcane;
        case Family::AeroFlight: return Element::Air;
        case Family::Weirdos:
        default: return Element::Chaos;
    }
}

const char* familyName(Family family) {
    switch (family) {
        case Family::PyroKin: return "PYRO_KIN";
        case Family::AquaBorn: return "AQUA_BORN";
        case Family::TerraForged: return "TERRA_FORGED";
        case Family::VoltStream: return "VOLT_STREAM";
        case Family::ShadowVeil: return "SHADOW_VEIL";
        case Family::Lumina: return "LUMINA";
        case Family::SteelWorks: return "STEEL_WORKS";
        case Family::ArcaneRift: return "ARCANE_RIFT";
        case Family::AeroFlight: return "AERO_FLIGHT";
        case Family::Weirdos:
        default: return "WEIRDOS";
    }
}

std::optional<Family> parseFamilyKey(std::string_view key) {
    for (int i = 0; i < kFamilyCount; ++i) {
        const auto f = static_cast<Family>(i);
        if (key == familyName(f)) return f;
    }
    return std::nullopt;
}

}  // namespace Pets
