#include "ElementInteractions.h"

namespace Pets {

using Forge::Gameplay::Element;

const std::vector<ElementInteraction>& elementInteractions() {
    static const std::vector<ElementInteraction> table{
        {Element::Fire, Element::Water, "steam", Element::Water,
         {"pressure", "expansion", "heat_transfer", "condensation", "vapor"},
         {"Steam", "Vapor", "Mist", "Fog"},
         {"the Boiler", "the Evaporator", "the Condenser", "the Turbine"},
         "Fire and Water combine to create Steam, a force of pressure and expansion.", 1.1f},
        {Element::Fire, Element::Earth, "lava", Element::Fire,
         {"molten", "eruption", "solidification", "pressure", "volcanic"},
         {"Magma", "Volcanic", "Molten", "Igneous"},
         {"the Eruptor", "the Forge", "the Caldera", "the Furnace"},
         "Fire and Earth merge into Lava, a destructive force of molten rock.", 1.2f},
        {Element::Water, Element::Earth, "mud", Element::Earth,
         {"absorption", "erosion", "solidification", "fertility", "quicksand"},
         {"Mud", "Clay", "Silt", "Mire"},
         {"the Swamp", "the Quagmire", "the Mire", "the Bog"},
         "Water and Earth combine to form Mud, a substance of absorption and erosion.", 1.1f},
        {Element::Lightning, Element::Water, "storm", Element::Lightning,
         {"electrocution", "conduction", "turbulence", "discharge", "thunder"},
         {"Storm", "Tempest", "Thunder", "Squall"},
         {"the Tempest", "the Thunderhead", "the Squall", "the Cyclone"},
         "Lightning and Water create Storm, a chaotic force of thunder and rain.", 1.2f},
        {Element::Fire, Element::Lightning, "plasma", Element::Lightning,
         {"ionization", "energy", "explosion", "discharge", "fusion"},
         {"Plasma", "Ion", "Arc", "Bolt"},
         {"the Ionizer", "the Arc", "the Discharger", "the Fusion"},
         "Fire and Lightning merge into Plasma, a state of ionized energy.", 1.25f},
        {Element::Shadow, Element::Light, "twilight", Element::Light,
         {"balance", "duality", "transition", "merging", "harmony"},
         {"Twilight", "Dusk", "Dawn", "Equinox"},
         {"the Balance", "the Duality", "the Transition", "the Harmony"},
         "Shadow and Light merge into Twilight, a state of perfect balance between opposites.", 1.15f},
        {Element::Fire, Element::Shadow, "ash", Element::Shadow,
         {"corruption", "decay", "smoke", "obscuration", "void"},
         {"Ash", "Ember", "Smoke", "Cinder"},
         {"the Corruptor", "the Decayer", "the Obscurer", "the Void"},
         "Fire and Shadow combine to create Ash, a substance of corruption and decay.", 1.15f},
        {Element::Water, Element::Light, "prism", Element::Light,
         {"refraction", "rainbow", "spectrum", "illumination", "clarity"},
         {"Prism", "Rainbow", "Spectrum", "Luminous"},
         {"the Refractor", "the Spectrum", "the Illuminator", "the Clarity"},
         "Water and Light merge into Prism, a force of refraction and illumination.", 1.1f},
        {Element::Earth, Element::Lightning, "crystal", Element::Earth,
         {"resonance", "amplification", "refraction", "energy", "focus"},
         {"Crystal", "Quartz", "Prism", "Gem"},
         {"the Resonator", "the Prism", "the Amplifier", "the Focus"},
         "Earth and Lightning form Crystal, a structure that amplifies and focuses energy.", 1.1f},
        {Element::Earth, Element::Nature, "grove", Element::Earth,
         {"growth", "fertility", "roots", "life", "nourishment"},
         {"Grove", "Forest", "Root", "Life"},
         {"the Grower", "the Nourisher", "the Root", "the Life"},
         "Earth and Nature combine to create Grove, a place of growth and fertility.", 1.1f},
        {Element::Lightning, Element::Nature, "wild_storm", Element::Lightning,
         {"wild", "chaos", "growth", "energy", "vitality"},
         {"Wild", "Chaos", "Vital", "Storm"},
         {"the Wild", "the Chaos", "the Vital", "the Storm"},
         "Lightning and Nature merge into Wild Storm, a force of wild growth and chaos.", 1.2f},
        {Element::Shadow, Element::Earth, "void", Element::Shadow,
         {"absorption", "entropy", "decay", "nothingness", "void"},
         {"Void", "Abyss", "Null", "Hollow"},
         {"the Void", "the Abyss", "the Null", "the Emptiness"},
         "Shadow and Earth combine to create Void, a force of absorption and entropy.", 1.3f},
        {Element::Light, Element::Nature, "radiance", Element::Light,
         {"growth", "healing", "purity", "life", "blessing"},
         {"Radiant", "Blessed", "Pure", "Luminous"},
         {"the Radiant", "the Blessed", "the Pure", "the Luminous"},
         "Light and Nature merge into Radiance, a force of healing and growth.", 1.1f},
    };
    return table;
}

const ElementInteraction* findElementInteraction(Element a, Element b) {
    for (const auto& entry : elementInteractions()) {
        if ((entry.element1 == a && entry.element2 == b) || (entry.element1 == b && entry.element2 == a)) {
            return &entry;
        }
    }
    return nullptr;
}

}  // namespace Pets
