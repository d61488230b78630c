#include "Lineage.h"

#include <algorithm>

namespace Pets {

using Forge::Gameplay::Element;

LineageInfluence lineageInfluence(const Pet& pet) {
    LineageInfluence out{};
    for (const auto& rec : pet.fusionHistory) {
        for (Family f : rec.parentFamilies) {
            out.elementCounts[static_cast<std::size_t>(familyElement(f))] += 1;
            out.totalAncestors += 1;
        }
    }
    int best = 0;
    for (std::size_t i = 0; i < out.elementCounts.size(); ++i) {
        if (out.elementCounts[i] > best) {
            best = out.elementCounts[i];
            out.dominant = static_cast<Element>(i);
        }
    }
    out.generation = pet.generation();
    return out;
}

std::vector<LineageModifier> lineageModifiers(const Pet& pet) {
    const LineageInfluence inf = lineageInfluence(pet);
    std::vector<LineageModifier> mods;

    if (const int fire = inf.count(Element::Fire); fire > 0) {
        mods.push_back({LineageKind::DamageBoost, 0.02f * fire, "Ancestral Ember"});
    }
    if (const int water = inf.count(Element::Water); water >= 3) {
        mods.push_back({LineageKind::HealingBoost, 0.05f + 0.02f * (water - 3), "Tidal Heritage"});
    }
    if (const int earth = inf.count(Element::Earth); earth > 0) {
        mods.push_back({LineageKind::DefenseBoost, 0.03f * earth, "Steadfast Lineage"});
    }
    if (const int lightning = inf.count(Element::Lightning); lightning > 0) {
        mods.push_back({LineageKind::SpeedBoost, 0.02f * lightning, "Speed of Kin"});
    }
    if (const int shadow = inf.count(Element::Shadow); shadow > 0) {
        mods.push_back({LineageKind::Evasion, std::min(0.15f, 0.01f * shadow), "Ancestral Veil"});
    }
    if (const int light = inf.count(Element::Light); inf.dominant == Element::Light && light >= 3) {
        mods.push_back({LineageKind::CritChance, 0.05f + 0.01f * light, "Divine Blood"});
    }
    if (inf.generation >= 10) {
        mods.push_back({LineageKind::DamageBoost, 0.10f, "Ancient Bloodline"});
        mods.push_back({LineageKind::DefenseBoost, 0.10f, "Ancient Bloodline"});
    }
    return mods;
}

}  // namespace Pets
