#include "StatusCatalog.h"

#include <fstream>
#include <optional>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "../../engine/core/Logger.h"
#include "../../engine/gameplay/Ability.h"

namespace {
using Forge::Status::StatusSpec;
using Forge::Status::StatusTag;
using Forge::Status::StatusType;

std::optional<StatusTag> tagFromString(const std::string& s) {
    static const std::unordered_map<std::string, StatusTag> map{
        {"DamageOverTime", StatusTag::DamageOverTime},
        {"HealOverTime", StatusTag::HealOverTime},
        {"Incapacitate", StatusTag::Incapacitate},
        {"Evasion", StatusTag::Evasion},
    };
    auto it = map.find(s);
    if (it != map.end()) return it->second;
    return std::nullopt;
}

StatusSpec defaultSpec(StatusType type) {
    StatusSpec spec{};
    spec.type = type;
    spec.duration = 2;
    spec.maxStacks = 1;
    spec.refreshOnReapply = true;
    spec.isDebuff = true;
    switch (type) {
        case StatusType::Burn:
            spec.tags = {StatusTag::DamageOverTime};
            spec.maxStacks = 3;
            spec.magnitude = 0.05f;
            break;
        case StatusType::Poison:
            spec.tags = {StatusTag::DamageOverTime};
            spec.maxStacks = 5;
            spec.duration = 3;
            spec.magnitude = 0.04f;
            break;
        case StatusType::Stun:
        case StatusType::Freeze:
            spec.tags = {StatusTag::Incapacitate};
            spec.duration = 1;
            break;
        case StatusType::Stealth:
            spec.tags = {StatusTag::Evasion};
            spec.isDebuff = false;
            break;
        case StatusType::Regeneration:
            spec.tags = {StatusTag::HealOverTime};
            spec.isDebuff = false;
            spec.duration = 3;
            spec.magnitude = 0.05f;
            break;
    }
    return spec;
}

}  // namespace

namespace Pets {

bool StatusCatalog::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        // Leave specs empty; make() will fall back to defaults.
        return false;
    }
    const nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        Forge::logWarn("Status catalog is not valid JSON: " + path);
        return false;
    }

    for (const auto& [key, value] : j.items()) {
        if (!value.is_object()) continue;
        try {
            const std::string idStr = value.value("id", key);
            auto typeOpt = Forge::Gameplay::parseStatusTypeKey(idStr);
            if (!typeOpt) {
                Forge::logWarn("Unknown status id in catalog: " + idStr);
                continue;
            }
            StatusSpec spec = defaultSpec(*typeOpt);
            spec.duration = value.value("duration", spec.duration);
            spec.maxStacks = value.value("maxStacks", spec.maxStacks);
            spec.refreshOnReapply = value.value("refreshOnReapply", spec.refreshOnReapply);
            spec.isDebuff = value.value("isDebuff", spec.isDebuff);
            spec.magnitude = value.value("magnitude", spec.magnitude);
            if (value.contains("tags") && value["tags"].is_array()) {
                spec.tags.clear();
                for (const auto& t : value["tags"]) {
                    if (!t.is_string()) continue;
                    auto tagOpt = tagFromString(t.get<std::string>());
                    if (tagOpt) spec.tags.push_back(*tagOpt);
                }
            }
            specs_[*typeOpt] = spec;
        } catch (const nlohmann::json::exception& e) {
            Forge::logWarn("Skipping status '" + key + "' with a mistyped field: " + e.what());
        }
    }
    return true;
}

Forge::Status::StatusSpec StatusCatalog::make(StatusType type, std::optional<int> duration,
                                              std::optional<float> magnitude) const {
    auto it = specs_.find(type);
    StatusSpec spec = it != specs_.end() ? it->second : defaultSpec(type);
    if (duration) spec.duration = *duration;
    if (magnitude) spec.magnitude = *magnitude;
    return spec;
}

}  // namespace Pets
