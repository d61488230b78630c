#pragma once

#include <optional>
#include <string>
#include <unordered_map>

#include "../../engine/status/StatusContainer.h"

namespace Pets {

// Loads status specifications from data/statuses.json and provides prefab specs.
class StatusCatalog {
public:
    bool load(const std::string& path);

    // Catalog spec with the effect's duration and magnitude overriding the defaults when given.
    Forge::Status::StatusSpec make(Forge::Status::StatusType type,
                                   std::optional<int> duration = std::nullopt,
                                   std::optional<float> magnitude = std::nullopt) const;

private:
    std::unordered_map<Forge::Status::StatusType, Forge::Status::StatusSpec> specs_;
};

}  // namespace Pets
