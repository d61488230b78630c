// Abstract persistence seams for creatures and stones; the fusion pipeline only talks to these.
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../content/Creature.h"
#include "../content/Stone.h"

namespace Pets {

class CreatureStore {
public:
    virtual ~CreatureStore() = default;

    virtual std::optional<Pet> findById(const std::string& id) const = 0;
    virtual bool exists(const std::string& id) const = 0;
    virtual bool save(const Pet& pet) = 0;
    // False when nothing was removed.
    virtual bool remove(const std::string& id) = 0;
    virtual std::vector<Pet> findAll() const = 0;
};

class StoneStore {
public:
    virtual ~StoneStore() = default;

    virtual std::optional<Stone> findById(const std::string& id) const = 0;
    virtual bool exists(const std::string& id) const = 0;
    virtual bool save(const Stone& stone) = 0;
    virtual bool remove(const std::string& id) = 0;
    virtual std::vector<Stone> findAll() const = 0;

    // Check-and-set on the owner field; an unset owner means "listed".
    virtual bool transferOwnership(const std::string& stoneId, const std::optional<std::string>& expectedOwner,
                                   const std::optional<std::string>& newOwner) = 0;
};

}  // namespace Pets
