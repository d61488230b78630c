// In-memory stores for the demo driver and tests, with simple failure injection.
#pragma once

#include <map>
#include <mutex>
#include <set>
#include <string>

#include "Stores.h"

namespace Pets {

class MemoryCreatureStore : public CreatureStore {
public:
    std::optional<Pet> findById(const std::string& id) const override;
    bool exists(const std::string& id) const override;
    bool save(const Pet& pet) override;
    bool remove(const std::string& id) override;
    std::vector<Pet> findAll() const override;

    // Failure injection.
    void failSaves(bool fail);
    void failRemovalOf(const std::string& id);
    void clearFailures();

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Pet> pets_;  // ordered so findAll() is stable
    bool failSaves_{false};
    std::set<std::string> failRemove_;
};

class MemoryStoneStore : public StoneStore {
public:
    std::optional<Stone> findById(const std::string& id) const override;
    bool exists(const std::string& id) const override;
    bool save(const Stone& stone) override;
    bool remove(const std::string& id) override;
    std::vector<Stone> findAll() const override;
    bool transferOwnership(const std::string& stoneId, const std::optional<std::string>& expectedOwner,
                           const std::optional<std::string>& newOwner) override;

    void failSaves(bool fail);
    void failRemovalOf(const std::string& id);
    void clearFailures();

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, Stone> stones_;
    bool failSaves_{false};
    std::set<std::string> failRemove_;
};

}  // namespace Pets
