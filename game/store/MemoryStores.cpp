#include "MemoryStores.h"

#include "../../engine/core/Logger.h"

namespace Pets {

std::optional<Pet> MemoryCreatureStore::findById(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pets_.find(id);
    if (it == pets_.end()) return std::nullopt;
    return it->second;
}

bool MemoryCreatureStore::exists(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pets_.count(id) > 0;
}

bool MemoryCreatureStore::save(const Pet& pet) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failSaves_ || pet.id.empty()) return false;
    pets_[pet.id] = pet;
    return true;
}

bool MemoryCreatureStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failRemove_.count(id)) {
        Forge::logDebug("Injected remove failure for creature " + id);
        return false;
    }
    return pets_.erase(id) > 0;
}

std::vector<Pet> MemoryCreatureStore::findAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Pet> out;
    out.reserve(pets_.size());
    for (const auto& [id, pet] : pets_) out.push_back(pet);
    return out;
}

void MemoryCreatureStore::failSaves(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failSaves_ = fail;
}

void MemoryCreatureStore::failRemovalOf(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    failRemove_.insert(id);
}

void MemoryCreatureStore::clearFailures() {
    std::lock_guard<std::mutex> lock(mutex_);
    failSaves_ = false;
    failRemove_.clear();
}

std::size_t MemoryCreatureStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pets_.size();
}

std::optional<Stone> MemoryStoneStore::findById(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stones_.find(id);
    if (it == stones_.end()) return std::nullopt;
    return it->second;
}

bool MemoryStoneStore::exists(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stones_.count(id) > 0;
}

bool MemoryStoneStore::save(const Stone& stone) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failSaves_ || stone.id.empty()) return false;
    stones_[stone.id] = stone;
    return true;
}

bool MemoryStoneStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failRemove_.count(id)) {
        Forge::logDebug("Injected remove failure for stone " + id);
        return false;
    }
    return stones_.erase(id) > 0;
}

std::vector<Stone> MemoryStoneStore::findAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Stone> out;
    out.reserve(stones_.size());
    for (const auto& [id, stone] : stones_) out.push_back(stone);
    return out;
}

bool MemoryStoneStore::transferOwnership(const std::string& stoneId, const std::optional<std::string>& expectedOwner,
                                         const std::optional<std::string>& newOwner) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stones_.find(stoneId);
    if (it == stones_.end()) return false;
    if (it->second.owner != expectedOwner) return false;
    it->second.owner = newOwner;
    return true;
}

void MemoryStoneStore::failSaves(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failSaves_ = fail;
}

void MemoryStoneStore::failRemovalOf(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    failRemove_.insert(id);
}

void MemoryStoneStore::clearFailures() {
    std::lock_guard<std::mutex> lock(mutex_);
    failSaves_ = false;
    failRemove_.clear();
}

std::size_t MemoryStoneStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stones_.size();
}

}  // namespace Pets
