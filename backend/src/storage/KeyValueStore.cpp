#include "KeyValueStore.hpp"
#include <spdlog/spdlog.h>

std::optional<std::string> InMemoryKeyValueStore::get(const std::string& key) {
    auto it = values.find(key);
    if (it == values.end()) return std::nullopt;
    return it->second;
}

bool InMemoryKeyValueStore::set(const std::string& key, const std::string& value) {
    values[key] = value;
    return true;
}

bool InMemoryKeyValueStore::remove(const std::string& key) {
    values.erase(key);
    return true;
}

CachedKeyValueStore::CachedKeyValueStore(KeyValueStore& store)
    : backing(store)
{
}

std::optional<std::string> CachedKeyValueStore::get(const std::string& key) {
    auto it = cache.find(key);
    if (it != cache.end()) {
        spdlog::debug("Cache hit for '{}'", key);
        return it->second;
    }

    auto value = backing.get(key);
    cache[key] = value;
    return value;
}

bool CachedKeyValueStore::set(const std::string& key, const std::string& value) {
    if (!backing.set(key, value)) {
        spdlog::warn("Write of '{}' failed; cache entry dropped", key);
        cache.erase(key);
        return false;
    }
    cache[key] = value;
    return true;
}

bool CachedKeyValueStore::remove(const std::string& key) {
    cache.erase(key);
    return backing.remove(key);
}

void CachedKeyValueStore::invalidate() {
    spdlog::debug("Cache invalidated ({} entries)", cache.size());
    cache.clear();
}

void CachedKeyValueStore::invalidate(const std::string& key) {
    cache.erase(key);
}
