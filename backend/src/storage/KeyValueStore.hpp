#pragma once
#include <optional>
#include <string>
#include <unordered_map>

// String key/value persistence used by the repository.
//   get    -> nullopt when the key is missing or unreadable (never throws)
//   set    -> false on write failure (cause is logged)
//   remove -> false on failure; removing a missing key succeeds
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual bool set(const std::string& key, const std::string& value) = 0;
    virtual bool remove(const std::string& key) = 0;
};

class InMemoryKeyValueStore : public KeyValueStore {
public:
    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

    std::size_t size() const { return values.size(); }

private:
    std::unordered_map<std::string, std::string> values;
};

/*
  Read-through / write-through cache in front of another store.
  A failed write leaves the cache untouched so it never shows data the backing
  store does not have. invalidate() forces the next reads to hit the backing store.
*/
class CachedKeyValueStore : public KeyValueStore {
public:
    explicit CachedKeyValueStore(KeyValueStore& backing);

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

    void invalidate();
    void invalidate(const std::string& key);

private:
    KeyValueStore& backing;
    std::unordered_map<std::string, std::optional<std::string>> cache;
};
