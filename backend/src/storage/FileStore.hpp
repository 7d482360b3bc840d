#pragma once
#include <string>
#include <vector>
#include "KeyValueStore.hpp"

// One file per key under a data directory.
//
// With a store key (crypto_secretbox_KEYBYTES long) every value is encrypted:
//   Header: 9 bytes ASCII "CADENCE1\n" (magic + version)
//   Nonce: crypto_secretbox_NONCEBYTES
//   Ciphertext: remaining bytes
// With an empty key values are written as plain text.
//
// A missing file reads as nullopt. A key of the wrong size makes every call fail.

class FileKeyValueStore : public KeyValueStore {
public:
    explicit FileKeyValueStore(const std::string& dataDir, std::vector<unsigned char> key = {});

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value) override;
    bool remove(const std::string& key) override;

    bool encrypted() const { return !storeKey.empty(); }
    std::string pathFor(const std::string& key) const;

private:
    std::string dir;
    std::vector<unsigned char> storeKey;

    bool keyUsable() const;
    static bool validKeyName(const std::string& key);

    std::optional<std::string> decrypt(const std::string& raw, const std::string& filename) const;
    std::optional<std::string> encrypt(const std::string& plain) const;
};
