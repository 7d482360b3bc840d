#pragma once
#include <string>
#include <vector>

// Derives the FileKeyValueStore encryption key from a passphrase (libsodium crypto_pwhash).
// The salt is kept hex-encoded in "<dataDir>/store.salt" and created on first use.
namespace StoreKey {

    // Throws std::runtime_error if libsodium cannot be initialised
    void ensureSodium();

    // Empty vector on bad input (cause logged); throws std::runtime_error if crypto_pwhash runs out of memory
    std::vector<unsigned char> derive(const std::string& passphrase, const std::string& saltHex);
    std::vector<unsigned char> deriveForDirectory(const std::string& passphrase, const std::string& dataDir);

    std::string newSaltHex();
    void wipe(std::vector<unsigned char>& key);
}
