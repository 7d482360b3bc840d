#include "StoreKey.hpp"
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <sodium.h>
#include <spdlog/spdlog.h>

namespace {

    constexpr std::size_t STORE_KEY_BYTES = crypto_secretbox_KEYBYTES;
    constexpr std::size_t STORE_SALT_BYTES = crypto_pwhash_SALTBYTES;

    std::string toHex(const std::vector<unsigned char>& bytes) {
        std::string hex(bytes.size() * 2 + 1, '\0');
        sodium_bin2hex(&hex[0], hex.size(), bytes.data(), bytes.size());
        hex.resize(bytes.size() * 2);
        return hex;
    }

    // nullopt unless the text is exactly one salt's worth of hex
    std::optional<std::vector<unsigned char>> saltFromHex(const std::string& hex) {
        std::vector<unsigned char> salt(STORE_SALT_BYTES);
        std::size_t decoded = 0;
        const char* end = nullptr;

        if (sodium_hex2bin(salt.data(), salt.size(), hex.data(), hex.size(), nullptr, &decoded, &end) != 0
            || end != hex.data() + hex.size()) {
            spdlog::error("Store salt is not valid hex");
            return std::nullopt;
        }
        if (decoded != STORE_SALT_BYTES) {
            spdlog::error("Store salt has {} bytes, expected {}", decoded, STORE_SALT_BYTES);
            return std::nullopt;
        }
        return salt;
    }
}

namespace StoreKey {

    void ensureSodium() {
        if (sodium_init() == -1) {
            spdlog::error("libsodium could not be initialised");
            throw std::runtime_error("sodium_init failed");
        }
    }

    std::string newSaltHex() {
        ensureSodium();
        std::vector<unsigned char> salt(STORE_SALT_BYTES);
        randombytes_buf(salt.data(), salt.size());
        return toHex(salt);
    }

    std::vector<unsigned char> derive(const std::string& passphrase, const std::string& saltHex) {
        ensureSodium();
        if (passphrase.empty() || saltHex.empty()) {
            spdlog::error("Cannot derive store key: empty passphrase or salt");
            return {};
        }

        auto salt = saltFromHex(saltHex);
        if (!salt) return {};

        std::vector<unsigned char> key(STORE_KEY_BYTES);
        const int rc = crypto_pwhash(key.data(), key.size(),
            passphrase.data(), passphrase.size(), salt->data(),
            crypto_pwhash_OPSLIMIT_INTERACTIVE, crypto_pwhash_MEMLIMIT_INTERACTIVE,
            crypto_pwhash_ALG_DEFAULT);
        if (rc != 0) {
            spdlog::error("crypto_pwhash failed while deriving the store key");
            throw std::runtime_error("crypto_pwhash failed (out of memory)");
        }

        spdlog::debug("Store key derived");
        return key;
    }

    std::vector<unsigned char> deriveForDirectory(const std::string& passphrase, const std::string& dataDir) {
        std::error_code ec;
        std::filesystem::create_directories(dataDir, ec);

        const std::string saltFile = (std::filesystem::path(dataDir) / "store.salt").string();
        std::string saltHex;

        std::ifstream in(saltFile);
        if (in) {
            std::getline(in, saltHex);
        }
        else {
            saltHex = newSaltHex();
            std::ofstream out(saltFile, std::ios::trunc);
            if (!out || !(out << saltHex << "\n")) {
                spdlog::error("Failed to write salt file '{}'", saltFile);
                return {};
            }
            spdlog::info("Created new store salt in '{}'", saltFile);
        }

        return derive(passphrase, saltHex);
    }

    void wipe(std::vector<unsigned char>& key) {
        if (key.empty()) return;
        sodium_memzero(key.data(), key.size());
        key.clear();
    }
}
