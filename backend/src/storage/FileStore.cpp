#include "FileStore.hpp"
#include "StoreKey.hpp"
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sodium.h>
#include <spdlog/spdlog.h>

static const char MAGIC_HDR[] = "CADENCE1\n";

FileKeyValueStore::FileKeyValueStore(const std::string& dataDir, std::vector<unsigned char> key)
    : dir(dataDir), storeKey(std::move(key))
{
    if (encrypted()) StoreKey::ensureSodium();

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        spdlog::error("Failed to create data directory '{}': {}", dir, ec.message());
    }

    spdlog::info("FileKeyValueStore at '{}' ({})", dir, encrypted() ? "encrypted" : "plain");
}

std::string FileKeyValueStore::pathFor(const std::string& key) const {
    return (std::filesystem::path(dir) / (key + ".dat")).string();
}

bool FileKeyValueStore::keyUsable() const {
    if (storeKey.empty() || storeKey.size() == crypto_secretbox_KEYBYTES) return true;
    spdlog::error("Invalid key size");
    return false;
}

bool FileKeyValueStore::validKeyName(const std::string& key) {
    if (key.empty()) return false;
    for (unsigned char c : key) {
        if (!(std::isalnum(c) || c == '_' || c == '-' || c == '.')) return false;
    }
    return key.front() != '.';
}

std::optional<std::string> FileKeyValueStore::get(const std::string& key) {
    if (!keyUsable() || !validKeyName(key)) {
        spdlog::error("Rejected read of key '{}'", key);
        return std::nullopt;
    }

    const std::string filename = pathFor(key);
    std::ifstream in(filename, std::ios::binary);
    if (!in) {
        spdlog::debug("File '{}' not found; treating as empty", filename);
        return std::nullopt;
    }

    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        spdlog::error("Failed reading '{}'", filename);
        return std::nullopt;
    }

    if (!encrypted()) return raw;
    return decrypt(raw, filename);
}

bool FileKeyValueStore::set(const std::string& key, const std::string& value) {
    if (!keyUsable()) return false;
    if (!validKeyName(key)) {
        spdlog::error("Rejected write of key '{}'", key);
        return false;
    }

    std::string payload = value;
    if (encrypted()) {
        auto sealed = encrypt(value);
        if (!sealed) return false;
        payload = std::move(*sealed);
    }

    const std::string filename = pathFor(key);
    std::ofstream out(filename, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("Failed to open '{}' for writing", filename);
        return false;
    }

    out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
    if (!out) {
        spdlog::error("Failed writing {} bytes to '{}'", payload.size(), filename);
        return false;
    }

    spdlog::debug("Saved '{}' ({} bytes)", key, value.size());
    return true;
}

bool FileKeyValueStore::remove(const std::string& key) {
    if (!validKeyName(key)) {
        spdlog::error("Rejected remove of key '{}'", key);
        return false;
    }

    std::error_code ec;
    std::filesystem::remove(pathFor(key), ec);
    if (ec) {
        spdlog::error("Failed to remove '{}': {}", pathFor(key), ec.message());
        return false;
    }
    return true;
}

std::optional<std::string> FileKeyValueStore::encrypt(const std::string& plain) const {
    const unsigned char* p = reinterpret_cast<const unsigned char*>(plain.data());
    unsigned long long plen = plain.size();

    std::vector<unsigned char> ciphertext(plen + crypto_secretbox_MACBYTES);

    unsigned char nonce[crypto_secretbox_NONCEBYTES];
    randombytes_buf(nonce, sizeof(nonce));

    if (crypto_secretbox_easy(ciphertext.data(), p, plen, nonce, storeKey.data()) != 0) {
        spdlog::error("Encryption failed");
        return std::nullopt;
    }

    std::string out(MAGIC_HDR, sizeof(MAGIC_HDR) - 1);
    out.append(reinterpret_cast<const char*>(nonce), sizeof(nonce));
    out.append(reinterpret_cast<const char*>(ciphertext.data()), ciphertext.size());
    return out;
}

std::optional<std::string> FileKeyValueStore::decrypt(const std::string& raw, const std::string& filename) const {
    const std::size_t hdr_len = sizeof(MAGIC_HDR) - 1;
    if (raw.size() < hdr_len || std::strncmp(raw.data(), MAGIC_HDR, hdr_len) != 0) {
        spdlog::error("Invalid magic header in '{}'", filename);
        return std::nullopt;
    }

    if (raw.size() < hdr_len + crypto_secretbox_NONCEBYTES) {
        spdlog::error("Failed to read nonce from '{}'", filename);
        return std::nullopt;
    }
    const unsigned char* nonce = reinterpret_cast<const unsigned char*>(raw.data() + hdr_len);

    const std::size_t offset = hdr_len + crypto_secretbox_NONCEBYTES;
    const unsigned char* ciphertext = reinterpret_cast<const unsigned char*>(raw.data() + offset);
    unsigned long long clen = raw.size() - offset;

    if (clen < crypto_secretbox_MACBYTES) {
        spdlog::error("Ciphertext too short in '{}'", filename);
        return std::nullopt;
    }

    std::vector<unsigned char> plain(clen - crypto_secretbox_MACBYTES);
    if (crypto_secretbox_open_easy(plain.data(), ciphertext, clen, nonce, storeKey.data()) != 0) {
        spdlog::error("Decryption of '{}' failed", filename);
        return std::nullopt;
    }

    return std::string(reinterpret_cast<const char*>(plain.data()), plain.size());
}
