#include "credential_store.hpp"
#include "../utils/error_handling.hpp"
#include <stdexcept>
#include <memory>
#include <vector>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace trading {

namespace {

constexpr size_t KEY_LENGTH = 32;
constexpr size_t IV_LENGTH = 16;
constexpr size_t TAG_LENGTH = 16;

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

std::vector<unsigned char> base64_decode(const std::string& text) {
    if (text.empty() || text.size() % 4 != 0) {
        throw error_handling::ConnectionError("Stored credential is not valid base64");
    }
    std::vector<unsigned char> out(text.size() / 4 * 3);
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(text.data()),
                                  static_cast<int>(text.size()));
    if (written < 0) {
        throw error_handling::ConnectionError("Stored credential is not valid base64");
    }
    // EVP_DecodeBlock counts padding as output bytes
    size_t padding = 0;
    if (text[text.size() - 1] == '=') padding++;
    if (text[text.size() - 2] == '=') padding++;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

std::string base64_encode(const std::vector<unsigned char>& data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data.data(),
                                  static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

} // namespace

AesGcmDecryptor::AesGcmDecryptor(const std::string& passphrase, const std::string& salt) {
    if (passphrase.empty()) {
        throw std::invalid_argument("AesGcmDecryptor requires a passphrase");
    }
    key_.resize(KEY_LENGTH);
    // scrypt N=16384 r=8 p=1
    if (EVP_PBE_scrypt(passphrase.data(), passphrase.size(),
                       reinterpret_cast<const unsigned char*>(salt.data()), salt.size(),
                       16384, 8, 1, 0,
                       reinterpret_cast<unsigned char*>(&key_[0]), KEY_LENGTH) != 1) {
        throw std::runtime_error("scrypt key derivation failed");
    }
}

std::string AesGcmDecryptor::decrypt(const std::string& ciphertext) const {
    const std::vector<unsigned char> combined = base64_decode(ciphertext);
    if (combined.size() < IV_LENGTH + TAG_LENGTH) {
        throw error_handling::ConnectionError("Stored credential is too short");
    }

    const unsigned char* iv = combined.data();
    const unsigned char* body = combined.data() + IV_LENGTH;
    const size_t body_length = combined.size() - IV_LENGTH - TAG_LENGTH;
    std::vector<unsigned char> tag(combined.end() - TAG_LENGTH, combined.end());

    CipherContext ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to allocate cipher context");
    }

    std::vector<unsigned char> plain(body_length + 16);
    int length = 0;
    int total = 0;
    const auto* key = reinterpret_cast<const unsigned char*>(key_.data());

    bool ok = EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(IV_LENGTH), nullptr) == 1 &&
              EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key, iv) == 1 &&
              EVP_DecryptUpdate(ctx.get(), plain.data(), &length, body, static_cast<int>(body_length)) == 1;
    total = length;
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_LENGTH), tag.data()) == 1 &&
         EVP_DecryptFinal_ex(ctx.get(), plain.data() + total, &length) == 1;

    if (!ok) {
        throw error_handling::ConnectionError("Stored credential could not be decrypted");
    }
    total += length;
    return std::string(reinterpret_cast<const char*>(plain.data()), static_cast<size_t>(total));
}

std::string AesGcmDecryptor::encrypt(const std::string& plaintext) const {
    std::vector<unsigned char> combined(IV_LENGTH + plaintext.size() + 16 + TAG_LENGTH);
    if (RAND_bytes(combined.data(), static_cast<int>(IV_LENGTH)) != 1) {
        throw std::runtime_error("Failed to generate IV");
    }

    CipherContext ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to allocate cipher context");
    }

    int length = 0;
    int total = 0;
    const auto* key = reinterpret_cast<const unsigned char*>(key_.data());
    unsigned char* out = combined.data() + IV_LENGTH;

    bool ok = EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) == 1 &&
              EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(IV_LENGTH), nullptr) == 1 &&
              EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key, combined.data()) == 1 &&
              EVP_EncryptUpdate(ctx.get(), out, &length,
                                reinterpret_cast<const unsigned char*>(plaintext.data()),
                                static_cast<int>(plaintext.size())) == 1;
    total = length;
    ok = ok && EVP_EncryptFinal_ex(ctx.get(), out + total, &length) == 1;
    total += length;
    ok = ok && EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_LENGTH), out + total) == 1;

    if (!ok) {
        throw std::runtime_error("Credential encryption failed");
    }
    combined.resize(IV_LENGTH + static_cast<size_t>(total) + TAG_LENGTH);
    return base64_encode(combined);
}

void InMemoryCredentialStore::add(StoredConnection connection) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = connection.id;
    connections_[id] = std::move(connection);
}

bool InMemoryCredentialStore::remove(const std::string& connection_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.erase(connection_id) > 0;
}

size_t InMemoryCredentialStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

std::optional<StoredConnection> InMemoryCredentialStore::find_connection_by_id(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    return it->second;
}

exchanges::ExchangeCredentials decrypt_credentials(const StoredConnection& connection,
                                                   const ISecretDecryptor& decryptor) {
    exchanges::ExchangeCredentials credentials;
    credentials.api_key = decryptor.decrypt(connection.encrypted_api_key);
    credentials.api_secret = decryptor.decrypt(connection.encrypted_api_secret);
    if (connection.encrypted_passphrase && !connection.encrypted_passphrase->empty()) {
        credentials.passphrase = decryptor.decrypt(*connection.encrypted_passphrase);
    }
    credentials.sandbox = connection.sandbox;
    return credentials;
}

std::string mask_api_key(const std::string& api_key) {
    if (api_key.size() <= 8) {
        return "****";
    }
    return api_key.substr(0, 4) + "****" + api_key.substr(api_key.size() - 4);
}

} // namespace trading
