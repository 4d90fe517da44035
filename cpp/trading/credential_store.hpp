#pragma once
#include "../exchanges/exchange_types.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace trading {

// Credential record as held by the external credential store; secrets are encrypted
struct StoredConnection {
    std::string id;
    std::string user_id;
    std::string exchange;
    std::string encrypted_api_key;
    std::string encrypted_api_secret;
    std::optional<std::string> encrypted_passphrase;
    bool sandbox = false;
};

class ICredentialStore {
public:
    virtual ~ICredentialStore() = default;
    virtual std::optional<StoredConnection> find_connection_by_id(const std::string& connection_id) const = 0;
};

class ISecretDecryptor {
public:
    virtual ~ISecretDecryptor() = default;
    // Throws error_handling::ConnectionError when the ciphertext cannot be decrypted
    virtual std::string decrypt(const std::string& ciphertext) const = 0;
};

// For stores that already hold plaintext (tests, local INI files)
class PlaintextDecryptor : public ISecretDecryptor {
public:
    std::string decrypt(const std::string& ciphertext) const override { return ciphertext; }
};

/**
 * AES-256-GCM secrets as written by the key vault: base64(iv[16] | ciphertext | tag[16]),
 * keyed by scrypt(passphrase, salt).
 */
class AesGcmDecryptor : public ISecretDecryptor {
public:
    AesGcmDecryptor(const std::string& passphrase, const std::string& salt);

    std::string decrypt(const std::string& ciphertext) const override;
    // Inverse of decrypt() with a random IV
    std::string encrypt(const std::string& plaintext) const;

private:
    std::string key_;
};

// Connection records held in process, used by the CLI and tests
class InMemoryCredentialStore : public ICredentialStore {
public:
    void add(StoredConnection connection);
    bool remove(const std::string& connection_id);
    size_t size() const;

    std::optional<StoredConnection> find_connection_by_id(const std::string& connection_id) const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, StoredConnection> connections_;
};

// Decrypts every secret of a stored record
exchanges::ExchangeCredentials decrypt_credentials(const StoredConnection& connection,
                                                   const ISecretDecryptor& decryptor);

// "abcd****wxyz" for display; never log the unmasked key
std::string mask_api_key(const std::string& api_key);

} // namespace trading
