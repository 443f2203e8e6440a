#pragma once

#include "peersend/crypto/crypto_types.hpp"
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace peersend::crypto {

// Stateless wrapper over libsodium primitives used by the transfer path.
// Encrypted frames are laid out as nonce(12) || ciphertext || tag(16).
class CryptoProvider {
public:
    CryptoProvider();
    ~CryptoProvider();
    
    CryptoProvider(const CryptoProvider&) = delete;
    CryptoProvider& operator=(const CryptoProvider&) = delete;
    
    SymmetricKey generate_key() const;
    Nonce generate_iv() const;
    
    // Base64 of the first 16 bytes of SHA-256(key)
    std::string compute_fingerprint(std::span<const std::uint8_t> key) const;
    
    CryptoResult encrypt(std::span<const std::uint8_t> data,
                         std::span<const std::uint8_t> key,
                         std::vector<std::uint8_t>& out_encrypted) const;
    
    CryptoResult decrypt(std::span<const std::uint8_t> encrypted,
                         std::span<const std::uint8_t> key,
                         std::vector<std::uint8_t>& out_plaintext) const;
    
    // SHA-256(key || data)
    Signature sign(std::span<const std::uint8_t> data,
                   std::span<const std::uint8_t> key) const;
    
    bool verify(std::span<const std::uint8_t> data,
                std::span<const std::uint8_t> key,
                std::span<const std::uint8_t> signature) const;
    
    CryptoResult derive_session_key(std::span<const std::uint8_t> shared_secret,
                                    const std::string& session_id,
                                    SymmetricKey& out_key) const;
    
    static void clear_key(std::span<std::uint8_t> key);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

std::string to_hex(std::span<const std::uint8_t> bytes);
bool from_hex(const std::string& hex, std::span<std::uint8_t> out);

}
