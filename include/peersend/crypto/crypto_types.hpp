#pragma once

#include <array>
#include <vector>
#include <span>
#include <string>
#include <cstdint>

namespace peersend::crypto {

constexpr size_t SYMMETRIC_KEY_SIZE = 32;
constexpr size_t NONCE_SIZE = 12;
constexpr size_t AEAD_TAG_SIZE = 16;

constexpr size_t SHA256_HASH_SIZE = 32;
constexpr size_t SIGNATURE_SIZE = SHA256_HASH_SIZE;
constexpr size_t FINGERPRINT_BYTES = 16;

constexpr size_t X25519_PUBLIC_KEY_SIZE = 32;
constexpr size_t X25519_SECRET_KEY_SIZE = 32;

using SymmetricKey = std::array<std::uint8_t, SYMMETRIC_KEY_SIZE>;
using Nonce = std::array<std::uint8_t, NONCE_SIZE>;
using Sha256Hash = std::array<std::uint8_t, SHA256_HASH_SIZE>;
using Signature = std::array<std::uint8_t, SIGNATURE_SIZE>;

using X25519PublicKey = std::array<std::uint8_t, X25519_PUBLIC_KEY_SIZE>;
using X25519SecretKey = std::array<std::uint8_t, X25519_SECRET_KEY_SIZE>;

struct X25519KeyPair {
    X25519PublicKey public_key;
    X25519SecretKey secret_key;
};

// Owns key material and wipes it on destruction
struct SecureBytes {
    std::vector<std::uint8_t> data;
    
    SecureBytes() = default;
    explicit SecureBytes(size_t size);
    SecureBytes(std::span<const std::uint8_t> bytes);
    
    ~SecureBytes();
    
    // Disable copy to prevent key material leakage
    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;
    
    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;
    
    std::uint8_t* data_ptr() { return data.data(); }
    const std::uint8_t* data_ptr() const { return data.data(); }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }
    
    std::span<std::uint8_t> span() { return std::span(data); }
    std::span<const std::uint8_t> span() const { return std::span(data); }
    
    void clear();
};

enum class CryptoError {
    SUCCESS = 0,
    INVALID_KEY,
    INVALID_LENGTH,
    ENCRYPTION_FAILED,
    DECRYPTION_FAILED,
    KEY_GENERATION_FAILED,
    KEY_EXCHANGE_FAILED,
    BUFFER_TOO_SMALL,
    RANDOM_GENERATION_FAILED
};

const char* to_string(CryptoError error);

struct CryptoResult {
    CryptoError error;
    std::string message;
    
    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

}
