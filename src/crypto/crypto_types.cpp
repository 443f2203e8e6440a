#include "peersend/crypto/crypto_types.hpp"
#include <sodium.h>

namespace peersend::crypto {

SecureBytes::SecureBytes(size_t size) : data(size) {
    sodium_memzero(data.data(), data.size());
}

SecureBytes::SecureBytes(std::span<const std::uint8_t> bytes) 
    : data(bytes.begin(), bytes.end()) {}

SecureBytes::~SecureBytes() {
    clear();
}

SecureBytes::SecureBytes(SecureBytes&& other) noexcept 
    : data(std::move(other.data)) {
    other.data.clear();
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        clear();
        data = std::move(other.data);
        other.data.clear();
    }
    return *this;
}

void SecureBytes::clear() {
    if (!data.empty()) {
        sodium_memzero(data.data(), data.size());
        data.clear();
    }
}

const char* to_string(CryptoError error) {
    switch (error) {
        case CryptoError::SUCCESS: return "success";
        case CryptoError::INVALID_KEY: return "invalid key";
        case CryptoError::INVALID_LENGTH: return "invalid length";
        case CryptoError::ENCRYPTION_FAILED: return "encryption failed";
        case CryptoError::DECRYPTION_FAILED: return "decryption failed";
        case CryptoError::KEY_GENERATION_FAILED: return "key generation failed";
        case CryptoError::KEY_EXCHANGE_FAILED: return "key exchange failed";
        case CryptoError::BUFFER_TOO_SMALL: return "buffer too small";
        case CryptoError::RANDOM_GENERATION_FAILED: return "random generation failed";
    }
    return "unknown";
}

}
