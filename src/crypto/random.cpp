#include "peersend/crypto/random.hpp"
#include "peersend/core/logger.hpp"
#include <sodium.h>
#include <stdexcept>

namespace peersend::crypto {

std::atomic<bool> SecureRandom::initialized_{false};

bool SecureRandom::initialize() {
    if (initialized_) {
        return true;
    }
    
    if (sodium_init() < 0) {
        LOG_ERROR("Failed to initialize libsodium");
        return false;
    }
    
    if (!initialized_.exchange(true)) {
        LOG_DEBUG("Cryptographic random number generator initialized");
    }
    return true;
}

CryptoResult SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialize()) {
        return CryptoResult(CryptoError::RANDOM_GENERATION_FAILED, "Random generator not initialized");
    }
    
    if (output.empty()) {
        return CryptoResult(CryptoError::BUFFER_TOO_SMALL, "Output buffer is empty");
    }
    
    randombytes_buf(output.data(), output.size());
    return CryptoResult();
}

SecureBytes SecureRandom::generate_bytes(size_t count) {
    SecureBytes result(count);
    auto crypto_result = generate_bytes(result.span());
    if (!crypto_result.success()) {
        throw std::runtime_error("Failed to generate random bytes: " + crypto_result.message);
    }
    return result;
}

SymmetricKey SecureRandom::generate_key() {
    SymmetricKey key;
    auto result = generate_bytes(std::span(key));
    if (!result.success()) {
        throw std::runtime_error("Failed to generate key: " + result.message);
    }
    return key;
}

Nonce SecureRandom::generate_nonce() {
    Nonce nonce;
    auto result = generate_bytes(std::span(nonce));
    if (!result.success()) {
        throw std::runtime_error("Failed to generate nonce: " + result.message);
    }
    return nonce;
}

std::uint32_t SecureRandom::generate_uint32() {
    if (!initialize()) {
        throw std::runtime_error("Random generator not initialized");
    }
    return randombytes_random();
}

}
