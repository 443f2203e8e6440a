#include "peersend/crypto/key_manager.hpp"
#include "peersend/crypto/random.hpp"
#include "peersend/core/logger.hpp"
#include <sodium.h>

namespace peersend::crypto {

namespace {
    std::span<const std::uint8_t> as_bytes(const std::string& text) {
        return std::span(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    }
}

KeyManager::KeyManager() 
    : initialized_(false) {
}

KeyManager::~KeyManager() {
    cleanup();
}

bool KeyManager::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        return true;
    }
    
    if (!SecureRandom::initialize()) {
        LOG_ERROR("Failed to initialize secure random generator");
        return false;
    }
    
    try {
        device_key_ = SecureRandom::generate_bytes(SYMMETRIC_KEY_SIZE);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to generate device key: {}", e.what());
        return false;
    }
    
    fingerprint_ = provider_.compute_fingerprint(device_key_.span());
    initialized_ = true;
    
    LOG_INFO("Key manager initialized with fingerprint: {}", fingerprint_);
    return true;
}

void KeyManager::cleanup() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (initialized_) {
        device_key_.clear();
        fingerprint_.clear();
        initialized_ = false;
    }
}

std::string KeyManager::issue_token(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return {};
    }
    
    auto signature = provider_.sign(as_bytes(session_id), device_key_.span());
    return to_hex(std::span(signature));
}

bool KeyManager::verify_token(const std::string& session_id, const std::string& token) const {
    Signature signature;
    if (!from_hex(token, std::span(signature))) {
        return false;
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return false;
    }
    return provider_.verify(as_bytes(session_id), device_key_.span(), std::span(signature));
}

X25519KeyPair KeyManager::generate_ephemeral_keys() const {
    X25519KeyPair keys;
    crypto_box_keypair(keys.public_key.data(), keys.secret_key.data());
    return keys;
}

CryptoResult KeyManager::derive_session_key(const X25519SecretKey& our_secret,
                                            const X25519PublicKey& their_public,
                                            const std::string& session_id,
                                            SymmetricKey& out_key) const {
    // Perform X25519 key exchange
    std::array<std::uint8_t, crypto_box_BEFORENMBYTES> shared_secret;
    if (crypto_box_beforenm(shared_secret.data(), their_public.data(), our_secret.data()) != 0) {
        return CryptoResult(CryptoError::KEY_EXCHANGE_FAILED, "Peer public key rejected");
    }
    
    auto result = provider_.derive_session_key(std::span(shared_secret), session_id, out_key);
    
    // Clear shared secret
    sodium_memzero(shared_secret.data(), shared_secret.size());
    return result;
}

std::string KeyManager::public_key_to_string(const X25519PublicKey& key) {
    return to_hex(std::span(key));
}

std::optional<X25519PublicKey> KeyManager::public_key_from_string(const std::string& str) {
    X25519PublicKey key;
    if (!from_hex(str, std::span(key))) {
        return std::nullopt;
    }
    return key;
}

}
