#pragma once

#include "peersend/crypto/crypto_types.hpp"
#include "peersend/crypto/crypto_provider.hpp"
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace peersend::crypto {

// Owns the per-device secret and performs per-session key agreement.
class KeyManager {
public:
    KeyManager();
    ~KeyManager();
    
    KeyManager(const KeyManager&) = delete;
    KeyManager& operator=(const KeyManager&) = delete;
    
    bool initialize();
    void cleanup();
    bool is_initialized() const { return initialized_; }
    
    const std::string& fingerprint() const { return fingerprint_; }
    
    // Opaque token bound to a session id; only this device can verify it.
    std::string issue_token(const std::string& session_id) const;
    bool verify_token(const std::string& session_id, const std::string& token) const;
    
    X25519KeyPair generate_ephemeral_keys() const;
    
    CryptoResult derive_session_key(const X25519SecretKey& our_secret,
                                    const X25519PublicKey& their_public,
                                    const std::string& session_id,
                                    SymmetricKey& out_key) const;
    
    static std::string public_key_to_string(const X25519PublicKey& key);
    static std::optional<X25519PublicKey> public_key_from_string(const std::string& str);
    
    const CryptoProvider& provider() const { return provider_; }

private:
    CryptoProvider provider_;
    SecureBytes device_key_;
    std::string fingerprint_;
    bool initialized_;
    mutable std::mutex mutex_;
};

}
