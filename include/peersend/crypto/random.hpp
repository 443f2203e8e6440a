#pragma once

#include "peersend/crypto/crypto_types.hpp"
#include <atomic>
#include <span>
#include <vector>

namespace peersend::crypto {

class SecureRandom {
public:
    // Idempotent; every generator below calls it first.
    static bool initialize();
    
    static CryptoResult generate_bytes(std::span<std::uint8_t> output);
    static SecureBytes generate_bytes(size_t count);
    
    static SymmetricKey generate_key();
    static Nonce generate_nonce();
    
    static std::uint32_t generate_uint32();

private:
    static std::atomic<bool> initialized_;
};

}
