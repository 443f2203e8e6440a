#include "peersend/crypto/crypto_provider.hpp"
#include "peersend/crypto/random.hpp"
#include <sodium.h>
#include <algorithm>
#include <stdexcept>

namespace peersend::crypto {

namespace {
    constexpr std::string_view SESSION_KEY_SALT = "peersend-session-v1";
    
    std::span<const std::uint8_t> as_bytes(std::string_view text) {
        return std::span(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    }
}

struct CryptoProvider::Impl {
    Impl() {
        if (!SecureRandom::initialize()) {
            throw std::runtime_error("Failed to initialize libsodium for crypto provider");
        }
    }
    
    // RFC 5869 with HMAC-SHA256, single output block
    static void hkdf_sha256(
        std::span<const std::uint8_t> input_key_material,
        std::span<const std::uint8_t> salt,
        std::span<const std::uint8_t> info,
        std::span<std::uint8_t> output_key
    ) {
        // HKDF-Extract: PRK = HMAC-Hash(salt, IKM)
        crypto_auth_hmacsha256_state extract_state;
        std::array<std::uint8_t, crypto_auth_hmacsha256_BYTES> prk;
        
        crypto_auth_hmacsha256_init(&extract_state, salt.data(), salt.size());
        crypto_auth_hmacsha256_update(&extract_state, input_key_material.data(), input_key_material.size());
        crypto_auth_hmacsha256_final(&extract_state, prk.data());
        
        // HKDF-Expand: OKM = HMAC-Hash(PRK, info || 0x01)
        crypto_auth_hmacsha256_state expand_state;
        crypto_auth_hmacsha256_init(&expand_state, prk.data(), prk.size());
        crypto_auth_hmacsha256_update(&expand_state, info.data(), info.size());
        
        std::uint8_t counter = 0x01;
        crypto_auth_hmacsha256_update(&expand_state, &counter, 1);
        
        std::array<std::uint8_t, crypto_auth_hmacsha256_BYTES> expanded;
        crypto_auth_hmacsha256_final(&expand_state, expanded.data());
        
        size_t copy_size = std::min(output_key.size(), expanded.size());
        std::copy(expanded.begin(), expanded.begin() + copy_size, output_key.begin());
        
        sodium_memzero(prk.data(), prk.size());
        sodium_memzero(expanded.data(), expanded.size());
        sodium_memzero(&extract_state, sizeof(extract_state));
        sodium_memzero(&expand_state, sizeof(expand_state));
    }
};

CryptoProvider::CryptoProvider() 
    : impl_(std::make_unique<Impl>()) {
}

CryptoProvider::~CryptoProvider() = default;

SymmetricKey CryptoProvider::generate_key() const {
    return SecureRandom::generate_key();
}

Nonce CryptoProvider::generate_iv() const {
    return SecureRandom::generate_nonce();
}

std::string CryptoProvider::compute_fingerprint(std::span<const std::uint8_t> key) const {
    Sha256Hash hash;
    crypto_hash_sha256(hash.data(), key.data(), key.size());
    
    constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
    std::string encoded(sodium_base64_ENCODED_LEN(FINGERPRINT_BYTES, variant), '\0');
    sodium_bin2base64(encoded.data(), encoded.size(), hash.data(), FINGERPRINT_BYTES, variant);
    
    // Drop the terminating NUL written by libsodium
    encoded.resize(std::char_traits<char>::length(encoded.c_str()));
    return encoded;
}

CryptoResult CryptoProvider::encrypt(std::span<const std::uint8_t> data,
                                     std::span<const std::uint8_t> key,
                                     std::vector<std::uint8_t>& out_encrypted) const {
    if (key.size() != SYMMETRIC_KEY_SIZE) {
        return CryptoResult(CryptoError::INVALID_KEY, "Key must be 32 bytes");
    }
    
    Nonce nonce;
    auto nonce_result = SecureRandom::generate_bytes(std::span(nonce));
    if (!nonce_result) {
        return nonce_result;
    }
    
    out_encrypted.resize(NONCE_SIZE + data.size() + AEAD_TAG_SIZE);
    std::copy(nonce.begin(), nonce.end(), out_encrypted.begin());
    
    unsigned long long ciphertext_len = 0;
    int result = crypto_aead_chacha20poly1305_ietf_encrypt(
        out_encrypted.data() + NONCE_SIZE,
        &ciphertext_len,
        data.data(),
        data.size(),
        nullptr,
        0,
        nullptr,  // nsec (not used)
        nonce.data(),
        key.data()
    );
    
    if (result != 0) {
        out_encrypted.clear();
        return CryptoResult(CryptoError::ENCRYPTION_FAILED, "ChaCha20-Poly1305 encryption failed");
    }
    
    out_encrypted.resize(NONCE_SIZE + ciphertext_len);
    return CryptoResult();
}

CryptoResult CryptoProvider::decrypt(std::span<const std::uint8_t> encrypted,
                                     std::span<const std::uint8_t> key,
                                     std::vector<std::uint8_t>& out_plaintext) const {
    out_plaintext.clear();
    
    if (encrypted.size() < NONCE_SIZE) {
        return CryptoResult(CryptoError::INVALID_LENGTH, "Encrypted data shorter than nonce");
    }
    if (encrypted.size() < NONCE_SIZE + AEAD_TAG_SIZE) {
        return CryptoResult(CryptoError::INVALID_LENGTH, "Encrypted data has no room for tag");
    }
    if (key.size() != SYMMETRIC_KEY_SIZE) {
        return CryptoResult(CryptoError::INVALID_KEY, "Key must be 32 bytes");
    }
    
    auto nonce = encrypted.first(NONCE_SIZE);
    auto ciphertext = encrypted.subspan(NONCE_SIZE);
    
    std::vector<std::uint8_t> plaintext(ciphertext.size() - AEAD_TAG_SIZE);
    unsigned long long plaintext_len = 0;
    
    int result = crypto_aead_chacha20poly1305_ietf_decrypt(
        plaintext.data(),
        &plaintext_len,
        nullptr,  // nsec (not used)
        ciphertext.data(),
        ciphertext.size(),
        nullptr,
        0,
        nonce.data(),
        key.data()
    );
    
    if (result != 0) {
        sodium_memzero(plaintext.data(), plaintext.size());
        return CryptoResult(CryptoError::DECRYPTION_FAILED, "ChaCha20-Poly1305 decryption failed");
    }
    
    plaintext.resize(plaintext_len);
    out_plaintext = std::move(plaintext);
    return CryptoResult();
}

Signature CryptoProvider::sign(std::span<const std::uint8_t> data,
                               std::span<const std::uint8_t> key) const {
    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);
    crypto_hash_sha256_update(&state, key.data(), key.size());
    crypto_hash_sha256_update(&state, data.data(), data.size());
    
    Signature signature;
    crypto_hash_sha256_final(&state, signature.data());
    return signature;
}

bool CryptoProvider::verify(std::span<const std::uint8_t> data,
                            std::span<const std::uint8_t> key,
                            std::span<const std::uint8_t> signature) const {
    if (signature.size() != SIGNATURE_SIZE) {
        return false;
    }
    
    auto expected = sign(data, key);
    return sodium_memcmp(expected.data(), signature.data(), SIGNATURE_SIZE) == 0;
}

CryptoResult CryptoProvider::derive_session_key(std::span<const std::uint8_t> shared_secret,
                                                const std::string& session_id,
                                                SymmetricKey& out_key) const {
    if (shared_secret.empty()) {
        return CryptoResult(CryptoError::INVALID_KEY, "Shared secret is empty");
    }
    
    Impl::hkdf_sha256(shared_secret, as_bytes(SESSION_KEY_SALT), as_bytes(session_id), std::span(out_key));
    return CryptoResult();
}

void CryptoProvider::clear_key(std::span<std::uint8_t> key) {
    if (!key.empty()) {
        sodium_memzero(key.data(), key.size());
    }
}

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::string hex(bytes.size() * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), bytes.data(), bytes.size());
    hex.pop_back();
    return hex;
}

bool from_hex(const std::string& hex, std::span<std::uint8_t> out) {
    if (hex.size() != out.size() * 2) {
        return false;
    }
    
    size_t decoded = 0;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(),
                       nullptr, &decoded, nullptr) != 0) {
        return false;
    }
    return decoded == out.size();
}

}
