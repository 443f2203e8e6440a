#include <gtest/gtest.h>
#include "peersend/crypto/crypto_provider.hpp"
#include "peersend/crypto/key_manager.hpp"
#include "peersend/crypto/random.hpp"
#include <string>
#include <vector>

namespace peersend::crypto::test {

class CryptoProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_unique<CryptoProvider>();
        test_key_ = provider_->generate_key();
    }
    
    static std::vector<std::uint8_t> bytes_of(const std::string& text) {
        return std::vector<std::uint8_t>(text.begin(), text.end());
    }
    
    std::unique_ptr<CryptoProvider> provider_;
    SymmetricKey test_key_;
};

TEST_F(CryptoProviderTest, BasicEncryptionDecryption) {
    auto plaintext = bytes_of("Hello, secure world!");
    
    std::vector<std::uint8_t> encrypted;
    auto result = provider_->encrypt(plaintext, test_key_, encrypted);
    ASSERT_TRUE(result.success());
    
    // nonce || ciphertext || tag
    ASSERT_EQ(encrypted.size(), NONCE_SIZE + plaintext.size() + AEAD_TAG_SIZE);
    
    std::vector<std::uint8_t> decrypted;
    result = provider_->decrypt(encrypted, test_key_, decrypted);
    ASSERT_TRUE(result.success());
    EXPECT_EQ(decrypted, plaintext);
}

TEST_F(CryptoProviderTest, EmptyPlaintextRoundTrips) {
    std::vector<std::uint8_t> empty;
    std::vector<std::uint8_t> encrypted;
    ASSERT_TRUE(provider_->encrypt(empty, test_key_, encrypted));
    EXPECT_EQ(encrypted.size(), NONCE_SIZE + AEAD_TAG_SIZE);
    
    std::vector<std::uint8_t> decrypted{0xFF};
    ASSERT_TRUE(provider_->decrypt(encrypted, test_key_, decrypted));
    EXPECT_TRUE(decrypted.empty());
}

TEST_F(CryptoProviderTest, FreshNoncePerEncryption) {
    auto plaintext = bytes_of("same input");
    
    std::vector<std::uint8_t> first;
    std::vector<std::uint8_t> second;
    ASSERT_TRUE(provider_->encrypt(plaintext, test_key_, first));
    ASSERT_TRUE(provider_->encrypt(plaintext, test_key_, second));
    
    EXPECT_NE(first, second);
}

TEST_F(CryptoProviderTest, AuthenticationFailsWithWrongKey) {
    auto plaintext = bytes_of("Secret message");
    
    std::vector<std::uint8_t> encrypted;
    ASSERT_TRUE(provider_->encrypt(plaintext, test_key_, encrypted));
    
    auto wrong_key = provider_->generate_key();
    std::vector<std::uint8_t> decrypted;
    auto result = provider_->decrypt(encrypted, wrong_key, decrypted);
    
    EXPECT_FALSE(result.success());
    EXPECT_EQ(result.error, CryptoError::DECRYPTION_FAILED);
    EXPECT_TRUE(decrypted.empty());
}

TEST_F(CryptoProviderTest, TamperedCiphertextRejected) {
    auto plaintext = bytes_of("Integrity matters");
    
    std::vector<std::uint8_t> encrypted;
    ASSERT_TRUE(provider_->encrypt(plaintext, test_key_, encrypted));
    
    encrypted[NONCE_SIZE] ^= 0x01;
    
    std::vector<std::uint8_t> decrypted;
    auto result = provider_->decrypt(encrypted, test_key_, decrypted);
    EXPECT_EQ(result.error, CryptoError::DECRYPTION_FAILED);
}

TEST_F(CryptoProviderTest, TruncatedFrameRejected) {
    auto plaintext = bytes_of("Will be cut short");
    
    std::vector<std::uint8_t> encrypted;
    ASSERT_TRUE(provider_->encrypt(plaintext, test_key_, encrypted));
    encrypted.pop_back();
    
    std::vector<std::uint8_t> decrypted;
    EXPECT_EQ(provider_->decrypt(encrypted, test_key_, decrypted).error,
              CryptoError::DECRYPTION_FAILED);
}

TEST_F(CryptoProviderTest, ShortInputsAreLengthErrors) {
    std::vector<std::uint8_t> decrypted;
    
    std::vector<std::uint8_t> five_bytes(5, 0xAB);
    EXPECT_EQ(provider_->decrypt(five_bytes, test_key_, decrypted).error,
              CryptoError::INVALID_LENGTH);
    
    // Holds a nonce but no room for the tag
    for (size_t size = NONCE_SIZE; size < NONCE_SIZE + AEAD_TAG_SIZE; ++size) {
        std::vector<std::uint8_t> frame(size, 0x00);
        EXPECT_EQ(provider_->decrypt(frame, test_key_, decrypted).error,
                  CryptoError::INVALID_LENGTH) << "size " << size;
    }
}

TEST_F(CryptoProviderTest, InvalidKeySizeRejected) {
    auto plaintext = bytes_of("data");
    std::vector<std::uint8_t> short_key(16, 0x42);
    
    std::vector<std::uint8_t> encrypted;
    EXPECT_EQ(provider_->encrypt(plaintext, short_key, encrypted).error,
              CryptoError::INVALID_KEY);
    
    std::vector<std::uint8_t> frame(NONCE_SIZE + AEAD_TAG_SIZE + 4, 0x00);
    std::vector<std::uint8_t> decrypted;
    EXPECT_EQ(provider_->decrypt(frame, short_key, decrypted).error,
              CryptoError::INVALID_KEY);
}

TEST_F(CryptoProviderTest, SignAndVerify) {
    auto data = bytes_of("session-1234");
    auto signature = provider_->sign(data, test_key_);
    
    EXPECT_TRUE(provider_->verify(data, test_key_, signature));
    
    // Deterministic for the same key and data
    EXPECT_EQ(signature, provider_->sign(data, test_key_));
}

TEST_F(CryptoProviderTest, VerifyDetectsAnyBitFlip) {
    auto data = bytes_of("session-1234");
    auto signature = provider_->sign(data, test_key_);
    
    auto flipped_data = data;
    flipped_data[3] ^= 0x10;
    EXPECT_FALSE(provider_->verify(flipped_data, test_key_, signature));
    
    auto flipped_key = test_key_;
    flipped_key[0] ^= 0x01;
    EXPECT_FALSE(provider_->verify(data, flipped_key, signature));
    
    auto flipped_signature = signature;
    flipped_signature[SIGNATURE_SIZE - 1] ^= 0x80;
    EXPECT_FALSE(provider_->verify(data, test_key_, flipped_signature));
    
    std::vector<std::uint8_t> short_signature(signature.begin(), signature.begin() + 16);
    EXPECT_FALSE(provider_->verify(data, test_key_, short_signature));
}

TEST_F(CryptoProviderTest, FingerprintFormat) {
    auto fingerprint = provider_->compute_fingerprint(test_key_);
    
    // Base64 of 16 bytes, padded
    EXPECT_EQ(fingerprint.size(), 24u);
    EXPECT_EQ(fingerprint.substr(22), "==");
    EXPECT_EQ(fingerprint, provider_->compute_fingerprint(test_key_));
    
    auto other_key = provider_->generate_key();
    EXPECT_NE(fingerprint, provider_->compute_fingerprint(other_key));
}

TEST_F(CryptoProviderTest, SessionKeyDerivationIsBoundToSessionId) {
    auto shared_secret = provider_->generate_key();
    
    SymmetricKey first{};
    SymmetricKey again{};
    SymmetricKey other{};
    ASSERT_TRUE(provider_->derive_session_key(shared_secret, "session-a", first));
    ASSERT_TRUE(provider_->derive_session_key(shared_secret, "session-a", again));
    ASSERT_TRUE(provider_->derive_session_key(shared_secret, "session-b", other));
    
    EXPECT_EQ(first, again);
    EXPECT_NE(first, other);
    
    std::vector<std::uint8_t> empty;
    EXPECT_EQ(provider_->derive_session_key(empty, "session-a", first).error,
              CryptoError::INVALID_KEY);
}

TEST_F(CryptoProviderTest, ClearKeyZeroes) {
    auto key = provider_->generate_key();
    CryptoProvider::clear_key(key);
    
    for (auto byte : key) {
        EXPECT_EQ(byte, 0);
    }
}

TEST(HexEncodingTest, RoundTripAndRejection) {
    std::array<std::uint8_t, 4> bytes{0x00, 0x1f, 0xa0, 0xff};
    auto hex = to_hex(bytes);
    EXPECT_EQ(hex, "001fa0ff");
    
    std::array<std::uint8_t, 4> decoded{};
    ASSERT_TRUE(from_hex(hex, decoded));
    EXPECT_EQ(decoded, bytes);
    
    EXPECT_FALSE(from_hex("001fa0", decoded));
    EXPECT_FALSE(from_hex("zz1fa0ff", decoded));
}

TEST(SecureRandomTest, GeneratesDistinctKeys) {
    ASSERT_TRUE(SecureRandom::initialize());
    
    auto first = SecureRandom::generate_key();
    auto second = SecureRandom::generate_key();
    EXPECT_NE(first, second);
    
    auto bytes = SecureRandom::generate_bytes(64);
    EXPECT_EQ(bytes.size(), 64u);
}

class KeyManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(sender_.initialize());
        ASSERT_TRUE(receiver_.initialize());
    }
    
    KeyManager sender_;
    KeyManager receiver_;
};

TEST_F(KeyManagerTest, InitializeProducesFingerprint) {
    EXPECT_TRUE(sender_.is_initialized());
    EXPECT_EQ(sender_.fingerprint().size(), 24u);
    EXPECT_NE(sender_.fingerprint(), receiver_.fingerprint());
    
    // Idempotent
    auto fingerprint = sender_.fingerprint();
    EXPECT_TRUE(sender_.initialize());
    EXPECT_EQ(sender_.fingerprint(), fingerprint);
}

TEST_F(KeyManagerTest, TokensVerifyOnlyOnIssuingDevice) {
    auto token = receiver_.issue_token("session-1");
    ASSERT_EQ(token.size(), SIGNATURE_SIZE * 2);
    
    EXPECT_TRUE(receiver_.verify_token("session-1", token));
    EXPECT_FALSE(receiver_.verify_token("session-2", token));
    EXPECT_FALSE(sender_.verify_token("session-1", token));
    EXPECT_FALSE(receiver_.verify_token("session-1", "not-hex"));
    EXPECT_FALSE(receiver_.verify_token("session-1", ""));
}

TEST_F(KeyManagerTest, CleanupInvalidatesTokens) {
    auto token = receiver_.issue_token("session-1");
    receiver_.cleanup();
    
    EXPECT_FALSE(receiver_.is_initialized());
    EXPECT_FALSE(receiver_.verify_token("session-1", token));
    EXPECT_TRUE(receiver_.issue_token("session-1").empty());
}

TEST_F(KeyManagerTest, BothSidesDeriveTheSameSessionKey) {
    auto sender_keys = sender_.generate_ephemeral_keys();
    auto receiver_keys = receiver_.generate_ephemeral_keys();
    
    SymmetricKey sender_session_key{};
    SymmetricKey receiver_session_key{};
    ASSERT_TRUE(sender_.derive_session_key(
        sender_keys.secret_key, receiver_keys.public_key, "receiver-session", sender_session_key));
    ASSERT_TRUE(receiver_.derive_session_key(
        receiver_keys.secret_key, sender_keys.public_key, "receiver-session", receiver_session_key));
    
    EXPECT_EQ(sender_session_key, receiver_session_key);
    
    // Frames sealed by one side open on the other
    std::vector<std::uint8_t> chunk{1, 2, 3, 4, 5};
    std::vector<std::uint8_t> encrypted;
    ASSERT_TRUE(sender_.provider().encrypt(chunk, sender_session_key, encrypted));
    
    std::vector<std::uint8_t> decrypted;
    ASSERT_TRUE(receiver_.provider().decrypt(encrypted, receiver_session_key, decrypted));
    EXPECT_EQ(decrypted, chunk);
}

TEST_F(KeyManagerTest, DifferentSessionIdGivesDifferentKey) {
    auto sender_keys = sender_.generate_ephemeral_keys();
    auto receiver_keys = receiver_.generate_ephemeral_keys();
    
    SymmetricKey first{};
    SymmetricKey second{};
    ASSERT_TRUE(sender_.derive_session_key(
        sender_keys.secret_key, receiver_keys.public_key, "session-a", first));
    ASSERT_TRUE(sender_.derive_session_key(
        sender_keys.secret_key, receiver_keys.public_key, "session-b", second));
    EXPECT_NE(first, second);
}

TEST_F(KeyManagerTest, LowOrderPublicKeyRejected) {
    auto keys = sender_.generate_ephemeral_keys();
    X25519PublicKey zero_key{};
    
    SymmetricKey session_key{};
    auto result = sender_.derive_session_key(keys.secret_key, zero_key, "session", session_key);
    EXPECT_EQ(result.error, CryptoError::KEY_EXCHANGE_FAILED);
}

TEST_F(KeyManagerTest, PublicKeyStringRoundTrip) {
    auto keys = sender_.generate_ephemeral_keys();
    auto encoded = KeyManager::public_key_to_string(keys.public_key);
    EXPECT_EQ(encoded.size(), X25519_PUBLIC_KEY_SIZE * 2);
    
    auto decoded = KeyManager::public_key_from_string(encoded);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, keys.public_key);
    
    EXPECT_FALSE(KeyManager::public_key_from_string("abcd").has_value());
    EXPECT_FALSE(KeyManager::public_key_from_string(std::string(64, 'x')).has_value());
}

}
