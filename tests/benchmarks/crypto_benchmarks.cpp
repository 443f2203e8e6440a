#include <benchmark/benchmark.h>
#include "peersend/crypto/crypto_provider.hpp"
#include "peersend/crypto/key_manager.hpp"
#include "peersend/crypto/random.hpp"
#include <memory>
#include <string>
#include <vector>

using namespace peersend::crypto;

class CryptoBenchmarkFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& /*state*/) override {
        key_manager_ = std::make_unique<KeyManager>();
        key_manager_->initialize();
        session_key_ = key_manager_->provider().generate_key();
    }
    
    void TearDown(const ::benchmark::State& /*state*/) override {
        CryptoProvider::clear_key(session_key_);
        key_manager_.reset();
    }
    
protected:
    std::unique_ptr<KeyManager> key_manager_;
    SymmetricKey session_key_{};
};

BENCHMARK_DEFINE_F(CryptoBenchmarkFixture, Encrypt)(benchmark::State& state) {
    std::vector<std::uint8_t> chunk(static_cast<std::size_t>(state.range(0)), 0x42);
    std::vector<std::uint8_t> encrypted;
    
    for (auto _ : state) {
        auto result = key_manager_->provider().encrypt(chunk, session_key_, encrypted);
        benchmark::DoNotOptimize(result);
        benchmark::DoNotOptimize(encrypted.data());
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(CryptoBenchmarkFixture, Encrypt)->Arg(1024)->Arg(64 * 1024)->Arg(1024 * 1024);

BENCHMARK_DEFINE_F(CryptoBenchmarkFixture, Decrypt)(benchmark::State& state) {
    std::vector<std::uint8_t> chunk(static_cast<std::size_t>(state.range(0)), 0x42);
    std::vector<std::uint8_t> encrypted;
    key_manager_->provider().encrypt(chunk, session_key_, encrypted);
    std::vector<std::uint8_t> decrypted;
    
    for (auto _ : state) {
        auto result = key_manager_->provider().decrypt(encrypted, session_key_, decrypted);
        benchmark::DoNotOptimize(result);
        benchmark::DoNotOptimize(decrypted.data());
    }
    
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK_REGISTER_F(CryptoBenchmarkFixture, Decrypt)->Arg(1024)->Arg(64 * 1024)->Arg(1024 * 1024);

BENCHMARK_F(CryptoBenchmarkFixture, IssueToken)(benchmark::State& state) {
    std::string session_id = "0b7f9c1e-4a1f-4b39-9a77-3d2c8c5e6f10";
    
    for (auto _ : state) {
        auto token = key_manager_->issue_token(session_id);
        benchmark::DoNotOptimize(token);
    }
}

BENCHMARK_F(CryptoBenchmarkFixture, VerifyToken)(benchmark::State& state) {
    std::string session_id = "0b7f9c1e-4a1f-4b39-9a77-3d2c8c5e6f10";
    auto token = key_manager_->issue_token(session_id);
    
    for (auto _ : state) {
        bool valid = key_manager_->verify_token(session_id, token);
        benchmark::DoNotOptimize(valid);
    }
}

BENCHMARK_F(CryptoBenchmarkFixture, SessionKeyAgreement)(benchmark::State& state) {
    auto remote = key_manager_->generate_ephemeral_keys();
    
    for (auto _ : state) {
        auto local = key_manager_->generate_ephemeral_keys();
        SymmetricKey derived{};
        auto result = key_manager_->derive_session_key(local.secret_key, remote.public_key,
                                                       "bench-session", derived);
        benchmark::DoNotOptimize(result);
        benchmark::DoNotOptimize(derived);
    }
}

static void RandomGeneration_Key(benchmark::State& state) {
    SecureRandom::initialize();
    for (auto _ : state) {
        auto key = SecureRandom::generate_key();
        benchmark::DoNotOptimize(key);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(SYMMETRIC_KEY_SIZE));
}
BENCHMARK(RandomGeneration_Key);

BENCHMARK_MAIN();
