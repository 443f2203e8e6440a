#include <gtest/gtest.h>
#include "peersend/network/prober.hpp"
#include <boost/asio/steady_timer.hpp>
#include <map>
#include <memory>
#include <set>

namespace peersend::network::test {

// Answers after a short delay so several probes overlap.
class FakeProbeClient : public ProbeClient {
public:
    struct Stats {
        std::vector<std::string> probed;
        std::size_t in_flight = 0;
        std::size_t peak_in_flight = 0;
        std::map<std::string, RegisterMessage> responders;
    };
    
    explicit FakeProbeClient(std::shared_ptr<Stats> stats,
                             std::chrono::milliseconds delay = std::chrono::milliseconds(10))
        : stats_(std::move(stats)), delay_(delay) {}
    
    void async_probe(boost::asio::io_context& io_context,
                     const std::string& ip,
                     std::uint16_t /*port*/,
                     std::chrono::milliseconds /*timeout*/,
                     ProbeHandler handler) override {
        stats_->probed.push_back(ip);
        stats_->peak_in_flight = std::max(stats_->peak_in_flight, ++stats_->in_flight);
        
        auto timer = std::make_shared<boost::asio::steady_timer>(io_context, delay_);
        timer->async_wait([stats = stats_, timer, ip, handler = std::move(handler)](
                              const boost::system::error_code&) {
            --stats->in_flight;
            auto it = stats->responders.find(ip);
            if (it == stats->responders.end()) {
                handler(std::nullopt);
            } else {
                handler(it->second);
            }
        });
    }

private:
    std::shared_ptr<Stats> stats_;
    std::chrono::milliseconds delay_;
};

class ProberTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = core::LocalSendConfig::make_default();
        config_.device_id = "self-device";
        config_.port = 53317;
        stats_ = std::make_shared<FakeProbeClient::Stats>();
    }
    
    std::unique_ptr<Prober> make_prober() {
        return std::make_unique<Prober>(config_, registry_, std::make_unique<FakeProbeClient>(stats_));
    }
    
    static RegisterMessage make_reply(const std::string& id, std::optional<std::uint16_t> port = std::nullopt) {
        RegisterMessage reply;
        reply.id = id;
        reply.device_type = "desktop";
        reply.name = "Peer " + id;
        reply.version = "2.1.0";
        reply.protocol_version = PROTOCOL_VERSION;
        reply.port = port;
        return reply;
    }
    
    core::LocalSendConfig config_;
    DeviceRegistry registry_;
    std::shared_ptr<FakeProbeClient::Stats> stats_;
};

TEST_F(ProberTest, ScansExactlyTheRequestedRange) {
    auto prober = make_prober();
    
    auto found = prober->scan_range("192.168.1.0", 5);
    
    EXPECT_EQ(found, 0u);
    ASSERT_EQ(stats_->probed.size(), 5u);
    std::set<std::string> probed(stats_->probed.begin(), stats_->probed.end());
    std::set<std::string> expected{
        "192.168.1.1", "192.168.1.2", "192.168.1.3", "192.168.1.4", "192.168.1.5"};
    EXPECT_EQ(probed, expected);
    
    // All five ran concurrently and every one resolved before returning
    EXPECT_EQ(stats_->peak_in_flight, 5u);
    EXPECT_EQ(stats_->in_flight, 0u);
}

TEST_F(ProberTest, ConcurrencyIsBounded) {
    config_.max_concurrent_probes = 3;
    auto prober = make_prober();
    
    prober->scan_range("10.0.0.0", 20);
    
    EXPECT_EQ(stats_->probed.size(), 20u);
    EXPECT_EQ(stats_->peak_in_flight, 3u);
    EXPECT_EQ(stats_->in_flight, 0u);
}

TEST_F(ProberTest, RespondersAreRegistered) {
    stats_->responders["192.168.1.2"] = make_reply("peer-a");
    stats_->responders["192.168.1.4"] = make_reply("peer-b", 40000);
    auto prober = make_prober();
    
    EXPECT_EQ(prober->scan_range("192.168.1.0", 5), 2u);
    EXPECT_EQ(registry_.size(), 2u);
    
    auto peer_a = registry_.get_device("peer-a");
    ASSERT_TRUE(peer_a.has_value());
    EXPECT_EQ(peer_a->ip, "192.168.1.2");
    EXPECT_EQ(peer_a->port, 53317);
    
    auto peer_b = registry_.get_device("peer-b");
    ASSERT_TRUE(peer_b.has_value());
    EXPECT_EQ(peer_b->port, 40000);
}

TEST_F(ProberTest, OwnReplyIgnored) {
    stats_->responders["192.168.1.1"] = make_reply("self-device");
    auto prober = make_prober();
    
    EXPECT_EQ(prober->scan_range("192.168.1.0", 2), 0u);
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(ProberTest, MalformedBaseProbesNothing) {
    auto prober = make_prober();
    
    EXPECT_EQ(prober->scan_range("not-an-ip", 10), 0u);
    EXPECT_EQ(prober->scan_range("192.168.1", 10), 0u);
    EXPECT_TRUE(stats_->probed.empty());
}

TEST_F(ProberTest, ZeroRangeProbesNothing) {
    auto prober = make_prober();
    EXPECT_EQ(prober->scan_range("192.168.1.0", 0), 0u);
    EXPECT_TRUE(stats_->probed.empty());
}

TEST_F(ProberTest, CheckDevice) {
    stats_->responders["192.168.1.9"] = make_reply("peer-c");
    auto prober = make_prober();
    
    auto device = prober->check_device("192.168.1.9");
    ASSERT_TRUE(device.has_value());
    EXPECT_EQ(device->id, "peer-c");
    EXPECT_EQ(device->ip, "192.168.1.9");
    
    EXPECT_FALSE(prober->check_device("192.168.1.10").has_value());
}

TEST(ProberCandidatesTest, StopsAtLastOctet) {
    auto candidates = Prober::candidate_addresses("192.168.1.250", 10);
    ASSERT_EQ(candidates.size(), 5u);
    EXPECT_EQ(candidates.front(), "192.168.1.251");
    EXPECT_EQ(candidates.back(), "192.168.1.255");
    
    EXPECT_TRUE(Prober::candidate_addresses("192.168.1.255", 5).empty());
}

TEST(ProberCandidatesTest, OffsetFromBaseOctet) {
    auto candidates = Prober::candidate_addresses("172.16.0.100", 3);
    std::vector<std::string> expected{"172.16.0.101", "172.16.0.102", "172.16.0.103"};
    EXPECT_EQ(candidates, expected);
    
    EXPECT_EQ(Prober::candidate_addresses("10.0.0.0", 255).size(), 255u);
    EXPECT_TRUE(Prober::candidate_addresses("", 5).empty());
}

}
