// ============================================================
// test_discovery.cpp -- Peer table, expiry and loopback discovery
// ============================================================

#include "../discovery/discovery_service.hpp"
#include "../common/presence.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <random>
#include <thread>

static EngineConfig discovery_config(u32 interval_ms) {
    EngineConfig cfg;
    cfg.discovery_interval_ms = interval_ms;
    cfg.broadcast_addr        = "127.0.0.1";
    cfg.discovery_port        = (u16)(42000 + std::random_device{}() % 2000);
    return cfg;
}

static std::vector<u8> datagram(const std::string& name, u16 port, u64 instance,
                                PeerStatus status = PeerStatus::IDLE) {
    Presence p;
    p.display_name = name;
    p.listen_port  = port;
    p.instance_id  = instance;
    p.status       = status;
    return proto::encode_presence(p);
}

TEST(DiscoveryTest, IngestUpsertsByAddressAndPort) {
    DiscoveryService d(discovery_config(1000));
    auto a = datagram("alpha", 12345, 11);
    auto b = datagram("beta", 12345, 22);

    EXPECT_TRUE(d.ingest(a.data(), a.size(), "10.0.0.5", 1000));
    EXPECT_TRUE(d.ingest(b.data(), b.size(), "10.0.0.6", 1000));
    auto renamed = datagram("alpha-renamed", 12345, 11, PeerStatus::BUSY);
    EXPECT_TRUE(d.ingest(renamed.data(), renamed.size(), "10.0.0.5", 1500));

    auto peers = d.snapshot_peers_at(1600);
    ASSERT_EQ(peers.size(), 2u);
    EXPECT_EQ(peers[0].endpoint(), "10.0.0.5:12345");
    EXPECT_EQ(peers[0].display_name, "alpha-renamed");
    EXPECT_EQ(peers[0].status, PeerStatus::BUSY);
    EXPECT_EQ(peers[0].last_seen_ms, 1500u);
    EXPECT_EQ(peers[1].display_name, "beta");
}

TEST(DiscoveryTest, PeerExpiresAfterTwiceTheInterval) {
    DiscoveryService d(discovery_config(500));
    auto a = datagram("quiet", 12345, 33);
    ASSERT_TRUE(d.ingest(a.data(), a.size(), "10.0.0.7", 10000));

    EXPECT_EQ(d.snapshot_peers_at(10000 + 1000).size(), 1u);   // exactly 2x: still fresh
    EXPECT_TRUE(d.snapshot_peers_at(10000 + 1001).empty());
    // Expiry removed it from the table, not just from one snapshot
    EXPECT_TRUE(d.snapshot_peers_at(10000).empty());
}

TEST(DiscoveryTest, DropsMalformedAndOwnDatagrams) {
    DiscoveryService d(discovery_config(1000));
    std::vector<u8> junk = {'h', 'e', 'l', 'l', 'o'};
    EXPECT_FALSE(d.ingest(junk.data(), junk.size(), "10.0.0.8", 1));

    auto own = datagram("me", 12345, d.instance_id());
    EXPECT_FALSE(d.ingest(own.data(), own.size(), "127.0.0.1", 1));
    EXPECT_TRUE(d.snapshot_peers_at(1).empty());
}

TEST(DiscoveryTest, LoopbackAnnouncementIsSeenThenExpires) {
    EngineConfig cfg = discovery_config(50);
    DiscoveryService listener(cfg);
    DiscoveryService announcer(cfg);

    listener.start_listening();
    announcer.start_announcing("bob", 4242, 50);

    ASSERT_TRUE(testutil::eventually([&] {
        auto peers = listener.snapshot_peers();
        return peers.size() == 1 && peers[0].display_name == "bob" && peers[0].port == 4242;
    }, 3000));

    announcer.set_status(PeerStatus::BUSY);
    EXPECT_TRUE(testutil::eventually([&] {
        auto peers = listener.snapshot_peers();
        return !peers.empty() && peers[0].status == PeerStatus::BUSY;
    }, 3000));

    // No goodbye message: silence alone removes the peer
    announcer.stop();
    EXPECT_TRUE(testutil::eventually([&] { return listener.snapshot_peers().empty(); }, 3000));
}

TEST(DiscoveryTest, StopReturnsPromptly) {
    DiscoveryService d(discovery_config(10000));
    d.start_listening();
    d.start_announcing("idle", 12345, 10000);
    auto t0 = std::chrono::steady_clock::now();
    d.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::milliseconds(1000));
    EXPECT_FALSE(d.listening());
    EXPECT_FALSE(d.announcing());
}
