#pragma once

// ============================================================
// discovery_service.hpp -- UDP presence announcer and peer table
//
//   announcer thread -> one presence datagram per interval to the
//                       broadcast address on the discovery port
//   listener thread  -> recv in 200 ms slices, decode, upsert
//
// Peers are keyed by address:port and expire after twice the
// announce interval. Expiry is applied lazily by snapshot_peers().
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/protocol.hpp"
#include "../common/socket.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

struct PeerRecord {
    std::string display_name;
    std::string address;
    u16         port{0};
    PeerStatus  status{PeerStatus::IDLE};
    u64         last_seen_ms{0};   // steady clock
    u64         instance_id{0};

    std::string endpoint() const { return address + ":" + std::to_string(port); }
};

class DiscoveryService {
public:
    explicit DiscoveryService(const EngineConfig& cfg);
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    // Start (or retarget) the announcer. Throws on socket setup failure.
    void start_announcing(const std::string& display_name, u16 listen_port, u32 interval_ms);
    void stop_announcing();

    // Bind the discovery port and start the listener thread
    void start_listening();

    // Fresh peers only; stale entries are dropped from the table
    std::vector<PeerRecord> snapshot_peers();
    std::vector<PeerRecord> snapshot_peers_at(u64 now_ms);

    void set_status(PeerStatus s);
    PeerStatus status() const { return status_.load(); }

    // Stops both threads; returns within one receive slice
    void stop();

    // Listener step for one datagram. Returns true when a peer was upserted.
    bool ingest(const u8* data, size_t len, const std::string& from_ip, u64 now_ms);

    u64 instance_id() const { return instance_id_; }
    u32 interval_ms() const { return interval_ms_.load(); }
    bool announcing() const { return announcer_.joinable(); }
    bool listening() const { return listener_.joinable(); }

private:
    void announce_loop();
    void listen_loop();
    void announce_once();

    EngineConfig      cfg_;
    const u64         instance_id_;
    std::atomic<u32>  interval_ms_;
    std::atomic<PeerStatus> status_{PeerStatus::IDLE};

    // announcer
    std::mutex              ann_mu_;
    std::condition_variable ann_cv_;
    bool                    ann_stop_{false};
    std::string             display_name_;
    u16                     listen_port_{0};
    UdpSocket               tx_;
    std::thread             announcer_;

    // listener
    std::atomic<bool> listen_stop_{false};
    UdpSocket         rx_;
    std::thread       listener_;

    mutable std::mutex                  peers_mu_;
    std::map<std::string, PeerRecord>   peers_;
};
