// ============================================================
// discovery_service.cpp -- Presence announcer, listener, peer table
// ============================================================

#include "discovery_service.hpp"
#include "../common/presence.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <chrono>

static constexpr int RECV_SLICE_MS = 200;

DiscoveryService::DiscoveryService(const EngineConfig& cfg)
    : cfg_(cfg)
    , instance_id_(utils::random_instance_id())
    , interval_ms_(cfg.discovery_interval_ms)
{}

DiscoveryService::~DiscoveryService() {
    stop();
}

void DiscoveryService::start_announcing(const std::string& display_name, u16 listen_port,
                                        u32 interval_ms) {
    // Fail fast on a name or port the codec would refuse
    Presence check;
    check.display_name = display_name;
    check.listen_port  = listen_port;
    proto::encode_presence(check);

    {
        std::lock_guard<std::mutex> lk(ann_mu_);
        display_name_ = display_name;
        listen_port_  = listen_port;
    }
    interval_ms_.store(interval_ms);

    if (announcer_.joinable()) {
        ann_cv_.notify_all();  // announce the new identity right away
        return;
    }

    tx_ = UdpSocket();
    tx_.enable_broadcast();
    {
        std::lock_guard<std::mutex> lk(ann_mu_);
        ann_stop_ = false;
    }
    announcer_ = std::thread([this]() { announce_loop(); });
    LOG_INFO("Announcing '" + display_name + "' (port " + std::to_string(listen_port) + ") to " +
             cfg_.broadcast_addr + ":" + std::to_string(cfg_.discovery_port) + " every " +
             std::to_string(interval_ms) + " ms");
}

void DiscoveryService::stop_announcing() {
    {
        std::lock_guard<std::mutex> lk(ann_mu_);
        ann_stop_ = true;
    }
    ann_cv_.notify_all();
    if (announcer_.joinable()) announcer_.join();
    tx_.close();
}

void DiscoveryService::start_listening() {
    if (listener_.joinable()) return;
    rx_ = UdpSocket();
    rx_.bind("0.0.0.0", cfg_.discovery_port);
    listen_stop_.store(false);
    listener_ = std::thread([this]() { listen_loop(); });
    LOG_INFO("Listening for peers on UDP port " + std::to_string(cfg_.discovery_port));
}

void DiscoveryService::stop() {
    stop_announcing();
    listen_stop_.store(true);
    if (listener_.joinable()) listener_.join();
    rx_.close();
}

void DiscoveryService::set_status(PeerStatus s) {
    if (status_.exchange(s) != s) {
        LOG_DEBUG(std::string("Presence status now ") + (s == PeerStatus::BUSY ? "busy" : "idle"));
        ann_cv_.notify_all();
    }
}

void DiscoveryService::announce_once() {
    Presence p;
    {
        std::lock_guard<std::mutex> lk(ann_mu_);
        p.display_name = display_name_;
        p.listen_port  = listen_port_;
    }
    p.status      = status_.load();
    p.instance_id = instance_id_;
    std::vector<u8> dgram = proto::encode_presence(p);
    tx_.send_to(cfg_.broadcast_addr, cfg_.discovery_port, dgram.data(), dgram.size());
}

void DiscoveryService::announce_loop() {
    std::unique_lock<std::mutex> lk(ann_mu_);
    while (!ann_stop_) {
        lk.unlock();
        try {
            announce_once();
        } catch (const std::exception& e) {
            LOG_WARN("Presence announcement failed: " + std::string(e.what()));
        }
        lk.lock();
        // Woken early by stop, a status change or a new identity
        ann_cv_.wait_for(lk, std::chrono::milliseconds(interval_ms_.load()));
    }
}

void DiscoveryService::listen_loop() {
    std::vector<u8> buf(2048);
    while (!listen_stop_.load()) {
        std::string from;
        int n = -1;
        try {
            n = rx_.recv_from(buf.data(), buf.size(), from, RECV_SLICE_MS);
        } catch (const std::exception& e) {
            LOG_WARN("Discovery receive failed: " + std::string(e.what()));
            std::this_thread::sleep_for(std::chrono::milliseconds(RECV_SLICE_MS));
            continue;
        }
        if (n < 0) continue;
        ingest(buf.data(), (size_t)n, from, utils::now_ms());
    }
}

bool DiscoveryService::ingest(const u8* data, size_t len, const std::string& from_ip, u64 now_ms) {
    Presence p;
    try {
        p = proto::decode_presence(data, len);
    } catch (const MalformedDatagram& e) {
        LOG_DEBUG("Ignoring datagram from " + from_ip + ": " + e.what());
        return false;
    }
    if (p.instance_id == instance_id_) return false;

    PeerRecord rec;
    rec.display_name = p.display_name;
    rec.address      = from_ip;
    rec.port         = p.listen_port;
    rec.status       = p.status;
    rec.last_seen_ms = now_ms;
    rec.instance_id  = p.instance_id;

    std::lock_guard<std::mutex> lk(peers_mu_);
    auto it = peers_.find(rec.endpoint());
    if (it == peers_.end()) {
        LOG_INFO("Found peer '" + rec.display_name + "' at " + rec.endpoint());
        peers_.emplace(rec.endpoint(), rec);
    } else {
        it->second = rec;
    }
    return true;
}

std::vector<PeerRecord> DiscoveryService::snapshot_peers() {
    return snapshot_peers_at(utils::now_ms());
}

std::vector<PeerRecord> DiscoveryService::snapshot_peers_at(u64 now_ms) {
    const u64 max_age = 2ull * interval_ms_.load();
    std::vector<PeerRecord> out;
    std::lock_guard<std::mutex> lk(peers_mu_);
    for (auto it = peers_.begin(); it != peers_.end();) {
        u64 age = now_ms > it->second.last_seen_ms ? now_ms - it->second.last_seen_ms : 0;
        if (age > max_age) {
            LOG_DEBUG("Peer '" + it->second.display_name + "' at " + it->first + " expired");
            it = peers_.erase(it);
            continue;
        }
        out.push_back(it->second);
        ++it;
    }
    return out;
}
