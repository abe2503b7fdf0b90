#pragma once

// ============================================================
// progress.hpp -- Per-session byte counters, rate and ETA
//
// Workers call update() on the hot path: a shared lock on the
// session map plus one relaxed atomic add. Rate and ETA are only
// computed when someone asks for a snapshot.
// ============================================================

#include "platform.hpp"
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>
#include <utility>

static constexpr u64 RATE_WINDOW_MS = 3000;

struct ProgressSnapshot {
    u64    session_id{0};
    u64    bytes_transferred{0};
    u64    total_bytes{0};
    double rate_bps{0.0};        // over the last RATE_WINDOW_MS
    i64    eta_seconds{-1};      // -1 = unknown
    bool   terminal{false};
    bool   valid{false};         // false for an unknown session
};

class ProgressAggregator {
public:
    ProgressAggregator() = default;
    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    // Register a session; slot 0 is the primary connection, 1..worker_count the workers
    void begin(u64 session_id, u64 total_bytes, u32 worker_count);

    // Thread-safe and non-blocking with respect to other updaters
    void update(u64 session_id, u32 worker_id, u64 delta);

    ProgressSnapshot snapshot(u64 session_id);
    ProgressSnapshot snapshot_at(u64 session_id, u64 now_ms);

    // Mark terminal: later snapshots report terminal=true
    void finish(u64 session_id);

    // Forget the session entirely
    void end(u64 session_id);

    bool contains(u64 session_id) const;

private:
    struct Entry {
        u64 total_bytes{0};
        u32 slot_count{0};
        std::unique_ptr<std::atomic<u64>[]> counters;
        std::atomic<bool> terminal{false};

        std::mutex window_mu;
        std::deque<std::pair<u64, u64>> window;  // (ms, bytes) samples
    };

    std::shared_ptr<Entry> find(u64 session_id) const;

    mutable std::shared_mutex mu_;
    std::unordered_map<u64, std::shared_ptr<Entry>> entries_;
};

// Delivers snapshots of one session to a callback from its own thread
// until the session turns terminal, disappears, or the subscription dies.
class ProgressSubscription {
public:
    using Callback = std::function<void(const ProgressSnapshot&)>;

    ProgressSubscription(ProgressAggregator& agg, u64 session_id, Callback cb, u32 interval_ms);
    ~ProgressSubscription();

    ProgressSubscription(const ProgressSubscription&) = delete;
    ProgressSubscription& operator=(const ProgressSubscription&) = delete;

    void stop();
    bool active() const { return active_.load(); }

private:
    void run();

    ProgressAggregator&     agg_;
    u64                     session_id_;
    Callback                cb_;
    u32                     interval_ms_;
    std::atomic<bool>       stop_{false};
    std::atomic<bool>       active_{true};
    std::mutex              mu_;
    std::condition_variable cv_;
    std::thread             thread_;
};
