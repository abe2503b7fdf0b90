// ============================================================
// progress.cpp -- ProgressAggregator / ProgressSubscription
// ============================================================

#include "progress.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <chrono>
#include <cmath>

// ============================================================
// ProgressAggregator
// ============================================================

void ProgressAggregator::begin(u64 session_id, u64 total_bytes, u32 worker_count) {
    auto e = std::make_shared<Entry>();
    e->total_bytes = total_bytes;
    e->slot_count  = worker_count + 1;
    e->counters    = std::make_unique<std::atomic<u64>[]>(e->slot_count);
    for (u32 i = 0; i < e->slot_count; ++i) e->counters[i].store(0);

    std::unique_lock<std::shared_mutex> lk(mu_);
    entries_[session_id] = std::move(e);
}

std::shared_ptr<ProgressAggregator::Entry> ProgressAggregator::find(u64 session_id) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = entries_.find(session_id);
    if (it == entries_.end()) return nullptr;
    return it->second;
}

void ProgressAggregator::update(u64 session_id, u32 worker_id, u64 delta) {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = entries_.find(session_id);
    if (it == entries_.end()) return;
    Entry& e = *it->second;
    u32 slot = worker_id < e.slot_count ? worker_id : 0;
    e.counters[slot].fetch_add(delta, std::memory_order_relaxed);
}

ProgressSnapshot ProgressAggregator::snapshot(u64 session_id) {
    return snapshot_at(session_id, utils::now_ms());
}

ProgressSnapshot ProgressAggregator::snapshot_at(u64 session_id, u64 now_ms) {
    ProgressSnapshot s;
    s.session_id = session_id;
    auto e = find(session_id);
    if (!e) return s;

    s.valid       = true;
    s.total_bytes = e->total_bytes;
    s.terminal    = e->terminal.load();
    for (u32 i = 0; i < e->slot_count; ++i) {
        s.bytes_transferred += e->counters[i].load(std::memory_order_relaxed);
    }

    {
        std::lock_guard<std::mutex> lk(e->window_mu);
        auto& w = e->window;
        if (w.empty() || w.back().first < now_ms) {
            w.emplace_back(now_ms, s.bytes_transferred);
        } else {
            w.back().second = s.bytes_transferred;
        }
        // Keep one sample at or before the window start as the baseline
        u64 cutoff = now_ms > RATE_WINDOW_MS ? now_ms - RATE_WINDOW_MS : 0;
        while (w.size() >= 2 && w[1].first <= cutoff) w.pop_front();

        const auto& first = w.front();
        const auto& last  = w.back();
        if (last.first > first.first && last.second >= first.second) {
            s.rate_bps = (double)(last.second - first.second) * 1000.0 /
                         (double)(last.first - first.first);
        }
    }

    u64 remaining = s.total_bytes > s.bytes_transferred ? s.total_bytes - s.bytes_transferred : 0;
    if (remaining == 0) {
        s.eta_seconds = 0;
    } else if (s.rate_bps > 0.0) {
        s.eta_seconds = (i64)std::ceil((double)remaining / s.rate_bps);
    }
    return s;
}

void ProgressAggregator::finish(u64 session_id) {
    auto e = find(session_id);
    if (e) e->terminal.store(true);
}

void ProgressAggregator::end(u64 session_id) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    entries_.erase(session_id);
}

bool ProgressAggregator::contains(u64 session_id) const {
    return find(session_id) != nullptr;
}

// ============================================================
// ProgressSubscription
// ============================================================

ProgressSubscription::ProgressSubscription(ProgressAggregator& agg, u64 session_id,
                                           Callback cb, u32 interval_ms)
    : agg_(agg), session_id_(session_id), cb_(std::move(cb)),
      interval_ms_(interval_ms == 0 ? 1 : interval_ms) {
    thread_ = std::thread([this] { run(); });
}

ProgressSubscription::~ProgressSubscription() {
    stop();
}

void ProgressSubscription::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stop_ = true;
    }
    cv_.notify_all();
    if (!thread_.joinable()) return;
    if (thread_.get_id() == std::this_thread::get_id()) {
        // Stopped from inside the callback: run() exits on its own
        thread_.detach();
    } else {
        thread_.join();
    }
}

void ProgressSubscription::run() {
    while (!stop_) {
        ProgressSnapshot snap = agg_.snapshot(session_id_);
        if (!snap.valid) break;
        try {
            cb_(snap);
        } catch (const std::exception& e) {
            LOG_WARN("Progress callback for session " + std::to_string(session_id_) +
                     " threw: " + e.what());
            break;
        }
        if (snap.terminal) break;

        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait_for(lk, std::chrono::milliseconds(interval_ms_), [this] { return stop_.load(); });
    }
    active_ = false;
}
