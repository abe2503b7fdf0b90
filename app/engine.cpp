// ============================================================
// engine.cpp -- Session registry and component wiring
// ============================================================

#include "engine.hpp"
#include "../sender/manifest_builder.hpp"
#include "../sender/send_coordinator.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <cstdlib>
#include <stdexcept>

Engine::Engine(EngineConfig cfg)
    : cfg_(std::move(cfg))
    , gate_(cfg_.decision_timeout_ms)
    , discovery_(cfg_)
{
    cfg_.validate();
    display_name_ = cfg_.display_name.empty() ? platform::host_name() : cfg_.display_name;
    if (display_name_.size() > MAX_DISPLAY_NAME) display_name_.resize(MAX_DISPLAY_NAME);
}

Engine::~Engine() {
    stop_receiving();

    std::vector<std::shared_ptr<TransferSession>> live;
    {
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& kv : sessions_) live.push_back(kv.second.session);
    }
    for (auto& s : live) {
        if (!is_terminal(s->state())) s->request_cancel();
    }

    std::map<u64, Entry> entries;
    {
        std::lock_guard<std::mutex> lk(mu_);
        entries.swap(sessions_);
    }
    for (auto& kv : entries) {
        if (kv.second.thread.joinable()) kv.second.thread.join();
    }
    discovery_.stop();
}

// ---------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------

std::vector<PeerRecord> Engine::discover_peers() {
    if (!discovery_.listening()) discovery_.start_listening();
    return discovery_.snapshot_peers();
}

// ---------------------------------------------------------------
// Sending
// ---------------------------------------------------------------

u64 Engine::send_files(const std::string& peer,
                       const std::vector<std::string>& paths,
                       const SendOptions& opts) {
    std::string ip = peer;
    u16 port = cfg_.listen_port;
    size_t colon = peer.rfind(':');
    if (colon != std::string::npos) {
        ip = peer.substr(0, colon);
        int p = std::atoi(peer.substr(colon + 1).c_str());
        if (!utils::validate_port(p)) {
            throw std::invalid_argument("Invalid port in peer address: " + peer);
        }
        port = (u16)p;
    }
    if (utils::validate_ip(ip)) {
        PeerRecord rec;
        rec.address = ip;
        rec.port    = port;
        return send_files(rec, paths, opts);
    }

    for (const auto& rec : discover_peers()) {
        if (rec.display_name == peer) return send_files(rec, paths, opts);
    }
    throw std::invalid_argument("Unknown peer: " + peer);
}

u64 Engine::send_files(const PeerRecord& peer,
                       const std::vector<std::string>& paths,
                       const SendOptions& opts) {
    if (paths.empty()) throw std::invalid_argument("Nothing to send");

    EngineConfig cfg = cfg_;
    if (opts.max_workers)            cfg.max_workers            = opts.max_workers;
    if (opts.multi_stream_threshold) cfg.multi_stream_threshold = opts.multi_stream_threshold;
    if (opts.min_chunk_size)         cfg.min_chunk_size         = opts.min_chunk_size;
    cfg.display_name = opts.sender_name.empty() ? display_name_ : opts.sender_name;
    cfg.validate();

    ManifestBuilder builder(cfg);
    for (const auto& p : paths) builder.add(p);
    SendList list = builder.build();

    auto session = std::make_shared<TransferSession>(Direction::SEND, peer.endpoint());
    auto coordinator = std::make_shared<SendCoordinator>(session, std::move(list), cfg, progress_,
                                                         peer.address, peer.port);
    std::thread t([coordinator]() {
        try {
            coordinator->run();
        } catch (const std::exception& e) {
            LOG_ERROR("Send session: " + std::string(e.what()));
        }
    });
    register_session(session, std::move(t));
    return session->id();
}

// ---------------------------------------------------------------
// Receiving
// ---------------------------------------------------------------

void Engine::start_receiving(u16 port, const std::string& display_name, AcceptPolicy policy) {
    if (receiving()) {
        throw std::runtime_error("Already receiving on port " + std::to_string(receive_port()));
    }
    if (!display_name.empty()) {
        display_name_ = display_name.size() > MAX_DISPLAY_NAME
                            ? display_name.substr(0, MAX_DISPLAY_NAME) : display_name;
    }
    gate_.set_policy(policy);

    listener_ = std::make_unique<ConnectionListener>(cfg_, gate_, progress_);
    listener_->set_session_hook([this](std::shared_ptr<TransferSession> s) {
        register_session(std::move(s), std::thread());
    });
    listener_->set_activity_hook([this](u32 active) {
        discovery_.set_status(active > 0 ? PeerStatus::BUSY : PeerStatus::IDLE);
    });
    listener_->serve(cfg_.listen_ip, port);

    try {
        discovery_.start_announcing(display_name_, listener_->port(), cfg_.discovery_interval_ms);
    } catch (const std::exception& e) {
        LOG_WARN("Receiving without announcements: " + std::string(e.what()));
    }
}

void Engine::stop_receiving() {
    discovery_.stop_announcing();
    if (listener_) listener_->stop();
}

bool Engine::receiving() const {
    return listener_ && listener_->running();
}

u16 Engine::receive_port() const {
    return listener_ ? listener_->port() : 0;
}

bool Engine::decide(u64 request_id, Decision d) {
    return gate_.decide(request_id, d);
}

void Engine::set_request_listener(AcceptanceGate::Listener cb) {
    gate_.set_listener(std::move(cb));
}

std::vector<IncomingRequest> Engine::pending_requests() const {
    return gate_.pending();
}

void Engine::set_session_listener(std::function<void(u64)> cb) {
    std::lock_guard<std::mutex> lk(mu_);
    session_listener_ = std::move(cb);
}

// ---------------------------------------------------------------
// Sessions
// ---------------------------------------------------------------

void Engine::register_session(std::shared_ptr<TransferSession> s, std::thread t) {
    u64 id = s->id();
    bool inbound = s->direction() == Direction::RECEIVE;
    std::function<void(u64)> cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        Entry& e  = sessions_[id];
        e.session = std::move(s);
        e.thread  = std::move(t);
        if (inbound) cb = session_listener_;
    }
    if (cb) cb(id);
}

std::shared_ptr<TransferSession> Engine::find(u64 session_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second.session;
}

bool Engine::cancel(u64 session_id) {
    auto s = find(session_id);
    if (!s) return false;
    s->request_cancel();
    // An inbound session may still sit in the gate, or be about to enter it
    while (!s->wait_terminal(POLL_SLICE_MS * 2)) {
        for (const auto& req : gate_.pending()) {
            if (req.session_id == session_id) gate_.decide(req.request_id, Decision::REJECT);
        }
    }
    return true;
}

std::unique_ptr<ProgressSubscription> Engine::subscribe_progress(u64 session_id,
                                                                 ProgressSubscription::Callback cb,
                                                                 u32 interval_ms) {
    return std::make_unique<ProgressSubscription>(progress_, session_id, std::move(cb), interval_ms);
}

ProgressSnapshot Engine::progress(u64 session_id) {
    return progress_.snapshot(session_id);
}

bool Engine::wait(u64 session_id, u32 timeout_ms) {
    auto s = find(session_id);
    if (!s) return false;
    return s->wait_terminal(timeout_ms);
}

SessionReport Engine::report(u64 session_id) const {
    auto s = find(session_id);
    if (!s) throw std::out_of_range("Unknown session " + std::to_string(session_id));
    return s->report();
}

std::vector<u64> Engine::sessions() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<u64> ids;
    for (const auto& kv : sessions_) ids.push_back(kv.first);
    return ids;
}

bool Engine::acknowledge(u64 session_id) {
    std::thread t;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end() || !is_terminal(it->second.session->state())) return false;
        t = std::move(it->second.thread);
        sessions_.erase(it);
    }
    if (t.joinable()) t.join();
    progress_.end(session_id);
    return true;
}
