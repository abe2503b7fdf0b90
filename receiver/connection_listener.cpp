// ============================================================
// connection_listener.cpp -- Accept loop and per-connection handlers
// ============================================================

#include "connection_listener.hpp"
#include "receive_coordinator.hpp"
#include "../common/chunk_plan.hpp"
#include "../common/envelope.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <chrono>

static constexpr int ACCEPT_SLICE_MS = 200;

ConnectionListener::ConnectionListener(const EngineConfig& cfg,
                                       AcceptanceGate& gate,
                                       ProgressAggregator& progress)
    : cfg_(cfg), gate_(gate), progress_(progress) {}

ConnectionListener::~ConnectionListener() {
    stop();
}

void ConnectionListener::serve(const std::string& ip, u16 port) {
    if (running_.load()) {
        throw std::runtime_error("listener already serving on port " + std::to_string(port_));
    }
    stop_flag_.store(false);

    TcpSocket sock;
    sock.bind_and_listen(ip, port);
    sock.set_cancel_flag(&stop_flag_);
    listen_sock_ = std::move(sock);
    port_ = listen_sock_.local_port();

    gate_.reopen();
    running_.store(true);
    accept_thread_ = std::thread([this]() { accept_loop(); });

    LOG_INFO("Listening for transfers on " + ip + ":" + std::to_string(port_));
}

void ConnectionListener::stop() {
    if (!running_.exchange(false)) return;

    stop_flag_.store(true);
    gate_.shutdown();
    {
        std::lock_guard<std::mutex> lk(sessions_mu_);
        for (auto& kv : sessions_) {
            if (auto s = kv.second.lock()) s->request_cancel();
        }
    }

    if (accept_thread_.joinable()) accept_thread_.join();
    reap_handlers(true);
    listen_sock_.close();
    LOG_INFO("Listener on port " + std::to_string(port_) + " stopped");
}

// ---------------------------------------------------------------
// accept_loop
//   Never blocks on a single peer: every accepted socket gets its
//   own handler thread, finished handlers are joined here.
// ---------------------------------------------------------------
void ConnectionListener::accept_loop() {
    while (!stop_flag_.load()) {
        try {
            TcpSocket sock = listen_sock_.accept(ACCEPT_SLICE_MS);
            reap_handlers(false);
            if (!sock.is_valid()) continue;

            LOG_DEBUG("Accepted connection from " + sock.peer_addr());
            auto done = std::make_shared<std::atomic<bool>>(false);
            std::lock_guard<std::mutex> lk(handlers_mu_);
            handlers_.push_back(Handler{
                std::thread([this, done, s = std::move(sock)]() mutable {
                    handle_connection(std::move(s));
                    done->store(true);
                }),
                done});
        } catch (const TransferError& e) {
            if (e.code() == ErrorCode::CANCELLED || stop_flag_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
            std::this_thread::sleep_for(std::chrono::milliseconds(ACCEPT_SLICE_MS));
        } catch (const std::exception& e) {
            if (stop_flag_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
            std::this_thread::sleep_for(std::chrono::milliseconds(ACCEPT_SLICE_MS));
        }
    }
}

void ConnectionListener::reap_handlers(bool all) {
    std::list<Handler> finished;
    {
        std::lock_guard<std::mutex> lk(handlers_mu_);
        auto it = handlers_.begin();
        while (it != handlers_.end()) {
            auto next = std::next(it);
            if (all || it->done->load()) finished.splice(finished.end(), handlers_, it);
            it = next;
        }
    }
    for (auto& h : finished) {
        if (h.thread.joinable()) h.thread.join();
    }
}

// ---------------------------------------------------------------
// handle_connection
//   Reads the handshake under HANDSHAKE_TIMEOUT_MS. Anything that
//   does not decode is logged and the connection is dropped.
// ---------------------------------------------------------------
void ConnectionListener::handle_connection(TcpSocket sock) {
    std::string peer = sock.peer_addr();
    TransferManifest manifest;
    try {
        sock.tune();
        sock.set_cancel_flag(&stop_flag_);
        sock.set_idle_timeout_ms(HANDSHAKE_TIMEOUT_MS);
        manifest = proto::read_handshake(sock);
    } catch (const TransferError& e) {
        if (e.code() != ErrorCode::CANCELLED) {
            LOG_WARN("Dropping connection from " + peer + ": " + e.what());
        }
        return;
    }

    try {
        run_session(std::move(sock), std::move(manifest));
    } catch (const std::exception& e) {
        LOG_ERROR("Receive session from " + peer + ": " + e.what());
    }
}

void ConnectionListener::run_session(TcpSocket sock, TransferManifest manifest) {
    auto session = std::make_shared<TransferSession>(Direction::RECEIVE, sock.peer_addr());
    session->set_manifest(manifest);
    session->set_peer_name(manifest.sender_name);
    progress_.begin(session->id(), manifest.total_bytes(),
                    (u32)chunk_plan::plan(manifest, 0).size());
    track(session);
    if (session_hook_) session_hook_(session);

    LOG_INFO("Session " + std::to_string(session->id()) + ": '" + manifest.sender_name + "' at " +
             session->peer_addr() + " offers " + std::to_string(manifest.files.size()) +
             " entries (" + utils::format_bytes(manifest.total_bytes()) + ")");

    IncomingRequest req;
    req.session_id  = session->id();
    req.peer_addr   = session->peer_addr();
    req.sender_name = manifest.sender_name;
    req.manifest    = manifest;
    req.total_bytes = manifest.total_bytes();

    Decision decision = Decision::REJECT;
    std::string oversized;
    if (cfg_.max_file_size > 0) {
        for (const auto& f : manifest.files) {
            if (f.size > cfg_.max_file_size) { oversized = f.rel_path; break; }
        }
    }
    if (!oversized.empty()) {
        LOG_INFO("Session " + std::to_string(session->id()) + ": '" + oversized +
                 "' exceeds the size limit of " + utils::format_bytes(cfg_.max_file_size));
    } else {
        // Tell the sender how long the decision may take before blocking on it
        Reply pending;
        pending.token      = ReplyToken::PENDING;
        pending.wait_ms    = gate_.timeout_ms();
        pending.session_id = session->id();
        try {
            proto::write_reply(sock, pending);
            decision = gate_.submit(req);
        } catch (const TransferError& e) {
            session->fail(e.code(), std::string("announcing pending decision: ") + e.what());
        }
    }

    if (decision == Decision::ACCEPT && !session->failure().is_set()) {
        ReceiveCoordinator coordinator(session, std::move(sock), cfg_, progress_, port_);
        coordinator.run();
        untrack(session->id());
        return;
    }

    Reply reply;
    reply.token      = decision == Decision::TIMEOUT ? ReplyToken::TIMEOUT : ReplyToken::REJECTED;
    reply.session_id = session->id();
    try {
        sock.set_cancel_flag(nullptr);
        proto::write_reply(sock, reply);
    } catch (const std::exception& e) {
        LOG_WARN("Session " + std::to_string(session->id()) + ": could not send reply: " + e.what());
    }

    if (decision == Decision::TIMEOUT) {
        session->fail(ErrorCode::DECISION_TIMEOUT,
                      "no decision within " + std::to_string(cfg_.decision_timeout_ms) + " ms");
    } else if (!oversized.empty()) {
        session->fail(ErrorCode::REJECTED, "'" + oversized + "' exceeds the size limit");
    } else {
        session->fail(ErrorCode::REJECTED, "request rejected");
    }
    sock.close();
    progress_.finish(session->id());
    session->conclude();
    untrack(session->id());
}

void ConnectionListener::track(const std::shared_ptr<TransferSession>& s) {
    {
        std::lock_guard<std::mutex> lk(sessions_mu_);
        sessions_[s->id()] = s;
        // stop() may already have swept the table
        if (stop_flag_.load()) s->request_cancel();
    }
    u32 n = ++active_;
    if (activity_hook_) activity_hook_(n);
}

void ConnectionListener::untrack(u64 session_id) {
    {
        std::lock_guard<std::mutex> lk(sessions_mu_);
        sessions_.erase(session_id);
    }
    u32 n = --active_;
    if (activity_hook_) activity_hook_(n);
}
