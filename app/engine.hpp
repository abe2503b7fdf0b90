#pragma once

// ============================================================
// engine.hpp -- Consumer-facing API of the transfer engine
//
// Owns discovery, the acceptance gate, the inbound listener, the
// progress aggregator and the session registry. Outbound sessions
// run on their own thread; inbound ones on the listener's handler
// thread. Every session stays in the registry until acknowledged.
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/progress.hpp"
#include "../common/session.hpp"
#include "../discovery/discovery_service.hpp"
#include "../receiver/acceptance_gate.hpp"
#include "../receiver/connection_listener.hpp"
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Per-call overrides for send_files(); zero/empty keeps the engine value
struct SendOptions {
    u16         max_workers{0};
    u64         multi_stream_threshold{0};
    u64         min_chunk_size{0};
    std::string sender_name;
};

class Engine {
public:
    explicit Engine(EngineConfig cfg);
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    const EngineConfig& config() const { return cfg_; }
    const std::string& display_name() const { return display_name_; }

    // ---- Discovery ----
    // Starts the discovery listener on first use; returns fresh peers only
    std::vector<PeerRecord> discover_peers();

    // ---- Sending ----
    // 'peer' is "ip", "ip:port" or the display name of a discovered peer.
    // Builds and validates the manifest before returning, so a missing
    // path throws here; the transfer itself runs in the background.
    u64 send_files(const std::string& peer,
                   const std::vector<std::string>& paths,
                   const SendOptions& opts = SendOptions());
    u64 send_files(const PeerRecord& peer,
                   const std::vector<std::string>& paths,
                   const SendOptions& opts = SendOptions());

    // ---- Receiving ----
    // Port 0 binds a free port (see receive_port()). Empty name -> config or host name.
    void start_receiving(u16 port, const std::string& display_name, AcceptPolicy policy);
    void stop_receiving();
    bool receiving() const;
    u16 receive_port() const;

    bool decide(u64 request_id, Decision d);
    void set_request_listener(AcceptanceGate::Listener cb);
    std::vector<IncomingRequest> pending_requests() const;

    // Called once for every inbound session entering the registry
    void set_session_listener(std::function<void(u64 session_id)> cb);

    // ---- Sessions ----
    // Returns once the session is terminal; false for an unknown id
    bool cancel(u64 session_id);

    std::unique_ptr<ProgressSubscription> subscribe_progress(u64 session_id,
                                                             ProgressSubscription::Callback cb,
                                                             u32 interval_ms);
    ProgressSnapshot progress(u64 session_id);

    // True once terminal; timeout_ms 0 waits forever
    bool wait(u64 session_id, u32 timeout_ms);

    // Throws std::out_of_range for an unknown id
    SessionReport report(u64 session_id) const;

    std::vector<u64> sessions() const;

    // Forget a terminal session. False if unknown or still running.
    bool acknowledge(u64 session_id);

private:
    struct Entry {
        std::shared_ptr<TransferSession> session;
        std::thread                      thread;   // outbound sessions only
    };

    std::shared_ptr<TransferSession> find(u64 session_id) const;
    void register_session(std::shared_ptr<TransferSession> s, std::thread t);

    EngineConfig       cfg_;
    std::string        display_name_;
    ProgressAggregator progress_;
    AcceptanceGate     gate_;
    DiscoveryService   discovery_;
    std::unique_ptr<ConnectionListener> listener_;

    mutable std::mutex                  mu_;
    std::map<u64, Entry>                sessions_;
    std::function<void(u64)>            session_listener_;
};
