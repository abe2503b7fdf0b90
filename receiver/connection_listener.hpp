#pragma once

// ============================================================
// connection_listener.hpp -- Inbound TCP accept loop
//
// Threading model:
//   accept thread   -> poll-based accept() in short slices
//   handler threads -> one per accepted connection: read the
//                      handshake, ask the AcceptanceGate, then run
//                      the ReceiveCoordinator for that session
//
// Handlers that finish are reaped by the accept loop; stop()
// rejects pending requests, cancels live sessions and joins all.
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/progress.hpp"
#include "../common/session.hpp"
#include "../common/socket.hpp"
#include "acceptance_gate.hpp"
#include <atomic>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

static constexpr u32 HANDSHAKE_TIMEOUT_MS = 8000;

class ConnectionListener {
public:
    // Called for each new receive session, before the gate is consulted
    using SessionHook  = std::function<void(std::shared_ptr<TransferSession>)>;
    // Called with the number of live receive sessions whenever it changes
    using ActivityHook = std::function<void(u32 active)>;

    ConnectionListener(const EngineConfig& cfg, AcceptanceGate& gate, ProgressAggregator& progress);
    ~ConnectionListener();

    ConnectionListener(const ConnectionListener&) = delete;
    ConnectionListener& operator=(const ConnectionListener&) = delete;

    void set_session_hook(SessionHook cb)   { session_hook_  = std::move(cb); }
    void set_activity_hook(ActivityHook cb) { activity_hook_ = std::move(cb); }

    // Bind and start accepting. Port 0 picks a free port (see port()).
    // Throws std::runtime_error when the port cannot be bound.
    void serve(const std::string& ip, u16 port);

    void stop();

    bool running() const { return running_.load(); }
    u16 port() const { return port_; }
    u32 active_sessions() const { return active_.load(); }

private:
    struct Handler {
        std::thread                        thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void accept_loop();
    void handle_connection(TcpSocket sock);
    void run_session(TcpSocket sock, TransferManifest manifest);
    void reap_handlers(bool all);
    void track(const std::shared_ptr<TransferSession>& s);
    void untrack(u64 session_id);

    EngineConfig        cfg_;
    AcceptanceGate&     gate_;
    ProgressAggregator& progress_;
    SessionHook         session_hook_;
    ActivityHook        activity_hook_;

    TcpSocket         listen_sock_{INVALID_SOCKET_VAL};
    u16               port_{0};
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_flag_{false};
    std::atomic<u32>  active_{0};
    std::thread       accept_thread_;

    std::mutex         handlers_mu_;
    std::list<Handler> handlers_;

    std::mutex                                       sessions_mu_;
    std::map<u64, std::weak_ptr<TransferSession>>    sessions_;
};
