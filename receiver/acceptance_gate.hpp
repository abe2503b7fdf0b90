#pragma once

// ============================================================
// acceptance_gate.hpp -- Blocking accept/reject slot per request
//
// submit() parks the calling connection handler until decide()
// resolves the request, the timeout expires, or shutdown() runs.
// Discovery and other connections are never blocked by it.
// ============================================================

#include "../common/platform.hpp"
#include "../common/envelope.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class Decision : u8 {
    ACCEPT  = 0,
    REJECT  = 1,
    TIMEOUT = 2,
};

enum class AcceptPolicy : u8 {
    ASK         = 0,  // consumer calls decide()
    AUTO_ACCEPT = 1,
    AUTO_REJECT = 2,
};

const char* decision_name(Decision d);

struct IncomingRequest {
    u64              request_id{0};
    u64              session_id{0};   // receive session waiting on this request
    std::string      peer_addr;
    std::string      sender_name;
    TransferManifest manifest;
    u64              total_bytes{0};
};

class AcceptanceGate {
public:
    using Listener = std::function<void(const IncomingRequest&)>;

    explicit AcceptanceGate(u32 timeout_ms);

    AcceptanceGate(const AcceptanceGate&) = delete;
    AcceptanceGate& operator=(const AcceptanceGate&) = delete;

    void set_policy(AcceptPolicy p) { policy_ = p; }
    AcceptPolicy policy() const { return policy_.load(); }
    u32 timeout_ms() const { return timeout_ms_; }

    // Called (outside any lock) once for every request that waits on a decision
    void set_listener(Listener cb);

    // Assigns req.request_id and blocks until a decision, the timeout or shutdown
    Decision submit(IncomingRequest& req);

    // Resolve a pending request with ACCEPT or REJECT.
    // Returns false for unknown, already resolved or timed-out requests.
    bool decide(u64 request_id, Decision d);

    std::vector<IncomingRequest> pending() const;

    // Reject everything pending and every later submit until reopen()
    void shutdown();
    void reopen();

private:
    struct Slot {
        IncomingRequest req;
        bool            decided{false};
        Decision        decision{Decision::REJECT};
    };

    std::atomic<AcceptPolicy> policy_{AcceptPolicy::ASK};
    const u32                 timeout_ms_;
    std::atomic<u64>          next_id_{1};

    mutable std::mutex                 mu_;
    std::condition_variable            cv_;
    std::map<u64, std::shared_ptr<Slot>> slots_;
    bool                               shut_{false};
    Listener                           listener_;
};
