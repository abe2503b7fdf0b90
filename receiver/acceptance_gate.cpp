// ============================================================
// acceptance_gate.cpp -- Decision slots with timeout
// ============================================================

#include "acceptance_gate.hpp"
#include "../common/logger.hpp"
#include <chrono>

const char* decision_name(Decision d) {
    switch (d) {
        case Decision::ACCEPT:  return "accept";
        case Decision::REJECT:  return "reject";
        case Decision::TIMEOUT: return "timeout";
    }
    return "unknown";
}

AcceptanceGate::AcceptanceGate(u32 timeout_ms)
    : timeout_ms_(timeout_ms) {}

void AcceptanceGate::set_listener(Listener cb) {
    std::lock_guard<std::mutex> lk(mu_);
    listener_ = std::move(cb);
}

Decision AcceptanceGate::submit(IncomingRequest& req) {
    req.request_id = next_id_.fetch_add(1);

    switch (policy_.load()) {
        case AcceptPolicy::AUTO_ACCEPT: return Decision::ACCEPT;
        case AcceptPolicy::AUTO_REJECT: return Decision::REJECT;
        case AcceptPolicy::ASK:         break;
    }

    auto slot = std::make_shared<Slot>();
    slot->req = req;
    Listener cb;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (shut_) return Decision::REJECT;
        slots_[req.request_id] = slot;
        cb = listener_;
    }

    if (cb) {
        try {
            cb(req);
        } catch (const std::exception& e) {
            LOG_WARN("Request listener threw: " + std::string(e.what()));
        }
    }

    std::unique_lock<std::mutex> lk(mu_);
    bool resolved = cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms_),
                                 [&] { return slot->decided || shut_; });
    slots_.erase(req.request_id);
    if (slot->decided) return slot->decision;
    if (resolved) return Decision::REJECT;  // shut down
    LOG_WARN("Request " + std::to_string(req.request_id) + " from " + req.peer_addr +
             " not decided within " + std::to_string(timeout_ms_) + " ms");
    return Decision::TIMEOUT;
}

bool AcceptanceGate::decide(u64 request_id, Decision d) {
    if (d == Decision::TIMEOUT) return false;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = slots_.find(request_id);
        if (it == slots_.end() || it->second->decided) return false;
        it->second->decided  = true;
        it->second->decision = d;
    }
    cv_.notify_all();
    return true;
}

std::vector<IncomingRequest> AcceptanceGate::pending() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<IncomingRequest> out;
    for (const auto& kv : slots_) {
        if (!kv.second->decided) out.push_back(kv.second->req);
    }
    return out;
}

void AcceptanceGate::shutdown() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        shut_ = true;
    }
    cv_.notify_all();
}

void AcceptanceGate::reopen() {
    std::lock_guard<std::mutex> lk(mu_);
    shut_ = false;
}
