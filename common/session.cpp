// ============================================================
// session.cpp -- TransferSession state machine
// ============================================================

#include "session.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <chrono>

std::atomic<u64> TransferSession::next_id_{1};

const char* session_state_name(SessionState s) {
    switch (s) {
        case SessionState::NEGOTIATING:  return "Negotiating";
        case SessionState::READY:        return "Ready";
        case SessionState::TRANSFERRING: return "Transferring";
        case SessionState::FINALIZING:   return "Finalizing";
        case SessionState::COMPLETED:    return "Completed";
        case SessionState::FAILED:       return "Failed";
        case SessionState::REJECTED:     return "Rejected";
        case SessionState::CANCELLED:    return "Cancelled";
    }
    return "Unknown";
}

const char* direction_name(Direction d) {
    return d == Direction::SEND ? "send" : "receive";
}

bool is_terminal(SessionState s) {
    return s == SessionState::COMPLETED || s == SessionState::FAILED ||
           s == SessionState::REJECTED  || s == SessionState::CANCELLED;
}

bool transition_allowed(SessionState from, SessionState to) {
    switch (from) {
        case SessionState::NEGOTIATING:
            return to == SessionState::READY || to == SessionState::REJECTED ||
                   to == SessionState::FAILED || to == SessionState::CANCELLED;
        case SessionState::READY:
            return to == SessionState::TRANSFERRING ||
                   to == SessionState::FAILED || to == SessionState::CANCELLED;
        case SessionState::TRANSFERRING:
            return to == SessionState::FINALIZING ||
                   to == SessionState::FAILED || to == SessionState::CANCELLED;
        case SessionState::FINALIZING:
            return to == SessionState::COMPLETED ||
                   to == SessionState::FAILED || to == SessionState::CANCELLED;
        default:
            return false;
    }
}

TransferSession::TransferSession(Direction dir, std::string peer_addr)
    : id_(next_id_.fetch_add(1)),
      direction_(dir),
      peer_addr_(std::move(peer_addr)),
      started_ms_(utils::now_ms()) {}

SessionState TransferSession::state() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

bool TransferSession::advance(SessionState to) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!transition_allowed(state_, to)) return false;
        state_ = to;
        if (is_terminal(to)) finished_ms_ = utils::now_ms();
    }
    LOG_DEBUG("Session " + std::to_string(id_) + " -> " + session_state_name(to));
    cv_.notify_all();
    return true;
}

bool TransferSession::fail(const FailureInfo& info) {
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (failure_.is_set() || is_terminal(state_)) return false;
        failure_ = info;
    }
    cancel_ = true;

    std::string msg = "Session " + std::to_string(id_) + " (" + direction_name(direction_) +
                      ", peer " + peer_addr_ + "): " + info.describe();
    if (info.code == ErrorCode::CANCELLED) {
        LOG_INFO(msg);
    } else if (info.code == ErrorCode::REJECTED || info.code == ErrorCode::DECISION_TIMEOUT) {
        LOG_WARN(msg);
    } else {
        Logger::get().transfer_error(msg);
    }
    return true;
}

bool TransferSession::fail(ErrorCode code, const std::string& reason, i64 file_index, u64 offset) {
    FailureInfo info;
    info.code       = code;
    info.reason     = reason;
    info.file_index = file_index;
    info.offset     = offset;
    return fail(info);
}

void TransferSession::request_cancel() {
    fail(ErrorCode::CANCELLED, "cancelled by consumer");
}

FailureInfo TransferSession::failure() const {
    std::lock_guard<std::mutex> lk(mu_);
    return failure_;
}

SessionState TransferSession::conclude() {
    SessionState target;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (is_terminal(state_)) return state_;
        switch (failure_.code) {
            case ErrorCode::NONE:             target = SessionState::COMPLETED; break;
            case ErrorCode::CANCELLED:        target = SessionState::CANCELLED; break;
            case ErrorCode::REJECTED:
            case ErrorCode::DECISION_TIMEOUT:
                target = state_ == SessionState::NEGOTIATING ? SessionState::REJECTED
                                                             : SessionState::FAILED;
                break;
            default:                          target = SessionState::FAILED; break;
        }
        // COMPLETED is only reachable from FINALIZING
        if (target == SessionState::COMPLETED && state_ != SessionState::FINALIZING) {
            failure_.code   = ErrorCode::PROTOCOL_VIOLATION;
            failure_.reason = std::string("session ended early in state ") + session_state_name(state_);
            target = SessionState::FAILED;
        }
        state_ = target;
        finished_ms_ = utils::now_ms();
    }
    LOG_DEBUG("Session " + std::to_string(id_) + " -> " + session_state_name(target));
    cv_.notify_all();
    return target;
}

bool TransferSession::wait_terminal(u32 timeout_ms) const {
    std::unique_lock<std::mutex> lk(mu_);
    auto done = [this] { return is_terminal(state_); };
    if (timeout_ms == 0) {
        cv_.wait(lk, done);
        return true;
    }
    return cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), done);
}

void TransferSession::set_manifest(const TransferManifest& m) {
    std::lock_guard<std::mutex> lk(mu_);
    manifest_ = m;
}

TransferManifest TransferSession::manifest() const {
    std::lock_guard<std::mutex> lk(mu_);
    return manifest_;
}

void TransferSession::set_assignments(const std::vector<ChunkAssignment>& a) {
    std::lock_guard<std::mutex> lk(mu_);
    assignments_ = a;
}

std::vector<ChunkAssignment> TransferSession::assignments() const {
    std::lock_guard<std::mutex> lk(mu_);
    return assignments_;
}

void TransferSession::set_peer_name(const std::string& name) {
    std::lock_guard<std::mutex> lk(mu_);
    peer_name_ = name;
}

void TransferSession::set_output_dir(const std::string& dir) {
    std::lock_guard<std::mutex> lk(mu_);
    output_dir_ = dir;
}

SessionReport TransferSession::report() const {
    std::lock_guard<std::mutex> lk(mu_);
    SessionReport r;
    r.id           = id_;
    r.direction    = direction_;
    r.peer_addr    = peer_addr_;
    r.peer_name    = peer_name_;
    r.state        = state_;
    r.failure      = failure_;
    r.mode         = manifest_.mode;
    r.file_count   = (u32)manifest_.files.size();
    r.worker_count = (u32)assignments_.size();
    r.total_bytes  = manifest_.total_bytes();
    r.output_dir   = output_dir_;
    u64 end = finished_ms_ ? finished_ms_ : utils::now_ms();
    r.elapsed_ms   = end > started_ms_ ? end - started_ms_ : 0;
    return r;
}
