#pragma once

// ============================================================
// session.hpp -- TransferSession record and state machine
//
//   NEGOTIATING -> READY -> TRANSFERRING -> FINALIZING -> COMPLETED
//   any non-terminal state -> FAILED | CANCELLED
//   NEGOTIATING -> REJECTED
//
// States only move forward. fail() records the first failure, logs
// it once and raises the cancel flag every socket of the session
// polls; the owning coordinator calls conclude() after joining its
// workers to enter the matching terminal state.
// ============================================================

#include "platform.hpp"
#include "errors.hpp"
#include "envelope.hpp"
#include "chunk_plan.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

enum class SessionState : u8 {
    NEGOTIATING  = 0,
    READY        = 1,
    TRANSFERRING = 2,
    FINALIZING   = 3,
    COMPLETED    = 4,
    FAILED       = 5,
    REJECTED     = 6,
    CANCELLED    = 7,
};

enum class Direction : u8 {
    SEND    = 0,
    RECEIVE = 1,
};

const char* session_state_name(SessionState s);
const char* direction_name(Direction d);
bool is_terminal(SessionState s);
bool transition_allowed(SessionState from, SessionState to);

// Consumer-facing summary of a session
struct SessionReport {
    u64          id{0};
    Direction    direction{Direction::SEND};
    std::string  peer_addr;
    std::string  peer_name;
    SessionState state{SessionState::NEGOTIATING};
    FailureInfo  failure;
    TransferMode mode{TransferMode::SINGLE_STREAM};
    u32          file_count{0};
    u32          worker_count{0};
    u64          total_bytes{0};
    std::string  output_dir;      // receive side only
    u64          elapsed_ms{0};
};

class TransferSession {
public:
    TransferSession(Direction dir, std::string peer_addr);

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    u64 id() const { return id_; }
    Direction direction() const { return direction_; }
    const std::string& peer_addr() const { return peer_addr_; }

    SessionState state() const;

    // Move to 'to' if the edge is allowed; false otherwise
    bool advance(SessionState to);

    // First failure wins; returns true if this call recorded it
    bool fail(const FailureInfo& info);
    bool fail(ErrorCode code, const std::string& reason, i64 file_index = -1, u64 offset = 0);

    // Consumer cancellation: recorded as a CANCELLED failure
    void request_cancel();
    bool cancel_requested() const { return cancel_.load(); }
    const std::atomic<bool>& cancel_flag() const { return cancel_; }

    FailureInfo failure() const;

    // Enter the terminal state matching the recorded failure (COMPLETED when none)
    SessionState conclude();

    // Block until terminal or timeout; timeout_ms 0 waits forever
    bool wait_terminal(u32 timeout_ms) const;

    // ---- Session data, written by the owning coordinator ----
    void set_manifest(const TransferManifest& m);
    TransferManifest manifest() const;
    void set_assignments(const std::vector<ChunkAssignment>& a);
    std::vector<ChunkAssignment> assignments() const;
    void set_peer_name(const std::string& name);
    void set_output_dir(const std::string& dir);

    SessionReport report() const;

private:
    static std::atomic<u64> next_id_;

    const u64         id_;
    const Direction   direction_;
    const std::string peer_addr_;
    const u64         started_ms_;

    mutable std::mutex              mu_;
    mutable std::condition_variable cv_;
    SessionState                    state_{SessionState::NEGOTIATING};
    FailureInfo                     failure_;
    u64                             finished_ms_{0};
    TransferManifest                manifest_;
    std::vector<ChunkAssignment>    assignments_;
    std::string                     peer_name_;
    std::string                     output_dir_;

    std::atomic<bool> cancel_{false};
};
