#pragma once

// ============================================================
// errors.hpp -- Error taxonomy shared by discovery and transfer
// ============================================================

#include "platform.hpp"
#include <stdexcept>
#include <string>

enum class ErrorCode : u8 {
    NONE               = 0,
    MALFORMED_DATAGRAM = 1,  // discovery decode failure: dropped, never escalated
    PROTOCOL_VIOLATION = 2,  // handshake/frame decode failure: connection closed
    DECISION_TIMEOUT   = 3,  // no accept/reject within the gate timeout
    CONNECTION_LOST    = 4,  // socket error or peer close mid-transfer
    IDLE_TIMEOUT       = 5,  // no bytes moved within the idle interval
    CHECKSUM_MISMATCH  = 6,  // post-transfer verification failed
    FILE_IO            = 7,  // local read/write failure
    REJECTED           = 8,  // peer (or policy) said no
    CANCELLED          = 9,  // explicit consumer cancellation
};

inline const char* error_code_name(ErrorCode c) {
    switch (c) {
        case ErrorCode::NONE:               return "None";
        case ErrorCode::MALFORMED_DATAGRAM: return "MalformedDatagram";
        case ErrorCode::PROTOCOL_VIOLATION: return "ProtocolViolation";
        case ErrorCode::DECISION_TIMEOUT:   return "DecisionTimeout";
        case ErrorCode::CONNECTION_LOST:    return "ConnectionLost";
        case ErrorCode::IDLE_TIMEOUT:       return "IdleTimeout";
        case ErrorCode::CHECKSUM_MISMATCH:  return "ChecksumMismatch";
        case ErrorCode::FILE_IO:            return "FileIo";
        case ErrorCode::REJECTED:           return "Rejected";
        case ErrorCode::CANCELLED:          return "Cancelled";
    }
    return "Unknown";
}

// Base class for every error the engine raises on purpose
class TransferError : public std::runtime_error {
public:
    TransferError(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class MalformedDatagram : public TransferError {
public:
    explicit MalformedDatagram(const std::string& msg)
        : TransferError(ErrorCode::MALFORMED_DATAGRAM, "malformed datagram: " + msg) {}
};

class ProtocolViolation : public TransferError {
public:
    explicit ProtocolViolation(const std::string& msg)
        : TransferError(ErrorCode::PROTOCOL_VIOLATION, "protocol violation: " + msg) {}
};

// Where and why a session stopped short of Completed
struct FailureInfo {
    ErrorCode   code{ErrorCode::NONE};
    std::string reason;
    i64         file_index{-1};  // -1 when not tied to one file
    u64         offset{0};       // byte offset inside file_index

    bool is_set() const { return code != ErrorCode::NONE; }

    std::string describe() const {
        std::string s = std::string(error_code_name(code)) + ": " + reason;
        if (file_index >= 0) {
            s += " (file #" + std::to_string(file_index) +
                 " at offset " + std::to_string(offset) + ")";
        }
        return s;
    }
};
