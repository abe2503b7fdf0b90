#pragma once

// ============================================================
// config.hpp -- Runtime configuration for the transfer engine
//
// Values that shape a session (threshold, parallelism, min chunk
// size) are only the sender's proposal: they travel in the
// handshake and the receiver plans from the handshake copy.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <stdexcept>

struct EngineConfig {
    // Data movement
    u32 buffer_size{DEFAULT_BUFFER_SIZE};            // bytes per read/write increment
    u32 idle_timeout_ms{30000};                      // no progress for this long -> failure
    u16 max_workers{4};                              // requested parallelism per large file
    u64 multi_stream_threshold{200ull * 1024 * 1024};
    u64 min_chunk_size{100ull * 1024 * 1024};        // lower bound per worker range

    // Discovery
    u16         discovery_port{DEFAULT_DISCOVERY_PORT};
    u32         discovery_interval_ms{5000};
    std::string broadcast_addr{"255.255.255.255"};

    // Receiving
    std::string listen_ip{"0.0.0.0"};
    u16         listen_port{DEFAULT_LISTEN_PORT};
    std::string display_name;                        // empty -> host name
    std::string save_dir{"."};
    u32         decision_timeout_ms{60000};
    u64         max_file_size{0};                    // 0 = unlimited
    bool        overwrite_files{false};
    bool        create_subfolders{true};
    bool        verify_checksums{true};

    // Throws std::invalid_argument describing the first bad field
    void validate() const {
        if (buffer_size < 4096 || buffer_size > MAX_BUFFER_SIZE) {
            throw std::invalid_argument("buffer_size must be 4 KB - 16 MB");
        }
        if (idle_timeout_ms < 100) {
            throw std::invalid_argument("idle_timeout_ms must be >= 100");
        }
        if (max_workers < 1 || max_workers > MAX_PARALLELISM) {
            throw std::invalid_argument("max_workers must be 1-" + std::to_string(MAX_PARALLELISM));
        }
        if (min_chunk_size == 0) {
            throw std::invalid_argument("min_chunk_size must be > 0");
        }
        if (discovery_port == 0) {
            throw std::invalid_argument("discovery_port must be 1-65535");
        }
        if (discovery_interval_ms < 10) {
            throw std::invalid_argument("discovery_interval_ms must be >= 10");
        }
        if (decision_timeout_ms < 10) {
            throw std::invalid_argument("decision_timeout_ms must be >= 10");
        }
        if (save_dir.empty()) {
            throw std::invalid_argument("save_dir must not be empty");
        }
    }
};
