#pragma once

// ============================================================
// chunk_worker.hpp -- Moves one byte range over one connection
// ============================================================

#include "platform.hpp"
#include "chunk_plan.hpp"
#include "file_io.hpp"
#include "progress.hpp"
#include "session.hpp"
#include "socket.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

// Stream [offset, offset + length) of src to sock in buffer_size steps,
// crediting progress slot worker_id after every step. 'moved' counts the
// bytes handed to the socket so far, also when an exception escapes.
void stream_range_out(TcpSocket& sock, const file_io::MmapReader& src,
                      u64 offset, u64 length, u32 buffer_size,
                      ProgressAggregator& progress, u64 session_id, u32 worker_id, u64& moved);

// Receive exactly 'length' bytes from sock into dst at offset.
// Throws ConnectionLost if the peer closes early.
void stream_range_in(TcpSocket& sock, file_io::MmapWriter& dst,
                     u64 offset, u64 length, std::vector<u8>& buf,
                     ProgressAggregator& progress, u64 session_id, u32 worker_id, u64& moved);

class ChunkTransferWorker {
public:
    ChunkTransferWorker(TransferSession& session, ProgressAggregator& progress,
                        const ChunkAssignment& assignment, u32 buffer_size, u32 idle_timeout_ms);
    ~ChunkTransferWorker();

    ChunkTransferWorker(const ChunkTransferWorker&) = delete;
    ChunkTransferWorker& operator=(const ChunkTransferWorker&) = delete;

    // Sender: connect to peer_ip:assignment.port and push the range from src
    void start_send(const std::string& peer_ip, const file_io::MmapReader& src);

    // Receiver: accept the sender on a pre-bound listener and write into dst.
    // Connections from any address other than expected_ip are dropped.
    void start_receive(TcpSocket listener, const std::string& expected_ip,
                       file_io::MmapWriter& dst);

    void join();

    bool succeeded() const { return succeeded_.load(); }
    u64 bytes_moved() const { return moved_.load(); }
    const ChunkAssignment& assignment() const { return assignment_; }

private:
    void run_send(std::string peer_ip, const file_io::MmapReader* src);
    void run_receive(TcpSocket listener, std::string expected_ip, file_io::MmapWriter* dst);
    void report_failure(ErrorCode code, const std::string& what);

    TransferSession&    session_;
    ProgressAggregator& progress_;
    ChunkAssignment     assignment_;
    u32                 buffer_size_;
    u32                 idle_timeout_ms_;

    std::thread         thread_;
    std::atomic<bool>   succeeded_{false};
    std::atomic<u64>    moved_{0};
};
