// ============================================================
// chunk_worker.cpp -- Per-range transfer over one connection
// ============================================================

#include "chunk_worker.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <algorithm>

// ---- Range streaming (shared with the primary connection) ----

void stream_range_out(TcpSocket& sock, const file_io::MmapReader& src,
                      u64 offset, u64 length, u32 buffer_size,
                      ProgressAggregator& progress, u64 session_id, u32 worker_id, u64& moved) {
    u64 end = offset + length;
    u64 pos = offset + moved;
    while (pos < end) {
        u64 n = std::min<u64>(buffer_size, end - pos);
        sock.send_all(src.chunk_ptr(pos), (size_t)n);
        pos   += n;
        moved += n;
        progress.update(session_id, worker_id, n);
    }
}

void stream_range_in(TcpSocket& sock, file_io::MmapWriter& dst,
                     u64 offset, u64 length, std::vector<u8>& buf,
                     ProgressAggregator& progress, u64 session_id, u32 worker_id, u64& moved) {
    u64 end = offset + length;
    u64 pos = offset + moved;
    while (pos < end) {
        size_t n = (size_t)std::min<u64>(buf.size(), end - pos);
        if (!sock.recv_all(buf.data(), n)) {
            throw TransferError(ErrorCode::CONNECTION_LOST,
                                "peer closed after " + std::to_string(moved) + " of " +
                                std::to_string(length) + " bytes");
        }
        dst.write_at(pos, buf.data(), n);
        pos   += n;
        moved += n;
        progress.update(session_id, worker_id, n);
    }
}

// ============================================================
// ChunkTransferWorker
// ============================================================

ChunkTransferWorker::ChunkTransferWorker(TransferSession& session, ProgressAggregator& progress,
                                         const ChunkAssignment& assignment,
                                         u32 buffer_size, u32 idle_timeout_ms)
    : session_(session)
    , progress_(progress)
    , assignment_(assignment)
    , buffer_size_(buffer_size)
    , idle_timeout_ms_(idle_timeout_ms)
{}

ChunkTransferWorker::~ChunkTransferWorker() {
    join();
}

void ChunkTransferWorker::start_send(const std::string& peer_ip, const file_io::MmapReader& src) {
    thread_ = std::thread(&ChunkTransferWorker::run_send, this, peer_ip, &src);
}

void ChunkTransferWorker::start_receive(TcpSocket listener, const std::string& expected_ip,
                                        file_io::MmapWriter& dst) {
    thread_ = std::thread(&ChunkTransferWorker::run_receive, this,
                          std::move(listener), expected_ip, &dst);
}

void ChunkTransferWorker::join() {
    if (thread_.joinable()) thread_.join();
}

void ChunkTransferWorker::report_failure(ErrorCode code, const std::string& what) {
    session_.fail(code, "worker " + std::to_string(assignment_.worker_id) + ": " + what,
                  (i64)assignment_.file_index, assignment_.offset + moved_.load());
}

void ChunkTransferWorker::run_send(std::string peer_ip, const file_io::MmapReader* src) {
    u64 moved = 0;
    try {
        TcpSocket sock;
        sock.set_cancel_flag(&session_.cancel_flag());
        sock.set_idle_timeout_ms(idle_timeout_ms_);
        sock.connect(peer_ip, assignment_.port, (int)idle_timeout_ms_);
        LOG_DEBUG("Worker " + std::to_string(assignment_.worker_id) + " connected to " +
                  peer_ip + ":" + std::to_string(assignment_.port) + " for " +
                  std::to_string(assignment_.length) + " bytes at " +
                  std::to_string(assignment_.offset));

        stream_range_out(sock, *src, assignment_.offset, assignment_.length, buffer_size_,
                         progress_, session_.id(), assignment_.worker_id, moved);
        moved_ = moved;
        succeeded_ = true;
    } catch (const TransferError& e) {
        moved_ = moved;
        report_failure(e.code(), e.what());
    } catch (const std::exception& e) {
        moved_ = moved;
        report_failure(ErrorCode::CONNECTION_LOST, e.what());
    }
}

void ChunkTransferWorker::run_receive(TcpSocket listener, std::string expected_ip,
                                      file_io::MmapWriter* dst) {
    u64 moved = 0;
    try {
        listener.set_cancel_flag(&session_.cancel_flag());

        TcpSocket sock(INVALID_SOCKET_VAL);
        u64 deadline = utils::now_ms() + idle_timeout_ms_;
        while (!sock.is_valid()) {
            u64 now = utils::now_ms();
            if (now >= deadline) {
                throw TransferError(ErrorCode::IDLE_TIMEOUT,
                                    "no connection on port " + std::to_string(assignment_.port));
            }
            TcpSocket candidate = listener.accept((int)(deadline - now));
            if (!candidate.is_valid()) continue;
            std::string ip = candidate.peer_ip();
            if (ip != expected_ip) {
                LOG_WARN("Port " + std::to_string(assignment_.port) +
                         ": dropping unexpected connection from " + ip);
                continue;
            }
            sock = std::move(candidate);
        }
        listener.close();

        sock.set_cancel_flag(&session_.cancel_flag());
        sock.set_idle_timeout_ms(idle_timeout_ms_);
        std::vector<u8> buf(buffer_size_);
        stream_range_in(sock, *dst, assignment_.offset, assignment_.length, buf,
                        progress_, session_.id(), assignment_.worker_id, moved);
        moved_ = moved;
        succeeded_ = true;
    } catch (const TransferError& e) {
        moved_ = moved;
        report_failure(e.code(), e.what());
    } catch (const std::exception& e) {
        moved_ = moved;
        report_failure(ErrorCode::CONNECTION_LOST, e.what());
    }
}
