// ============================================================
// send_coordinator.cpp -- Outbound session: handshake, data, verify
// ============================================================

#include "send_coordinator.hpp"
#include "../common/chunk_plan.hpp"
#include "../common/envelope.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>

SendCoordinator::SendCoordinator(std::shared_ptr<TransferSession> session,
                                 SendList list,
                                 const EngineConfig& cfg,
                                 ProgressAggregator& progress,
                                 std::string peer_ip,
                                 u16 peer_port)
    : session_(std::move(session))
    , list_(std::move(list))
    , cfg_(cfg)
    , progress_(progress)
    , peer_ip_(std::move(peer_ip))
    , peer_port_(peer_port)
{
    session_->set_manifest(list_.manifest);
    session_->set_peer_name(peer_ip_ + ":" + std::to_string(peer_port_));
    progress_.begin(session_->id(), list_.manifest.total_bytes(),
                    (u32)chunk_plan::plan(list_.manifest, 0).size());
}

SessionState SendCoordinator::run() {
    const TransferManifest& m = list_.manifest;
    LOG_INFO("Session " + std::to_string(session_->id()) + ": sending " +
             std::to_string(m.files.size()) + " entries (" + utils::format_bytes(m.total_bytes()) +
             ") to " + peer_ip_ + ":" + std::to_string(peer_port_));

    try {
        TcpSocket primary;
        primary.set_cancel_flag(&session_->cancel_flag());
        primary.connect(peer_ip_, peer_port_, (int)cfg_.idle_timeout_ms);
        transfer(primary);
    } catch (const TransferError& e) {
        session_->fail(e.code(), e.what());
    } catch (const std::exception& e) {
        session_->fail(ErrorCode::CONNECTION_LOST, e.what());
    }

    join_workers();
    readers_.clear();
    progress_.finish(session_->id());

    SessionState final_state = session_->conclude();
    SessionReport rep = session_->report();
    if (final_state == SessionState::COMPLETED) {
        double secs = rep.elapsed_ms / 1000.0;
        LOG_INFO("Session " + std::to_string(rep.id) + " completed: " +
                 utils::format_bytes(rep.total_bytes) + " in " +
                 utils::format_duration_s((u64)secs) + " (" +
                 utils::format_speed(secs > 0 ? rep.total_bytes / secs : 0.0) + ")");
    } else {
        LOG_INFO("Session " + std::to_string(rep.id) + " ended " +
                 session_state_name(final_state));
    }
    return final_state;
}

void SendCoordinator::transfer(TcpSocket& primary) {
    const TransferManifest& m = list_.manifest;
    const u64 sid = session_->id();

    proto::write_handshake(primary, m);

    // PENDING carries the peer's decision timeout; the final reply follows within it
    Reply reply = proto::read_reply(primary);
    if (reply.token == ReplyToken::PENDING) {
        LOG_INFO("Session " + std::to_string(sid) + ": peer is deciding (up to " +
                 std::to_string(reply.wait_ms) + " ms)");
        primary.set_idle_timeout_ms((u32)std::min<u64>((u64)reply.wait_ms + cfg_.idle_timeout_ms,
                                                       0xFFFFFFFFull));
        reply = proto::read_reply(primary);
        primary.set_idle_timeout_ms(cfg_.idle_timeout_ms);
        if (reply.token == ReplyToken::PENDING) {
            throw ProtocolViolation("second pending reply");
        }
    }

    if (reply.token != ReplyToken::READY) {
        ErrorCode code = reply.token == ReplyToken::TIMEOUT ? ErrorCode::DECISION_TIMEOUT
                                                            : ErrorCode::REJECTED;
        session_->fail(code, std::string("peer replied ") + reply_token_name(reply.token));
        return;
    }
    if (!session_->advance(SessionState::READY)) return;

    std::vector<ChunkAssignment> plan = chunk_plan::plan(m, reply.aux_base_port);
    if (!plan.empty() && reply.aux_base_port == 0) {
        throw ProtocolViolation("ready reply without auxiliary ports for a multi-stream session");
    }
    session_->set_assignments(plan);

    readers_.resize(m.files.size());
    for (size_t i = 0; i < m.files.size(); ++i) {
        const auto& f = m.files[i];
        if (f.is_directory || f.size == 0) continue;
        readers_[i] = std::make_unique<file_io::MmapReader>(list_.sources[i]);
        if (readers_[i]->size() != f.size) {
            throw TransferError(ErrorCode::FILE_IO,
                                "File changed size since it was hashed: " + list_.sources[i]);
        }
    }

    if (!session_->advance(SessionState::TRANSFERRING)) return;

    for (const auto& a : plan) {
        workers_.push_back(std::make_unique<ChunkTransferWorker>(*session_, progress_, a,
                                                                 cfg_.buffer_size, cfg_.idle_timeout_ms));
        workers_.back()->start_send(peer_ip_, *readers_[a.file_index]);
    }
    if (!plan.empty()) {
        LOG_INFO("Session " + std::to_string(sid) + ": " + std::to_string(plan.size()) +
                 " workers from port " + std::to_string(reply.aux_base_port));
    }

    // Single-stream files follow the reply directly, in manifest order
    for (size_t i = 0; i < m.files.size(); ++i) {
        const auto& f = m.files[i];
        if (f.is_directory || f.size == 0 || m.is_chunked(i)) continue;
        u64 moved = 0;
        try {
            stream_range_out(primary, *readers_[i], 0, f.size, cfg_.buffer_size,
                             progress_, sid, 0, moved);
        } catch (const TransferError& e) {
            session_->fail(e.code(), e.what(), (i64)i, moved);
            return;
        }
    }

    join_workers();
    if (session_->failure().is_set()) return;

    proto::write_complete(primary, m.total_bytes(), (u32)m.files.size());
    if (!session_->advance(SessionState::FINALIZING)) return;

    // Verification time on the receiver grows with the payload
    u64 verify_allowance = m.total_bytes() / (32ull * 1024 * 1024) * 1000;
    primary.set_idle_timeout_ms(cfg_.idle_timeout_ms +
                                (u32)std::min<u64>(verify_allowance, 0xFFFFFFFFull - cfg_.idle_timeout_ms));
    Result result = proto::read_result(primary);
    if (result.status == ResultStatus::OK) return;

    i64 idx = result.file_index == NO_FILE_INDEX ? -1 : (i64)result.file_index;
    std::string name = idx >= 0 && (size_t)idx < m.files.size() ? m.files[idx].rel_path : "?";
    if (result.status == ResultStatus::CHECKSUM_MISMATCH) {
        session_->fail(ErrorCode::CHECKSUM_MISMATCH, "receiver reported checksum mismatch for " + name, idx);
    } else {
        session_->fail(ErrorCode::FILE_IO, "receiver could not finalize " + name, idx);
    }
}

void SendCoordinator::join_workers() {
    for (auto& w : workers_) w->join();
    workers_.clear();
}
