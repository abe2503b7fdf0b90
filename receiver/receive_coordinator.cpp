// ============================================================
// receive_coordinator.cpp -- Inbound session: outputs, data, verify
// ============================================================

#include "receive_coordinator.hpp"
#include "../common/chunk_plan.hpp"
#include "../common/envelope.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <ctime>
#include <system_error>

namespace fs = std::filesystem;

std::vector<TcpSocket> bind_port_block(const std::string& ip, u16 start, u32 count, u16& base) {
    static constexpr int MAX_ATTEMPTS = 64;
    u32 candidate = start;
    for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
        if (candidate == 0 || candidate + count - 1 > 65535) break;
        std::vector<TcpSocket> socks;
        socks.reserve(count);
        u32 failed_at = 0;
        for (u32 k = 0; k < count; ++k) {
            TcpSocket s;
            try {
                s.bind_and_listen(ip, (u16)(candidate + k), 1);
            } catch (const std::runtime_error& e) {
                LOG_DEBUG("Auxiliary port " + std::to_string(candidate + k) + " busy: " + e.what());
                failed_at = candidate + k;
                break;
            }
            socks.push_back(std::move(s));
        }
        if (socks.size() == count) {
            base = (u16)candidate;
            return socks;
        }
        candidate = failed_at + 1;
    }
    throw TransferError(ErrorCode::CONNECTION_LOST,
                        "no block of " + std::to_string(count) + " free ports from " +
                        std::to_string(start));
}

ReceiveCoordinator::ReceiveCoordinator(std::shared_ptr<TransferSession> session,
                                       TcpSocket primary,
                                       const EngineConfig& cfg,
                                       ProgressAggregator& progress,
                                       u16 primary_port)
    : session_(std::move(session))
    , primary_(std::move(primary))
    , cfg_(cfg)
    , progress_(progress)
    , primary_port_(primary_port)
    , manifest_(session_->manifest())
    , peer_ip_(primary_.peer_ip())
{
    primary_.set_cancel_flag(&session_->cancel_flag());
    primary_.set_idle_timeout_ms(cfg_.idle_timeout_ms);
}

SessionState ReceiveCoordinator::run() {
    try {
        prepare();
    } catch (const TransferError& e) {
        session_->fail(e.code(), e.what());
    } catch (const std::exception& e) {
        session_->fail(ErrorCode::FILE_IO, e.what());
    }

    if (session_->failure().is_set()) {
        // Nothing was promised yet: turn the sender away and undo the outputs
        session_->set_assignments({});
        listeners_.clear();
        send_rejection();
        discard_outputs();
    } else {
        try {
            transfer();
        } catch (const TransferError& e) {
            session_->fail(e.code(), e.what());
        } catch (const std::exception& e) {
            session_->fail(ErrorCode::CONNECTION_LOST, e.what());
        }
    }

    join_workers();
    listeners_.clear();
    if (session_->failure().is_set() && session_->state() == SessionState::FINALIZING && !result_sent_) {
        send_result(ResultStatus::FAILED, NO_FILE_INDEX);
    }
    for (auto& w : writers_) {
        if (!w || !w->is_open()) continue;
        try {
            w->close();
        } catch (const std::exception& e) {
            LOG_WARN(std::string("Closing output failed: ") + e.what());
        }
    }
    primary_.close();
    progress_.finish(session_->id());

    SessionState final_state = session_->conclude();
    SessionReport rep = session_->report();
    if (final_state == SessionState::COMPLETED) {
        double secs = rep.elapsed_ms / 1000.0;
        LOG_INFO("Session " + std::to_string(rep.id) + " completed: " +
                 std::to_string(rep.file_count) + " entries, " +
                 utils::format_bytes(rep.total_bytes) + " into " + rep.output_dir + " (" +
                 utils::format_speed(secs > 0 ? rep.total_bytes / secs : 0.0) + ")");
    } else {
        LOG_INFO("Session " + std::to_string(rep.id) + " ended " + session_state_name(final_state));
    }
    return final_state;
}

// ---------------------------------------------------------------
// prepare
//   Everything that can fail before MT_REPLY(ready): the aux port
//   block first, then the output tree.
// ---------------------------------------------------------------
void ReceiveCoordinator::prepare() {
    plan_ = chunk_plan::plan(manifest_, 0);
    if (!plan_.empty()) {
        u32 start = (u32)primary_port_ + 1;
        if (start > 65535) start = 1024;
        listeners_ = bind_port_block(cfg_.listen_ip, (u16)start, (u32)plan_.size(), aux_base_);
        plan_ = chunk_plan::plan(manifest_, aux_base_);
    }
    session_->set_assignments(plan_);
    if (session_->failure().is_set()) return;
    prepare_outputs();
}

void ReceiveCoordinator::prepare_outputs() {
    fs::path root(cfg_.save_dir);
    if (cfg_.create_subfolders && manifest_.files.size() > 1) {
        root = file_io::unique_path(root / file_io::batch_dir_name(std::time(nullptr)));
    }
    std::error_code ec;
    bool fresh_root = !fs::exists(root, ec);
    fs::create_directories(root, ec);
    if (ec) {
        throw TransferError(ErrorCode::FILE_IO,
                            "Cannot create output directory " + root.string() + ": " + ec.message());
    }
    if (fresh_root) created_.push_back(root);
    root_created_ = fresh_root;
    out_root_ = root;
    session_->set_output_dir(root.string());

    paths_.resize(manifest_.files.size());
    writers_.resize(manifest_.files.size());
    for (size_t i = 0; i < manifest_.files.size(); ++i) {
        const auto& f = manifest_.files[i];
        paths_[i] = output_path(f.rel_path);
        if (f.is_directory) {
            fs::create_directories(paths_[i], ec);
            if (ec) {
                throw TransferError(ErrorCode::FILE_IO,
                                    "Cannot create directory " + paths_[i].string() + ": " + ec.message());
            }
            continue;
        }
        writers_[i] = std::make_unique<file_io::MmapWriter>();
        writers_[i]->open(paths_[i].string(), f.size);
    }
}

fs::path ReceiveCoordinator::output_path(const std::string& rel_path) {
    size_t slash = rel_path.find_first_of("/\\");
    std::string top = rel_path.substr(0, slash);

    auto it = top_names_.find(top);
    if (it == top_names_.end()) {
        std::string local = top;
        if (!cfg_.overwrite_files) {
            local = file_io::unique_path(out_root_ / top).filename().string();
            if (local != top) {
                LOG_INFO("'" + top + "' exists, saving as '" + local + "'");
            }
        }
        std::error_code ec;
        if (!root_created_ && !fs::exists(out_root_ / local, ec)) created_.push_back(out_root_ / local);
        it = top_names_.emplace(top, local).first;
    }
    std::string mapped = slash == std::string::npos ? it->second
                                                    : it->second + "/" + rel_path.substr(slash + 1);
    return file_io::proto_to_fspath(out_root_, mapped);
}

void ReceiveCoordinator::transfer() {
    const u64 sid = session_->id();
    const std::vector<ChunkAssignment>& plan = plan_;

    Reply reply;
    reply.token         = ReplyToken::READY;
    reply.aux_base_port = aux_base_;
    reply.session_id    = sid;
    proto::write_reply(primary_, reply);
    if (!session_->advance(SessionState::READY)) return;
    if (!session_->advance(SessionState::TRANSFERRING)) return;

    for (size_t k = 0; k < plan.size(); ++k) {
        const ChunkAssignment& a = plan[k];
        workers_.push_back(std::make_unique<ChunkTransferWorker>(*session_, progress_, a,
                                                                 cfg_.buffer_size, cfg_.idle_timeout_ms));
        workers_.back()->start_receive(std::move(listeners_[k]), peer_ip_, *writers_[a.file_index]);
    }
    if (!plan.empty()) {
        LOG_INFO("Session " + std::to_string(sid) + ": " + std::to_string(plan.size()) +
                 " workers on ports " + std::to_string(aux_base_) + "-" +
                 std::to_string(aux_base_ + plan.size() - 1));
    }

    std::vector<u8> buf(cfg_.buffer_size);
    for (size_t i = 0; i < manifest_.files.size(); ++i) {
        const auto& f = manifest_.files[i];
        if (f.is_directory || f.size == 0 || manifest_.is_chunked(i)) continue;
        u64 moved = 0;
        try {
            stream_range_in(primary_, *writers_[i], 0, f.size, buf, progress_, sid, 0, moved);
        } catch (const TransferError& e) {
            session_->fail(e.code(), e.what(), (i64)i, moved);
            return;
        }
    }

    join_workers();
    if (session_->failure().is_set()) return;

    CompleteMsg done = proto::read_complete(primary_);
    if (done.total_bytes != manifest_.total_bytes() || done.file_count != manifest_.files.size()) {
        throw ProtocolViolation("completion marker reports " + std::to_string(done.total_bytes) +
                                " bytes in " + std::to_string(done.file_count) + " entries");
    }
    if (!session_->advance(SessionState::FINALIZING)) return;
    finalize();
}

void ReceiveCoordinator::finalize() {
    for (size_t i = 0; i < writers_.size(); ++i) {
        if (!writers_[i]) continue;
        try {
            writers_[i]->close();
        } catch (const TransferError& e) {
            session_->fail(e.code(), e.what(), (i64)i);
            send_result(ResultStatus::FAILED, (u32)i);
            return;
        }
    }

    if (cfg_.verify_checksums) {
        for (size_t i = 0; i < manifest_.files.size(); ++i) {
            const auto& f = manifest_.files[i];
            if (f.is_directory) continue;
            hash::Hash128 got = file_io::hash_file(paths_[i].string(), cfg_.buffer_size);
            if (got != f.checksum) {
                session_->fail(ErrorCode::CHECKSUM_MISMATCH,
                               "checksum mismatch for " + f.rel_path + ": expected " +
                               hash::to_hex(f.checksum) + ", got " + hash::to_hex(got) +
                               "; output kept at " + paths_[i].string(),
                               (i64)i);
                send_result(ResultStatus::CHECKSUM_MISMATCH, (u32)i);
                return;
            }
        }
    }
    send_result(ResultStatus::OK, NO_FILE_INDEX);
}

void ReceiveCoordinator::send_result(ResultStatus status, u32 file_index) {
    result_sent_ = true;
    Result r;
    r.status         = status;
    r.file_index     = file_index;
    r.bytes_received = progress_.snapshot(session_->id()).bytes_transferred;
    try {
        // A failure raised the cancel flag; the result still has to go out
        TcpSocket& s = primary_;
        s.set_cancel_flag(nullptr);
        proto::write_result(s, r);
        s.set_cancel_flag(&session_->cancel_flag());
    } catch (const std::exception& e) {
        LOG_WARN("Session " + std::to_string(session_->id()) + ": could not send result: " + e.what());
    }
}

void ReceiveCoordinator::send_rejection() {
    Reply reply;
    reply.token      = ReplyToken::REJECTED;
    reply.session_id = session_->id();
    try {
        primary_.set_cancel_flag(nullptr);
        proto::write_reply(primary_, reply);
    } catch (const std::exception& e) {
        LOG_WARN("Session " + std::to_string(session_->id()) + ": could not send rejection: " + e.what());
    }
    primary_.set_cancel_flag(&session_->cancel_flag());
}

// Remove the batch folder or top-level outputs prepare_outputs() created; pre-existing paths stay
void ReceiveCoordinator::discard_outputs() {
    for (auto& w : writers_) {
        if (!w || !w->is_open()) continue;
        try {
            w->close();
        } catch (const std::exception& e) {
            LOG_WARN(std::string("Closing output failed: ") + e.what());
        }
    }
    for (auto it = created_.rbegin(); it != created_.rend(); ++it) {
        std::error_code ec;
        fs::remove_all(*it, ec);
        if (ec) LOG_WARN("Could not remove " + it->string() + ": " + ec.message());
    }
    created_.clear();
}

void ReceiveCoordinator::join_workers() {
    for (auto& w : workers_) w->join();
    workers_.clear();
}
