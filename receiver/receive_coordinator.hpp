#pragma once

// ============================================================
// receive_coordinator.hpp -- Drives one accepted inbound session
// ============================================================

#include "../common/platform.hpp"
#include "../common/chunk_worker.hpp"
#include "../common/config.hpp"
#include "../common/progress.hpp"
#include "../common/session.hpp"
#include "../common/socket.hpp"
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

// Bind 'count' listeners on consecutive ports, starting at 'start' and
// sliding past ports another session holds. 'base' receives the first port.
std::vector<TcpSocket> bind_port_block(const std::string& ip, u16 start, u32 count, u16& base);

class ReceiveCoordinator {
public:
    ReceiveCoordinator(std::shared_ptr<TransferSession> session,
                       TcpSocket primary,
                       const EngineConfig& cfg,
                       ProgressAggregator& progress,
                       u16 primary_port);

    ReceiveCoordinator(const ReceiveCoordinator&) = delete;
    ReceiveCoordinator& operator=(const ReceiveCoordinator&) = delete;

    // Session must be NEGOTIATING with its manifest set; runs to a terminal state
    SessionState run();

private:
    void prepare();
    void prepare_outputs();
    std::filesystem::path output_path(const std::string& rel_path);
    void transfer();
    void finalize();
    void send_result(ResultStatus status, u32 file_index);
    void send_rejection();
    void discard_outputs();
    void join_workers();

    std::shared_ptr<TransferSession> session_;
    TcpSocket                        primary_;
    EngineConfig                     cfg_;
    ProgressAggregator&              progress_;
    u16                              primary_port_;
    TransferManifest                 manifest_;
    std::string                      peer_ip_;

    std::vector<ChunkAssignment>                       plan_;
    std::vector<TcpSocket>                             listeners_;  // aux, one per assignment
    u16                                                aux_base_{0};

    std::filesystem::path                              out_root_;
    std::vector<std::filesystem::path>                 created_;    // removed if no ready reply went out
    bool                                               root_created_{false};
    std::map<std::string, std::string>                 top_names_;  // sent name -> local name
    std::vector<std::filesystem::path>                 paths_;
    std::vector<std::unique_ptr<file_io::MmapWriter>>  writers_;
    std::vector<std::unique_ptr<ChunkTransferWorker>>  workers_;
    bool                                               result_sent_{false};
};
