#pragma once

// ============================================================
// send_coordinator.hpp -- Drives one outbound transfer session
// ============================================================

#include "../common/platform.hpp"
#include "../common/chunk_worker.hpp"
#include "../common/config.hpp"
#include "../common/progress.hpp"
#include "../common/session.hpp"
#include "manifest_builder.hpp"
#include <memory>
#include <string>
#include <vector>

class SendCoordinator {
public:
    SendCoordinator(std::shared_ptr<TransferSession> session,
                    SendList list,
                    const EngineConfig& cfg,
                    ProgressAggregator& progress,
                    std::string peer_ip,
                    u16 peer_port);

    SendCoordinator(const SendCoordinator&) = delete;
    SendCoordinator& operator=(const SendCoordinator&) = delete;

    // Runs the session to a terminal state on the calling thread
    SessionState run();

private:
    void transfer(TcpSocket& primary);
    void join_workers();

    std::shared_ptr<TransferSession> session_;
    SendList                         list_;
    EngineConfig                     cfg_;
    ProgressAggregator&              progress_;
    std::string                      peer_ip_;
    u16                              peer_port_;

    std::vector<std::unique_ptr<file_io::MmapReader>>  readers_;
    std::vector<std::unique_ptr<ChunkTransferWorker>>  workers_;
};
