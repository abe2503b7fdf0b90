// ============================================================
// app/main.cpp -- lanshare command-line entry point
// ============================================================

#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/tui.hpp"
#include "../common/utils.hpp"
#include "engine.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <iostream>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

static std::atomic<bool> g_stop{false};

static void sig_handler(int /*sig*/) {
    g_stop.store(true);
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <command> [args] [options]\n"
        << "\nCommands:\n"
        << "  peers                     list peers announcing on the LAN\n"
        << "  send <peer> <path>...     send files/directories; peer is ip[:port] or a peer name\n"
        << "  recv                      receive transfers until interrupted\n"
        << "\nCommon options:\n"
        << "  --verbose                 enable debug logging\n"
        << "  --log-file PATH           also write the log to PATH\n"
        << "  --name NAME               display name (default: host name)\n"
        << "  --discovery-port N        UDP discovery port (default: 5000)\n"
        << "  --interval-ms N           announce interval (default: 5000)\n"
        << "  --broadcast IP            announce address (default: 255.255.255.255)\n"
        << "  --buffer-kb N             I/O increment in KB (default: 64)\n"
        << "  --idle-timeout-ms N       fail after N ms without progress (default: 30000)\n"
        << "\nSend options:\n"
        << "  --workers N               parallel connections per large file (default: 4)\n"
        << "  --threshold-mb N          multi-stream threshold (default: 200)\n"
        << "  --min-chunk-mb N          smallest chunk per worker (default: 100)\n"
        << "\nReceive options:\n"
        << "  --port N                  TCP listen port (default: 12345)\n"
        << "  --dir PATH                save directory (default: .)\n"
        << "  --auto-accept             accept every request\n"
        << "  --auto-reject             reject every request\n"
        << "  --decision-timeout-ms N   time to answer a request (default: 60000)\n"
        << "  --size-limit-mb N         reject files larger than N MB (default: unlimited)\n"
        << "  --overwrite               overwrite existing outputs\n"
        << "  --no-subfolders           never create batch subfolders\n"
        << "  --no-verify               skip checksum verification\n"
        << "\nExamples:\n"
        << "  " << prog << " peers\n"
        << "  " << prog << " send 192.168.1.20 ./photos report.pdf --workers 8\n"
        << "  " << prog << " recv --dir ~/Downloads --auto-accept\n";
}

static int cmd_peers(Engine& engine) {
    engine.discover_peers();
    // Two announce rounds so that every live peer had a chance to speak
    u32 wait_ms = engine.config().discovery_interval_ms * 2;
    for (u32 waited = 0; waited < wait_ms && !g_stop.load(); waited += 100) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::vector<PeerRecord> peers = engine.discover_peers();
    if (peers.empty()) {
        std::cout << "No peers found.\n";
        return 0;
    }
    for (const auto& p : peers) {
        std::cout << "  " << p.display_name << "  " << p.endpoint() << "  "
                  << (p.status == PeerStatus::BUSY ? "busy" : "idle") << "\n";
    }
    return 0;
}

static int cmd_send(Engine& engine, const std::string& peer, const std::vector<std::string>& paths) {
    u64 id = engine.send_files(peer, paths);

    Tui tui("Sent", "-> " + peer);
    auto sub = engine.subscribe_progress(id, [&tui](const ProgressSnapshot& s) { tui.render(s); }, 200);

    bool cancelled = false;
    while (!engine.wait(id, 200)) {
        if (g_stop.load() && !cancelled) {
            cancelled = true;
            engine.cancel(id);
        }
    }
    sub->stop();

    SessionReport rep = engine.report(id);
    tui.finish(rep);
    engine.acknowledge(id);
    return rep.state == SessionState::COMPLETED ? 0 : 1;
}

static bool ask_user(const IncomingRequest& req) {
    std::cout << "\nIncoming transfer from '" << req.sender_name << "' (" << req.peer_addr << "): "
              << req.manifest.files.size() << " entries, " << utils::format_bytes(req.total_bytes)
              << "\n";
    size_t shown = 0;
    for (const auto& f : req.manifest.files) {
        if (++shown > 10) {
            std::cout << "    ...\n";
            break;
        }
        std::cout << "    " << f.rel_path << (f.is_directory ? "/" : "  " + utils::format_bytes(f.size))
                  << "\n";
    }
    std::cout << "Accept? [y/N] ";
    std::cout.flush();
    std::string line;
    if (!std::getline(std::cin, line)) return false;
    return !line.empty() && (line[0] == 'y' || line[0] == 'Y');
}

static int cmd_recv(Engine& engine, u16 port, AcceptPolicy policy) {
    std::mutex mu;
    std::deque<u64> fresh;
    engine.set_session_listener([&](u64 id) {
        std::lock_guard<std::mutex> lk(mu);
        fresh.push_back(id);
    });

    engine.start_receiving(port, engine.display_name(), policy);
    std::cout << "Receiving as '" << engine.display_name() << "' on port " << engine.receive_port()
              << " (Ctrl+C to stop)\n";

    std::set<u64> asked;
    std::set<u64> live;
    while (!g_stop.load()) {
        {
            std::lock_guard<std::mutex> lk(mu);
            while (!fresh.empty()) {
                live.insert(fresh.front());
                fresh.pop_front();
            }
        }

        if (policy == AcceptPolicy::ASK) {
            for (const auto& req : engine.pending_requests()) {
                if (!asked.insert(req.request_id).second) continue;
                bool yes = ask_user(req);
                if (!engine.decide(req.request_id, yes ? Decision::ACCEPT : Decision::REJECT)) {
                    std::cout << "Request " << req.request_id << " is no longer pending.\n";
                }
            }
        }

        for (auto it = live.begin(); it != live.end();) {
            if (!engine.wait(*it, 1)) {
                ++it;
                continue;
            }
            SessionReport rep = engine.report(*it);
            Tui("Recv", "<- " + rep.peer_name + " (" + rep.peer_addr + ")").finish(rep);
            engine.acknowledge(*it);
            it = live.erase(it);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    engine.stop_receiving();
    for (u64 id : live) {
        engine.wait(id, 0);
        engine.acknowledge(id);
    }
    return 0;
}

int main(int argc, char* argv[]) {
    platform::Guard platform_guard;

#ifndef _WIN32
    signal(SIGPIPE, SIG_IGN);
#endif

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::vector<std::string> positional;
    EngineConfig cfg;
    AcceptPolicy policy = AcceptPolicy::ASK;
    int port_int = DEFAULT_LISTEN_PORT;

    Logger::get().set_level(LogLevel::INFO);

    for (int i = 2; i < argc; ++i) {
        bool has_val = i + 1 < argc;
        if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else if (std::strcmp(argv[i], "--log-file") == 0 && has_val) {
            Logger::get().set_log_file(argv[++i]);
        } else if (std::strcmp(argv[i], "--name") == 0 && has_val) {
            cfg.display_name = argv[++i];
        } else if (std::strcmp(argv[i], "--discovery-port") == 0 && has_val) {
            int p = std::atoi(argv[++i]);
            if (!utils::validate_port(p)) {
                std::cerr << "ERROR: Invalid discovery port: " << p << "\n";
                return 1;
            }
            cfg.discovery_port = (u16)p;
        } else if (std::strcmp(argv[i], "--interval-ms") == 0 && has_val) {
            cfg.discovery_interval_ms = (u32)std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--broadcast") == 0 && has_val) {
            cfg.broadcast_addr = argv[++i];
        } else if (std::strcmp(argv[i], "--buffer-kb") == 0 && has_val) {
            cfg.buffer_size = (u32)std::atoi(argv[++i]) * 1024;
        } else if (std::strcmp(argv[i], "--idle-timeout-ms") == 0 && has_val) {
            cfg.idle_timeout_ms = (u32)std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--workers") == 0 && has_val) {
            cfg.max_workers = (u16)std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--threshold-mb") == 0 && has_val) {
            cfg.multi_stream_threshold = (u64)std::atoll(argv[++i]) * 1024 * 1024;
        } else if (std::strcmp(argv[i], "--min-chunk-mb") == 0 && has_val) {
            cfg.min_chunk_size = (u64)std::atoll(argv[++i]) * 1024 * 1024;
        } else if (std::strcmp(argv[i], "--port") == 0 && has_val) {
            port_int = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--dir") == 0 && has_val) {
            cfg.save_dir = argv[++i];
        } else if (std::strcmp(argv[i], "--auto-accept") == 0) {
            policy = AcceptPolicy::AUTO_ACCEPT;
        } else if (std::strcmp(argv[i], "--auto-reject") == 0) {
            policy = AcceptPolicy::AUTO_REJECT;
        } else if (std::strcmp(argv[i], "--decision-timeout-ms") == 0 && has_val) {
            cfg.decision_timeout_ms = (u32)std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--size-limit-mb") == 0 && has_val) {
            cfg.max_file_size = (u64)std::atoll(argv[++i]) * 1024 * 1024;
        } else if (std::strcmp(argv[i], "--overwrite") == 0) {
            cfg.overwrite_files = true;
        } else if (std::strcmp(argv[i], "--no-subfolders") == 0) {
            cfg.create_subfolders = false;
        } else if (std::strcmp(argv[i], "--no-verify") == 0) {
            cfg.verify_checksums = false;
        } else if (std::strncmp(argv[i], "--", 2) == 0) {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        } else {
            positional.push_back(argv[i]);
        }
    }

    if (!utils::validate_port(port_int)) {
        std::cerr << "ERROR: Invalid port: " << port_int << "\n";
        return 1;
    }
    cfg.listen_port = (u16)port_int;

    try {
        cfg.validate();
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }

    std::signal(SIGINT,  sig_handler);
    std::signal(SIGTERM, sig_handler);

    try {
        Engine engine(cfg);
        if (command == "peers") {
            return cmd_peers(engine);
        }
        if (command == "send") {
            if (positional.size() < 2) {
                print_usage(argv[0]);
                return 1;
            }
            std::vector<std::string> paths(positional.begin() + 1, positional.end());
            return cmd_send(engine, positional[0], paths);
        }
        if (command == "recv") {
            return cmd_recv(engine, cfg.listen_port, policy);
        }
        std::cerr << "Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
