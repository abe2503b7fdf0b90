#pragma once

// ============================================================
// socket.hpp -- RAII TCP/UDP socket wrappers
//
// TcpSocket runs in non-blocking mode; every wait is a poll in
// POLL_SLICE_MS slices that checks the attached cancel flag and
// the idle deadline. Errors are thrown as TransferError.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <atomic>
#include <string>
#include <stdexcept>
#include <vector>

static constexpr int POLL_SLICE_MS = 100;

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: connect to remote, giving up after timeout_ms
    void connect(const std::string& ip, u16 port, int timeout_ms = 5000);

    // Server: bind + listen
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 128);

    // Accept one connection; returns an invalid socket if none arrives in timeout_ms
    TcpSocket accept(int timeout_ms);

    // Send exactly 'len' bytes; throws on error, idle timeout or cancel
    void send_all(const void* buf, size_t len);

    // Receive exactly 'len' bytes; returns false on clean close
    bool recv_all(void* buf, size_t len);

    // Send a complete frame (header + payload)
    void write_frame(MsgType type, u16 flags, const void* payload, u32 payload_len);

    // Read next frame: fills header, resizes payload_buf and reads payload
    // Returns false on clean close (peer disconnected)
    bool read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf);

    // Apply TCP performance tuning
    void tune();

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    void close();

    // Get peer address as "ip:port" / "ip"
    std::string peer_addr() const;
    std::string peer_ip() const;

    u16 local_port() const;

    // Longest wait without progress before IdleTimeout (0 = infinite)
    void set_idle_timeout_ms(u32 ms) { idle_timeout_ms_ = ms; }
    u32 idle_timeout_ms() const { return idle_timeout_ms_; }

    // Flag polled between slices; when set, blocked calls throw Cancelled
    void set_cancel_flag(const std::atomic<bool>* flag) { cancel_ = flag; }

    // Sockets currently open in this process
    static i64 open_count() { return open_count_.load(); }

private:
    socket_t fd_{INVALID_SOCKET_VAL};
    u32 idle_timeout_ms_{0};
    const std::atomic<bool>* cancel_{nullptr};

    static std::atomic<i64> open_count_;

    void adopt();
    void set_nonblocking();
    // Poll for 'events' until ready; throws on cancel or idle timeout.
    // A negative limit_ms uses the idle timeout.
    void wait_io(short events, const char* what, int limit_ms = -1);
};

class UdpSocket {
public:
    UdpSocket();
    ~UdpSocket();

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;
    UdpSocket(UdpSocket&& o) noexcept;
    UdpSocket& operator=(UdpSocket&& o) noexcept;

    // Bind with address reuse so several instances can share the discovery port
    void bind(const std::string& ip, u16 port);

    void enable_broadcast();

    void send_to(const std::string& ip, u16 port, const void* data, size_t len);

    // Wait up to timeout_ms for one datagram.
    // Returns -1 on timeout, otherwise the datagram length; from_ip is filled.
    int recv_from(void* buf, size_t cap, std::string& from_ip, int timeout_ms);

    u16 local_port() const;

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    void close();

private:
    socket_t fd_{INVALID_SOCKET_VAL};
};
