// ============================================================
// socket.cpp -- TcpSocket / UdpSocket implementation
// ============================================================

#include "socket.hpp"
#include "protocol_io.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>
#include <climits>

#ifndef _WIN32
#  include <sys/uio.h>
#endif

// Buffer size for SO_SNDBUF / SO_RCVBUF = 4 MB
static constexpr int SOCKET_BUF_SIZE = 4 * 1024 * 1024;

std::atomic<i64> TcpSocket::open_count_{0};

static TransferError lost(const std::string& msg) {
    return TransferError(ErrorCode::CONNECTION_LOST, msg);
}

static bool parse_ipv4(const std::string& ip, in_addr& out) {
    if (ip.empty() || ip == "0.0.0.0") {
        out.s_addr = htonl(INADDR_ANY);
        return true;
    }
    return inet_pton(AF_INET, ip.c_str(), &out) == 1;
}

static std::string ipv4_str(const in_addr& a) {
    char buf[INET_ADDRSTRLEN] = {0};
    if (!inet_ntop(AF_INET, const_cast<in_addr*>(&a), buf, sizeof(buf))) return "unknown";
    return buf;
}

// ============================================================
// TcpSocket
// ============================================================

TcpSocket::TcpSocket() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw lost("socket() failed: " + socket_error_str(last_socket_error()));
    }
    adopt();
}

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {
    if (fd_ != INVALID_SOCKET_VAL) {
        adopt();
    }
}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept
    : fd_(o.fd_), idle_timeout_ms_(o.idle_timeout_ms_), cancel_(o.cancel_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        idle_timeout_ms_ = o.idle_timeout_ms_;
        cancel_ = o.cancel_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::adopt() {
    ++open_count_;
#ifndef _WIN32
    int on = 1;
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#endif
    set_nonblocking();
}

void TcpSocket::set_nonblocking() {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(fd_, FIONBIO, &mode);
#else
    int flags = fcntl(fd_, F_GETFL, 0);
    if (flags >= 0) fcntl(fd_, F_SETFL, flags | O_NONBLOCK);
#endif
}

void TcpSocket::tune() {
    int nodelay = 1;
    int keepalive = 1;
    int sndbuf = SOCKET_BUF_SIZE;
    int rcvbuf = SOCKET_BUF_SIZE;

#ifdef _WIN32
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  (const char*)&nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, (const char*)&keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    (const char*)&sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    (const char*)&rcvbuf,    sizeof(rcvbuf));
#else
    setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY,  &nodelay,   sizeof(nodelay));
    setsockopt(fd_, SOL_SOCKET,  SO_KEEPALIVE, &keepalive, sizeof(keepalive));
    setsockopt(fd_, SOL_SOCKET,  SO_SNDBUF,    &sndbuf,    sizeof(sndbuf));
    setsockopt(fd_, SOL_SOCKET,  SO_RCVBUF,    &rcvbuf,    sizeof(rcvbuf));
#endif
}

void TcpSocket::wait_io(short events, const char* what, int limit_ms) {
    u32 limit = limit_ms >= 0 ? (u32)limit_ms : idle_timeout_ms_;
    u64 start = utils::now_ms();
    for (;;) {
        if (cancel_ && cancel_->load()) {
            throw TransferError(ErrorCode::CANCELLED, std::string(what) + " cancelled");
        }
        pollfd_t pfd{};
        pfd.fd     = fd_;
        pfd.events = events;
        int rc = POLL_SOCKETS(&pfd, 1, POLL_SLICE_MS);
        if (rc > 0) return;  // ready, or an error the next call will surface
        if (rc < 0) {
            int err = last_socket_error();
            if (!interrupted(err)) {
                throw lost("poll() failed: " + socket_error_str(err));
            }
        }
        if (limit > 0 && utils::now_ms() - start >= limit) {
            throw TransferError(ErrorCode::IDLE_TIMEOUT,
                                std::string(what) + ": no progress for " + std::to_string(limit) + " ms");
        }
    }
}

void TcpSocket::connect(const std::string& ip, u16 port, int timeout_ms) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (ip.empty() || inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::invalid_argument("Invalid IP address: " + ip);
    }

    if (::connect(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        int err = last_socket_error();
#ifdef _WIN32
        bool pending = (err == WSAEWOULDBLOCK);
#else
        bool pending = (err == EINPROGRESS || err == EINTR);
#endif
        if (!pending) {
            throw lost("connect() to " + ip + ":" + std::to_string(port) +
                       " failed: " + socket_error_str(err));
        }
        try {
            wait_io(POLLOUT, "connect", timeout_ms);
        } catch (const TransferError& e) {
            if (e.code() != ErrorCode::IDLE_TIMEOUT) throw;
            throw lost("connect() to " + ip + ":" + std::to_string(port) + " timed out");
        }
        int so_err = 0;
#ifdef _WIN32
        int len = sizeof(so_err);
        getsockopt(fd_, SOL_SOCKET, SO_ERROR, (char*)&so_err, &len);
#else
        socklen_t len = sizeof(so_err);
        getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_err, &len);
#endif
        if (so_err != 0) {
            throw lost("connect() to " + ip + ":" + std::to_string(port) +
                       " failed: " + socket_error_str(so_err));
        }
    }
    tune();
}

void TcpSocket::bind_and_listen(const std::string& ip, u16 port, int backlog) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (!parse_ipv4(ip, addr.sin_addr)) {
        throw std::invalid_argument("Invalid IP address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("bind() to port " + std::to_string(port) + " failed: " +
                                 socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("listen() failed: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept(int timeout_ms) {
    u64 start = utils::now_ms();
    for (;;) {
        if (cancel_ && cancel_->load()) {
            throw TransferError(ErrorCode::CANCELLED, "accept cancelled");
        }
        pollfd_t pfd{};
        pfd.fd     = fd_;
        pfd.events = POLLIN;
        int slice = timeout_ms >= 0 ? std::min(POLL_SLICE_MS, timeout_ms) : POLL_SLICE_MS;
        int rc = POLL_SOCKETS(&pfd, 1, slice);
        if (rc > 0) {
            sockaddr_in peer{};
#ifdef _WIN32
            int peer_len = sizeof(peer);
#else
            socklen_t peer_len = sizeof(peer);
#endif
            socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
            if (client != INVALID_SOCKET_VAL) {
                TcpSocket s(client);
                s.tune();
                return s;
            }
            int err = last_socket_error();
            if (!would_block(err) && !interrupted(err)) {
                throw std::runtime_error("accept() failed: " + socket_error_str(err));
            }
        } else if (rc < 0) {
            int err = last_socket_error();
            if (!interrupted(err)) {
                throw std::runtime_error("poll() on listener failed: " + socket_error_str(err));
            }
        }
        if (timeout_ms >= 0 && utils::now_ms() - start >= (u64)timeout_ms) {
            return TcpSocket(INVALID_SOCKET_VAL);
        }
    }
}

void TcpSocket::send_all(const void* buf, size_t len) {
    if (cancel_ && cancel_->load()) {
        throw TransferError(ErrorCode::CANCELLED, "send cancelled");
    }
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        int sent = ::send(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
#endif
        if (sent > 0) {
            p += sent;
            remaining -= static_cast<size_t>(sent);
            continue;
        }
        if (sent == 0) {
            throw lost("Connection closed during send");
        }
        int err = last_socket_error();
        if (would_block(err) || interrupted(err)) {
            wait_io(POLLOUT, "send");
            continue;
        }
        throw lost("send() failed: " + socket_error_str(err));
    }
}

bool TcpSocket::recv_all(void* buf, size_t len) {
    if (cancel_ && cancel_->load()) {
        throw TransferError(ErrorCode::CANCELLED, "recv cancelled");
    }
    char* p = static_cast<char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
#ifdef _WIN32
        int received = ::recv(fd_, p, (int)std::min(remaining, (size_t)INT_MAX), 0);
#else
        ssize_t received = ::recv(fd_, p, remaining, 0);
#endif
        if (received > 0) {
            p += received;
            remaining -= static_cast<size_t>(received);
            continue;
        }
        if (received == 0) return false; // clean close
        int err = last_socket_error();
        if (would_block(err) || interrupted(err)) {
            wait_io(POLLIN, "recv");
            continue;
        }
        throw lost("recv() failed: " + socket_error_str(err));
    }
    return true;
}

void TcpSocket::write_frame(MsgType type, u16 flags, const void* payload, u32 payload_len) {
    u8 hdr_buf[8];
    FrameHeader hdr;
    hdr.msg_type    = static_cast<u16>(type);
    hdr.flags       = flags;
    hdr.payload_len = payload_len;
    proto::encode_header(hdr, hdr_buf);

    if (cancel_ && cancel_->load()) {
        throw TransferError(ErrorCode::CANCELLED, "send cancelled");
    }
    if (payload_len == 0 || !payload) {
        send_all(hdr_buf, 8);
        return;
    }

#ifdef _WIN32
    std::vector<u8> frame(8 + (size_t)payload_len);
    std::memcpy(frame.data(), hdr_buf, 8);
    std::memcpy(frame.data() + 8, payload, payload_len);
    send_all(frame.data(), frame.size());
#else
    // sendmsg: merge header + payload into one syscall, handle partial sends
    size_t total = 8 + payload_len;
    size_t sent_total = 0;
    while (sent_total < total) {
        // Rebuild iovec from remaining data
        struct iovec cur[2];
        int cur_cnt = 0;
        size_t skip = sent_total;
        for (int i = 0; i < 2; ++i) {
            size_t seg_len = (i == 0) ? 8 : (size_t)payload_len;
            const char* seg_base = (i == 0) ? reinterpret_cast<const char*>(hdr_buf)
                                             : static_cast<const char*>(payload);
            if (skip >= seg_len) { skip -= seg_len; continue; }
            cur[cur_cnt].iov_base = const_cast<char*>(seg_base + skip);
            cur[cur_cnt].iov_len  = seg_len - skip;
            skip = 0;
            ++cur_cnt;
        }
        msghdr msg{};
        msg.msg_iov    = cur;
        msg.msg_iovlen = cur_cnt;
        ssize_t n = ::sendmsg(fd_, &msg, MSG_NOSIGNAL);
        if (n < 0) {
            int err = errno;
            if (err == EINTR) continue;
            if (would_block(err)) {
                wait_io(POLLOUT, "send");
                continue;
            }
            throw lost("sendmsg failed: " + socket_error_str(err));
        }
        sent_total += (size_t)n;
    }
#endif
}

bool TcpSocket::read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf) {
    u8 hdr_buf[8];
    if (!recv_all(hdr_buf, 8)) return false;
    hdr = proto::decode_header(hdr_buf);
    if (hdr.payload_len > MAX_PAYLOAD_LEN) {
        throw ProtocolViolation("payload too large: " + std::to_string(hdr.payload_len));
    }
    payload_buf.resize(hdr.payload_len);
    if (hdr.payload_len > 0) {
        if (!recv_all(payload_buf.data(), hdr.payload_len)) return false;
    }
    return true;
}

void TcpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
        --open_count_;
    }
}

std::string TcpSocket::peer_addr() const {
    sockaddr_in peer{};
#ifdef _WIN32
    int len = sizeof(peer);
#else
    socklen_t len = sizeof(peer);
#endif
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        return ipv4_str(peer.sin_addr) + ":" + std::to_string(ntohs(peer.sin_port));
    }
    return "unknown";
}

std::string TcpSocket::peer_ip() const {
    sockaddr_in peer{};
#ifdef _WIN32
    int len = sizeof(peer);
#else
    socklen_t len = sizeof(peer);
#endif
    if (getpeername(fd_, (sockaddr*)&peer, &len) == 0) {
        return ipv4_str(peer.sin_addr);
    }
    return "unknown";
}

u16 TcpSocket::local_port() const {
    sockaddr_in local{};
#ifdef _WIN32
    int len = sizeof(local);
#else
    socklen_t len = sizeof(local);
#endif
    if (getsockname(fd_, (sockaddr*)&local, &len) != 0) return 0;
    return ntohs(local.sin_port);
}

// ============================================================
// UdpSocket
// ============================================================

UdpSocket::UdpSocket() {
    fd_ = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw std::runtime_error("socket(UDP) failed: " + socket_error_str(last_socket_error()));
    }
}

UdpSocket::~UdpSocket() {
    close();
}

UdpSocket::UdpSocket(UdpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

UdpSocket& UdpSocket::operator=(UdpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void UdpSocket::bind(const std::string& ip, u16 port) {
    int on = 1;
#ifdef _WIN32
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, (const char*)&on, sizeof(on));
#else
    setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
#  ifdef SO_REUSEPORT
    setsockopt(fd_, SOL_SOCKET, SO_REUSEPORT, &on, sizeof(on));
#  endif
#endif
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (!parse_ipv4(ip, addr.sin_addr)) {
        throw std::invalid_argument("Invalid IP address: " + ip);
    }
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw std::runtime_error("bind(UDP) to port " + std::to_string(port) + " failed: " +
                                 socket_error_str(last_socket_error()));
    }
}

void UdpSocket::enable_broadcast() {
    int on = 1;
#ifdef _WIN32
    int rc = setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, (const char*)&on, sizeof(on));
#else
    int rc = setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on));
#endif
    if (rc != 0) {
        throw std::runtime_error("SO_BROADCAST failed: " + socket_error_str(last_socket_error()));
    }
}

void UdpSocket::send_to(const std::string& ip, u16 port, const void* data, size_t len) {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) {
        throw std::invalid_argument("Invalid IP address: " + ip);
    }
#ifdef _WIN32
    int rc = ::sendto(fd_, (const char*)data, (int)len, 0, (sockaddr*)&addr, sizeof(addr));
#else
    ssize_t rc = ::sendto(fd_, data, len, 0, (sockaddr*)&addr, sizeof(addr));
#endif
    if (rc < 0) {
        throw std::runtime_error("sendto " + ip + ":" + std::to_string(port) + " failed: " +
                                 socket_error_str(last_socket_error()));
    }
}

int UdpSocket::recv_from(void* buf, size_t cap, std::string& from_ip, int timeout_ms) {
    pollfd_t pfd{};
    pfd.fd     = fd_;
    pfd.events = POLLIN;
    int rc = POLL_SOCKETS(&pfd, 1, timeout_ms);
    if (rc == 0) return -1;
    if (rc < 0) {
        int err = last_socket_error();
        if (interrupted(err)) return -1;
        throw std::runtime_error("poll(UDP) failed: " + socket_error_str(err));
    }

    sockaddr_in from{};
#ifdef _WIN32
    int from_len = sizeof(from);
    int n = ::recvfrom(fd_, (char*)buf, (int)cap, 0, (sockaddr*)&from, &from_len);
    if (n < 0 && last_socket_error() == WSAEMSGSIZE) n = (int)cap;  // truncated datagram
#else
    socklen_t from_len = sizeof(from);
    ssize_t n = ::recvfrom(fd_, buf, cap, 0, (sockaddr*)&from, &from_len);
#endif
    if (n < 0) {
        int err = last_socket_error();
        if (would_block(err) || interrupted(err)) return -1;
        throw std::runtime_error("recvfrom failed: " + socket_error_str(err));
    }
    from_ip = ipv4_str(from.sin_addr);
    return (int)n;
}

u16 UdpSocket::local_port() const {
    sockaddr_in local{};
#ifdef _WIN32
    int len = sizeof(local);
#else
    socklen_t len = sizeof(local);
#endif
    if (getsockname(fd_, (sockaddr*)&local, &len) != 0) return 0;
    return ntohs(local.sin_port);
}

void UdpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}
