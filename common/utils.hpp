#pragma once

// ============================================================
// utils.hpp -- Clock, formatting and validation helpers
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <random>

namespace utils {

// Monotonic milliseconds; only differences are meaningful
inline u64 now_ms() {
    using namespace std::chrono;
    return (u64)duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

// value scaled by 1024 per unit step, e.g. "1.23 MB" or "512 B"
inline std::string format_scaled(double value, const char* const* units, int unit_count,
                                 int first_precision) {
    int unit = 0;
    while (value >= 1024.0 && unit + 1 < unit_count) {
        value /= 1024.0;
        ++unit;
    }
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%.*f %s", unit == 0 ? first_precision : 2, value, units[unit]);
    return buf;
}

inline std::string format_bytes(u64 bytes) {
    static const char* const units[] = {"B", "KB", "MB", "GB", "TB"};
    return format_scaled((double)bytes, units, 5, 0);
}

inline std::string format_speed(double bytes_per_sec) {
    static const char* const units[] = {"B/s", "KB/s", "MB/s", "GB/s"};
    return format_scaled(bytes_per_sec < 0 ? 0.0 : bytes_per_sec, units, 4, 1);
}

// "1h 23m 45s", "2m 5s" or "45s"
inline std::string format_duration_s(u64 seconds) {
    std::string out;
    if (seconds >= 3600) out += std::to_string(seconds / 3600) + "h ";
    if (seconds >= 60)   out += std::to_string((seconds % 3600) / 60) + "m ";
    return out + std::to_string(seconds % 60) + "s";
}

// Dotted-quad IPv4 only; host names are resolved by discovery, not here
inline bool validate_ip(const std::string& ip) {
    int a, b, c, d;
    char tail;
    if (std::sscanf(ip.c_str(), "%d.%d.%d.%d%c", &a, &b, &c, &d, &tail) != 4) return false;
    for (int octet : {a, b, c, d}) {
        if (octet < 0 || octet > 255) return false;
    }
    return true;
}

inline bool validate_port(int port) {
    return port >= 1 && port <= 65535;
}

// Random non-zero 64-bit identity for this process's discovery instance
inline u64 random_instance_id() {
    std::random_device rd;
    std::mt19937_64 gen(((u64)rd() << 32) ^ (u64)rd() ^
                        (u64)std::chrono::steady_clock::now().time_since_epoch().count());
    u64 v = gen();
    return v == 0 ? 1 : v;
}

template<typename T>
inline T clamp(T val, T lo, T hi) {
    return val < lo ? lo : (val > hi ? hi : val);
}

} // namespace utils
