#pragma once

// ============================================================
// utils.hpp -- Clock, formatting and argument validation helpers
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdio>
#include <sstream>
#include <iomanip>

namespace utils {

// Monotonic milliseconds. The engine only ever compares differences,
// so the epoch does not matter.
inline u64 now_ms() {
    using namespace std::chrono;
    return (u64)duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()
    ).count();
}

// Format bytes as human-readable (e.g., "1.23 KB")
inline std::string format_bytes(u64 bytes) {
    std::ostringstream ss;
    if (bytes < 1024ULL) {
        ss << bytes << " B";
    } else if (bytes < 1024ULL * 1024) {
        ss << std::fixed << std::setprecision(2) << (double)bytes / 1024.0 << " KB";
    } else {
        ss << std::fixed << std::setprecision(2) << (double)bytes / (1024.0 * 1024) << " MB";
    }
    return ss.str();
}

// Transfer rate in kByte/s over a millisecond interval
inline std::string format_rate(u64 bytes, u64 elapsed_ms) {
    double secs = elapsed_ms > 0 ? (double)elapsed_ms / 1000.0 : 0.001;
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << ((double)bytes / secs) / 1024.0 << " kByte/s";
    return ss.str();
}

inline std::string format_seconds(u64 elapsed_ms) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << (double)elapsed_ms / 1000.0 << "s";
    return ss.str();
}

// Validate IPv4 address string
inline bool validate_ip(const std::string& ip) {
    int a, b, c, d;
    char tail;
    if (std::sscanf(ip.c_str(), "%d.%d.%d.%d%c", &a, &b, &c, &d, &tail) != 4) return false;
    return (a >= 0 && a <= 255) && (b >= 0 && b <= 255) &&
           (c >= 0 && c <= 255) && (d >= 0 && d <= 255);
}

// Validate port number (1-65535)
inline bool validate_port(int port) {
    return port >= 1 && port <= 65535;
}

// Remote paths travel as raw ASCII in the request payload
inline bool is_ascii(const std::string& s) {
    for (unsigned char c : s) {
        if (c == 0 || c > 0x7F) return false;
    }
    return true;
}

template<typename T>
inline T clamp(T val, T lo, T hi) {
    return val < lo ? lo : (val > hi ? hi : val);
}

} // namespace utils
