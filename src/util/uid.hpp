#pragma once
/**
 * Identifier helpers for envelopes and traces.
 *
 *   generate_uuid()     -> "3f2b9c1e-7a4d-4e0b-9c55-2d8f6b1a0e47" (RFC 4122 v4 layout)
 *   generate_trace_id() -> 32 lowercase hex digits (W3C trace-id)
 *   generate_span_id()  -> 16 lowercase hex digits (W3C parent-id)
 *
 * Randomness comes from a per-thread mt19937_64 seeded from std::random_device,
 * mixed with the high-resolution clock for platforms whose random_device is
 * deterministic.
 */
#include <chrono>
#include <cstdint>
#include <random>
#include <string>

namespace agentbus::util {

namespace detail {

inline std::mt19937_64& rng() {
    thread_local std::mt19937_64 engine([] {
        std::random_device rd;
        uint64_t seed = (static_cast<uint64_t>(rd()) << 32) ^ rd();
        seed ^= static_cast<uint64_t>(
            std::chrono::high_resolution_clock::now().time_since_epoch().count());
        return seed;
    }());
    return engine;
}

inline std::string random_hex(size_t digits) {
    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.reserve(digits);
    while (out.size() < digits) {
        uint64_t bits = rng()();
        for (int i = 0; i < 16 && out.size() < digits; ++i) {
            out.push_back(kHex[bits & 0xF]);
            bits >>= 4;
        }
    }
    return out;
}

} // namespace detail

inline std::string generate_uuid() {
    std::string hex = detail::random_hex(32);
    hex[12] = '4';                                   // version 4
    hex[16] = "89ab"[detail::rng()() & 0x3];         // RFC 4122 variant
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

inline std::string generate_trace_id() {
    return detail::random_hex(32);
}

inline std::string generate_span_id() {
    return detail::random_hex(16);
}

// Wall clock in milliseconds since the Unix epoch
inline int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace agentbus::util
