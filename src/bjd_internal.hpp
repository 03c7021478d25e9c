#pragma once

#include "bjd/bjd.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bjd::internal {

// Preview sizing shared by the decoder and the renderer.
inline constexpr std::size_t kSampleCount = 8;
inline constexpr std::size_t kShowCount = 4;
inline constexpr std::size_t kHeadBytes = 32;

// Deepest container nesting accepted from input.
inline constexpr int kMaxDepth = 512;

// Nesting level for the lifetime of one container. Throws before entering level kMaxDepth + 1.
struct DepthGuard {
    DepthGuard(int& d, std::size_t at) : depth(d) {
        if (depth >= kMaxDepth) {
            throw BjdError(ErrorKind::NestingTooDeep, at,
                           "nesting deeper than " + std::to_string(kMaxDepth) + " levels at " + std::to_string(at));
        }
        ++depth;
    }
    ~DepthGuard() { --depth; }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;
    int& depth;
};

/* Safe arithmetic */
bool checked_mul_size(std::size_t a, std::size_t b, std::size_t& out);
bool checked_add_size(std::size_t a, std::size_t b, std::size_t& out);

/* Text helpers */
void append_utf8(std::string& out, unsigned codepoint);
bool is_valid_utf8(const std::uint8_t* p, std::size_t n);
// UTF-8 when valid, otherwise each byte taken as a Latin-1 code point.
std::string decode_text(const std::uint8_t* p, std::size_t n);
std::size_t utf8_length(const std::string& s);

/* Hex */
std::string to_hex(const std::uint8_t* p, std::size_t n);

/* Integer view of a decoded scalar (Int, UInt, Byte). */
bool value_as_u64(const Value& v, std::uint64_t& out);

} // namespace bjd::internal
