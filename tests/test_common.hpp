#pragma once

#include "bjd/bjd.hpp"

#include <cstdint>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#define CHECK(cond) do { \
    if (!(cond)) { \
        std::ostringstream _oss; \
        _oss << "CHECK failed: " #cond " at " << __FILE__ << ":" << __LINE__; \
        throw std::runtime_error(_oss.str()); \
    } \
} while (0)

// Runs `expr` and checks that it throws BjdError of `kind`. Yields the error offset via `off`.
#define CHECK_THROWS_KIND(expr, k, off) do { \
    bool _thrown = false; \
    try { \
        (void)(expr); \
    } catch (const bjd::BjdError& _e) { \
        _thrown = true; \
        CHECK(_e.kind() == (k)); \
        (off) = _e.offset(); \
    } \
    CHECK(_thrown); \
} while (0)

namespace bjd_test {

// Minimal BJData writer for building test inputs.
class ByteWriter {
public:
    explicit ByteWriter(bjd::ByteOrder order = bjd::ByteOrder::Little) : order_(order) {}

    ByteWriter& raw(const std::string& s) {
        bytes_.insert(bytes_.end(), s.begin(), s.end());
        return *this;
    }

    ByteWriter& byte(std::uint8_t b) {
        bytes_.push_back(b);
        return *this;
    }

    // Unmarked integer of `width` bytes.
    ByteWriter& uint(std::uint64_t v, std::size_t width) {
        for (std::size_t i = 0; i < width; ++i) {
            std::size_t shift = order_ == bjd::ByteOrder::Little ? i : (width - 1 - i);
            bytes_.push_back(static_cast<std::uint8_t>(v >> (8 * shift)));
        }
        return *this;
    }

    ByteWriter& f32(float f) {
        std::uint32_t bits;
        std::memcpy(&bits, &f, 4);
        return uint(bits, 4);
    }

    ByteWriter& f64(double d) {
        std::uint64_t bits;
        std::memcpy(&bits, &d, 8);
        return uint(bits, 8);
    }

    // Marked uint8 length.
    ByteWriter& len(std::uint8_t n) { return byte('U').byte(n); }

    // `S` string body (length + bytes), no leading marker.
    ByteWriter& text(const std::string& s) {
        len(static_cast<std::uint8_t>(s.size()));
        return raw(s);
    }

    ByteWriter& str(const std::string& s) { return byte('S').text(s); }

    // Object key.
    ByteWriter& key(const std::string& s) { return text(s); }

    const std::vector<std::uint8_t>& bytes() const { return bytes_; }
    std::size_t size() const { return bytes_.size(); }

private:
    bjd::ByteOrder order_;
    std::vector<std::uint8_t> bytes_;
};

inline std::vector<std::uint8_t> bytes_of(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

inline std::int64_t as_int(const bjd::Value& v) { return std::get<std::int64_t>(v.v); }

inline double as_float(const bjd::Value& v) { return std::get<double>(v.v); }

inline const bjd::Value& field(const bjd::Object& o, const std::string& k) {
    const bjd::Value* v = o.find(k);
    if (!v) throw std::runtime_error("missing field: " + k);
    return *v;
}

} // namespace bjd_test
