#include "bjd/bjd.hpp"

#include <cmath>
#include <cstring>
#include <limits>

namespace bjd {

MarkerTable::MarkerTable(ByteOrder order) : order_(order) {
    infos_ = {
        {marker::kNull, "null", 0, NumericRule::Null},
        {marker::kNoOp, "noop", 0, NumericRule::NoOp},
        {marker::kTrue, "true", 0, NumericRule::True},
        {marker::kFalse, "false", 0, NumericRule::False},
        {marker::kInt8, "int8", 1, NumericRule::Int8},
        {marker::kUInt8, "uint8", 1, NumericRule::UInt8},
        {marker::kInt16, "int16", 2, NumericRule::Int16},
        {marker::kUInt16, "uint16", 2, NumericRule::UInt16},
        {marker::kInt32, "int32", 4, NumericRule::Int32},
        {marker::kUInt32, "uint32", 4, NumericRule::UInt32},
        {marker::kInt64, "int64", 8, NumericRule::Int64},
        {marker::kUInt64, "uint64", 8, NumericRule::UInt64},
        {marker::kFloat16, "float16", 2, NumericRule::Float16},
        {marker::kFloat32, "float32", 4, NumericRule::Float32},
        {marker::kFloat64, "float64", 8, NumericRule::Float64},
        {marker::kChar, "char", 1, NumericRule::Char},
        {marker::kByte, "byte", 1, NumericRule::Byte},
    };
    for (auto& s : slot_) s = -1;
    for (std::size_t i = 0; i < infos_.size(); ++i) {
        slot_[infos_[i].marker] = static_cast<std::int16_t>(i);
    }
}

const MarkerTable& MarkerTable::get(ByteOrder order) {
    static const MarkerTable little(ByteOrder::Little);
    static const MarkerTable big(ByteOrder::Big);
    return order == ByteOrder::Big ? big : little;
}

ByteOrder MarkerTable::byte_order() const noexcept { return order_; }

const MarkerInfo* MarkerTable::find(std::uint8_t m) const noexcept {
    std::int16_t s = slot_[m];
    if (s < 0) return nullptr;
    return &infos_[static_cast<std::size_t>(s)];
}

std::uint64_t MarkerTable::load_unsigned(const std::uint8_t* p, std::size_t n) const noexcept {
    std::uint64_t u = 0;
    if (order_ == ByteOrder::Little) {
        for (std::size_t i = 0; i < n; ++i) u |= (static_cast<std::uint64_t>(p[i]) << (8 * i));
    } else {
        for (std::size_t i = 0; i < n; ++i) u = (u << 8) | static_cast<std::uint64_t>(p[i]);
    }
    return u;
}

static double half_to_double(std::uint16_t h) {
    const bool neg = (h & 0x8000u) != 0;
    const int exp = (h >> 10) & 0x1F;
    const unsigned mant = h & 0x3FFu;
    double v = 0.0;
    if (exp == 0) {
        v = std::ldexp(static_cast<double>(mant), -24);
    } else if (exp == 31) {
        v = mant ? std::numeric_limits<double>::quiet_NaN() : std::numeric_limits<double>::infinity();
    } else {
        v = std::ldexp(static_cast<double>(mant + 1024u), exp - 25);
    }
    return neg ? std::copysign(v, -1.0) : v;
}

static std::int64_t sign_extend(std::uint64_t u, std::size_t width) {
    if (width >= 8) return static_cast<std::int64_t>(u);
    const unsigned bits = static_cast<unsigned>(width * 8);
    const std::uint64_t sign = 1ull << (bits - 1);
    if (u & sign) {
        u |= ~((1ull << bits) - 1);
    }
    return static_cast<std::int64_t>(u);
}

bool MarkerTable::decode_integer(const MarkerInfo& info, const std::uint8_t* p, std::int64_t& out_signed,
                                 std::uint64_t& out_unsigned, bool& is_unsigned) const {
    switch (info.rule) {
        case NumericRule::Int8:
        case NumericRule::Int16:
        case NumericRule::Int32:
        case NumericRule::Int64:
            out_signed = sign_extend(load_unsigned(p, info.width), info.width);
            is_unsigned = false;
            return true;
        case NumericRule::UInt8:
        case NumericRule::UInt16:
        case NumericRule::UInt32:
        case NumericRule::UInt64:
            out_unsigned = load_unsigned(p, info.width);
            is_unsigned = true;
            return true;
        default:
            return false;
    }
}

Value MarkerTable::decode(const MarkerInfo& info, const std::uint8_t* p) const {
    switch (info.rule) {
        case NumericRule::Null:
        case NumericRule::NoOp:
            return Value::make_null();
        case NumericRule::True:
            return Value::make_bool(true);
        case NumericRule::False:
            return Value::make_bool(false);
        case NumericRule::Float16:
            return Value::make_float(half_to_double(static_cast<std::uint16_t>(load_unsigned(p, 2))));
        case NumericRule::Float32: {
            std::uint32_t bits = static_cast<std::uint32_t>(load_unsigned(p, 4));
            float f;
            std::memcpy(&f, &bits, 4);
            return Value::make_float(static_cast<double>(f));
        }
        case NumericRule::Float64: {
            std::uint64_t bits = load_unsigned(p, 8);
            double d;
            std::memcpy(&d, &bits, 8);
            return Value::make_float(d);
        }
        case NumericRule::Char:
            return Value::make_char(p[0]);
        case NumericRule::Byte:
            return Value::make_byte(p[0]);
        default:
            break;
    }

    std::int64_t s = 0;
    std::uint64_t u = 0;
    bool is_unsigned = false;
    if (!decode_integer(info, p, s, u, is_unsigned)) return Value::make_null();
    if (!is_unsigned) return Value::make_int(s);
    if (u <= static_cast<std::uint64_t>((std::numeric_limits<std::int64_t>::max)())) {
        return Value::make_int(static_cast<std::int64_t>(u));
    }
    return Value::make_uint(u);
}

} // namespace bjd
