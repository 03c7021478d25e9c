#include "bjd/bjd.hpp"
#include "bjd_internal.hpp"

#include <cstdio>
#include <limits>

namespace bjd {

BjdError::BjdError(ErrorKind k, std::size_t offset, const std::string& msg)
    : std::runtime_error(msg), kind_(k), offset_(offset) {}

BjdError::BjdError(ErrorKind k, std::size_t offset, std::size_t needed, std::size_t available,
                   const std::string& msg)
    : std::runtime_error(msg), kind_(k), offset_(offset), needed_(needed), available_(available) {}

ErrorKind BjdError::kind() const noexcept { return kind_; }

std::size_t BjdError::offset() const noexcept { return offset_; }

std::size_t BjdError::needed() const noexcept { return needed_; }

std::size_t BjdError::available() const noexcept { return available_; }

std::string to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::UnexpectedEof: return "unexpected-eof";
        case ErrorKind::UnknownMarker: return "unknown-marker";
        case ErrorKind::UnexpectedMarker: return "unexpected-marker";
        case ErrorKind::InvalidLength: return "invalid-length";
        case ErrorKind::MalformedSchema: return "malformed-schema";
        case ErrorKind::IndexOutOfRange: return "index-out-of-range";
        case ErrorKind::NestingTooDeep: return "nesting-too-deep";
        case ErrorKind::JsonParse: return "json-parse";
        case ErrorKind::Io: return "io";
    }
    return "unknown";
}

std::string to_string(SoaLayout layout) {
    return layout == SoaLayout::ColumnMajor ? "column-major" : "row-major";
}

// ------------------------------
// Small helpers
// ------------------------------

namespace internal {

bool checked_mul_size(std::size_t a, std::size_t b, std::size_t& out) {
    if (a == 0 || b == 0) { out = 0; return true; }
    if (a > (std::numeric_limits<std::size_t>::max)() / b) return false;
    out = a * b;
    return true;
}

bool checked_add_size(std::size_t a, std::size_t b, std::size_t& out) {
    if (a > (std::numeric_limits<std::size_t>::max)() - b) return false;
    out = a + b;
    return true;
}

void append_utf8(std::string& out, unsigned codepoint) {
    if (codepoint <= 0x7F) {
        out.push_back(static_cast<char>(codepoint));
    } else if (codepoint <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((codepoint >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else if (codepoint <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((codepoint >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((codepoint >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (codepoint & 0x3F)));
    }
}

bool is_valid_utf8(const std::uint8_t* p, std::size_t n) {
    std::size_t i = 0;
    while (i < n) {
        std::uint8_t c = p[i];
        if (c < 0x80) { ++i; continue; }

        std::size_t extra = 0;
        unsigned cp = 0;
        if (c >= 0xC2 && c <= 0xDF) { extra = 1; cp = c & 0x1Fu; }
        else if (c >= 0xE0 && c <= 0xEF) { extra = 2; cp = c & 0x0Fu; }
        else if (c >= 0xF0 && c <= 0xF4) { extra = 3; cp = c & 0x07u; }
        else return false;

        if (i + extra >= n) return false;
        for (std::size_t k = 1; k <= extra; ++k) {
            std::uint8_t cc = p[i + k];
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3Fu);
        }
        // overlong, surrogate and out-of-range sequences
        if (extra == 2 && (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF))) return false;
        if (extra == 3 && (cp < 0x10000 || cp > 0x10FFFF)) return false;
        i += extra + 1;
    }
    return true;
}

std::string decode_text(const std::uint8_t* p, std::size_t n) {
    if (n == 0) return {};
    if (is_valid_utf8(p, n)) {
        return std::string(reinterpret_cast<const char*>(p), n);
    }
    std::string out;
    out.reserve(n * 2);
    for (std::size_t i = 0; i < n; ++i) append_utf8(out, p[i]);
    return out;
}

std::size_t utf8_length(const std::string& s) {
    std::size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

std::string to_hex(const std::uint8_t* p, std::size_t n) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(n * 2);
    for (std::size_t i = 0; i < n; ++i) {
        out.push_back(digits[(p[i] >> 4) & 0x0F]);
        out.push_back(digits[p[i] & 0x0F]);
    }
    return out;
}

bool value_as_u64(const Value& v, std::uint64_t& out) {
    if (std::holds_alternative<std::int64_t>(v.v)) {
        std::int64_t i = std::get<std::int64_t>(v.v);
        if (i < 0) return false;
        out = static_cast<std::uint64_t>(i);
        return true;
    }
    if (std::holds_alternative<std::uint64_t>(v.v)) {
        out = std::get<std::uint64_t>(v.v);
        return true;
    }
    if (std::holds_alternative<Byte>(v.v)) {
        out = std::get<Byte>(v.v).value;
        return true;
    }
    return false;
}

} // namespace internal

bool is_integer_marker(std::uint8_t m) noexcept {
    switch (m) {
        case marker::kInt8:
        case marker::kUInt8:
        case marker::kInt16:
        case marker::kUInt16:
        case marker::kInt32:
        case marker::kUInt32:
        case marker::kInt64:
        case marker::kUInt64:
            return true;
        default:
            return false;
    }
}

std::string describe_marker(std::uint8_t m) {
    char buf[8];
    if (m >= 32 && m < 127) {
        std::snprintf(buf, sizeof(buf), "'%c'", static_cast<char>(m));
    } else {
        std::snprintf(buf, sizeof(buf), "0x%02x", static_cast<unsigned>(m));
    }
    return buf;
}

// ------------------------------
// Object
// ------------------------------

void Object::set(std::string key, Value v) {
    auto it = index_.find(key);
    if (it != index_.end()) {
        entries_[it->second].second = std::move(v);
        return;
    }
    index_.emplace(key, entries_.size());
    entries_.emplace_back(std::move(key), std::move(v));
}

const Value* Object::find(std::string_view key) const {
    auto it = index_.find(std::string(key));
    if (it == index_.end()) return nullptr;
    return &entries_[it->second].second;
}

std::size_t Object::size() const noexcept { return entries_.size(); }

bool Object::empty() const noexcept { return entries_.empty(); }

const std::vector<Object::Entry>& Object::entries() const noexcept { return entries_; }

// ------------------------------
// Value helpers
// ------------------------------

Value Value::make_null() {
    Value v;
    v.v.emplace<std::nullptr_t>(nullptr);
    return v;
}

Value Value::make_bool(bool b) {
    Value v;
    v.v.emplace<bool>(b);
    return v;
}

Value Value::make_int(std::int64_t i) {
    Value v;
    v.v.emplace<std::int64_t>(i);
    return v;
}

Value Value::make_uint(std::uint64_t u) {
    Value v;
    v.v.emplace<std::uint64_t>(u);
    return v;
}

Value Value::make_float(double d) {
    Value v;
    v.v.emplace<double>(d);
    return v;
}

Value Value::make_char(std::uint8_t c) {
    Value v;
    v.v.emplace<Char>(Char{c});
    return v;
}

Value Value::make_byte(std::uint8_t b) {
    Value v;
    v.v.emplace<Byte>(Byte{b});
    return v;
}

Value Value::make_string(std::string s) {
    Value v;
    v.v.emplace<std::string>(std::move(s));
    return v;
}

Value Value::make_highprec(std::string digits) {
    Value v;
    v.v.emplace<HighPrec>(HighPrec{std::move(digits)});
    return v;
}

Value Value::make_array(Array a) {
    Value v;
    v.v.emplace<Array>(std::move(a));
    return v;
}

Value Value::make_object(Object o) {
    Value v;
    v.v.emplace<Object>(std::move(o));
    return v;
}

Value Value::make_typed(TypedArray a) {
    Value v;
    v.v.emplace<TypedArray>(std::move(a));
    return v;
}

Value Value::make_soa(SoaRecordSet s) {
    Value v;
    v.v.emplace<SoaRecordSet>(std::move(s));
    return v;
}

bool Value::is_null() const noexcept { return std::holds_alternative<std::nullptr_t>(v); }

bool Value::is_array() const noexcept { return std::holds_alternative<Array>(v); }

bool Value::is_object() const noexcept { return std::holds_alternative<Object>(v); }

bool Value::is_string() const noexcept { return std::holds_alternative<std::string>(v); }

const Array& Value::as_array() const {
    if (!is_array()) throw std::logic_error("value is not an array");
    return std::get<Array>(v);
}

const Object& Value::as_object() const {
    if (!is_object()) throw std::logic_error("value is not an object");
    return std::get<Object>(v);
}

const std::string& Value::as_string() const {
    if (!is_string()) throw std::logic_error("value is not a string");
    return std::get<std::string>(v);
}

const TypedArray& Value::as_typed() const {
    if (!std::holds_alternative<TypedArray>(v)) throw std::logic_error("value is not a typed array");
    return std::get<TypedArray>(v);
}

const SoaRecordSet& Value::as_soa() const {
    if (!std::holds_alternative<SoaRecordSet>(v)) throw std::logic_error("value is not an SOA record set");
    return std::get<SoaRecordSet>(v);
}

bool operator==(const Char& a, const Char& b) noexcept { return a.code == b.code; }

bool operator==(const Byte& a, const Byte& b) noexcept { return a.value == b.value; }

bool operator==(const HighPrec& a, const HighPrec& b) noexcept { return a.digits == b.digits; }

bool operator==(const Object& a, const Object& b) { return a.entries() == b.entries(); }

bool operator==(const TypedArray& a, const TypedArray& b) {
    return a.elem_marker == b.elem_marker && a.nd == b.nd && a.dims == b.dims &&
           a.column_major == b.column_major && a.count == b.count && a.total_bytes == b.total_bytes &&
           a.available_bytes == b.available_bytes && a.state == b.state && a.values == b.values &&
           a.head == b.head;
}

// Compares the logical content only; the schema describes the encoding.
bool operator==(const SoaRecordSet& a, const SoaRecordSet& b) {
    return a.layout == b.layout && a.dims == b.dims && a.count == b.count && a.records == b.records;
}

bool operator==(const Value& a, const Value& b) { return a.v == b.v; }

bool operator!=(const Value& a, const Value& b) { return !(a == b); }

} // namespace bjd
