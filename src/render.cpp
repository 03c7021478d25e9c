#include "bjd/bjd.hpp"
#include "bjd_internal.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <ostream>
#include <sstream>

namespace bjd {

namespace {

constexpr std::size_t kInlineMaxItems = 10;
constexpr std::size_t kInlineMaxWidth = 80;

std::string escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');
    for (unsigned char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(c));
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    out.push_back('"');
    return out;
}

std::string dims_to_string(const std::vector<std::size_t>& dims) {
    std::ostringstream oss;
    oss << '[';
    for (std::size_t i = 0; i < dims.size(); ++i) {
        if (i) oss << ", ";
        oss << dims[i];
    }
    oss << ']';
    return oss.str();
}

bool is_inline_scalar(const Value& v) {
    return std::holds_alternative<bool>(v.v) || std::holds_alternative<std::int64_t>(v.v) ||
           std::holds_alternative<std::uint64_t>(v.v) || std::holds_alternative<double>(v.v) ||
           std::holds_alternative<Byte>(v.v);
}

struct Renderer {
    const RenderOptions& opts;
    std::size_t indent;

    std::string pad() const { return std::string(indent * 2, ' '); }

    std::string nested(const Value& v) const { return render(v, opts, indent + 1); }

    std::string flat(const Value& v) const { return render(v, opts, 0); }

    std::string operator()(std::nullptr_t) const { return "null"; }

    std::string operator()(bool b) const { return b ? "true" : "false"; }

    std::string operator()(std::int64_t i) const { return std::to_string(i); }

    std::string operator()(std::uint64_t u) const { return std::to_string(u); }

    std::string operator()(double d) const { return format_float(d); }

    std::string operator()(const Char& c) const {
        std::string s;
        internal::append_utf8(s, c.code < 0x80 ? c.code : 0xFFFDu);
        return escape(s);
    }

    std::string operator()(const Byte& b) const { return std::to_string(b.value); }

    std::string operator()(const std::string& s) const { return escape(truncate_string(s, opts.max_string)); }

    std::string operator()(const HighPrec& h) const { return "HighPrec(" + h.digits + ")"; }

    std::string operator()(const Array& a) const {
        if (a.empty()) return "[]";
        if (a.size() > opts.max_items) {
            std::string preview;
            for (std::size_t i = 0; i < internal::kShowCount && i < a.size(); ++i) {
                if (i) preview += ", ";
                preview += flat(a[i]);
            }
            return "<array[" + std::to_string(a.size()) + "]: [" + preview + ", ...]>";
        }
        if (a.size() <= kInlineMaxItems) {
            bool all_scalar = true;
            for (const auto& x : a) {
                if (!is_inline_scalar(x)) { all_scalar = false; break; }
            }
            if (all_scalar) {
                std::string s = "[";
                for (std::size_t i = 0; i < a.size(); ++i) {
                    if (i) s += ", ";
                    s += flat(a[i]);
                }
                s += "]";
                if (s.size() < kInlineMaxWidth) return s;
            }
        }
        std::string out = "[";
        for (const auto& x : a) {
            out += "\n" + pad() + "  " + nested(x) + ",";
        }
        out += "\n" + pad() + "]";
        return out;
    }

    std::string operator()(const Object& o) const {
        if (o.empty()) return "{}";
        const auto& entries = o.entries();
        if (entries.size() > opts.max_items) {
            std::string preview;
            for (std::size_t i = 0; i < internal::kShowCount && i < entries.size(); ++i) {
                if (i) preview += ", ";
                preview += escape(entries[i].first) + ": " + flat(entries[i].second);
            }
            return "<object[" + std::to_string(entries.size()) + " keys]: { " + preview + ", ... }>";
        }
        std::string out = "{";
        for (const auto& kv : entries) {
            out += "\n" + pad() + "  " + escape(kv.first) + ": " + nested(kv.second) + ",";
        }
        out += "\n" + pad() + "}";
        return out;
    }

    std::string operator()(const TypedArray& a) const {
        std::string head = "<" + a.elem_name;
        if (a.nd) {
            head += dims_to_string(a.dims) + (a.column_major ? " col" : " row");
        } else {
            head += "[" + std::to_string(a.count) + "]";
        }
        head += ": ";

        auto list = [&](std::size_t n) {
            std::string s = "[";
            for (std::size_t i = 0; i < n && i < a.values.size(); ++i) {
                if (i) s += ", ";
                s += flat(a.values[i]);
            }
            return s + "]";
        };

        switch (a.state) {
            case PreviewState::Truncated:
                return head + internal::to_hex(a.head.data(), a.head.size()) + "... (truncated: " +
                       std::to_string(a.available_bytes) + "B of " + std::to_string(a.total_bytes) + "B)>";
            case PreviewState::Sampled: {
                std::string size = a.total_bytes > 0 ? std::to_string(a.total_bytes) + "B"
                                                     : std::to_string(a.count) + " items";
                return head + list(internal::kShowCount) + "... (" + size + ")>";
            }
            case PreviewState::Full:
                break;
        }
        return head + list(a.values.size()) + ">";
    }

    std::string operator()(const SoaRecordSet& s) const {
        std::string header = "<soa " + to_string(s.layout) + " " + dims_to_string(s.dims) + ": " +
                             std::to_string(s.count) + " records>";
        if (s.records.empty()) return header + " []";

        // Also collapsed when the decoder kept only a sample.
        const bool collapsed = s.count > opts.max_items || s.records.size() < s.count;
        const std::size_t shown = collapsed ? std::min(internal::kShowCount, s.records.size()) : s.records.size();
        Renderer inner{opts, indent + 1};

        std::string out = header + "\n" + pad() + "[";
        for (std::size_t i = 0; i < shown; ++i) {
            out += "\n" + pad() + "  " + inner(s.records[i]) + ",";
        }
        if (collapsed) {
            out += "\n" + pad() + "  ... (" + std::to_string(s.count - shown) + " more)";
        }
        out += "\n" + pad() + "]";
        return out;
    }
};

} // namespace

std::string format_float(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d > 0 ? "inf" : "-inf";
    char buf[64];
    auto r = std::to_chars(buf, buf + sizeof(buf), d);
    std::string s(buf, r.ptr);
    if (s.find_first_of(".e") == std::string::npos) s += ".0";
    return s;
}

std::string truncate_string(const std::string& s, std::size_t max_string) {
    const std::size_t n = internal::utf8_length(s);
    if (n <= max_string) return s;

    // Byte offset of every code point start.
    std::vector<std::size_t> starts;
    starts.reserve(n);
    for (std::size_t i = 0; i < s.size(); ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) starts.push_back(i);
    }
    const std::size_t half = max_string / 2;
    std::string prefix = s.substr(0, half < starts.size() ? starts[half] : s.size());
    std::string suffix = half == 0 ? std::string() : s.substr(starts[starts.size() - half]);
    return prefix + "..." + suffix + " (" + std::to_string(n) + " chars)";
}

void hex_dump(std::ostream& os, const std::uint8_t* data, std::size_t size, std::size_t begin, std::size_t end) {
    end = std::min(end, size);
    for (std::size_t row = begin; row < end; row += 16) {
        const std::size_t n = std::min<std::size_t>(16, end - row);
        std::string ascii;
        for (std::size_t i = row; i < row + n; ++i) {
            ascii.push_back(data[i] >= 0x20 && data[i] < 0x7F ? static_cast<char>(data[i]) : '.');
        }
        std::string offset = std::to_string(row);
        if (offset.size() < 4) offset.insert(0, 4 - offset.size(), '0');
        os << "  " << offset << ": " << internal::to_hex(data + row, n) << "  " << ascii << "\n";
    }
}

std::string render(const Value& v, const RenderOptions& opts, std::size_t indent) {
    return std::visit(Renderer{opts, indent}, v.v);
}

} // namespace bjd
