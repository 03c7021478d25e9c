#include "bjd/bjd.hpp"
#include "bjd_internal.hpp"

#include <charconv>
#include <cstdlib>

namespace bjd {

// ------------------------------
// Textual JSON
// ------------------------------

namespace {

class JsonTextParser {
public:
    explicit JsonTextParser(std::string_view s) : s_(s) {}

    Value parse() {
        skip_ws();
        Value out = parse_value();
        skip_ws();
        if (pos_ != s_.size()) fail("trailing data in JSON");
        return out;
    }

private:
    std::string_view s_;
    std::size_t pos_{0};
    int depth_{0};

    [[noreturn]] void fail(const std::string& msg) const {
        throw BjdError(ErrorKind::JsonParse, pos_, msg);
    }

    void skip_ws() {
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c == ' ' || c == '\n' || c == '\r' || c == '\t') {
                ++pos_;
                continue;
            }
            break;
        }
    }

    char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

    char get() {
        if (pos_ >= s_.size()) fail("unexpected end of JSON");
        return s_[pos_++];
    }

    void expect(std::string_view word) {
        if (s_.substr(pos_, word.size()) != word) fail("invalid literal in JSON");
        pos_ += word.size();
    }

    unsigned parse_hex4() {
        unsigned v = 0;
        for (int i = 0; i < 4; ++i) {
            char c = get();
            v <<= 4;
            if (c >= '0' && c <= '9') v |= static_cast<unsigned>(c - '0');
            else if (c >= 'a' && c <= 'f') v |= static_cast<unsigned>(10 + (c - 'a'));
            else if (c >= 'A' && c <= 'F') v |= static_cast<unsigned>(10 + (c - 'A'));
            else fail("invalid \\u escape");
        }
        return v;
    }

    // Opening quote already consumed.
    std::string parse_string() {
        std::string out;
        while (true) {
            char c = get();
            if (c == '"') break;
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            char e = get();
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    unsigned u = parse_hex4();
                    if (u >= 0xD800 && u <= 0xDBFF) {
                        if (get() != '\\' || get() != 'u') fail("invalid surrogate pair");
                        unsigned lo = parse_hex4();
                        if (lo < 0xDC00 || lo > 0xDFFF) fail("invalid surrogate pair");
                        u = 0x10000 + (((u - 0xD800) << 10) | (lo - 0xDC00));
                    }
                    internal::append_utf8(out, u);
                    break;
                }
                default:
                    fail("invalid escape in JSON string");
            }
        }
        return out;
    }

    Value parse_number() {
        const std::size_t start = pos_;
        if (peek() == '-') ++pos_;
        bool is_int = true;
        while (pos_ < s_.size()) {
            char c = s_[pos_];
            if (c >= '0' && c <= '9') { ++pos_; continue; }
            if (c == '.') { is_int = false; ++pos_; continue; }
            if (c == 'e' || c == 'E') {
                is_int = false;
                ++pos_;
                if (peek() == '+' || peek() == '-') ++pos_;
                continue;
            }
            break;
        }
        std::string raw(s_.substr(start, pos_ - start));
        if (raw.empty() || raw == "-") {
            pos_ = start;
            fail("invalid number in JSON");
        }

        const char* first = raw.data();
        const char* last = raw.data() + raw.size();
        if (is_int) {
            std::int64_t i = 0;
            auto r = std::from_chars(first, last, i);
            if (r.ec == std::errc() && r.ptr == last) return Value::make_int(i);
            if (raw[0] != '-') {
                std::uint64_t u = 0;
                r = std::from_chars(first, last, u);
                if (r.ec == std::errc() && r.ptr == last) return Value::make_uint(u);
            }
        }
        char* end = nullptr;
        double d = std::strtod(raw.c_str(), &end);
        if (end != raw.c_str() + raw.size()) {
            pos_ = start;
            fail("invalid number in JSON");
        }
        return Value::make_float(d);
    }

    // '[' already consumed.
    Value parse_array() {
        internal::DepthGuard guard(depth_, pos_);
        Array arr;
        skip_ws();
        if (peek() == ']') {
            get();
            return Value::make_array(std::move(arr));
        }
        while (true) {
            skip_ws();
            arr.push_back(parse_value());
            skip_ws();
            char c = get();
            if (c == ']') break;
            if (c != ',') fail("expected ',' in array");
        }
        return Value::make_array(std::move(arr));
    }

    // '{' already consumed.
    Value parse_object() {
        internal::DepthGuard guard(depth_, pos_);
        Object obj;
        skip_ws();
        if (peek() == '}') {
            get();
            return Value::make_object(std::move(obj));
        }
        while (true) {
            skip_ws();
            if (get() != '"') fail("expected string key");
            std::string key = parse_string();
            skip_ws();
            if (get() != ':') fail("expected ':' in object");
            skip_ws();
            obj.set(std::move(key), parse_value());
            skip_ws();
            char c = get();
            if (c == '}') break;
            if (c != ',') fail("expected ',' in object");
        }
        return Value::make_object(std::move(obj));
    }

    Value parse_value() {
        skip_ws();
        char c = peek();
        if (c == '"') { get(); return Value::make_string(parse_string()); }
        if (c == '{') { get(); return parse_object(); }
        if (c == '[') { get(); return parse_array(); }
        if (c == 't') { expect("true"); return Value::make_bool(true); }
        if (c == 'f') { expect("false"); return Value::make_bool(false); }
        if (c == 'n') { expect("null"); return Value::make_null(); }
        return parse_number();
    }
};

} // namespace

bool looks_like_json(const std::uint8_t* data, std::size_t size) {
    if (size < 2) return false;
    if (data[0] != '{' && data[0] != '[') return false;
    static const std::string_view kFollow = " \t\n\r\"0123456789-[{";
    return kFollow.find(static_cast<char>(data[1])) != std::string_view::npos;
}

Value parse_json_text(std::string_view text) {
    return JsonTextParser(text).parse();
}

} // namespace bjd
