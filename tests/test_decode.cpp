#include "test_common.hpp"

#include <sstream>

using bjd::ErrorKind;
using bjd::PreviewState;
using bjd::Value;
using bjd_test::ByteWriter;
using bjd_test::as_int;
using bjd_test::bytes_of;

static void test_null_advances_one_byte() {
    auto data = bytes_of("Z");
    std::size_t consumed = 0;
    Value v = bjd::decode(data.data(), data.size(), {}, &consumed);
    CHECK(v.is_null());
    CHECK(consumed == 1);
}

static void test_typed_counted_uint8_array() {
    auto data = bytes_of(std::string("[$U#U\x03\x01\x02\x03", 8));
    std::size_t consumed = 0;
    Value v = bjd::decode(data.data(), data.size(), {}, &consumed);
    CHECK(consumed == data.size());
    const auto& a = v.as_array();
    CHECK(a.size() == 3);
    CHECK(as_int(a[0]) == 1);
    CHECK(as_int(a[1]) == 2);
    CHECK(as_int(a[2]) == 3);
}

static void test_plain_containers() {
    ByteWriter w;
    w.raw("{").key("name").str("sensor").key("values").raw("[").raw("T").byte('i').byte(0xFF).raw("Z]");
    w.key("nested").raw("{").key("k").raw("D").f64(0.5).raw("}").raw("}");

    Value v = bjd::decode(w.bytes());
    const auto& o = v.as_object();
    CHECK(o.size() == 3);
    CHECK(o.entries()[0].first == "name");
    CHECK(o.entries()[1].first == "values");
    CHECK(o.entries()[2].first == "nested");
    CHECK(bjd_test::field(o, "name").as_string() == "sensor");

    const auto& values = bjd_test::field(o, "values").as_array();
    CHECK(values.size() == 3);
    CHECK(std::get<bool>(values[0].v));
    CHECK(as_int(values[1]) == -1);
    CHECK(values[2].is_null());

    const auto& nested = bjd_test::field(o, "nested").as_object();
    CHECK(bjd_test::as_float(bjd_test::field(nested, "k")) == 0.5);
}

static void test_counted_and_typed_objects() {
    {
        ByteWriter w;
        w.raw("{#").len(2).key("a").raw("T").key("b").str("x");
        Value v = bjd::decode(w.bytes());
        CHECK(v.as_object().size() == 2);
        CHECK(bjd_test::field(v.as_object(), "b").as_string() == "x");
    }
    {
        ByteWriter w;
        w.raw("{$U#").len(2).key("a").byte(7).key("b").byte(9);
        std::size_t consumed = 0;
        Value v = bjd::decode(w.bytes().data(), w.size(), {}, &consumed);
        CHECK(consumed == w.size());
        CHECK(as_int(bjd_test::field(v.as_object(), "a")) == 7);
        CHECK(as_int(bjd_test::field(v.as_object(), "b")) == 9);
    }
    {
        // Typed string elements of a counted array.
        ByteWriter w;
        w.raw("[$S#").len(2).text("ab").text("cd");
        Value v = bjd::decode(w.bytes());
        CHECK(v.as_array().size() == 2);
        CHECK(v.as_array()[1].as_string() == "cd");
    }
    {
        // Zero-width element type repeats the constant.
        ByteWriter w;
        w.raw("[$T#").len(3);
        std::size_t consumed = 0;
        Value v = bjd::decode(w.bytes().data(), w.size(), {}, &consumed);
        CHECK(consumed == w.size());
        CHECK(v.as_array().size() == 3);
        CHECK(std::get<bool>(v.as_array()[2].v));
    }
    {
        ByteWriter w;
        w.raw("[#").len(2).raw("T").str("q");
        Value v = bjd::decode(w.bytes());
        CHECK(v.as_array().size() == 2);
        CHECK(v.as_array()[1].as_string() == "q");
    }
}

static void test_duplicate_keys_last_write_wins() {
    ByteWriter w;
    w.raw("{").key("a").raw("U").byte(1).key("b").raw("U").byte(2).key("a").raw("U").byte(3).raw("}");
    Value v = bjd::decode(w.bytes());
    const auto& o = v.as_object();
    CHECK(o.size() == 2);
    CHECK(o.entries()[0].first == "a");
    CHECK(as_int(o.entries()[0].second) == 3);
}

static void test_text_decoding() {
    {
        ByteWriter w;
        w.str("h\xC3\xA9llo");
        CHECK(bjd::decode(w.bytes()).as_string() == "h\xC3\xA9llo");
    }
    {
        // Invalid UTF-8 is read as Latin-1.
        ByteWriter w;
        w.raw("S").len(1).byte(0xE9);
        CHECK(bjd::decode(w.bytes()).as_string() == "\xC3\xA9");
    }
    {
        ByteWriter w;
        w.raw("H").text("3.14159265358979323846");
        Value v = bjd::decode(w.bytes());
        CHECK(std::get<bjd::HighPrec>(v.v).digits == "3.14159265358979323846");
    }
    {
        ByteWriter w;
        w.raw("S").len(0);
        CHECK(bjd::decode(w.bytes()).as_string().empty());
    }
}

static ByteWriter typed_uint8(std::size_t n) {
    ByteWriter w;
    w.raw("[$U#").raw("I").uint(n, 2);
    for (std::size_t i = 0; i < n; ++i) w.byte(static_cast<std::uint8_t>(i));
    return w;
}

static void test_truncation_boundary() {
    bjd::DecodeOptions opts;
    opts.max_items = 100;
    {
        ByteWriter w = typed_uint8(100);
        std::size_t consumed = 0;
        Value v = bjd::decode(w.bytes().data(), w.size(), opts, &consumed);
        CHECK(consumed == w.size());
        CHECK(v.as_array().size() == 100);
        CHECK(as_int(v.as_array()[99]) == 99);
    }
    {
        ByteWriter w = typed_uint8(101);
        std::size_t consumed = 0;
        Value v = bjd::decode(w.bytes().data(), w.size(), opts, &consumed);
        CHECK(consumed == w.size());
        const auto& t = v.as_typed();
        CHECK(t.state == PreviewState::Sampled);
        CHECK(t.count == 101);
        CHECK(t.total_bytes == 101);
        CHECK(t.values.size() == 8);
        CHECK(as_int(t.values[7]) == 7);
    }
}

static void test_truncated_payload() {
    ByteWriter w;
    w.raw("[$D#").len(10);
    for (int i = 0; i < 16; ++i) w.byte(static_cast<std::uint8_t>(0xA0 + i));

    std::size_t consumed = 0;
    Value v = bjd::decode(w.bytes().data(), w.size(), {}, &consumed);
    CHECK(consumed == w.size());
    const auto& t = v.as_typed();
    CHECK(t.state == PreviewState::Truncated);
    CHECK(t.elem_name == "float64");
    CHECK(t.count == 10);
    CHECK(t.total_bytes == 80);
    CHECK(t.available_bytes == 16);
    CHECK(t.head.size() == 16);
    CHECK(t.head[0] == 0xA0);
    CHECK(t.values.empty());
}

static void test_nd_arrays() {
    {
        ByteWriter w;
        w.raw("[$U#[$U#").len(2).byte(2).byte(3);
        for (int i = 1; i <= 6; ++i) w.byte(static_cast<std::uint8_t>(i));
        std::size_t consumed = 0;
        Value v = bjd::decode(w.bytes().data(), w.size(), {}, &consumed);
        CHECK(consumed == w.size());
        const auto& t = v.as_typed();
        CHECK(t.nd);
        CHECK(!t.column_major);
        CHECK(t.state == PreviewState::Full);
        CHECK((t.dims == std::vector<std::size_t>{2, 3}));
        CHECK(t.values.size() == 6);
        CHECK(as_int(t.values[5]) == 6);
    }
    {
        // Column-major, untyped dimension list.
        ByteWriter w;
        w.raw("[$I#[[").raw("U").byte(2).raw("U").byte(2).raw("]]");
        for (int i = 0; i < 4; ++i) w.uint(static_cast<std::uint64_t>(1000 + i), 2);
        std::size_t consumed = 0;
        Value v = bjd::decode(w.bytes().data(), w.size(), {}, &consumed);
        CHECK(consumed == w.size());
        const auto& t = v.as_typed();
        CHECK(t.column_major);
        CHECK((t.dims == std::vector<std::size_t>{2, 2}));
        CHECK(as_int(t.values[3]) == 1003);
    }
    {
        // Untyped N-d elements are walked one by one.
        ByteWriter w;
        w.raw("[#[").raw("U").byte(2).raw("]").str("a").raw("T");
        std::size_t consumed = 0;
        Value v = bjd::decode(w.bytes().data(), w.size(), {}, &consumed);
        CHECK(consumed == w.size());
        const auto& t = v.as_typed();
        CHECK(t.elem_name == "any");
        CHECK(t.values.size() == 2);
        CHECK(t.values[0].as_string() == "a");
    }
}

static void test_cursor_conservation() {
    ByteWriter w;
    w.raw("[$U#").len(2).byte(4).byte(5);
    const std::size_t first = w.size();
    w.str("next");

    bjd::Decoder d(w.bytes());
    Value a = d.read_value();
    CHECK(d.position() == first);
    CHECK(a.as_array().size() == 2);
    Value b = d.read_value();
    CHECK(b.as_string() == "next");
    CHECK(d.remaining() == 0);
}

static void test_errors() {
    std::size_t off = 0;
    {
        // Truncated mid-scalar: reported where the payload read began.
        auto data = bytes_of(std::string("l\x01\x02", 3));
        CHECK_THROWS_KIND(bjd::decode(data), ErrorKind::UnexpectedEof, off);
        CHECK(off == 1);
        try {
            bjd::decode(data);
        } catch (const bjd::BjdError& e) {
            CHECK(e.needed() == 4);
            CHECK(e.available() == 2);
        }
    }
    {
        auto data = bytes_of(std::string("[U\x01x]", 5));
        CHECK_THROWS_KIND(bjd::decode(data), ErrorKind::UnknownMarker, off);
        CHECK(off == 3);
    }
    {
        auto data = bytes_of(std::string("SI\xFF\xFF", 4));
        CHECK_THROWS_KIND(bjd::decode(data), ErrorKind::InvalidLength, off);
        CHECK(off == 1);
    }
    {
        auto data = bytes_of("SDabcd");
        CHECK_THROWS_KIND(bjd::decode(data), ErrorKind::UnexpectedMarker, off);
        CHECK(off == 1);
    }
    {
        auto data = bytes_of("[TT");
        CHECK_THROWS_KIND(bjd::decode(data), ErrorKind::UnexpectedEof, off);
        CHECK(off == 3);
    }
    {
        std::vector<std::uint8_t> empty;
        CHECK_THROWS_KIND(bjd::decode(empty), ErrorKind::UnexpectedEof, off);
        CHECK(off == 0);
    }
    {
        // Shape product overflows size_t.
        ByteWriter w;
        w.raw("[$U#[$M#").len(2).uint(~0ull, 8).uint(~0ull, 8);
        CHECK_THROWS_KIND(bjd::decode(w.bytes()), ErrorKind::InvalidLength, off);
    }
}

static void test_nesting_limit() {
    std::size_t off = 0;
    {
        std::vector<std::uint8_t> deep(200000, '[');
        CHECK_THROWS_KIND(bjd::decode(deep), ErrorKind::NestingTooDeep, off);
        CHECK(off == 513);
    }
    {
        ByteWriter w;
        for (int i = 0; i < 100000; ++i) w.raw("{").key("a");
        CHECK_THROWS_KIND(bjd::decode(w.bytes()), ErrorKind::NestingTooDeep, off);
    }
    {
        // Typed nested arrays recurse through the element type.
        ByteWriter w;
        for (int i = 0; i < 100000; ++i) w.raw("[$[#").len(1);
        CHECK_THROWS_KIND(bjd::decode(w.bytes()), ErrorKind::NestingTooDeep, off);
    }
    {
        // Moderate nesting is fine.
        std::string doc = std::string(100, '[') + std::string(100, ']');
        std::size_t consumed = 0;
        auto data = bytes_of(doc);
        Value v = bjd::decode(data.data(), data.size(), {}, &consumed);
        CHECK(consumed == data.size());
        CHECK(v.as_array().size() == 1);
    }
}

static void test_trace_sink() {
    std::ostringstream trace;
    bjd::DecodeOptions opts;
    opts.trace = &trace;
    auto data = bytes_of(std::string("[$U#U\x03\x01\x02\x03", 8));
    bjd::decode(data.data(), data.size(), opts);
    const std::string t = trace.str();
    CHECK(t.find("#      1: marker: [") != std::string::npos);
    CHECK(t.find("type: U") != std::string::npos);
    CHECK(t.find("count: 3") != std::string::npos);
}

int main() {
    try {
        test_null_advances_one_byte();
        test_typed_counted_uint8_array();
        test_plain_containers();
        test_counted_and_typed_objects();
        test_duplicate_keys_last_write_wins();
        test_text_decoding();
        test_truncation_boundary();
        test_truncated_payload();
        test_nd_arrays();
        test_cursor_conservation();
        test_errors();
        test_nesting_limit();
        test_trace_sink();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    std::cout << "All tests passed.\n";
    return 0;
}
