#include "test_common.hpp"

using bjd::ErrorKind;
using bjd::Value;
using bjd_test::bytes_of;

static void test_detection() {
    auto yes = [](const std::string& s) {
        auto b = bytes_of(s);
        return bjd::looks_like_json(b.data(), b.size());
    };
    CHECK(yes("{\"a\": 1}"));
    CHECK(yes("[1, 2]"));
    CHECK(yes("[ ]"));
    CHECK(yes("[[1]]"));
    CHECK(yes("[-1]"));
    CHECK(!yes("[$U#U\x03"));
    CHECK(!yes("{U\x01" "a"));
    CHECK(!yes("["));
    CHECK(!yes("Z"));
}

static void test_parse_document() {
    Value v = bjd::parse_json_text(
        " {\"name\": \"sensor\", \"n\": 3, \"big\": 18446744073709551615, \"neg\": -7,"
        " \"f\": 2.5e1, \"ok\": true, \"none\": null, \"list\": [1, \"two\", [false]]} ");
    const auto& o = v.as_object();
    CHECK(o.size() == 8);
    CHECK(o.entries()[0].first == "name");
    CHECK(o.entries()[7].first == "list");
    CHECK(bjd_test::field(o, "name").as_string() == "sensor");
    CHECK(bjd_test::as_int(bjd_test::field(o, "n")) == 3);
    CHECK(std::get<std::uint64_t>(bjd_test::field(o, "big").v) == 18446744073709551615ull);
    CHECK(bjd_test::as_int(bjd_test::field(o, "neg")) == -7);
    CHECK(bjd_test::as_float(bjd_test::field(o, "f")) == 25.0);
    CHECK(std::get<bool>(bjd_test::field(o, "ok").v));
    CHECK(bjd_test::field(o, "none").is_null());
    const auto& list = bjd_test::field(o, "list").as_array();
    CHECK(list.size() == 3);
    CHECK(list[1].as_string() == "two");
    CHECK(list[2].as_array().size() == 1);
}

static void test_numbers_and_escapes() {
    // Too large for any integer type.
    Value huge = bjd::parse_json_text("-99999999999999999999");
    CHECK(bjd_test::as_float(huge) == -99999999999999999999.0);

    Value s = bjd::parse_json_text("\"tab\\t\\u00e9\\ud83d\\ude00\\/\"");
    CHECK(s.as_string() == "tab\t\xC3\xA9\xF0\x9F\x98\x80/");
}

static void test_duplicate_keys() {
    Value v = bjd::parse_json_text("{\"a\": 1, \"b\": 2, \"a\": 3}");
    const auto& o = v.as_object();
    CHECK(o.size() == 2);
    CHECK(bjd_test::as_int(o.entries()[0].second) == 3);
}

static void test_errors() {
    std::size_t off = 0;
    CHECK_THROWS_KIND(bjd::parse_json_text("[1, 2"), ErrorKind::JsonParse, off);
    CHECK(off == 5);
    CHECK_THROWS_KIND(bjd::parse_json_text("{\"a\" 1}"), ErrorKind::JsonParse, off);
    CHECK_THROWS_KIND(bjd::parse_json_text("[1] x"), ErrorKind::JsonParse, off);
    CHECK(off == 4);
    CHECK_THROWS_KIND(bjd::parse_json_text("[tru]"), ErrorKind::JsonParse, off);
    CHECK_THROWS_KIND(bjd::parse_json_text("\"\\q\""), ErrorKind::JsonParse, off);
    CHECK_THROWS_KIND(bjd::parse_json_text("[-]"), ErrorKind::JsonParse, off);
    CHECK(off == 1);
}

static void test_nesting_limit() {
    std::size_t off = 0;
    CHECK_THROWS_KIND(bjd::parse_json_text(std::string(200000, '[')), ErrorKind::NestingTooDeep, off);
    CHECK(off == 513);

    std::string objects;
    for (int i = 0; i < 100000; ++i) objects += "{\"a\": ";
    CHECK_THROWS_KIND(bjd::parse_json_text(objects), ErrorKind::NestingTooDeep, off);

    Value ok = bjd::parse_json_text(std::string(100, '[') + std::string(100, ']'));
    CHECK(ok.as_array().size() == 1);
}

static void test_render_json_tree() {
    Value v = bjd::parse_json_text("{\"xs\": [1, 2.0, 3]}");
    CHECK(bjd::render(v) == "{\n  \"xs\": [1, 2.0, 3],\n}");
}

int main() {
    try {
        test_detection();
        test_parse_document();
        test_numbers_and_escapes();
        test_duplicate_keys();
        test_errors();
        test_nesting_limit();
        test_render_json_tree();
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }
    std::cout << "All tests passed.\n";
    return 0;
}
