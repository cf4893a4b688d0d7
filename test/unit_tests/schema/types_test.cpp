#include <catch2/catch.hpp>

#include "model/document.hpp"
#include "schema/types.hpp"

#include "support/helpers.hpp"

#include <chrono>
#include <cmath>
#include <limits>

namespace scribe::test {

namespace {

// Represents the node with the given style (or the default style of the type).
std::string represent(const Type& type, const Document& doc, NodeId id, std::string style = "") {
    if (style.empty())
        style = type.default_style;

    const RepresentFunction* fn = type.representer(style);
    REQUIRE(fn != nullptr);
    return (*fn)(doc[id], style);
}

} // namespace

TEST_CASE("The null type should resolve the null literals", "[types]") {
    const Type type = null_type();
    REQUIRE(type.tag == "tag:yaml.org,2002:null");

    for (auto str : {"~", "null", "Null", "NULL"})
        REQUIRE(type.resolves(str));
    for (auto str : {"", "nULL", "nil", "none"})
        REQUIRE_FALSE(type.resolves(str));
}

TEST_CASE("The null type should support all of its styles", "[types]") {
    const Type type = null_type();
    Document doc;
    NodeId null = doc.make_null();

    REQUIRE(type.matches(doc[null]));
    REQUIRE_FALSE(type.matches(doc[doc.make_string("null")]));

    REQUIRE(represent(type, doc, null) == "null");
    REQUIRE(represent(type, doc, null, "canonical") == "~");
    REQUIRE(represent(type, doc, null, "uppercase") == "NULL");
    REQUIRE(represent(type, doc, null, "camelcase") == "Null");
}

TEST_CASE("The bool type should resolve and represent booleans", "[types]") {
    const Type type = bool_type();
    REQUIRE(type.tag == "tag:yaml.org,2002:bool");

    for (auto str : {"true", "True", "TRUE", "false", "False", "FALSE"})
        REQUIRE(type.resolves(str));
    for (auto str : {"", "yes", "no", "tRUE", "1"})
        REQUIRE_FALSE(type.resolves(str));

    Document doc;
    NodeId t = doc.make_bool(true);
    NodeId f = doc.make_bool(false);
    REQUIRE(represent(type, doc, t) == "true");
    REQUIRE(represent(type, doc, f) == "false");
    REQUIRE(represent(type, doc, t, "uppercase") == "TRUE");
    REQUIRE(represent(type, doc, f, "camelcase") == "False");
}

TEST_CASE("The int type should resolve all integer notations", "[types]") {
    const Type type = int_type();
    REQUIRE(type.tag == "tag:yaml.org,2002:int");

    for (auto str : {"0", "-0", "12", "-12", "+12", "1_000", "0b1010", "-0b1_0", "0x1F", "0xdead",
             "017", "190:20:30", "-1:30"}) {
        CAPTURE(str);
        REQUIRE(type.resolves(str));
    }

    for (auto str : {"", "-", "+", "0b", "0x", "0b12", "0xG", "08", "1_", "_1", "1:60", "1.5",
             "abc", "12a", "0x_"}) {
        CAPTURE(str);
        REQUIRE_FALSE(type.resolves(str));
    }
}

TEST_CASE("The int type should represent integers in all bases", "[types]") {
    const Type type = int_type();
    Document doc;
    NodeId positive = doc.make_int(255);
    NodeId negative = doc.make_int(-255);
    NodeId min = doc.make_int(std::numeric_limits<i64>::min());

    REQUIRE(type.default_style == "decimal");
    REQUIRE(represent(type, doc, positive) == "255");
    REQUIRE(represent(type, doc, negative) == "-255");
    REQUIRE(represent(type, doc, min) == "-9223372036854775808");

    REQUIRE(represent(type, doc, positive, "binary") == "0b11111111");
    REQUIRE(represent(type, doc, negative, "binary") == "-0b11111111");
    REQUIRE(represent(type, doc, positive, "octal") == "0377");
    REQUIRE(represent(type, doc, negative, "octal") == "-0377");
    REQUIRE(represent(type, doc, positive, "hexadecimal") == "0xFF");
    REQUIRE(represent(type, doc, negative, "hexadecimal") == "-0xFF");
    REQUIRE(represent(type, doc, min, "hexadecimal") == "-0x8000000000000000");
}

TEST_CASE("The int type should reject unknown styles", "[types]") {
    const Type type = int_type();
    REQUIRE(error_code_of([&] { type.representer("roman"); }) == SCRIBE_ERROR_BAD_CONFIG);
}

TEST_CASE("The float type should resolve yaml 1.1 floats", "[types]") {
    const Type type = float_type();
    REQUIRE(type.tag == "tag:yaml.org,2002:float");

    for (auto str : {"1.5", "-1.5", "+1.5", "1", "1.", "1e5", "1.5e-3", "1_000.5", ".5", ".5e3",
             ".inf", "-.inf", "+.Inf", ".INF", ".nan", ".NaN", ".NAN", "190:20:30.15"}) {
        CAPTURE(str);
        REQUIRE(type.resolves(str));
    }

    for (auto str : {"", ".", "1.5_", "abc", "1.5.5", "+.nan", "e5", "inf", "nan", "1:30"}) {
        CAPTURE(str);
        REQUIRE_FALSE(type.resolves(str));
    }
}

TEST_CASE("The float type should represent special values", "[types]") {
    const Type type = float_type();
    Document doc;
    NodeId nan = doc.make_float(std::nan(""));
    NodeId inf = doc.make_float(std::numeric_limits<f64>::infinity());
    NodeId neg_inf = doc.make_float(-std::numeric_limits<f64>::infinity());
    NodeId neg_zero = doc.make_float(-0.0);

    REQUIRE(represent(type, doc, nan) == ".nan");
    REQUIRE(represent(type, doc, nan, "uppercase") == ".NAN");
    REQUIRE(represent(type, doc, nan, "camelcase") == ".NaN");
    REQUIRE(represent(type, doc, inf) == ".inf");
    REQUIRE(represent(type, doc, inf, "uppercase") == ".INF");
    REQUIRE(represent(type, doc, neg_inf) == "-.inf");
    REQUIRE(represent(type, doc, neg_inf, "camelcase") == "-.Inf");
    REQUIRE(represent(type, doc, neg_zero) == "-0.0");
}

TEST_CASE("The float type should produce text that reads back as a float", "[types]") {
    const Type type = float_type();
    Document doc;

    REQUIRE(represent(type, doc, doc.make_float(1.5)) == "1.5");
    REQUIRE(represent(type, doc, doc.make_float(-0.25)) == "-0.25");
    REQUIRE(represent(type, doc, doc.make_float(100.0)) == "100.0");
    REQUIRE(represent(type, doc, doc.make_float(0.0)) == "0.0");
    REQUIRE(represent(type, doc, doc.make_float(0.1)) == "0.1");

    for (f64 value : {1e21, -1e21, 1e-7, 123456789.125, 5e-324}) {
        const std::string text = represent(type, doc, doc.make_float(value));
        CAPTURE(text);
        REQUIRE(type.resolves(text));
        REQUIRE_FALSE(int_type().resolves(text));
    }
}

TEST_CASE("The timestamp type should resolve dates and timestamps", "[types]") {
    const Type type = timestamp_type();
    REQUIRE(type.tag == "tag:yaml.org,2002:timestamp");

    for (auto str : {"2001-12-14", "2001-12-14t21:59:43.10-05:00", "2001-12-14 21:59:43.10 -5",
             "2001-12-15T02:59:43.1Z", "2002-12-14T00:00:00Z", "2001-1-1T1:00:00"}) {
        CAPTURE(str);
        REQUIRE(type.resolves(str));
    }

    for (auto str : {"", "2001-1-1", "2001-12-14T", "12-14-2001", "2001-12-14T21:59"}) {
        CAPTURE(str);
        REQUIRE_FALSE(type.resolves(str));
    }
}

TEST_CASE("The timestamp type should represent time points in UTC", "[types]") {
    using namespace std::chrono;

    const Type type = timestamp_type();
    Document doc;
    NodeId ts = doc.make_timestamp(system_clock::time_point(milliseconds(1008367183100)));
    NodeId epoch = doc.make_timestamp(system_clock::time_point());

    REQUIRE(represent(type, doc, ts) == "2001-12-14T21:59:43.100Z");
    REQUIRE(represent(type, doc, epoch) == "1970-01-01T00:00:00.000Z");
}

TEST_CASE("The merge type should only resolve the merge key", "[types]") {
    const Type type = merge_type();
    REQUIRE(type.tag == "tag:yaml.org,2002:merge");
    REQUIRE(type.resolves("<<"));
    REQUIRE_FALSE(type.resolves("<"));

    Document doc;
    REQUIRE_FALSE(type.matches(doc[doc.make_string("<<")]));
}

TEST_CASE("The binary type should represent data as base64", "[types]") {
    const Type type = binary_type();
    REQUIRE(type.tag == "tag:yaml.org,2002:binary");
    REQUIRE_FALSE(type.resolves("aGVsbG8="));

    Document doc;
    auto encode = [&](std::string_view str) {
        return represent(type, doc, doc.make_binary(std::vector<byte>(str.begin(), str.end())));
    };

    REQUIRE(encode("") == "");
    REQUIRE(encode("f") == "Zg==");
    REQUIRE(encode("fo") == "Zm8=");
    REQUIRE(encode("foo") == "Zm9v");
    REQUIRE(encode("hello") == "aGVsbG8=");
    REQUIRE(encode("foobar") == "Zm9vYmFy");

    NodeId bytes = doc.make_binary({0xFF, 0xFE, 0x00});
    REQUIRE(represent(type, doc, bytes) == "//4A");
}

} // namespace scribe::test
