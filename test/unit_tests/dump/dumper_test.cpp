#include <catch2/catch.hpp>

#include "dump/dumper.hpp"
#include "schema/schema.hpp"

#include "support/helpers.hpp"

#include <chrono>
#include <cmath>
#include <string>
#include <vector>

namespace scribe::test {

TEST_CASE("Scalars should be dumped through the default schema", "[dumper]") {
    Document doc;
    NodeId root = make_map(doc, {
                                    {"int", doc.make_int(1)},
                                    {"str", doc.make_string("hello")},
                                    {"bool", doc.make_bool(true)},
                                    {"null", doc.make_null()},
                                    {"float", doc.make_float(1.5)},
                                    {"nan", doc.make_float(std::nan(""))},
                                });
    REQUIRE(stringify(doc, root)
            == "int: 1\n"
               "str: hello\n"
               "bool: true\n"
               "null: null\n"
               "float: 1.5\n"
               "nan: .nan\n");
}

TEST_CASE("Root scalars should end with a single line break", "[dumper]") {
    Document doc;
    REQUIRE(stringify(doc, doc.make_string("hello")) == "hello\n");
    REQUIRE(stringify(doc, doc.make_int(-5)) == "-5\n");
    REQUIRE(stringify(doc, doc.make_string("")) == "''\n");
    REQUIRE(stringify(doc, doc.make_string("line1\nline2\n")) == "|\n  line1\n  line2\n");
    REQUIRE(stringify(doc, doc.make_string("a\n\n")) == "|+\n  a\n\n");
}

TEST_CASE("Ambiguous strings should be quoted", "[dumper]") {
    Document doc;
    NodeId root = doc.make_sequence({doc.make_string("true"), doc.make_string("123"),
        doc.make_string("yes"), doc.make_string("null"), doc.make_string("plain")});
    REQUIRE(stringify(doc, root) == "- 'true'\n- '123'\n- 'yes'\n- 'null'\n- plain\n");
}

TEST_CASE("Compat mode should control the quoting of yaml 1.1 booleans", "[dumper]") {
    Document doc;
    NodeId root = doc.make_string("yes");
    REQUIRE(stringify(doc, root) == "'yes'\n");

    DumpOptions options;
    options.compat_mode = false;
    REQUIRE(stringify(doc, root, options) == "yes\n");
}

TEST_CASE("Nested collections should be rendered in block style", "[dumper]") {
    Document doc;
    NodeId root = make_map(doc, {
                                    {"list", doc.make_sequence({doc.make_int(1), doc.make_int(2)})},
                                    {"map", make_map(doc, {{"x", doc.make_int(1)}})},
                                    {"text", doc.make_string("a\nb")},
                                });
    REQUIRE(stringify(doc, root)
            == "list:\n"
               "  - 1\n"
               "  - 2\n"
               "map:\n"
               "  x: 1\n"
               "text: |-\n"
               "  a\n"
               "  b\n");
}

TEST_CASE("Sequences should not be indented when array_indent is false", "[dumper]") {
    Document doc;
    NodeId root = make_map(doc, {{"list", doc.make_sequence({doc.make_int(1), doc.make_int(2)})}});

    DumpOptions options;
    options.array_indent = false;
    REQUIRE(stringify(doc, root, options) == "list:\n- 1\n- 2\n");
}

TEST_CASE("Sequence items should be rendered compactly", "[dumper]") {
    Document doc;
    NodeId first = make_map(doc, {{"a", doc.make_int(1)}, {"b", doc.make_int(2)}});
    NodeId second = make_map(doc, {{"c", doc.make_int(3)}});
    NodeId nested = doc.make_sequence({doc.make_sequence({doc.make_int(1), doc.make_int(2)}),
        doc.make_sequence({doc.make_int(3)})});

    REQUIRE(stringify(doc, doc.make_sequence({first, second})) == "- a: 1\n  b: 2\n- c: 3\n");
    REQUIRE(stringify(doc, nested) == "- - 1\n  - 2\n- - 3\n");
    REQUIRE(stringify(doc, doc.make_sequence({doc.make_string("a\nb")})) == "- |-\n  a\n  b\n");
}

TEST_CASE("Empty collections should be rendered in flow style", "[dumper]") {
    Document doc;
    NodeId root = make_map(doc, {{"a", doc.make_sequence()}, {"b", doc.make_mapping()}});
    REQUIRE(stringify(doc, root) == "a: []\nb: {}\n");
    REQUIRE(stringify(doc, doc.make_sequence()) == "[]\n");
    REQUIRE(stringify(doc, doc.make_mapping()) == "{}\n");
}

TEST_CASE("Non-default indentation should disable compact notation", "[dumper]") {
    Document doc;
    NodeId root = make_map(doc, {
                                    {"a", make_map(doc, {{"b", doc.make_int(1)}})},
                                    {"c", doc.make_sequence({doc.make_int(1)})},
                                });
    NodeId list = doc.make_sequence(
        {make_map(doc, {{"a", doc.make_int(1)}, {"b", doc.make_int(2)}})});

    DumpOptions options;
    options.indent = 4;
    REQUIRE(stringify(doc, root, options) == "a:\n    b: 1\nc:\n    - 1\n");
    REQUIRE(stringify(doc, list, options) == "-\n    a: 1\n    b: 2\n");

    options.indent = 0;
    REQUIRE(stringify(doc, root, options) == "a:\n b: 1\nc:\n - 1\n");
}

TEST_CASE("Shared nodes should be rendered with anchors and aliases", "[dumper]") {
    Document doc;
    NodeId shared = make_map(doc, {{"k", doc.make_int(1)}});
    NodeId root = make_map(doc, {{"x", shared}, {"y", shared}});

    REQUIRE(stringify(doc, root) == "x: &ref_0\n  k: 1\ny: *ref_0\n");

    DumpOptions options;
    options.use_anchors = false;
    REQUIRE(stringify(doc, root, options) == "x:\n  k: 1\ny:\n  k: 1\n");
}

TEST_CASE("Shared sequences should be anchored in sequences", "[dumper]") {
    Document doc;
    NodeId shared = doc.make_sequence({doc.make_int(1)});
    NodeId root = doc.make_sequence({shared, shared});
    REQUIRE(stringify(doc, root) == "- &ref_0\n  - 1\n- *ref_0\n");

    DumpOptions options;
    options.flow_level = 0;
    REQUIRE(stringify(doc, root, options) == "[&ref_0 [1], *ref_0]\n");
}

TEST_CASE("Anchors should be numbered in discovery order", "[dumper]") {
    Document doc;
    NodeId a = doc.make_sequence({doc.make_int(1)});
    NodeId b = doc.make_sequence({doc.make_int(2)});
    NodeId root = make_map(doc, {{"a", a}, {"b", b}, {"c", b}, {"d", a}});
    REQUIRE(stringify(doc, root)
            == "a: &ref_1\n"
               "  - 1\n"
               "b: &ref_0\n"
               "  - 2\n"
               "c: *ref_0\n"
               "d: *ref_1\n");
}

TEST_CASE("Cycles should be rendered as aliases to their anchor", "[dumper]") {
    Document doc;
    NodeId root = doc.make_sequence({doc.make_int(1)});
    doc.append(root, root);
    REQUIRE(stringify(doc, root) == "&ref_0\n- 1\n- *ref_0\n");

    NodeId map = doc.make_mapping();
    doc.set(map, "self", map);
    REQUIRE(stringify(doc, map) == "&ref_0\nself: *ref_0\n");
}

TEST_CASE("Cycles without anchors should exceed the depth limit", "[dumper]") {
    Document doc;
    NodeId root = doc.make_sequence();
    doc.append(root, root);

    DumpOptions options;
    options.use_anchors = false;
    REQUIRE(error_code_of([&] { stringify(doc, root, options); }) == SCRIBE_ERROR_TOO_DEEP);
}

TEST_CASE("Deeply nested documents should be rejected", "[dumper]") {
    Document doc;
    NodeId root = doc.make_int(1);
    for (int i = 0; i < 5; ++i)
        root = doc.make_sequence({root});

    DumpOptions options;
    options.max_depth = 6;
    REQUIRE(error_code_of([&] { stringify(doc, root, options); }) == SCRIBE_OK);

    options.max_depth = 5;
    REQUIRE(error_code_of([&] { stringify(doc, root, options); }) == SCRIBE_ERROR_TOO_DEEP);
}

TEST_CASE("Keys should be sorted when requested", "[dumper]") {
    Document doc;
    NodeId root = make_map(doc, {{"b", doc.make_int(1)}, {"a", doc.make_int(2)}});
    REQUIRE(stringify(doc, root) == "b: 1\na: 2\n");

    DumpOptions options;
    options.sort_keys = KeyOrder::Lexicographic;
    REQUIRE(stringify(doc, root, options) == "a: 2\nb: 1\n");
}

TEST_CASE("Keys should be sorted with a custom comparator", "[dumper]") {
    Document doc;
    NodeId root = make_map(
        doc, {{"a", doc.make_int(1)}, {"c", doc.make_int(2)}, {"b", doc.make_int(3)}});

    DumpOptions options;
    options.sort_keys = KeyOrder::Custom;
    options.key_comparator = [](std::string_view a, std::string_view b) { return b.compare(a); };
    REQUIRE(stringify(doc, root, options) == "c: 2\nb: 3\na: 1\n");
}

TEST_CASE("Flow level 0 should render everything in flow style", "[dumper]") {
    Document doc;
    NodeId root = make_map(doc, {
                                    {"a", doc.make_sequence({doc.make_int(1), doc.make_int(2)})},
                                    {"b", make_map(doc, {{"c", doc.make_string("x")}})},
                                });

    DumpOptions options;
    options.flow_level = 0;
    REQUIRE(stringify(doc, root, options) == "{a: [1, 2], b: {c: x}}\n");

    options.condense_flow = true;
    REQUIRE(stringify(doc, root, options) == "{\"a\":[1,2],\"b\":{\"c\":x}}\n");
}

TEST_CASE("Flow style should start at the configured level", "[dumper]") {
    Document doc;
    NodeId root = make_map(doc, {
                                    {"a", doc.make_sequence({doc.make_int(1), doc.make_int(2)})},
                                    {"b", doc.make_string("x\ny")},
                                });

    DumpOptions options;
    options.flow_level = 1;
    REQUIRE(stringify(doc, root, options) == "a: [1, 2]\nb: \"x\\ny\"\n");
}

TEST_CASE("Flow mappings should keep insertion order when sorting keys", "[dumper]") {
    Document doc;
    NodeId map = make_map(doc, {{"b", doc.make_int(1)}, {"a", doc.make_int(2)}});

    DumpOptions options;
    options.sort_keys = KeyOrder::Lexicographic;
    options.flow_level = 0;
    REQUIRE(stringify(doc, map, options) == "{b: 1, a: 2}\n");

    NodeId seq = doc.make_sequence({map});
    options.flow_level = 1;
    REQUIRE(stringify(doc, seq, options) == "- {b: 1, a: 2}\n");
}

TEST_CASE("Multi line strings in flow sequences should be double quoted", "[dumper]") {
    Document doc;
    NodeId seq = doc.make_sequence({doc.make_string("a\nb"), doc.make_int(1)});
    NodeId root = make_map(doc, {{"k", seq}});

    DumpOptions options;
    options.flow_level = 1;
    options.array_indent = false;
    REQUIRE(stringify(doc, root, options) == "k: [\"a\\nb\", 1]\n");

    options.array_indent = true;
    REQUIRE(stringify(doc, root, options) == "k: [\"a\\nb\", 1]\n");
}

TEST_CASE("Invalid values should be skipped when requested", "[dumper]") {
    Document doc;
    NodeId map = make_map(doc, {
                                   {"a", doc.make_int(1)},
                                   {"b", doc.make_undefined()},
                                   {"c", doc.make_int(3)},
                               });
    NodeId seq = doc.make_sequence({doc.make_int(1), doc.make_undefined(), doc.make_int(3)});

    REQUIRE(error_code_of([&] { stringify(doc, map); }) == SCRIBE_ERROR_BAD_VALUE);

    DumpOptions options;
    options.skip_invalid = true;

    Diagnostics diag;
    REQUIRE(stringify(doc, map, options, &diag) == "a: 1\nc: 3\n");
    REQUIRE(stringify(doc, seq, options, &diag) == "- 1\n- 3\n");
    REQUIRE(diag.warning_count() == 2);
    REQUIRE(diag.messages()[0].path == "$.b");
    REQUIRE(diag.messages()[1].path == "$[1]");

    options.flow_level = 0;
    REQUIRE(stringify(doc, map, options) == "{a: 1, c: 3}\n");
    REQUIRE(stringify(doc, seq, options) == "[1, 3]\n");
}

TEST_CASE("Invalid roots should produce an empty document when skipped", "[dumper]") {
    Document doc;
    NodeId root = doc.make_undefined();

    DumpOptions options;
    options.skip_invalid = true;

    Dumper dumper(doc, options);
    REQUIRE(dumper.dump(root) == "");
    REQUIRE(dumper.diag().warning_count() == 1);
    REQUIRE(dumper.diag().messages()[0].path == "$");
}

TEST_CASE("Unsupported values should name their kind", "[dumper]") {
    Document doc;
    try {
        stringify(doc, doc.make_undefined());
        FAIL("Expected an exception.");
    } catch (const Error& e) {
        REQUIRE(e.code() == SCRIBE_ERROR_BAD_VALUE);
        REQUIRE_THAT(
            e.what(), Catch::Matchers::Contains(
                          "unacceptable kind of an object to dump Undefined"));
    }
}

TEST_CASE("Style overrides should be applied to their tag", "[dumper]") {
    Document doc;
    NodeId root = make_map(doc, {
                                    {"n", doc.make_int(255)},
                                    {"z", doc.make_null()},
                                    {"b", doc.make_bool(true)},
                                });

    DumpOptions options;
    options.styles["!!int"] = "hexadecimal";
    options.styles["tag:yaml.org,2002:null"] = "canonical";
    options.styles["!!bool"] = "uppercase";
    REQUIRE(stringify(doc, root, options) == "n: 0xFF\nz: ~\nb: TRUE\n");

    options.styles["!!int"] = "roman";
    REQUIRE(error_code_of([&] { stringify(doc, root, options); }) == SCRIBE_ERROR_BAD_CONFIG);
}

TEST_CASE("Explicit types should be rendered with their tag", "[dumper]") {
    Document doc;
    const std::string_view hello = "hello";
    NodeId root = make_map(
        doc, {{"data", doc.make_binary(std::vector<byte>(hello.begin(), hello.end()))}});
    REQUIRE(stringify(doc, root) == "data: !<tag:yaml.org,2002:binary> aGVsbG8=\n");
}

TEST_CASE("Timestamps should be rendered as implicit scalars", "[dumper]") {
    using namespace std::chrono;

    Document doc;
    NodeId root = make_map(
        doc, {{"t", doc.make_timestamp(system_clock::time_point(milliseconds(1008367183100)))}});
    REQUIRE(stringify(doc, root) == "t: 2001-12-14T21:59:43.100Z\n");
}

TEST_CASE("The failsafe schema should only dump strings and collections", "[dumper]") {
    Document doc;
    NodeId root = make_map(doc, {{"a", doc.make_string("true")}});

    DumpOptions options;
    options.schema = &failsafe_schema();
    REQUIRE(stringify(doc, root, options) == "a: true\n");

    doc.set(root, "b", doc.make_int(1));
    REQUIRE(error_code_of([&] { stringify(doc, root, options); }) == SCRIBE_ERROR_BAD_VALUE);
}

TEST_CASE("Custom schemas should be used for type detection", "[dumper]") {
    Document doc;
    NodeId root = make_map(doc, {{"a", doc.make_undefined()}});

    Type implicit_type;
    implicit_type.tag = "tag:example.com,2024:undefined";
    implicit_type.predicate = [](const Node& node) { return node.kind() == NodeKind::Undefined; };
    implicit_type.represent = RepresentFunction(
        [](const Node&, std::string_view) { return std::string("~"); });

    const Schema implicit_schema = default_schema().extend({implicit_type});

    DumpOptions options;
    options.schema = &implicit_schema;
    REQUIRE(stringify(doc, root, options) == "a: ~\n");

    Type explicit_type = implicit_type;
    explicit_type.represent = RepresentFunction(
        [](const Node&, std::string_view) { return std::string("nothing"); });

    const Schema explicit_schema = default_schema().extend({}, {explicit_type});
    options.schema = &explicit_schema;
    REQUIRE(stringify(doc, root, options) == "a: !<tag:example.com,2024:undefined> nothing\n");
}

TEST_CASE("Tagged values should be rendered with their tag", "[dumper]") {
    Document doc;
    NodeId str = doc.make_tagged("!!str", doc.make_string("abc"));
    NodeId port = doc.make_tagged("tag:example.com,2024:port", doc.make_int(5));
    NodeId point = doc.make_tagged(
        "tag:example.com,2024:point", make_map(doc, {{"x", doc.make_int(1)}}));

    REQUIRE(stringify(doc, str) == "!<tag:yaml.org,2002:str> abc\n");
    REQUIRE(stringify(doc, port) == "!<tag:example.com,2024:port> '5'\n");
    REQUIRE(stringify(doc, point) == "!<tag:example.com,2024:point> \n? x\n: 1\n");
}

TEST_CASE("Long keys should use the explicit key notation", "[dumper]") {
    Document doc;
    const std::string key(1100, 'k');
    NodeId root = make_map(doc, {{key, doc.make_int(1)}});
    REQUIRE(stringify(doc, root) == "? " + key + "\n: 1\n");

    const std::string short_key(1024, 'k');
    NodeId short_root = make_map(doc, {{short_key, doc.make_int(1)}});
    REQUIRE(stringify(doc, short_root) == short_key + ": 1\n");
}

TEST_CASE("Multi line keys should be double quoted", "[dumper]") {
    Document doc;
    NodeId root = make_map(doc, {{"a\nb", doc.make_int(1)}, {"", doc.make_int(2)}});
    REQUIRE(stringify(doc, root) == "\"a\\nb\": 1\n'': 2\n");
}

TEST_CASE("Long lines should be folded unless the width is unlimited", "[dumper]") {
    std::string text;
    for (int i = 0; i < 250; ++i) {
        if (i > 0)
            text += ' ';
        text += "abc";
    }
    REQUIRE(text.size() == 999);

    Document doc;
    NodeId root = doc.make_string(text);

    const std::string folded = stringify(doc, root);
    REQUIRE(folded.substr(0, 3) == ">-\n");
    REQUIRE(folded.find("\n  abc abc") != std::string::npos);

    DumpOptions options;
    options.line_width = -1;
    REQUIRE(stringify(doc, root, options) == text + "\n");
}

TEST_CASE("Dumping twice should produce the same output", "[dumper]") {
    Document doc;
    NodeId shared = doc.make_sequence({doc.make_int(1)});
    NodeId root = doc.make_sequence({shared, shared});

    Dumper dumper(doc, DumpOptions());
    const std::string first = dumper.dump(root);
    REQUIRE(first == "- &ref_0\n  - 1\n- *ref_0\n");
    REQUIRE(dumper.dump(root) == first);
    REQUIRE(dumper.dump(shared) == "- 1\n");
}

TEST_CASE("Invalid utf8 should be rejected", "[dumper]") {
    Document doc;
    NodeId root = make_map(doc, {{"a", doc.make_string("\xFF")}});
    REQUIRE(error_code_of([&] { stringify(doc, root); }) == SCRIBE_ERROR_BAD_UTF8);
}

TEST_CASE("Dumpers should use the default schema unless configured otherwise", "[dumper]") {
    Document doc;
    Dumper dumper(doc, DumpOptions());
    REQUIRE(&dumper.schema() == &default_schema());
    REQUIRE(dumper.options().indent == 2);
}

} // namespace scribe::test
