#ifndef CONL_TESTS_VALIDATION__
#define CONL_TESTS_VALIDATION__

#include "conl_test_harness.hpp"
#include "../include/conl.hpp"

namespace conl::tests
{
//------------------------------------------
// HELPERS
//------------------------------------------

    inline std::vector<std::string> messages(result const & r)
    {
        std::vector<std::string> out;
        for (auto const & e : r.errors())
            out.push_back(e.str());
        return out;
    }

    // Schemas built here must outlive the results validated against them.
    inline std::optional<schema> make_schema(std::string_view text)
    {
        auto ctx = parse_schema(text);
        if (ctx.has_errors())
            return std::nullopt;
        return std::move(ctx.result);
    }

    using strings = std::vector<std::string>;

//------------------------------------------
// TESTS
//------------------------------------------

static bool validation_reports_pattern_mismatch()
{
    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    keys\n"
        "      username = \\w+\n");
    EXPECT(s.has_value(), "schema rejected");

    auto r = validate(*s, "username = *");
    EXPECT(!r.valid(), "mismatch accepted");
    EXPECT(messages(r) == strings{ "1: expected \\w+" }, "wrong errors");
    EXPECT(r.errors()[0].pos == value_position(1), "error not on the value");
    return true;
}

static bool validation_reports_unexpected_and_missing_keys()
{
    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    required keys\n"
        "      username = \\w+\n");
    EXPECT(s.has_value(), "schema rejected");

    auto r = validate(*s, "password = example");
    auto got = messages(r);
    EXPECT(got.size() == 2, "wrong error count");
    EXPECT(got[0] == "1: unexpected key password", "unexpected key not first");
    EXPECT(got[1] == "1: missing required key username", "missing key not reported");
    return true;
}

static bool validation_one_of_lists_alternatives()
{
    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    items = <bool>\n"
        "  bool\n"
        "    one of\n"
        "      = true\n"
        "      = false\n");
    EXPECT(s.has_value(), "schema rejected");

    auto r = validate(*s, "= true\n= false\n= foo");
    EXPECT(messages(r) == strings{ "3: expected false or true" }, "wrong errors");
    return true;
}

static bool validation_reports_duplicate_required_match()
{
    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    required keys\n"
        "      a|b = .*\n");
    EXPECT(s.has_value(), "schema rejected");

    auto r = validate(*s, "a = 1\nb = 2");
    EXPECT(messages(r) == strings{ "2: duplicate key a|b" }, "wrong errors");
    EXPECT(r.errors()[0].pos == key_position(2), "error not on the key");
    return true;
}

static bool validation_accepts_multiline_scalars()
{
    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    keys\n"
        "      key = line1.*\n");
    EXPECT(s.has_value(), "schema rejected");

    auto r = validate(*s, "key = \"\"\"\n  line1\n  line2");
    EXPECT(r.valid(), "multiline value rejected");

    auto const & v = r.doc().root().map[0].value;
    EXPECT(v.scalar->content == "line1\nline2", "wrong multiline content");
    return true;
}

//------------------------------------------
// Shapes
//------------------------------------------

static bool validation_reports_wrong_shapes()
{
    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    keys\n"
        "      map = <map>\n"
        "      list = <list>\n"
        "      scalar = .*\n"
        "      none = <none>\n"
        "  map\n"
        "    keys\n"
        "      x = .*\n"
        "  list\n"
        "    items = .*\n"
        "  none\n");
    EXPECT(s.has_value(), "schema rejected");

    auto r = validate(*s,
        "map = 1\n"
        "list\n"
        "  x = 1\n"
        "scalar\n"
        "  = 1\n"
        "none = 1\n");

    EXPECT(messages(r) == strings({
        "1: expected a map",
        "2: expected a list",
        "4: expected any scalar",
        "6: expected no value" }), "wrong errors");
    return true;
}

static bool validation_treats_missing_value_as_empty_container()
{
    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    keys\n"
        "      map = <map>\n"
        "      list = <list>\n"
        "      scalar = \\d+\n"
        "      number = <number>\n"
        "  map\n"
        "    keys\n"
        "      x = .*\n"
        "  list\n"
        "    items = .*\n"
        "  number\n"
        "    scalar = \\d+\n");
    EXPECT(s.has_value(), "schema rejected");

    auto r = validate(*s, "map\nlist =\nscalar =\nnumber");
    EXPECT(messages(r) == strings({ "3: expected any scalar", "4: expected any scalar" }), "wrong errors");
    return true;
}

static bool validation_checks_required_items()
{
    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    required items\n"
        "      = x\n"
        "      = y\n");
    EXPECT(s.has_value(), "schema rejected");

    EXPECT(validate(*s, "= x\n= y").valid(), "complete list rejected");
    EXPECT(messages(validate(*s, "= x")) == strings{ "1: missing required list item y" }, "short list accepted");
    EXPECT(messages(validate(*s, "= x\n= y\n= z")) == strings{ "3: unexpected list item" }, "long list accepted");
    EXPECT(messages(validate(*s, "= y\n= y")) == strings{ "1: expected x" }, "wrong item accepted");
    return true;
}

static bool validation_follows_nested_definitions()
{
    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    keys\n"
        "      server = <server>\n"
        "  server\n"
        "    required keys\n"
        "      host = .+\n"
        "      port = \\d+\n");
    EXPECT(s.has_value(), "schema rejected");

    auto r = validate(*s, "server\n  host = example.com\n  port = http");
    EXPECT(messages(r) == strings{ "3: expected \\d+" }, "wrong errors");

    r = validate(*s, "server\n  port = 80");
    EXPECT(messages(r) == strings{ "1: missing required key host" }, "missing key not reported on parent line");
    return true;
}

//------------------------------------------
// Ambiguity
//------------------------------------------

static bool validation_one_of_prefers_deeper_failure()
{
    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    one of\n"
        "      = <config>\n"
        "      = <list>\n"
        "  config\n"
        "    keys\n"
        "      name = \\w+\n"
        "  list\n"
        "    items = .*\n");
    EXPECT(s.has_value(), "schema rejected");

    auto r = validate(*s, "name = *");
    EXPECT(messages(r) == strings{ "1: expected \\w+" }, "shallow alternative won");
    return true;
}

static bool validation_one_of_prefers_more_errors_on_same_line()
{
    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    one of\n"
        "      = <numbers>\n"
        "      = <words>\n"
        "  numbers\n"
        "    keys\n"
        "      p = \\d+\n"
        "      q = \\d+\n"
        "  words\n"
        "    keys\n"
        "      p = [a-y]+\n"
        "      q = .*\n");
    EXPECT(s.has_value(), "schema rejected");

    auto r = validate(*s, "p = z\nq = z");
    EXPECT(messages(r) == strings({ "1: expected \\d+", "2: expected \\d+" }), "smaller error set won");
    return true;
}

static bool validation_merges_optional_key_candidates()
{
    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    keys\n"
        "      a|b = \\d+\n"
        "      .* = x|y\n");
    EXPECT(s.has_value(), "schema rejected");

    EXPECT(validate(*s, "a = 1\nb = x\nc = y").valid(), "matching keys rejected");

    auto r = validate(*s, "a = z");
    EXPECT(messages(r) == strings{ "1: expected \\d+, x or y" }, "candidates not combined");
    return true;
}

static bool validation_one_of_combines_missing_keys()
{
    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    one of\n"
        "      = <first>\n"
        "      = <second>\n"
        "  first\n"
        "    required keys\n"
        "      a = .*\n"
        "  second\n"
        "    required keys\n"
        "      b = .*\n");
    EXPECT(s.has_value(), "schema rejected");

    auto r = validate(*s, "");
    EXPECT(messages(r) == strings{ "1: missing required key a or b" }, "missing keys not combined");
    return true;
}

//------------------------------------------
// Errors in the document
//------------------------------------------

static bool validation_surfaces_decode_errors()
{
    auto r = validate(any_schema(), "a = \"b\nc = \"\\q\"");
    EXPECT(messages(r) == strings({ "1: unclosed quotes", "2: invalid escape code: \\q" }), "wrong errors");
    return true;
}

static bool validation_surfaces_normalizer_errors()
{
    auto r = validate(any_schema(), "a = 1\n= 2\n  b = 1");
    auto got = messages(r);
    EXPECT(!got.empty() && got[0] == "2: unexpected list item", "mixed section not reported");

    r = validate(any_schema(), "  a = 1");
    EXPECT(messages(r) == strings{ "1: unexpected indent" }, "unexpected indent not reported");
    return true;
}

static bool validation_surfaces_comment_errors()
{
    auto r = validate(any_schema(), "a = 1 ; \xff");
    EXPECT(messages(r) == strings{ "1: invalid UTF-8" }, "comment error not reported");
    return true;
}

static bool validation_reports_exact_duplicate_keys()
{
    auto r = validate(any_schema(), "a = 1\nb = 2\na = 3");
    EXPECT(messages(r) == strings{ "3: duplicate key a" }, "duplicate not reported");
    return true;
}

static bool validation_decode_error_outranks_schema_errors()
{
    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    keys\n"
        "      a = \\d+\n");
    EXPECT(s.has_value(), "schema rejected");

    auto r = validate(*s, "a = \"1");
    EXPECT(messages(r) == strings{ "1: unclosed quotes" }, "decode error hidden");
    return true;
}

//------------------------------------------
// Determinism and ordering
//------------------------------------------

static bool validation_is_deterministic()
{
    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    required keys\n"
        "      a = \\d+\n"
        "      b = <flag>\n"
        "  flag\n"
        "    one of\n"
        "      = on\n"
        "      = off\n");
    EXPECT(s.has_value(), "schema rejected");

    constexpr std::string_view input = "b = maybe\nc = 1\n  d\n= 2";
    EXPECT(messages(validate(*s, input)) == messages(validate(*s, input)), "results differ between runs");
    return true;
}

static bool validation_orders_errors_by_line()
{
    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    required keys\n"
        "      z = .*\n"
        "    keys\n"
        "      a = \\d+\n"
        "      b = \\d+\n");
    EXPECT(s.has_value(), "schema rejected");

    auto r = validate(*s, "b = x\na = y\nc = 1\n; \xff");
    EXPECT(messages(r) == strings({
        "1: expected \\d+",
        "1: missing required key z",
        "2: expected \\d+",
        "3: unexpected key c",
        "4: invalid UTF-8" }), "wrong order");

    size_t last = 0;
    for (auto const & e : r.errors())
    {
        EXPECT(e.line() >= last, "lines out of order");
        last = e.line();
    }
    return true;
}

static bool validation_ranks_problems_by_kind()
{
    EXPECT(detail::priority(decode_error{ "x" }) == detail::priority(schema_load_error{ "x" }), "load errors ranked apart");
    EXPECT(detail::priority(decode_error{ "x" }) < detail::priority(unexpected{ "key k" }), "decode error outranked");
    EXPECT(detail::priority(duplicate_key{ "k" }) == detail::priority(unexpected{ "key k" }), "duplicates ranked apart");
    EXPECT(detail::priority(unexpected{ "key k" }) < detail::priority(missing_required_key{ { "k" } }), "unexpected outranked");
    EXPECT(detail::priority(missing_required_item{ "x" }) == detail::priority(missing_required_key{ { "k" } }), "missing ranked apart");
    EXPECT(detail::priority(missing_required_item{ "x" }) < detail::priority(expected_match{ { "x" } }), "missing outranked");
    return true;
}

static bool validation_orders_key_before_value()
{
    std::vector<validation_error> errors = {
        { value_position(2), expected_match{ { "x" } } },
        { value_position(0), missing_required_key{ { "k" } } },
        { key_position(2),   unexpected{ "key y" } },
        { key_position(1),   duplicate_key{ "z" } },
    };
    detail::sort_errors(errors);
    EXPECT(errors[0].pos == key_position(1), "key on line 1 not first");
    EXPECT(errors[1].pos == value_position(0), "document error not after line 1 keys");
    EXPECT(errors[2].pos == key_position(2), "key not before value");
    EXPECT(errors[3].pos == value_position(2), "value not last");

    auto s = make_schema(
        "root = <root>\n"
        "definitions\n"
        "  root\n"
        "    keys\n"
        "      a = <inner>\n"
        "  inner\n"
        "    keys\n"
        "      b = .*\n");
    EXPECT(s.has_value(), "schema rejected");

    auto r = validate(*s, "x = 1\na\n  c = 2");
    EXPECT(messages(r) == strings({ "1: unexpected key x", "3: unexpected key c" }), "wrong errors");
    EXPECT(r.errors()[0].pos.part == position_part::key, "unexpected key not on the key");
    return true;
}

//------------------------------------------

inline void run_validation_tests()
{
    RUN_TEST(validation_reports_pattern_mismatch);
    RUN_TEST(validation_reports_unexpected_and_missing_keys);
    RUN_TEST(validation_one_of_lists_alternatives);
    RUN_TEST(validation_reports_duplicate_required_match);
    RUN_TEST(validation_accepts_multiline_scalars);

    SUBCAT("Shapes");
    RUN_TEST(validation_reports_wrong_shapes);
    RUN_TEST(validation_treats_missing_value_as_empty_container);
    RUN_TEST(validation_checks_required_items);
    RUN_TEST(validation_follows_nested_definitions);

    SUBCAT("Ambiguity");
    RUN_TEST(validation_one_of_prefers_deeper_failure);
    RUN_TEST(validation_one_of_prefers_more_errors_on_same_line);
    RUN_TEST(validation_merges_optional_key_candidates);
    RUN_TEST(validation_one_of_combines_missing_keys);

    SUBCAT("Document errors");
    RUN_TEST(validation_surfaces_decode_errors);
    RUN_TEST(validation_surfaces_normalizer_errors);
    RUN_TEST(validation_surfaces_comment_errors);
    RUN_TEST(validation_reports_exact_duplicate_keys);
    RUN_TEST(validation_decode_error_outranks_schema_errors);

    SUBCAT("Determinism and ordering");
    RUN_TEST(validation_is_deterministic);
    RUN_TEST(validation_orders_errors_by_line);
    RUN_TEST(validation_ranks_problems_by_kind);
    RUN_TEST(validation_orders_key_before_value);
}

} // ns conl::tests

#endif
