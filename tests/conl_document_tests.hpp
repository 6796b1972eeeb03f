#ifndef CONL_TESTS_DOCUMENT__
#define CONL_TESTS_DOCUMENT__

#include "conl_test_harness.hpp"
#include "../include/conl_document.hpp"

namespace conl::tests
{
//------------------------------------------
// TESTS
//------------------------------------------

static bool document_builds_maps_lists_and_scalars()
{
    auto doc = parse_document(
        "a = 1\n"
        "b\n"
        "  c = 2\n"
        "d\n"
        "  = x\n"
        "  = y\n");

    auto const & root = doc.root();
    EXPECT(root.is_map() && root.map.size() == 3, "wrong root entries");

    EXPECT(root.map[0].key.content == "a", "wrong first key");
    EXPECT(root.map[0].value.is_scalar() && root.map[0].value.scalar->content == "1", "wrong scalar");

    auto const & b = root.map[1].value;
    EXPECT(b.is_map() && b.map.size() == 1, "nested map missing");
    EXPECT(b.map[0].key.content == "c", "wrong nested key");

    auto const & d = root.map[2].value;
    EXPECT(d.is_list() && d.list.size() == 2, "nested list missing");
    EXPECT(d.list[1].value.scalar->content == "y", "wrong list item");
    return true;
}

static bool document_marks_missing_values_empty()
{
    auto doc = parse_document("a\nb =\nc = 1");
    auto const & root = doc.root();
    EXPECT(root.map.size() == 3, "wrong entry count");
    EXPECT(root.map[0].value.empty(), "a should have no value");
    EXPECT(root.map[1].value.empty(), "b should have no value");
    EXPECT(!root.map[2].value.empty(), "c lost its value");
    return true;
}

static bool document_empty_input_has_empty_root()
{
    EXPECT(parse_document("").root().empty(), "empty input produced entries");
    EXPECT(parse_document("; just a comment").root().empty(), "comment produced entries");
    return true;
}

static bool document_records_parent_lines()
{
    auto doc = parse_document("a\n  b\n    c = 1\n  d = 2");
    auto const & a = doc.root().map[0];
    EXPECT(a.parent_line == 0, "root entry has a parent");

    auto const & b = a.value.map[0];
    EXPECT(b.parent_line == 1, "b should belong to line 1");
    EXPECT(b.value.map[0].parent_line == 2, "c should belong to line 2");
    EXPECT(a.value.map[1].parent_line == 1, "d should belong to line 1");
    return true;
}

static bool document_finds_entries_by_line()
{
    auto doc = parse_document("a\n  b\n    c = 1\nd\n  = e");
    auto c = doc.find_entry(3);
    EXPECT(c && c->key.content == "c", "c not found");

    auto item = doc.find_entry(5);
    EXPECT(item && item->key.kind == token_kind::list_item, "list item not found");

    EXPECT(doc.find_entry(42) == nullptr, "phantom entry");
    EXPECT(doc.value_at(0) == &doc.root(), "line 0 is not the root");
    EXPECT(doc.value_at(2) && doc.value_at(2)->is_map(), "wrong value at line 2");
    return true;
}

static bool document_keeps_multiline_scalars()
{
    auto doc = parse_document("key = \"\"\"\n  line1\n  line2");
    auto const & v = doc.root().map[0].value;
    EXPECT(v.is_scalar(), "multiline value missing");
    EXPECT(v.scalar->kind == token_kind::multiline_scalar, "wrong token kind");
    EXPECT(v.scalar->content == "line1\nline2", "wrong content");
    return true;
}

//------------------------------------------
// Errors
//------------------------------------------

static bool document_keeps_errored_tokens_in_place()
{
    auto doc = parse_document("a = \"x\n\"\n");
    auto const & root = doc.root();
    EXPECT(root.map.size() == 2, "errored entries dropped");
    EXPECT(root.map[0].value.scalar->has_error(), "value error lost");
    EXPECT(root.map[1].key.has_error(), "key error lost");
    return true;
}

static bool document_collects_detached_errors()
{
    auto doc = parse_document("; \xff\na = 1");
    EXPECT(doc.detached_errors().size() == 1, "comment error not kept");
    EXPECT(doc.detached_errors()[0].line == 1, "wrong line");
    EXPECT(doc.root().map.size() == 1, "content lost");
    return true;
}

static bool document_nests_under_unexpected_indent()
{
    auto doc = parse_document("  a = 1");
    auto const & root = doc.root();
    EXPECT(root.map.size() == 1, "placeholder entry missing");
    EXPECT(root.map[0].key.has_error(), "placeholder carries no error");
    EXPECT(root.map[0].value.is_map(), "indented block not nested");
    EXPECT(root.map[0].value.map[0].key.content == "a", "wrong nested key");
    return true;
}

static bool document_is_movable()
{
    auto doc = parse_document("a\n  b = 1");
    document moved = std::move(doc);
    auto e = moved.find_entry(2);
    EXPECT(e && e->value.scalar->content == "1", "moved document lost content");
    return true;
}

//------------------------------------------

inline void run_document_tests()
{
    RUN_TEST(document_builds_maps_lists_and_scalars);
    RUN_TEST(document_marks_missing_values_empty);
    RUN_TEST(document_empty_input_has_empty_root);
    RUN_TEST(document_records_parent_lines);
    RUN_TEST(document_finds_entries_by_line);
    RUN_TEST(document_keeps_multiline_scalars);

    SUBCAT("Errors");
    RUN_TEST(document_keeps_errored_tokens_in_place);
    RUN_TEST(document_collects_detached_errors);
    RUN_TEST(document_nests_under_unexpected_indent);
    RUN_TEST(document_is_movable);
}

} // ns conl::tests

#endif
