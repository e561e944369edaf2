#ifndef QUILT_TESTS_DOCUMENT__
#define QUILT_TESTS_DOCUMENT__

#include "quilt_test_harness.hpp"
#include "../include/quilt.hpp"

namespace quilt::tests
{
using namespace quilt;

static bool block_accessors_read_metadata()
{
    hybrid_block b(syntax_kind::org(), "* TODO Plan\n");
    EXPECT(b.is_dirty(), "A block nobody parsed is dirty");
    EXPECT(!b.has_ast(), "A block nobody parsed has no tree");

    block_metadata md;
    md.heading_level = 1;
    md.todo_state = "TODO";
    md.id = "plan";
    md.set_property("OWNER", "sam");
    b.patch_metadata(md);

    EXPECT(b.is_heading() && b.heading_level() == 1, "Heading accessors");
    EXPECT(b.is_todo() && !b.is_done(), "TODO state");
    EXPECT(b.todo_state() == "TODO", "todo_state");
    EXPECT(b.id() == "plan", "id");
    EXPECT(b.has_properties() && b.property("OWNER") == "sam", "Property lookup");
    EXPECT(!b.property("MISSING"), "Missing property");
    EXPECT(b.is_syntax(syntax_kind::org()), "Syntax check");
    return true;
}

static bool set_property_marks_dirty()
{
    hybrid_block b(syntax_kind::markdown(), "text\n");
    b.set_property("A", "1");
    b.set_property("A", "2");

    EXPECT(b.properties().size() == 1, "Setting a key twice replaces it");
    EXPECT(b.property("A") == "2", "Latest value wins");
    EXPECT(b.is_dirty(), "Metadata patch dirties the block");
    return true;
}

static bool note_appends_at_next_free_line()
{
    hybrid_note note("n1", "Scratch");

    EXPECT(note.add_block(hybrid_block(syntax_kind::markdown(), "a\nb\n")) == 0, "First index");
    EXPECT(note.add_block(hybrid_block(syntax_kind::code("c"), "```c\nx\n```\n")) == 1, "Second index");

    EXPECT(note.block_count() == 2, "Two blocks");
    EXPECT(note.block_at(0)->lines() == (line_range{ 1, 2 }), "First block lines");
    EXPECT(note.block_at(1)->lines() == (line_range{ 3, 5 }), "Second block follows");
    EXPECT(note.block_at(2) == nullptr, "Out of range access yields null");
    EXPECT(note.total_lines() == 5, "Total lines");
    EXPECT(note.is_contiguous(), "Ranges tile the note");
    return true;
}

static bool note_rejects_blocks_that_break_the_tiling()
{
    hybrid_note note("n2", "Ragged");

    EXPECT(note.add_block(hybrid_block(syntax_kind::markdown(), "")) == npos(), "Empty text is rejected");
    EXPECT(note.empty(), "Nothing was added");

    EXPECT(note.add_block(hybrid_block(syntax_kind::markdown(), "a")) == 0, "Unterminated last line is fine");
    EXPECT(note.add_block(hybrid_block(syntax_kind::markdown(), "b\n")) == npos(), "Cannot start after an open line");
    EXPECT(note.block_count() == 1, "Note is unchanged");
    EXPECT(note.total_lines() == 1, "Still one line");
    EXPECT(note.is_contiguous(), "Ranges still tile the note");
    return true;
}

static bool document_is_one_format_at_a_time()
{
    auto doc = document::hybrid("d1", "Journal");

    EXPECT(doc.format() == document_format::hybrid, "Hybrid format");
    EXPECT(doc.id() == "d1" && doc.title() == "Journal", "Identity");
    EXPECT(doc.as_hybrid() != nullptr, "Hybrid view");
    EXPECT(doc.as_standard() == nullptr, "No standard view");

    doc.as_hybrid_mut()->add_block(hybrid_block(syntax_kind::markdown(), "hello\n"));
    EXPECT(doc.as_hybrid()->block_count() == 1, "Mutable access reaches the note");

    auto plain = document::standard("d2", "Plain", syntax_kind::org());
    EXPECT(plain.format() == document_format::standard, "Standard format");
    EXPECT(plain.as_standard()->syntax == syntax_kind::org(), "Standard syntax");
    EXPECT(plain.as_hybrid() == nullptr, "No hybrid view");
    return true;
}

static bool hybrid_to_standard_and_back()
{
    constexpr std::string_view src = "# A\n```c\nx\n```\n";

    auto ctx = load(src);
    EXPECT(!ctx.has_errors(), "Clean load");

    document doc(std::move(ctx.result));
    auto standard = to_standard(doc);
    auto n = standard.as_standard();
    EXPECT(n != nullptr, "Conversion yields a standard document");
    EXPECT(n->ast.nodes.size() == 2, "Heading node and code node");
    EXPECT(node_as<heading_node>(n->ast.nodes[0]) != nullptr, "Heading first");
    EXPECT(node_as<code_node>(n->ast.nodes[1])->language == "c", "Code second");

    auto back = to_hybrid(standard);
    auto h = back.as_hybrid();
    EXPECT(h != nullptr, "Conversion yields a hybrid document");
    EXPECT(h->block_count() == 2, "Blocks are detected again");
    EXPECT(render_document(*h, make_default_registry()) == src, "Text survives both conversions");
    return true;
}

static bool dirty_blocks_convert_verbatim()
{
    hybrid_note note;
    note.add_block(hybrid_block(syntax_kind::markdown(), "never parsed\n"));

    auto standard = to_standard(note);
    EXPECT(standard.ast.nodes.size() == 1, "One node per unparsed block");

    auto v = node_as<verbatim_node>(standard.ast.nodes[0]);
    EXPECT(v && v->text == "never parsed\n", "Raw text is kept");
    return true;
}

//============================================================================
// Test Runner
//============================================================================

inline void run_document_tests()
{
    SUBCAT("Blocks");
    RUN_TEST(block_accessors_read_metadata);
    RUN_TEST(set_property_marks_dirty);

    SUBCAT("Notes and documents");
    RUN_TEST(note_appends_at_next_free_line);
    RUN_TEST(note_rejects_blocks_that_break_the_tiling);
    RUN_TEST(document_is_one_format_at_a_time);

    SUBCAT("Conversion");
    RUN_TEST(hybrid_to_standard_and_back);
    RUN_TEST(dirty_blocks_convert_verbatim);
}

}

#endif
