#ifndef QUILT_TESTS_MANAGER__
#define QUILT_TESTS_MANAGER__

#include "quilt_test_harness.hpp"
#include "../include/quilt.hpp"

namespace quilt::tests
{
using namespace quilt;

// Blocks of 5, 3 and 4 lines starting on line 1
constexpr std::string_view three_blocks =
    "a\nb\nc\nd\ne\n"
    "```\nx\n```\n"
    "p\nq\nr\ns\n";

inline block_manager make_manager(std::string_view text, manager_options opt = {})
{
    block_manager mgr(make_default_registry(), opt);
    if (auto err = mgr.parse_document(text))
        std::cout << "parse_document: " << err->message << '\n';
    return mgr;
}

//----------------------------------------------------------------------------
// Parsing
//----------------------------------------------------------------------------

static bool parse_document_builds_clean_blocks()
{
    auto mgr = make_manager(three_blocks);

    EXPECT(mgr.block_count() == 3, "Expected three blocks");
    EXPECT(mgr.block(0)->lines() == (line_range{ 1, 5 }), "First block lines");
    EXPECT(mgr.block(1)->lines() == (line_range{ 6, 8 }), "Second block lines");
    EXPECT(mgr.block(2)->lines() == (line_range{ 9, 12 }), "Third block lines");
    EXPECT(mgr.dirty_blocks().empty(), "Fresh blocks are clean");
    EXPECT(mgr.failed_blocks().empty(), "Every block parsed");
    EXPECT(mgr.render_document() == three_blocks, "Render reproduces the input");
    return true;
}

static bool parse_document_replaces_previous_blocks()
{
    auto mgr = make_manager(three_blocks);
    EXPECT(!mgr.parse_document("only line\n"), "Second parse should succeed");

    EXPECT(mgr.block_count() == 1, "Old blocks are gone");
    EXPECT(mgr.block(0)->raw_text() == "only line\n", "New content");
    return true;
}

static bool unterminated_block_is_kept_with_notice()
{
    constexpr std::string_view src = "#+BEGIN_SRC\nx=1\n";
    auto mgr = make_manager(src);

    EXPECT(mgr.block_count() == 1, "One recovered block");
    EXPECT(mgr.notices().size() == 1, "One recovery notice");
    EXPECT(mgr.block(0)->notice().has_value(), "Notice attached to the block");
    EXPECT(mgr.failed_blocks() == std::vector<size_t>{ 0 }, "Org parser rejects the open block");
    EXPECT(!mgr.block(0)->has_ast(), "Failed block has no tree");
    EXPECT(mgr.render_document() == src, "Raw text still renders");
    return true;
}

static bool strict_detection_leaves_note_untouched()
{
    manager_options opt;
    opt.detection.strict = true;
    auto mgr = make_manager("kept\n", opt);

    auto err = mgr.parse_document("#+BEGIN_SRC\nx=1\n");
    EXPECT(err.has_value(), "Strict mode rejects unterminated blocks");
    EXPECT(err->kind == manager_error_kind::strict_detection_failed, "Wrong error kind");
    EXPECT(err->loc.line == 1, "Error points at the opener");
    EXPECT(mgr.block_count() == 1 && mgr.block(0)->raw_text() == "kept\n", "Previous note survives");
    return true;
}

static bool unknown_syntax_falls_back_to_identity()
{
    constexpr std::string_view src = "some text\n$$x$$\n```\ny\n```\n";

    block_manager mgr{ parser_registry{} };
    EXPECT(!mgr.parse_document(src), "Parsing never needs a registered parser");

    EXPECT(mgr.block_count() == 3, "Detection is independent of the registry");
    for (auto const & b : mgr.note().blocks())
        EXPECT(b.is_fallback() && !b.resolved_syntax(), "Identity parser took every block");
    EXPECT(mgr.render_document() == src, "Identity renders the input unchanged");
    return true;
}

static bool fallback_blocks_ignore_same_named_parsers()
{
    // Registered under the name a fallback might be mistaken for
    class shouting_parser final : public parser
    {
    public:
        syntax_kind kind() const override { return syntax_kind::custom("identity"); }
        bool can_handle(std::string_view) const override { return false; }

        parse_result parse(std::string_view, size_t) const override
        {
            parsed_block out;
            out.metadata.set_property("SHOUT", "yes");
            out.ast.nodes.push_back({ verbatim_node{ "LOUD\n" }, std::string("LOUD\n") });
            return out;
        }

        std::string render(block_ast const &, block_metadata const &) const override { return "LOUD\n"; }
    };

    constexpr std::string_view src = "plain words\n";

    parser_registry registry;
    EXPECT(!registry.emplace<shouting_parser>(), "Custom parser registers");

    block_manager mgr(std::move(registry));
    EXPECT(!mgr.parse_document(src), "Parse should succeed");
    EXPECT(mgr.block(0)->is_fallback(), "Nothing claimed the prose");

    EXPECT(!mgr.reparse_block(0), "Reparse should succeed");
    EXPECT(mgr.block(0)->is_fallback(), "Reparse stays with the identity parser");
    EXPECT(!mgr.block(0)->property("SHOUT"), "Custom parser never ran");
    EXPECT(mgr.render_document() == src, "Block renders verbatim");
    return true;
}

//----------------------------------------------------------------------------
// Structural edits
//----------------------------------------------------------------------------

static bool remove_shifts_following_blocks()
{
    auto mgr = make_manager(three_blocks);
    block_ast before = *mgr.block(2)->ast();

    EXPECT(!mgr.remove_block(1), "Remove should succeed");
    EXPECT(mgr.block_count() == 2, "Two blocks left");
    EXPECT(mgr.block(1)->lines() == (line_range{ 6, 9 }), "Third block moves from 9-12 to 6-9");
    EXPECT(*mgr.block(1)->ast() == before, "Moved block keeps its tree");
    EXPECT(mgr.dirty_blocks().empty(), "Removal dirties nothing");
    EXPECT(mgr.note().is_contiguous(), "Ranges still tile the note");
    return true;
}

static bool insert_shifts_following_blocks()
{
    auto mgr = make_manager(three_blocks);
    block_metadata before = mgr.block(1)->metadata();

    EXPECT(!mgr.insert_block(1, syntax_kind::latex(), "$$\nx\n$$\n"), "Insert should succeed");
    EXPECT(mgr.block_count() == 4, "Four blocks");
    EXPECT(mgr.block(0)->lines() == (line_range{ 1, 5 }), "Earlier block untouched");
    EXPECT(mgr.block(1)->lines() == (line_range{ 6, 8 }), "New block takes the position");
    EXPECT(mgr.block(2)->lines() == (line_range{ 9, 11 }), "Following block shifted by three");
    EXPECT(mgr.block(3)->lines() == (line_range{ 12, 15 }), "Last block shifted by three");
    EXPECT(mgr.block(2)->metadata() == before, "Shifted block keeps its metadata");
    EXPECT(!mgr.block(1)->is_dirty() && mgr.block(1)->has_ast(), "Inserted block is parsed at once");
    EXPECT(mgr.dirty_blocks().empty(), "No block is left dirty");
    EXPECT(mgr.note().is_contiguous(), "Ranges still tile the note");
    return true;
}

static bool insert_terminates_inner_blocks()
{
    auto mgr = make_manager(three_blocks);

    EXPECT(!mgr.insert_block(0, syntax_kind::markdown(), "no newline"), "Insert should succeed");
    EXPECT(mgr.block(0)->raw_text() == "no newline\n", "Inner block gets a line terminator");
    EXPECT(mgr.render_document() == std::string("no newline\n") + std::string(three_blocks), "Render stays line aligned");

    EXPECT(!mgr.insert_block(mgr.block_count(), syntax_kind::markdown(), "tail"), "Append should succeed");
    EXPECT(mgr.block(mgr.block_count() - 1)->raw_text() == "tail", "Last block may end without newline");
    return true;
}

static bool append_after_open_last_line_is_rejected()
{
    auto mgr = make_manager("a\n```\nx\n```");

    auto err = mgr.insert_block(mgr.block_count(), syntax_kind::markdown(), "more\n");
    EXPECT(err && err->kind == manager_error_kind::boundary_not_at_line_end, "Append needs a line boundary");
    EXPECT(mgr.block_count() == 2, "No block was added");
    return true;
}

static bool empty_text_is_rejected()
{
    auto mgr = make_manager(three_blocks);

    auto ins = mgr.insert_block(0, syntax_kind::markdown(), "");
    EXPECT(ins && ins->kind == manager_error_kind::empty_block, "Empty insert rejected");

    auto set = mgr.set_block_text(0, "");
    EXPECT(set && set->kind == manager_error_kind::empty_block, "Empty replacement rejected");
    EXPECT(mgr.render_document() == three_blocks, "Note unchanged");
    return true;
}

static bool invalid_indices_do_not_mutate()
{
    auto mgr = make_manager(three_blocks);

    auto r = mgr.reparse_block(3);
    auto d = mgr.remove_block(3);
    auto i = mgr.insert_block(4, syntax_kind::markdown(), "x\n");
    auto s = mgr.set_block_text(9, "x\n");
    auto m = mgr.mark_dirty(3);
    auto p = mgr.patch_metadata(3, {});
    auto x = mgr.redetect_block(3);

    for (auto const & err : { r, d, i, s, m, p, x })
        EXPECT(err && err->kind == manager_error_kind::index_out_of_range, "Expected index_out_of_range");

    EXPECT(mgr.block_count() == 3, "Block count unchanged");
    EXPECT(mgr.dirty_blocks().empty(), "Nothing dirtied");
    EXPECT(mgr.render_document() == three_blocks, "Text unchanged");
    return true;
}

//----------------------------------------------------------------------------
// Dirty tracking
//----------------------------------------------------------------------------

static bool set_text_dirties_only_that_block()
{
    auto mgr = make_manager(three_blocks);
    block_ast code_before = *mgr.block(1)->ast();
    block_ast tail_before = *mgr.block(2)->ast();

    EXPECT(!mgr.set_block_text(0, "new\ntext\n"), "Edit should succeed");

    EXPECT(mgr.dirty_blocks() == std::vector<size_t>{ 0 }, "Only the edited block is dirty");
    EXPECT(mgr.block(0)->lines() == (line_range{ 1, 2 }), "Edited block shrinks");
    EXPECT(mgr.block(1)->lines() == (line_range{ 3, 5 }), "Next block shifts back");
    EXPECT(mgr.block(2)->lines() == (line_range{ 6, 9 }), "Last block shifts back");
    EXPECT(*mgr.block(1)->ast() == code_before && *mgr.block(2)->ast() == tail_before, "Other trees untouched");

    auto pending = mgr.render_dirty_blocks();
    EXPECT(pending.size() == 1 && pending[0].first == 0 && pending[0].second == "new\ntext\n", "Dirty render");
    EXPECT(mgr.render_document() == "new\ntext\n```\nx\n```\np\nq\nr\ns\n", "Raw text is authoritative");

    EXPECT(mgr.reparse_dirty() == 1, "One block reparsed");
    EXPECT(mgr.dirty_blocks().empty(), "Clean after reparse");
    return true;
}

static bool failed_reparse_keeps_raw_text()
{
    auto mgr = make_manager(three_blocks);

    EXPECT(!mgr.set_block_text(1, "```\nunclosed\n"), "Edit should succeed");
    EXPECT(!mgr.reparse_block(1), "Reparse call itself succeeds");

    auto const * b = mgr.block(1);
    EXPECT(b->failed() && !b->has_ast(), "Block records its parse error");
    EXPECT(b->error()->kind == parse_error_kind::unterminated_fence, "Wrong parse error");
    EXPECT(b->error()->loc.line == 6, "Error carries the document line");
    EXPECT(!b->is_dirty(), "Derived state reflects the current text");
    EXPECT(b->raw_text() == "```\nunclosed\n", "Raw text untouched");
    EXPECT(b->lines() == (line_range{ 6, 7 }), "Line range untouched");
    EXPECT(mgr.failed_blocks() == std::vector<size_t>{ 1 }, "Failure is queryable");
    return true;
}

static bool reparse_keeps_resolved_parser()
{
    auto mgr = make_manager(three_blocks);

    // Turning prose into a fence is a structural change; the Markdown
    // parser keeps the block until it is redetected
    EXPECT(!mgr.set_block_text(2, "```\nnow code\n```\n"), "Edit should succeed");
    EXPECT(!mgr.reparse_block(2), "Reparse should succeed");
    EXPECT(mgr.block(2)->resolved_syntax() == syntax_kind::markdown(), "Same parser as before");
    EXPECT(mgr.block(2)->is_syntax(syntax_kind::markdown()), "Declared syntax unchanged");
    return true;
}

static bool patch_and_mark_dirty()
{
    auto mgr = make_manager(three_blocks);

    block_metadata md;
    md.heading_level = 3;
    EXPECT(!mgr.patch_metadata(2, md), "Patch should succeed");
    EXPECT(mgr.block(2)->heading_level() == 3, "Patched metadata is visible");
    EXPECT(mgr.render_document() == three_blocks, "Metadata patch does not touch text");

    EXPECT(!mgr.mark_dirty(0), "mark_dirty should succeed");
    EXPECT(mgr.dirty_blocks() == (std::vector<size_t>{ 0, 2 }), "Both blocks dirty");

    EXPECT(mgr.reparse_dirty() == 2, "Two blocks reparsed");
    EXPECT(!mgr.block(2)->heading_level(), "Reparse restores derived metadata");
    return true;
}

static bool redetect_splits_a_block()
{
    auto mgr = make_manager("intro\n");
    constexpr std::string_view text = "intro\n```c\nint x;\n```\nafter\n";

    EXPECT(!mgr.set_block_text(0, std::string(text)), "Edit should succeed");
    EXPECT(!mgr.redetect_block(0), "Redetection should succeed");

    EXPECT(mgr.block_count() == 3, "Block split into three");
    EXPECT(mgr.block(1)->is_syntax(syntax_kind::code("c")), "Fence detected");
    EXPECT(mgr.block(1)->lines() == (line_range{ 2, 4 }), "Fence lines");
    EXPECT(mgr.block(2)->lines() == (line_range{ 5, 5 }), "Trailing prose");
    EXPECT(mgr.dirty_blocks().empty(), "Redetected blocks are parsed");
    EXPECT(mgr.render_document() == text, "Text unchanged");
    return true;
}

//============================================================================
// Test Runner
//============================================================================

inline void run_manager_tests()
{
    SUBCAT("Parsing");
    RUN_TEST(parse_document_builds_clean_blocks);
    RUN_TEST(parse_document_replaces_previous_blocks);
    RUN_TEST(unterminated_block_is_kept_with_notice);
    RUN_TEST(strict_detection_leaves_note_untouched);
    RUN_TEST(unknown_syntax_falls_back_to_identity);
    RUN_TEST(fallback_blocks_ignore_same_named_parsers);

    SUBCAT("Structural edits");
    RUN_TEST(remove_shifts_following_blocks);
    RUN_TEST(insert_shifts_following_blocks);
    RUN_TEST(insert_terminates_inner_blocks);
    RUN_TEST(append_after_open_last_line_is_rejected);
    RUN_TEST(empty_text_is_rejected);
    RUN_TEST(invalid_indices_do_not_mutate);

    SUBCAT("Dirty tracking");
    RUN_TEST(set_text_dirties_only_that_block);
    RUN_TEST(failed_reparse_keeps_raw_text);
    RUN_TEST(reparse_keeps_resolved_parser);
    RUN_TEST(patch_and_mark_dirty);
    RUN_TEST(redetect_splits_a_block);
}

}

#endif
