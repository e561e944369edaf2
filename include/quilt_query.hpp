// quilt_query.hpp - Quilt hybrid notes - Read-only block queries
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef QUILT_QUERY_HPP
#define QUILT_QUERY_HPP

#include "quilt_document.hpp"

#include <functional>

namespace quilt
{
//========================================================================
// QUERY API
//========================================================================
//
// Linear scans that return block indices in document order. Nothing here
// reparses: a dirty block answers with the metadata of its last parse.

    using block_predicate    = std::function<bool(hybrid_block const &)>;
    using metadata_predicate = std::function<bool(block_metadata const &)>;

    std::vector<size_t> find_blocks(hybrid_note const & note, block_predicate const & pred);
    std::vector<size_t> find_by_metadata(hybrid_note const & note, metadata_predicate const & pred);

    std::vector<size_t> find_headings(hybrid_note const & note);
    std::vector<size_t> find_headings_at_level(hybrid_note const & note, int level);
    std::vector<size_t> find_todo_items(hybrid_note const & note);
    std::vector<size_t> find_blocks_by_syntax(hybrid_note const & note, syntax_kind const & kind);
    std::vector<size_t> find_blocks_with_property(hybrid_note const & note, std::string_view key);
    std::optional<size_t> find_block_by_id(hybrid_note const & note, std::string_view id);

    std::vector<size_t> failed_blocks(hybrid_note const & note);
    std::vector<size_t> dirty_blocks(hybrid_note const & note);

    // Heading nodes anywhere inside block ASTs, in document order
    struct heading_ref
    {
        size_t               block;
        size_t               node;
        heading_node const * heading;
    };

    std::vector<heading_ref> find_heading_nodes(hybrid_note const & note);

//========================================================================
// QUERY IMPLEMENTATION
//========================================================================

    inline std::vector<size_t> find_blocks(hybrid_note const & note, block_predicate const & pred)
    {
        std::vector<size_t> out;
        auto blocks = note.blocks();
        for (size_t i = 0; i < blocks.size(); ++i)
            if (pred(blocks[i]))
                out.push_back(i);
        return out;
    }

    inline std::vector<size_t> find_by_metadata(hybrid_note const & note, metadata_predicate const & pred)
    {
        return find_blocks(note, [&](hybrid_block const & b) { return pred(b.metadata()); });
    }

//---------------------------------------------------------------------------

    inline std::vector<size_t> find_headings(hybrid_note const & note)
    {
        return note.find_headings();
    }

    inline std::vector<size_t> find_headings_at_level(hybrid_note const & note, int level)
    {
        return note.find_headings_at_level(level);
    }

    inline std::vector<size_t> find_todo_items(hybrid_note const & note)
    {
        return note.find_todos();
    }

    inline std::vector<size_t> find_blocks_by_syntax(hybrid_note const & note, syntax_kind const & kind)
    {
        return find_blocks(note, [&](hybrid_block const & b) { return b.is_syntax(kind); });
    }

    inline std::vector<size_t> find_blocks_with_property(hybrid_note const & note, std::string_view key)
    {
        return find_blocks(note, [&](hybrid_block const & b) { return b.property(key).has_value(); });
    }

    inline std::optional<size_t> find_block_by_id(hybrid_note const & note, std::string_view id)
    {
        auto blocks = note.blocks();
        for (size_t i = 0; i < blocks.size(); ++i)
            if (blocks[i].id() == id)
                return i;
        return std::nullopt;
    }

//---------------------------------------------------------------------------

    inline std::vector<size_t> failed_blocks(hybrid_note const & note)
    {
        return find_blocks(note, [](hybrid_block const & b) { return b.failed(); });
    }

    inline std::vector<size_t> dirty_blocks(hybrid_note const & note)
    {
        return find_blocks(note, [](hybrid_block const & b) { return b.is_dirty(); });
    }

//---------------------------------------------------------------------------

    inline std::vector<heading_ref> find_heading_nodes(hybrid_note const & note)
    {
        std::vector<heading_ref> out;
        auto blocks = note.blocks();

        for (size_t i = 0; i < blocks.size(); ++i)
        {
            auto ast = blocks[i].ast();
            if (!ast)
                continue;

            for (size_t n = 0; n < ast->nodes.size(); ++n)
                if (auto h = node_as<heading_node>(ast->nodes[n]))
                    out.push_back({ i, n, h });
        }

        return out;
    }

} // namespace quilt

#endif // QUILT_QUERY_HPP
