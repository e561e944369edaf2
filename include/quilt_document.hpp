// quilt_document.hpp - Quilt hybrid notes - Block and Document Model
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef QUILT_DOCUMENT_HPP
#define QUILT_DOCUMENT_HPP

#include "quilt_core.hpp"
#include "quilt_detector.hpp"
#include "quilt_parser.hpp"

#include <span>

namespace quilt
{
    class block_manager;
    class hybrid_note;

//========================================================================
// Hybrid block
//========================================================================
//
// raw_text is the source of truth. ast and metadata are derived from it
// and may be stale while the block is dirty.

    class hybrid_block
    {
    public:
        hybrid_block() = default;

        // Unparsed block; stays dirty until a manager parses it
        hybrid_block(syntax_kind kind, std::string raw_text)
            : syntax_(std::move(kind))
            , raw_text_(std::move(raw_text))
        {}

        //------------------------------------------------------------------------
        // Source
        //------------------------------------------------------------------------

        syntax_kind const & syntax() const noexcept { return syntax_; }
        std::string const & raw_text() const noexcept { return raw_text_; }
        line_range lines() const noexcept { return lines_; }
        size_t line_count() const noexcept { return lines_.count(); }

        bool is_syntax(syntax_kind const & kind) const { return syntax_ == kind; }

        // Kind of the registered parser that produced ast; empty before the
        // first parse and when the identity parser took the block
        std::optional<syntax_kind> const & resolved_syntax() const noexcept { return resolved_; }
        bool is_fallback() const noexcept { return fallback_; }

        //------------------------------------------------------------------------
        // Derived state
        //------------------------------------------------------------------------

        bool is_dirty() const noexcept { return dirty_; }
        bool has_ast() const noexcept { return ast_.has_value(); }
        block_ast const * ast() const noexcept { return ast_ ? &*ast_ : nullptr; }
        block_metadata const & metadata() const noexcept { return metadata_; }

        bool failed() const noexcept { return error_.has_value(); }
        std::optional<parse_error> const & error() const noexcept { return error_; }
        std::optional<detection_notice> const & notice() const noexcept { return notice_; }

        //------------------------------------------------------------------------
        // Metadata accessors
        //------------------------------------------------------------------------

        bool is_heading() const noexcept { return metadata_.heading_level.has_value(); }
        std::optional<int> heading_level() const noexcept { return metadata_.heading_level; }

        std::optional<std::string_view> todo_state() const noexcept
        {
            if (!metadata_.todo_state) return std::nullopt;
            return std::string_view(*metadata_.todo_state);
        }

        bool is_todo() const noexcept { return metadata_.todo_state == "TODO"; }
        bool is_done() const noexcept { return metadata_.todo_state == "DONE"; }

        std::optional<std::string_view> id() const noexcept
        {
            if (!metadata_.id) return std::nullopt;
            return std::string_view(*metadata_.id);
        }

        property_list const & properties() const noexcept { return metadata_.properties; }
        bool has_properties() const noexcept { return !metadata_.properties.empty(); }

        std::optional<std::string_view> property(std::string_view key) const
        {
            return metadata_.property(key);
        }

        //------------------------------------------------------------------------
        // Mutation; every edit leaves the block dirty
        //------------------------------------------------------------------------

        void set_property(std::string_view key, std::string_view value)
        {
            metadata_.set_property(key, value);
            dirty_ = true;
        }

        void patch_metadata(block_metadata metadata)
        {
            metadata_ = std::move(metadata);
            dirty_ = true;
        }

        void mark_dirty() noexcept { dirty_ = true; }

    private:
        friend class hybrid_note;
        friend class block_manager;

        syntax_kind                     syntax_;
        std::string                     raw_text_;
        std::optional<block_ast>        ast_;
        block_metadata                  metadata_;
        line_range                      lines_;
        bool                            dirty_ {true};
        std::optional<syntax_kind>      resolved_;
        bool                            fallback_ {false};
        std::optional<parse_error>      error_;
        std::optional<detection_notice> notice_;
    };

//========================================================================
// Hybrid note
//========================================================================
//
// Ordered blocks whose line ranges tile the document: block i+1 starts on
// the line after block i ends, and the first block starts on line 1.

    class hybrid_note
    {
    public:
        hybrid_note() = default;

        hybrid_note(std::string id, std::string title)
            : id_(std::move(id))
            , title_(std::move(title))
        {}

        std::string const & id() const noexcept { return id_; }
        std::string const & title() const noexcept { return title_; }

        void set_title(std::string title) { title_ = std::move(title); }

        //------------------------------------------------------------------------
        // Blocks
        //------------------------------------------------------------------------

        // Appends at the next free line; returns the new block's index, or
        // npos() when the text is empty or the last block has no final
        // line terminator
        size_t add_block(hybrid_block block);

        size_t block_count() const noexcept { return blocks_.size(); }
        bool empty() const noexcept { return blocks_.empty(); }

        hybrid_block const * block_at(size_t index) const noexcept
        {
            return index < blocks_.size() ? &blocks_[index] : nullptr;
        }

        hybrid_block * block_at_mut(size_t index) noexcept
        {
            return index < blocks_.size() ? &blocks_[index] : nullptr;
        }

        std::span<const hybrid_block> blocks() const noexcept { return blocks_; }

        //------------------------------------------------------------------------
        // Lines
        //------------------------------------------------------------------------

        size_t total_lines() const noexcept
        {
            return blocks_.empty() ? 0 : blocks_.back().lines_.end;
        }

        bool is_contiguous() const noexcept;

        //------------------------------------------------------------------------
        // Metadata scans; dirty blocks report their last parsed metadata
        //------------------------------------------------------------------------

        std::vector<size_t> find_headings() const;
        std::vector<size_t> find_headings_at_level(int level) const;
        std::vector<size_t> find_todos() const;

    private:
        friend class block_manager;

        std::string               id_;
        std::string               title_;
        std::vector<hybrid_block> blocks_;
    };

//---------------------------------------------------------------------------

    inline size_t hybrid_note::add_block(hybrid_block block)
    {
        if (block.raw_text_.empty())
            return npos();
        if (!blocks_.empty() && !detail::has_line_terminator(blocks_.back().raw_text_))
            return npos();

        size_t start = total_lines() + 1;
        block.lines_ = { start, start + detail::count_lines(block.raw_text_) - 1 };
        blocks_.push_back(std::move(block));
        return blocks_.size() - 1;
    }

//---------------------------------------------------------------------------

    inline bool hybrid_note::is_contiguous() const noexcept
    {
        size_t expected = 1;
        for (auto const & b : blocks_)
        {
            if (b.lines_.start != expected || b.lines_.end < b.lines_.start)
                return false;
            expected = b.lines_.end + 1;
        }
        return true;
    }

//---------------------------------------------------------------------------

    inline std::vector<size_t> hybrid_note::find_headings() const
    {
        std::vector<size_t> out;
        for (size_t i = 0; i < blocks_.size(); ++i)
            if (blocks_[i].is_heading())
                out.push_back(i);
        return out;
    }

    inline std::vector<size_t> hybrid_note::find_headings_at_level(int level) const
    {
        std::vector<size_t> out;
        for (size_t i = 0; i < blocks_.size(); ++i)
            if (blocks_[i].heading_level() == level)
                out.push_back(i);
        return out;
    }

    inline std::vector<size_t> hybrid_note::find_todos() const
    {
        std::vector<size_t> out;
        for (size_t i = 0; i < blocks_.size(); ++i)
            if (blocks_[i].todo_state())
                out.push_back(i);
        return out;
    }

//========================================================================
// Document
//========================================================================
//
// A document is either one syntax tree (standard) or a hybrid note.
// Moving between the two is explicit and may lose per-block detail.

    struct standard_note
    {
        std::string id;
        std::string title;
        syntax_kind syntax;
        block_ast   ast;
    };

    enum class document_format
    {
        standard,
        hybrid
    };

    class document
    {
    public:
        explicit document(standard_note n) : content_(std::move(n)) {}
        explicit document(hybrid_note n) : content_(std::move(n)) {}

        static document standard(std::string id, std::string title, syntax_kind syntax = syntax_kind::markdown())
        {
            return document(standard_note{ std::move(id), std::move(title), std::move(syntax), {} });
        }

        static document hybrid(std::string id, std::string title)
        {
            return document(hybrid_note(std::move(id), std::move(title)));
        }

        document_format format() const noexcept
        {
            return std::holds_alternative<hybrid_note>(content_) ? document_format::hybrid : document_format::standard;
        }

        std::string const & id() const noexcept
        {
            return std::visit([](auto const & n) -> std::string const & { return id_of(n); }, content_);
        }

        std::string const & title() const noexcept
        {
            return std::visit([](auto const & n) -> std::string const & { return title_of(n); }, content_);
        }

        standard_note const * as_standard() const noexcept { return std::get_if<standard_note>(&content_); }
        standard_note * as_standard_mut() noexcept { return std::get_if<standard_note>(&content_); }
        hybrid_note const * as_hybrid() const noexcept { return std::get_if<hybrid_note>(&content_); }
        hybrid_note * as_hybrid_mut() noexcept { return std::get_if<hybrid_note>(&content_); }

    private:
        static std::string const & id_of(standard_note const & n) noexcept { return n.id; }
        static std::string const & id_of(hybrid_note const & n) noexcept { return n.id(); }
        static std::string const & title_of(standard_note const & n) noexcept { return n.title; }
        static std::string const & title_of(hybrid_note const & n) noexcept { return n.title(); }

        std::variant<standard_note, hybrid_note> content_;
    };

//========================================================================
// Conversion
//========================================================================

    // Concatenates block ASTs in order. A block without a current AST
    // (failed or dirty) contributes its raw text as one verbatim node.
    inline standard_note to_standard(hybrid_note const & note, syntax_kind syntax = syntax_kind::markdown())
    {
        standard_note out{ note.id(), note.title(), std::move(syntax), {} };

        for (auto const & b : note.blocks())
        {
            if (b.ast() && !b.is_dirty())
            {
                auto const & nodes = b.ast()->nodes;
                out.ast.nodes.insert(out.ast.nodes.end(), nodes.begin(), nodes.end());
            }
            else
                out.ast.nodes.push_back(ast_node{ verbatim_node{ b.raw_text() }, b.raw_text() });
        }

        return out;
    }

} // namespace quilt

#endif // QUILT_DOCUMENT_HPP
