// quilt_manager.hpp - Quilt hybrid notes - Block Manager
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef QUILT_MANAGER_HPP
#define QUILT_MANAGER_HPP

#include "quilt_core.hpp"
#include "quilt_detector.hpp"
#include "quilt_parser.hpp"
#include "quilt_document.hpp"
#include "quilt_query.hpp"
#include "quilt_serializer.hpp"

#include <cstddef>
#include <iterator>

#include <plog/Log.h>

namespace quilt
{
    struct manager_options
    {
        detector_options detection {};
    };

    enum class manager_error_kind
    {
        index_out_of_range,
        empty_block,                // replacement or inserted text holds no lines
        boundary_not_at_line_end,   // appending after a last block with no final newline
        strict_detection_failed,
    };

    using manager_error = error<manager_error_kind>;

//========================================================================
// BLOCK MANAGER API
//========================================================================
//
// Owns one hybrid note and keeps its blocks in step with their text.
// A failed call leaves the note exactly as it was. Edits that change raw
// text only dirty the edited block; nothing is reparsed behind the
// caller's back.

    class block_manager
    {
    public:
        explicit block_manager(parser_registry registry, manager_options opt = {});
        block_manager(hybrid_note note, parser_registry registry, manager_options opt = {});

        //------------------------------------------------------------------------
        // Whole document
        //------------------------------------------------------------------------

        // Detects, parses and swaps in a fresh block sequence in one step
        maybe_error<manager_error_kind> parse_document(std::string_view text);

        std::string render_document(render_options opt = {}) const;

        // (index, rendered text) of every dirty block, in order
        std::vector<std::pair<size_t, std::string>> render_dirty_blocks() const;

        //------------------------------------------------------------------------
        // Block edits
        //------------------------------------------------------------------------

        // Reruns the block's resolved parser over its current raw text
        maybe_error<manager_error_kind> reparse_block(size_t index);

        // Returns the number of blocks reparsed
        size_t reparse_dirty();

        maybe_error<manager_error_kind> mark_dirty(size_t index);
        maybe_error<manager_error_kind> set_block_text(size_t index, std::string raw_text);
        maybe_error<manager_error_kind> patch_metadata(size_t index, block_metadata metadata);

        // index == block_count() appends. The new block is parsed at once.
        maybe_error<manager_error_kind> insert_block(size_t index, syntax_kind kind, std::string raw_text);

        maybe_error<manager_error_kind> remove_block(size_t index);

        // Runs detection over one block's text and replaces the block with
        // the segments found there
        maybe_error<manager_error_kind> redetect_block(size_t index);

        //------------------------------------------------------------------------
        // Access
        //------------------------------------------------------------------------

        hybrid_note const & note() const noexcept { return note_; }
        hybrid_note release() { return std::move(note_); }

        hybrid_block const * block(size_t index) const noexcept { return note_.block_at(index); }
        size_t block_count() const noexcept { return note_.block_count(); }

        // Recovery notices from the last parse_document
        std::vector<detection_notice> const & notices() const noexcept { return notices_; }

        parser_registry const & registry() const noexcept { return registry_; }
        manager_options const & options() const noexcept { return opts_; }

        //------------------------------------------------------------------------
        // Queries (metadata may be stale on dirty blocks)
        //------------------------------------------------------------------------

        std::vector<size_t> find_headings() const { return quilt::find_headings(note_); }
        std::vector<size_t> find_todo_items() const { return quilt::find_todo_items(note_); }
        std::vector<size_t> find_blocks_by_heading_level(int level) const { return quilt::find_headings_at_level(note_, level); }

        std::vector<size_t> find_by_metadata(metadata_predicate const & pred) const
        {
            return quilt::find_by_metadata(note_, pred);
        }

        std::vector<size_t> failed_blocks() const { return quilt::failed_blocks(note_); }
        std::vector<size_t> dirty_blocks() const { return quilt::dirty_blocks(note_); }

    private:
        hybrid_block build_block(raw_segment seg, size_t first_line) const;
        void parse_into(hybrid_block & block) const;
        void shift_lines(size_t from, std::ptrdiff_t delta);

        maybe_error<manager_error_kind> check_index(size_t index, std::string_view op) const;

        parser_registry               registry_;
        manager_options               opts_;
        hybrid_note                   note_;
        std::vector<detection_notice> notices_;
    };

//========================================================================
// Block manager implementation
//========================================================================

    inline block_manager::block_manager(parser_registry registry, manager_options opt)
        : registry_(std::move(registry))
        , opts_(opt)
    {}

    inline block_manager::block_manager(hybrid_note note, parser_registry registry, manager_options opt)
        : registry_(std::move(registry))
        , opts_(opt)
        , note_(std::move(note))
    {}

//---------------------------------------------------------------------------

    inline maybe_error<manager_error_kind> block_manager::check_index(size_t index, std::string_view op) const
    {
        if (index < note_.blocks_.size())
            return std::nullopt;

        return manager_error{ manager_error_kind::index_out_of_range, {},
                              std::string(op) + ": block index " + std::to_string(index)
                              + " out of range (" + std::to_string(note_.blocks_.size()) + " blocks)" };
    }

//---------------------------------------------------------------------------

    inline void block_manager::parse_into(hybrid_block & block) const
    {
        parser const & p = block.fallback_ ? registry_.identity()
                         : block.resolved_ ? registry_.lookup(*block.resolved_)
                         : registry_.resolve(block.syntax_, block.raw_text_);

        auto result = p.parse(block.raw_text_, block.lines_.start);

        if (is_parse_error(result))
        {
            auto const & err = get_parse_error(result);
            PLOGW << "quilt: line " << err.loc.line << ": " << p.kind().name()
                  << " block could not be parsed: " << err.message;

            block.ast_.reset();
            block.metadata_ = {};
            block.error_ = err;
        }
        else
        {
            auto & parsed = get_parsed(result);
            block.ast_ = std::move(parsed.ast);
            block.metadata_ = std::move(parsed.metadata);
            block.error_.reset();
        }

        block.fallback_ = &p == &registry_.identity();
        if (block.fallback_)
            block.resolved_.reset();
        else
            block.resolved_ = p.kind();
        block.dirty_ = false;
    }

//---------------------------------------------------------------------------

    inline hybrid_block block_manager::build_block(raw_segment seg, size_t first_line) const
    {
        hybrid_block block(std::move(seg.kind), std::move(seg.raw_text));
        block.lines_ = { first_line + seg.start_line - 1, first_line + seg.end_line - 1 };

        if (seg.notice)
        {
            block.notice_ = std::move(seg.notice);
            block.notice_->loc.line = block.lines_.start;
        }

        parse_into(block);
        return block;
    }

//---------------------------------------------------------------------------

    inline void block_manager::shift_lines(size_t from, std::ptrdiff_t delta)
    {
        auto shift = [delta](size_t & line)
        {
            if (line != 0)
                line = static_cast<size_t>(static_cast<std::ptrdiff_t>(line) + delta);
        };

        for (size_t i = from; i < note_.blocks_.size(); ++i)
        {
            auto & b = note_.blocks_[i];
            shift(b.lines_.start);
            shift(b.lines_.end);
            if (b.error_)
                shift(b.error_->loc.line);
            if (b.notice_)
                shift(b.notice_->loc.line);
        }
    }

//---------------------------------------------------------------------------

    inline maybe_error<manager_error_kind> block_manager::parse_document(std::string_view text)
    {
        auto detected = scan(text, opts_.detection);

        if (opts_.detection.strict && detected.has_errors())
        {
            auto const & first = detected.errors.front();
            return manager_error{ manager_error_kind::strict_detection_failed, first.loc, first.message };
        }

        std::vector<hybrid_block> blocks;
        blocks.reserve(detected.result.size());
        for (auto & seg : detected.result)
            blocks.push_back(build_block(std::move(seg), 1));

        note_.blocks_ = std::move(blocks);
        notices_ = std::move(detected.errors);
        return std::nullopt;
    }

//---------------------------------------------------------------------------

    inline std::string block_manager::render_document(render_options opt) const
    {
        return quilt::render_document(note_, registry_, opt);
    }

    inline std::vector<std::pair<size_t, std::string>> block_manager::render_dirty_blocks() const
    {
        std::vector<std::pair<size_t, std::string>> out;
        for (size_t i : dirty_blocks())
            out.emplace_back(i, render_block(note_.blocks_[i], registry_));
        return out;
    }

//---------------------------------------------------------------------------

    inline maybe_error<manager_error_kind> block_manager::reparse_block(size_t index)
    {
        if (auto err = check_index(index, "reparse_block"))
            return err;

        PLOGD << "quilt: reparsing block " << index;
        parse_into(note_.blocks_[index]);
        return std::nullopt;
    }

    inline size_t block_manager::reparse_dirty()
    {
        size_t count = 0;
        for (auto & b : note_.blocks_)
        {
            if (!b.dirty_)
                continue;
            parse_into(b);
            ++count;
        }

        PLOGD << "quilt: reparsed " << count << " dirty blocks";
        return count;
    }

//---------------------------------------------------------------------------

    inline maybe_error<manager_error_kind> block_manager::mark_dirty(size_t index)
    {
        if (auto err = check_index(index, "mark_dirty"))
            return err;

        note_.blocks_[index].dirty_ = true;
        return std::nullopt;
    }

//---------------------------------------------------------------------------

    inline maybe_error<manager_error_kind> block_manager::set_block_text(size_t index, std::string raw_text)
    {
        if (auto err = check_index(index, "set_block_text"))
            return err;

        if (raw_text.empty())
            return manager_error{ manager_error_kind::empty_block, {}, "set_block_text: block text is empty" };

        // Only the last block may end without a line terminator
        if (index + 1 < note_.blocks_.size() && !detail::has_line_terminator(raw_text))
            raw_text.push_back('\n');

        auto & b = note_.blocks_[index];
        size_t old_count = b.line_count();
        size_t new_count = detail::count_lines(raw_text);

        b.raw_text_ = std::move(raw_text);
        b.lines_.end = b.lines_.start + new_count - 1;
        b.dirty_ = true;

        shift_lines(index + 1, static_cast<std::ptrdiff_t>(new_count) - static_cast<std::ptrdiff_t>(old_count));
        return std::nullopt;
    }

//---------------------------------------------------------------------------

    inline maybe_error<manager_error_kind> block_manager::patch_metadata(size_t index, block_metadata metadata)
    {
        if (auto err = check_index(index, "patch_metadata"))
            return err;

        note_.blocks_[index].patch_metadata(std::move(metadata));
        return std::nullopt;
    }

//---------------------------------------------------------------------------

    inline maybe_error<manager_error_kind> block_manager::insert_block(size_t index, syntax_kind kind, std::string raw_text)
    {
        auto & blocks = note_.blocks_;

        if (index > blocks.size())
        {
            return manager_error{ manager_error_kind::index_out_of_range, {},
                                  "insert_block: position " + std::to_string(index)
                                  + " out of range (" + std::to_string(blocks.size()) + " blocks)" };
        }

        if (raw_text.empty())
            return manager_error{ manager_error_kind::empty_block, {}, "insert_block: block text is empty" };

        if (index == blocks.size() && !blocks.empty() && !detail::has_line_terminator(blocks.back().raw_text_))
        {
            return manager_error{ manager_error_kind::boundary_not_at_line_end, { blocks.back().lines_.end },
                                  "insert_block: last block does not end with a newline" };
        }

        if (index < blocks.size() && !detail::has_line_terminator(raw_text))
            raw_text.push_back('\n');

        size_t start = index < blocks.size() ? blocks[index].lines_.start : note_.total_lines() + 1;
        size_t count = detail::count_lines(raw_text);

        hybrid_block block(std::move(kind), std::move(raw_text));
        block.lines_ = { start, start + count - 1 };
        parse_into(block);

        shift_lines(index, static_cast<std::ptrdiff_t>(count));
        blocks.insert(blocks.begin() + static_cast<std::ptrdiff_t>(index), std::move(block));

        PLOGD << "quilt: inserted block " << index << " at lines " << start << "-" << start + count - 1;
        return std::nullopt;
    }

//---------------------------------------------------------------------------

    inline maybe_error<manager_error_kind> block_manager::remove_block(size_t index)
    {
        if (auto err = check_index(index, "remove_block"))
            return err;

        auto & blocks = note_.blocks_;
        size_t count = blocks[index].line_count();

        blocks.erase(blocks.begin() + static_cast<std::ptrdiff_t>(index));
        shift_lines(index, -static_cast<std::ptrdiff_t>(count));

        PLOGD << "quilt: removed block " << index << " (" << count << " lines)";
        return std::nullopt;
    }

//---------------------------------------------------------------------------

    inline maybe_error<manager_error_kind> block_manager::redetect_block(size_t index)
    {
        if (auto err = check_index(index, "redetect_block"))
            return err;

        auto & blocks = note_.blocks_;
        size_t first_line = blocks[index].lines_.start;

        auto detected = scan(blocks[index].raw_text_, opts_.detection);

        if (opts_.detection.strict && detected.has_errors())
        {
            auto const & first = detected.errors.front();
            return manager_error{ manager_error_kind::strict_detection_failed,
                                  { first_line + first.loc.line - 1 }, first.message };
        }

        std::vector<hybrid_block> replacement;
        replacement.reserve(detected.result.size());
        for (auto & seg : detected.result)
            replacement.push_back(build_block(std::move(seg), first_line));

        blocks.erase(blocks.begin() + static_cast<std::ptrdiff_t>(index));
        blocks.insert(blocks.begin() + static_cast<std::ptrdiff_t>(index),
                      std::make_move_iterator(replacement.begin()),
                      std::make_move_iterator(replacement.end()));

        PLOGD << "quilt: block " << index << " redetected as " << replacement.size() << " blocks";
        return std::nullopt;
    }

} // namespace quilt

#endif // QUILT_MANAGER_HPP
