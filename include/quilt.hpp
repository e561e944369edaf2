// quilt.hpp - Quilt hybrid notes
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

//========================================================================
// Quilt Core Principles:
//========================================================================
//
// The Authored-Text Principle
// ---------------------------
// The raw text of a block is the document.
// Trees and metadata are derived views and may be rebuilt at any time.
// Rendering an unedited note reproduces its input byte for byte.
//
//
// The Total-Coverage Principle
// ----------------------------
// Every line belongs to exactly one block.
// Unknown syntax is kept verbatim, never rejected.
// An unterminated block still owns its lines up to the end.
//
//
// The Locality Principle
// ----------------------
// A broken block is still a block.
// Errors stay with the block that caused them.
// An edit to one block never disturbs the derived state of another.
//
//========================================================================

#ifndef QUILT_HYBRID_NOTES
#define QUILT_HYBRID_NOTES

#include "quilt_core.hpp"
#include "quilt_detector.hpp"
#include "quilt_parser.hpp"
#include "quilt_parsers.hpp"
#include "quilt_document.hpp"
#include "quilt_query.hpp"
#include "quilt_serializer.hpp"
#include "quilt_manager.hpp"

namespace quilt
{
//========================================================================
// Document creation
//========================================================================

    struct load_options
    {
        detector_options detection {};
    };

    using any_error = std::variant<detection_notice, parse_error>;

    using note_context = context<hybrid_note, any_error>;

    // Detects and parses text with the default registry. Recovery notices
    // and per-block parse errors are collected, never fatal.
    note_context load(std::string_view text, load_options opt = {});

    inline bool is_detection_notice(any_error const & e) { return std::holds_alternative<detection_notice>(e); }
    inline bool is_block_parse_error(any_error const & e) { return std::holds_alternative<parse_error>(e); }

    inline size_t error_line(any_error const & e)
    {
        return std::visit([](auto const & err) { return err.loc.line; }, e);
    }

    // Hybrid document to one syntax tree
    document to_standard(document const & doc, syntax_kind syntax = syntax_kind::markdown());

    // Renders the single tree and runs detection over the result
    document to_hybrid(document const & doc, load_options opt = {});

//========================================================================
// Implementation
//========================================================================

    inline note_context load(std::string_view text, load_options opt)
    {
        note_context out{};

        // Strict mode only applies to an explicit manager
        detector_options detection = opt.detection;
        detection.strict = false;

        block_manager mgr(make_default_registry(), manager_options{ detection });
        if (auto err = mgr.parse_document(text))
        {
            PLOGE << "quilt: load failed: " << err->message;
            return out;
        }

        for (auto const & n : mgr.notices())
            out.errors.emplace_back(n);

        for (auto const & b : mgr.note().blocks())
            if (b.error())
                out.errors.emplace_back(*b.error());

        out.result = mgr.release();
        return out;
    }

//---------------------------------------------------------------------------

    inline document to_standard(document const & doc, syntax_kind syntax)
    {
        if (auto n = doc.as_hybrid())
            return document(to_standard(*n, std::move(syntax)));
        return doc;
    }

//---------------------------------------------------------------------------

    inline document to_hybrid(document const & doc, load_options opt)
    {
        auto n = doc.as_standard();
        if (!n)
            return doc;

        auto registry = make_default_registry();
        auto ctx = load(render_note(*n, registry), opt);

        hybrid_note out(n->id, n->title);
        for (auto const & b : ctx.result.blocks())
        {
            if (out.add_block(b) == npos())
            {
                PLOGE << "quilt: to_hybrid: block at line " << b.lines().start << " does not fit the note";
                return doc;
            }
        }

        return document(std::move(out));
    }

} // namespace quilt

#endif // QUILT_HYBRID_NOTES
