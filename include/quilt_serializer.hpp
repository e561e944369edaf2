// quilt_serializer.hpp - Quilt hybrid notes - Serializer
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef QUILT_SERIALIZER_HPP
#define QUILT_SERIALIZER_HPP

#include "quilt_document.hpp"
#include "quilt_parser.hpp"

#include <sstream>

namespace quilt
{
    struct render_options
    {
        // Drop authored literals and emit every node in its parser's
        // normalised form
        bool canonical = false;
    };

//========================================================================
// SERIALIZER API
//========================================================================

    // A dirty block, or one without an AST, renders as its raw text
    std::string render_block(hybrid_block const & block, parser_registry const & registry, render_options opt = {});

    // Blocks concatenated in order, no separators
    std::string render_document(hybrid_note const & note, parser_registry const & registry, render_options opt = {});

    // Single-syntax tree through the parser registered for its syntax
    std::string render_note(standard_note const & note, parser_registry const & registry, render_options opt = {});

//========================================================================
// SERIALIZER IMPLEMENTATION
//========================================================================

    namespace detail
    {
        class serializer_impl
        {
        public:
            serializer_impl(parser_registry const & registry, render_options opt)
                : registry_(registry)
                , opts_(opt)
            {}

            std::string block(hybrid_block const & b) const
            {
                if (b.is_dirty() || !b.ast())
                    return b.raw_text();

                parser const & p = b.is_fallback()
                    ? registry_.identity()
                    : registry_.lookup(b.resolved_syntax().value_or(b.syntax()));
                return tree(p, *b.ast(), b.metadata());
            }

            std::string note(hybrid_note const & n) const
            {
                std::ostringstream out;
                for (auto const & b : n.blocks())
                    out << block(b);
                return out.str();
            }

            std::string tree(parser const & p, block_ast const & ast, block_metadata const & metadata) const
            {
                if (opts_.canonical)
                    return p.render(strip_source_literals(ast), metadata);
                return p.render(ast, metadata);
            }

        private:
            parser_registry const & registry_;
            render_options          opts_;
        };
    }

//---------------------------------------------------------------------------

    inline std::string render_block(hybrid_block const & block, parser_registry const & registry, render_options opt)
    {
        return detail::serializer_impl(registry, opt).block(block);
    }

    inline std::string render_document(hybrid_note const & note, parser_registry const & registry, render_options opt)
    {
        return detail::serializer_impl(registry, opt).note(note);
    }

    inline std::string render_note(standard_note const & note, parser_registry const & registry, render_options opt)
    {
        return detail::serializer_impl(registry, opt).tree(registry.lookup(note.syntax), note.ast, {});
    }

} // namespace quilt

#endif // QUILT_SERIALIZER_HPP
