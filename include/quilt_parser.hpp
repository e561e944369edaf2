// quilt_parser.hpp - Quilt hybrid notes - Parser contract and registry
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef QUILT_PARSER_HPP
#define QUILT_PARSER_HPP

#include "quilt_core.hpp"

#include <memory>
#include <functional>
#include <type_traits>

#include <plog/Log.h>

namespace quilt
{
//========================================================================
// Parse results
//========================================================================

    enum class parse_error_kind
    {
        unterminated_block,
        unterminated_drawer,
        unterminated_fence,
        unbalanced_math,
        malformed_marker,
    };

    using parse_error = error<parse_error_kind>;

    struct parsed_block
    {
        block_ast      ast;
        block_metadata metadata;
    };

    using parse_result = std::variant<parsed_block, parse_error>;

    inline bool is_parse_error(parse_result const & r) { return std::holds_alternative<parse_error>(r); }

    inline parse_error const & get_parse_error(parse_result const & r) { return std::get<parse_error>(r); }
    inline parsed_block & get_parsed(parse_result & r) { return std::get<parsed_block>(r); }
    inline parsed_block const & get_parsed(parse_result const & r) { return std::get<parsed_block>(r); }

//========================================================================
// Parser capability
//========================================================================
//
// One implementation per syntax. Parsers hold no mutable state, so one
// instance may serve any number of blocks and documents.
//
// Round trip: render(parse(text)) reproduces text byte for byte while the
// AST still carries its source literals. Nodes without a literal are
// rendered in the parser's normalised form, which must be a fixed point
// of parse-then-render.

    class parser
    {
    public:
        virtual ~parser() = default;

        // Declared identity; exact registry lookups compare against it
        virtual syntax_kind kind() const = 0;

        // Cheap structural probe, only used when no parser declares the
        // block's kind
        virtual bool can_handle(std::string_view text) const = 0;

        // line_offset is the document line of the first line of raw_text
        virtual parse_result parse(std::string_view raw_text, size_t line_offset) const = 0;

        virtual std::string render(block_ast const & ast, block_metadata const & metadata) const = 0;
    };

//========================================================================
// Rendering helpers shared by parsers
//========================================================================

    namespace detail
    {
        using node_renderer = std::function<std::string(node_value const &)>;

        // Replays authored text where it exists, otherwise renders the node
        inline std::string render_nodes(block_ast const & ast, node_renderer const & canonical)
        {
            std::string out;
            for (auto const & node : ast.nodes)
            {
                if (node.source_literal)
                    out += *node.source_literal;
                else
                    out += canonical(node.value);
            }
            return out;
        }

        inline ast_node make_node(node_value value, std::string literal)
        {
            return ast_node{ std::move(value), std::move(literal) };
        }

        inline std::string fenced(std::string_view open, std::string_view content, std::string_view close)
        {
            std::string out(open);
            out += '\n';
            if (!content.empty())
            {
                out += content;
                out += '\n';
            }
            out += close;
            out += '\n';
            return out;
        }

        // Normalised form of nodes outside a parser's own grammar
        inline std::string render_generic(node_value const & value)
        {
            return std::visit([](auto const & n) -> std::string
            {
                using T = std::decay_t<decltype(n)>;

                if constexpr (std::is_same_v<T, heading_node>)
                    return std::string(static_cast<size_t>(n.level), '#') + " " + n.text + "\n";
                else if constexpr (std::is_same_v<T, paragraph_node>)
                    return n.text + "\n";
                else if constexpr (std::is_same_v<T, list_item_node>)
                {
                    std::string out = n.marker + " ";
                    if (n.checked)
                        out += *n.checked ? "[x] " : "[ ] ";
                    return out + n.text + "\n";
                }
                else if constexpr (std::is_same_v<T, thematic_break_node>)
                    return "---\n";
                else if constexpr (std::is_same_v<T, blank_node>)
                    return std::string(n.count, '\n');
                else if constexpr (std::is_same_v<T, code_node>)
                    return fenced("```" + n.language + (n.parameters.empty() ? "" : " " + n.parameters),
                                  n.content, "```");
                else if constexpr (std::is_same_v<T, math_node>)
                    return fenced("$$", n.content, "$$");
                else if constexpr (std::is_same_v<T, delimited_node>)
                    return fenced("#+BEGIN_" + n.name + (n.parameters.empty() ? "" : " " + n.parameters),
                                  n.content, "#+END_" + n.name);
                else if constexpr (std::is_same_v<T, drawer_node>)
                {
                    std::string out = ":" + n.name + ":\n";
                    for (auto const & [k, v] : n.entries)
                        out += k.empty() ? v + "\n" : ":" + k + ": " + v + "\n";
                    return out + ":END:\n";
                }
                else if constexpr (std::is_same_v<T, keyword_node>)
                    return "#+" + n.key + ": " + n.value + "\n";
                else
                    return n.text;
            }, value);
        }
    }

    // Copy of ast with every authored literal dropped
    inline block_ast strip_source_literals(block_ast ast)
    {
        for (auto & node : ast.nodes)
            node.source_literal.reset();
        return ast;
    }

//========================================================================
// Identity parser
//========================================================================
//
// Parser of last resort: keeps the text verbatim with empty metadata.

    class identity_parser final : public parser
    {
    public:
        syntax_kind kind() const override { return syntax_kind::custom("identity"); }

        bool can_handle(std::string_view) const override { return true; }

        parse_result parse(std::string_view raw_text, size_t) const override
        {
            parsed_block out;
            out.ast.nodes.push_back(detail::make_node(verbatim_node{ std::string(raw_text) }, std::string(raw_text)));
            return out;
        }

        std::string render(block_ast const & ast, block_metadata const &) const override
        {
            return detail::render_nodes(ast, detail::render_generic);
        }
    };

//========================================================================
// Parser registry
//========================================================================

    enum class registry_error_kind
    {
        duplicate_syntax,
        null_parser,
    };

    using registry_error = error<registry_error_kind>;

    class parser_registry
    {
    public:
        parser_registry() = default;

        // Rejects a parser whose kind() is already registered; the
        // registry is left unchanged on failure
        maybe_error<registry_error_kind> add(std::unique_ptr<parser> p);

        template <typename P, typename... Args>
        maybe_error<registry_error_kind> emplace(Args &&... args)
        {
            return add(std::make_unique<P>(std::forward<Args>(args)...));
        }

        parser const * find(syntax_kind const & kind) const noexcept;

        // find(), falling back to the identity parser
        parser const & lookup(syntax_kind const & kind) const noexcept;

        // Declared kind first, then the first can_handle() in registration
        // order, then the identity parser. Never fails.
        parser const & resolve(syntax_kind const & declared, std::string_view raw_text) const;

        parser const & identity() const noexcept { return identity_; }

        std::vector<syntax_kind> available_syntaxes() const;

        size_t size() const noexcept { return parsers_.size(); }

    private:
        std::vector<std::unique_ptr<parser>> parsers_;   // registration order
        identity_parser                      identity_;
    };

//========================================================================
// Registry implementation
//========================================================================

    inline maybe_error<registry_error_kind> parser_registry::add(std::unique_ptr<parser> p)
    {
        if (!p)
            return registry_error{ registry_error_kind::null_parser, {}, "cannot register a null parser" };

        syntax_kind kind = p->kind();
        if (find(kind) != nullptr)
        {
            registry_error err{ registry_error_kind::duplicate_syntax, {},
                                "a parser for " + kind.name() + " is already registered" };
            PLOGE << "quilt: " << err.message;
            return err;
        }

        parsers_.push_back(std::move(p));
        return std::nullopt;
    }

//---------------------------------------------------------------------------

    inline parser const * parser_registry::find(syntax_kind const & kind) const noexcept
    {
        for (auto const & p : parsers_)
            if (p->kind() == kind)
                return p.get();
        return nullptr;
    }

//---------------------------------------------------------------------------

    inline parser const & parser_registry::lookup(syntax_kind const & kind) const noexcept
    {
        if (auto p = find(kind))
            return *p;
        return identity_;
    }

//---------------------------------------------------------------------------

    inline parser const & parser_registry::resolve(syntax_kind const & declared, std::string_view raw_text) const
    {
        if (auto p = find(declared))
            return *p;

        for (auto const & p : parsers_)
            if (p->can_handle(raw_text))
                return *p;

        return identity_;
    }

//---------------------------------------------------------------------------

    inline std::vector<syntax_kind> parser_registry::available_syntaxes() const
    {
        std::vector<syntax_kind> out;
        out.reserve(parsers_.size());
        for (auto const & p : parsers_)
            out.push_back(p->kind());
        return out;
    }

} // namespace quilt

#endif // QUILT_PARSER_HPP
