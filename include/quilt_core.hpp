// quilt_core.hpp - Quilt hybrid notes - Core Data Structures
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef QUILT_CORE_HPP
#define QUILT_CORE_HPP

#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <algorithm>
#include <utility>
#include <cstddef>
#include <cctype>

namespace quilt
{
    inline constexpr size_t npos() { return static_cast<size_t>(-1); }

//========================================================================
// Syntax kinds
//========================================================================

    enum class syntax_family
    {
        markdown,
        org,
        latex,
        code,   // payload: language tag, empty when the fence is untagged
        custom  // payload: syntax name
    };

    struct syntax_kind
    {
        syntax_family family {syntax_family::markdown};
        std::string   payload;

        static syntax_kind markdown() { return { syntax_family::markdown, {} }; }
        static syntax_kind org()      { return { syntax_family::org, {} }; }
        static syntax_kind latex()    { return { syntax_family::latex, {} }; }

        static syntax_kind code(std::string_view language)
        {
            return { syntax_family::code, std::string(language) };
        }

        static syntax_kind custom(std::string_view name)
        {
            return { syntax_family::custom, std::string(name) };
        }

        bool is_code() const noexcept { return family == syntax_family::code; }
        bool is_custom() const noexcept { return family == syntax_family::custom; }

        std::string name() const
        {
            switch (family)
            {
                case syntax_family::markdown: return "Markdown";
                case syntax_family::org:      return "Org-mode";
                case syntax_family::latex:    return "LaTeX";
                case syntax_family::code:     return "Code(" + payload + ")";
                case syntax_family::custom:   return "Custom(" + payload + ")";
            }
            return "Custom(" + payload + ")";
        }

        bool operator==(syntax_kind const &) const = default;
    };

//========================================================================
// Diagnostics
//========================================================================

    struct source_loc
    {
        size_t line {0};   // 1-based document line, 0 when unknown
    };

    template <typename Kind>
    struct error
    {
        Kind        kind;
        source_loc  loc;
        std::string message;
    };

    // Empty on success
    template <typename Kind>
    using maybe_error = std::optional<error<Kind>>;

    template <typename T, typename Error>
    struct context
    {
        T result;
        std::vector<Error> errors;

        bool has_errors() const { return !errors.empty(); }
    };

//========================================================================
// Line bookkeeping
//========================================================================

    struct line_range
    {
        size_t start {1};
        size_t end   {0};   // inclusive

        size_t count() const noexcept { return end + 1 - start; }

        bool operator==(line_range const &) const = default;
    };

//========================================================================
// Block metadata
//========================================================================

    using property_list = std::vector<std::pair<std::string, std::string>>;

    struct block_metadata
    {
        std::optional<int>         heading_level;
        std::optional<std::string> id;
        std::optional<std::string> todo_state;
        property_list              properties;   // authored order

        std::optional<std::string_view> property(std::string_view key) const
        {
            for (auto const & [k, v] : properties)
                if (k == key)
                    return std::string_view(v);
            return std::nullopt;
        }

        void set_property(std::string_view key, std::string_view value)
        {
            for (auto & [k, v] : properties)
            {
                if (k == key)
                {
                    v = std::string(value);
                    return;
                }
            }
            properties.emplace_back(std::string(key), std::string(value));
        }

        bool operator==(block_metadata const &) const = default;
    };

//========================================================================
// Block AST
//========================================================================
//
// Nodes are shared by every syntax. A parser only emits the node kinds
// its grammar knows; the rest of the library treats a block_ast as an
// opaque value and only hands it back to the parser that produced it.

    struct heading_node
    {
        int                        level {1};
        std::string                text;
        std::optional<std::string> todo;   // TODO / DONE keyword
        std::optional<std::string> id;
        std::vector<std::string>   tags;

        bool operator==(heading_node const &) const = default;
    };

    struct paragraph_node
    {
        std::string text;   // lines joined by '\n', no trailing terminator

        bool operator==(paragraph_node const &) const = default;
    };

    struct list_item_node
    {
        std::string         marker;    // "-", "*", "+", "1." ...
        std::optional<bool> checked;   // task items only
        std::string         text;

        bool operator==(list_item_node const &) const = default;
    };

    struct thematic_break_node
    {
        bool operator==(thematic_break_node const &) const = default;
    };

    struct blank_node
    {
        size_t count {1};

        bool operator==(blank_node const &) const = default;
    };

    struct code_node
    {
        std::string language;
        std::string parameters;   // rest of the opening line after the language
        std::string content;

        bool operator==(code_node const &) const = default;
    };

    enum class math_delimiter
    {
        dollars,     // $$ ... $$
        brackets,    // \[ ... \]
        environment  // \begin{env} ... \end{env}
    };

    struct math_node
    {
        math_delimiter delimiter {math_delimiter::dollars};
        std::string    environment;
        std::string    content;
        bool           block_layout {false};  // delimiters on their own lines
        std::string    leading;               // text before the opening delimiter
        std::string    trailing;              // text after the closing delimiter

        bool operator==(math_node const &) const = default;
    };

    struct delimited_node
    {
        std::string name;        // upper-cased block name
        std::string parameters;
        std::string content;

        bool operator==(delimited_node const &) const = default;
    };

    struct drawer_node
    {
        std::string   name;
        property_list entries;   // lines that are not ":KEY: value" keep an empty key

        bool operator==(drawer_node const &) const = default;
    };

    struct keyword_node
    {
        std::string key;
        std::string value;

        bool operator==(keyword_node const &) const = default;
    };

    struct verbatim_node
    {
        std::string text;

        bool operator==(verbatim_node const &) const = default;
    };

    using node_value = std::variant<
        heading_node,
        paragraph_node,
        list_item_node,
        thematic_break_node,
        blank_node,
        code_node,
        math_node,
        delimited_node,
        drawer_node,
        keyword_node,
        verbatim_node
    >;

    struct ast_node
    {
        node_value                 value;
        std::optional<std::string> source_literal;   // authored text, line endings included

        bool operator==(ast_node const &) const = default;
    };

    struct block_ast
    {
        std::vector<ast_node> nodes;

        bool operator==(block_ast const &) const = default;
    };

    template <typename T>
    T const * node_as(ast_node const & n) noexcept
    {
        return std::get_if<T>(&n.value);
    }

    inline bool is_blank(ast_node const & n) noexcept
    {
        return std::holds_alternative<blank_node>(n.value);
    }

//========================================================================
// UTILITY FUNCTIONS
//========================================================================

    namespace detail
    {
        inline std::string_view trim_sv(std::string_view s)
        {
            size_t start = s.find_first_not_of(" \t\r\n");
            if (start == std::string_view::npos) return {};
            size_t end = s.find_last_not_of(" \t\r\n");
            return s.substr(start, end - start + 1);
        }

        inline std::string_view ltrim_sv(std::string_view s)
        {
            size_t start = s.find_first_not_of(" \t");
            if (start == std::string_view::npos) return {};
            return s.substr(start);
        }

        inline std::string to_lower(std::string_view s)
        {
            std::string result(s);
            std::transform(result.begin(), result.end(), result.begin(),
                [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return result;
        }

        inline std::string to_upper(std::string_view s)
        {
            std::string result(s);
            std::transform(result.begin(), result.end(), result.begin(),
                [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return result;
        }

        inline bool starts_with_ci(std::string_view s, std::string_view prefix)
        {
            if (s.size() < prefix.size())
                return false;
            return to_upper(s.substr(0, prefix.size())) == to_upper(prefix);
        }

        inline bool is_blank_line(std::string_view s)
        {
            return trim_sv(s).empty();
        }

        // First whitespace-delimited token
        inline std::string_view first_token(std::string_view s)
        {
            s = ltrim_sv(s);
            size_t end = s.find_first_of(" \t");
            return end == std::string_view::npos ? s : s.substr(0, end);
        }

        inline size_t count_occurrences(std::string_view s, std::string_view needle)
        {
            if (needle.empty())
                return 0;

            size_t n = 0;
            for (size_t pos = s.find(needle); pos != std::string_view::npos; pos = s.find(needle, pos + needle.size()))
                ++n;
            return n;
        }

        inline bool has_line_terminator(std::string_view s)
        {
            return !s.empty() && s.back() == '\n';
        }

        // Line content without its "\n" or "\r\n" terminator
        inline std::string_view line_body(std::string_view line)
        {
            if (!line.empty() && line.back() == '\n')
                line.remove_suffix(1);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            return line;
        }

        // Splits into lines that keep their terminators, so that joining
        // the pieces reproduces the input exactly. A final unterminated
        // fragment counts as a line; a trailing terminator does not open one.
        inline std::vector<std::string_view> split_lines(std::string_view text)
        {
            std::vector<std::string_view> lines;
            size_t pos = 0;
            while (pos < text.size())
            {
                size_t nl = text.find('\n', pos);
                size_t end = (nl == std::string_view::npos) ? text.size() : nl + 1;
                lines.push_back(text.substr(pos, end - pos));
                pos = end;
            }
            return lines;
        }

        inline size_t count_lines(std::string_view text)
        {
            if (text.empty())
                return 0;
            size_t n = static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
            return has_line_terminator(text) ? n : n + 1;
        }

        inline std::string join_lines(std::vector<std::string_view> const & lines, size_t first, size_t last)
        {
            std::string out;
            for (size_t i = first; i < last && i < lines.size(); ++i)
                out.append(lines[i]);
            return out;
        }

        inline std::string join_bodies(std::vector<std::string_view> const & lines, size_t first, size_t last)
        {
            std::string out;
            for (size_t i = first; i < last && i < lines.size(); ++i)
            {
                if (i > first)
                    out.push_back('\n');
                out.append(line_body(lines[i]));
            }
            return out;
        }

        // 1-based line within text of the given byte offset
        inline size_t line_of_offset(std::string_view text, size_t offset)
        {
            offset = std::min(offset, text.size());
            return 1 + static_cast<size_t>(std::count(text.begin(), text.begin() + static_cast<std::ptrdiff_t>(offset), '\n'));
        }
    }

} // namespace quilt

#endif // QUILT_CORE_HPP
