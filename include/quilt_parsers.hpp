// quilt_parsers.hpp - Quilt hybrid notes - Built-in syntax parsers
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef QUILT_PARSERS_HPP
#define QUILT_PARSERS_HPP

#include "quilt_core.hpp"
#include "quilt_detector.hpp"
#include "quilt_parser.hpp"

#include <plog/Log.h>

namespace quilt
{
//========================================================================
// PARSERS API
//========================================================================
//
// Every parser keeps each node's authored text as its source literal, so
// an unedited block renders back byte for byte. Nodes are split per line
// group so that edits to one node leave its neighbours' literals intact.

    class markdown_parser final : public parser
    {
    public:
        syntax_kind  kind() const override { return syntax_kind::markdown(); }
        bool         can_handle(std::string_view text) const override;
        parse_result parse(std::string_view raw_text, size_t line_offset) const override;
        std::string  render(block_ast const & ast, block_metadata const & metadata) const override;
    };

    class org_parser final : public parser
    {
    public:
        syntax_kind  kind() const override { return syntax_kind::org(); }
        bool         can_handle(std::string_view text) const override;
        parse_result parse(std::string_view raw_text, size_t line_offset) const override;
        std::string  render(block_ast const & ast, block_metadata const & metadata) const override;
    };

    class latex_parser final : public parser
    {
    public:
        syntax_kind  kind() const override { return syntax_kind::latex(); }
        bool         can_handle(std::string_view text) const override;
        parse_result parse(std::string_view raw_text, size_t line_offset) const override;
        std::string  render(block_ast const & ast, block_metadata const & metadata) const override;
    };

    // Fenced code. An empty language claims every fence; a named one only
    // claims fences tagged with it.
    class code_parser final : public parser
    {
    public:
        explicit code_parser(std::string language = {}) : language_(std::move(language)) {}

        syntax_kind  kind() const override { return syntax_kind::code(language_); }
        bool         can_handle(std::string_view text) const override;
        parse_result parse(std::string_view raw_text, size_t line_offset) const override;
        std::string  render(block_ast const & ast, block_metadata const & metadata) const override;

    private:
        std::string language_;
    };

    // Markdown, Org-mode, LaTeX and untagged Code, in that order
    parser_registry make_default_registry();

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        inline std::optional<std::string_view> first_content_line(std::string_view text)
        {
            for (auto line : split_lines(text))
            {
                auto body = line_body(line);
                if (!is_blank_line(body))
                    return body;
            }
            return std::nullopt;
        }

        // Counts the blank lines starting at i
        inline size_t blank_run(std::vector<std::string_view> const & lines, size_t i)
        {
            size_t j = i;
            while (j < lines.size() && is_blank_line(line_body(lines[j])))
                ++j;
            return j - i;
        }

        inline ast_node const * lead_node(block_ast const & ast)
        {
            for (auto const & n : ast.nodes)
                if (!is_blank(n))
                    return &n;
            return nullptr;
        }

        inline std::string join_words(std::vector<std::string> const & words, std::string_view sep)
        {
            std::string out;
            for (size_t i = 0; i < words.size(); ++i)
            {
                if (i > 0)
                    out += sep;
                out += words[i];
            }
            return out;
        }

    //----------------------------------------------------------------------
    // Markdown grammar
    //----------------------------------------------------------------------

        namespace md
        {
            inline std::optional<heading_node> atx_heading(std::string_view body)
            {
                size_t indent = 0;
                while (indent < body.size() && body[indent] == ' ')
                    ++indent;
                if (indent > 3)
                    return std::nullopt;

                auto rest = body.substr(indent);
                size_t hashes = 0;
                while (hashes < rest.size() && rest[hashes] == '#')
                    ++hashes;
                if (hashes == 0 || hashes > 6)
                    return std::nullopt;
                if (hashes < rest.size() && rest[hashes] != ' ' && rest[hashes] != '\t')
                    return std::nullopt;

                heading_node h;
                h.level = static_cast<int>(hashes);
                std::string_view text = trim_sv(rest.substr(hashes));

                // Trailing {#id} attribute
                if (text.ends_with('}'))
                {
                    size_t open = text.rfind("{#");
                    if (open != std::string_view::npos && (open == 0 || text[open - 1] == ' ' || text[open - 1] == '\t'))
                    {
                        auto id = text.substr(open + 2, text.size() - open - 3);
                        if (!id.empty())
                        {
                            h.id = std::string(id);
                            text = trim_sv(text.substr(0, open));
                        }
                    }
                }

                // Optional closing sequence
                size_t last = text.find_last_not_of('#');
                if (last == std::string_view::npos)
                    text = {};
                else if (last + 1 < text.size() && (text[last] == ' ' || text[last] == '\t'))
                    text = trim_sv(text.substr(0, last + 1));

                h.text = std::string(text);
                return h;
            }

            inline bool is_thematic_break(std::string_view body)
            {
                auto t = trim_sv(body);
                if (t.empty() || (t.front() != '-' && t.front() != '*' && t.front() != '_'))
                    return false;

                size_t marks = 0;
                for (char c : t)
                {
                    if (c == t.front())
                        ++marks;
                    else if (c != ' ' && c != '\t')
                        return false;
                }
                return marks >= 3;
            }

            inline std::optional<list_item_node> list_item(std::string_view body)
            {
                auto t = ltrim_sv(body);
                size_t marker_len = 0;

                if (!t.empty() && (t[0] == '-' || t[0] == '*' || t[0] == '+'))
                    marker_len = 1;
                else
                {
                    size_t digits = 0;
                    while (digits < t.size() && digits < 9 && std::isdigit(static_cast<unsigned char>(t[digits])))
                        ++digits;
                    if (digits > 0 && digits < t.size() && (t[digits] == '.' || t[digits] == ')'))
                        marker_len = digits + 1;
                }

                if (marker_len == 0)
                    return std::nullopt;
                if (marker_len < t.size() && t[marker_len] != ' ' && t[marker_len] != '\t')
                    return std::nullopt;

                list_item_node item;
                item.marker = std::string(t.substr(0, marker_len));

                auto rest = trim_sv(t.substr(marker_len));
                if (rest.size() >= 3 && (rest.size() == 3 || rest[3] == ' ' || rest[3] == '\t'))
                {
                    auto box = rest.substr(0, 3);
                    if (box == "[ ]" || box == "[x]" || box == "[X]")
                    {
                        item.checked = box != "[ ]";
                        rest = trim_sv(rest.substr(3));
                    }
                }

                item.text = std::string(rest);
                return item;
            }

            inline bool starts_structure(std::string_view body)
            {
                return atx_heading(body) || is_thematic_break(body) || list_item(body);
            }

            inline std::string render_node(node_value const & value)
            {
                if (auto h = std::get_if<heading_node>(&value))
                {
                    std::string out(static_cast<size_t>(h->level), '#');
                    if (!h->text.empty())
                        out += " " + h->text;
                    if (h->id)
                        out += " {#" + *h->id + "}";
                    return out + "\n";
                }
                return render_generic(value);
            }
        }

    //----------------------------------------------------------------------
    // Org grammar
    //----------------------------------------------------------------------

        namespace org
        {
            inline bool is_tag_group(std::string_view s)
            {
                if (s.size() < 3 || s.front() != ':' || s.back() != ':')
                    return false;

                bool in_tag = false;
                for (size_t i = 1; i < s.size(); ++i)
                {
                    char c = s[i];
                    if (c == ':')
                    {
                        if (!in_tag)
                            return false;
                        in_tag = false;
                    }
                    else if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '@' || c == '#' || c == '%')
                        in_tag = true;
                    else
                        return false;
                }
                return true;
            }

            inline std::vector<std::string> split_tags(std::string_view s)
            {
                std::vector<std::string> tags;
                s = s.substr(1, s.size() - 2);
                size_t pos = 0;
                while (pos <= s.size())
                {
                    size_t next = s.find(':', pos);
                    if (next == std::string_view::npos)
                        next = s.size();
                    tags.emplace_back(s.substr(pos, next - pos));
                    pos = next + 1;
                }
                return tags;
            }

            inline std::optional<heading_node> heading(std::string_view body)
            {
                size_t stars = 0;
                while (stars < body.size() && body[stars] == '*')
                    ++stars;
                if (stars == 0 || stars >= body.size() || (body[stars] != ' ' && body[stars] != '\t'))
                    return std::nullopt;

                heading_node h;
                h.level = static_cast<int>(stars);

                auto rest = trim_sv(body.substr(stars));
                auto keyword = first_token(rest);
                if (keyword == "TODO" || keyword == "DONE")
                {
                    h.todo = std::string(keyword);
                    rest = trim_sv(rest.substr(keyword.size()));
                }

                size_t sp = rest.find_last_of(" \t");
                auto last = sp == std::string_view::npos ? rest : rest.substr(sp + 1);
                if (is_tag_group(last))
                {
                    h.tags = split_tags(last);
                    rest = sp == std::string_view::npos ? std::string_view{} : trim_sv(rest.substr(0, sp));
                }

                h.text = std::string(rest);
                return h;
            }

            inline std::optional<std::string> drawer_name(std::string_view body)
            {
                auto t = trim_sv(body);
                if (t.size() < 3 || t.front() != ':' || t.back() != ':')
                    return std::nullopt;

                auto name = t.substr(1, t.size() - 2);
                if (name.find_first_of(": \t") != std::string_view::npos || to_upper(name) == "END")
                    return std::nullopt;

                return std::string(name);
            }

            inline bool is_drawer_end(std::string_view body)
            {
                return to_upper(trim_sv(body)) == ":END:";
            }

            inline std::pair<std::string, std::string> drawer_entry(std::string_view body)
            {
                auto t = trim_sv(body);
                if (t.size() > 2 && t.front() == ':')
                {
                    size_t colon = t.find(':', 1);
                    if (colon != std::string_view::npos && colon > 1)
                    {
                        auto key = t.substr(1, colon - 1);
                        if (key.find_first_of(" \t") == std::string_view::npos)
                            return { std::string(key), std::string(trim_sv(t.substr(colon + 1))) };
                    }
                }
                return { std::string(), std::string(t) };
            }

            inline std::optional<keyword_node> keyword(std::string_view body)
            {
                auto t = ltrim_sv(body);
                if (!t.starts_with("#+"))
                    return std::nullopt;

                size_t colon = t.find(':');
                if (colon == std::string_view::npos || colon <= 2)
                    return std::nullopt;

                auto key = t.substr(2, colon - 2);
                if (key.find_first_of(" \t") != std::string_view::npos)
                    return std::nullopt;

                return keyword_node{ to_upper(key), std::string(trim_sv(t.substr(colon + 1))) };
            }

            inline bool starts_structure(std::string_view body)
            {
                return org_block_name(body) || heading(body) || drawer_name(body) || keyword(body);
            }

            inline std::string render_node(node_value const & value)
            {
                if (auto h = std::get_if<heading_node>(&value))
                {
                    std::vector<std::string> parts;
                    if (h->todo)
                        parts.push_back(*h->todo);
                    if (!h->text.empty())
                        parts.push_back(h->text);
                    if (!h->tags.empty())
                        parts.push_back(":" + join_words(h->tags, ":") + ":");

                    return std::string(static_cast<size_t>(h->level), '*') + " " + join_words(parts, " ") + "\n";
                }

                if (auto c = std::get_if<code_node>(&value))
                {
                    std::string open = "#+BEGIN_SRC";
                    if (!c->language.empty())
                        open += " " + c->language;
                    if (!c->parameters.empty())
                        open += " " + c->parameters;
                    return fenced(open, c->content, "#+END_SRC");
                }

                return render_generic(value);
            }
        }

    //----------------------------------------------------------------------
    // LaTeX grammar
    //----------------------------------------------------------------------

        namespace tex
        {
            constexpr std::string_view BEGIN_ENV = "\\begin{";
            constexpr std::string_view LABEL     = "\\label{";

            inline std::optional<std::string> label(std::string_view content)
            {
                size_t pos = content.find(LABEL);
                if (pos == std::string_view::npos)
                    return std::nullopt;

                size_t start = pos + LABEL.size();
                size_t end = content.find('}', start);
                if (end == std::string_view::npos || end == start)
                    return std::nullopt;

                return std::string(content.substr(start, end - start));
            }

            inline std::string render_node(node_value const & value)
            {
                auto m = std::get_if<math_node>(&value);
                if (!m)
                    return render_generic(value);

                std::string open, close;
                switch (m->delimiter)
                {
                    case math_delimiter::dollars:
                        open = close = std::string(MATH_DOLLARS);
                        break;
                    case math_delimiter::brackets:
                        open  = std::string(MATH_OPEN);
                        close = std::string(MATH_CLOSE);
                        break;
                    case math_delimiter::environment:
                        open  = "\\begin{" + m->environment + "}";
                        close = "\\end{" + m->environment + "}";
                        break;
                }

                std::string out;
                if (!m->leading.empty())
                    out += m->leading + " ";

                if (m->block_layout || m->content.find('\n') != std::string::npos)
                    out += open + "\n" + m->content + "\n" + close;
                else
                    out += open + m->content + close;

                if (!m->trailing.empty())
                    out += " " + m->trailing;

                return out + "\n";
            }
        }
    }

//========================================================================
// Markdown parser
//========================================================================

    inline bool markdown_parser::can_handle(std::string_view text) const
    {
        auto body = detail::first_content_line(text);
        return body && !detail::match_opener(*body);
    }

//---------------------------------------------------------------------------

    inline parse_result markdown_parser::parse(std::string_view raw_text, size_t) const
    {
        using namespace detail;

        auto lines = split_lines(raw_text);
        parsed_block out;

        size_t i = 0;
        while (i < lines.size())
        {
            auto body = line_body(lines[i]);

            if (size_t blanks = blank_run(lines, i); blanks > 0)
            {
                out.ast.nodes.push_back(make_node(blank_node{ blanks }, join_lines(lines, i, i + blanks)));
                i += blanks;
                continue;
            }

            if (auto h = md::atx_heading(body))
            {
                out.ast.nodes.push_back(make_node(std::move(*h), std::string(lines[i])));
                ++i;
                continue;
            }

            if (md::is_thematic_break(body))
            {
                out.ast.nodes.push_back(make_node(thematic_break_node{}, std::string(lines[i])));
                ++i;
                continue;
            }

            if (auto item = md::list_item(body))
            {
                out.ast.nodes.push_back(make_node(std::move(*item), std::string(lines[i])));
                ++i;
                continue;
            }

            size_t j = i + 1;
            while (j < lines.size())
            {
                auto next = line_body(lines[j]);
                if (is_blank_line(next) || md::starts_structure(next))
                    break;
                ++j;
            }

            std::string text;
            for (size_t k = i; k < j; ++k)
            {
                if (k > i)
                    text += '\n';
                text += trim_sv(line_body(lines[k]));
            }

            out.ast.nodes.push_back(make_node(paragraph_node{ std::move(text) }, join_lines(lines, i, j)));
            i = j;
        }

        // A block is a heading only when the heading is all it holds
        std::vector<ast_node const *> content;
        for (auto const & n : out.ast.nodes)
            if (!is_blank(n))
                content.push_back(&n);

        if (content.size() == 1)
        {
            if (auto h = node_as<heading_node>(*content.front()))
            {
                out.metadata.heading_level = h->level;
                out.metadata.id = h->id;
            }
        }

        if (!content.empty())
        {
            if (auto item = node_as<list_item_node>(*content.front()); item && item->checked)
                out.metadata.todo_state = *item->checked ? "DONE" : "TODO";
        }

        return out;
    }

//---------------------------------------------------------------------------

    inline std::string markdown_parser::render(block_ast const & ast, block_metadata const &) const
    {
        return detail::render_nodes(ast, detail::md::render_node);
    }

//========================================================================
// Org parser
//========================================================================

    inline bool org_parser::can_handle(std::string_view text) const
    {
        auto body = detail::first_content_line(text);
        return body && detail::org::starts_structure(*body);
    }

//---------------------------------------------------------------------------

    inline parse_result org_parser::parse(std::string_view raw_text, size_t line_offset) const
    {
        using namespace detail;

        auto lines = split_lines(raw_text);
        parsed_block out;

        size_t i = 0;
        while (i < lines.size())
        {
            auto body = line_body(lines[i]);

            if (size_t blanks = blank_run(lines, i); blanks > 0)
            {
                out.ast.nodes.push_back(make_node(blank_node{ blanks }, join_lines(lines, i, i + blanks)));
                i += blanks;
                continue;
            }

            if (auto name = org_block_name(body))
            {
                size_t j = i + 1;
                while (j < lines.size() && !is_org_end(line_body(lines[j]), *name))
                    ++j;

                if (j == lines.size())
                {
                    return parse_error{ parse_error_kind::unterminated_block, { line_offset + i },
                                        "#+BEGIN_" + *name + " has no matching #+END_" + *name };
                }

                auto params  = org_block_parameters(body);
                auto content = join_bodies(lines, i + 1, j);

                node_value value;
                if (*name == "SRC")
                {
                    auto language = first_token(params);
                    auto rest     = std::string(trim_sv(std::string_view(params).substr(language.size())));
                    value = code_node{ std::string(language), std::move(rest), std::move(content) };
                }
                else
                    value = delimited_node{ *name, std::move(params), std::move(content) };

                out.ast.nodes.push_back(make_node(std::move(value), join_lines(lines, i, j + 1)));
                i = j + 1;
                continue;
            }

            if (auto h = org::heading(body))
            {
                out.ast.nodes.push_back(make_node(std::move(*h), std::string(lines[i])));
                ++i;
                continue;
            }

            if (auto name = org::drawer_name(body))
            {
                size_t j = i + 1;
                while (j < lines.size() && !org::is_drawer_end(line_body(lines[j])))
                    ++j;

                if (j == lines.size())
                {
                    return parse_error{ parse_error_kind::unterminated_drawer, { line_offset + i },
                                        ":" + *name + ": drawer has no :END:" };
                }

                drawer_node drawer{ *name, {} };
                for (size_t k = i + 1; k < j; ++k)
                    drawer.entries.push_back(org::drawer_entry(line_body(lines[k])));

                out.ast.nodes.push_back(make_node(std::move(drawer), join_lines(lines, i, j + 1)));
                i = j + 1;
                continue;
            }

            if (auto kw = org::keyword(body))
            {
                out.ast.nodes.push_back(make_node(std::move(*kw), std::string(lines[i])));
                ++i;
                continue;
            }

            size_t j = i + 1;
            while (j < lines.size())
            {
                auto next = line_body(lines[j]);
                if (is_blank_line(next) || org::starts_structure(next))
                    break;
                ++j;
            }

            out.ast.nodes.push_back(make_node(paragraph_node{ join_bodies(lines, i, j) }, join_lines(lines, i, j)));
            i = j;
        }

        // Metadata
        if (auto lead = lead_node(out.ast))
        {
            if (auto h = node_as<heading_node>(*lead))
            {
                out.metadata.heading_level = h->level;
                out.metadata.todo_state = h->todo;
            }
            else if (auto c = node_as<code_node>(*lead))
            {
                out.metadata.set_property("BLOCK", "SRC");
                if (!c->language.empty())
                    out.metadata.set_property("LANGUAGE", c->language);
            }
            else if (auto d = node_as<delimited_node>(*lead))
            {
                out.metadata.set_property("BLOCK", d->name);
                if (!d->parameters.empty())
                    out.metadata.set_property("PARAMETERS", d->parameters);
            }
        }

        for (auto const & n : out.ast.nodes)
        {
            if (auto drawer = node_as<drawer_node>(n))
            {
                for (auto const & [k, v] : drawer->entries)
                {
                    if (k.empty())
                        continue;
                    if (to_upper(k) == "ID")
                        out.metadata.id = v;
                    else
                        out.metadata.set_property(k, v);
                }
            }
            else if (auto kw = node_as<keyword_node>(n))
                out.metadata.set_property(kw->key, kw->value);
        }

        return out;
    }

//---------------------------------------------------------------------------

    inline std::string org_parser::render(block_ast const & ast, block_metadata const &) const
    {
        return detail::render_nodes(ast, detail::org::render_node);
    }

//========================================================================
// LaTeX parser
//========================================================================

    inline bool latex_parser::can_handle(std::string_view text) const
    {
        auto body = detail::first_content_line(text);
        if (!body)
            return false;

        auto t = detail::trim_sv(*body);
        return t.find(detail::MATH_DOLLARS) != std::string_view::npos
            || t.starts_with(detail::MATH_OPEN)
            || t.starts_with(detail::tex::BEGIN_ENV);
    }

//---------------------------------------------------------------------------

    inline parse_result latex_parser::parse(std::string_view raw_text, size_t line_offset) const
    {
        using namespace detail;
        constexpr auto npos = std::string_view::npos;

        auto fail = [&](parse_error_kind kind, size_t offset, std::string message) -> parse_result
        {
            return parse_error{ kind, { line_offset + line_of_offset(raw_text, offset) - 1 }, std::move(message) };
        };

        math_node m;
        size_t open_pos = 0, open_len = 0, close_pos = 0, close_len = 0;

        size_t dollars  = raw_text.find(MATH_DOLLARS);
        size_t brackets = raw_text.find(MATH_OPEN);
        size_t env      = raw_text.find(tex::BEGIN_ENV);

        if (dollars != npos)
        {
            size_t last = raw_text.rfind(MATH_DOLLARS);
            if (last == dollars)
                return fail(parse_error_kind::unbalanced_math, dollars, "$$ is never closed");

            m.delimiter = math_delimiter::dollars;
            open_pos  = dollars;
            open_len  = MATH_DOLLARS.size();
            close_pos = last;
            close_len = MATH_DOLLARS.size();
        }
        else if (brackets != npos)
        {
            size_t last = raw_text.rfind(MATH_CLOSE);
            if (last == npos || last < brackets + MATH_OPEN.size())
                return fail(parse_error_kind::unbalanced_math, brackets, "\\[ is never closed by \\]");

            m.delimiter = math_delimiter::brackets;
            open_pos  = brackets;
            open_len  = MATH_OPEN.size();
            close_pos = last;
            close_len = MATH_CLOSE.size();
        }
        else if (env != npos)
        {
            size_t name_start = env + tex::BEGIN_ENV.size();
            size_t name_end   = raw_text.find('}', name_start);
            if (name_end == npos || name_end == name_start)
                return fail(parse_error_kind::malformed_marker, env, "\\begin without an environment name");

            m.delimiter   = math_delimiter::environment;
            m.environment = std::string(raw_text.substr(name_start, name_end - name_start));

            std::string closing = "\\end{" + m.environment + "}";
            size_t last = raw_text.rfind(closing);
            if (last == npos || last <= name_end)
                return fail(parse_error_kind::unbalanced_math, env, "\\begin{" + m.environment + "} is never closed");

            open_pos  = env;
            open_len  = name_end + 1 - env;
            close_pos = last;
            close_len = closing.size();
        }
        else
            return fail(parse_error_kind::malformed_marker, 0, "no math delimiters found");

        auto inner = raw_text.substr(open_pos + open_len, close_pos - open_pos - open_len);
        m.block_layout = inner.find('\n') != npos;
        m.content  = std::string(trim_sv(inner));
        m.leading  = std::string(trim_sv(raw_text.substr(0, open_pos)));
        m.trailing = std::string(trim_sv(raw_text.substr(close_pos + close_len)));

        parsed_block out;

        switch (m.delimiter)
        {
            case math_delimiter::dollars:     out.metadata.set_property("DELIMITER", MATH_DOLLARS); break;
            case math_delimiter::brackets:    out.metadata.set_property("DELIMITER", MATH_OPEN); break;
            case math_delimiter::environment: out.metadata.set_property("ENVIRONMENT", m.environment); break;
        }
        out.metadata.id = tex::label(m.content);

        out.ast.nodes.push_back(make_node(std::move(m), std::string(raw_text)));
        return out;
    }

//---------------------------------------------------------------------------

    inline std::string latex_parser::render(block_ast const & ast, block_metadata const &) const
    {
        return detail::render_nodes(ast, detail::tex::render_node);
    }

//========================================================================
// Code parser
//========================================================================

    inline bool code_parser::can_handle(std::string_view text) const
    {
        auto body = detail::first_content_line(text);
        if (!body)
            return false;

        auto lang = detail::fence_language(*body);
        return lang && (language_.empty() || *lang == language_);
    }

//---------------------------------------------------------------------------

    inline parse_result code_parser::parse(std::string_view raw_text, size_t line_offset) const
    {
        using namespace detail;

        auto lines = split_lines(raw_text);
        parsed_block out;
        std::optional<size_t> first_fence;

        size_t i = 0;
        while (i < lines.size())
        {
            auto body = line_body(lines[i]);

            if (size_t blanks = blank_run(lines, i); blanks > 0)
            {
                out.ast.nodes.push_back(make_node(blank_node{ blanks }, join_lines(lines, i, i + blanks)));
                i += blanks;
                continue;
            }

            if (auto lang = fence_language(body))
            {
                size_t j = i + 1;
                while (j < lines.size() && !is_closing_fence(line_body(lines[j])))
                    ++j;

                if (j == lines.size())
                {
                    return parse_error{ parse_error_kind::unterminated_fence, { line_offset + i },
                                        "code fence is never closed" };
                }

                code_node c{ std::move(*lang), fence_parameters(body), join_bodies(lines, i + 1, j) };
                if (!first_fence)
                    first_fence = out.ast.nodes.size();
                out.ast.nodes.push_back(make_node(std::move(c), join_lines(lines, i, j + 1)));
                i = j + 1;
                continue;
            }

            // Stray text around the fence is kept as is
            size_t j = i + 1;
            while (j < lines.size() && !is_blank_line(line_body(lines[j])) && !fence_language(line_body(lines[j])))
                ++j;

            std::string text = join_lines(lines, i, j);
            out.ast.nodes.push_back(make_node(verbatim_node{ text }, text));
            i = j;
        }

        if (!first_fence)
            return parse_error{ parse_error_kind::malformed_marker, { line_offset }, "no opening code fence" };

        auto const & fence = std::get<code_node>(out.ast.nodes[*first_fence].value);
        if (!fence.language.empty())
            out.metadata.set_property("LANGUAGE", fence.language);
        if (!fence.parameters.empty())
            out.metadata.set_property("PARAMETERS", fence.parameters);

        return out;
    }

//---------------------------------------------------------------------------

    inline std::string code_parser::render(block_ast const & ast, block_metadata const &) const
    {
        return detail::render_nodes(ast, detail::render_generic);
    }

//========================================================================
// Default registry
//========================================================================

    inline parser_registry make_default_registry()
    {
        parser_registry registry;

        std::unique_ptr<parser> defaults[] = {
            std::make_unique<markdown_parser>(),
            std::make_unique<org_parser>(),
            std::make_unique<latex_parser>(),
            std::make_unique<code_parser>(),
        };

        for (auto & p : defaults)
            if (auto err = registry.add(std::move(p)))
                PLOGE << "quilt: default registry: " << err->message;

        return registry;
    }

} // namespace quilt

#endif // QUILT_PARSERS_HPP
