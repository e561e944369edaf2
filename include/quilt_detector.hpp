// quilt_detector.hpp - Quilt hybrid notes - Block Detector
// Version 0.1.0
// Copyright 2025 Mikael Ueno A
// Licenced as-is under the MIT licence.

#ifndef QUILT_DETECTOR_HPP
#define QUILT_DETECTOR_HPP

#include "quilt_core.hpp"

#include <plog/Log.h>

namespace quilt
{
    struct detector_options
    {
        // Unterminated special blocks make parse_document fail instead of
        // being recovered to end of document. scan() is total either way.
        bool strict = false;

        // A blank line completes the current Markdown run and becomes its
        // last line.
        bool split_markdown_on_blank_lines = false;
    };

    enum class detection_notice_kind
    {
        unterminated_org_block,
        unterminated_code_fence,
        unterminated_latex_block,
    };

    using detection_notice = error<detection_notice_kind>;

    struct raw_segment
    {
        syntax_kind kind;
        size_t      start_line {1};   // 1-based, inclusive
        size_t      end_line   {0};
        std::string raw_text;
        std::optional<detection_notice> notice;

        line_range lines() const noexcept { return { start_line, end_line }; }
        size_t line_count() const noexcept { return end_line + 1 - start_line; }
    };

    using detect_context = context<std::vector<raw_segment>, detection_notice>;

//========================================================================
// DETECTOR API
//========================================================================

    detect_context scan(std::string_view text, detector_options opt = {});

//========================================================================
// Marker table
//========================================================================

    namespace detail
    {
        constexpr std::string_view ORG_BEGIN  = "#+BEGIN_";
        constexpr std::string_view ORG_END    = "#+END_";
        constexpr std::string_view CODE_FENCE = "```";
        constexpr std::string_view MATH_DOLLARS = "$$";
        constexpr std::string_view MATH_OPEN    = "\\[";
        constexpr std::string_view MATH_CLOSE   = "\\]";

        // Upper-cased block name of a "#+BEGIN_<name>" line
        inline std::optional<std::string> org_block_name(std::string_view body)
        {
            auto t = ltrim_sv(body);
            if (!starts_with_ci(t, ORG_BEGIN))
                return std::nullopt;

            auto rest = t.substr(ORG_BEGIN.size());
            if (rest.empty() || rest.front() == ' ' || rest.front() == '\t')
                return std::nullopt;

            auto name = first_token(rest);
            if (name.empty())
                return std::nullopt;

            return to_upper(name);
        }

        inline std::string org_block_parameters(std::string_view body)
        {
            auto t = ltrim_sv(body).substr(ORG_BEGIN.size());
            auto name = first_token(t);
            return std::string(trim_sv(t.substr(name.size())));
        }

        inline bool is_org_end(std::string_view body, std::string_view name)
        {
            auto t = ltrim_sv(body);
            if (!starts_with_ci(t, ORG_END))
                return false;

            return to_upper(first_token(t.substr(ORG_END.size()))) == name;
        }

        // Language tag of an opening fence, empty when untagged. Runs of
        // four or more backticks are not fences.
        inline std::optional<std::string> fence_language(std::string_view body)
        {
            auto t = trim_sv(body);
            if (!t.starts_with(CODE_FENCE))
                return std::nullopt;
            if (t.size() > CODE_FENCE.size() && t[CODE_FENCE.size()] == '`')
                return std::nullopt;

            return std::string(first_token(t.substr(CODE_FENCE.size())));
        }

        inline std::string fence_parameters(std::string_view body)
        {
            auto rest = ltrim_sv(trim_sv(body).substr(CODE_FENCE.size()));
            return std::string(trim_sv(rest.substr(first_token(rest).size())));
        }

        inline bool is_closing_fence(std::string_view body)
        {
            return trim_sv(body) == CODE_FENCE;
        }
    }

//========================================================================
// Implementation details
//========================================================================

    namespace detail
    {
        enum class detector_state
        {
            default_text,
            in_org_block,
            in_code_fence,
            in_latex_bracket,
        };

        enum class latex_closer
        {
            dollars,
            bracket
        };

        struct block_opener
        {
            syntax_kind    kind;
            detector_state state {detector_state::default_text};
            bool           closed_on_same_line {false};
            std::string    org_name;
            latex_closer   closer {latex_closer::dollars};
        };

        inline std::optional<block_opener> match_opener(std::string_view body)
        {
            if (auto name = org_block_name(body))
            {
                block_opener op{ syntax_kind::org(), detector_state::in_org_block };
                op.org_name = std::move(*name);
                return op;
            }

            if (auto lang = fence_language(body))
                return block_opener{ syntax_kind::code(*lang), detector_state::in_code_fence };

            // An even count of $$ pairs up on the line itself
            if (size_t dollars = count_occurrences(body, MATH_DOLLARS); dollars > 0)
            {
                block_opener op{ syntax_kind::latex(), detector_state::in_latex_bracket };
                op.closer = latex_closer::dollars;
                op.closed_on_same_line = dollars % 2 == 0;
                return op;
            }

            if (trim_sv(body) == MATH_OPEN)
            {
                block_opener op{ syntax_kind::latex(), detector_state::in_latex_bracket };
                op.closer = latex_closer::bracket;
                return op;
            }

            return std::nullopt;
        }

        struct detector_impl
        {
            explicit detector_impl(detector_options o) : opts(o) {}

            detector_options opts;
            detect_context   ctx;

            detector_state state {detector_state::default_text};
            latex_closer   closer {latex_closer::dollars};
            std::string    org_name;

            // Current run; run_start == 0 while no run is open
            syntax_kind    run_kind;
            std::string    run_text;
            size_t         run_start {0};
            bool           run_has_content {false};

            void run(std::string_view text);
            void default_line(std::string_view line, size_t line_no);
            void special_line(std::string_view line, size_t line_no);
            void open(syntax_kind kind, size_t line_no);
            void flush(size_t end_line);
            void finish(size_t last_line);
        };

//---------------------------------------------------------------------------

        inline void detector_impl::run(std::string_view text)
        {
            auto lines = split_lines(text);

            for (size_t i = 0; i < lines.size(); ++i)
            {
                if (state == detector_state::default_text)
                    default_line(lines[i], i + 1);
                else
                    special_line(lines[i], i + 1);
            }

            finish(lines.size());
        }

//---------------------------------------------------------------------------

        inline void detector_impl::default_line(std::string_view line, size_t line_no)
        {
            std::string_view body = line_body(line);

            if (auto op = match_opener(body))
            {
                if (run_start != 0)
                    flush(line_no - 1);

                open(std::move(op->kind), line_no);
                run_text.append(line);

                if (op->closed_on_same_line)
                {
                    flush(line_no);
                    return;
                }

                state    = op->state;
                closer   = op->closer;
                org_name = std::move(op->org_name);
                return;
            }

            if (run_start == 0)
                open(syntax_kind::markdown(), line_no);

            run_text.append(line);

            if (!is_blank_line(body))
                run_has_content = true;
            else if (opts.split_markdown_on_blank_lines && run_has_content)
                flush(line_no);
        }

//---------------------------------------------------------------------------

        inline void detector_impl::special_line(std::string_view line, size_t line_no)
        {
            std::string_view body = line_body(line);
            run_text.append(line);

            // Markers of other dialects are literal content here
            bool closes = false;
            switch (state)
            {
                case detector_state::in_org_block:
                    closes = is_org_end(body, org_name);
                    break;

                case detector_state::in_code_fence:
                    closes = is_closing_fence(body);
                    break;

                case detector_state::in_latex_bracket:
                    closes = closer == latex_closer::dollars
                        ? body.find(MATH_DOLLARS) != std::string_view::npos
                        : trim_sv(body) == MATH_CLOSE;
                    break;

                case detector_state::default_text:
                    break;
            }

            if (closes)
                flush(line_no);
        }

//---------------------------------------------------------------------------

        inline void detector_impl::open(syntax_kind kind, size_t line_no)
        {
            run_kind        = std::move(kind);
            run_start       = line_no;
            run_has_content = false;
            run_text.clear();
        }

//---------------------------------------------------------------------------

        inline void detector_impl::flush(size_t end_line)
        {
            raw_segment seg;
            seg.kind       = std::move(run_kind);
            seg.start_line = run_start;
            seg.end_line   = end_line;
            seg.raw_text   = std::move(run_text);

            ctx.result.push_back(std::move(seg));

            run_text.clear();
            run_start       = 0;
            run_has_content = false;
            state           = detector_state::default_text;
        }

//---------------------------------------------------------------------------

        inline void detector_impl::finish(size_t last_line)
        {
            if (run_start == 0)
                return;

            if (state == detector_state::default_text)
            {
                flush(last_line);
                return;
            }

            detection_notice notice;
            notice.loc.line = run_start;

            switch (state)
            {
                case detector_state::in_org_block:
                    notice.kind    = detection_notice_kind::unterminated_org_block;
                    notice.message = "#+BEGIN_" + org_name + " has no matching #+END_" + org_name;
                    break;

                case detector_state::in_code_fence:
                    notice.kind    = detection_notice_kind::unterminated_code_fence;
                    notice.message = "code fence is never closed";
                    break;

                case detector_state::in_latex_bracket:
                case detector_state::default_text:
                    notice.kind    = detection_notice_kind::unterminated_latex_block;
                    notice.message = closer == latex_closer::dollars
                        ? "$$ math block is never closed"
                        : "\\[ math block is never closed";
                    break;
            }

            PLOGW << "quilt: line " << run_start << ": " << notice.message
                  << " (closed at end of document, line " << last_line << ")";

            flush(last_line);
            ctx.result.back().notice = notice;
            ctx.errors.push_back(std::move(notice));
        }
    }

//========================================================================
// Detector API implementation
//========================================================================

    inline detect_context scan(std::string_view text, detector_options opt)
    {
        detail::detector_impl d(opt);
        d.run(text);
        return std::move(d.ctx);
    }

} // namespace quilt

#endif // QUILT_DETECTOR_HPP
