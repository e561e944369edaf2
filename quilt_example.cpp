#include "include/quilt.hpp"

#include <iostream>
#include <iomanip>

#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

// A note that mixes every built-in syntax
const char* example_note = R"(# Orbital mechanics {#orbits}

Notes from the lecture on transfer orbits.
$$
\Delta v = \sqrt{\frac{\mu}{r_1}} \left( \sqrt{\frac{2 r_2}{r_1 + r_2}} - 1 \right) \label{eq:hohmann}
$$
- [ ] redo the worked example
- [x] read chapter 4
#+BEGIN_SRC python :results output
mu = 3.986e14
print(mu / 7e6)
#+END_SRC
```cpp
double period(double a, double mu);
```
#+BEGIN_QUOTE
Everything is a two-body problem if you squint.
#+END_QUOTE
)";

void print_separator(const std::string& title)
{
    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << title << "\n";
    std::cout << std::string(70, '=') << "\n\n";
}

void print_blocks(quilt::hybrid_note const & note)
{
    for (auto const & b : note.blocks())
    {
        std::cout << "  • " << std::left << std::setw(14) << b.syntax().name()
                  << " lines " << b.lines().start << "-" << b.lines().end;
        if (b.heading_level())
            std::cout << "  heading " << *b.heading_level();
        if (b.todo_state())
            std::cout << "  " << *b.todo_state();
        if (b.id())
            std::cout << "  #" << *b.id();
        if (b.is_dirty())
            std::cout << "  (dirty)";
        if (b.failed())
            std::cout << "  (failed: " << b.error()->message << ")";
        std::cout << "\n";
    }
}

void demo_detection()
{
    print_separator("DEMO 1: Block detection");

    auto ctx = quilt::scan(example_note);
    std::cout << "✓ Detected " << ctx.result.size() << " segments\n";
    for (auto const & s : ctx.result)
        std::cout << "  • " << s.kind.name() << " [" << s.start_line << ", " << s.end_line << "]\n";
}

void demo_load_and_round_trip()
{
    print_separator("DEMO 2: Load and round trip");

    auto ctx = quilt::load(example_note);
    std::cout << "✓ Loaded " << ctx.result.block_count() << " blocks, "
              << ctx.errors.size() << " diagnostics\n";
    print_blocks(ctx.result);

    auto text = quilt::render_document(ctx.result, quilt::make_default_registry());
    std::cout << (text == example_note ? "✓" : "✗") << " Rendered text is byte-identical\n";
}

void demo_queries()
{
    print_separator("DEMO 3: Queries");

    auto ctx = quilt::load(example_note);
    auto const & note = ctx.result;

    std::cout << "Outline:\n";
    for (auto const & ref : quilt::find_heading_nodes(note))
        std::cout << "  " << std::string(static_cast<size_t>(ref.heading->level) * 2, ' ')
                  << ref.heading->text << "  (block " << ref.block << ")\n";

    std::cout << "Open tasks in blocks:";
    for (size_t i : quilt::find_todo_items(note))
        std::cout << " " << i;
    std::cout << "\n";

    if (auto i = quilt::find_block_by_id(note, "eq:hohmann"))
        std::cout << "✓ eq:hohmann lives in block " << *i << "\n";

    for (size_t i : quilt::find_blocks_with_property(note, "LANGUAGE"))
        std::cout << "✓ block " << i << " holds " << *note.block_at(i)->property("LANGUAGE") << " source\n";
}

void demo_editing()
{
    print_separator("DEMO 4: Incremental editing");

    quilt::block_manager mgr(quilt::make_default_registry());
    if (auto err = mgr.parse_document(example_note))
    {
        std::cout << "✗ " << err->message << "\n";
        return;
    }

    if (auto err = mgr.insert_block(1, quilt::syntax_kind::org(), "* TODO Ask about gravity assists :exam:\n"))
        std::cout << "✗ " << err->message << "\n";

    if (auto err = mgr.set_block_text(3, "- [x] redo the worked example\n- [x] read chapter 4\n"))
        std::cout << "✗ " << err->message << "\n";

    std::cout << "After insert and edit:\n";
    print_blocks(mgr.note());

    std::cout << "\nReparsed " << mgr.reparse_dirty() << " dirty block(s)\n";
    print_blocks(mgr.note());

    if (auto err = mgr.remove_block(5))
        std::cout << "✗ " << err->message << "\n";

    std::cout << "\nAfter removing the C++ fence:\n";
    print_blocks(mgr.note());
    std::cout << (mgr.note().is_contiguous() ? "✓" : "✗") << " Line ranges are contiguous\n";

    auto bad = mgr.reparse_block(42);
    std::cout << (bad ? "✓ " + bad->message : std::string("✗ expected an index error")) << "\n";
}

void demo_recovery()
{
    print_separator("DEMO 5: Recovery");

    auto ctx = quilt::load("Intro\n```rust\nfn main() {\n");
    for (auto const & e : ctx.errors)
        std::cout << "  line " << quilt::error_line(e) << ": "
                  << (quilt::is_detection_notice(e) ? "notice" : "parse error") << "\n";
    print_blocks(ctx.result);
}

int main()
{
    static plog::ConsoleAppender<plog::TxtFormatter> appender(plog::streamStdErr);
    plog::init(plog::warning, &appender);

    std::cout << "Quilt - hybrid notes example\nVersion 0.1.0\n";

    demo_detection();
    demo_load_and_round_trip();
    demo_queries();
    demo_editing();
    demo_recovery();

    print_separator("DONE");
    return 0;
}
