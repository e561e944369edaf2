#include "quilt_test_harness.hpp"
#include "quilt_detector_tests.hpp"
#include "quilt_parser_tests.hpp"
#include "quilt_document_tests.hpp"
#include "quilt_query_tests.hpp"
#include "quilt_manager_tests.hpp"
#include "quilt_serializer_tests.hpp"
#include "quilt_integration_tests.hpp"

#include <iostream>

#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace quilt::tests
{
    std::vector<test_result> results;
    std::string              current_category;
    char const *             last_error = "";
    int                      last_line = 0;
}

bool first = true;

void run_tests( std::string suite_name, void(*pf_tests)() )
{
    if (!first)
        std::cout << '\n';
    else first = false;

    std::cout << suite_name << '\n';
    std::cout << std::string(suite_name.length(), '=') << '\n';
    pf_tests();
}

int main()
{
    using namespace quilt::tests;

    // Recovery notices and parse failures are expected in several tests
    static plog::ConsoleAppender<plog::TxtFormatter> appender(plog::streamStdErr);
    plog::init(plog::error, &appender);

    #ifdef QUILT_TESTS_DETECTOR__
        run_tests("Block detection", run_detector_tests);
    #endif

    #ifdef QUILT_TESTS_PARSER__
        run_tests("Parsers and registry", run_parser_tests);
    #endif

    #ifdef QUILT_TESTS_DOCUMENT__
        run_tests("Document model", run_document_tests);
    #endif

    #ifdef QUILT_TESTS_QUERIES__
        run_tests("Queries", run_query_tests);
    #endif

    #ifdef QUILT_TESTS_MANAGER__
        run_tests("Block manager", run_manager_tests);
    #endif

    #ifdef QUILT_TESTS_SERIALIZER__
        run_tests("Serialization", run_serializer_tests);
    #endif

    #ifdef QUILT_TESTS_INTEGRATION__
        run_tests("Integration", run_integration_tests);
    #endif

    size_t failed = 0;
    for (auto const & r : results)
    {
        if (r.passed)
            continue;
        if (failed++ == 0)
            std::cout << "\nFailures\n========\n";
        std::cout << "  " << r.category << " / " << r.name << " (line " << r.line << "): " << r.message << '\n';
    }

    std::cout << '\n' << results.size() - failed << '/' << results.size() << " tests passed\n";
    return failed == 0 ? 0 : 1;
}
