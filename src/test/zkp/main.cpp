#include <xrpl/beast/unit_test.h>

#include <cstdlib>
#include <iostream>
#include <string>

// Runs every registered suite, or those matching the first argument
// (a suite name, module name or library name).
int
main(int argc, char** argv)
{
    beast::unit_test::reporter r(std::cout);

    bool failed;
    if (argc > 1)
        failed = r.run_each_if(
            beast::unit_test::global_suites(),
            beast::unit_test::match_auto(argv[1]));
    else
        failed = r.run_each(beast::unit_test::global_suites());

    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
