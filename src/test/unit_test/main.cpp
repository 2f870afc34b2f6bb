#include <xrpl/beast/unit_test.h>

#include <cstdlib>
#include <iostream>
#include <string>

// Runs every suite linked into the binary. With an argument, only suites
// whose name contains it.
int
main(int argc, char** argv)
{
    beast::unit_test::reporter r(std::cout);

    bool failed;
    if (argc > 1)
    {
        std::string const pattern = argv[1];
        failed = r.run_each_if(
            beast::unit_test::global_suites(),
            [&pattern](beast::unit_test::suite_info const& s) {
                return s.full_name().find(pattern) != std::string::npos;
            });
    }
    else
    {
        failed = r.run_each(beast::unit_test::global_suites());
    }

    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}
