// demo_check.cpp
//
// Checks Iranian national IDs given on the command line, or one per line on
// stdin when none are given.  Valid IDs are printed in canonical form on
// stdout; rejected ones are logged to stderr.
//
//     ./demo_check 0451726707 40010007 123        # two valid, one rejected
//     ./demo_check --config melli.toml < ids.txt
//
// Exit status: 0 if every input was valid, 1 if any was rejected, 2 on a
// usage or config error.

#include "check_runner.hpp"

#include <iostream>

int main(int argc, char** argv) {
    return melli::demo::run_check(argc, argv, std::cin, std::cout);
}
