#pragma once

#include <melli/result.hpp>
#include <iosfwd>
#include <string>
#include <vector>

namespace melli::demo {

enum ExitCode {
    AllValid = 0,
    SomeRejected = 1,
    UsageError = 2
};

struct CheckOptions {
    std::string config_path;
    std::vector<std::string> inputs;
};

// demo_check [--config <file.toml>] [id...]
Result<CheckOptions> parse_check_args(int argc, const char* const* argv);

// Checks the ids named in argv, or one per line from `in` when there are
// none. Canonical forms of valid ids go to `out`; rejections and usage
// errors are logged. Returns an ExitCode.
int run_check(int argc, const char* const* argv, std::istream& in, std::ostream& out);

} // namespace melli::demo
