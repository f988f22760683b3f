#include "check_runner.hpp"

#include <melli/config.hpp>
#include <melli/log.hpp>
#include <melli/national_id.hpp>

#include <istream>
#include <ostream>

namespace melli::demo {

static const char* kUsage = "usage: demo_check [--config <file.toml>] [id...]";

Result<CheckOptions> parse_check_args(int argc, const char* const* argv) {
    CheckOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                return MelliError{MelliError::InvalidArg, "--config needs a path", kUsage};
            }
            opts.config_path = argv[++i];
        } else if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            return MelliError{MelliError::InvalidArg, "unknown option '" + arg + "'", kUsage};
        } else {
            opts.inputs.push_back(arg);
        }
    }
    return Result<CheckOptions>::ok(std::move(opts));
}

// Load and apply the config file, if one was named.
static Result<CheckOptions> apply_config(CheckOptions& opts) {
    if (!opts.config_path.empty()) {
        auto cfg = Config::load(opts.config_path);
        MELLI_TRY(cfg);
        cfg.value().apply();
        log::debug("loaded config from %s", opts.config_path.c_str());
    }
    return Result<CheckOptions>::ok(std::move(opts));
}

static bool check_one(const std::string& input, std::ostream& out) {
    log::trace("checking '%s'", input.c_str());
    auto id = NationalId::parse(input);
    if (id.is_err()) {
        log::warn("'%s': %s", input.c_str(), id.error().format().c_str());
        return false;
    }
    out << id.value().str() << "\n";
    return true;
}

int run_check(int argc, const char* const* argv, std::istream& in, std::ostream& out) {
    auto opts = parse_check_args(argc, argv).and_then(apply_config);
    if (opts.is_err()) {
        log::error("%s", opts.error().format().c_str());
        return UsageError;
    }

    size_t checked = 0;
    size_t rejected = 0;

    if (opts.value().inputs.empty()) {
        log::debug("reading ids from stdin");
        std::string line;
        while (std::getline(in, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
            ++checked;
            if (!check_one(line, out)) ++rejected;
        }
    } else {
        for (const auto& input : opts.value().inputs) {
            ++checked;
            if (!check_one(input, out)) ++rejected;
        }
    }

    log::info("checked %zu ids, %zu rejected", checked, rejected);
    return rejected == 0 ? AllValid : SomeRejected;
}

} // namespace melli::demo
