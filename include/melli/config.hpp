#pragma once

#include <melli/result.hpp>
#include <melli/log.hpp>
#include <optional>
#include <string>

namespace melli {

// Settings for programs that embed the library, read from TOML:
//
//   [log]
//   level = "info"
//   color = true
struct Config {
    log::Level log_level = log::Info;
    // Unset means auto-detect from the terminal
    std::optional<bool> log_color;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Push the settings into the logging module
    void apply() const;
};

} // namespace melli
