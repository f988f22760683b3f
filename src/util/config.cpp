#include <melli/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>

namespace melli {

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return MelliError{MelliError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto lg = doc["log"].as_table()) {
        if (auto node = (*lg)["level"]) {
            auto name = node.value_exact<std::string>();
            if (!name) {
                return MelliError{MelliError::Config,
                    "log.level must be a string",
                    "expected one of: trace, debug, info, warn, error"};
            }
            auto lvl = log::parse_level(*name);
            MELLI_TRY(lvl);
            cfg.log_level = lvl.value();
        }
        if (auto node = (*lg)["color"]) {
            auto color = node.value_exact<bool>();
            if (!color) {
                return MelliError{MelliError::Config,
                    "log.color must be a boolean",
                    "use true or false, or omit it to auto-detect"};
            }
            cfg.log_color = *color;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return MelliError{MelliError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str());
}

void Config::apply() const {
    log::set_level(log_level);
    if (log_color.has_value()) {
        log::set_color_enabled(*log_color);
    }
    log::debug("log level set to %s", log::level_name(log_level));
}

} // namespace melli
