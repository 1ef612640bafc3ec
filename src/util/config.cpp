#include <drgrep/config.hpp>
#include <drgrep/log.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace drgrep {

Result<ColorMode> parse_color_mode(const std::string& s) {
    if (s == "auto") return Result<ColorMode>::ok(ColorMode::Auto);
    if (s == "always") return Result<ColorMode>::ok(ColorMode::Always);
    if (s == "never") return Result<ColorMode>::ok(ColorMode::Never);
    return DrgrepError{DrgrepError::Config,
        "unknown color mode: '" + s + "'",
        "expected one of: auto, always, never"};
}

const char* color_mode_name(ColorMode m) {
    switch (m) {
        case ColorMode::Auto:   return "auto";
        case ColorMode::Always: return "always";
        case ColorMode::Never:  return "never";
    }
    return "auto";
}

static DrgrepError type_error(const char* key, const char* expected) {
    return DrgrepError{DrgrepError::Config,
        std::string("config key '") + key + "' must be " + expected};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return DrgrepError{DrgrepError::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [search]
    if (auto node = doc["search"]["sensitive"]) {
        auto v = node.value<bool>();
        if (!v) return type_error("search.sensitive", "a boolean");
        cfg.sensitive = *v;
        cfg.sensitive_set = true;
    }

    // [output]
    if (auto node = doc["output"]["color"]) {
        auto v = node.value<std::string>();
        if (!v) return type_error("output.color", "a string");
        auto mode = parse_color_mode(*v);
        if (mode.is_err()) return std::move(mode).error();
        cfg.color = mode.value();
        cfg.color_set = true;
    }

    // [log]
    if (auto node = doc["log"]["level"]) {
        auto v = node.value<std::string>();
        if (!v) return type_error("log.level", "a string");
        auto lvl = log::parse_level(*v);
        if (lvl.is_err()) {
            return DrgrepError{DrgrepError::Config, lvl.error().message, lvl.error().hint};
        }
        cfg.log_level = *v;
        cfg.log_level_set = true;
    }

    // [ignore]
    if (auto node = doc["ignore"]["patterns"]) {
        auto arr = node.as_array();
        if (!arr) return type_error("ignore.patterns", "an array of strings");
        for (const auto& el : *arr) {
            auto s = el.value<std::string>();
            if (!s) return type_error("ignore.patterns", "an array of strings");
            cfg.ignore_patterns.push_back(*s);
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return DrgrepError{DrgrepError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return Config::parse(ss.str()).map_error([&](DrgrepError e) {
        e.file = path;
        return e;
    });
}

Result<std::optional<Config>> Config::load_if_exists(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !std::filesystem::exists(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = load(path);
    if (cfg.is_err()) return std::move(cfg).error();
    log::debug("config: loaded %s", path.c_str());
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

void Config::merge(const Config& other) {
    if (other.sensitive_set) {
        sensitive = other.sensitive;
        sensitive_set = true;
    }
    if (other.color_set) {
        color = other.color;
        color_set = true;
    }
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    ignore_patterns.insert(ignore_patterns.end(),
                           other.ignore_patterns.begin(), other.ignore_patterns.end());
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.drgrep/config.toml";
}

std::string local_config_path() {
    return ".drgrep.toml";
}

} // namespace drgrep
