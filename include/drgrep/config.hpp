#pragma once

#include <drgrep/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace drgrep {

enum class ColorMode { Auto, Always, Never };

Result<ColorMode> parse_color_mode(const std::string& s);
const char* color_mode_name(ColorMode m);

// Layered configuration: global (~/.drgrep/config.toml) then local
// (./.drgrep.toml). Later layers override explicitly-set fields; ignore
// patterns accumulate.
struct Config {
    bool sensitive = false;
    ColorMode color = ColorMode::Auto;
    std::string log_level = "info";
    std::vector<std::string> ignore_patterns;

    // Track which fields were explicitly set (for merge)
    bool sensitive_set = false;
    bool color_set = false;
    bool log_level_set = false;

    static Result<Config> parse(const std::string& toml_str);
    static Result<Config> load(const std::string& path);

    // Load if the file exists; a missing file yields std::nullopt.
    static Result<std::optional<Config>> load_if_exists(const std::string& path);

    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);
};

// ~/.drgrep/config.toml, or empty when no home directory is known.
std::string global_config_path();

// Project-local config file name, resolved against the working directory.
std::string local_config_path();

} // namespace drgrep
