#pragma once

#include <drgrep/config.hpp>
#include <drgrep/regex.hpp>
#include <drgrep/result.hpp>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace drgrep {

extern const char* const VERSION;
extern const char* const USAGE;

// Raw command line: "--name [value]" and "-n [value]". After a long flag
// the next token is its value unless it starts with "--"; after a short
// flag, unless it starts with '-'. Positional tokens are ignored.
class Args {
public:
    static Args parse(int argc, const char* const* argv);
    static Args parse(const std::vector<std::string>& tokens);

    bool has(const std::string& name) const;
    // Value of the first of `names` that is present with a value.
    std::optional<std::string> get(std::initializer_list<const char*> names) const;
    bool has_any(std::initializer_list<const char*> names) const;
    void set(const std::string& name, std::string value);

private:
    std::unordered_map<std::string, std::optional<std::string>> values_;
};

struct Options {
    std::optional<std::string> key;
    std::optional<std::string> path;   // only set when it names a file or directory
    bool path_is_dir = true;
    std::optional<Regex> regex;
    std::optional<std::string> content;
    bool sensitive = false;

    static Result<Options> from_args(const Args& args, bool env_sensitive);
};

// Search according to `opts`, printing results to `out`. The config's
// ignore patterns and sensitivity apply on top of the command line.
Status run(const Options& opts, const Config& config, std::ostream& out, bool color);

} // namespace drgrep
