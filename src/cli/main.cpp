#include <drgrep/cli.hpp>
#include <drgrep/config.hpp>
#include <drgrep/log.hpp>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <iterator>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

using namespace drgrep;

static Result<Config> load_config() {
    auto global = Config::load_if_exists(global_config_path());
    if (global.is_err()) return std::move(global).error();
    auto local = Config::load_if_exists(local_config_path());
    if (local.is_err()) return std::move(local).error();
    return Result<Config>::ok(Config::effective(global.value(), local.value()));
}

static bool use_color(ColorMode mode) {
    switch (mode) {
        case ColorMode::Always: return true;
        case ColorMode::Never:  return false;
        case ColorMode::Auto:   return isatty(fileno(stdout));
    }
    return false;
}

int main(int argc, char** argv) {
    Args args = Args::parse(argc, argv);

    if (args.has_any({"version", "v"})) {
        std::cout << VERSION << "\n";
        return 0;
    }
    if (args.has_any({"help", "h"})) {
        std::cout << USAGE << "\n";
        return 0;
    }

    auto config = load_config();
    if (config.is_err()) {
        log::error("%s", config.error().format().c_str());
        return 1;
    }

    std::string level = args.get({"log-level"}).value_or(config.value().log_level);
    auto lvl = log::parse_level(level);
    if (lvl.is_err()) {
        log::error("%s", lvl.error().format().c_str());
        return 1;
    }
    log::set_level(lvl.value());

    // "-c @" reads the content from a pipe
    if (auto content = args.get({"content", "c"}); content && *content == "@") {
        std::string input{std::istreambuf_iterator<char>(std::cin),
                          std::istreambuf_iterator<char>()};
        args.set(args.has("content") ? "content" : "c", std::move(input));
    }

    auto opts = Options::from_args(args, std::getenv("DRGREP_SENSITIVE_CASE") != nullptr);
    if (opts.is_err()) {
        if (opts.error().code == DrgrepError::InvalidArg) {
            std::cout << USAGE << "\n";
        }
        log::error("%s", opts.error().format().c_str());
        return 1;
    }

    auto status = run(opts.value(), config.value(), std::cout,
                      use_color(config.value().color));
    if (status.is_err()) {
        log::error("%s", status.error().format().c_str());
        return 1;
    }
    return 0;
}
