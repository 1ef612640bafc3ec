#include <drgrep/cli.hpp>
#include <filesystem>
#include <utility>

namespace drgrep {

const char* const VERSION = "v0.3.0";

const char* const USAGE = R"(drgrep is a CLI searching tool
Usage:
drgrep --[args]/-[flag]

[flags]-[args]
-h --help => Print this help message
-v --version => Print the current version of drgrep
-k --key <optional:false> => The word that you want to search
-p --path <optional:true>, <default: './'> => The file or directory to search
-r --regex <optional:true> => The regex expression to use for matching
-c --content <optional:true> => Search this text instead of files; '@' reads standard input
-s --sensitive <optional:true> => Case sensitive search (also enabled by DRGREP_SENSITIVE_CASE)
--log-level <level> => trace, debug, info, warn or error
)";

Args Args::parse(int argc, const char* const* argv) {
    std::vector<std::string> tokens;
    for (int i = 1; i < argc; i++) tokens.emplace_back(argv[i]);
    return parse(tokens);
}

Args Args::parse(const std::vector<std::string>& tokens) {
    Args args;
    for (size_t i = 0; i < tokens.size(); i++) {
        const std::string& tok = tokens[i];
        if (tok.size() < 2 || tok[0] != '-') continue;

        bool is_long = tok[1] == '-';
        std::string name = tok.substr(is_long ? 2 : 1);

        // A long flag only refuses another long flag as its value, so
        // "--key -O2" works; a short flag refuses anything dash-led.
        std::optional<std::string> value;
        if (i + 1 < tokens.size()) {
            const std::string& next = tokens[i + 1];
            bool refused = is_long ? next.rfind("--", 0) == 0
                                   : !next.empty() && next[0] == '-';
            if (!refused) value = tokens[++i];
        }
        args.values_[name] = std::move(value);
    }
    return args;
}

bool Args::has(const std::string& name) const {
    return values_.count(name) > 0;
}

bool Args::has_any(std::initializer_list<const char*> names) const {
    for (const char* n : names) {
        if (has(n)) return true;
    }
    return false;
}

std::optional<std::string> Args::get(std::initializer_list<const char*> names) const {
    for (const char* n : names) {
        auto it = values_.find(n);
        if (it != values_.end() && it->second) return it->second;
    }
    return std::nullopt;
}

void Args::set(const std::string& name, std::string value) {
    values_[name] = std::move(value);
}

Result<Options> Options::from_args(const Args& args, bool env_sensitive) {
    if (!args.has_any({"key", "k", "regex", "r", "content", "c"})) {
        return DrgrepError{DrgrepError::InvalidArg,
            "no search key, regex or content provided",
            "pass -k <word> or -r <regex>"};
    }

    // Search flags must carry a value
    static const std::pair<const char*, const char*> valued[] = {
        {"key", "k"}, {"regex", "r"}, {"content", "c"}};
    for (const auto& [name, alias] : valued) {
        if (args.has_any({name, alias}) && !args.get({name, alias})) {
            return DrgrepError{DrgrepError::InvalidArg,
                std::string("missing value for --") + name,
                std::string("pass it as --") + name + " <value>"};
        }
    }

    Options opts;
    opts.key = args.get({"key", "k"});

    if (auto p = args.get({"path", "p"})) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(*p, ec)) {
            opts.path = *p;
            opts.path_is_dir = false;
        } else if (std::filesystem::is_directory(*p, ec)) {
            opts.path = *p;
        }
    }

    if (auto r = args.get({"regex", "r"})) {
        auto re = Regex::compile(*r);
        if (re.is_err()) return std::move(re).error();
        opts.regex = std::move(re).value();
    }

    opts.content = args.get({"content", "c"});

    opts.sensitive = args.has_any({"sensitive", "s"}) || env_sensitive;

    return Result<Options>::ok(std::move(opts));
}

} // namespace drgrep
