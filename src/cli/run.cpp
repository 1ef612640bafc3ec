#include <drgrep/cli.hpp>
#include <drgrep/glob.hpp>
#include <drgrep/ignore.hpp>
#include <drgrep/log.hpp>
#include <drgrep/output.hpp>
#include <drgrep/search.hpp>
#include <drgrep/utf8.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace drgrep {

namespace fs = std::filesystem;

static Result<std::string> read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open()) {
        return DrgrepError{DrgrepError::IO,
            "could not open file: " + p.string(),
            "check file permissions"};
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return Result<std::string>::ok(buf.str());
}

static std::vector<SearchResult> search_content(const Options& opts, bool sensitive,
                                                const std::string& source,
                                                const std::string& content) {
    if (opts.regex) return search_regex(*opts.regex, source, content);
    if (opts.key) return search_words(*opts.key, source, content, sensitive);
    return {};
}

static Status search_tree(const Options& opts, const Config& config, bool sensitive,
                          Printer& printer) {
    std::error_code ec;
    fs::path root = fs::absolute(opts.path.value_or("."), ec);
    if (ec) {
        return DrgrepError{DrgrepError::IO, "cannot resolve search root", ec.message()};
    }
    root = root.lexically_normal();

    auto ignore = IgnoreRules::load(root);
    if (ignore.is_err()) return std::move(ignore).error();
    for (const auto& pat : config.ignore_patterns) {
        ignore.value().add(pat);
    }

    auto entries = Glob::compile("*").find_files(root);
    if (entries.is_err()) return std::move(entries).error();

    for (const auto& path : entries.value()) {
        if (ignore.value().is_ignored(path)) continue;
        if (!fs::is_regular_file(path, ec)) continue;

        auto content = read_file(path);
        if (content.is_err()) {
            log::warn("%s", content.error().format().c_str());
            continue;
        }
        if (!utf8::is_valid(content.value())) {
            log::debug("skipping non UTF-8 file %s", path.string().c_str());
            continue;
        }

        for (const auto& r : search_content(opts, sensitive, path.string(), content.value())) {
            printer.print(r);
        }
    }
    return ok_status();
}

Status run(const Options& opts, const Config& config, std::ostream& out, bool color) {
    Printer printer(out, color);
    bool sensitive = opts.sensitive || config.sensitive;

    if (opts.path && !opts.path_is_dir) {
        auto content = read_file(*opts.path);
        if (content.is_err()) return std::move(content).error();
        if (!utf8::is_valid(content.value())) {
            return DrgrepError{DrgrepError::IO,
                "file is not valid UTF-8: " + *opts.path,
                "only UTF-8 text files can be searched"};
        }
        for (const auto& r : search_content(opts, sensitive, *opts.path, content.value())) {
            printer.print(r);
        }
        return ok_status();
    }

    if (opts.content) {
        if (!utf8::is_valid(*opts.content)) {
            return DrgrepError{DrgrepError::InvalidArg,
                "content is not valid UTF-8"};
        }
        for (const auto& r : search_content(opts, sensitive, "", *opts.content)) {
            printer.print(r);
        }
        return ok_status();
    }

    return search_tree(opts, config, sensitive, printer);
}

} // namespace drgrep
