#include <drgrep/ignore.hpp>
#include <drgrep/log.hpp>
#include <fstream>

namespace drgrep {

namespace fs = std::filesystem;

static std::string root_string(const fs::path& root) {
    std::string s = root.generic_string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

static std::string trim_line(std::string line) {
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
        line.pop_back();
    }
    return line;
}

IgnoreRules IgnoreRules::from_lines(const fs::path& root,
                                    const std::vector<std::string>& lines) {
    IgnoreRules rules(root_string(root));
    for (const auto& raw : lines) {
        std::string line = trim_line(raw);
        if (line.empty() || line[0] == '#') continue;
        rules.add(line);
        rules.entries_.push_back(line);
    }
    rules.add(".git/**");
    return rules;
}

Result<IgnoreRules> IgnoreRules::load(const fs::path& root) {
    fs::path file = root / ".gitignore";

    std::error_code ec;
    if (!fs::exists(file, ec)) {
        log::debug("ignore: no .gitignore under %s", root.string().c_str());
        return Result<IgnoreRules>::ok(from_lines(root, {}));
    }

    std::ifstream in(file);
    if (!in.is_open()) {
        return DrgrepError{DrgrepError::IO,
            "cannot open ignore file: " + file.string(),
            "check file permissions"};
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }

    auto rules = from_lines(root, lines);
    log::debug("ignore: loaded %zu rule(s) from %s", rules.size(), file.string().c_str());
    return Result<IgnoreRules>::ok(std::move(rules));
}

void IgnoreRules::add(const std::string& pattern) {
    std::string rel = pattern;
    while (!rel.empty() && rel[0] == '/') rel.erase(0, 1);
    globs_.push_back(Glob::compile(root_ + "/" + rel));
}

bool IgnoreRules::is_ignored(const fs::path& path) const {
    std::string s = path.generic_string();
    for (const auto& g : globs_) {
        if (g.matches(s)) return true;
    }
    for (const auto& e : entries_) {
        if (s.find(e) != std::string::npos) return true;
    }
    return false;
}

} // namespace drgrep
