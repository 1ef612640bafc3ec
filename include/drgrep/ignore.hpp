#pragma once

#include <drgrep/glob.hpp>
#include <drgrep/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace drgrep {

// Ignore rules for directory searches. Each .gitignore line becomes one
// glob rooted at the search root; the raw lines are also kept and match
// any path that contains them.
class IgnoreRules {
public:
    // Reads <root>/.gitignore when present and always ignores <root>/.git/**.
    static Result<IgnoreRules> load(const std::filesystem::path& root);

    // Rules built from explicit lines, without touching the filesystem.
    static IgnoreRules from_lines(const std::filesystem::path& root,
                                  const std::vector<std::string>& lines);

    // Add one glob rooted at the search root.
    void add(const std::string& pattern);

    bool is_ignored(const std::filesystem::path& path) const;

    size_t size() const { return globs_.size(); }
    const std::vector<std::string>& entries() const { return entries_; }

private:
    explicit IgnoreRules(std::string root) : root_(std::move(root)) {}

    std::string root_;
    std::vector<Glob> globs_;
    std::vector<std::string> entries_;
};

} // namespace drgrep
