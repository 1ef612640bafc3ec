#include <drgrep/glob.hpp>
#include <drgrep/log.hpp>
#include <functional>
#include <unordered_set>

namespace drgrep {

namespace fs = std::filesystem;

namespace {

using PathPredicate = std::function<bool(const std::string&)>;

DrgrepError read_error(const fs::path& dir, const std::error_code& ec) {
    log::debug("glob: cannot read %s: %s", dir.string().c_str(), ec.message().c_str());
    return DrgrepError{DrgrepError::IO,
        "cannot read directory: " + dir.string(), ec.message()};
}

// Depth-first walk. Every entry is tested; every real directory is
// descended whether or not it matched. Symlinked directories are tested
// but not followed.
Status walk_dir(const fs::path& dir, const PathPredicate& matches,
                std::vector<fs::path>& out) {
    log::trace("glob: entering %s", dir.string().c_str());

    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) return read_error(dir, ec);

    fs::directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) return read_error(dir, ec);

        const fs::path path = it->path();
        if (matches(path.string())) {
            out.push_back(path);
        }

        auto status = it->symlink_status(ec);
        if (ec) return read_error(path, ec);
        if (fs::is_directory(status)) {
            DRGREP_TRY(walk_dir(path, matches, out));
        }
    }
    if (ec) return read_error(dir, ec);

    return ok_status();
}

} // namespace

Result<std::vector<fs::path>> Glob::find_files(const fs::path& base_dir) const {
    std::vector<fs::path> results;

    if (auto alts = std::get_if<GlobAlternatives>(&repr_)) {
        // One walk per alternative; a path matched by several is kept once
        std::unordered_set<std::string> seen;
        for (const auto& comps : alts->compiled) {
            std::vector<fs::path> found;
            DRGREP_TRY(walk_dir(base_dir, [&](const std::string& p) {
                return match_glob_components(comps, p);
            }, found));
            for (auto& p : found) {
                if (seen.insert(p.string()).second) {
                    results.push_back(std::move(p));
                }
            }
        }
    } else {
        DRGREP_TRY(walk_dir(base_dir, [this](const std::string& p) {
            return matches(p);
        }, results));
    }

    log::debug("glob: '%s' matched %zu path(s) under %s",
               pattern_.c_str(), results.size(), base_dir.string().c_str());
    return Result<std::vector<fs::path>>::ok(std::move(results));
}

} // namespace drgrep
