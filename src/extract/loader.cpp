#include "extract/loader.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <system_error>

namespace pystruct::extract {

namespace {

auto is_skipped_directory(const fs::path& dir) -> bool {
    auto name = dir.filename().string();
    return name.starts_with(".") || name == "__pycache__";
}

} // namespace

auto discover_sources(const fs::path& root) -> Result<std::vector<std::string>, std::string> {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return "root is not a directory: " + root.string();
    }

    std::vector<std::string> paths;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return "cannot read directory " + root.string() + ": " + ec.message();
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return "cannot read directory " + root.string() + ": " + ec.message();
        }
        const auto& entry = *it;
        std::error_code entry_ec;
        if (entry.is_directory(entry_ec)) {
            if (is_skipped_directory(entry.path())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(entry_ec) || entry.path().extension() != ".py") {
            continue;
        }
        paths.push_back(entry.path().lexically_relative(root).generic_string());
    }
    if (ec) {
        return "cannot read directory " + root.string() + ": " + ec.message();
    }

    std::sort(paths.begin(), paths.end());
    PYSTRUCT_LOG_DEBUG("loader", "Discovered " << paths.size() << " files under " << root.string());
    return paths;
}

auto load_sources(const fs::path& root, const std::vector<std::string>& relative_paths)
    -> LoadedSources {
    LoadedSources loaded;
    loaded.files_discovered = relative_paths.size();

    for (const auto& relative : relative_paths) {
        auto source = lexer::Source::from_file((root / relative).string(), relative);
        if (is_err(source)) {
            PYSTRUCT_LOG_WARN("loader", "Skipping " << relative << ": " << unwrap_err(source));
            loaded.failures.push_back(ExtractionFailure{.kind = FailureKind::Io,
                                                        .file = relative,
                                                        .message = unwrap_err(source),
                                                        .line = 0,
                                                        .column = 0});
            continue;
        }
        loaded.units.push_back(
            SourceUnit{.relative_path = relative, .source = std::move(unwrap(source))});
    }

    return loaded;
}

auto load_sources(const fs::path& root) -> Result<LoadedSources, std::string> {
    auto paths = discover_sources(root);
    if (is_err(paths)) {
        return unwrap_err(paths);
    }
    return load_sources(root, unwrap(paths));
}

} // namespace pystruct::extract
