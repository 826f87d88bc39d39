#include "filter/builtin_filters.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

namespace pystruct::filter {

namespace {

constexpr std::array<std::string_view, 3> TEST_DIRECTORIES = {"test", "tests", "testing"};
constexpr std::array<std::string_view, 3> TEST_STEMS = {"test", "tests", "conftest"};
constexpr std::array<std::string_view, 12> NON_CORE_DIRECTORIES = {
    "vendor",   "_vendor", "vendored",      "third_party", "thirdparty", "external",
    "build",    "dist",    "site-packages", "examples",    "example",    "docs",
};

auto to_lower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

/// A module path split into its directories and file stem.
struct PathParts {
    std::vector<std::string_view> directories;
    std::string_view stem;
};

auto split_module_path(std::string_view path) -> PathParts {
    PathParts parts;
    size_t start = 0;
    while (true) {
        size_t slash = path.find('/', start);
        if (slash == std::string_view::npos) {
            break;
        }
        if (slash > start) {
            parts.directories.push_back(path.substr(start, slash - start));
        }
        start = slash + 1;
    }
    auto file = path.substr(start);
    auto dot = file.rfind('.');
    parts.stem = dot == std::string_view::npos || dot == 0 ? file : file.substr(0, dot);
    return parts;
}

auto is_dunder(std::string_view name) -> bool {
    return name.size() > 4 && name.starts_with("__") && name.ends_with("__");
}

auto is_private_name(std::string_view name) -> bool {
    return name.starts_with("_") && !is_dunder(name);
}

template <size_t N>
auto contains(const std::array<std::string_view, N>& names, std::string_view name) -> bool {
    return std::find(names.begin(), names.end(), name) != names.end();
}

auto has_str_type(const model::Callable& callable) -> bool {
    if (callable.return_type && *callable.return_type == "str") {
        return true;
    }
    return std::any_of(callable.parameters.begin(), callable.parameters.end(),
                       [](const model::Parameter& p) { return p.type && *p.type == "str"; });
}

} // namespace

// ============================================================================
// Predicates
// ============================================================================

auto is_private_module_path(std::string_view file_path) -> bool {
    auto parts = split_module_path(file_path);
    if (is_private_name(parts.stem)) {
        return true;
    }
    return std::any_of(parts.directories.begin(), parts.directories.end(), is_private_name);
}

auto is_test_module_path(std::string_view file_path) -> bool {
    auto parts = split_module_path(file_path);
    for (auto dir : parts.directories) {
        if (contains(TEST_DIRECTORIES, to_lower(dir))) {
            return true;
        }
    }
    auto stem = to_lower(parts.stem);
    return contains(TEST_STEMS, stem) || stem.starts_with("test_") || stem.ends_with("_test");
}

auto package_name_for(std::string_view repository_name) -> std::string {
    auto name = to_lower(repository_name);
    std::replace(name.begin(), name.end(), '-', '_');
    std::replace(name.begin(), name.end(), '.', '_');
    return name;
}

auto is_core_module_path(std::string_view file_path, std::string_view package) -> bool {
    auto parts = split_module_path(file_path);
    for (auto dir : parts.directories) {
        if (contains(NON_CORE_DIRECTORIES, to_lower(dir))) {
            return false;
        }
    }

    auto dirs = parts.directories;
    if (!dirs.empty() && dirs.front() == "src") {
        dirs.erase(dirs.begin());
    }
    if (dirs.empty()) {
        return to_lower(parts.stem) == package;
    }
    return to_lower(dirs.front()) == package;
}

// ============================================================================
// Filters
// ============================================================================

auto private_module_filter() -> Filter {
    return Filter{
        .name = "PrivateModuleFilter",
        .description = "Removes modules whose path has an underscore-prefixed component",
        .stages = {ModuleFilter{[](const model::Module& module, const model::RepositoryIdentity&) {
            return !is_private_module_path(module.file_path);
        }}},
    };
}

auto test_module_filter() -> Filter {
    return Filter{
        .name = "TestModuleFilter",
        .description = "Removes test modules (test directories, test_*.py, *_test.py, conftest.py)",
        .stages = {ModuleFilter{[](const model::Module& module, const model::RepositoryIdentity&) {
            return !is_test_module_path(module.file_path);
        }}},
    };
}

auto non_core_module_filter() -> Filter {
    return Filter{
        .name = "NonCoreModuleFilter",
        .description = "Keeps only modules of the repository's own package",
        .stages = {ModuleFilter{
            [](const model::Module& module, const model::RepositoryIdentity& identity) {
                return is_core_module_path(module.file_path, package_name_for(identity.name));
            }}},
    };
}

auto no_string_type_filter() -> Filter {
    return Filter{
        .name = "NoStringTypeFilter",
        .description = "Removes functions and methods without any declared type",
        .stages = {CallableFilter{[](const model::Callable& callable, const CallableContext&) {
            return callable.has_type_annotation();
        }}},
    };
}

auto string_type_filter() -> Filter {
    return Filter{
        .name = "StringTypeFilter",
        .description = "Keeps functions and methods with a 'str' parameter or return type",
        .stages = {CallableFilter{[](const model::Callable& callable, const CallableContext&) {
            return has_str_type(callable);
        }}},
    };
}

auto empty_filter() -> Filter {
    return Filter{
        .name = "EmptyFilter",
        .description = "Removes classes without methods, then empty modules and repositories",
        .stages =
            {
                ClassFilter{[](const model::Class& cls, const model::Module&,
                               const model::RepositoryIdentity&) { return !cls.methods.empty(); }},
                ModuleFilter{[](const model::Module& module, const model::RepositoryIdentity&) {
                    return !module.is_empty();
                }},
                RepositoryFilter{
                    [](const model::Repository& repo) { return !repo.modules.empty(); }},
            },
    };
}

} // namespace pystruct::filter
