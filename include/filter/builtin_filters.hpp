//! # Built-in Filters
//!
//! | Name | Scope | Keeps |
//! |------|-------|-------|
//! | `PrivateModuleFilter` | module | no `_`-prefixed path component (dunders are public) |
//! | `TestModuleFilter` | module | not under `test*` dirs, not `test_*`/`*_test`/`conftest` |
//! | `NonCoreModuleFilter` | module | inside the package's own tree, outside vendored dirs |
//! | `NoStringTypeFilter` | callable | at least one declared parameter or return type |
//! | `StringTypeFilter` | callable | a parameter or return declared exactly `str` |
//! | `EmptyFilter` | class, module, repository | containers with at least one child |

#ifndef PYSTRUCT_FILTER_BUILTIN_FILTERS_HPP
#define PYSTRUCT_FILTER_BUILTIN_FILTERS_HPP

#include "filter/filter.hpp"

#include <string>
#include <string_view>

namespace pystruct::filter {

[[nodiscard]] auto private_module_filter() -> Filter;
[[nodiscard]] auto test_module_filter() -> Filter;
[[nodiscard]] auto non_core_module_filter() -> Filter;
[[nodiscard]] auto no_string_type_filter() -> Filter;
[[nodiscard]] auto string_type_filter() -> Filter;
[[nodiscard]] auto empty_filter() -> Filter;

// Predicates, exposed for direct testing.

[[nodiscard]] auto is_private_module_path(std::string_view file_path) -> bool;
[[nodiscard]] auto is_test_module_path(std::string_view file_path) -> bool;

/// The import name of a repository's own package: the repository name
/// lower-cased with `-` and `.` mapped to `_` (`"My-Lib"` → `"my_lib"`).
[[nodiscard]] auto package_name_for(std::string_view repository_name) -> std::string;

[[nodiscard]] auto is_core_module_path(std::string_view file_path, std::string_view package)
    -> bool;

} // namespace pystruct::filter

#endif // PYSTRUCT_FILTER_BUILTIN_FILTERS_HPP
