//! # Filters
//!
//! A filter is a named, ordered list of **stages**. Each stage is a predicate
//! scoped to one level of the entity tree:
//!
//! | Stage | Predicate sees | Removing drops |
//! |-------|----------------|----------------|
//! | `RepositoryFilter` | the repository | the whole repository |
//! | `ModuleFilter` | module + repository identity | the module |
//! | `ClassFilter` | class + owning module + identity | the class |
//! | `CallableFilter` | function/method + `CallableContext` | the function or method |
//!
//! Predicates return `true` to **keep** an entity. Removing a node removes
//! its subtree; predicate authors never recurse themselves.
//!
//! ## Persistence
//!
//! `apply_stage()` never edits its input. It returns a new root that shares
//! every unchanged module, class, function and method with the input, or the
//! input root itself when nothing was removed.

#ifndef PYSTRUCT_FILTER_FILTER_HPP
#define PYSTRUCT_FILTER_FILTER_HPP

#include "common.hpp"
#include "model/entities.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace pystruct::filter {

// ============================================================================
// Stages
// ============================================================================

/// Where a function or method sits.
struct CallableContext {
    const model::RepositoryIdentity& identity;
    const model::Module& module;
    const model::Class* owner; ///< Owning class, nullptr for a top-level function.
};

struct RepositoryFilter {
    std::function<bool(const model::Repository&)> keep;
};

struct ModuleFilter {
    std::function<bool(const model::Module&, const model::RepositoryIdentity&)> keep;
};

struct ClassFilter {
    std::function<bool(const model::Class&, const model::Module&,
                       const model::RepositoryIdentity&)>
        keep;
};

struct CallableFilter {
    std::function<bool(const model::Callable&, const CallableContext&)> keep;
};

using FilterStage = std::variant<RepositoryFilter, ModuleFilter, ClassFilter, CallableFilter>;

enum class Scope { Repository, Module, Class, Callable };

[[nodiscard]] auto scope_of(const FilterStage& stage) -> Scope;
[[nodiscard]] auto scope_name(Scope scope) -> std::string_view;

/// A named filter.
struct Filter {
    std::string name;
    std::string description;
    std::vector<FilterStage> stages; ///< Applied in order, each to the previous result.
};

// ============================================================================
// Removal Accounting
// ============================================================================

/// Entities removed by a filter. A removed node counts with its whole
/// subtree: dropping a module with two functions adds 1 module and 2
/// functions.
struct RemovalCounts {
    size_t repositories = 0;
    size_t modules = 0;
    size_t classes = 0;
    size_t functions = 0;
    size_t methods = 0;

    [[nodiscard]] auto any() const -> bool {
        return repositories + modules + classes + functions + methods > 0;
    }

    auto operator+=(const RemovalCounts& other) -> RemovalCounts&;

    [[nodiscard]] auto operator==(const RemovalCounts& other) const -> bool = default;
};

/// One filter application.
struct FilterStep {
    std::string filter;
    RemovalCounts removed;
};

/// Every filter application of a run, in order.
struct FilterReport {
    std::vector<FilterStep> steps;

    [[nodiscard]] auto total() const -> RemovalCounts;
};

// ============================================================================
// Application
// ============================================================================

/// Applies one stage. Returns nullptr when the repository itself is removed.
[[nodiscard]] auto apply_stage(const FilterStage& stage,
                               const Rc<const model::Repository>& repository,
                               RemovalCounts& removed) -> Rc<const model::Repository>;

/// Applies every stage of `filter` in order.
[[nodiscard]] auto apply_filter(const Filter& filter, Rc<const model::Repository> repository,
                                RemovalCounts& removed) -> Rc<const model::Repository>;

} // namespace pystruct::filter

#endif // PYSTRUCT_FILTER_FILTER_HPP
