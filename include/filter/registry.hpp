//! # Filter Registry
//!
//! The set of filters a pipeline may name. A registry is an explicit object
//! built once by the driver and passed to `FilterPipeline::create()`; there
//! is no global registration.
//!
//! Lookups ignore ASCII case, so `"emptyfilter"` resolves to `EmptyFilter`.

#ifndef PYSTRUCT_FILTER_REGISTRY_HPP
#define PYSTRUCT_FILTER_REGISTRY_HPP

#include "common.hpp"
#include "filter/filter.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pystruct::filter {

class FilterRegistry {
public:
    FilterRegistry() = default;

    /// A registry holding every built-in filter.
    [[nodiscard]] static auto builtin() -> FilterRegistry;

    /// Registers a filter. Fails if a filter with the same name (ignoring
    /// case) is already registered.
    auto add(Filter filter) -> Result<bool, ConfigurationError>;

    /// Finds a filter by name, ignoring case. Returns nullptr if unknown.
    [[nodiscard]] auto find(std::string_view name) const -> const Filter*;

    /// Registered names in registration order.
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    [[nodiscard]] auto filters() const -> const std::vector<Rc<const Filter>>& {
        return filters_;
    }

    [[nodiscard]] auto size() const -> size_t {
        return filters_.size();
    }

private:
    std::vector<Rc<const Filter>> filters_;
};

/// Splits a comma-separated filter chain (`"A, B"`) into trimmed names.
/// An empty entry, as in `"A,,B"` or a trailing comma, is an error. An
/// entirely blank string yields an empty chain.
[[nodiscard]] auto split_filter_names(std::string_view chain)
    -> Result<std::vector<std::string>, ConfigurationError>;

} // namespace pystruct::filter

#endif // PYSTRUCT_FILTER_REGISTRY_HPP
