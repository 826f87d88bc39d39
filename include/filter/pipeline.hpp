//! # Filter Pipeline
//!
//! An ordered chain of filters resolved against a `FilterRegistry`.
//!
//! ```cpp
//! auto registry = filter::FilterRegistry::builtin();
//! auto pipeline = filter::FilterPipeline::create(registry, "NoStringTypeFilter,EmptyFilter");
//! if (is_err(pipeline)) {
//!     // unknown or empty filter name; nothing has been read yet
//! }
//! filter::FilterReport report;
//! auto kept = unwrap(pipeline).apply(repository, report);
//! ```
//!
//! The whole chain is validated in `create()`, so a bad name is reported
//! before any source file is touched. Each filter sees only what the
//! filters before it kept, and records one `FilterStep` in the report.

#ifndef PYSTRUCT_FILTER_PIPELINE_HPP
#define PYSTRUCT_FILTER_PIPELINE_HPP

#include "common.hpp"
#include "filter/filter.hpp"
#include "filter/registry.hpp"
#include "model/entities.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pystruct::filter {

class FilterPipeline {
public:
    /// Resolves every name in `names`, in order. Fails on the first unknown
    /// or empty name.
    [[nodiscard]] static auto create(const FilterRegistry& registry,
                                     const std::vector<std::string>& names)
        -> Result<FilterPipeline, ConfigurationError>;

    /// Resolves a comma-separated chain.
    [[nodiscard]] static auto create(const FilterRegistry& registry, std::string_view chain)
        -> Result<FilterPipeline, ConfigurationError>;

    /// Applies the chain to one repository. Returns nullptr when a filter
    /// removed the repository itself.
    [[nodiscard]] auto apply(Rc<const model::Repository> repository, FilterReport& report) const
        -> Rc<const model::Repository>;

    /// Applies the chain to every repository of a dataset, dropping removed
    /// repositories. The report gets one step per filter, summed over the
    /// dataset.
    [[nodiscard]] auto apply(const model::Dataset& dataset, FilterReport& report) const
        -> model::Dataset;

    /// Canonical names of the resolved filters, in chain order.
    [[nodiscard]] auto names() const -> std::vector<std::string>;

    [[nodiscard]] auto empty() const -> bool {
        return filters_.empty();
    }

private:
    std::vector<Filter> filters_;
};

} // namespace pystruct::filter

#endif // PYSTRUCT_FILTER_PIPELINE_HPP
