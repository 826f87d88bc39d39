#include "filter/pipeline.hpp"

#include "log/log.hpp"

namespace pystruct::filter {

namespace {

void log_removals(const std::string& filter, const RemovalCounts& removed) {
    if (!removed.any()) {
        PYSTRUCT_LOG_DEBUG("filter", filter << ": nothing removed");
        return;
    }
    PYSTRUCT_LOG_DEBUG("filter", filter << ": removed " << removed.repositories
                                        << " repositories, " << removed.modules << " modules, "
                                        << removed.classes << " classes, " << removed.functions
                                        << " functions, " << removed.methods << " methods");
}

} // namespace

auto FilterPipeline::create(const FilterRegistry& registry, const std::vector<std::string>& names)
    -> Result<FilterPipeline, ConfigurationError> {
    FilterPipeline pipeline;
    for (const auto& name : names) {
        if (name.empty()) {
            return ConfigurationError{"empty filter name"};
        }
        const Filter* filter = registry.find(name);
        if (filter == nullptr) {
            return ConfigurationError{"unknown filter '" + name + "'"};
        }
        pipeline.filters_.push_back(*filter);
    }
    return pipeline;
}

auto FilterPipeline::create(const FilterRegistry& registry, std::string_view chain)
    -> Result<FilterPipeline, ConfigurationError> {
    auto names = split_filter_names(chain);
    if (is_err(names)) {
        return unwrap_err(names);
    }
    return create(registry, unwrap(names));
}

auto FilterPipeline::apply(Rc<const model::Repository> repository, FilterReport& report) const
    -> Rc<const model::Repository> {
    for (const auto& filter : filters_) {
        RemovalCounts removed;
        if (repository) {
            repository = apply_filter(filter, std::move(repository), removed);
        }
        log_removals(filter.name, removed);
        report.steps.push_back(FilterStep{.filter = filter.name, .removed = removed});
    }
    return repository;
}

auto FilterPipeline::apply(const model::Dataset& dataset, FilterReport& report) const
    -> model::Dataset {
    model::Dataset current = dataset;
    for (const auto& filter : filters_) {
        RemovalCounts removed;
        model::Dataset next;
        next.reserve(current.size());
        for (auto& repository : current) {
            auto kept = apply_filter(filter, std::move(repository), removed);
            if (kept) {
                next.push_back(std::move(kept));
            }
        }
        current = std::move(next);
        log_removals(filter.name, removed);
        report.steps.push_back(FilterStep{.filter = filter.name, .removed = removed});
    }
    return current;
}

auto FilterPipeline::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(filters_.size());
    for (const auto& filter : filters_) {
        out.push_back(filter.name);
    }
    return out;
}

} // namespace pystruct::filter
