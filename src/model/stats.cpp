#include "model/stats.hpp"

namespace pystruct::model {

namespace {

void count_callable(const Callable& callable, EntityCounts& counts) {
    counts.parameters += callable.parameters.size();
    for (const auto& param : callable.parameters) {
        if (param.type) {
            ++counts.typed_parameters;
        }
    }
    if (callable.has_type_annotation()) {
        ++counts.typed_callables;
    }
}

} // namespace

auto EntityCounts::operator+=(const EntityCounts& other) -> EntityCounts& {
    repositories += other.repositories;
    modules += other.modules;
    classes += other.classes;
    functions += other.functions;
    methods += other.methods;
    parameters += other.parameters;
    typed_parameters += other.typed_parameters;
    typed_callables += other.typed_callables;
    return *this;
}

auto count_entities(const Repository& repository) -> EntityCounts {
    EntityCounts counts;
    counts.repositories = 1;
    for (const auto& module : repository.modules) {
        ++counts.modules;
        for (const auto& function : module->functions) {
            ++counts.functions;
            count_callable(function->callable, counts);
        }
        for (const auto& cls : module->classes) {
            ++counts.classes;
            for (const auto& method : cls->methods) {
                ++counts.methods;
                count_callable(method->callable, counts);
            }
        }
    }
    return counts;
}

auto count_entities(const Dataset& dataset) -> EntityCounts {
    EntityCounts total;
    for (const auto& repository : dataset) {
        total += count_entities(*repository);
    }
    return total;
}

} // namespace pystruct::model
