//! # Filter Application
//!
//! Each stage kind visits exactly one level of the tree; the driver matches
//! on the stage variant. Containers are rebuilt only along the path to a
//! removal; everything else is shared with the input.

#include "filter/filter.hpp"

namespace pystruct::filter {

namespace {

template <class... Ts> struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

void count_class(const model::Class& cls, RemovalCounts& removed) {
    ++removed.classes;
    removed.methods += cls.methods.size();
}

void count_module(const model::Module& module, RemovalCounts& removed) {
    ++removed.modules;
    removed.functions += module.functions.size();
    for (const auto& cls : module.classes) {
        count_class(*cls, removed);
    }
}

auto with_modules(const model::Repository& repository,
                  std::vector<Rc<const model::Module>> modules) -> Rc<const model::Repository> {
    return make_rc<model::Repository>(
        model::Repository{.identity = repository.identity, .modules = std::move(modules)});
}

auto keep_repository(const RepositoryFilter& stage, const Rc<const model::Repository>& repository,
                     RemovalCounts& removed) -> Rc<const model::Repository> {
    if (stage.keep(*repository)) {
        return repository;
    }
    ++removed.repositories;
    for (const auto& module : repository->modules) {
        count_module(*module, removed);
    }
    return nullptr;
}

auto keep_modules(const ModuleFilter& stage, const Rc<const model::Repository>& repository,
                  RemovalCounts& removed) -> Rc<const model::Repository> {
    std::vector<Rc<const model::Module>> kept;
    bool changed = false;
    for (const auto& module : repository->modules) {
        if (stage.keep(*module, repository->identity)) {
            kept.push_back(module);
        } else {
            count_module(*module, removed);
            changed = true;
        }
    }
    return changed ? with_modules(*repository, std::move(kept)) : repository;
}

auto keep_classes(const ClassFilter& stage, const Rc<const model::Repository>& repository,
                  RemovalCounts& removed) -> Rc<const model::Repository> {
    std::vector<Rc<const model::Module>> modules;
    bool changed = false;
    for (const auto& module : repository->modules) {
        std::vector<Rc<const model::Class>> kept;
        bool module_changed = false;
        for (const auto& cls : module->classes) {
            if (stage.keep(*cls, *module, repository->identity)) {
                kept.push_back(cls);
            } else {
                count_class(*cls, removed);
                module_changed = true;
            }
        }
        if (module_changed) {
            auto copy = *module;
            copy.classes = std::move(kept);
            modules.push_back(make_rc<model::Module>(std::move(copy)));
            changed = true;
        } else {
            modules.push_back(module);
        }
    }
    return changed ? with_modules(*repository, std::move(modules)) : repository;
}

auto keep_callables(const CallableFilter& stage, const Rc<const model::Repository>& repository,
                    RemovalCounts& removed) -> Rc<const model::Repository> {
    std::vector<Rc<const model::Module>> modules;
    bool changed = false;

    for (const auto& module : repository->modules) {
        bool module_changed = false;

        std::vector<Rc<const model::Function>> functions;
        for (const auto& function : module->functions) {
            CallableContext context{
                .identity = repository->identity, .module = *module, .owner = nullptr};
            if (stage.keep(function->callable, context)) {
                functions.push_back(function);
            } else {
                ++removed.functions;
                module_changed = true;
            }
        }

        std::vector<Rc<const model::Class>> classes;
        for (const auto& cls : module->classes) {
            std::vector<Rc<const model::Method>> methods;
            bool class_changed = false;
            for (const auto& method : cls->methods) {
                CallableContext context{
                    .identity = repository->identity, .module = *module, .owner = cls.get()};
                if (stage.keep(method->callable, context)) {
                    methods.push_back(method);
                } else {
                    ++removed.methods;
                    class_changed = true;
                }
            }
            if (class_changed) {
                auto copy = *cls;
                copy.methods = std::move(methods);
                classes.push_back(make_rc<model::Class>(std::move(copy)));
                module_changed = true;
            } else {
                classes.push_back(cls);
            }
        }

        if (module_changed) {
            modules.push_back(make_rc<model::Module>(
                model::Module{.name = module->name,
                              .file_path = module->file_path,
                              .functions = std::move(functions),
                              .classes = std::move(classes)}));
            changed = true;
        } else {
            modules.push_back(module);
        }
    }

    return changed ? with_modules(*repository, std::move(modules)) : repository;
}

} // namespace

auto scope_of(const FilterStage& stage) -> Scope {
    return std::visit(overloaded{
                          [](const RepositoryFilter&) { return Scope::Repository; },
                          [](const ModuleFilter&) { return Scope::Module; },
                          [](const ClassFilter&) { return Scope::Class; },
                          [](const CallableFilter&) { return Scope::Callable; },
                      },
                      stage);
}

auto scope_name(Scope scope) -> std::string_view {
    switch (scope) {
    case Scope::Repository:
        return "repository";
    case Scope::Module:
        return "module";
    case Scope::Class:
        return "class";
    case Scope::Callable:
        return "callable";
    }
    return "unknown";
}

auto RemovalCounts::operator+=(const RemovalCounts& other) -> RemovalCounts& {
    repositories += other.repositories;
    modules += other.modules;
    classes += other.classes;
    functions += other.functions;
    methods += other.methods;
    return *this;
}

auto FilterReport::total() const -> RemovalCounts {
    RemovalCounts total;
    for (const auto& step : steps) {
        total += step.removed;
    }
    return total;
}

auto apply_stage(const FilterStage& stage, const Rc<const model::Repository>& repository,
                 RemovalCounts& removed) -> Rc<const model::Repository> {
    if (!repository) {
        return nullptr;
    }
    return std::visit(
        overloaded{
            [&](const RepositoryFilter& s) { return keep_repository(s, repository, removed); },
            [&](const ModuleFilter& s) { return keep_modules(s, repository, removed); },
            [&](const ClassFilter& s) { return keep_classes(s, repository, removed); },
            [&](const CallableFilter& s) { return keep_callables(s, repository, removed); },
        },
        stage);
}

auto apply_filter(const Filter& filter, Rc<const model::Repository> repository,
                  RemovalCounts& removed) -> Rc<const model::Repository> {
    for (const auto& stage : filter.stages) {
        repository = apply_stage(stage, repository, removed);
        if (!repository) {
            break;
        }
    }
    return repository;
}

} // namespace pystruct::filter
