#include "filter/registry.hpp"

#include "filter/builtin_filters.hpp"

#include <algorithm>
#include <cctype>

namespace pystruct::filter {

namespace {

auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

auto FilterRegistry::builtin() -> FilterRegistry {
    FilterRegistry registry;
    for (auto& filter : {private_module_filter(), test_module_filter(), non_core_module_filter(),
                         no_string_type_filter(), string_type_filter(), empty_filter()}) {
        registry.filters_.push_back(make_rc<Filter>(filter));
    }
    return registry;
}

auto FilterRegistry::add(Filter filter) -> Result<bool, ConfigurationError> {
    if (filter.name.empty()) {
        return ConfigurationError{"filter name must not be empty"};
    }
    if (find(filter.name) != nullptr) {
        return ConfigurationError{"filter '" + filter.name + "' is already registered"};
    }
    filters_.push_back(make_rc<Filter>(std::move(filter)));
    return true;
}

auto FilterRegistry::find(std::string_view name) const -> const Filter* {
    for (const auto& filter : filters_) {
        if (equals_ignore_case(filter->name, name)) {
            return filter.get();
        }
    }
    return nullptr;
}

auto FilterRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(filters_.size());
    for (const auto& filter : filters_) {
        out.push_back(filter->name);
    }
    return out;
}

auto split_filter_names(std::string_view chain)
    -> Result<std::vector<std::string>, ConfigurationError> {
    std::vector<std::string> names;
    if (trim(chain).empty()) {
        return names;
    }

    size_t start = 0;
    while (true) {
        size_t comma = chain.find(',', start);
        auto entry = trim(chain.substr(start, comma == std::string_view::npos
                                                  ? std::string_view::npos
                                                  : comma - start));
        if (entry.empty()) {
            return ConfigurationError{"empty filter name in chain '" + std::string(chain) + "'"};
        }
        names.emplace_back(entry);
        if (comma == std::string_view::npos) {
            break;
        }
        start = comma + 1;
    }
    return names;
}

} // namespace pystruct::filter
