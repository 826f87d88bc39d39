#include "model/entities.hpp"

#include <algorithm>

namespace pystruct::model {

namespace {

template <typename T>
auto deep_equal(const std::vector<Rc<const T>>& a, const std::vector<Rc<const T>>& b) -> bool {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](const Rc<const T>& x, const Rc<const T>& y) {
                          if (x == y) {
                              return true;
                          }
                          return x && y && *x == *y;
                      });
}

} // namespace

auto parameter_kind_name(ParameterKind kind) -> std::string_view {
    switch (kind) {
    case ParameterKind::PositionalOnly:
        return "positional_only";
    case ParameterKind::Regular:
        return "regular";
    case ParameterKind::VarArgs:
        return "var_args";
    case ParameterKind::KeywordOnly:
        return "keyword_only";
    case ParameterKind::VarKeywords:
        return "var_keywords";
    }
    return "regular";
}

auto parse_parameter_kind(std::string_view name) -> std::optional<ParameterKind> {
    for (auto kind : {ParameterKind::PositionalOnly, ParameterKind::Regular,
                      ParameterKind::VarArgs, ParameterKind::KeywordOnly,
                      ParameterKind::VarKeywords}) {
        if (parameter_kind_name(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

auto Callable::has_type_annotation() const -> bool {
    if (return_type) {
        return true;
    }
    return std::any_of(parameters.begin(), parameters.end(),
                       [](const Parameter& p) { return p.type.has_value(); });
}

auto operator==(const Class& a, const Class& b) -> bool {
    return a.name == b.name && a.superclasses == b.superclasses && a.fields == b.fields &&
           a.file == b.file && deep_equal(a.methods, b.methods);
}

auto operator==(const Module& a, const Module& b) -> bool {
    return a.name == b.name && a.file_path == b.file_path &&
           deep_equal(a.functions, b.functions) && deep_equal(a.classes, b.classes);
}

auto operator==(const Repository& a, const Repository& b) -> bool {
    return a.identity == b.identity && deep_equal(a.modules, b.modules);
}

auto datasets_equal(const Dataset& a, const Dataset& b) -> bool {
    return deep_equal(a, b);
}

} // namespace pystruct::model
