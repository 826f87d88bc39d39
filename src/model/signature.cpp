#include "model/signature.hpp"

namespace pystruct::model {

namespace {

constexpr std::string_view CONSTRUCTOR_NAME = "__init__";

} // namespace

auto render_signature(std::string_view name, const std::vector<Parameter>& parameters,
                      const std::optional<std::string>& return_type) -> std::string {
    std::string out(name);
    out += '(';
    for (size_t i = 0; i < parameters.size(); ++i) {
        const auto& param = parameters[i];
        if (i > 0) {
            out += ", ";
        }
        if (param.kind == ParameterKind::VarArgs) {
            out += '*';
        } else if (param.kind == ParameterKind::VarKeywords) {
            out += "**";
        }
        out += param.name;
        if (param.type) {
            out += ": ";
            out += *param.type;
        }
    }
    out += ')';
    if (return_type) {
        out += " -> ";
        out += *return_type;
    }
    return out;
}

auto render_full_signature(std::string_view annotations, std::string_view signature)
    -> std::string {
    if (annotations.empty()) {
        return std::string(signature);
    }
    std::string out(annotations);
    out += '\n';
    out += signature;
    return out;
}

auto make_callable(CallableParts parts) -> Callable {
    Callable callable{
        .name = std::move(parts.name),
        .parameters = std::move(parts.parameters),
        .annotations = std::move(parts.annotations),
        .return_type = std::move(parts.return_type),
        .body = std::move(parts.body),
        .signature = {},
        .full_signature = {},
        .line_number = parts.line_number,
        .col_offset = parts.col_offset,
    };
    callable.signature =
        render_signature(callable.name, callable.parameters, callable.return_type);
    callable.full_signature = render_full_signature(callable.annotations, callable.signature);
    return callable;
}

auto make_function(CallableParts parts, std::string file) -> Function {
    return Function{.callable = make_callable(std::move(parts)), .file = std::move(file)};
}

auto make_method(CallableParts parts) -> Method {
    bool is_constructor = parts.name == CONSTRUCTOR_NAME;
    return Method{.callable = make_callable(std::move(parts)), .is_constructor = is_constructor};
}

} // namespace pystruct::model
