#include "serialize/dataset_json.hpp"

#include "json/json_parser.hpp"
#include "model/signature.hpp"

#include <limits>
#include <utility>

namespace pystruct::serialize {

using json::JsonArray;
using json::JsonObject;
using json::JsonValue;

// ============================================================================
// Writing
// ============================================================================

namespace {

auto string_array(const std::vector<std::string>& items) -> JsonValue {
    JsonArray arr;
    arr.reserve(items.size());
    for (const auto& item : items) {
        arr.emplace_back(item);
    }
    return JsonValue(std::move(arr));
}

auto parameters_json(const std::vector<model::Parameter>& parameters) -> JsonValue {
    JsonArray arr;
    arr.reserve(parameters.size());
    for (const auto& param : parameters) {
        arr.push_back(to_json(param));
    }
    return JsonValue(std::move(arr));
}

} // namespace

auto to_json(const model::Parameter& parameter) -> JsonValue {
    JsonObject obj;
    obj.emplace_back("identifier", JsonValue(parameter.name));
    obj.emplace_back("type", JsonValue::optional_string(parameter.type));
    obj.emplace_back("line_number", json::json_int(parameter.line_number));
    obj.emplace_back("col_offset", json::json_int(parameter.col_offset));
    obj.emplace_back("kind", JsonValue(model::parameter_kind_name(parameter.kind)));
    return JsonValue(std::move(obj));
}

auto to_json(const model::Function& function) -> JsonValue {
    const auto& c = function.callable;
    JsonObject obj;
    obj.emplace_back("identifier", JsonValue(c.name));
    obj.emplace_back("parameters", parameters_json(c.parameters));
    obj.emplace_back("annotations", JsonValue(c.annotations));
    obj.emplace_back("return", JsonValue::optional_string(c.return_type));
    obj.emplace_back("body", JsonValue(c.body));
    obj.emplace_back("signature", JsonValue(c.signature));
    obj.emplace_back("full_signature", JsonValue(c.full_signature));
    obj.emplace_back("file", JsonValue(function.file));
    obj.emplace_back("line_number", json::json_int(c.line_number));
    obj.emplace_back("col_offset", json::json_int(c.col_offset));
    return JsonValue(std::move(obj));
}

auto to_json(const model::Method& method) -> JsonValue {
    const auto& c = method.callable;
    JsonObject obj;
    obj.emplace_back("identifier", JsonValue(c.name));
    obj.emplace_back("parameters", parameters_json(c.parameters));
    obj.emplace_back("annotations", JsonValue(c.annotations));
    obj.emplace_back("return", JsonValue::optional_string(c.return_type));
    obj.emplace_back("body", JsonValue(c.body));
    obj.emplace_back("signature", JsonValue(c.signature));
    obj.emplace_back("full_signature", JsonValue(c.full_signature));
    obj.emplace_back("constructor", JsonValue(method.is_constructor));
    obj.emplace_back("line_number", json::json_int(c.line_number));
    obj.emplace_back("col_offset", json::json_int(c.col_offset));
    return JsonValue(std::move(obj));
}

auto to_json(const model::Class& cls) -> JsonValue {
    JsonArray methods;
    for (const auto& method : cls.methods) {
        methods.push_back(to_json(*method));
    }

    JsonArray fields;
    for (const auto& field : cls.fields) {
        JsonObject f;
        f.emplace_back("name", JsonValue(field.name));
        f.emplace_back("type", JsonValue::optional_string(field.type));
        fields.emplace_back(std::move(f));
    }

    JsonObject obj;
    obj.emplace_back("identifier", JsonValue(cls.name));
    obj.emplace_back("methods", JsonValue(std::move(methods)));
    obj.emplace_back("superclasses", string_array(cls.superclasses));
    obj.emplace_back("fields", JsonValue(std::move(fields)));
    obj.emplace_back("file", JsonValue(cls.file));
    return JsonValue(std::move(obj));
}

auto to_json(const model::Module& module) -> JsonValue {
    JsonArray functions;
    for (const auto& function : module.functions) {
        functions.push_back(to_json(*function));
    }
    JsonArray classes;
    for (const auto& cls : module.classes) {
        classes.push_back(to_json(*cls));
    }

    JsonObject obj;
    obj.emplace_back("name", JsonValue(module.name));
    obj.emplace_back("file_path", JsonValue(module.file_path));
    obj.emplace_back("functions", JsonValue(std::move(functions)));
    obj.emplace_back("classes", JsonValue(std::move(classes)));
    return JsonValue(std::move(obj));
}

auto to_json(const model::Repository& repository) -> JsonValue {
    JsonArray modules;
    for (const auto& module : repository.modules) {
        modules.push_back(to_json(*module));
    }

    const auto& id = repository.identity;
    JsonObject obj;
    obj.emplace_back("name", JsonValue(id.name));
    obj.emplace_back("url", JsonValue(id.url));
    obj.emplace_back("pypi_tag", JsonValue(id.pypi_tag));
    obj.emplace_back("git_commit_hash", JsonValue(id.git_commit_hash));
    obj.emplace_back("modules", JsonValue(std::move(modules)));
    return JsonValue(std::move(obj));
}

auto to_json(const model::Dataset& dataset) -> JsonValue {
    JsonArray arr;
    arr.reserve(dataset.size());
    for (const auto& repository : dataset) {
        arr.push_back(to_json(*repository));
    }
    return JsonValue(std::move(arr));
}

auto write_dataset(const model::Dataset& dataset) -> std::string {
    return to_json(dataset).to_string_pretty(2);
}

// ============================================================================
// Reading
// ============================================================================

namespace {

auto member_path(const std::string& path, std::string_view key) -> std::string {
    return path + "." + std::string(key);
}

auto element_path(const std::string& path, size_t index) -> std::string {
    return path + "[" + std::to_string(index) + "]";
}

auto expect_object(const JsonValue& value, const std::string& path)
    -> Result<bool, DatasetError> {
    if (!value.is_object()) {
        return DatasetError{"expected an object", path};
    }
    return true;
}

auto required(const JsonValue& obj, std::string_view key, const std::string& path)
    -> Result<const JsonValue*, DatasetError> {
    const JsonValue* value = obj.get(key);
    if (value == nullptr) {
        return DatasetError{"missing key '" + std::string(key) + "'", path};
    }
    return value;
}

auto read_string(const JsonValue& obj, std::string_view key, const std::string& path)
    -> Result<std::string, DatasetError> {
    auto value = required(obj, key, path);
    if (is_err(value)) {
        return unwrap_err(value);
    }
    if (!unwrap(value)->is_string()) {
        return DatasetError{"expected a string", member_path(path, key)};
    }
    return unwrap(value)->as_string();
}

/// A missing key and `null` both read as absent.
auto read_optional_string(const JsonValue& obj, std::string_view key, const std::string& path)
    -> Result<std::optional<std::string>, DatasetError> {
    const JsonValue* value = obj.get(key);
    if (value == nullptr || value->is_null()) {
        return std::optional<std::string>{};
    }
    if (!value->is_string()) {
        return DatasetError{"expected a string or null", member_path(path, key)};
    }
    return std::optional<std::string>{value->as_string()};
}

auto read_position(const JsonValue& obj, std::string_view key, const std::string& path)
    -> Result<uint32_t, DatasetError> {
    const JsonValue* value = obj.get(key);
    if (value == nullptr || value->is_null()) {
        return uint32_t{0};
    }
    auto number = value->try_as_i64();
    if (!number || *number < 0 || *number > std::numeric_limits<uint32_t>::max()) {
        return DatasetError{"expected a non-negative integer", member_path(path, key)};
    }
    return static_cast<uint32_t>(*number);
}

auto read_array(const JsonValue& obj, std::string_view key, const std::string& path)
    -> Result<const JsonArray*, DatasetError> {
    auto value = required(obj, key, path);
    if (is_err(value)) {
        return unwrap_err(value);
    }
    if (!unwrap(value)->is_array()) {
        return DatasetError{"expected an array", member_path(path, key)};
    }
    return &unwrap(value)->as_array();
}

auto read_parameter(const JsonValue& value, const std::string& path)
    -> Result<model::Parameter, DatasetError> {
    if (auto ok = expect_object(value, path); is_err(ok)) {
        return unwrap_err(ok);
    }

    auto name = read_string(value, "identifier", path);
    if (is_err(name)) {
        return unwrap_err(name);
    }
    auto type = read_optional_string(value, "type", path);
    if (is_err(type)) {
        return unwrap_err(type);
    }
    auto line = read_position(value, "line_number", path);
    if (is_err(line)) {
        return unwrap_err(line);
    }
    auto column = read_position(value, "col_offset", path);
    if (is_err(column)) {
        return unwrap_err(column);
    }

    auto kind = model::ParameterKind::Regular;
    if (const JsonValue* k = value.get("kind"); k != nullptr && !k->is_null()) {
        std::optional<model::ParameterKind> parsed;
        if (k->is_string()) {
            parsed = model::parse_parameter_kind(k->as_string());
        }
        if (!parsed) {
            return DatasetError{"unknown parameter kind", member_path(path, "kind")};
        }
        kind = *parsed;
    }

    return model::Parameter{.name = std::move(unwrap(name)),
                            .type = std::move(unwrap(type)),
                            .line_number = unwrap(line),
                            .col_offset = unwrap(column),
                            .kind = kind};
}

auto read_callable_parts(const JsonValue& value, const std::string& path)
    -> Result<model::CallableParts, DatasetError> {
    if (auto ok = expect_object(value, path); is_err(ok)) {
        return unwrap_err(ok);
    }

    model::CallableParts parts;

    auto name = read_string(value, "identifier", path);
    if (is_err(name)) {
        return unwrap_err(name);
    }
    parts.name = std::move(unwrap(name));

    auto params = read_array(value, "parameters", path);
    if (is_err(params)) {
        return unwrap_err(params);
    }
    const auto& param_values = *unwrap(params);
    for (size_t i = 0; i < param_values.size(); ++i) {
        auto param =
            read_parameter(param_values[i], element_path(member_path(path, "parameters"), i));
        if (is_err(param)) {
            return unwrap_err(param);
        }
        parts.parameters.push_back(std::move(unwrap(param)));
    }

    auto annotations = read_string(value, "annotations", path);
    if (is_err(annotations)) {
        return unwrap_err(annotations);
    }
    parts.annotations = std::move(unwrap(annotations));

    auto returns = read_optional_string(value, "return", path);
    if (is_err(returns)) {
        return unwrap_err(returns);
    }
    parts.return_type = std::move(unwrap(returns));

    auto body = read_string(value, "body", path);
    if (is_err(body)) {
        return unwrap_err(body);
    }
    parts.body = std::move(unwrap(body));

    auto line = read_position(value, "line_number", path);
    if (is_err(line)) {
        return unwrap_err(line);
    }
    parts.line_number = unwrap(line);

    auto column = read_position(value, "col_offset", path);
    if (is_err(column)) {
        return unwrap_err(column);
    }
    parts.col_offset = unwrap(column);

    return parts;
}

auto read_function(const JsonValue& value, const std::string& path)
    -> Result<Rc<const model::Function>, DatasetError> {
    auto parts = read_callable_parts(value, path);
    if (is_err(parts)) {
        return unwrap_err(parts);
    }
    auto file = read_string(value, "file", path);
    if (is_err(file)) {
        return unwrap_err(file);
    }
    return Rc<const model::Function>(make_rc<model::Function>(
        model::make_function(std::move(unwrap(parts)), std::move(unwrap(file)))));
}

auto read_class(const JsonValue& value, const std::string& path)
    -> Result<Rc<const model::Class>, DatasetError> {
    if (auto ok = expect_object(value, path); is_err(ok)) {
        return unwrap_err(ok);
    }

    model::Class cls;

    auto name = read_string(value, "identifier", path);
    if (is_err(name)) {
        return unwrap_err(name);
    }
    cls.name = std::move(unwrap(name));

    auto methods = read_array(value, "methods", path);
    if (is_err(methods)) {
        return unwrap_err(methods);
    }
    const auto& method_values = *unwrap(methods);
    for (size_t i = 0; i < method_values.size(); ++i) {
        // The constructor flag is derived from the name, not read.
        auto parts =
            read_callable_parts(method_values[i], element_path(member_path(path, "methods"), i));
        if (is_err(parts)) {
            return unwrap_err(parts);
        }
        cls.methods.push_back(make_rc<model::Method>(model::make_method(std::move(unwrap(parts)))));
    }

    auto supers = read_array(value, "superclasses", path);
    if (is_err(supers)) {
        return unwrap_err(supers);
    }
    const auto& super_values = *unwrap(supers);
    for (size_t i = 0; i < super_values.size(); ++i) {
        if (!super_values[i].is_string()) {
            return DatasetError{"expected a string",
                                element_path(member_path(path, "superclasses"), i)};
        }
        cls.superclasses.push_back(super_values[i].as_string());
    }

    if (value.get("fields") != nullptr) {
        auto fields = read_array(value, "fields", path);
        if (is_err(fields)) {
            return unwrap_err(fields);
        }
        const auto& field_values = *unwrap(fields);
        for (size_t i = 0; i < field_values.size(); ++i) {
            auto field_path = element_path(member_path(path, "fields"), i);
            if (auto ok = expect_object(field_values[i], field_path); is_err(ok)) {
                return unwrap_err(ok);
            }
            auto field_name = read_string(field_values[i], "name", field_path);
            if (is_err(field_name)) {
                return unwrap_err(field_name);
            }
            auto field_type = read_optional_string(field_values[i], "type", field_path);
            if (is_err(field_type)) {
                return unwrap_err(field_type);
            }
            cls.fields.push_back(model::Field{.name = std::move(unwrap(field_name)),
                                              .type = std::move(unwrap(field_type))});
        }
    }

    auto file = read_string(value, "file", path);
    if (is_err(file)) {
        return unwrap_err(file);
    }
    cls.file = std::move(unwrap(file));

    return Rc<const model::Class>(make_rc<model::Class>(std::move(cls)));
}

auto read_module(const JsonValue& value, const std::string& path)
    -> Result<Rc<const model::Module>, DatasetError> {
    if (auto ok = expect_object(value, path); is_err(ok)) {
        return unwrap_err(ok);
    }

    model::Module module;

    auto name = read_string(value, "name", path);
    if (is_err(name)) {
        return unwrap_err(name);
    }
    module.name = std::move(unwrap(name));

    auto file_path = read_string(value, "file_path", path);
    if (is_err(file_path)) {
        return unwrap_err(file_path);
    }
    module.file_path = std::move(unwrap(file_path));

    auto functions = read_array(value, "functions", path);
    if (is_err(functions)) {
        return unwrap_err(functions);
    }
    const auto& function_values = *unwrap(functions);
    for (size_t i = 0; i < function_values.size(); ++i) {
        auto function =
            read_function(function_values[i], element_path(member_path(path, "functions"), i));
        if (is_err(function)) {
            return unwrap_err(function);
        }
        module.functions.push_back(std::move(unwrap(function)));
    }

    auto classes = read_array(value, "classes", path);
    if (is_err(classes)) {
        return unwrap_err(classes);
    }
    const auto& class_values = *unwrap(classes);
    for (size_t i = 0; i < class_values.size(); ++i) {
        auto cls = read_class(class_values[i], element_path(member_path(path, "classes"), i));
        if (is_err(cls)) {
            return unwrap_err(cls);
        }
        module.classes.push_back(std::move(unwrap(cls)));
    }

    return Rc<const model::Module>(make_rc<model::Module>(std::move(module)));
}

auto read_repository(const JsonValue& value, const std::string& path)
    -> Result<Rc<const model::Repository>, DatasetError> {
    if (auto ok = expect_object(value, path); is_err(ok)) {
        return unwrap_err(ok);
    }

    model::Repository repository;
    auto& id = repository.identity;

    const std::pair<std::string_view, std::string*> identity_keys[] = {
        {"name", &id.name},
        {"url", &id.url},
        {"pypi_tag", &id.pypi_tag},
        {"git_commit_hash", &id.git_commit_hash},
    };
    for (const auto& [key, target] : identity_keys) {
        auto field = read_string(value, key, path);
        if (is_err(field)) {
            return unwrap_err(field);
        }
        *target = std::move(unwrap(field));
    }

    auto modules = read_array(value, "modules", path);
    if (is_err(modules)) {
        return unwrap_err(modules);
    }
    const auto& module_values = *unwrap(modules);
    for (size_t i = 0; i < module_values.size(); ++i) {
        auto module = read_module(module_values[i], element_path(member_path(path, "modules"), i));
        if (is_err(module)) {
            return unwrap_err(module);
        }
        repository.modules.push_back(std::move(unwrap(module)));
    }

    return Rc<const model::Repository>(make_rc<model::Repository>(std::move(repository)));
}

} // namespace

auto repository_from_json(const JsonValue& value)
    -> Result<Rc<const model::Repository>, DatasetError> {
    return read_repository(value, "$");
}

auto dataset_from_json(const JsonValue& value) -> Result<model::Dataset, DatasetError> {
    if (value.is_object()) {
        auto repository = read_repository(value, "$");
        if (is_err(repository)) {
            return unwrap_err(repository);
        }
        return model::Dataset{std::move(unwrap(repository))};
    }
    if (!value.is_array()) {
        return DatasetError{"expected an array of repositories", "$"};
    }

    model::Dataset dataset;
    const auto& items = value.as_array();
    dataset.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        auto repository = read_repository(items[i], element_path("$", i));
        if (is_err(repository)) {
            return unwrap_err(repository);
        }
        dataset.push_back(std::move(unwrap(repository)));
    }
    return dataset;
}

auto read_dataset(std::string_view text) -> Result<model::Dataset, DatasetError> {
    auto parsed = json::parse_json(text);
    if (is_err(parsed)) {
        return DatasetError{unwrap_err(parsed).to_string(), "$"};
    }
    return dataset_from_json(unwrap(parsed));
}

} // namespace pystruct::serialize
