#include "extract/extractor.hpp"

#include "log/log.hpp"
#include "model/signature.hpp"
#include "parser/parser.hpp"

#include <filesystem>

namespace pystruct::extract {

namespace {

auto to_parameter_kind(parser::ParamKind kind) -> model::ParameterKind {
    switch (kind) {
    case parser::ParamKind::PositionalOnly:
        return model::ParameterKind::PositionalOnly;
    case parser::ParamKind::Regular:
        return model::ParameterKind::Regular;
    case parser::ParamKind::VarArgs:
        return model::ParameterKind::VarArgs;
    case parser::ParamKind::KeywordOnly:
        return model::ParameterKind::KeywordOnly;
    case parser::ParamKind::VarKeywords:
        return model::ParameterKind::VarKeywords;
    }
    return model::ParameterKind::Regular;
}

auto callable_parts(const parser::FuncDef& func) -> model::CallableParts {
    model::CallableParts parts;
    parts.name = func.name;
    parts.return_type = func.returns;
    parts.body = func.body_text;
    parts.line_number = func.name_location.line;
    parts.col_offset = func.name_location.column;

    for (const auto& param : func.params) {
        parts.parameters.push_back(model::Parameter{.name = param.name,
                                                    .type = param.annotation,
                                                    .line_number = param.location.line,
                                                    .col_offset = param.location.column,
                                                    .kind = to_parameter_kind(param.kind)});
    }

    for (size_t i = 0; i < func.decorators.size(); ++i) {
        if (i > 0) {
            parts.annotations += '\n';
        }
        parts.annotations += func.decorators[i].text;
    }
    return parts;
}

auto extract_class(const parser::ClassDef& def, const std::string& file) -> model::Class {
    model::Class cls{.name = def.name,
                     .methods = {},
                     .superclasses = def.bases,
                     .fields = {},
                     .file = file};

    for (const auto& stmt : def.body) {
        if (stmt->is<parser::FuncDef>()) {
            auto method = model::make_method(callable_parts(stmt->as<parser::FuncDef>()));
            cls.methods.push_back(make_rc<model::Method>(std::move(method)));
        } else if (stmt->is<parser::AssignStmt>()) {
            const auto& assign = stmt->as<parser::AssignStmt>();
            for (const auto& target : assign.targets) {
                cls.fields.push_back(model::Field{.name = target, .type = assign.annotation});
            }
        }
    }
    return cls;
}

} // namespace

auto module_name_for(const std::string& relative_path) -> std::string {
    return std::filesystem::path(relative_path).stem().string();
}

auto module_from_ast(const parser::Module& ast, const std::string& relative_path)
    -> model::Module {
    model::Module module{.name = module_name_for(relative_path),
                         .file_path = relative_path,
                         .functions = {},
                         .classes = {}};

    for (const auto& stmt : ast.body) {
        if (stmt->is<parser::FuncDef>()) {
            module.functions.push_back(make_rc<model::Function>(
                model::make_function(callable_parts(stmt->as<parser::FuncDef>()), relative_path)));
        } else if (stmt->is<parser::ClassDef>()) {
            module.classes.push_back(
                make_rc<model::Class>(extract_class(stmt->as<parser::ClassDef>(), relative_path)));
        }
    }
    return module;
}

auto extract_module(const lexer::Source& source, const std::string& relative_path)
    -> Result<model::Module, ExtractionFailure> {
    auto ast = parser::parse_source(source);
    if (is_err(ast)) {
        const auto& error = unwrap_err(ast);
        return ExtractionFailure{.kind = FailureKind::Syntax,
                                 .file = relative_path,
                                 .message = error.message,
                                 .line = error.span.start.line,
                                 .column = error.span.start.column};
    }

    auto module = module_from_ast(unwrap(ast), relative_path);
    PYSTRUCT_LOG_TRACE("extract", relative_path << ": " << module.functions.size()
                                                << " functions, " << module.classes.size()
                                                << " classes");
    return module;
}

} // namespace pystruct::extract
