#include "serialize/report_json.hpp"

namespace pystruct::serialize {

using json::JsonArray;
using json::JsonObject;
using json::JsonValue;

auto to_json(const extract::ExtractionFailure& failure) -> JsonValue {
    JsonObject obj;
    obj.emplace_back("file", JsonValue(failure.file));
    obj.emplace_back("kind", JsonValue(extract::failure_kind_name(failure.kind)));
    obj.emplace_back("message", JsonValue(failure.message));
    obj.emplace_back("line", json::json_int(failure.line));
    obj.emplace_back("column", json::json_int(failure.column));
    return JsonValue(std::move(obj));
}

auto to_json(const filter::RemovalCounts& counts) -> JsonValue {
    JsonObject obj;
    obj.emplace_back("repositories", json::json_int(static_cast<int64_t>(counts.repositories)));
    obj.emplace_back("modules", json::json_int(static_cast<int64_t>(counts.modules)));
    obj.emplace_back("classes", json::json_int(static_cast<int64_t>(counts.classes)));
    obj.emplace_back("functions", json::json_int(static_cast<int64_t>(counts.functions)));
    obj.emplace_back("methods", json::json_int(static_cast<int64_t>(counts.methods)));
    return JsonValue(std::move(obj));
}

auto to_json(const filter::FilterReport& report) -> JsonValue {
    JsonArray steps;
    for (const auto& step : report.steps) {
        JsonObject obj;
        obj.emplace_back("filter", JsonValue(step.filter));
        obj.emplace_back("removed", to_json(step.removed));
        steps.emplace_back(std::move(obj));
    }
    return JsonValue(std::move(steps));
}

auto to_json(const model::EntityCounts& counts) -> JsonValue {
    auto count = [](size_t n) { return json::json_int(static_cast<int64_t>(n)); };

    JsonObject obj;
    obj.emplace_back("repositories", count(counts.repositories));
    obj.emplace_back("modules", count(counts.modules));
    obj.emplace_back("classes", count(counts.classes));
    obj.emplace_back("functions", count(counts.functions));
    obj.emplace_back("methods", count(counts.methods));
    obj.emplace_back("parameters", count(counts.parameters));
    obj.emplace_back("typed_parameters", count(counts.typed_parameters));
    obj.emplace_back("typed_callables", count(counts.typed_callables));
    return JsonValue(std::move(obj));
}

auto report_to_json(const extract::ExtractionReport& extraction,
                    const filter::FilterReport& filters) -> JsonValue {
    JsonArray failures;
    for (const auto& failure : extraction.failures) {
        failures.push_back(to_json(failure));
    }

    JsonObject obj;
    obj.emplace_back("files_discovered",
                     json::json_int(static_cast<int64_t>(extraction.files_discovered)));
    obj.emplace_back("modules_extracted",
                     json::json_int(static_cast<int64_t>(extraction.modules_extracted)));
    obj.emplace_back("elapsed_ms", json::json_int(extraction.elapsed_ms));
    obj.emplace_back("failures", JsonValue(std::move(failures)));
    obj.emplace_back("filters", to_json(filters));
    return JsonValue(std::move(obj));
}

} // namespace pystruct::serialize
