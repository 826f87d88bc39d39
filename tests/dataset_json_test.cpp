//! # Dataset JSON Tests
//!
//! Test Coverage:
//! - Schema keys and their order for every entity
//! - Absent types written as null
//! - Reading back a written dataset
//! - Reader defaults (missing kind, missing positions) and derived fields
//! - Schema errors reported with a JSON path
//! - Run report layout

#include "extract/extractor.hpp"
#include "json/json_parser.hpp"
#include "serialize/dataset_json.hpp"
#include "serialize/report_json.hpp"

#include <gtest/gtest.h>

using namespace pystruct;
using namespace pystruct::serialize;

namespace {

auto keys_of(const json::JsonValue& value) -> std::vector<std::string> {
    std::vector<std::string> keys;
    for (const auto& [key, member] : value.as_object()) {
        keys.push_back(key);
    }
    return keys;
}

} // namespace

class DatasetJsonTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto source = lexer::Source::from_string(CODE, "pkg/client.py");
        auto module = extract::extract_module(source, "pkg/client.py");
        ASSERT_TRUE(is_ok(module)) << unwrap_err(module).to_string();

        auto repository = make_rc<model::Repository>();
        repository->identity = model::RepositoryIdentity{.name = "pkg",
                                                         .url = "https://example.com/pkg",
                                                         .pypi_tag = "1.2.0",
                                                         .git_commit_hash = "0123abcd"};
        repository->modules.push_back(make_rc<model::Module>(std::move(unwrap(module))));
        dataset_ = {repository};
    }

    auto read_error(std::string_view text) -> DatasetError {
        auto result = read_dataset(text);
        if (is_ok(result)) {
            ADD_FAILURE() << "Expected dataset to be rejected";
            return DatasetError{};
        }
        return unwrap_err(result);
    }

    static constexpr const char* CODE = "def connect(host, port: int = 80) -> 'Client':\n"
                                        "    return Client(host, port)\n"
                                        "\n"
                                        "class Client(Base):\n"
                                        "    timeout: float = 1.0\n"
                                        "\n"
                                        "    def __init__(self, host: str, *args, **kw):\n"
                                        "        self.host = host\n";

    model::Dataset dataset_;
};

// ============================================================================
// Writing
// ============================================================================

TEST_F(DatasetJsonTest, RepositoryKeys) {
    auto value = to_json(dataset_);
    ASSERT_TRUE(value.is_array());
    ASSERT_EQ(value.size(), 1u);

    std::vector<std::string> repository = {"name", "url", "pypi_tag", "git_commit_hash", "modules"};
    EXPECT_EQ(keys_of(value[0]), repository);

    const auto& module = (*value[0].get("modules"))[0];
    std::vector<std::string> module_keys = {"name", "file_path", "functions", "classes"};
    EXPECT_EQ(keys_of(module), module_keys);
    EXPECT_EQ(module.get("name")->as_string(), "client");
}

TEST_F(DatasetJsonTest, FunctionKeys) {
    auto value = to_json(*dataset_[0]->modules[0]->functions[0]);
    std::vector<std::string> keys = {"identifier", "parameters",     "annotations", "return",
                                     "body",       "signature",      "full_signature", "file",
                                     "line_number", "col_offset"};
    EXPECT_EQ(keys_of(value), keys);
    EXPECT_EQ(value.get("return")->as_string(), "'Client'");
    EXPECT_EQ(value.get("file")->as_string(), "pkg/client.py");
    EXPECT_EQ(value.get("line_number")->try_as_i64(), 1);
    EXPECT_EQ(value.get("col_offset")->try_as_i64(), 5);

    const auto& host = (*value.get("parameters"))[0];
    std::vector<std::string> param_keys = {"identifier", "type", "line_number", "col_offset",
                                           "kind"};
    EXPECT_EQ(keys_of(host), param_keys);
    EXPECT_TRUE(host.get("type")->is_null());
    EXPECT_EQ(host.get("kind")->as_string(), "regular");
}

TEST_F(DatasetJsonTest, ClassAndMethodKeys) {
    const auto& cls = *dataset_[0]->modules[0]->classes[0];
    auto value = to_json(cls);
    std::vector<std::string> keys = {"identifier", "methods", "superclasses", "fields", "file"};
    EXPECT_EQ(keys_of(value), keys);
    EXPECT_EQ(value.get("superclasses")->to_string(), R"(["Base"])");
    EXPECT_EQ(value.get("fields")->to_string(), R"([{"name":"timeout","type":"float"}])");

    const auto& init = (*value.get("methods"))[0];
    std::vector<std::string> method_keys = {
        "identifier", "parameters", "annotations",    "return",      "body",
        "signature",  "full_signature", "constructor", "line_number", "col_offset"};
    EXPECT_EQ(keys_of(init), method_keys);
    EXPECT_TRUE(init.get("constructor")->as_bool());
    EXPECT_TRUE(init.get("return")->is_null());
    EXPECT_EQ((*init.get("parameters"))[2].get("kind")->as_string(), "var_args");
    EXPECT_EQ((*init.get("parameters"))[3].get("kind")->as_string(), "var_keywords");
}

TEST_F(DatasetJsonTest, EmptyDataset) {
    EXPECT_EQ(write_dataset({}), "[]");
}

// ============================================================================
// Reading
// ============================================================================

TEST_F(DatasetJsonTest, ReadsWrittenDataset) {
    auto text = write_dataset(dataset_);
    auto result = read_dataset(text);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    EXPECT_TRUE(model::datasets_equal(unwrap(result), dataset_));
    EXPECT_EQ(write_dataset(unwrap(result)), text);
}

TEST_F(DatasetJsonTest, SingleRepositoryObjectIsAccepted) {
    auto result = read_dataset(to_json(*dataset_[0]).to_string());
    ASSERT_TRUE(is_ok(result));
    ASSERT_EQ(unwrap(result).size(), 1u);
    EXPECT_EQ(unwrap(result)[0]->identity.name, "pkg");
}

TEST_F(DatasetJsonTest, ReaderDefaultsAndDerivedFields) {
    auto result = read_dataset(R"([{
        "name": "r", "url": "u", "pypi_tag": "", "git_commit_hash": "",
        "modules": [{
            "name": "m", "file_path": "m.py", "functions": [],
            "classes": [{
                "identifier": "C", "superclasses": [], "file": "m.py",
                "methods": [{
                    "identifier": "__init__",
                    "parameters": [{"identifier": "self", "type": null}],
                    "annotations": "", "return": null, "body": "pass",
                    "signature": "stale", "full_signature": "stale", "constructor": false
                }]
            }]
        }]
    }])");
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();

    const auto& cls = *unwrap(result)[0]->modules[0]->classes[0];
    EXPECT_TRUE(cls.fields.empty());
    const auto& init = *cls.methods[0];
    EXPECT_TRUE(init.is_constructor);
    EXPECT_EQ(init.callable.signature, "__init__(self)");
    EXPECT_EQ(init.callable.line_number, 0u);
    EXPECT_EQ(init.callable.parameters[0].kind, model::ParameterKind::Regular);
    EXPECT_EQ(init.callable.parameters[0].col_offset, 0u);
}

TEST_F(DatasetJsonTest, RejectsNonDatasetRoot) {
    auto error = read_error("42");
    EXPECT_EQ(error.to_string(), "$: expected an array of repositories");

    auto bad_json = read_error("[{");
    EXPECT_EQ(bad_json.path, "$");
    EXPECT_NE(bad_json.message.find("line 1"), std::string::npos);
}

TEST_F(DatasetJsonTest, ErrorsCarryJsonPath) {
    EXPECT_EQ(read_error(R"([{"name": "r"}])").to_string(), "$[0]: missing key 'url'");
    EXPECT_EQ(read_error(R"([{"name": "r", "url": 1}])").to_string(),
              "$[0].url: expected a string");
    EXPECT_EQ(read_error("[[]]").to_string(), "$[0]: expected an object");

    auto text = write_dataset(dataset_);
    auto value = json::parse_json(text);
    ASSERT_TRUE(is_ok(value));
    auto& root = unwrap(value);

    auto& function = root.as_array_mut()[0]
                         .as_object_mut()[4]
                         .second.as_array_mut()[0]
                         .as_object_mut()[2]
                         .second.as_array_mut()[0];
    function.as_object_mut()[1].second.as_array_mut()[0].set("kind", json::JsonValue("star"));

    auto result = dataset_from_json(root);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).to_string(),
              "$[0].modules[0].functions[0].parameters[0].kind: unknown parameter kind");
}

TEST_F(DatasetJsonTest, NegativePositionIsRejected) {
    auto error = read_error(R"([{
        "name": "r", "url": "u", "pypi_tag": "", "git_commit_hash": "",
        "modules": [{"name": "m", "file_path": "m.py", "classes": [], "functions": [{
            "identifier": "f", "parameters": [], "annotations": "", "return": null,
            "body": "", "file": "m.py", "line_number": -1
        }]}]
    }])");
    EXPECT_EQ(error.to_string(),
              "$[0].modules[0].functions[0].line_number: expected a non-negative integer");
}

// ============================================================================
// Run Report
// ============================================================================

TEST(ReportJsonTest, Layout) {
    extract::ExtractionReport extraction;
    extraction.files_discovered = 3;
    extraction.modules_extracted = 2;
    extraction.elapsed_ms = 17;
    extraction.failures.push_back(extract::ExtractionFailure{.kind = extract::FailureKind::Syntax,
                                                             .file = "pkg/bad.py",
                                                             .message = "invalid syntax",
                                                             .line = 3,
                                                             .column = 7});

    filter::FilterReport filters;
    filters.steps.push_back(
        filter::FilterStep{.filter = "EmptyFilter", .removed = {.modules = 1, .classes = 2}});

    auto value = report_to_json(extraction, filters);
    std::vector<std::string> keys = {"files_discovered", "modules_extracted", "elapsed_ms",
                                     "failures", "filters"};
    EXPECT_EQ(keys_of(value), keys);
    EXPECT_EQ(value.get("failures")->to_string(),
              R"([{"file":"pkg/bad.py","kind":"syntax","message":"invalid syntax",)"
              R"("line":3,"column":7}])");
    EXPECT_EQ(value.get("filters")->to_string(),
              R"([{"filter":"EmptyFilter","removed":{"repositories":0,"modules":1,)"
              R"("classes":2,"functions":0,"methods":0}}])");
}

TEST(ReportJsonTest, EntityCounts) {
    model::EntityCounts counts;
    counts.repositories = 1;
    counts.typed_callables = 4;
    auto value = to_json(counts);
    EXPECT_EQ(value.get("typed_callables")->try_as_i64(), 4);
    EXPECT_EQ(value.size(), 8u);
}
