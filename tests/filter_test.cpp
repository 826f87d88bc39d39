//! # Filter Tests
//!
//! Test Coverage:
//! - Module path predicates (private, test, core package)
//! - Each built-in filter on a small repository
//! - Copy-on-write stage application: untouched subtrees are shared,
//!   the input tree is never modified
//! - Removal accounting, including whole removed subtrees

#include "filter/builtin_filters.hpp"
#include "model/signature.hpp"
#include "model/stats.hpp"

#include <gtest/gtest.h>

using namespace pystruct;
using namespace pystruct::filter;

namespace {

auto typed(const std::string& name, const std::string& type) -> model::Parameter {
    return model::Parameter{
        .name = name, .type = type, .line_number = 1, .col_offset = 1,
        .kind = model::ParameterKind::Regular};
}

auto untyped(const std::string& name) -> model::Parameter {
    return model::Parameter{
        .name = name, .type = std::nullopt, .line_number = 1, .col_offset = 1,
        .kind = model::ParameterKind::Regular};
}

auto callable(const std::string& name, std::vector<model::Parameter> params,
              std::optional<std::string> returns = std::nullopt) -> model::CallableParts {
    return model::CallableParts{.name = name,
                                .parameters = std::move(params),
                                .annotations = {},
                                .return_type = std::move(returns),
                                .body = "pass",
                                .line_number = 1,
                                .col_offset = 5};
}

auto function(const std::string& file, model::CallableParts parts) -> Rc<const model::Function> {
    return make_rc<model::Function>(model::make_function(std::move(parts), file));
}

auto method(model::CallableParts parts) -> Rc<const model::Method> {
    return make_rc<model::Method>(model::make_method(std::move(parts)));
}

auto klass(const std::string& name, const std::string& file,
           std::vector<Rc<const model::Method>> methods) -> Rc<const model::Class> {
    return make_rc<model::Class>(model::Class{.name = name,
                                              .methods = std::move(methods),
                                              .superclasses = {},
                                              .fields = {},
                                              .file = file});
}

auto module(const std::string& path, std::vector<Rc<const model::Function>> functions,
            std::vector<Rc<const model::Class>> classes = {}) -> Rc<const model::Module> {
    auto slash = path.rfind('/');
    auto file = slash == std::string::npos ? path : path.substr(slash + 1);
    return make_rc<model::Module>(model::Module{.name = file.substr(0, file.rfind('.')),
                                                .file_path = path,
                                                .functions = std::move(functions),
                                                .classes = std::move(classes)});
}

} // namespace

// ============================================================================
// Path Predicates
// ============================================================================

TEST(ModulePathTest, PrivateModules) {
    EXPECT_TRUE(is_private_module_path("pkg/_internal.py"));
    EXPECT_TRUE(is_private_module_path("pkg/_impl/helpers.py"));
    EXPECT_TRUE(is_private_module_path("_version.py"));
    EXPECT_FALSE(is_private_module_path("pkg/__init__.py"));
    EXPECT_FALSE(is_private_module_path("pkg/__main__.py"));
    EXPECT_FALSE(is_private_module_path("pkg/public.py"));
    EXPECT_FALSE(is_private_module_path("pkg/my_module.py"));
}

TEST(ModulePathTest, TestModules) {
    EXPECT_TRUE(is_test_module_path("tests/test_foo.py"));
    EXPECT_TRUE(is_test_module_path("pkg/tests/helpers.py"));
    EXPECT_TRUE(is_test_module_path("Testing/util.py"));
    EXPECT_TRUE(is_test_module_path("pkg/test_client.py"));
    EXPECT_TRUE(is_test_module_path("pkg/client_test.py"));
    EXPECT_TRUE(is_test_module_path("conftest.py"));
    EXPECT_TRUE(is_test_module_path("pkg/test.py"));
    EXPECT_FALSE(is_test_module_path("pkg/testing_utils.py"));
    EXPECT_FALSE(is_test_module_path("pkg/contest.py"));
    EXPECT_FALSE(is_test_module_path("pkg/latest.py"));
}

TEST(ModulePathTest, PackageName) {
    EXPECT_EQ(package_name_for("Flask-SQLAlchemy"), "flask_sqlalchemy");
    EXPECT_EQ(package_name_for("zope.interface"), "zope_interface");
    EXPECT_EQ(package_name_for("requests"), "requests");
}

TEST(ModulePathTest, CoreModules) {
    EXPECT_TRUE(is_core_module_path("requests/api.py", "requests"));
    EXPECT_TRUE(is_core_module_path("src/requests/api.py", "requests"));
    EXPECT_TRUE(is_core_module_path("requests.py", "requests"));
    EXPECT_TRUE(is_core_module_path("Requests/api.py", "requests"));
    EXPECT_FALSE(is_core_module_path("setup.py", "requests"));
    EXPECT_FALSE(is_core_module_path("docs/conf.py", "requests"));
    EXPECT_FALSE(is_core_module_path("requests/vendor/six.py", "requests"));
    EXPECT_FALSE(is_core_module_path("tools/release.py", "requests"));
}

// ============================================================================
// Built-in Filters
// ============================================================================

class BuiltinFilterTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto repository = make_rc<model::Repository>();
        repository->identity = model::RepositoryIdentity{
            .name = "demo", .url = "https://example.com/demo", .pypi_tag = {},
            .git_commit_hash = {}};

        repository->modules.push_back(module(
            "demo/api.py",
            {function("demo/api.py", callable("f", {typed("x", "int")}, "int")),
             function("demo/api.py", callable("g", {untyped("x")}))},
            {klass("Client", "demo/api.py",
                   {method(callable("__init__", {untyped("self"), typed("url", "str")})),
                    method(callable("close", {untyped("self")}))}),
             klass("Marker", "demo/api.py", {})}));
        repository->modules.push_back(
            module("demo/_compat.py", {function("demo/_compat.py", callable("h", {}, "str"))}));
        repository->modules.push_back(module(
            "tests/test_api.py",
            {function("tests/test_api.py", callable("test_f", {untyped("client")}))}));
        repository->modules.push_back(module("docs/conf.py", {}));

        repository_ = repository;
    }

    auto run(const Filter& filter, RemovalCounts& removed) -> Rc<const model::Repository> {
        return apply_filter(filter, repository_, removed);
    }

    static auto paths(const model::Repository& repository) -> std::vector<std::string> {
        std::vector<std::string> out;
        for (const auto& m : repository.modules) {
            out.push_back(m->file_path);
        }
        return out;
    }

    Rc<const model::Repository> repository_;
};

TEST_F(BuiltinFilterTest, PrivateModuleFilter) {
    RemovalCounts removed;
    auto result = run(private_module_filter(), removed);
    std::vector<std::string> expected = {"demo/api.py", "tests/test_api.py", "docs/conf.py"};
    EXPECT_EQ(paths(*result), expected);
    EXPECT_EQ(removed.modules, 1u);
    EXPECT_EQ(removed.functions, 1u);
}

TEST_F(BuiltinFilterTest, TestModuleFilter) {
    RemovalCounts removed;
    auto result = run(test_module_filter(), removed);
    std::vector<std::string> expected = {"demo/api.py", "demo/_compat.py", "docs/conf.py"};
    EXPECT_EQ(paths(*result), expected);
    EXPECT_EQ(removed, (RemovalCounts{.modules = 1, .functions = 1}));
}

TEST_F(BuiltinFilterTest, NonCoreModuleFilter) {
    RemovalCounts removed;
    auto result = run(non_core_module_filter(), removed);
    std::vector<std::string> expected = {"demo/api.py", "demo/_compat.py"};
    EXPECT_EQ(paths(*result), expected);
    EXPECT_EQ(removed.modules, 2u);
}

TEST_F(BuiltinFilterTest, NoStringTypeFilterKeepsTypedCallables) {
    RemovalCounts removed;
    auto result = run(no_string_type_filter(), removed);

    const auto& api = *result->modules[0];
    ASSERT_EQ(api.functions.size(), 1u);
    EXPECT_EQ(api.functions[0]->callable.name, "f");
    ASSERT_EQ(api.classes.size(), 2u);
    ASSERT_EQ(api.classes[0]->methods.size(), 1u);
    EXPECT_EQ(api.classes[0]->methods[0]->callable.name, "__init__");
    EXPECT_TRUE(api.classes[1]->methods.empty());

    EXPECT_EQ(result->modules.size(), 4u);
    EXPECT_TRUE(result->modules[2]->functions.empty());
    EXPECT_EQ(removed, (RemovalCounts{.functions = 2, .methods = 1}));
}

TEST_F(BuiltinFilterTest, StringTypeFilterKeepsStrCallables) {
    RemovalCounts removed;
    auto result = run(string_type_filter(), removed);

    const auto& api = *result->modules[0];
    EXPECT_TRUE(api.functions.empty());
    ASSERT_EQ(api.classes[0]->methods.size(), 1u);
    EXPECT_EQ(api.classes[0]->methods[0]->callable.name, "__init__");
    ASSERT_EQ(result->modules[1]->functions.size(), 1u);
    EXPECT_EQ(result->modules[1]->functions[0]->callable.name, "h");
}

TEST_F(BuiltinFilterTest, EmptyFilterRemovesBottomUp) {
    RemovalCounts removed;
    auto result = run(empty_filter(), removed);

    std::vector<std::string> expected = {"demo/api.py", "demo/_compat.py", "tests/test_api.py"};
    EXPECT_EQ(paths(*result), expected);
    ASSERT_EQ(result->modules[0]->classes.size(), 1u);
    EXPECT_EQ(result->modules[0]->classes[0]->name, "Client");
    EXPECT_EQ(removed, (RemovalCounts{.modules = 1, .classes = 1}));
}

TEST_F(BuiltinFilterTest, EmptyFilterRemovesEmptyRepository) {
    auto only_marker = make_rc<model::Repository>(model::Repository{
        .identity = repository_->identity,
        .modules = {module("demo/marker.py", {}, {klass("Marker", "demo/marker.py", {})})}});

    RemovalCounts removed;
    EXPECT_EQ(apply_filter(empty_filter(), only_marker, removed).get(), nullptr);
    EXPECT_EQ(removed, (RemovalCounts{.repositories = 1, .modules = 1, .classes = 1}));
}

TEST_F(BuiltinFilterTest, NullRepositoryStaysNull) {
    RemovalCounts removed;
    EXPECT_EQ(apply_stage(empty_filter().stages[0], nullptr, removed).get(), nullptr);
    EXPECT_FALSE(removed.any());
}

TEST_F(BuiltinFilterTest, FilterMetadata) {
    EXPECT_EQ(private_module_filter().name, "PrivateModuleFilter");
    EXPECT_EQ(test_module_filter().name, "TestModuleFilter");
    EXPECT_EQ(non_core_module_filter().name, "NonCoreModuleFilter");
    EXPECT_EQ(no_string_type_filter().name, "NoStringTypeFilter");
    EXPECT_EQ(string_type_filter().name, "StringTypeFilter");

    auto empty = empty_filter();
    EXPECT_EQ(empty.name, "EmptyFilter");
    ASSERT_EQ(empty.stages.size(), 3u);
    EXPECT_EQ(scope_of(empty.stages[0]), Scope::Class);
    EXPECT_EQ(scope_of(empty.stages[1]), Scope::Module);
    EXPECT_EQ(scope_of(empty.stages[2]), Scope::Repository);
    EXPECT_EQ(scope_name(Scope::Callable), "callable");
}

// ============================================================================
// Stage Application
// ============================================================================

TEST_F(BuiltinFilterTest, UntouchedSubtreesAreShared) {
    RemovalCounts removed;
    auto result = run(test_module_filter(), removed);
    ASSERT_NE(result.get(), repository_.get());
    EXPECT_EQ(result->modules[0].get(), repository_->modules[0].get());
    EXPECT_EQ(result->modules[1].get(), repository_->modules[1].get());
}

TEST_F(BuiltinFilterTest, NoRemovalReturnsSameTree) {
    Filter keep_all{.name = "KeepAll",
                    .description = "",
                    .stages = {ModuleFilter{[](const model::Module&,
                                               const model::RepositoryIdentity&) { return true; }},
                               CallableFilter{[](const model::Callable&,
                                                 const CallableContext&) { return true; }}}};
    RemovalCounts removed;
    auto result = run(keep_all, removed);
    EXPECT_EQ(result.get(), repository_.get());
    EXPECT_FALSE(removed.any());
}

TEST_F(BuiltinFilterTest, InputTreeIsNotModified) {
    auto before = model::count_entities(*repository_);
    RemovalCounts removed;
    auto after_filters = run(empty_filter(), removed);
    after_filters = apply_filter(no_string_type_filter(), after_filters, removed);
    EXPECT_EQ(model::count_entities(*repository_), before);
    EXPECT_EQ(repository_->modules.size(), 4u);
    EXPECT_EQ(repository_->modules[0]->functions.size(), 2u);
}

TEST_F(BuiltinFilterTest, CallableContextSeesOwner) {
    std::vector<std::string> seen;
    Filter recorder{.name = "Recorder",
                 .description = "",
                 .stages = {CallableFilter{
                     [&seen](const model::Callable& c, const CallableContext& context) {
                         std::string owner = context.owner ? context.owner->name + "." : "";
                         seen.push_back(context.module.file_path + ":" + owner + c.name);
                         return true;
                     }}}};
    RemovalCounts removed;
    auto result = run(recorder, removed);
    EXPECT_EQ(result.get(), repository_.get());
    ASSERT_GE(seen.size(), 4u);
    EXPECT_EQ(seen[0], "demo/api.py:f");
    EXPECT_EQ(seen[2], "demo/api.py:Client.__init__");
}

TEST(RemovalCountsTest, Accumulates) {
    RemovalCounts a{.repositories = 0, .modules = 1, .classes = 2, .functions = 3, .methods = 4};
    RemovalCounts b{.repositories = 1, .modules = 1, .classes = 0, .functions = 0, .methods = 1};
    a += b;
    EXPECT_EQ(a, (RemovalCounts{.repositories = 1, .modules = 2, .classes = 2, .functions = 3,
                                .methods = 5}));
    EXPECT_TRUE(a.any());
    EXPECT_FALSE(RemovalCounts{}.any());

    FilterReport report;
    report.steps.push_back(FilterStep{.filter = "A", .removed = a});
    report.steps.push_back(FilterStep{.filter = "B", .removed = b});
    EXPECT_EQ(report.total().methods, 6u);
}
