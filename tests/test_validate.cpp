#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "sqlforge/validation/render.h"
#include "sqlforge/validation/validate.h"
#include "test_builders.h"

namespace v = sqlforge::validation;
namespace ts = sqlforge::test_support;

using v::Dialect;
using v::ErrorKind;

namespace {

const std::string kAgeSource =
    "--! users_by_age (min_age, max_age) : (id, name)\n"
    "SELECT id, name FROM users WHERE age > $1 AND age < $3;\n";

auto ageQuery(const std::string& source, std::vector<v::SourceSpan<v::BindParameter>> bindParams) -> v::Query {
    return ts::makeQuery(source, ts::name(source, "users_by_age"),
                         ts::implicit({ts::field(source, "min_age"), ts::field(source, "max_age")}),
                         ts::implicit({ts::field(source, "id"), ts::field(source, "name")}), "SELECT",
                         std::move(bindParams));
}

}  // namespace

TEST(ValidateQueryTest, PositionalParametersValidate) {
    const std::string source =
        "--! users_by_age (min_age, max_age) : (id, name)\n"
        "SELECT id, name FROM users WHERE age > $1 AND age < $2;\n";
    const auto module = v::makeModuleInfo("queries/users.sql", source);

    auto result = v::validateQuery(module, ageQuery(source, {ts::indexed(source, "$1", 1), ts::indexed(source, "$2", 2)}));
    ASSERT_TRUE(result.success()) << v::renderError(*result.error);

    const auto& query = *result.value;
    EXPECT_EQ(query.kind, Dialect::PgCompatible);
    EXPECT_EQ(query.name.value, "users_by_age");
    ASSERT_EQ(query.param_fields.size(), 2U);
    EXPECT_EQ(query.param_fields[1].value.name, "max_age");
    ASSERT_EQ(query.row_fields.size(), 2U);
    EXPECT_EQ(query.sql_text, "SELECT id, name FROM users WHERE age > $1 AND age < $2;");
}

TEST(ValidateQueryTest, RepeatedIndicesAreAllowed) {
    const std::string source =
        "--! users_by_age (min_age, max_age) : (id, name)\n"
        "SELECT id, name FROM users WHERE age > $1 AND age < $2 OR rank > $1;\n";
    const auto module = v::makeModuleInfo("queries/users.sql", source);

    const auto result = v::validateQuery(module, ageQuery(source, {
                                                                      ts::indexed(source, "$1", 1, 0),
                                                                      ts::indexed(source, "$2", 2),
                                                                      ts::indexed(source, "$1", 1, 1),
                                                                  }));
    EXPECT_TRUE(result.success());
}

TEST(ValidateQueryTest, IndexAboveParameterCount) {
    const auto module = v::makeModuleInfo("queries/users.sql", kAgeSource);

    const auto result =
        v::validateQuery(module, ageQuery(kAgeSource, {ts::indexed(kAgeSource, "$1", 1), ts::indexed(kAgeSource, "$3", 3)}));
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error->kind, ErrorKind::TooManyBindParams);
    EXPECT_EQ(result.error->count, 2U);
    EXPECT_EQ(result.error->position, ts::offsetOf(kAgeSource, "$3"));
}

TEST(ValidateQueryTest, UnusedDeclaredParameter) {
    const std::string source =
        "--! users_by_age (min_age, max_age) : (id, name)\n"
        "SELECT id, name FROM users WHERE age > $1;\n";
    const auto module = v::makeModuleInfo("queries/users.sql", source);

    const auto result = v::validateQuery(module, ageQuery(source, {ts::indexed(source, "$1", 1)}));
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error->kind, ErrorKind::UnusedParam);
    EXPECT_EQ(result.error->count, 2U);
    EXPECT_EQ(result.error->position, ts::offsetOf(source, "max_age"));
}

TEST(ValidateQueryTest, MixedDialectsAreAmbiguous) {
    const std::string source =
        "--! users_by_age (min_age, max_age) : (id, name)\n"
        "SELECT id, name FROM users WHERE age > $1 AND age < :max_age;\n";
    const auto module = v::makeModuleInfo("queries/users.sql", source);

    const auto result =
        v::validateQuery(module, ageQuery(source, {ts::indexed(source, "$1", 1), ts::named(source, "max_age")}));
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error->kind, ErrorKind::AmbiguousBindParam);
    EXPECT_EQ(result.error->position, ts::offsetOf(source, ":max_age"));
}

TEST(ValidateQueryTest, DuplicateFieldsAreCheckedBeforeDialect) {
    const std::string source =
        "--! broken : (id, id)\n"
        "SELECT id FROM users WHERE id = $1 OR id = :id;\n";
    const auto module = v::makeModuleInfo("queries/users.sql", source);

    auto query = ts::makeQuery(source, ts::name(source, "broken"), ts::implicit({}),
                               ts::implicit({ts::field(source, "id", 0), ts::field(source, "id", 1)}), "SELECT",
                               {ts::indexed(source, "$1", 1), ts::named(source, "id")});
    const auto result = v::validateQuery(module, std::move(query));
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error->kind, ErrorKind::DuplicateField);
    EXPECT_EQ(result.error->position, ts::offsetOf(source, "id", 1));
}

TEST(ValidateQueryTest, NamedRowInPositionalQuery) {
    const std::string source =
        "--! get_user (user_id) : UserRow\n"
        "SELECT id, name FROM users WHERE id = $1;\n";
    const auto module = v::makeModuleInfo("queries/users.sql", source);

    auto query = ts::makeQuery(source, ts::name(source, "get_user"), ts::implicit({ts::field(source, "user_id")}),
                               ts::namedStruct(source, "UserRow"), "SELECT", {ts::indexed(source, "$1", 1)});
    const auto result = v::validateQuery(module, std::move(query));
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error->kind, ErrorKind::NamedStructInPgQuery);
    EXPECT_EQ(result.error->position, ts::offsetOf(source, "UserRow"));
}

TEST(ValidateQueryTest, InvalidIndexIsReportedBeforeNamedStructGuard) {
    const std::string source =
        "--! get_user (user_id) : UserRow\n"
        "SELECT id, name FROM users WHERE id = $0;\n";
    const auto module = v::makeModuleInfo("queries/users.sql", source);

    auto query = ts::makeQuery(source, ts::name(source, "get_user"), ts::implicit({ts::field(source, "user_id")}),
                               ts::namedStruct(source, "UserRow"), "SELECT", {ts::indexed(source, "$0", 0)});
    const auto result = v::validateQuery(module, std::move(query));
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error->kind, ErrorKind::InvalidI16Index);
    EXPECT_EQ(result.error->position, ts::offsetOf(source, "$0"));
}

TEST(ValidateQueryTest, IndexAboveInt16Range) {
    const std::string source =
        "--! get_user (user_id) : (id)\n"
        "SELECT id FROM users WHERE id = $40000;\n";
    const auto module = v::makeModuleInfo("queries/users.sql", source);

    auto query = ts::makeQuery(source, ts::name(source, "get_user"), ts::implicit({ts::field(source, "user_id")}),
                               ts::implicit({ts::field(source, "id")}), "SELECT", {ts::indexed(source, "$40000", 40000)});
    const auto result = v::validateQuery(module, std::move(query));
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error->kind, ErrorKind::InvalidI16Index);
}

TEST(ValidateQueryTest, NamedParametersAreSortedDedupedAndRewritten) {
    const std::string source =
        "--! find_users (name, age) : UserRow\n"
        "SELECT * FROM users WHERE name = :name OR alias = :name AND age > :age;\n";
    const auto module = v::makeModuleInfo("queries/users.sql", source);

    auto query = ts::makeQuery(
        source, ts::name(source, "find_users"), ts::implicit({ts::field(source, "name"), ts::field(source, "age")}),
        ts::namedStruct(source, "UserRow"), "SELECT",
        {ts::named(source, "name", 0), ts::named(source, "name", 1), ts::named(source, "age")});
    const auto result = v::validateQuery(module, std::move(query));
    ASSERT_TRUE(result.success()) << v::renderError(*result.error);

    const auto& validated = *result.value;
    EXPECT_EQ(validated.kind, Dialect::Extended);
    ASSERT_EQ(validated.bind_params.size(), 2U);
    EXPECT_EQ(validated.bind_params[0].value, "age");
    EXPECT_EQ(validated.bind_params[1].value, "name");
    EXPECT_EQ(validated.bind_params[1].start, ts::offsetOf(source, ":name", 0));
    EXPECT_EQ(validated.sql_text, "SELECT * FROM users WHERE name = $2 OR alias = $2 AND age > $1;");
    EXPECT_TRUE(validated.row.isNamed());
    EXPECT_EQ(validated.row.name.value, "UserRow");
    EXPECT_EQ(validated.params.fields.size(), 2U);
}

TEST(ValidateQueryTest, QueryWithoutParametersIsExtended) {
    const std::string source =
        "--! all_users : (id)\n"
        "SELECT id FROM users;\n";
    const auto module = v::makeModuleInfo("queries/users.sql", source);

    auto query = ts::makeQuery(source, ts::name(source, "all_users"), ts::implicit({}),
                               ts::implicit({ts::field(source, "id")}), "SELECT", {});
    const auto result = v::validateQuery(module, std::move(query));
    ASSERT_TRUE(result.success());
    EXPECT_EQ(result.value->kind, Dialect::Extended);
    EXPECT_TRUE(result.value->bind_params.empty());
    EXPECT_EQ(result.value->sql_text, "SELECT id FROM users;");
}

TEST(NormalizeSqlTest, SpanOutsideQueryTextIsAnInternalError) {
    const std::string source = "SELECT :id";
    v::QuerySql sql;
    sql.sql_text = source;
    sql.bind_params.push_back(v::makeSpan<v::BindParameter>(7, 40, v::BindParameter::extended("id")));
    const std::vector<v::SourceSpan<std::string>> names = {v::makeSpan<std::string>(7, 10, "id")};
    EXPECT_THROW((void)v::normalizeSql(sql, 0, names), std::logic_error);
}

namespace {

const std::string kModuleSource =
    "--: UserRow (id, name, email?)\n"
    "--! get_user (user_id) : UserRow\n"
    "SELECT id, name, email FROM users WHERE id = :user_id;\n"
    "--! list_users (max_rows) : (id, name)\n"
    "SELECT id, name FROM users LIMIT $1;\n"
    "--! count_users : (total)\n"
    "SELECT count(*) AS total FROM users WHERE age > $1;\n";

auto userRowType() -> v::TypeAnnotation {
    v::TypeAnnotation type;
    type.name = ts::name(kModuleSource, "UserRow");
    type.fields = {ts::field(kModuleSource, "id"), ts::field(kModuleSource, "name"),
                   ts::field(kModuleSource, "email", 0, true)};
    return type;
}

auto getUser() -> v::Query {
    return ts::makeQuery(kModuleSource, ts::name(kModuleSource, "get_user"),
                         ts::implicit({ts::field(kModuleSource, "user_id")}), ts::namedStruct(kModuleSource, "UserRow", 1),
                         "SELECT id, name, email", {ts::named(kModuleSource, "user_id")});
}

auto listUsers() -> v::Query {
    return ts::makeQuery(kModuleSource, ts::name(kModuleSource, "list_users"),
                         ts::implicit({ts::field(kModuleSource, "max_rows")}),
                         ts::implicit({ts::field(kModuleSource, "id", 5), ts::field(kModuleSource, "name", 2)}),
                         "SELECT id, name FROM users LIMIT", {ts::indexed(kModuleSource, "$1", 1, 0)});
}

// Declares no parameter but uses $1.
auto countUsers() -> v::Query {
    return ts::makeQuery(kModuleSource, ts::name(kModuleSource, "count_users"), ts::implicit({}),
                         ts::implicit({ts::field(kModuleSource, "total")}), "SELECT count(*)",
                         {ts::indexed(kModuleSource, "$1", 1, 1)});
}

}  // namespace

TEST(ValidateModuleTest, ValidModuleKeepsRegistriesAndOrder) {
    const auto module = v::makeModuleInfo("queries/users.sql", kModuleSource);
    v::ParsedModule parsed;
    parsed.row_types.push_back(userRowType());
    parsed.queries.push_back(getUser());
    parsed.queries.push_back(listUsers());

    const auto result = v::validateModule(module, std::move(parsed));
    ASSERT_TRUE(result.success()) << v::renderError(*result.error);

    const auto& validated = *result.value;
    EXPECT_EQ(validated.module.get(), module.get());
    ASSERT_EQ(validated.row_types.size(), 1U);
    EXPECT_EQ(validated.row_types[0].name.value, "UserRow");
    EXPECT_TRUE(validated.param_types.empty());
    ASSERT_EQ(validated.queries.size(), 2U);
    EXPECT_EQ(validated.queries[0].name.value, "get_user");
    EXPECT_EQ(validated.queries[0].kind, Dialect::Extended);
    EXPECT_EQ(validated.queries[0].sql_text, "SELECT id, name, email FROM users WHERE id = $1;");
    EXPECT_EQ(validated.queries[1].name.value, "list_users");
    EXPECT_EQ(validated.queries[1].kind, Dialect::PgCompatible);
}

TEST(ValidateModuleTest, StopsAtFirstFailingQuery) {
    const auto module = v::makeModuleInfo("queries/users.sql", kModuleSource);
    v::ParsedModule parsed;
    parsed.row_types.push_back(userRowType());
    parsed.queries.push_back(getUser());
    parsed.queries.push_back(countUsers());
    parsed.queries.push_back(listUsers());

    const auto result = v::validateModule(module, std::move(parsed));
    ASSERT_FALSE(result.success());
    EXPECT_FALSE(result.value.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::TooManyBindParams);
    EXPECT_EQ(result.error->count, 0U);
    EXPECT_EQ(result.error->module.get(), module.get());
}

TEST(ValidateModuleTest, DuplicateQueryNamesReportBothPositions) {
    const std::string source =
        "--! get_user (user_id) : (id)\n"
        "SELECT id FROM users WHERE id = :user_id;\n"
        "--! get_user (email) : (id)\n"
        "SELECT id FROM accounts WHERE email = :email;\n";
    const auto module = v::makeModuleInfo("queries/users.sql", source);

    v::ParsedModule parsed;
    parsed.queries.push_back(ts::makeQuery(source, ts::name(source, "get_user", 0),
                                           ts::implicit({ts::field(source, "user_id")}),
                                           ts::implicit({ts::field(source, "id", 1)}), "SELECT id FROM users",
                                           {ts::named(source, "user_id")}));
    parsed.queries.push_back(ts::makeQuery(source, ts::name(source, "get_user", 1),
                                           ts::implicit({ts::field(source, "email")}),
                                           ts::implicit({ts::field(source, "id", 5)}), "SELECT id FROM accounts",
                                           {ts::named(source, "email")}));

    const auto result = v::validateModule(module, std::move(parsed));
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error->kind, ErrorKind::DuplicateQueryName);
    EXPECT_EQ(result.error->first_definition.start, ts::offsetOf(source, "get_user", 0));
    EXPECT_EQ(result.error->name.start, ts::offsetOf(source, "get_user", 1));
}

TEST(ValidateModuleTest, NameCollisionIsCheckedBeforeRegistries) {
    const auto module = v::makeModuleInfo("queries/users.sql", kModuleSource);
    v::ParsedModule parsed;
    auto broken = userRowType();
    broken.fields.push_back(ts::field(kModuleSource, "id", 1));
    parsed.row_types.push_back(std::move(broken));
    parsed.queries.push_back(getUser());
    parsed.queries.push_back(getUser());

    const auto result = v::validateModule(module, std::move(parsed));
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error->kind, ErrorKind::DuplicateQueryName);
}

TEST(ValidateModuleTest, RegistryFieldsMustBeUnique) {
    const auto module = v::makeModuleInfo("queries/users.sql", kModuleSource);
    v::ParsedModule parsed;
    auto broken = userRowType();
    broken.fields.push_back(ts::field(kModuleSource, "name", 1));
    parsed.db_types.push_back(std::move(broken));
    parsed.queries.push_back(countUsers());

    const auto result = v::validateModule(module, std::move(parsed));
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.error->kind, ErrorKind::DuplicateField);
    EXPECT_EQ(result.error->position, ts::offsetOf(kModuleSource, "name", 1));
}

TEST(ValidateModuleTest, ValidationIsDeterministic) {
    const auto module = v::makeModuleInfo("queries/users.sql", kModuleSource);
    auto build = [] {
        v::ParsedModule parsed;
        parsed.row_types.push_back(userRowType());
        parsed.queries.push_back(getUser());
        parsed.queries.push_back(countUsers());
        return parsed;
    };

    const auto first = v::validateModule(module, build());
    const auto second = v::validateModule(module, build());
    ASSERT_FALSE(first.success());
    ASSERT_FALSE(second.success());
    EXPECT_EQ(v::renderError(*first.error), v::renderError(*second.error));
}
