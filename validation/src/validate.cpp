#include "sqlforge/validation/validate.h"

#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>

#include "sqlforge/validation/checks.h"

namespace sqlforge::validation {

namespace {

[[nodiscard]] auto checkImplicitFields(const ModuleInfoPtr& module, const QueryDataStructure& structure)
    -> CheckResult {
    if (structure.isNamed()) {
        return std::nullopt;
    }
    return checkDuplicates(module, structure.fields);
}

// Sorts by value and drops repeats; the earliest occurrence of a value is kept.
template <typename T>
[[nodiscard]] auto dedupByValue(std::vector<SourceSpan<T>> items) -> std::vector<SourceSpan<T>> {
    std::stable_sort(items.begin(), items.end(),
                     [](const SourceSpan<T>& lhs, const SourceSpan<T>& rhs) { return lhs.value < rhs.value; });
    const auto last = std::unique(items.begin(), items.end(), [](const SourceSpan<T>& lhs, const SourceSpan<T>& rhs) {
        return lhs.value == rhs.value;
    });
    items.erase(last, items.end());
    return items;
}

[[nodiscard]] auto validateExtended(Query query) -> ValidatedQuery {
    std::vector<SourceSpan<std::string>> names;
    names.reserve(query.sql.bind_params.size());
    for (const auto& param : query.sql.bind_params) {
        names.push_back(param.map([](const BindParameter& value) { return value.name; }));
    }

    ValidatedQuery validated;
    validated.kind = Dialect::Extended;
    validated.bind_params = dedupByValue(std::move(names));
    validated.sql_text = normalizeSql(query.sql, query.sql_start, validated.bind_params);
    validated.name = std::move(query.annotation.name);
    validated.params = std::move(query.annotation.param);
    validated.row = std::move(query.annotation.row);
    return validated;
}

[[nodiscard]] auto validatePgCompatible(const ModuleInfoPtr& module, Query query) -> Result<ValidatedQuery> {
    IndexList indices;
    indices.reserve(query.sql.bind_params.size());
    for (const auto& param : query.sql.bind_params) {
        auto index = normalizeIndex(module, param);
        if (!index.success()) {
            return Result<ValidatedQuery>::fail(std::move(*index.error));
        }
        indices.push_back(*index.value);
    }
    const IndexList deduped = dedupByValue(indices);

    auto guarded = guardPgCompatible(module, query.annotation);
    if (!guarded.success()) {
        return Result<ValidatedQuery>::fail(std::move(*guarded.error));
    }
    auto& [params, row] = *guarded.value;

    if (auto error = checkOverflow(module, params, deduped)) {
        return Result<ValidatedQuery>::fail(std::move(*error));
    }
    if (auto error = checkUnused(module, params, indices)) {
        return Result<ValidatedQuery>::fail(std::move(*error));
    }

    ValidatedQuery validated;
    validated.kind = Dialect::PgCompatible;
    validated.name = std::move(query.annotation.name);
    validated.param_fields = std::move(params);
    validated.row_fields = std::move(row);
    validated.sql_text = std::move(query.sql.sql_text);
    return Result<ValidatedQuery>::ok(std::move(validated));
}

}  // namespace

auto validateQuery(const ModuleInfoPtr& module, Query query) -> Result<ValidatedQuery> {
    for (const auto* structure : {&query.annotation.param, &query.annotation.row}) {
        if (auto error = checkImplicitFields(module, *structure)) {
            return Result<ValidatedQuery>::fail(std::move(*error));
        }
    }

    const auto dialect = resolveDialect(module, query.sql.bind_params);
    if (!dialect.success()) {
        return Result<ValidatedQuery>::fail(*dialect.error);
    }

    if (*dialect.value == Dialect::Extended) {
        return Result<ValidatedQuery>::ok(validateExtended(std::move(query)));
    }
    return validatePgCompatible(module, std::move(query));
}

auto validateModule(ModuleInfoPtr module, ParsedModule parsed) -> Result<ValidatedModule> {
    if (auto error = checkNameCollisions(module, parsed.queries)) {
        return Result<ValidatedModule>::fail(std::move(*error));
    }

    for (const auto* registry : {&parsed.param_types, &parsed.row_types, &parsed.db_types}) {
        for (const auto& type : *registry) {
            if (auto error = checkDuplicates(module, type.fields)) {
                return Result<ValidatedModule>::fail(std::move(*error));
            }
        }
    }

    ValidatedModule validated;
    validated.queries.reserve(parsed.queries.size());
    for (auto& query : parsed.queries) {
        auto result = validateQuery(module, std::move(query));
        if (!result.success()) {
            return Result<ValidatedModule>::fail(std::move(*result.error));
        }
        validated.queries.push_back(std::move(*result.value));
    }

    validated.module = std::move(module);
    validated.param_types = std::move(parsed.param_types);
    validated.row_types = std::move(parsed.row_types);
    validated.db_types = std::move(parsed.db_types);
    return Result<ValidatedModule>::ok(std::move(validated));
}

}  // namespace sqlforge::validation
