#include "sqlforge/validation/checks.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace sqlforge::validation {

auto resolveDialect(const ModuleInfoPtr& module, const std::vector<SourceSpan<BindParameter>>& bindParams)
    -> Result<Dialect> {
    // Ad-hoc rule kept for compatibility: whatever comes first wins.
    const Dialect dialect = bindParams.empty() ? Dialect::Extended : bindParams.front().value.kind;
    for (const auto& param : bindParams) {
        if (param.value.kind != dialect) {
            return Result<Dialect>::fail(Error::atPosition(ErrorKind::AmbiguousBindParam, module, param.start));
        }
    }
    return Result<Dialect>::ok(dialect);
}

auto checkDuplicates(const ModuleInfoPtr& module, const FieldList& fields) -> CheckResult {
    std::unordered_set<std::string> seen;
    seen.reserve(fields.size());
    for (const auto& field : fields) {
        const auto [iter, inserted] = seen.insert(field.value.name);
        if (!inserted) {
            return Error::atPosition(ErrorKind::DuplicateField, module, field.start);
        }
    }
    return std::nullopt;
}

auto guardPgCompatible(const ModuleInfoPtr& module, const QueryAnnotation& annotation)
    -> Result<std::pair<FieldList, FieldList>> {
    using GuardResult = Result<std::pair<FieldList, FieldList>>;
    for (const auto* structure : {&annotation.param, &annotation.row}) {
        if (structure->isNamed()) {
            return GuardResult::fail(
                Error::atPosition(ErrorKind::NamedStructInPgQuery, module, structure->name.start));
        }
    }
    return GuardResult::ok({annotation.param.fields, annotation.row.fields});
}

auto normalizeIndex(const ModuleInfoPtr& module, const SourceSpan<BindParameter>& bindParam)
    -> Result<SourceSpan<std::int16_t>> {
    using IndexResult = Result<SourceSpan<std::int16_t>>;
    if (bindParam.value.isExtended()) {
        throw std::logic_error("normalizeIndex called on named bind parameter '" + bindParam.value.name + "'");
    }

    // Postgres numbers parameters from 1 and sends the count as an int16.
    const std::uint64_t index = bindParam.value.index;
    if (index == 0 || index > static_cast<std::uint64_t>(kMaxBindIndex)) {
        return IndexResult::fail(Error::atPosition(ErrorKind::InvalidI16Index, module, bindParam.start));
    }
    return IndexResult::ok(makeSpan(bindParam.start, bindParam.end, static_cast<std::int16_t>(index)));
}

auto checkOverflow(const ModuleInfoPtr& module, const FieldList& declaredParams, const IndexList& dedupedIndices)
    -> CheckResult {
    const std::size_t count = declaredParams.size();
    for (const auto& index : dedupedIndices) {
        if (static_cast<std::size_t>(index.value) > count) {
            return Error::tooManyBindParams(module, index.start, count);
        }
    }
    return std::nullopt;
}

auto checkUnused(const ModuleInfoPtr& module, const FieldList& declaredParams, const IndexList& rawIndices)
    -> CheckResult {
    for (std::size_t i = 0; i < declaredParams.size(); ++i) {
        const std::size_t position = i + 1;
        const bool used = std::any_of(rawIndices.begin(), rawIndices.end(), [&](const SourceSpan<std::int16_t>& index) {
            return static_cast<std::size_t>(index.value) == position;
        });
        if (!used) {
            return Error::unusedParam(module, declaredParams[i].start, position);
        }
    }
    return std::nullopt;
}

auto checkNameCollisions(const ModuleInfoPtr& module, const std::vector<Query>& queries) -> CheckResult {
    for (std::size_t i = 0; i < queries.size(); ++i) {
        const auto& name = queries[i].annotation.name;
        for (std::size_t j = 0; j < queries.size(); ++j) {
            if (j != i && queries[j].annotation.name.value == name.value) {
                return Error::duplicateQueryName(module, name, queries[j].annotation.name);
            }
        }
    }
    return std::nullopt;
}

auto checkNullableName(const ModuleInfoPtr& module, const SourceSpan<NullableIdent>& field,
                       const std::vector<std::string>& availableNames) -> CheckResult {
    if (std::find(availableNames.begin(), availableNames.end(), field.value.name) != availableNames.end()) {
        return std::nullopt;
    }
    return Error::invalidNullableName(module, field.map([](const NullableIdent& ident) { return ident.name; }));
}

}  // namespace sqlforge::validation
