#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "sqlforge/validation/ast.h"
#include "sqlforge/validation/error.h"
#include "sqlforge/validation/span.h"

namespace sqlforge::validation {

// Positional indices travel over the wire as int16.
inline constexpr std::int16_t kMaxBindIndex = 32767;

using IndexList = std::vector<SourceSpan<std::int16_t>>;

// The first parameter decides the dialect; an empty list is Extended.
[[nodiscard]] auto resolveDialect(const ModuleInfoPtr& module,
                                  const std::vector<SourceSpan<BindParameter>>& bindParams) -> Result<Dialect>;

[[nodiscard]] auto checkDuplicates(const ModuleInfoPtr& module, const FieldList& fields) -> CheckResult;

[[nodiscard]] auto guardPgCompatible(const ModuleInfoPtr& module, const QueryAnnotation& annotation)
    -> Result<std::pair<FieldList, FieldList>>;

[[nodiscard]] auto normalizeIndex(const ModuleInfoPtr& module, const SourceSpan<BindParameter>& bindParam)
    -> Result<SourceSpan<std::int16_t>>;

[[nodiscard]] auto checkOverflow(const ModuleInfoPtr& module, const FieldList& declaredParams,
                                 const IndexList& dedupedIndices) -> CheckResult;

[[nodiscard]] auto checkUnused(const ModuleInfoPtr& module, const FieldList& declaredParams,
                               const IndexList& rawIndices) -> CheckResult;

[[nodiscard]] auto checkNameCollisions(const ModuleInfoPtr& module, const std::vector<Query>& queries)
    -> CheckResult;

// Run once type resolution knows the columns (or parameters) of a query: a
// nullability override has to name one of them.
[[nodiscard]] auto checkNullableName(const ModuleInfoPtr& module, const SourceSpan<NullableIdent>& field,
                                     const std::vector<std::string>& availableNames) -> CheckResult;

}  // namespace sqlforge::validation
