#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "sqlforge/validation/ast.h"
#include "sqlforge/validation/error.h"
#include "sqlforge/validation/span.h"

namespace sqlforge::validation {

struct ValidatedQuery {
    Dialect kind = Dialect::Extended;
    SourceSpan<std::string> name;

    // PgCompatible
    FieldList param_fields;
    FieldList row_fields;

    // Extended
    QueryDataStructure params;
    QueryDataStructure row;
    std::vector<SourceSpan<std::string>> bind_params;

    std::string sql_text;

    [[nodiscard]] auto isExtended() const -> bool { return kind == Dialect::Extended; }
};

struct ValidatedModule {
    ModuleInfoPtr module;
    std::vector<TypeAnnotation> param_types;
    std::vector<TypeAnnotation> row_types;
    std::vector<TypeAnnotation> db_types;
    std::vector<ValidatedQuery> queries;
};

[[nodiscard]] auto validateQuery(const ModuleInfoPtr& module, Query query) -> Result<ValidatedQuery>;

// Stops at the first failing check; no partial result survives an error.
[[nodiscard]] auto validateModule(ModuleInfoPtr module, ParsedModule parsed) -> Result<ValidatedModule>;

}  // namespace sqlforge::validation
