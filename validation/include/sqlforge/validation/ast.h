#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "sqlforge/validation/span.h"

namespace sqlforge::validation {

// Source file the module was read from. One instance is shared by the
// validated module and every error raised against it.
struct ModuleInfo {
    std::string path;
    std::string source;
};

using ModuleInfoPtr = std::shared_ptr<const ModuleInfo>;

[[nodiscard]] auto makeModuleInfo(std::string path, std::string source) -> ModuleInfoPtr;

enum class Dialect : std::uint8_t {
    PgCompatible,
    Extended,
};

struct BindParameter {
    Dialect kind = Dialect::Extended;
    std::uint64_t index = 0;
    std::string name;

    [[nodiscard]] static auto pgCompatible(std::uint64_t index) -> BindParameter {
        BindParameter param;
        param.kind = Dialect::PgCompatible;
        param.index = index;
        return param;
    }

    [[nodiscard]] static auto extended(std::string name) -> BindParameter {
        BindParameter param;
        param.kind = Dialect::Extended;
        param.name = std::move(name);
        return param;
    }

    [[nodiscard]] auto isExtended() const -> bool { return kind == Dialect::Extended; }
};

// Field or column name with an optional nullability override: `name?` marks
// the value nullable, `name[]?` marks array elements nullable.
struct NullableIdent {
    std::string name;
    bool nullable = false;
    bool inner_nullable = false;

    [[nodiscard]] auto operator==(const NullableIdent& other) const -> bool = default;
};

[[nodiscard]] auto describeField(const NullableIdent& field) -> std::string;
[[nodiscard]] auto describeFields(const std::vector<NullableIdent>& fields) -> std::string;

using FieldList = std::vector<SourceSpan<NullableIdent>>;

[[nodiscard]] auto stripSpans(const FieldList& fields) -> std::vector<NullableIdent>;

struct QueryDataStructure {
    enum class Kind : std::uint8_t {
        Implicit,
        Named,
    };

    Kind kind = Kind::Implicit;
    FieldList fields;
    SourceSpan<std::string> name;

    [[nodiscard]] static auto implicit(FieldList fields) -> QueryDataStructure {
        QueryDataStructure structure;
        structure.kind = Kind::Implicit;
        structure.fields = std::move(fields);
        return structure;
    }

    [[nodiscard]] static auto named(SourceSpan<std::string> name) -> QueryDataStructure {
        QueryDataStructure structure;
        structure.kind = Kind::Named;
        structure.name = std::move(name);
        return structure;
    }

    [[nodiscard]] auto isNamed() const -> bool { return kind == Kind::Named; }
};

struct QueryAnnotation {
    SourceSpan<std::string> name;
    QueryDataStructure param;
    QueryDataStructure row;
};

struct QuerySql {
    std::vector<SourceSpan<BindParameter>> bind_params;
    std::string sql_text;
};

struct Query {
    QueryAnnotation annotation;
    QuerySql sql;
    // Module offset of the first byte of sql.sql_text.
    std::size_t sql_start = 0;
};

// Named struct declared once per module and referenced from queries.
struct TypeAnnotation {
    SourceSpan<std::string> name;
    FieldList fields;
};

struct ParsedModule {
    std::vector<TypeAnnotation> param_types;
    std::vector<TypeAnnotation> row_types;
    std::vector<TypeAnnotation> db_types;
    std::vector<Query> queries;
};

// Rewrites every named placeholder of `sql` to `$k`, where k is the 1-based
// position of its name in `dedupedNames`.
[[nodiscard]] auto normalizeSql(const QuerySql& sql, std::size_t sqlStart,
                                const std::vector<SourceSpan<std::string>>& dedupedNames) -> std::string;

}  // namespace sqlforge::validation
