#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "sqlforge/validation/ast.h"
#include "sqlforge/validation/span.h"

namespace sqlforge::validation {

enum class ErrorKind : std::uint8_t {
    AmbiguousBindParam,
    InvalidI16Index,
    DuplicateField,
    TooManyBindParams,
    UnusedParam,
    InvalidNullableName,
    NamedStructInvalidFields,
    DuplicateQueryName,
    NamedStructInPgQuery,
    UnknownNamedStruct,
};

[[nodiscard]] auto errorKindName(ErrorKind kind) -> const char*;

// A rejected module. `position` is the offset the diagnostic points at; the
// other payload fields are set only for the kinds that use them:
//   count             TooManyBindParams (declared params), UnusedParam (1-based index)
//   name              InvalidNullableName, NamedStructInvalidFields, DuplicateQueryName
//   first_definition  DuplicateQueryName
//   expected, actual  NamedStructInvalidFields
struct Error {
    ErrorKind kind = ErrorKind::AmbiguousBindParam;
    ModuleInfoPtr module;
    std::size_t position = 0;
    std::size_t count = 0;
    SourceSpan<std::string> name;
    SourceSpan<std::string> first_definition;
    std::vector<NullableIdent> expected;
    std::vector<NullableIdent> actual;

    [[nodiscard]] static auto atPosition(ErrorKind kind, ModuleInfoPtr module, std::size_t position) -> Error;
    [[nodiscard]] static auto tooManyBindParams(ModuleInfoPtr module, std::size_t position, std::size_t nbParams)
        -> Error;
    [[nodiscard]] static auto unusedParam(ModuleInfoPtr module, std::size_t position, std::size_t index) -> Error;
    [[nodiscard]] static auto invalidNullableName(ModuleInfoPtr module, SourceSpan<std::string> column) -> Error;
    [[nodiscard]] static auto namedStructInvalidFields(ModuleInfoPtr module, SourceSpan<std::string> name,
                                                       std::vector<NullableIdent> expected,
                                                       std::vector<NullableIdent> actual) -> Error;
    [[nodiscard]] static auto duplicateQueryName(ModuleInfoPtr module, SourceSpan<std::string> firstDefinition,
                                                 SourceSpan<std::string> redefinition) -> Error;
};

// Outcome of a check that yields nothing on success.
using CheckResult = std::optional<Error>;

template <typename T>
struct Result {
    std::optional<T> value;
    std::optional<Error> error;

    [[nodiscard]] static auto ok(T result) -> Result {
        Result outcome;
        outcome.value = std::move(result);
        return outcome;
    }

    [[nodiscard]] static auto fail(Error failure) -> Result {
        Result outcome;
        outcome.error = std::move(failure);
        return outcome;
    }

    [[nodiscard]] auto success() const -> bool { return !error.has_value(); }
};

}  // namespace sqlforge::validation
