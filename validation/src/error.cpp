#include "sqlforge/validation/error.h"

#include <utility>

namespace sqlforge::validation {

auto errorKindName(ErrorKind kind) -> const char* {
    switch (kind) {
        case ErrorKind::AmbiguousBindParam:
            return "AmbiguousBindParam";
        case ErrorKind::InvalidI16Index:
            return "InvalidI16Index";
        case ErrorKind::DuplicateField:
            return "DuplicateField";
        case ErrorKind::TooManyBindParams:
            return "TooManyBindParams";
        case ErrorKind::UnusedParam:
            return "UnusedParam";
        case ErrorKind::InvalidNullableName:
            return "InvalidNullableName";
        case ErrorKind::NamedStructInvalidFields:
            return "NamedStructInvalidFields";
        case ErrorKind::DuplicateQueryName:
            return "DuplicateQueryName";
        case ErrorKind::NamedStructInPgQuery:
            return "NamedStructInPgQuery";
        case ErrorKind::UnknownNamedStruct:
            return "UnknownNamedStruct";
    }
    return "Unknown";
}

auto Error::atPosition(ErrorKind kind, ModuleInfoPtr module, std::size_t position) -> Error {
    Error error;
    error.kind = kind;
    error.module = std::move(module);
    error.position = position;
    return error;
}

auto Error::tooManyBindParams(ModuleInfoPtr module, std::size_t position, std::size_t nbParams) -> Error {
    Error error = atPosition(ErrorKind::TooManyBindParams, std::move(module), position);
    error.count = nbParams;
    return error;
}

auto Error::unusedParam(ModuleInfoPtr module, std::size_t position, std::size_t index) -> Error {
    Error error = atPosition(ErrorKind::UnusedParam, std::move(module), position);
    error.count = index;
    return error;
}

auto Error::invalidNullableName(ModuleInfoPtr module, SourceSpan<std::string> column) -> Error {
    Error error = atPosition(ErrorKind::InvalidNullableName, std::move(module), column.start);
    error.name = std::move(column);
    return error;
}

auto Error::namedStructInvalidFields(ModuleInfoPtr module, SourceSpan<std::string> name,
                                     std::vector<NullableIdent> expected, std::vector<NullableIdent> actual)
    -> Error {
    Error error = atPosition(ErrorKind::NamedStructInvalidFields, std::move(module), name.start);
    error.name = std::move(name);
    error.expected = std::move(expected);
    error.actual = std::move(actual);
    return error;
}

auto Error::duplicateQueryName(ModuleInfoPtr module, SourceSpan<std::string> firstDefinition,
                               SourceSpan<std::string> redefinition) -> Error {
    Error error = atPosition(ErrorKind::DuplicateQueryName, std::move(module), redefinition.start);
    error.name = std::move(redefinition);
    error.first_definition = std::move(firstDefinition);
    return error;
}

}  // namespace sqlforge::validation
