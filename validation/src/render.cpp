#include "sqlforge/validation/render.h"

#include <algorithm>
#include <ostream>
#include <sstream>
#include <string>
#include <vector>

namespace sqlforge::validation {

namespace {

[[nodiscard]] auto header(const ModuleInfo& module) -> std::string {
    return "Error while validating queries [path: \"" + module.path + "\"]:\n";
}

[[nodiscard]] auto messagesFor(const Error& error) -> std::vector<std::string> {
    switch (error.kind) {
        case ErrorKind::AmbiguousBindParam:
            return {
                "Cannot mix bind parameter syntaxes in the same query.",
                "Please use either named (`:named_ident`) or indexed (`$n`) bind parameters, but not both.",
            };
        case ErrorKind::InvalidI16Index:
            return {"Index must be between 1 and 32767."};
        case ErrorKind::DuplicateField:
            return {"Column name is already used."};
        case ErrorKind::TooManyBindParams:
            return {"Index is higher than the number of parameters supplied (" + std::to_string(error.count) +
                    ")."};
        case ErrorKind::UnusedParam:
            return {"Parameter `$" + std::to_string(error.count) + "` is never used in the query."};
        case ErrorKind::InvalidNullableName:
            return {"No column named `" + error.name.value + "` found for this query."};
        case ErrorKind::NamedStructInvalidFields:
            return {
                "This query's named struct `" + error.name.value +
                    "` has already been used, but the fields don't match.",
                "Expected fields: " + describeFields(error.expected),
                "Got fields: " + describeFields(error.actual),
            };
        case ErrorKind::DuplicateQueryName:
            return {"A query named `" + error.name.value + "` already exists."};
        case ErrorKind::NamedStructInPgQuery:
            return {
                "Named query structs are not allowed when using the PostgreSQL-compatible syntax.",
                "Use anonymous structs instead, or use the extended query syntax.",
            };
        case ErrorKind::UnknownNamedStruct:
            return {"Unknown named struct. Named structs must be registered using type annotations."};
    }
    return {"Unknown validation error."};
}

}  // namespace

auto computeLine(const std::string& source, std::size_t offset) -> LineInfo {
    const std::size_t clamped = std::min(offset, source.size());

    LineInfo info;
    std::size_t lineStart = 0;
    for (std::size_t i = 0; i < clamped; ++i) {
        if (source[i] == '\n') {
            ++info.line;
            lineStart = i + 1;
        }
    }

    std::size_t lineEnd = source.find('\n', lineStart);
    if (lineEnd == std::string::npos) {
        lineEnd = source.size();
    }
    if (lineEnd > lineStart && source[lineEnd - 1] == '\r') {
        --lineEnd;
    }

    info.column = clamped - lineStart + 1;
    info.text = source.substr(lineStart, lineEnd - lineStart);
    return info;
}

auto formatBlock(const ModuleInfo& module, std::size_t offset, const std::vector<std::string>& messages)
    -> std::string {
    const LineInfo info = computeLine(module.source, offset);

    std::ostringstream out;
    out << " --> " << info.line << ':' << info.column << '\n';
    out << "  | \n";
    out << "  | " << info.text << '\n';
    out << "  | " << std::string(info.column - 1, ' ') << "^---\n";
    out << "  | ";
    for (const auto& message : messages) {
        out << "\n  = " << message;
    }
    return out.str();
}

auto renderError(const Error& error) -> std::string {
    if (!error.module) {
        return std::string{errorKindName(error.kind)} + " (no module context)";
    }
    const ModuleInfo& module = *error.module;

    std::string rendered = header(module);
    rendered += formatBlock(module, error.position, messagesFor(error));
    if (error.kind == ErrorKind::DuplicateQueryName) {
        rendered += "\n\n";
        rendered += formatBlock(module, error.first_definition.start,
                                {"Query `" + error.first_definition.value + "` first defined here."});
    }
    return rendered;
}

auto operator<<(std::ostream& out, const Error& error) -> std::ostream& {
    return out << renderError(error);
}

}  // namespace sqlforge::validation
