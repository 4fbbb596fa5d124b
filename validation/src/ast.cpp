#include "sqlforge/validation/ast.h"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace sqlforge::validation {

auto makeModuleInfo(std::string path, std::string source) -> ModuleInfoPtr {
    return std::make_shared<const ModuleInfo>(ModuleInfo{.path = std::move(path), .source = std::move(source)});
}

auto describeField(const NullableIdent& field) -> std::string {
    // Annotations spell one marker per field; a field carrying both flags
    // renders the column marker before the element marker.
    std::string text = field.name;
    if (field.nullable) {
        text += "?";
    }
    if (field.inner_nullable) {
        text += "[]?";
    }
    return text;
}

auto describeFields(const std::vector<NullableIdent>& fields) -> std::string {
    std::string text = "[";
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            text += ", ";
        }
        text += describeField(fields[i]);
    }
    text += "]";
    return text;
}

auto stripSpans(const FieldList& fields) -> std::vector<NullableIdent> {
    std::vector<NullableIdent> plain;
    plain.reserve(fields.size());
    for (const auto& field : fields) {
        plain.push_back(field.value);
    }
    return plain;
}

auto normalizeSql(const QuerySql& sql, std::size_t sqlStart,
                  const std::vector<SourceSpan<std::string>>& dedupedNames) -> std::string {
    std::vector<const SourceSpan<BindParameter>*> ordered;
    ordered.reserve(sql.bind_params.size());
    for (const auto& param : sql.bind_params) {
        if (!param.value.isExtended()) {
            throw std::logic_error("normalizeSql called on a positional bind parameter");
        }
        ordered.push_back(&param);
    }
    // Rewrite back to front so the offsets of earlier placeholders stay valid.
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const auto* lhs, const auto* rhs) { return lhs->start > rhs->start; });

    std::string text = sql.sql_text;
    for (const auto* param : ordered) {
        if (param->start < sqlStart || param->end < param->start || param->end - sqlStart > sql.sql_text.size()) {
            throw std::logic_error("bind parameter '" + param->value.name + "' lies outside its query text");
        }

        const auto it = std::find_if(dedupedNames.begin(), dedupedNames.end(),
                                     [&](const SourceSpan<std::string>& name) { return name.value == param->value.name; });
        if (it == dedupedNames.end()) {
            throw std::logic_error("bind parameter '" + param->value.name + "' missing from the deduplicated list");
        }

        const auto position = static_cast<std::size_t>(it - dedupedNames.begin()) + 1;
        text.replace(param->start - sqlStart, param->end - param->start, "$" + std::to_string(position));
    }
    return text;
}

}  // namespace sqlforge::validation
