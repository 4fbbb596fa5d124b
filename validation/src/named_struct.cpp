#include "sqlforge/validation/named_struct.h"

#include <algorithm>
#include <utility>

namespace sqlforge::validation {

auto resolveNamedStruct(const ModuleInfoPtr& module, const std::vector<TypeAnnotation>& registry,
                        const SourceSpan<std::string>& name) -> Result<FieldList> {
    const auto it = std::find_if(registry.begin(), registry.end(),
                                 [&](const TypeAnnotation& entry) { return entry.name.value == name.value; });
    if (it == registry.end()) {
        return Result<FieldList>::fail(Error::atPosition(ErrorKind::UnknownNamedStruct, module, name.start));
    }
    return Result<FieldList>::ok(it->fields);
}

auto checkNamedStructConsistency(const ModuleInfoPtr& module, const SourceSpan<std::string>& name,
                                 const std::vector<NullableIdent>& previous,
                                 const std::vector<NullableIdent>& candidate) -> CheckResult {
    if (previous.size() == candidate.size() &&
        std::is_permutation(previous.begin(), previous.end(), candidate.begin(), candidate.end())) {
        return std::nullopt;
    }
    return Error::namedStructInvalidFields(module, name, previous, candidate);
}

NamedStructTracker::NamedStructTracker(ModuleInfoPtr module) : module_(std::move(module)) {}

auto NamedStructTracker::record(const SourceSpan<std::string>& name, std::vector<NullableIdent> fields)
    -> CheckResult {
    const auto it = seen_.find(name.value);
    if (it == seen_.end()) {
        seen_.emplace(name.value, std::move(fields));
        return std::nullopt;
    }
    return checkNamedStructConsistency(module_, name, it->second, fields);
}

auto NamedStructTracker::lookup(const std::string& name) const -> const std::vector<NullableIdent>* {
    const auto it = seen_.find(name);
    if (it == seen_.end()) {
        return nullptr;
    }
    return &it->second;
}

}  // namespace sqlforge::validation
