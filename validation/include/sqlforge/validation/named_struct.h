#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "sqlforge/validation/ast.h"
#include "sqlforge/validation/error.h"
#include "sqlforge/validation/span.h"

namespace sqlforge::validation {

[[nodiscard]] auto resolveNamedStruct(const ModuleInfoPtr& module, const std::vector<TypeAnnotation>& registry,
                                      const SourceSpan<std::string>& name) -> Result<FieldList>;

// Equal length and equal as multisets of (name, nullable, inner_nullable).
[[nodiscard]] auto checkNamedStructConsistency(const ModuleInfoPtr& module, const SourceSpan<std::string>& name,
                                               const std::vector<NullableIdent>& previous,
                                               const std::vector<NullableIdent>& candidate) -> CheckResult;

// Fields seen so far for every named struct of one module. Owned by the
// type-resolution stage and fed one Named use site at a time.
class NamedStructTracker {
   public:
    explicit NamedStructTracker(ModuleInfoPtr module);

    // Stores the first use of `name`; later uses must match it.
    [[nodiscard]] auto record(const SourceSpan<std::string>& name, std::vector<NullableIdent> fields) -> CheckResult;

    [[nodiscard]] auto lookup(const std::string& name) const -> const std::vector<NullableIdent>*;
    [[nodiscard]] auto size() const -> std::size_t { return seen_.size(); }

   private:
    ModuleInfoPtr module_;
    std::unordered_map<std::string, std::vector<NullableIdent>> seen_;
};

}  // namespace sqlforge::validation
