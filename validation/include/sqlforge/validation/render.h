#pragma once

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include "sqlforge/validation/ast.h"
#include "sqlforge/validation/error.h"

namespace sqlforge::validation {

struct LineInfo {
    std::size_t line = 1;
    std::size_t column = 1;
    std::string text;
};

// 1-based line/column of a byte offset; offsets past the end clamp to it.
[[nodiscard]] auto computeLine(const std::string& source, std::size_t offset) -> LineInfo;

[[nodiscard]] auto formatBlock(const ModuleInfo& module, std::size_t offset, const std::vector<std::string>& messages)
    -> std::string;

[[nodiscard]] auto renderError(const Error& error) -> std::string;

auto operator<<(std::ostream& out, const Error& error) -> std::ostream&;

}  // namespace sqlforge::validation
