#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sqlforge::container {

// Runs argv[0] from PATH with stdout/stderr discarded and waits for it.
// Returns the exit status (128 + signal for signalled children), or nullopt
// when the process could not be started.
[[nodiscard]] auto run_command(const std::vector<std::string>& argv) -> std::optional<int>;

}  // namespace sqlforge::container
