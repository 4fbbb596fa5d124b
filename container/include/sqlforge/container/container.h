#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace sqlforge::container {

inline constexpr const char* kContainerName = "sqlforge_postgres";

enum class ContainerStatus : std::uint8_t {
    Success,
    RunFailed,
    HealthCheckFailed,
    MaxRetriesReached,
    StopFailed,
    RemoveFailed,
};

struct ContainerResult {
    ContainerStatus status = ContainerStatus::Success;
    std::string message;

    [[nodiscard]] auto success() const -> bool { return status == ContainerStatus::Success; }
};

// Exit status of the command, or nullopt when it could not be started.
using CommandRunner = std::function<std::optional<int>(const std::vector<std::string>&)>;
using SleepFunction = std::function<void(std::chrono::milliseconds)>;

struct ContainerOptions {
    std::uint64_t max_retries = 120;
    std::chrono::milliseconds retry_interval{1000};
    // Retries between two "slower than expected" notices.
    std::uint64_t progress_every = 10;
    // Null silences progress notices.
    std::ostream* progress_stream = nullptr;
    CommandRunner runner;
    SleepFunction sleep;
};

[[nodiscard]] auto container_command(bool use_podman) -> std::string;

// Starts a disposable Postgres container and blocks until pg_isready succeeds.
[[nodiscard]] auto setup(bool use_podman, const ContainerOptions& options = {}) -> ContainerResult;

// Stops and removes the container started by setup().
[[nodiscard]] auto cleanup(bool use_podman, const ContainerOptions& options = {}) -> ContainerResult;

[[nodiscard]] auto status_name(ContainerStatus status) -> const char*;

}  // namespace sqlforge::container
