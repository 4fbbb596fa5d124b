#include "sqlforge/container/container.h"

#include <ostream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "sqlforge/container/process.h"

namespace sqlforge::container {

namespace {

constexpr const char* kDaemonHint = " If you are using `docker`, please check that the daemon is up-and-running.";

struct Collaborators {
    CommandRunner runner;
    SleepFunction sleep;
};

[[nodiscard]] auto resolve_collaborators(const ContainerOptions& options) -> Collaborators {
    Collaborators collaborators;
    collaborators.runner = options.runner ? options.runner : CommandRunner{run_command};
    collaborators.sleep = options.sleep ? options.sleep
                                        : SleepFunction{[](std::chrono::milliseconds delay) {
                                              std::this_thread::sleep_for(delay);
                                          }};
    return collaborators;
}

[[nodiscard]] auto make_result(ContainerStatus status, std::string message) -> ContainerResult {
    return ContainerResult{.status = status, .message = std::move(message)};
}

// Only the exit status is interpreted; a command that cannot be started and
// one that exits non-zero fail the same way.
[[nodiscard]] auto run_step(const CommandRunner& runner, const std::vector<std::string>& argv, ContainerStatus failure,
                            const std::string& message) -> ContainerResult {
    const auto exit_code = runner(argv);
    if (!exit_code.has_value()) {
        return make_result(failure, message + kDaemonHint);
    }
    if (*exit_code != 0) {
        return make_result(failure, message + kDaemonHint + " (command returned with an error status)");
    }
    return make_result(ContainerStatus::Success, {});
}

[[nodiscard]] auto healthcheck(const std::string& command, const ContainerOptions& options,
                               const Collaborators& collaborators) -> ContainerResult {
    const std::vector<std::string> probe{command, "exec", kContainerName, "pg_isready"};
    std::uint64_t retries = 0;
    for (;;) {
        const auto exit_code = collaborators.runner(probe);
        if (!exit_code.has_value()) {
            return make_result(ContainerStatus::HealthCheckFailed,
                               std::string{"Encountered error while probing database container health."} +
                                   kDaemonHint);
        }
        if (*exit_code == 0) {
            return make_result(ContainerStatus::Success, {});
        }
        if (retries >= options.max_retries) {
            return make_result(ContainerStatus::MaxRetriesReached,
                               "max number of retries reached while waiting for database container to start");
        }

        collaborators.sleep(options.retry_interval);
        ++retries;

        if (options.progress_stream != nullptr && options.progress_every != 0 && retries % options.progress_every == 0) {
            *options.progress_stream << "Container startup slower than expected (" << retries << " retries out of "
                                     << options.max_retries << ")\n";
        }
    }
}

}  // namespace

auto container_command(bool use_podman) -> std::string {
    return use_podman ? "podman" : "docker";
}

auto setup(bool use_podman, const ContainerOptions& options) -> ContainerResult {
    const auto collaborators = resolve_collaborators(options);
    const std::string command = container_command(use_podman);

    const std::vector<std::string> run{command, "run", "-d", "--name", kContainerName, "-p", "5432:5432",
                                       "-e",    "POSTGRES_PASSWORD=postgres", "postgres"};
    auto started = run_step(collaborators.runner, run, ContainerStatus::RunFailed,
                            "Couldn't start database container.");
    if (!started.success()) {
        return started;
    }
    return healthcheck(command, options, collaborators);
}

auto cleanup(bool use_podman, const ContainerOptions& options) -> ContainerResult {
    const auto collaborators = resolve_collaborators(options);
    const std::string command = container_command(use_podman);

    auto stopped = run_step(collaborators.runner, {command, "stop", kContainerName}, ContainerStatus::StopFailed,
                            "Couldn't stop database container.");
    if (!stopped.success()) {
        return stopped;
    }
    return run_step(collaborators.runner, {command, "rm", "-v", kContainerName}, ContainerStatus::RemoveFailed,
                    "Couldn't clean up database container.");
}

auto status_name(ContainerStatus status) -> const char* {
    switch (status) {
        case ContainerStatus::Success:
            return "success";
        case ContainerStatus::RunFailed:
            return "run-failed";
        case ContainerStatus::HealthCheckFailed:
            return "health-check-failed";
        case ContainerStatus::MaxRetriesReached:
            return "max-retries-reached";
        case ContainerStatus::StopFailed:
            return "stop-failed";
        case ContainerStatus::RemoveFailed:
            return "remove-failed";
    }
    return "unknown";
}

}  // namespace sqlforge::container
