#include "sqlforge/container/process.h"

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <vector>

extern char** environ;

namespace sqlforge::container {

namespace {

class SpawnActions {
public:
    SpawnActions() { posix_spawn_file_actions_init(&actions_); }
    ~SpawnActions() { posix_spawn_file_actions_destroy(&actions_); }
    SpawnActions(const SpawnActions&) = delete;
    auto operator=(const SpawnActions&) -> SpawnActions& = delete;

    [[nodiscard]] auto silence_output() -> bool {
        return posix_spawn_file_actions_addopen(&actions_, STDOUT_FILENO, "/dev/null", O_WRONLY, 0) == 0 &&
               posix_spawn_file_actions_addopen(&actions_, STDERR_FILENO, "/dev/null", O_WRONLY, 0) == 0;
    }

    [[nodiscard]] auto get() const -> const posix_spawn_file_actions_t* { return &actions_; }

private:
    posix_spawn_file_actions_t actions_{};
};

}  // namespace

auto run_command(const std::vector<std::string>& argv) -> std::optional<int> {
    if (argv.empty()) {
        return std::nullopt;
    }

    std::vector<char*> cargs;
    cargs.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargs.push_back(const_cast<char*>(arg.c_str()));
    }
    cargs.push_back(nullptr);

    SpawnActions actions;
    if (!actions.silence_output()) {
        return std::nullopt;
    }

    pid_t pid = -1;
    if (posix_spawnp(&pid, argv[0].c_str(), actions.get(), nullptr, cargs.data(), environ) != 0) {
        return std::nullopt;
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return std::nullopt;
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}

}  // namespace sqlforge::container
