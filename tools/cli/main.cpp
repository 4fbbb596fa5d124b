#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "sqlforge/container/container.h"

namespace {

struct Options {
    bool setup = false;
    bool cleanup = false;
    bool podman = false;
    bool quiet = false;
    std::uint64_t maxRetries = 120;
    std::uint64_t retryIntervalMs = 1000;
};

void printUsage() {
    std::cout << "Usage: sqlforge-container (--setup | --cleanup) [options]\n"
                 "\n"
                 "Commands:\n"
                 "  --setup                    Start the disposable Postgres container and wait until it is ready\n"
                 "  --cleanup                  Stop and remove the container\n"
                 "\n"
                 "Options:\n"
                 "  --podman                   Use podman instead of docker\n"
                 "  --max-retries <n>          Health probes before giving up (default 120)\n"
                 "  --retry-interval-ms <n>    Delay between health probes (default 1000)\n"
                 "  --quiet                    Do not print startup progress notices\n";
}

auto parseCount(const std::string& flag, const char* text) -> std::optional<std::uint64_t> {
    const std::string value{text};
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        std::cerr << "Invalid value for " << flag << ": '" << value << "'\n";
        return std::nullopt;
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        std::cerr << "Value for " << flag << " is out of range: '" << value << "'\n";
        return std::nullopt;
    }
}

auto parseArgs(int argc, char** argv) -> std::optional<Options> {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        const std::string arg{argv[i]};
        if (arg == "--setup") {
            opts.setup = true;
            continue;
        }
        if (arg == "--cleanup") {
            opts.cleanup = true;
            continue;
        }
        if (arg == "--podman") {
            opts.podman = true;
            continue;
        }
        if (arg == "--quiet" || arg == "-q") {
            opts.quiet = true;
            continue;
        }
        if (arg == "--max-retries" || arg == "--retry-interval-ms") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << '\n';
                return std::nullopt;
            }
            const auto value = parseCount(arg, argv[++i]);
            if (!value.has_value()) {
                return std::nullopt;
            }
            if (arg == "--max-retries") {
                opts.maxRetries = *value;
            } else {
                opts.retryIntervalMs = *value;
            }
            continue;
        }
        if (arg == "--help" || arg == "-h") {
            printUsage();
            return std::nullopt;
        }
        std::cerr << "Unknown argument: " << arg << '\n';
        return std::nullopt;
    }

    if (opts.setup == opts.cleanup) {
        std::cerr << "Specify exactly one of --setup or --cleanup\n";
        return std::nullopt;
    }
    return opts;
}

}  // namespace

auto main(int argc, char** argv) -> int {
    const auto options = parseArgs(argc, argv);
    if (!options.has_value()) {
        return 1;
    }

    sqlforge::container::ContainerOptions containerOptions;
    containerOptions.max_retries = options->maxRetries;
    containerOptions.retry_interval =
        std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(options->retryIntervalMs));
    containerOptions.progress_stream = options->quiet ? nullptr : &std::cout;

    const auto result = options->setup ? sqlforge::container::setup(options->podman, containerOptions)
                                       : sqlforge::container::cleanup(options->podman, containerOptions);
    if (!result.success()) {
        std::cerr << "error [" << sqlforge::container::status_name(result.status) << "]: " << result.message << '\n';
        return 2;
    }

    std::cout << (options->setup ? "Database container is ready\n" : "Database container removed\n");
    return 0;
}
