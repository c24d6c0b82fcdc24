#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace patchgrade::harness {

/**
 * \brief Parameters for a new container.
 */
struct ContainerOptions {
    std::string image;
    std::string name;
    bool network_disabled{true};
    std::string working_dir{"/workspace"};
    std::vector<std::string> env;          ///< `KEY=value`
    std::optional<double> cpus{};
    std::optional<std::string> memory{};   ///< e.g. `4g`
};

/**
 * \brief Outcome of one command executed inside a container.
 *
 * `timed_out` means the command was forcibly stopped; output is whatever had
 * been captured until then.
 */
struct CommandResult {
    int exit_code{-1};
    std::string stdout_text;
    std::string stderr_text;
    bool timed_out{false};
};

/**
 * \brief Contract the harness needs from a container engine.
 *
 * Implementations must be safe to call from several worker threads at once.
 * Failures of the engine itself (daemon unreachable, unknown image, ...) are
 * reported by throwing InternalError; a command that runs and exits non-zero is
 * not a failure of the engine and is returned in CommandResult.
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /// Creates and starts a long-lived container; returns its id.
    virtual std::string create_container(const ContainerOptions& options) = 0;

    /// Runs `/bin/sh -c script` inside the container.
    virtual CommandResult exec(const std::string& container,
                               const std::string& script,
                               std::chrono::milliseconds timeout) = 0;

    /// Writes `content` to `path` inside the container, creating parent directories.
    virtual void write_file(const std::string& container,
                            const std::string& path,
                            std::string_view content) = 0;

    /// Reads `path` inside the container; nullopt when it does not exist.
    virtual std::optional<std::string> read_file(const std::string& container,
                                                 const std::string& path) = 0;

    /// Commits the container filesystem as image `tag`; returns the image reference.
    virtual std::string commit(const std::string& container, const std::string& tag) = 0;

    virtual void kill(const std::string& container) = 0;

    /// Force-removes the container. Removing an unknown container is not an error.
    virtual void remove(const std::string& container) = 0;

    [[nodiscard]] virtual bool image_exists(const std::string& image) = 0;
};

}  // namespace patchgrade::harness
