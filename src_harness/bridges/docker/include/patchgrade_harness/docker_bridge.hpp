#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "patchgrade_harness/container_runtime.hpp"
#include "patchgrade_harness/image_cache.hpp"
#include "patchgrade_harness/logger.hpp"
#include "patchgrade_harness/subprocess.hpp"

namespace patchgrade::harness::docker_bridge
{

/**
 * Container runtime on top of the `docker` command-line client.
 *
 * Every operation is one `docker` invocation through run_process(); nothing
 * goes through a shell on the host. Containers are kept alive with
 * `tail -f /dev/null` so that build stages and test runs can `docker exec`
 * into them.
 */
class DockerCli : public ContainerRuntime
{
public:
    struct Config
    {
        // Docker client executable (PATH lookup)
        std::string docker_exe{"docker"};

        // Timeout of housekeeping calls (run, commit, rm, ...)
        std::chrono::milliseconds command_timeout{std::chrono::minutes(10)};

        // Per-stream capture bound of exec'd commands; the tail is kept
        std::size_t max_output_bytes{512 * 1024};

        // Upper bound of files read back from a container (structured reports)
        std::size_t max_file_bytes{64 * 1024 * 1024};
    };

    explicit DockerCli(Config cfg, Logger& log = Logger::null());

    /**
     * Verifies that the client runs and reaches a daemon.
     * Returns true on success. Diagnostics appended to diag_out.
     */
    bool init(std::string& diag_out);

    std::string create_container(const ContainerOptions& options) override;
    CommandResult exec(const std::string& container, const std::string& script, std::chrono::milliseconds timeout) override;
    void write_file(const std::string& container, const std::string& path, std::string_view content) override;
    std::optional<std::string> read_file(const std::string& container, const std::string& path) override;
    std::string commit(const std::string& container, const std::string& tag) override;
    void kill(const std::string& container) override;
    void remove(const std::string& container) override;
    bool image_exists(const std::string& image) override;

    [[nodiscard]] const Config& config() const noexcept { return cfg_; }

private:
    ProcessResult docker(std::vector<std::string> args, ProcessOptions options) const;
    ProcessResult docker(std::vector<std::string> args) const;

    Config cfg_;
    Logger& log_;
};

/**
 * Remote image registry reached through `docker login/pull/tag/push`.
 *
 * Remote references are `<url>/<repository>:<stage hash>`. Pulled images are
 * re-tagged with the local stage tag so later runs find them without the
 * registry. Login happens once, on first use, under a mutex; a failed login
 * is remembered and reported as an authentication failure on every call.
 */
class DockerRegistry : public RegistrySync
{
public:
    struct Config
    {
        std::string docker_exe{"docker"};
        std::string url;
        std::string user;
        std::string password;
        std::string repository{"patchgrade-stage"};
        std::size_t tag_hash_chars{24};   // local tag, as used by BuildPipeline
        std::chrono::milliseconds timeout{std::chrono::minutes(30)};
    };

    explicit DockerRegistry(Config cfg, Logger& log = Logger::null());

    std::optional<std::string> pull(const std::string& hash) override;
    void push(const std::string& hash, const std::string& image) override;

    [[nodiscard]] std::string remote_ref(const std::string& hash) const;
    [[nodiscard]] std::string local_tag(const std::string& hash) const;

private:
    void ensure_login();
    ProcessResult docker(std::vector<std::string> args, std::string stdin_data = {}) const;

    Config cfg_;
    Logger& log_;
    std::mutex login_mutex_;
    bool logged_in_{false};
    std::optional<std::string> login_failure_;
};

/// True when docker's stderr reports missing or rejected credentials.
[[nodiscard]] bool looks_like_auth_failure(std::string_view stderr_text);

/// True when docker's stderr reports an image or tag that does not exist.
[[nodiscard]] bool looks_like_missing_image(std::string_view stderr_text);

} // namespace patchgrade::harness::docker_bridge
