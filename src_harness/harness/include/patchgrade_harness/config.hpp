#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace patchgrade::harness {

/// `true/false`, `yes/no`, `1/0`, `on/off`, case-insensitive; nullopt otherwise.
[[nodiscard]] std::optional<bool> parse_bool(std::string_view raw);

/**
 * \brief Remote image registry settings.
 *
 * Read from `PATCHGRADE_PUSH_TO_REGISTRY`, `PATCHGRADE_PULL_FROM_REGISTRY`,
 * `PATCHGRADE_REGISTRY_URL`, `PATCHGRADE_REGISTRY_USER` and
 * `PATCHGRADE_REGISTRY_PASS`; command-line flags override them.
 */
struct RegistryConfig {
    bool push{false};
    bool pull{false};
    std::string url;
    std::string user;
    std::string password;

    using Getenv = std::function<std::optional<std::string>(const char* name)>;

    /// Throws std::runtime_error on a malformed boolean variable.
    [[nodiscard]] static RegistryConfig from_environment(const Getenv& getenv = {});

    /// Sync needs a URL and a user, and at least one direction switched on.
    [[nodiscard]] bool enabled() const noexcept;
};

}  // namespace patchgrade::harness
