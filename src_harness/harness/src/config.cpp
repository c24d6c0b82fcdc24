#include "patchgrade_harness/config.hpp"

#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace {

std::optional<std::string> process_getenv(const char* name) {
    if (const char* value = std::getenv(name)) {
        return std::string{value};
    }
    return std::nullopt;
}

}  // namespace

namespace patchgrade::harness {

std::optional<bool> parse_bool(std::string_view raw) {
    std::string t;
    t.reserve(raw.size());
    for (unsigned char c : raw) {
        if (std::isspace(c) == 0) t.push_back(static_cast<char>(std::tolower(c)));
    }
    if (t == "1" || t == "true" || t == "yes" || t == "on") return true;
    if (t == "0" || t == "false" || t == "no" || t == "off") return false;
    return std::nullopt;
}

RegistryConfig RegistryConfig::from_environment(const Getenv& getenv) {
    const Getenv& lookup = getenv ? getenv : Getenv{process_getenv};

    auto flag = [&](const char* name) {
        const auto raw = lookup(name);
        if (!raw || raw->empty()) {
            return false;
        }
        const auto value = parse_bool(*raw);
        if (!value) {
            throw std::runtime_error(std::string{"Invalid boolean value '"} + *raw + "' in " + name);
        }
        return *value;
    };

    RegistryConfig config;
    config.push = flag("PATCHGRADE_PUSH_TO_REGISTRY");
    config.pull = flag("PATCHGRADE_PULL_FROM_REGISTRY");
    config.url = lookup("PATCHGRADE_REGISTRY_URL").value_or("");
    config.user = lookup("PATCHGRADE_REGISTRY_USER").value_or("");
    config.password = lookup("PATCHGRADE_REGISTRY_PASS").value_or("");
    return config;
}

bool RegistryConfig::enabled() const noexcept {
    return (push || pull) && !url.empty() && !user.empty();
}

}  // namespace patchgrade::harness
