#include "patchgrade_harness/docker_bridge.hpp"
#include "patchgrade_harness/errors.hpp"
#include "patchgrade_harness/spec_resolver.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace patchgrade::harness::docker_bridge {

static std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char ch : s) out.push_back(static_cast<char>(std::tolower(ch)));
    return out;
}

static std::string trim(std::string s) {
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
    return s;
}

static std::string parent_dir(const std::string& path) {
    const auto slash = path.find_last_of('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

static bool daemon_error(const ProcessResult& r) {
    return r.stderr_text.find("Error response from daemon") != std::string::npos ||
           r.stderr_text.find("Cannot connect to the Docker daemon") != std::string::npos;
}

static std::string describe(const std::vector<std::string>& args, const ProcessResult& r) {
    std::ostringstream os;
    os << "docker";
    for (const auto& a : args) os << ' ' << a;
    os << " failed with exit code " << r.exit_code;
    if (r.timed_out) os << " (timed out)";
    const auto err = trim(r.stderr_text);
    if (!err.empty()) os << ": " << tail_excerpt(err, 2048);
    return os.str();
}

bool looks_like_auth_failure(std::string_view stderr_text) {
    const auto t = to_lower(stderr_text);
    return t.find("unauthorized") != std::string::npos || t.find("denied") != std::string::npos ||
           t.find("authentication required") != std::string::npos ||
           t.find("no basic auth credentials") != std::string::npos;
}

bool looks_like_missing_image(std::string_view stderr_text) {
    const auto t = to_lower(stderr_text);
    return t.find("manifest unknown") != std::string::npos || t.find("not found") != std::string::npos ||
           t.find("no such image") != std::string::npos;
}

// DockerCli

DockerCli::DockerCli(Config cfg, Logger& log) : cfg_(std::move(cfg)), log_(log) {}

ProcessResult DockerCli::docker(std::vector<std::string> args, ProcessOptions options) const {
    args.insert(args.begin(), cfg_.docker_exe);
    try {
        return run_process(args, options);
    } catch (const std::runtime_error& e) {
        throw InternalError(std::string{"unable to run "} + cfg_.docker_exe + ": " + e.what());
    }
}

ProcessResult DockerCli::docker(std::vector<std::string> args) const {
    ProcessOptions options;
    options.timeout = cfg_.command_timeout;
    options.max_output_bytes = cfg_.max_output_bytes;
    return docker(std::move(args), options);
}

bool DockerCli::init(std::string& diag_out) {
    const std::vector<std::string> args{"version", "--format", "{{.Server.Version}}"};
    ProcessResult r;
    try {
        r = docker(args);
    } catch (const InternalError& e) {
        diag_out += std::string{e.what()} + "\n";
        return false;
    }
    if (r.exit_code == 127) {
        diag_out += "docker executable not found: " + cfg_.docker_exe + "\n";
        return false;
    }
    if (r.exit_code != 0) {
        diag_out += describe(args, r) + "\n";
        return false;
    }
    log_.info("docker server " + trim(r.stdout_text));
    return true;
}

std::string DockerCli::create_container(const ContainerOptions& options) {
    std::vector<std::string> args{"run", "-d"};
    if (!options.name.empty()) {
        args.insert(args.end(), {"--name", options.name});
    }
    if (options.network_disabled) {
        args.insert(args.end(), {"--network", "none"});
    }
    if (!options.working_dir.empty()) {
        args.insert(args.end(), {"-w", options.working_dir});
    }
    for (const auto& kv : options.env) {
        args.insert(args.end(), {"-e", kv});
    }
    if (options.cpus) {
        args.insert(args.end(), {"--cpus", std::to_string(*options.cpus)});
    }
    if (options.memory) {
        args.insert(args.end(), {"--memory", *options.memory});
    }
    args.insert(args.end(), {"--entrypoint", "", options.image, "tail", "-f", "/dev/null"});

    const auto r = docker(args);
    if (r.exit_code != 0 || r.timed_out) {
        throw InternalError(describe(args, r));
    }
    const auto id = trim(r.stdout_text);
    if (id.empty()) {
        throw InternalError("docker run returned no container id for image " + options.image);
    }
    log_.debug("started container " + id.substr(0, 12) + " from " + options.image);
    return id;
}

CommandResult DockerCli::exec(const std::string& container, const std::string& script, std::chrono::milliseconds timeout) {
    ProcessOptions options;
    options.timeout = timeout;
    options.max_output_bytes = cfg_.max_output_bytes;
    const std::vector<std::string> args{"exec", container, "/bin/sh", "-c", script};
    const auto r = docker(args, options);
    if (!r.timed_out && r.exit_code != 0 && daemon_error(r)) {
        throw InternalError(describe({"exec", container}, r));
    }

    CommandResult out;
    out.exit_code = r.exit_code;
    out.stdout_text = r.stdout_text;
    out.stderr_text = r.stderr_text;
    out.timed_out = r.timed_out;
    return out;
}

void DockerCli::write_file(const std::string& container, const std::string& path, std::string_view content) {
    ProcessOptions options;
    options.stdin_data = std::string{content};
    options.timeout = cfg_.command_timeout;
    const std::string script = "mkdir -p " + shell_quote(parent_dir(path)) + " && cat > " + shell_quote(path);
    const std::vector<std::string> args{"exec", "-i", container, "/bin/sh", "-c", script};
    const auto r = docker(args, options);
    if (r.exit_code != 0 || r.timed_out) {
        throw InternalError("writing " + path + " into " + container + ": " + describe({"exec", "-i", container}, r));
    }
}

std::optional<std::string> DockerCli::read_file(const std::string& container, const std::string& path) {
    constexpr int kMissing = 3;
    ProcessOptions options;
    options.timeout = cfg_.command_timeout;
    options.max_output_bytes = cfg_.max_file_bytes;
    const std::string script = "if [ -f " + shell_quote(path) + " ]; then cat " + shell_quote(path) +
                               "; else exit " + std::to_string(kMissing) + "; fi";
    const std::vector<std::string> args{"exec", container, "/bin/sh", "-c", script};
    const auto r = docker(args, options);
    if (r.exit_code == kMissing && !daemon_error(r)) {
        return std::nullopt;
    }
    if (r.exit_code != 0 || r.timed_out) {
        throw InternalError("reading " + path + " from " + container + ": " + describe({"exec", container}, r));
    }
    if (r.truncated) {
        throw InternalError(path + " in " + container + " exceeds " + std::to_string(cfg_.max_file_bytes) + " bytes");
    }
    return r.stdout_text;
}

std::string DockerCli::commit(const std::string& container, const std::string& tag) {
    const std::vector<std::string> args{"commit", container, tag};
    const auto r = docker(args);
    if (r.exit_code != 0 || r.timed_out) {
        throw InternalError(describe(args, r));
    }
    return tag;
}

void DockerCli::kill(const std::string& container) {
    const std::vector<std::string> args{"kill", container};
    const auto r = docker(args);
    if (r.exit_code != 0 && r.stderr_text.find("is not running") == std::string::npos) {
        throw InternalError(describe(args, r));
    }
}

void DockerCli::remove(const std::string& container) {
    const std::vector<std::string> args{"rm", "-f", container};
    const auto r = docker(args);
    if (r.exit_code != 0 && to_lower(r.stderr_text).find("no such container") == std::string::npos) {
        throw InternalError(describe(args, r));
    }
}

bool DockerCli::image_exists(const std::string& image) {
    const std::vector<std::string> args{"image", "inspect", "--format", "{{.Id}}", image};
    const auto r = docker(args);
    if (r.exit_code == 0) {
        return true;
    }
    if (daemon_error(r) && !looks_like_missing_image(r.stderr_text)) {
        throw InternalError(describe(args, r));
    }
    return false;
}

// DockerRegistry

DockerRegistry::DockerRegistry(Config cfg, Logger& log) : cfg_(std::move(cfg)), log_(log) {}

ProcessResult DockerRegistry::docker(std::vector<std::string> args, std::string stdin_data) const {
    args.insert(args.begin(), cfg_.docker_exe);
    ProcessOptions options;
    options.stdin_data = std::move(stdin_data);
    options.timeout = cfg_.timeout;
    options.max_output_bytes = 64 * 1024;
    try {
        return run_process(args, options);
    } catch (const std::runtime_error& e) {
        throw RegistryError(std::string{"unable to run "} + cfg_.docker_exe + ": " + e.what(), false);
    }
}

std::string DockerRegistry::remote_ref(const std::string& hash) const {
    std::string url = cfg_.url;
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url + "/" + cfg_.repository + ":" + hash;
}

std::string DockerRegistry::local_tag(const std::string& hash) const {
    return cfg_.repository + ":" + hash.substr(0, cfg_.tag_hash_chars);
}

void DockerRegistry::ensure_login() {
    std::lock_guard<std::mutex> guard(login_mutex_);
    if (logged_in_) {
        return;
    }
    if (login_failure_) {
        throw RegistryError(*login_failure_, true);
    }
    if (cfg_.url.empty() || cfg_.user.empty()) {
        login_failure_ = "registry url or user not configured";
        throw RegistryError(*login_failure_, true);
    }

    const std::vector<std::string> args{"login", cfg_.url, "-u", cfg_.user, "--password-stdin"};
    const auto r = docker(args, cfg_.password);
    if (r.exit_code != 0 || r.timed_out) {
        login_failure_ = "docker login " + cfg_.url + " failed: " + tail_excerpt(trim(r.stderr_text), 2048);
        throw RegistryError(*login_failure_, true);
    }
    logged_in_ = true;
    log_.info("logged in to registry " + cfg_.url + " as " + cfg_.user);
}

std::optional<std::string> DockerRegistry::pull(const std::string& hash) {
    ensure_login();
    const auto remote = remote_ref(hash);
    const auto r = docker({"pull", remote});
    if (r.exit_code != 0 || r.timed_out) {
        if (looks_like_auth_failure(r.stderr_text)) {
            throw RegistryError("pull " + remote + " rejected: " + trim(r.stderr_text), true);
        }
        if (!r.timed_out && looks_like_missing_image(r.stderr_text)) {
            return std::nullopt;
        }
        throw RegistryError("pull " + remote + " failed: " + tail_excerpt(trim(r.stderr_text), 2048), false);
    }

    const auto local = local_tag(hash);
    const auto t = docker({"tag", remote, local});
    if (t.exit_code != 0) {
        log_.warning("could not tag " + remote + " as " + local + ": " + trim(t.stderr_text));
        return remote;
    }
    return local;
}

void DockerRegistry::push(const std::string& hash, const std::string& image) {
    ensure_login();
    const auto remote = remote_ref(hash);
    const auto t = docker({"tag", image, remote});
    if (t.exit_code != 0) {
        throw RegistryError("tag " + image + " as " + remote + " failed: " + trim(t.stderr_text), false);
    }
    const auto r = docker({"push", remote});
    if (r.exit_code != 0 || r.timed_out) {
        throw RegistryError("push " + remote + " failed: " + tail_excerpt(trim(r.stderr_text), 2048),
                            looks_like_auth_failure(r.stderr_text));
    }
}

} // namespace patchgrade::harness::docker_bridge
