#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "patchgrade_harness/container_runtime.hpp"
#include "patchgrade_harness/errors.hpp"
#include "patchgrade_harness/image_cache.hpp"

namespace fakes {

namespace ph = patchgrade::harness;

// In-memory container runtime. Every call is recorded; exec answers come from `on_exec`.
class FakeRuntime : public ph::ContainerRuntime {
public:
    using ExecHandler = std::function<ph::CommandResult(const std::string& image, const std::string& script,
                                                        std::chrono::milliseconds timeout)>;

    struct ExecCall {
        std::string container;
        std::string image;
        std::string script;
    };

    ExecHandler on_exec{};
    std::map<std::string, std::string> files;   // path -> content, visible in every container
    std::set<std::string> images;                // what image_exists() reports
    std::chrono::milliseconds exec_delay{0};
    bool fail_create{false};
    bool fail_remove{false};

    std::string create_container(const ph::ContainerOptions& options) override {
        std::lock_guard<std::mutex> guard(mutex_);
        if (fail_create) {
            throw ph::InternalError("cannot create container from " + options.image);
        }
        const std::string id = "c" + std::to_string(++seq_);
        image_of_[id] = options.image;
        live_.insert(id);
        created_.push_back(options);
        return id;
    }

    ph::CommandResult exec(const std::string& container, const std::string& script,
                           std::chrono::milliseconds timeout) override {
        std::string image;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            image = image_of_.at(container);
            execs_.push_back(ExecCall{container, image, script});
        }
        if (exec_delay.count() > 0) {
            std::this_thread::sleep_for(exec_delay);
        }
        if (on_exec) {
            return on_exec(image, script, timeout);
        }
        return ph::CommandResult{0, "", "", false};
    }

    void write_file(const std::string& container, const std::string& path, std::string_view content) override {
        std::lock_guard<std::mutex> guard(mutex_);
        written_[container + ":" + path] = std::string{content};
    }

    std::optional<std::string> read_file(const std::string&, const std::string& path) override {
        std::lock_guard<std::mutex> guard(mutex_);
        ++reads_;
        const auto it = files.find(path);
        if (it == files.end()) return std::nullopt;
        return it->second;
    }

    std::string commit(const std::string&, const std::string& tag) override {
        std::lock_guard<std::mutex> guard(mutex_);
        commits_.push_back(tag);
        images.insert(tag);
        return tag;
    }

    void kill(const std::string& container) override {
        std::lock_guard<std::mutex> guard(mutex_);
        killed_.push_back(container);
    }

    void remove(const std::string& container) override {
        std::lock_guard<std::mutex> guard(mutex_);
        removed_.push_back(container);
        live_.erase(container);
        if (fail_remove) {
            throw ph::InternalError("remove failed for " + container);
        }
    }

    bool image_exists(const std::string& image) override {
        std::lock_guard<std::mutex> guard(mutex_);
        return images.count(image) != 0;
    }

    std::size_t live_containers() const { std::lock_guard<std::mutex> g(mutex_); return live_.size(); }
    std::vector<std::string> removed() const { std::lock_guard<std::mutex> g(mutex_); return removed_; }
    std::vector<std::string> killed() const { std::lock_guard<std::mutex> g(mutex_); return killed_; }
    std::vector<std::string> commits() const { std::lock_guard<std::mutex> g(mutex_); return commits_; }
    std::vector<ExecCall> execs() const { std::lock_guard<std::mutex> g(mutex_); return execs_; }
    std::vector<ph::ContainerOptions> created() const { std::lock_guard<std::mutex> g(mutex_); return created_; }
    std::map<std::string, std::string> written() const { std::lock_guard<std::mutex> g(mutex_); return written_; }
    std::size_t reads() const { std::lock_guard<std::mutex> g(mutex_); return reads_; }

private:
    mutable std::mutex mutex_;
    std::size_t seq_{0};
    std::size_t reads_{0};
    std::map<std::string, std::string> image_of_;
    std::set<std::string> live_;
    std::vector<std::string> removed_;
    std::vector<std::string> killed_;
    std::vector<std::string> commits_;
    std::vector<ExecCall> execs_;
    std::vector<ph::ContainerOptions> created_;
    std::map<std::string, std::string> written_;
};

// Registry keyed by stage hash.
class FakeRegistry : public ph::RegistrySync {
public:
    std::map<std::string, std::string> remote;   // hash -> image reference returned by pull()
    bool auth_failure{false};
    bool transient_failure{false};

    std::optional<std::string> pull(const std::string& hash) override {
        ++pulls;
        if (auth_failure) throw ph::RegistryError("unauthorized: authentication required", true);
        if (transient_failure) throw ph::RegistryError("connection reset", false);
        std::lock_guard<std::mutex> guard(mutex_);
        const auto it = remote.find(hash);
        if (it == remote.end()) return std::nullopt;
        return it->second;
    }

    void push(const std::string& hash, const std::string& image) override {
        ++push_attempts;
        if (auth_failure) throw ph::RegistryError("denied: requested access to the resource is denied", true);
        if (transient_failure) throw ph::RegistryError("connection reset", false);
        std::lock_guard<std::mutex> guard(mutex_);
        pushed.emplace_back(hash, image);
    }

    std::atomic<int> pulls{0};
    std::atomic<int> push_attempts{0};
    std::vector<std::pair<std::string, std::string>> pushed;

private:
    std::mutex mutex_;
};

inline ph::CommandResult ok(std::string out = {}) {
    return ph::CommandResult{0, std::move(out), "", false};
}

inline ph::CommandResult failed(int code, std::string err) {
    return ph::CommandResult{code, "", std::move(err), false};
}

inline ph::CommandResult timed_out(std::string out = {}) {
    return ph::CommandResult{137, std::move(out), "", true};
}

}  // namespace fakes
