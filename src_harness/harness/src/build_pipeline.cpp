#include "patchgrade_harness/build_pipeline.hpp"
#include "patchgrade_harness/errors.hpp"
#include "patchgrade_harness/subprocess.hpp"

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace {

using patchgrade::harness::ContainerRuntime;
using patchgrade::harness::Logger;

std::string_view source_name(patchgrade::harness::ImageCache::Source source) {
    using Source = patchgrade::harness::ImageCache::Source;
    switch (source) {
        case Source::Memory: return "memory";
        case Source::Local: return "local";
        case Source::Registry: return "registry";
        case Source::Built: return "built";
    }
    return "unknown";
}

// Removes the build container on every exit path.
class BuildContainer {
public:
    BuildContainer(ContainerRuntime& runtime, std::string id, Logger& log)
        : runtime_{runtime}, id_{std::move(id)}, log_{log} {}

    BuildContainer(const BuildContainer&) = delete;
    BuildContainer& operator=(const BuildContainer&) = delete;

    ~BuildContainer() {
        try {
            runtime_.remove(id_);
        } catch (const std::exception& e) {
            log_.warning("failed to remove build container " + id_ + ": " + e.what());
        }
    }

    [[nodiscard]] const std::string& id() const noexcept { return id_; }

private:
    ContainerRuntime& runtime_;
    std::string id_;
    Logger& log_;
};

}  // namespace

namespace patchgrade::harness {

BuildPipeline::BuildPipeline(ContainerRuntime& runtime, ImageCache& cache)
    : BuildPipeline(runtime, cache, Config{}) {}

BuildPipeline::BuildPipeline(ContainerRuntime& runtime, ImageCache& cache, Config config, Logger& log)
    : runtime_{runtime}, cache_{cache}, config_{std::move(config)}, log_{log} {}

std::string BuildPipeline::build(const BuildPlan& plan) {
    return build(plan, log_);
}

std::string BuildPipeline::build(const BuildPlan& plan, Logger& log) {
    std::string parent = plan.base_image;
    for (const auto& stage : plan.stages) {
        const std::string short_hash = stage.hash.substr(0, 12);
        if (stage.empty()) {
            cache_.store(stage.hash, parent);
            log.debug("stage " + stage.name + " [" + short_hash + "]: nothing to do, reusing parent image");
            continue;
        }

        const auto resolution = cache_.acquire(stage.hash, [&] { return build_stage(stage, parent, log); });
        if (resolution.source != ImageCache::Source::Built) {
            ++cache_hits_;
            log.info("stage " + stage.name + " [" + short_hash + "]: cached (" +
                     std::string{source_name(resolution.source)} + ") " + resolution.image);
        }
        parent = resolution.image;
    }
    return parent;
}

std::string BuildPipeline::build_stage(const Stage& stage, const std::string& parent, Logger& log) {
    const std::string short_hash = stage.hash.substr(0, 12);
    log.info("stage " + stage.name + " [" + short_hash + "]: building from " + parent +
             (stage.network_isolated ? " (network disabled)" : ""));

    ContainerOptions options;
    options.image = parent;
    options.name = "patchgrade-build-" + short_hash + "-" + std::to_string(++container_seq_);
    options.network_disabled = stage.network_isolated;
    options.working_dir = "/";

    BuildContainer container(runtime_, runtime_.create_container(options), log);

    std::string transcript;
    for (const auto& file : stage.files) {
        transcript += "# write " + file.path + " (" + std::to_string(file.content.size()) + " bytes)\n";
        try {
            runtime_.write_file(container.id(), file.path, file.content);
        } catch (const InternalError& e) {
            transcript += std::string{e.what()} + "\n";
            const auto excerpt = tail_excerpt(transcript, config_.log_excerpt_bytes);
            log.error("stage " + stage.name + " [" + short_hash + "] could not write " + file.path + "\n" + excerpt);
            throw BuildError(stage.name, -1, excerpt);
        }
    }
    for (const auto& command : stage.commands) {
        transcript += "$ " + command + "\n";
        const auto result = runtime_.exec(container.id(), command, config_.stage_timeout);
        transcript += result.stdout_text;
        transcript += result.stderr_text;
        if (result.timed_out || result.exit_code != 0) {
            if (result.timed_out) {
                transcript += "\n[stage command timed out]\n";
            }
            const auto excerpt = tail_excerpt(transcript, config_.log_excerpt_bytes);
            log.error("stage " + stage.name + " [" + short_hash + "] failed with exit code " +
                      std::to_string(result.exit_code) + "\n" + excerpt);
            throw BuildError(stage.name, result.exit_code, excerpt);
        }
    }
    log.debug("stage " + stage.name + " output:\n" + tail_excerpt(transcript, config_.log_excerpt_bytes));

    const std::string image = runtime_.commit(container.id(), image_tag(stage.hash));
    ++commits_;
    log.info("stage " + stage.name + " [" + short_hash + "]: committed " + image);
    return image;
}

BuildPipeline::Stats BuildPipeline::stats() const noexcept {
    return Stats{commits_.load(), cache_hits_.load()};
}

std::string BuildPipeline::image_tag(const std::string& hash) const {
    return config_.image_repository + ":" + hash.substr(0, config_.tag_hash_chars);
}

ImageCache::LocalProbe BuildPipeline::local_probe(ContainerRuntime& runtime) {
    return local_probe(runtime, Config{});
}

ImageCache::LocalProbe BuildPipeline::local_probe(ContainerRuntime& runtime, Config config) {
    return [&runtime, config = std::move(config)](const std::string& hash) -> std::optional<std::string> {
        const std::string tag = config.image_repository + ":" + hash.substr(0, config.tag_hash_chars);
        if (runtime.image_exists(tag)) {
            return tag;
        }
        return std::nullopt;
    };
}

}  // namespace patchgrade::harness
