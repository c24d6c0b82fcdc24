#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <string>

#include "container_runtime.hpp"
#include "image_cache.hpp"
#include "logger.hpp"
#include "spec_resolver.hpp"

namespace patchgrade::harness {

/**
 * \brief Executes BuildPlan stages against a container runtime.
 *
 * Every stage is resolved through the image cache. On a miss a container is
 * started from the parent image (without network for isolated stages), the
 * stage commands run in order, and the container is committed as
 * `<image_repository>:<hash prefix>`. The container is removed whatever
 * happens. A stage without commands reuses its parent image.
 *
 * Safe to call from several workers at once; concurrent builds of the same
 * stage hash are collapsed by the cache.
 */
class BuildPipeline {
public:
    struct Config {
        std::string image_repository{"patchgrade-stage"};
        std::chrono::milliseconds stage_timeout{std::chrono::minutes(30)};
        std::size_t log_excerpt_bytes{16 * 1024};
        std::size_t tag_hash_chars{24};
    };

    struct Stats {
        std::size_t commits{0};
        std::size_t cache_hits{0};
    };

    BuildPipeline(ContainerRuntime& runtime, ImageCache& cache);
    BuildPipeline(ContainerRuntime& runtime, ImageCache& cache, Config config, Logger& log = Logger::null());

    /// Returns the image reference of the final stage. Throws BuildError on the first failing stage.
    std::string build(const BuildPlan& plan);
    std::string build(const BuildPlan& plan, Logger& log);

    [[nodiscard]] Stats stats() const noexcept;

    /// Image tag a stage hash is committed under.
    [[nodiscard]] std::string image_tag(const std::string& hash) const;

    /// Local probe for ImageCache::Config: finds stage images left by earlier runs.
    [[nodiscard]] static ImageCache::LocalProbe local_probe(ContainerRuntime& runtime);
    [[nodiscard]] static ImageCache::LocalProbe local_probe(ContainerRuntime& runtime, Config config);

private:
    std::string build_stage(const Stage& stage, const std::string& parent, Logger& log);

    ContainerRuntime& runtime_;
    ImageCache& cache_;
    Config config_;
    Logger& log_;
    std::atomic<std::size_t> commits_{0};
    std::atomic<std::size_t> cache_hits_{0};
    std::atomic<std::size_t> container_seq_{0};
};

}  // namespace patchgrade::harness
