#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "logger.hpp"

namespace patchgrade::harness {

/**
 * \brief Optional remote side channel of the image cache.
 *
 * pull() returns a local image reference on a remote hit and nullopt when the
 * registry simply does not have the hash. Every other failure is a
 * RegistryError; `auth_failure()` on that error switches the cache to
 * local-only mode for the rest of the run. Implementations are shared by all
 * workers and must allow concurrent calls.
 */
class RegistrySync {
public:
    virtual ~RegistrySync() = default;

    virtual std::optional<std::string> pull(const std::string& hash) = 0;
    virtual void push(const std::string& hash, const std::string& image) = 0;
};

/**
 * \brief Content-addressed map from stage hash to image reference.
 *
 * Lookups and stores may come from any worker. acquire() deduplicates
 * concurrent work per hash: the first caller produces the image, racers block
 * on that hash's entry (not on the whole cache) and reuse the result. Entries
 * are never mutated once published and never evicted by the cache itself.
 *
 * Resolution order inside acquire(): memory → local probe → registry pull →
 * build (then push).
 */
class ImageCache {
public:
    enum class Source { Memory, Local, Registry, Built };

    struct Resolution {
        std::string image;
        Source source{Source::Memory};
    };

    using Producer = std::function<std::string()>;
    using LocalProbe = std::function<std::optional<std::string>(const std::string& hash)>;

    struct Config {
        std::shared_ptr<RegistrySync> registry{};
        bool pull_from_registry{true};
        bool push_to_registry{true};
        LocalProbe local_probe{};
    };

    ImageCache();
    explicit ImageCache(Config config, Logger& log = Logger::null());

    ImageCache(const ImageCache&) = delete;
    ImageCache& operator=(const ImageCache&) = delete;

    [[nodiscard]] std::optional<std::string> lookup(const std::string& hash) const;

    /// First writer wins; returns false (and keeps the existing image) when the hash is already stored.
    bool store(const std::string& hash, const std::string& image);

    /// Resolves `hash`, invoking `build` at most once per hash across all threads.
    /// A failed build is remembered and rethrown to every later caller for that hash.
    Resolution acquire(const std::string& hash, const Producer& build);

    [[nodiscard]] bool registry_enabled() const noexcept;
    [[nodiscard]] std::size_t size() const;

private:
    struct Entry {
        std::mutex mutex;
        std::condition_variable ready_cv;
        bool building{false};
        std::optional<std::string> image;
        std::exception_ptr failure;
    };

    std::shared_ptr<Entry> entry_for(const std::string& hash);
    Resolution produce(const std::string& hash, const Producer& build);
    std::optional<std::string> try_pull(const std::string& hash);
    void try_push(const std::string& hash, const std::string& image);

    Config config_;
    Logger& log_;
    std::atomic<bool> registry_disabled_{false};
    mutable std::mutex map_mutex_;
    std::map<std::string, std::shared_ptr<Entry>> entries_;
};

}  // namespace patchgrade::harness
