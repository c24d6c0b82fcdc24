#include "patchgrade_harness/image_cache.hpp"
#include "patchgrade_harness/errors.hpp"

#include <string>
#include <utility>
#include <vector>

namespace patchgrade::harness {

ImageCache::ImageCache() : ImageCache(Config{}) {}

ImageCache::ImageCache(Config config, Logger& log) : config_{std::move(config)}, log_{log} {}

std::shared_ptr<ImageCache::Entry> ImageCache::entry_for(const std::string& hash) {
    std::lock_guard<std::mutex> guard(map_mutex_);
    auto& slot = entries_[hash];
    if (!slot) {
        slot = std::make_shared<Entry>();
    }
    return slot;
}

std::optional<std::string> ImageCache::lookup(const std::string& hash) const {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard<std::mutex> guard(map_mutex_);
        const auto it = entries_.find(hash);
        if (it == entries_.end()) {
            return std::nullopt;
        }
        entry = it->second;
    }
    std::lock_guard<std::mutex> guard(entry->mutex);
    return entry->image;
}

bool ImageCache::store(const std::string& hash, const std::string& image) {
    auto entry = entry_for(hash);
    std::lock_guard<std::mutex> guard(entry->mutex);
    if (entry->image) {
        return false;
    }
    entry->image = image;
    entry->failure = nullptr;
    entry->ready_cv.notify_all();
    return true;
}

ImageCache::Resolution ImageCache::acquire(const std::string& hash, const Producer& build) {
    auto entry = entry_for(hash);

    std::unique_lock<std::mutex> lock(entry->mutex);
    entry->ready_cv.wait(lock, [&] { return entry->image || entry->failure || !entry->building; });
    if (entry->image) {
        return Resolution{*entry->image, Source::Memory};
    }
    if (entry->failure) {
        std::rethrow_exception(entry->failure);
    }
    entry->building = true;
    lock.unlock();

    // Racers for this hash block on the entry; the map and every other entry stay available.
    Resolution resolution;
    std::exception_ptr failure;
    try {
        resolution = produce(hash, build);
    } catch (...) {
        failure = std::current_exception();
    }

    lock.lock();
    entry->building = false;
    if (failure) {
        entry->failure = failure;
        entry->ready_cv.notify_all();
        std::rethrow_exception(failure);
    }
    if (entry->image) {
        // store() from another path won the race; keep the first image.
        resolution.image = *entry->image;
    } else {
        entry->image = resolution.image;
    }
    entry->ready_cv.notify_all();
    return resolution;
}

ImageCache::Resolution ImageCache::produce(const std::string& hash, const Producer& build) {
    if (config_.local_probe) {
        if (auto local = config_.local_probe(hash)) {
            return Resolution{std::move(*local), Source::Local};
        }
    }
    if (auto pulled = try_pull(hash)) {
        log_.info("registry hit for " + hash.substr(0, 12));
        return Resolution{std::move(*pulled), Source::Registry};
    }

    Resolution resolution{build(), Source::Built};
    try_push(hash, resolution.image);
    return resolution;
}

std::optional<std::string> ImageCache::try_pull(const std::string& hash) {
    if (!config_.registry || !config_.pull_from_registry || registry_disabled_.load()) {
        return std::nullopt;
    }
    try {
        return config_.registry->pull(hash);
    } catch (const RegistryError& e) {
        if (e.auth_failure()) {
            if (!registry_disabled_.exchange(true)) {
                log_.warning(std::string{"registry authentication failed, continuing local-only: "} + e.what());
            }
        } else {
            log_.warning(std::string{"registry pull failed for "} + hash.substr(0, 12) + ": " + e.what());
        }
    }
    return std::nullopt;
}

void ImageCache::try_push(const std::string& hash, const std::string& image) {
    if (!config_.registry || !config_.push_to_registry || registry_disabled_.load()) {
        return;
    }
    try {
        config_.registry->push(hash, image);
        log_.debug("pushed " + image + " for " + hash.substr(0, 12));
    } catch (const RegistryError& e) {
        if (e.auth_failure()) {
            if (!registry_disabled_.exchange(true)) {
                log_.warning(std::string{"registry authentication failed, continuing local-only: "} + e.what());
            }
        } else {
            log_.warning(std::string{"registry push failed for "} + hash.substr(0, 12) + ": " + e.what());
        }
    }
}

bool ImageCache::registry_enabled() const noexcept {
    return config_.registry != nullptr && !registry_disabled_.load();
}

std::size_t ImageCache::size() const {
    std::vector<std::shared_ptr<Entry>> snapshot;
    {
        std::lock_guard<std::mutex> guard(map_mutex_);
        snapshot.reserve(entries_.size());
        for (const auto& [hash, entry] : entries_) {
            snapshot.push_back(entry);
        }
    }
    std::size_t count = 0;
    for (const auto& entry : snapshot) {
        std::lock_guard<std::mutex> guard(entry->mutex);
        if (entry->image) ++count;
    }
    return count;
}

}  // namespace patchgrade::harness
