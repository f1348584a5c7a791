#include "daemon/transcription/provider_registry.h"

#include "core/error_codes.h"
#include "logging/logger.h"

namespace daemon_transcription {

void ProviderRegistry::registerFactory(const std::string& name, Factory factory) {
    std::lock_guard<std::mutex> lock(mapMutex_);
    auto entry = std::make_unique<Entry>();
    entry->factory = std::move(factory);
    entries_[name] = std::move(entry);
}

bool ProviderRegistry::has(const std::string& name) const {
    return find(name) != nullptr;
}

std::vector<std::string> ProviderRegistry::names() const {
    std::lock_guard<std::mutex> lock(mapMutex_);
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        out.push_back(name);
    }
    return out;
}

ProviderRegistry::Entry* ProviderRegistry::find(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mapMutex_);
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : it->second.get();
}

std::shared_ptr<TranscriptionProvider> ProviderRegistry::get(const std::string& name) {
    Entry* entry = find(name);
    if (!entry) {
        throw voxd::ProviderError(voxd::ErrorCode::PROVIDER_UNAVAILABLE,
                                  "unknown transcription provider '" + name + "'");
    }

    if (entry->ready.load(std::memory_order_acquire)) {
        return entry->instance;
    }

    std::lock_guard<std::mutex> lock(entry->mutex);
    if (!entry->ready.load(std::memory_order_relaxed)) {
        auto instance = entry->factory ? entry->factory() : nullptr;
        if (!instance) {
            throw voxd::ProviderError(voxd::ErrorCode::PROVIDER_UNAVAILABLE,
                                      "transcription provider '" + name + "' is not available");
        }
        LOG_INFO("Transcription provider '{}' initialized", name);
        entry->instance = std::move(instance);
        entry->ready.store(true, std::memory_order_release);
    }
    return entry->instance;
}

size_t ProviderRegistry::constructedCount() const {
    std::lock_guard<std::mutex> lock(mapMutex_);
    size_t count = 0;
    for (const auto& [name, entry] : entries_) {
        if (entry->ready.load(std::memory_order_acquire)) {
            ++count;
        }
    }
    return count;
}

}  // namespace daemon_transcription
