#pragma once

#include "daemon/transcription/transcription_provider.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace daemon_transcription {

// Constructed once at startup and passed by reference. Provider clients are
// built lazily on first use and then shared read-only.
class ProviderRegistry {
   public:
    using Factory = std::function<std::shared_ptr<TranscriptionProvider>()>;

    // Registration happens before the registry is shared with workers.
    void registerFactory(const std::string& name, Factory factory);

    bool has(const std::string& name) const;
    std::vector<std::string> names() const;

    // Throws voxd::ProviderError(PROVIDER_UNAVAILABLE) for unknown names or
    // factories that yield nothing.
    std::shared_ptr<TranscriptionProvider> get(const std::string& name);

    // Instances built so far.
    size_t constructedCount() const;

   private:
    struct Entry {
        Factory factory;
        std::mutex mutex;
        std::atomic<bool> ready{false};
        std::shared_ptr<TranscriptionProvider> instance;
    };

    Entry* find(const std::string& name) const;

    mutable std::mutex mapMutex_;
    std::map<std::string, std::unique_ptr<Entry>> entries_;
};

}  // namespace daemon_transcription
