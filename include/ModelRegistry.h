#pragma once

#include "ArtifactStore.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

enum class RegistryState { Empty, Loading, Ready, Unloaded };

const char* registryStateName(RegistryState state) noexcept;

// Process-wide holder of the active ArtifactPair. Readers copy the shared
// pointer under a shared lock and keep using their copy lock-free; load and
// unload swap the pointer under the exclusive lock.
class ModelRegistry {
public:
    explicit ModelRegistry(ArtifactStore store);

    /**
     * @brief Loads the artifacts for `version` and installs them.
     * @post On success state is Ready and current() returns the new pair.
     *       On failure the previously installed pair (if any) stays active,
     *       lastError() describes the failure and false is returned.
     * Never throws. Refused once unload() has been called.
     */
    bool load(const std::string& version);

    bool isReady() const;

    /// @throws Helios::ServiceUnavailableException when no pair is installed.
    std::shared_ptr<const ArtifactPair> current() const;

    /// Same as current() but returns nullptr instead of throwing.
    std::shared_ptr<const ArtifactPair> tryCurrent() const;

    void unload();

    RegistryState state() const noexcept { return currentState.load(std::memory_order_acquire); }
    std::string lastError() const;
    const ArtifactStore& store() const noexcept { return artifactStore; }

private:
    ArtifactStore artifactStore;

    mutable std::shared_mutex mutex;
    std::shared_ptr<const ArtifactPair> active;

    std::mutex lifecycleMutex;
    std::atomic<RegistryState> currentState{RegistryState::Empty};

    mutable std::mutex errorMutex;
    std::string lastFailure;
};
