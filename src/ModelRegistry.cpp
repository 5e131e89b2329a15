#include "ModelRegistry.h"

#include "HeliosExceptions.h"

#include <exception>
#include <iostream>
#include <utility>

const char* registryStateName(RegistryState state) noexcept {
    switch (state) {
        case RegistryState::Empty: return "empty";
        case RegistryState::Loading: return "loading";
        case RegistryState::Ready: return "ready";
        case RegistryState::Unloaded: return "unloaded";
    }
    return "unknown";
}

ModelRegistry::ModelRegistry(ArtifactStore store) : artifactStore(std::move(store)) {}

bool ModelRegistry::load(const std::string& version) {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex);

    const RegistryState previous = currentState.load(std::memory_order_acquire);
    if (previous == RegistryState::Unloaded) {
        std::lock_guard<std::mutex> guard(errorMutex);
        lastFailure = "registry has been unloaded";
        std::cerr << "[HeliosRegistry] load_refused version=" << version << " state=unloaded\n";
        return false;
    }

    currentState.store(RegistryState::Loading, std::memory_order_release);
    std::cout << "[HeliosRegistry] loading version=" << version
              << " artifact_dir=" << artifactStore.baseDirectory() << "\n";

    std::shared_ptr<const ArtifactPair> loaded;
    try {
        loaded = std::make_shared<const ArtifactPair>(artifactStore.load(version));
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> guard(errorMutex);
            lastFailure = e.what();
        }
        currentState.store(previous, std::memory_order_release);
        std::cerr << "[HeliosRegistry] load_failed version=" << version
                  << " state=" << registryStateName(previous)
                  << " error=" << e.what() << "\n";
        return false;
    }

    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        active = loaded;
    }
    {
        std::lock_guard<std::mutex> guard(errorMutex);
        lastFailure.clear();
    }
    currentState.store(RegistryState::Ready, std::memory_order_release);

    std::cout << "[HeliosRegistry] loaded version=" << loaded->version
              << " features=" << loaded->scaler.featureCount()
              << " trees=" << loaded->regressor.treeCount() << "\n";
    return true;
}

bool ModelRegistry::isReady() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return active != nullptr;
}

std::shared_ptr<const ArtifactPair> ModelRegistry::current() const {
    std::shared_ptr<const ArtifactPair> pair = tryCurrent();
    if (!pair) {
        throw Helios::ServiceUnavailableException("model artifacts are not loaded");
    }
    return pair;
}

std::shared_ptr<const ArtifactPair> ModelRegistry::tryCurrent() const {
    std::shared_lock<std::shared_mutex> lock(mutex);
    return active;
}

void ModelRegistry::unload() {
    std::lock_guard<std::mutex> lifecycle(lifecycleMutex);

    std::shared_ptr<const ArtifactPair> released;
    {
        std::unique_lock<std::shared_mutex> lock(mutex);
        released = std::move(active);
        active.reset();
    }
    currentState.store(RegistryState::Unloaded, std::memory_order_release);

    // In-flight requests may still hold their own reference; memory is
    // released when the last one finishes.
    std::cout << "[HeliosRegistry] unloaded version=" << (released ? released->version : std::string("none"))
              << " outstanding_refs=" << (released ? released.use_count() - 1 : 0) << "\n";
}

std::string ModelRegistry::lastError() const {
    std::lock_guard<std::mutex> guard(errorMutex);
    return lastFailure;
}
