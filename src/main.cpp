#include "AuditLogger.h"
#include "HeliosExceptions.h"
#include "ModelRegistry.h"
#include "PredictionService.h"
#include "RequestMonitor.h"
#include "ServiceConfig.h"

#include <atomic>
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <pthread.h>
#include <thread>

namespace {
// Blocks SIGINT/SIGTERM in every thread; a dedicated watcher receives them
// with sigwait and stops the server outside signal context.
sigset_t blockShutdownSignals() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    return signals;
}

// Joined on every exit path; a signal that arrives before the server listens
// still reaches PredictionService::stop().
class ShutdownWatcher {
public:
    ShutdownWatcher(PredictionService& service, const sigset_t& signals)
        : thread([this, &service, signals] { run(service, signals); }) {}

    ~ShutdownWatcher() {
        releasing.store(true);
        if (!finished.load()) {
            pthread_kill(thread.native_handle(), SIGTERM);
        }
        thread.join();
    }

    ShutdownWatcher(const ShutdownWatcher&) = delete;
    ShutdownWatcher& operator=(const ShutdownWatcher&) = delete;

private:
    void run(PredictionService& service, sigset_t signals) {
        int received = 0;
        if (sigwait(&signals, &received) == 0 && !releasing.load()) {
            std::cout << "[Helios] signal=" << strsignal(received) << " shutting_down=true\n";
        }
        service.stop();
        finished.store(true);
    }

    std::atomic<bool> finished{false};
    std::atomic<bool> releasing{false};
    std::thread thread;
};
} // namespace

int main(int argc, char* argv[]) {
    ServiceConfig config;
    try {
        config = ServiceConfig::fromArgs(argc, argv);
    } catch (const Helios::HeliosException& e) {
        std::cerr << "[Helios Error] " << e.what() << "\n";
        std::cerr << ServiceConfig::usage(argv[0]);
        return 1;
    }

    if (config.showHelp) {
        std::cout << ServiceConfig::usage(argv[0]);
        return 0;
    }

    std::cout << "[Helios] Solar power forecast service starting...\n";
    const sigset_t signals = blockShutdownSignals();

    try {
        ModelRegistry registry{ArtifactStore(config.artifactDir)};
        AuditLogger audit(config.auditLogPath, config.auditEnabled);
        RequestMonitor monitor;
        PredictionService service(registry, audit, monitor);

        int rc = 0;
        {
            ShutdownWatcher watcher(service, signals);

            // A failed load leaves the service up in degraded mode (503 on /predict).
            if (!registry.load(config.modelVersion)) {
                std::cerr << "[Helios] model_unavailable version=" << config.modelVersion
                          << " artifact_dir=" << config.artifactDir << "\n";
            }

            PredictionService::Config serviceConfig;
            serviceConfig.host = config.host;
            serviceConfig.port = config.port;
            serviceConfig.threadCount = config.threadCount;
            serviceConfig.quiet = config.quiet;
            rc = service.start(serviceConfig);
        }

        registry.unload();
        audit.flush();
        std::cout << "[Helios] audit_rows_written=" << audit.writtenRecords()
                  << " audit_rows_dropped=" << audit.droppedRecords() << "\n";
        return rc;
    } catch (const Helios::HeliosException& e) {
        std::cerr << "[Helios Error] " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[Helios Exception] " << e.what() << "\n";
        return 1;
    }
}
