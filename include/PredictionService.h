#pragma once

#include "AuditLogger.h"
#include "InferenceEngine.h"
#include "ModelRegistry.h"
#include "RequestMonitor.h"

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>

namespace httplib {
class Server;
}

struct ServiceResponse {
    int status = 200;
    std::string body;
    std::string contentType = "application/json";
};

// HTTP surface. Handlers are plain functions of the request body so they can
// be exercised without a socket; start() binds them to an httplib server.
class PredictionService {
public:
    struct Config {
        std::string host = "0.0.0.0";
        int port = 8000; // 0 binds an ephemeral port, see boundPort()
        size_t threadCount = 8;
        bool quiet = false;
    };

    static constexpr const char* kUnavailableDetail = "ML Model is not loaded available";
    static constexpr const char* kInternalErrorDetail = "Internal processing error";

    PredictionService(ModelRegistry& registry, AuditLogger& audit, RequestMonitor& monitor);
    ~PredictionService();

    ServiceResponse handleRoot() const;
    ServiceResponse handleHealth() const;
    ServiceResponse handleDocs() const;
    ServiceResponse handlePredict(const std::string& body);

    /// Blocks serving requests until stop(); returns non-zero if binding failed.
    /// Returns 0 without listening when stop() was requested beforehand.
    int start(const Config& config);

    /// Safe from any thread at any time, including before or during start().
    void stop();
    bool isRunning() const;
    bool stopRequested() const noexcept { return stopFlag.load(std::memory_order_acquire); }
    int boundPort() const noexcept { return listeningPort.load(std::memory_order_acquire); }

    void setQuiet(bool value) noexcept { quiet = value; }

private:
    void logMonitoringLine(const std::string& endpoint, int status, double latencyMs) const;

    ModelRegistry& registry;
    AuditLogger& audit;
    RequestMonitor& monitor;
    InferenceEngine engine;

    std::unique_ptr<httplib::Server> server;
    std::atomic<int> listeningPort{0};
    std::atomic<bool> stopFlag{false};
    std::atomic<bool> serving{false};
    bool quiet = false;
};
