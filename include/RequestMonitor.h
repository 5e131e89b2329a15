#pragma once

#include <atomic>
#include <cstdint>
#include <limits>
#include <mutex>
#include <string>

struct PredictionDistributionStats {
    uint64_t count = 0;
    double min = std::numeric_limits<double>::infinity();
    double max = -std::numeric_limits<double>::infinity();
    double mean = 0.0;
};

struct MonitoringSnapshot {
    uint64_t totalRequests = 0;
    uint64_t predictRequests = 0;
    uint64_t errorRequests = 0;
    uint64_t unavailableRequests = 0;
    uint64_t rejectedRequests = 0;
    double averageLatencyMs = 0.0;
    PredictionDistributionStats predictions;
};

class RequestMonitor {
public:
    void recordSuccess(const std::string& endpoint, double latencyMs);
    void recordPrediction(double latencyMs, double prediction);
    // status is the HTTP status returned to the caller (422, 500, 503, ...).
    void recordError(const std::string& endpoint, int status, double latencyMs);
    MonitoringSnapshot snapshot() const;

private:
    void countRequest(const std::string& endpoint, double latencyMs);

    std::atomic<uint64_t> totalRequests{0};
    std::atomic<uint64_t> predictRequests{0};
    std::atomic<uint64_t> errorRequests{0};
    std::atomic<uint64_t> unavailableRequests{0};
    std::atomic<uint64_t> rejectedRequests{0};
    std::atomic<uint64_t> totalLatencyMicros{0};

    mutable std::mutex distributionMutex;
    uint64_t predictionCount = 0;
    double predictionSum = 0.0;
    double predictionMin = std::numeric_limits<double>::infinity();
    double predictionMax = -std::numeric_limits<double>::infinity();
};
