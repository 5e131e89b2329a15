#include "RequestMonitor.h"

#include <algorithm>
#include <cmath>

namespace {
uint64_t toLatencyMicros(double latencyMs) {
    if (!std::isfinite(latencyMs) || latencyMs <= 0.0) return 0;
    return static_cast<uint64_t>(std::llround(latencyMs * 1000.0));
}
} // namespace

void RequestMonitor::countRequest(const std::string& endpoint, double latencyMs) {
    totalRequests.fetch_add(1, std::memory_order_relaxed);
    if (endpoint == "/predict") {
        predictRequests.fetch_add(1, std::memory_order_relaxed);
    }
    totalLatencyMicros.fetch_add(toLatencyMicros(latencyMs), std::memory_order_relaxed);
}

void RequestMonitor::recordSuccess(const std::string& endpoint, double latencyMs) {
    countRequest(endpoint, latencyMs);
}

void RequestMonitor::recordPrediction(double latencyMs, double prediction) {
    countRequest("/predict", latencyMs);
    if (!std::isfinite(prediction)) return;

    std::lock_guard<std::mutex> lock(distributionMutex);
    predictionCount += 1;
    predictionSum += prediction;
    predictionMin = std::min(predictionMin, prediction);
    predictionMax = std::max(predictionMax, prediction);
}

void RequestMonitor::recordError(const std::string& endpoint, int status, double latencyMs) {
    countRequest(endpoint, latencyMs);
    if (status == 503) {
        unavailableRequests.fetch_add(1, std::memory_order_relaxed);
    } else if (status >= 400 && status < 500) {
        rejectedRequests.fetch_add(1, std::memory_order_relaxed);
    } else {
        errorRequests.fetch_add(1, std::memory_order_relaxed);
    }
}

MonitoringSnapshot RequestMonitor::snapshot() const {
    MonitoringSnapshot out;
    out.totalRequests = totalRequests.load(std::memory_order_relaxed);
    out.predictRequests = predictRequests.load(std::memory_order_relaxed);
    out.errorRequests = errorRequests.load(std::memory_order_relaxed);
    out.unavailableRequests = unavailableRequests.load(std::memory_order_relaxed);
    out.rejectedRequests = rejectedRequests.load(std::memory_order_relaxed);

    const uint64_t latencyMicros = totalLatencyMicros.load(std::memory_order_relaxed);
    if (out.totalRequests > 0) {
        out.averageLatencyMs = static_cast<double>(latencyMicros) / static_cast<double>(out.totalRequests) / 1000.0;
    }

    std::lock_guard<std::mutex> lock(distributionMutex);
    out.predictions.count = predictionCount;
    if (predictionCount > 0) {
        out.predictions.mean = predictionSum / static_cast<double>(predictionCount);
        out.predictions.min = predictionMin;
        out.predictions.max = predictionMax;
    }
    return out;
}
