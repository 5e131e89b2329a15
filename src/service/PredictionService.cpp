#include "PredictionService.h"

#include "CommonUtils.h"
#include "FeatureRecord.h"
#include "HeliosExceptions.h"
#include "JsonValue.h"
#include "RequestValidator.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>

#include <httplib.h>

namespace {
using Clock = std::chrono::steady_clock;

constexpr size_t kMaxRequestBodyBytes = 64 * 1024;

double elapsedMs(Clock::time_point started) {
    return std::chrono::duration<double, std::milli>(Clock::now() - started).count();
}

ServiceResponse jsonResponse(int status, const std::string& payload) {
    ServiceResponse out;
    out.status = status;
    out.body = payload;
    return out;
}

std::string makeDetailResponse(const std::string& detail) {
    return "{\"detail\":\"" + escapeJsonString(detail) + "\"}";
}

std::string makeValidationResponse(const std::vector<Helios::FieldViolation>& violations) {
    std::ostringstream out;
    out << "{\"detail\":[";
    for (size_t i = 0; i < violations.size(); ++i) {
        const auto& v = violations[i];
        if (i > 0) out << ',';
        out << "{\"type\":\"" << escapeJsonString(v.type) << "\","
            << "\"loc\":[\"body\"";
        if (!v.field.empty()) {
            out << ",\"" << escapeJsonString(v.field) << "\"";
        }
        out << "],"
            << "\"msg\":\"" << escapeJsonString(v.message) << "\"";
        if (!v.inputJson.empty()) {
            out << ",\"input\":" << v.inputJson;
        }
        if (!v.contextJson.empty()) {
            out << ",\"ctx\":" << v.contextJson;
        }
        out << '}';
    }
    out << "]}";
    return out.str();
}

std::string makePredictSuccessResponse(const PredictionResult& result) {
    std::ostringstream out;
    out << "{"
        << "\"predicted_power\":" << CommonUtils::formatDouble(result.value) << ","
        << "\"unit\":\"" << escapeJsonString(result.unit) << "\","
        << "\"model_version\":\"" << escapeJsonString(result.modelVersion) << "\""
        << "}";
    return out.str();
}

std::string describeBounds(const FeatureField& field) {
    if (field.minInclusive && field.maxInclusive) {
        return CommonUtils::formatDouble(*field.minInclusive) + " &le; x &le; " +
               CommonUtils::formatDouble(*field.maxInclusive);
    }
    if (field.minInclusive) return "x &ge; " + CommonUtils::formatDouble(*field.minInclusive);
    if (field.maxInclusive) return "x &le; " + CommonUtils::formatDouble(*field.maxInclusive);
    return "unbounded";
}

void applyResponse(const ServiceResponse& in, httplib::Response& out) {
    out.status = in.status;
    out.set_content(in.body, in.contentType.c_str());
}
} // namespace

PredictionService::PredictionService(ModelRegistry& registryRef, AuditLogger& auditRef, RequestMonitor& monitorRef)
    : registry(registryRef),
      audit(auditRef),
      monitor(monitorRef),
      engine(registryRef),
      server(std::make_unique<httplib::Server>()) {}

PredictionService::~PredictionService() = default;

ServiceResponse PredictionService::handleRoot() const {
    const bool ready = registry.isReady();
    std::ostringstream out;
    out << "{"
        << "\"status\":\"" << (ready ? "ok" : "warning") << "\","
        << "\"message\":\""
        << (ready ? "Solar Forecasting API is ready" : "Service running but models not loaded") << "\","
        << "\"documentation_url\":\"/docs\""
        << "}";
    return jsonResponse(200, out.str());
}

ServiceResponse PredictionService::handleHealth() const {
    const auto pair = registry.tryCurrent();
    std::ostringstream out;
    out << "{"
        << "\"status\":\"ok\","
        << "\"model_version\":\"" << escapeJsonString(pair ? pair->version : std::string("none")) << "\""
        << "}";
    return jsonResponse(200, out.str());
}

ServiceResponse PredictionService::handleDocs() const {
    std::ostringstream out;
    out << "<!DOCTYPE html>\n<html><head><meta charset=\"utf-8\"><title>Solar Power Prediction API</title></head><body>\n"
        << "<h1>Solar Power Prediction API</h1>\n"
        << "<p>Forecasts instantaneous solar power output from weather and lag features.</p>\n"
        << "<h2>Endpoints</h2>\n<ul>\n"
        << "<li><code>GET /</code> service status (<code>ok</code> or <code>warning</code> when no model is loaded)</li>\n"
        << "<li><code>GET /health</code> liveness and active model version</li>\n"
        << "<li><code>POST /predict</code> JSON body with the fields below; returns "
        << "<code>{predicted_power, unit, model_version}</code>. "
        << "422 on invalid input, 503 when no model is loaded, 500 on inference failure.</li>\n"
        << "</ul>\n<h2>Request fields</h2>\n"
        << "<table border=\"1\"><tr><th>Field</th><th>Bounds</th><th>Description</th><th>Example</th></tr>\n";
    for (const auto& field : featureLayout()) {
        out << "<tr><td><code>" << field.wireName << "</code></td><td>" << describeBounds(field) << "</td><td>"
            << field.description << "</td><td>" << CommonUtils::formatDouble(field.example) << "</td></tr>\n";
    }
    out << "</table>\n</body></html>\n";

    ServiceResponse response;
    response.body = out.str();
    response.contentType = "text/html; charset=utf-8";
    return response;
}

ServiceResponse PredictionService::handlePredict(const std::string& body) {
    const auto started = Clock::now();
    int status = 200;
    ServiceResponse response;

    try {
        if (!registry.isReady()) {
            throw Helios::ServiceUnavailableException("model artifacts are not loaded");
        }

        const FeatureRecord record = RequestValidator::validateBody(body);
        const FeatureVector features = FeatureAssembler::assemble(record);
        const PredictionResult result = engine.predict(features);

        response = jsonResponse(200, makePredictSuccessResponse(result));

        // The response is final at this point; auditing cannot change it.
        audit.record(record, result);
        monitor.recordPrediction(elapsedMs(started), result.value);
    } catch (const Helios::ValidationException& e) {
        status = 422;
        response = jsonResponse(status, makeValidationResponse(e.violations()));
    } catch (const Helios::ServiceUnavailableException&) {
        status = 503;
        response = jsonResponse(status, makeDetailResponse(kUnavailableDetail));
    } catch (const Helios::InferenceException& e) {
        status = 500;
        std::cerr << "[HeliosService][Error] endpoint=/predict prediction_failed error=" << e.what() << "\n";
        response = jsonResponse(status, makeDetailResponse(kInternalErrorDetail));
    } catch (const std::exception& e) {
        status = 500;
        std::cerr << "[HeliosService][Error] endpoint=/predict unexpected_error=" << e.what() << "\n";
        response = jsonResponse(status, makeDetailResponse(kInternalErrorDetail));
    }

    const double latencyMs = elapsedMs(started);
    if (status != 200) {
        monitor.recordError("/predict", status, latencyMs);
    }
    logMonitoringLine("/predict", status, latencyMs);
    return response;
}

void PredictionService::logMonitoringLine(const std::string& endpoint, int status, double latencyMs) const {
    if (quiet) return;
    const MonitoringSnapshot snapshot = monitor.snapshot();
    std::ostringstream line;
    line << "[HeliosService][Monitor] endpoint=" << endpoint
         << " status=" << status
         << " latency_ms=" << latencyMs
         << " total_requests=" << snapshot.totalRequests
         << " rejected=" << snapshot.rejectedRequests
         << " unavailable=" << snapshot.unavailableRequests
         << " errors=" << snapshot.errorRequests
         << " avg_latency_ms=" << snapshot.averageLatencyMs;
    if (snapshot.predictions.count > 0) {
        line << " prediction_mean=" << snapshot.predictions.mean
             << " prediction_min=" << snapshot.predictions.min
             << " prediction_max=" << snapshot.predictions.max;
    }
    std::cout << line.str() << "\n";
}

int PredictionService::start(const Config& config) {
    serving.store(true, std::memory_order_release);
    struct ServingGuard {
        std::atomic<bool>& flag;
        ~ServingGuard() { flag.store(false, std::memory_order_release); }
    } servingGuard{serving};

    quiet = config.quiet;
    server->new_task_queue = [threadCount = std::max<size_t>(1, config.threadCount)] {
        return new httplib::ThreadPool(threadCount);
    };
    server->set_payload_max_length(kMaxRequestBodyBytes);

    server->Get("/", [this](const httplib::Request&, httplib::Response& response) {
        const auto started = Clock::now();
        applyResponse(handleRoot(), response);
        monitor.recordSuccess("/", elapsedMs(started));
    });

    server->Get("/health", [this](const httplib::Request&, httplib::Response& response) {
        const auto started = Clock::now();
        applyResponse(handleHealth(), response);
        monitor.recordSuccess("/health", elapsedMs(started));
    });

    server->Get("/docs", [this](const httplib::Request&, httplib::Response& response) {
        const auto started = Clock::now();
        applyResponse(handleDocs(), response);
        monitor.recordSuccess("/docs", elapsedMs(started));
    });

    server->Post("/predict", [this](const httplib::Request& request, httplib::Response& response) {
        applyResponse(handlePredict(request.body), response);
    });

    server->set_error_handler([](const httplib::Request&, httplib::Response& response) {
        if (response.status == 404) {
            response.set_content(makeDetailResponse("Not Found"), "application/json");
        } else if (response.status == 405) {
            response.set_content(makeDetailResponse("Method Not Allowed"), "application/json");
        }
    });

    const auto pair = registry.tryCurrent();
    std::cout << "[HeliosService] starting host=" << config.host
              << " port=" << config.port
              << " threads=" << std::max<size_t>(1, config.threadCount)
              << " model_state=" << registryStateName(registry.state())
              << " model_version=" << (pair ? pair->version : std::string("none"))
              << " audit_log=" << (audit.enabled() ? audit.path() : std::string("disabled"))
              << "\n";
    if (!pair) {
        std::cerr << "[HeliosService] degraded_mode=true reason=\"" << registry.lastError() << "\"\n";
    }

    if (stopFlag.load(std::memory_order_acquire)) {
        std::cout << "[HeliosService] stop_requested_before_bind\n";
        return 0;
    }
    int port = config.port;
    if (port == 0) {
        port = server->bind_to_any_port(config.host.c_str());
        if (port < 0) {
            std::cerr << "[HeliosService] failed_to_bind host=" << config.host << " port=any\n";
            return 1;
        }
    } else if (!server->bind_to_port(config.host.c_str(), port)) {
        std::cerr << "[HeliosService] failed_to_bind host=" << config.host << " port=" << port << "\n";
        return 1;
    }
    listeningPort.store(port, std::memory_order_release);

    if (stopFlag.load(std::memory_order_acquire)) {
        std::cout << "[HeliosService] stop_requested_before_listen port=" << port << "\n";
        return 0;
    }
    if (!server->listen_after_bind()) {
        std::cerr << "[HeliosService] listen_failed host=" << config.host << " port=" << port << "\n";
        return 1;
    }
    std::cout << "[HeliosService] stopped port=" << port << "\n";
    return 0;
}

void PredictionService::stop() {
    stopFlag.store(true, std::memory_order_release);
    // httplib ignores stop() until listen_after_bind() has flagged the server
    // as running, so wait for that or for start() to bail out on the flag.
    while (serving.load(std::memory_order_acquire)) {
        if (server->is_running()) {
            server->stop();
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

bool PredictionService::isRunning() const {
    return server->is_running();
}
