#include "AuditLogger.h"

#include "CSVUtils.h"
#include "CommonUtils.h"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

AuditLogger::AuditLogger(std::string path, bool enabledFlag, size_t maxPendingRows)
    : logPath(std::move(path)), isEnabled(enabledFlag), pendingLimit(std::max<size_t>(1, maxPendingRows)) {
    if (isEnabled) {
        writer = std::thread([this] { writerLoop(); });
    }
}

AuditLogger::~AuditLogger() {
    if (!writer.joinable()) return;
    {
        std::lock_guard<std::mutex> lock(queueMutex);
        stopping = true;
    }
    queueReady.notify_all();
    writer.join();
}

std::string AuditLogger::formatRow(const FeatureRecord& request,
                                   const PredictionResult& result,
                                   std::chrono::system_clock::time_point when) {
    return CSVUtils::formatRow({
        CommonUtils::utcIsoTimestamp(when),
        CommonUtils::formatDouble(request.temperature),
        CommonUtils::formatDouble(request.humidity),
        CommonUtils::formatDouble(request.ghi),
        CommonUtils::formatDouble(request.powerT1),
        CommonUtils::formatDouble(request.powerT2),
        CommonUtils::formatDouble(result.value),
    });
}

void AuditLogger::record(const FeatureRecord& request, const PredictionResult& result) noexcept {
    record(request, result, std::chrono::system_clock::now());
}

void AuditLogger::record(const FeatureRecord& request,
                         const PredictionResult& result,
                         std::chrono::system_clock::time_point when) noexcept {
    if (!isEnabled) return;
    try {
        std::string row = formatRow(request, result, when);
        bool overflowStarted = false;
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            if (stopping) {
                dropped.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            if (pending.size() >= pendingLimit) {
                dropped.fetch_add(1, std::memory_order_relaxed);
                overflowStarted = !overflowing;
                overflowing = true;
            } else {
                pending.push_back(std::move(row));
            }
        }
        if (overflowStarted) {
            std::cerr << "[HeliosAudit][Error] queue_full path=" << logPath << " limit=" << pendingLimit
                      << " dropping_rows=true\n";
        }
        queueReady.notify_one();
    } catch (const std::exception& e) {
        dropped.fetch_add(1, std::memory_order_relaxed);
        std::cerr << "[HeliosAudit][Error] enqueue_failed error=" << e.what() << "\n";
    }
}

void AuditLogger::flush() {
    if (!isEnabled) return;
    std::unique_lock<std::mutex> lock(queueMutex);
    queueDrained.wait(lock, [this] { return pending.empty() && !writerBusy; });
}

void AuditLogger::writerLoop() {
    while (true) {
        std::deque<std::string> batch;
        {
            std::unique_lock<std::mutex> lock(queueMutex);
            queueReady.wait(lock, [this] { return stopping || !pending.empty(); });
            if (pending.empty()) {
                // stopping with nothing left to write
                break;
            }
            batch.swap(pending);
            writerBusy = true;
            overflowing = false;
        }

        writeBatch(batch);

        {
            std::lock_guard<std::mutex> lock(queueMutex);
            writerBusy = false;
        }
        queueDrained.notify_all();
    }
    queueDrained.notify_all();
}

void AuditLogger::checkExistingHeader() {
    std::ifstream in(logPath);
    if (!in) return;
    CSVUtils::skipBOM(in);
    bool malformed = false;
    const std::vector<std::string> header = CSVUtils::parseCSVLine(in, ',', &malformed);
    std::string joined;
    for (size_t i = 0; i < header.size(); ++i) {
        if (i > 0) joined += ',';
        joined += header[i];
    }
    if (malformed || joined != kHeader) {
        std::cerr << "[HeliosAudit] unexpected_header path=" << logPath << " found=\"" << joined
                  << "\" appending_anyway=true\n";
    }
}

bool AuditLogger::endsWithNewline() const {
    std::ifstream in(logPath, std::ios::binary);
    if (!in) return true;
    in.seekg(-1, std::ios::end);
    char last = '\n';
    if (!in.get(last)) return true;
    return last == '\n';
}

void AuditLogger::writeBatch(const std::deque<std::string>& rows) {
    try {
        std::error_code ec;
        const bool exists = std::filesystem::exists(logPath, ec);
        const bool needsHeader = !exists || std::filesystem::file_size(logPath, ec) == 0 || ec;

        if (!needsHeader && !headerChecked) {
            checkExistingHeader();
        }
        headerChecked = true;

        std::string payload;
        if (!needsHeader && !endsWithNewline()) {
            // Terminate a partial last line so the next row starts on its own.
            payload += '\n';
        }
        if (needsHeader) {
            payload += kHeader;
            payload += '\n';
        }
        for (const auto& row : rows) {
            payload += row;
        }

        std::ofstream out(logPath, std::ios::app | std::ios::binary);
        if (!out) {
            throw std::runtime_error("could not open audit log for append");
        }
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        out.flush();
        if (!out) {
            throw std::runtime_error("write to audit log failed");
        }
        written.fetch_add(rows.size(), std::memory_order_relaxed);
    } catch (const std::exception& e) {
        dropped.fetch_add(rows.size(), std::memory_order_relaxed);
        std::cerr << "[HeliosAudit][Error] write_failed path=" << logPath << " rows=" << rows.size()
                  << " error=" << e.what() << "\n";
    }
}
