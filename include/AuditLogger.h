#pragma once

#include "FeatureRecord.h"
#include "InferenceEngine.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

// Append-only CSV log of served predictions. record() only formats and
// enqueues; a single writer thread owns the file, so rows never interleave.
// Write failures are logged and counted, never raised.
class AuditLogger {
public:
    static constexpr const char* kHeader =
        "timestamp,temperature,humidity,ghi,power_t_1,power_t_2,predicted_power";

    // Rows queued beyond this while the writer is stalled are dropped.
    static constexpr size_t kDefaultMaxPendingRows = 10000;

    explicit AuditLogger(std::string logPath, bool enabled = true, size_t maxPendingRows = kDefaultMaxPendingRows);
    ~AuditLogger();

    AuditLogger(const AuditLogger&) = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;

    void record(const FeatureRecord& request, const PredictionResult& result) noexcept;
    void record(const FeatureRecord& request,
                const PredictionResult& result,
                std::chrono::system_clock::time_point when) noexcept;

    // Blocks until every queued row has been written or dropped.
    void flush();

    bool enabled() const noexcept { return isEnabled; }
    const std::string& path() const noexcept { return logPath; }
    size_t maxPendingRows() const noexcept { return pendingLimit; }
    uint64_t writtenRecords() const noexcept { return written.load(std::memory_order_relaxed); }
    uint64_t droppedRecords() const noexcept { return dropped.load(std::memory_order_relaxed); }

    static std::string formatRow(const FeatureRecord& request,
                                 const PredictionResult& result,
                                 std::chrono::system_clock::time_point when);

private:
    void writerLoop();
    void writeBatch(const std::deque<std::string>& rows);
    void checkExistingHeader();
    bool endsWithNewline() const;

    std::string logPath;
    bool isEnabled;
    size_t pendingLimit;

    std::mutex queueMutex;
    std::condition_variable queueReady;
    std::condition_variable queueDrained;
    std::deque<std::string> pending;
    bool stopping = false;
    bool writerBusy = false;
    bool headerChecked = false;
    bool overflowing = false;

    std::atomic<uint64_t> written{0};
    std::atomic<uint64_t> dropped{0};

    std::thread writer;
};
