#pragma once

#include "padpoint/pipeline/ThreadSafeQueue.hpp"
#include "padpoint/trace/TraceTypes.hpp"
#include <atomic>
#include <string>
#include <thread>

namespace padpoint {
namespace trace {

/**
 * @brief Persists traces as PNG plus YAML sidecar on a worker thread
 *
 * Both files are written under a temporary name and renamed into place, so
 * the output directory never holds a partial file. If the configured
 * directory cannot be used the files go to /tmp.
 */
class TraceWriter : public TraceSink {
public:
    explicit TraceWriter(const TraceConfig& config);
    ~TraceWriter() override;

    TraceWriter(const TraceWriter&) = delete;
    TraceWriter& operator=(const TraceWriter&) = delete;

    void start();

    /**
     * @brief Stop accepting traces, write what is queued, join the worker
     */
    void stop();

    /**
     * @brief Queue a trace without waiting; drops it with an ERROR if full
     */
    bool submit(TraceJob job) override;

    /**
     * @brief Write a trace on the calling thread
     * @return Path of the PNG that was written, empty on failure
     */
    std::string writeNow(const TraceJob& job);

    size_t getWrittenCount() const { return written_; }
    size_t getFailedCount() const { return failed_; }
    size_t getDroppedCount() const { return dropped_; }

private:
    void workerLoop();
    bool writeTo(const std::string& dir, const TraceJob& job, std::string& pngPath);

    TraceConfig config_;
    pipeline::ThreadSafeQueue<TraceJob> queue_;
    std::thread worker_;
    std::atomic<bool> running_;
    std::atomic<size_t> written_;
    std::atomic<size_t> failed_;
    std::atomic<size_t> dropped_;
};

/**
 * @brief Reload a trace from its YAML sidecar
 * @throws core::FileException if the file is missing or malformed
 */
TracePath loadTraceFile(const std::string& yamlPath);

} // namespace trace
} // namespace padpoint
