#pragma once

#include "padpoint/trace/TraceTypes.hpp"
#include "padpoint/tracking/TouchTypes.hpp"
#include <chrono>

namespace padpoint {
namespace trace {

/**
 * @brief Accumulates the predicted path while the trigger is armed
 */
class TraceRecorder {
public:
    explicit TraceRecorder(bool recordReferencePaths = true);

    /**
     * @brief Start a new path, discarding anything unfinished
     */
    void begin(core::TimePoint now);

    void append(const cv::Point2d& padPoint);

    /**
     * @brief Append the reference finger positions, if enabled
     */
    void appendReferences(const tracking::ReferencePose& pose);

    /**
     * @brief Hand out the collected path and reset
     */
    TracePath finish(core::TimePoint now);

    void discard();

    bool isRecording() const { return recording_; }
    size_t size() const { return path_.size(); }

    /**
     * @brief File stem for a trace saved at the given wall-clock time
     */
    static std::string makeFileStem(std::chrono::system_clock::time_point when);

private:
    bool recordReferencePaths_;
    bool recording_;
    TracePath path_;
};

} // namespace trace
} // namespace padpoint
