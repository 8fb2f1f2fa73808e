#pragma once

#include "padpoint/core/types.hpp"
#include "padpoint/prediction/ScreenMapping.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace padpoint {
namespace trace {

/**
 * @brief Trace recording and persistence settings
 */
struct TraceConfig {
    bool enabled = true;
    std::string output_dir = "~/touchshots";
    bool record_reference_paths = true;
    int stroke_px = 3;
    int grid = 0;                 ///< n x n guide grid in the image, 0 = none
    size_t queue_capacity = 4;    ///< Pending traces before new ones are dropped

    bool isValid() const {
        return !output_dir.empty() && stroke_px > 0 && grid >= 0 && queue_capacity > 0;
    }
};

/**
 * @brief Points collected during one Armed interval, in pad units
 */
struct TracePath {
    std::vector<cv::Point2d> points;
    std::vector<std::vector<cv::Point2d>> referencePaths;   ///< One polyline per reference finger
    std::string startedAt;      ///< Local wall-clock time of arming
    core::TimePoint started;
    core::TimePoint ended;

    size_t size() const { return points.size(); }
    bool empty() const { return points.empty(); }
};

/**
 * @brief Everything the writer needs to persist one trace
 */
struct TraceJob {
    TracePath path;
    std::string fileStem;       ///< shot_YYYY-MM-DD_HH-MM-SS_mmm
    std::string outputDir;
    prediction::ScreenMapping mapping;
    int strokePx = 3;
    int grid = 0;
};

/**
 * @brief Consumer of completed traces
 *
 * submit() must return promptly; it runs on the tick loop.
 */
class TraceSink {
public:
    virtual ~TraceSink() = default;

    /**
     * @return false if the trace was not accepted (already logged)
     */
    virtual bool submit(TraceJob job) = 0;
};

} // namespace trace
} // namespace padpoint
