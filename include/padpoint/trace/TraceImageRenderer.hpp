#pragma once

#include "padpoint/trace/TraceTypes.hpp"
#include <opencv2/core.hpp>
#include <string>

namespace padpoint {
namespace trace {

/**
 * @brief Draws a trace onto a white screen-sized canvas
 *
 * Layers: optional grid, reference finger polylines (blue), predicted path
 * (green, one pixel wider) and a caption line at the bottom.
 */
class TraceImageRenderer {
public:
    /**
     * @param job Trace and drawing settings
     * @param savedAt Timestamp printed at the start of the caption
     * @return 8-bit BGR image, empty if the mapping has no screen size
     */
    static cv::Mat render(const TraceJob& job, const std::string& savedAt);

    static std::string caption(const TraceJob& job, const std::string& savedAt);
};

} // namespace trace
} // namespace padpoint
