#include "padpoint/trace/TraceImageRenderer.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace padpoint {
namespace trace {

namespace {

// BGR
const cv::Scalar kBackground(255, 255, 255);
const cv::Scalar kGridColor(200, 200, 200);
const cv::Scalar kReferenceColor(255, 132, 25);
const cv::Scalar kPointerColor(113, 204, 46);
const cv::Scalar kCaptionColor(40, 40, 40);

std::vector<cv::Point> toScreen(const std::vector<cv::Point2d>& padPoints,
                                const prediction::ScreenMapping& mapping) {
    std::vector<cv::Point> pts;
    pts.reserve(padPoints.size());
    for (const auto& p : padPoints) {
        cv::Point2d s = mapping.pad_to_screen(p);
        pts.emplace_back(static_cast<int>(std::lround(s.x)), static_cast<int>(std::lround(s.y)));
    }
    return pts;
}

void drawPath(cv::Mat& canvas, const std::vector<cv::Point>& pts,
              const cv::Scalar& color, int thickness) {
    if (pts.size() == 1) {
        cv::circle(canvas, pts.front(), std::max(1, thickness), color, cv::FILLED, cv::LINE_AA);
        return;
    }
    cv::polylines(canvas, pts, false, color, thickness, cv::LINE_AA);
}

} // namespace

std::string TraceImageRenderer::caption(const TraceJob& job, const std::string& savedAt) {
    std::ostringstream oss;
    oss << savedAt;
    if (!job.path.startedAt.empty()) {
        oss << "  start: " << job.path.startedAt;
    }
    oss << "  refs:" << job.path.referencePaths.size()
        << "  act_pts:" << job.path.points.size();
    return oss.str();
}

cv::Mat TraceImageRenderer::render(const TraceJob& job, const std::string& savedAt) {
    const int width = job.mapping.screen_width();
    const int height = job.mapping.screen_height();
    if (width <= 0 || height <= 0) {
        return cv::Mat();
    }

    cv::Mat canvas(height, width, CV_8UC3, kBackground);

    if (job.grid > 0) {
        for (int i = 1; i < job.grid; ++i) {
            int x = i * width / job.grid;
            cv::line(canvas, cv::Point(x, 0), cv::Point(x, height - 1), kGridColor, 1);
        }
        for (int j = 1; j < job.grid; ++j) {
            int y = j * height / job.grid;
            cv::line(canvas, cv::Point(0, y), cv::Point(width - 1, y), kGridColor, 1);
        }
    }

    const int stroke = std::max(1, job.strokePx);
    for (const auto& refPath : job.path.referencePaths) {
        if (!refPath.empty()) {
            drawPath(canvas, toScreen(refPath, job.mapping), kReferenceColor, stroke);
        }
    }

    if (!job.path.points.empty()) {
        drawPath(canvas, toScreen(job.path.points, job.mapping), kPointerColor,
                 std::max(2, stroke + 1));
    }

    cv::putText(canvas, caption(job, savedAt), cv::Point(12, std::max(12, height - 24)),
                cv::FONT_HERSHEY_SIMPLEX, 0.5, kCaptionColor, 1, cv::LINE_AA);
    return canvas;
}

} // namespace trace
} // namespace padpoint
