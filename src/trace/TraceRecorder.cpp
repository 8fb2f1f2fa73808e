#include "padpoint/trace/TraceRecorder.hpp"
#include "padpoint/core/Logger.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace padpoint {
namespace trace {

namespace {

std::string formatLocalTime(std::chrono::system_clock::time_point when, const char* format) {
    auto timeT = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&timeT, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, format);
    return oss.str();
}

} // namespace

TraceRecorder::TraceRecorder(bool recordReferencePaths)
    : recordReferencePaths_(recordReferencePaths)
    , recording_(false) {
}

void TraceRecorder::begin(core::TimePoint now) {
    if (recording_ && !path_.empty()) {
        PADPOINT_LOG_DEBUG("TraceRecorder") << "Discarding unfinished path of "
            << path_.size() << " points";
    }
    path_ = TracePath();
    path_.started = now;
    path_.startedAt = formatLocalTime(std::chrono::system_clock::now(), "%H:%M:%S");
    recording_ = true;
}

void TraceRecorder::append(const cv::Point2d& padPoint) {
    if (!recording_) {
        return;
    }
    path_.points.push_back(padPoint);
}

void TraceRecorder::appendReferences(const tracking::ReferencePose& pose) {
    if (!recording_ || !recordReferencePaths_ || !pose.valid) {
        return;
    }
    if (path_.referencePaths.size() < pose.references.size()) {
        path_.referencePaths.resize(pose.references.size());
    }
    for (size_t i = 0; i < pose.references.size(); ++i) {
        path_.referencePaths[i].push_back(pose.references[i].position_d());
    }
}

TracePath TraceRecorder::finish(core::TimePoint now) {
    TracePath done = std::move(path_);
    done.ended = now;
    path_ = TracePath();
    recording_ = false;
    return done;
}

void TraceRecorder::discard() {
    path_ = TracePath();
    recording_ = false;
}

std::string TraceRecorder::makeFileStem(std::chrono::system_clock::time_point when) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()).count() % 1000;
    std::ostringstream oss;
    oss << "shot_" << formatLocalTime(when, "%Y-%m-%d_%H-%M-%S")
        << "_" << std::setfill('0') << std::setw(3) << ms;
    return oss.str();
}

} // namespace trace
} // namespace padpoint
