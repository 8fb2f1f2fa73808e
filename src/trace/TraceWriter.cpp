#include "padpoint/trace/TraceWriter.hpp"
#include "padpoint/core/Logger.hpp"
#include "padpoint/core/exception.hpp"
#include "padpoint/trace/TraceImageRenderer.hpp"
#include <opencv2/imgcodecs.hpp>
#include <yaml-cpp/yaml.h>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace padpoint {
namespace trace {

namespace {

const char* kFallbackDir = "/tmp";

std::string savedAtString() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&timeT, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d_%H-%M-%S");
    return oss.str();
}

void emitPoints(YAML::Emitter& out, const std::vector<cv::Point2d>& points) {
    out << YAML::BeginSeq;
    for (const auto& p : points) {
        out << YAML::Flow << YAML::BeginSeq << p.x << p.y << YAML::EndSeq;
    }
    out << YAML::EndSeq;
}

std::vector<cv::Point2d> parsePoints(const YAML::Node& node) {
    std::vector<cv::Point2d> points;
    if (!node || !node.IsSequence()) {
        return points;
    }
    points.reserve(node.size());
    for (const auto& item : node) {
        points.emplace_back(item[0].as<double>(), item[1].as<double>());
    }
    return points;
}

std::string buildSidecar(const TraceJob& job, const std::string& pngName,
                         const std::string& savedAt) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "image" << YAML::Value << pngName;
    out << YAML::Key << "saved_at" << YAML::Value << savedAt;
    out << YAML::Key << "started_at" << YAML::Value << job.path.startedAt;
    out << YAML::Key << "duration_ms" << YAML::Value
        << std::chrono::duration_cast<std::chrono::milliseconds>(
               job.path.ended - job.path.started).count();
    out << YAML::Key << "screen" << YAML::Value << YAML::Flow << YAML::BeginMap
        << YAML::Key << "width" << YAML::Value << job.mapping.screen_width()
        << YAML::Key << "height" << YAML::Value << job.mapping.screen_height()
        << YAML::EndMap;
    const auto& b = job.mapping.bounds();
    out << YAML::Key << "pad_bounds" << YAML::Value << YAML::Flow
        << YAML::BeginSeq << b.min_x << b.max_x << b.min_y << b.max_y << YAML::EndSeq;
    out << YAML::Key << "points" << YAML::Value;
    emitPoints(out, job.path.points);
    out << YAML::Key << "references" << YAML::Value << YAML::BeginSeq;
    for (const auto& refPath : job.path.referencePaths) {
        emitPoints(out, refPath);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return out.c_str();
}

bool writeAtomically(const std::filesystem::path& target, const char* data, size_t size) {
    std::filesystem::path tmp = target;
    tmp += ".tmp";
    {
        std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
        if (!file) {
            return false;
        }
        file.write(data, static_cast<std::streamsize>(size));
        file.flush();
        if (!file) {
            file.close();
            std::error_code ec;
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return false;
    }
    return true;
}

} // namespace

TraceWriter::TraceWriter(const TraceConfig& config)
    : config_(config)
    , queue_(config.queue_capacity)
    , running_(false)
    , written_(0)
    , failed_(0)
    , dropped_(0) {
}

TraceWriter::~TraceWriter() {
    stop();
}

void TraceWriter::start() {
    if (running_) {
        return;
    }
    running_ = true;
    worker_ = std::thread(&TraceWriter::workerLoop, this);
    PADPOINT_LOG_DEBUG("TraceWriter") << "Worker started, queue capacity "
        << queue_.capacity();
}

void TraceWriter::stop() {
    if (!running_) {
        return;
    }
    queue_.stop();
    if (worker_.joinable()) {
        worker_.join();
    }
    running_ = false;
    PADPOINT_LOG_DEBUG("TraceWriter") << "Worker stopped, " << written_
        << " traces written, " << failed_ << " failed, " << dropped_ << " dropped";
}

bool TraceWriter::submit(TraceJob job) {
    if (!running_) {
        PADPOINT_LOG_ERROR("TraceWriter") << "Writer not running, dropping trace "
            << job.fileStem;
        dropped_++;
        return false;
    }
    std::string stem = job.fileStem;
    if (!queue_.tryPush(std::move(job))) {
        PADPOINT_LOG_ERROR("TraceWriter") << "Queue full, dropping trace " << stem;
        dropped_++;
        return false;
    }
    return true;
}

void TraceWriter::workerLoop() {
    TraceJob job;
    while (true) {
        if (queue_.pop(job, 100)) {
            writeNow(job);
            continue;
        }
        if (queue_.isStopped() && queue_.size() == 0) {
            break;
        }
    }
}

std::string TraceWriter::writeNow(const TraceJob& job) {
    std::string pngPath;
    if (writeTo(job.outputDir, job, pngPath)) {
        written_++;
        PADPOINT_LOG_INFO("TraceWriter") << "Saved trace " << pngPath
            << " (" << job.path.size() << " points)";
        return pngPath;
    }

    PADPOINT_LOG_WARNING("TraceWriter") << "Could not save trace in " << job.outputDir
        << ", falling back to " << kFallbackDir;
    if (writeTo(kFallbackDir, job, pngPath)) {
        written_++;
        PADPOINT_LOG_INFO("TraceWriter") << "Saved trace (fallback) " << pngPath;
        return pngPath;
    }

    failed_++;
    PADPOINT_LOG_ERROR("TraceWriter") << "All save attempts failed for " << job.fileStem;
    return "";
}

bool TraceWriter::writeTo(const std::string& dir, const TraceJob& job, std::string& pngPath) {
    namespace fs = std::filesystem;

    try {
        fs::create_directories(dir);
    } catch (const fs::filesystem_error& e) {
        PADPOINT_LOG_WARNING("TraceWriter") << "Failed to create " << dir << ": " << e.what();
        return false;
    }

    const std::string savedAt = savedAtString();
    cv::Mat image = TraceImageRenderer::render(job, savedAt);
    if (image.empty()) {
        PADPOINT_LOG_ERROR("TraceWriter") << "Nothing to render for " << job.fileStem;
        return false;
    }

    std::vector<uchar> encoded;
    try {
        if (!cv::imencode(".png", image, encoded)) {
            PADPOINT_LOG_ERROR("TraceWriter") << "PNG encoding failed for " << job.fileStem;
            return false;
        }
    } catch (const cv::Exception& e) {
        PADPOINT_LOG_ERROR("TraceWriter") << "PNG encoding failed: " << e.what();
        return false;
    }

    fs::path png = fs::path(dir) / (job.fileStem + ".png");
    fs::path sidecar = fs::path(dir) / (job.fileStem + ".yaml");

    const std::string yaml = buildSidecar(job, png.filename().string(), savedAt);
    if (!writeAtomically(sidecar, yaml.data(), yaml.size())) {
        return false;
    }
    if (!writeAtomically(png, reinterpret_cast<const char*>(encoded.data()), encoded.size())) {
        std::error_code ec;
        fs::remove(sidecar, ec);
        return false;
    }

    pngPath = png.string();
    return true;
}

TracePath loadTraceFile(const std::string& yamlPath) {
    if (!std::filesystem::exists(yamlPath)) {
        PADPOINT_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_NOT_FOUND,
                            "Trace file not found: " + yamlPath);
    }

    TracePath path;
    try {
        YAML::Node root = YAML::LoadFile(yamlPath);
        path.startedAt = root["started_at"] ? root["started_at"].as<std::string>() : "";
        path.points = parsePoints(root["points"]);
        if (root["references"] && root["references"].IsSequence()) {
            for (const auto& ref : root["references"]) {
                path.referencePaths.push_back(parsePoints(ref));
            }
        }
    } catch (const YAML::Exception& e) {
        PADPOINT_THROW_CODE(core::FileException, core::ResultCode::ERROR_FILE_IO,
                            "Malformed trace file " + yamlPath + ": " + e.what());
    }
    return path;
}

} // namespace trace
} // namespace padpoint
