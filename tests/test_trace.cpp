/**
 * @file test_trace.cpp
 * @brief Tests for trace recording, rendering and writing
 */

#include <gtest/gtest.h>
#include <padpoint/trace/TraceRecorder.hpp>
#include <padpoint/trace/TraceImageRenderer.hpp>
#include <padpoint/trace/TraceWriter.hpp>
#include <padpoint/core/Logger.hpp>
#include <padpoint/core/exception.hpp>
#include <chrono>
#include <filesystem>
#include <regex>

using namespace padpoint::trace;
namespace fs = std::filesystem;

namespace {

padpoint::tracking::ReferencePose makePose(int shift) {
    padpoint::tracking::ReferencePose pose;
    for (int i = 0; i < 3; ++i) {
        padpoint::tracking::Contact c;
        c.id = static_cast<std::uint64_t>(i + 1);
        c.position = cv::Point(100 + 100 * i + shift, 500);
        pose.references.push_back(c);
    }
    pose.valid = true;
    return pose;
}

padpoint::prediction::ScreenMapping smallMapping() {
    padpoint::prediction::PadBounds b;
    b.min_x = 0;
    b.max_x = 1000;
    b.min_y = 0;
    b.max_y = 1000;
    return padpoint::prediction::ScreenMapping(b, 320, 200);
}

} // namespace

class TraceRecorderTest : public ::testing::Test {
protected:
    void SetUp() override {
        padpoint::core::Logger::getInstance().setLogLevel(padpoint::core::LogLevel::WARNING);
        t0_ = padpoint::core::Clock::now();
    }

    padpoint::core::TimePoint t0_;
};

TEST_F(TraceRecorderTest, IgnoresPointsWhenNotRecording) {
    TraceRecorder recorder;
    recorder.append(cv::Point2d(1, 2));
    EXPECT_FALSE(recorder.isRecording());
    EXPECT_EQ(recorder.size(), 0u);
}

TEST_F(TraceRecorderTest, RecordsPointsAndReferences) {
    TraceRecorder recorder;
    recorder.begin(t0_);
    ASSERT_TRUE(recorder.isRecording());

    recorder.append(cv::Point2d(10, 20));
    recorder.appendReferences(makePose(0));
    recorder.append(cv::Point2d(11, 21));
    recorder.appendReferences(makePose(5));

    TracePath path = recorder.finish(t0_ + std::chrono::milliseconds(250));
    EXPECT_FALSE(recorder.isRecording());
    EXPECT_EQ(recorder.size(), 0u);

    ASSERT_EQ(path.size(), 2u);
    EXPECT_EQ(path.points[1], cv::Point2d(11, 21));
    ASSERT_EQ(path.referencePaths.size(), 3u);
    EXPECT_EQ(path.referencePaths[2].size(), 2u);
    EXPECT_EQ(path.referencePaths[0][1], cv::Point2d(105, 500));
    EXPECT_EQ(path.started, t0_);
    EXPECT_EQ(path.ended - path.started, std::chrono::milliseconds(250));
    EXPECT_FALSE(path.startedAt.empty());
}

TEST_F(TraceRecorderTest, ReferencePathsCanBeDisabled) {
    TraceRecorder recorder(false);
    recorder.begin(t0_);
    recorder.append(cv::Point2d(1, 1));
    recorder.appendReferences(makePose(0));
    TracePath path = recorder.finish(t0_);
    EXPECT_EQ(path.size(), 1u);
    EXPECT_TRUE(path.referencePaths.empty());
}

TEST_F(TraceRecorderTest, DiscardDropsPath) {
    TraceRecorder recorder;
    recorder.begin(t0_);
    recorder.append(cv::Point2d(1, 1));
    recorder.discard();
    EXPECT_FALSE(recorder.isRecording());
    EXPECT_EQ(recorder.size(), 0u);
}

TEST_F(TraceRecorderTest, FileStemFormat) {
    std::string stem = TraceRecorder::makeFileStem(std::chrono::system_clock::now());
    EXPECT_TRUE(std::regex_match(stem,
        std::regex("shot_\\d{4}-\\d{2}-\\d{2}_\\d{2}-\\d{2}-\\d{2}_\\d{3}")));
}

class TraceWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        padpoint::core::Logger::getInstance().setLogLevel(padpoint::core::LogLevel::CRITICAL);
        dir_ = fs::temp_directory_path() /
            ("padpoint_trace_test_" + std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count()));
        t0_ = padpoint::core::Clock::now();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    TraceJob makeJob(const std::string& stem) const {
        TraceJob job;
        job.path.started = t0_;
        job.path.ended = t0_ + std::chrono::milliseconds(480);
        job.path.startedAt = "12:00:00";
        job.path.points = {cv::Point2d(100, 100), cv::Point2d(400, 300), cv::Point2d(800, 700)};
        job.path.referencePaths = {{cv::Point2d(50, 900), cv::Point2d(52, 901)},
                                   {cv::Point2d(150, 850), cv::Point2d(151, 850)},
                                   {cv::Point2d(250, 900), cv::Point2d(250, 902)}};
        job.fileStem = stem;
        job.outputDir = dir_.string();
        job.mapping = smallMapping();
        job.strokePx = 2;
        job.grid = 4;
        return job;
    }

    fs::path dir_;
    padpoint::core::TimePoint t0_;
};

TEST_F(TraceWriterTest, RendersScreenSizedImage) {
    cv::Mat image = TraceImageRenderer::render(makeJob("render"), "2024-01-01_00-00-00");
    ASSERT_FALSE(image.empty());
    EXPECT_EQ(image.cols, 320);
    EXPECT_EQ(image.rows, 200);
    EXPECT_EQ(image.type(), CV_8UC3);

    std::string caption = TraceImageRenderer::caption(makeJob("render"), "2024-01-01_00-00-00");
    EXPECT_NE(caption.find("refs:3"), std::string::npos);
    EXPECT_NE(caption.find("act_pts:3"), std::string::npos);
    EXPECT_NE(caption.find("start: 12:00:00"), std::string::npos);
}

TEST_F(TraceWriterTest, WriteNowRoundTrip) {
    TraceConfig config;
    config.output_dir = dir_.string();
    TraceWriter writer(config);

    TraceJob job = makeJob("shot_roundtrip");
    std::string png = writer.writeNow(job);
    ASSERT_FALSE(png.empty());
    EXPECT_TRUE(fs::exists(png));
    EXPECT_FALSE(fs::exists(png + ".tmp"));
    EXPECT_EQ(writer.getWrittenCount(), 1u);

    fs::path sidecar = dir_ / "shot_roundtrip.yaml";
    ASSERT_TRUE(fs::exists(sidecar));

    TracePath loaded = loadTraceFile(sidecar.string());
    EXPECT_EQ(loaded.startedAt, "12:00:00");
    ASSERT_EQ(loaded.points.size(), job.path.points.size());
    for (size_t i = 0; i < loaded.points.size(); ++i) {
        EXPECT_DOUBLE_EQ(loaded.points[i].x, job.path.points[i].x);
        EXPECT_DOUBLE_EQ(loaded.points[i].y, job.path.points[i].y);
    }
    ASSERT_EQ(loaded.referencePaths.size(), 3u);
    EXPECT_EQ(loaded.referencePaths[1].size(), 2u);
}

TEST_F(TraceWriterTest, WorkerDrainsQueueOnStop) {
    TraceConfig config;
    config.output_dir = dir_.string();
    config.queue_capacity = 8;
    TraceWriter writer(config);
    writer.start();

    EXPECT_TRUE(writer.submit(makeJob("shot_a")));
    EXPECT_TRUE(writer.submit(makeJob("shot_b")));
    writer.stop();

    EXPECT_EQ(writer.getWrittenCount(), 2u);
    EXPECT_TRUE(fs::exists(dir_ / "shot_a.png"));
    EXPECT_TRUE(fs::exists(dir_ / "shot_b.png"));
}

TEST_F(TraceWriterTest, SubmitWithoutWorkerIsDropped) {
    TraceConfig config;
    config.output_dir = dir_.string();
    TraceWriter writer(config);
    EXPECT_FALSE(writer.submit(makeJob("shot_nowhere")));
    EXPECT_EQ(writer.getDroppedCount(), 1u);
}

TEST_F(TraceWriterTest, MissingTraceFileThrows) {
    EXPECT_THROW(loadTraceFile((dir_ / "missing.yaml").string()), padpoint::core::FileException);
}
