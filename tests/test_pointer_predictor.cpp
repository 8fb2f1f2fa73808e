/**
 * @file test_pointer_predictor.cpp
 * @brief Unit tests for PointerPredictor
 *
 * Validates:
 * - Confidence classification, including the inclusive minimum-ellipse boundary
 * - Identical output for identical input
 * - Occlusion extrapolation with decayed velocity, held while the input is static
 * - Outline sampling for the overlay
 *
 * The mapping uses pad bounds 0..1919 x 0..1079 on a 1920x1080 screen so one
 * pad unit is one screen pixel.
 */

#include <gtest/gtest.h>
#include <padpoint/prediction/PointerPredictor.hpp>
#include <padpoint/tracking/ReferencePoseEstimator.hpp>
#include <padpoint/core/Logger.hpp>
#include <chrono>

using namespace padpoint::prediction;
using namespace padpoint::tracking;
using padpoint::core::TimePoint;

class PointerPredictorTest : public ::testing::Test {
protected:
    void SetUp() override {
        padpoint::core::Logger::getInstance().setLogLevel(padpoint::core::LogLevel::WARNING);
        t0_ = padpoint::core::Clock::now();

        PadBounds b;
        b.min_x = 0;
        b.max_x = 1919;
        b.min_y = 0;
        b.max_y = 1079;
        mapping_ = ScreenMapping(b, 1920, 1080);

        // Centroid lands on (300, 460); perpendicular points to -y
        std::vector<Contact> refs = {contact(1, 200, 500), contact(2, 300, 380),
                                     contact(3, 400, 500)};
        pose_ = estimator_.update(refs, at(0));
        ASSERT_TRUE(pose_.valid);
    }

    TimePoint at(int ms) const {
        return t0_ + std::chrono::milliseconds(ms);
    }

    Contact contact(std::uint64_t id, int x, int y) const {
        Contact c;
        c.id = id;
        c.slot_id = static_cast<int>(id);
        c.position = cv::Point(x, y);
        c.established_at = t0_;
        return c;
    }

    TimePoint t0_;
    ScreenMapping mapping_;
    ReferencePoseEstimator estimator_;
    ReferencePose pose_;
};

TEST_F(PointerPredictorTest, PoseGeometryAsExpected) {
    EXPECT_DOUBLE_EQ(pose_.centroid.x, 300.0);
    EXPECT_DOUBLE_EQ(pose_.centroid.y, 460.0);
    EXPECT_NEAR(pose_.perpendicular_axis.y, -1.0, 1e-12);
}

TEST_F(PointerPredictorTest, FarContactIsNormal) {
    PointerPredictor predictor(PredictionParameters(), mapping_);
    auto result = predictor.predict(pose_, contact(10, 300, 100), at(10));

    EXPECT_EQ(result.confidence, PredictionConfidence::NORMAL);
    EXPECT_TRUE(result.has_output);
    EXPECT_EQ(result.contact_id, 10u);
    EXPECT_EQ(result.timestamp, at(10));
    EXPECT_TRUE(predictor.has_last_good());

    // Straight along the perpendicular: corrected angle is the mark offset
    EXPECT_NEAR(result.sector_angle, -20.0, 1e-9);
}

TEST_F(PointerPredictorTest, MinimumEllipseBoundaryIsInclusive) {
    PointerPredictor predictor(PredictionParameters(), mapping_);

    auto at_limit = predictor.predict(pose_, contact(10, 460, 460), at(10));
    EXPECT_EQ(at_limit.confidence, PredictionConfidence::INVALID);
    EXPECT_FALSE(at_limit.has_output);

    auto above = predictor.predict(pose_, contact(10, 461, 460), at(20));
    EXPECT_EQ(above.confidence, PredictionConfidence::NORMAL);
    EXPECT_TRUE(above.has_output);
}

TEST_F(PointerPredictorTest, InvalidPoseGivesNoOutput) {
    PointerPredictor predictor(PredictionParameters(), mapping_);
    ReferencePose empty;
    auto result = predictor.predict(empty, contact(10, 300, 100), at(10));
    EXPECT_EQ(result.confidence, PredictionConfidence::INVALID);
    EXPECT_FALSE(result.has_output);
}

TEST_F(PointerPredictorTest, StaticInputGivesIdenticalOutput) {
    PointerPredictor predictor(PredictionParameters(), mapping_);
    const Contact pointing = contact(10, 520, 150);

    auto first = predictor.predict(pose_, pointing, at(10));
    auto second = predictor.predict(pose_, pointing, at(20));
    for (int tick = 3; tick <= 10; ++tick) {
        auto next = predictor.predict(pose_, pointing, at(tick * 10));
        EXPECT_EQ(next.confidence, second.confidence);
        EXPECT_EQ(next.pad_point, second.pad_point);
        EXPECT_EQ(next.screen_point, second.screen_point);
        EXPECT_EQ(next.sector_angle, second.sector_angle);
    }
    EXPECT_EQ(first.screen_point, second.screen_point);
}

TEST_F(PointerPredictorTest, StaticOccludedInputGivesIdenticalOutput) {
    PointerPredictor predictor(PredictionParameters(), mapping_);
    ASSERT_TRUE(predictor.predict(pose_, contact(10, 461, 460), at(0)).has_output);
    ASSERT_TRUE(predictor.predict(pose_, contact(10, 481, 440), at(10)).has_output);

    const Contact hidden = contact(10, 300, 420);
    auto held = predictor.predict(pose_, hidden, at(20));
    ASSERT_EQ(held.confidence, PredictionConfidence::OCCLUDED);
    ASSERT_TRUE(held.has_output);
    for (int tick = 3; tick <= 10; ++tick) {
        auto next = predictor.predict(pose_, hidden, at(tick * 10));
        EXPECT_EQ(next.confidence, PredictionConfidence::OCCLUDED);
        EXPECT_TRUE(next.has_output);
        EXPECT_EQ(next.screen_point, held.screen_point);
        EXPECT_EQ(next.pad_point, held.pad_point);
    }
}

TEST_F(PointerPredictorTest, OccludedWithoutHistoryIsSuppressed) {
    PointerPredictor predictor(PredictionParameters(), mapping_);

    // Between the centroid and the middle finger
    auto result = predictor.predict(pose_, contact(10, 300, 420), at(10));
    EXPECT_EQ(result.confidence, PredictionConfidence::OCCLUDED);
    EXPECT_FALSE(result.has_output);
}

TEST_F(PointerPredictorTest, OccludedExtrapolatesWithDecayedVelocity) {
    PredictionParameters params;
    params.occlusion_velocity_decay = 0.5;
    PointerPredictor predictor(params, mapping_);

    auto p1 = predictor.predict(pose_, contact(10, 461, 460), at(0));
    auto p2 = predictor.predict(pose_, contact(10, 481, 440), at(100));
    ASSERT_EQ(p1.confidence, PredictionConfidence::NORMAL);
    ASSERT_EQ(p2.confidence, PredictionConfidence::NORMAL);

    cv::Point2d velocity = (p2.screen_point - p1.screen_point) * 10.0;

    auto p3 = predictor.predict(pose_, contact(10, 300, 420), at(200));
    ASSERT_EQ(p3.confidence, PredictionConfidence::OCCLUDED);
    ASSERT_TRUE(p3.has_output);
    cv::Point2d expected3 = p2.screen_point + velocity * (0.5 * 0.1);
    EXPECT_NEAR(p3.screen_point.x, expected3.x, 1e-6);
    EXPECT_NEAR(p3.screen_point.y, expected3.y, 1e-6);

    // Same input again: the occluded point holds
    auto p4 = predictor.predict(pose_, contact(10, 300, 420), at(300));
    ASSERT_EQ(p4.confidence, PredictionConfidence::OCCLUDED);
    EXPECT_EQ(p4.screen_point, p3.screen_point);

    // Moving while occluded advances with the next decay step
    auto p5 = predictor.predict(pose_, contact(10, 300, 421), at(400));
    ASSERT_EQ(p5.confidence, PredictionConfidence::OCCLUDED);
    cv::Point2d expected5 = expected3 + velocity * (0.25 * 0.1);
    EXPECT_NEAR(p5.screen_point.x, expected5.x, 1e-6);
    EXPECT_NEAR(p5.screen_point.y, expected5.y, 1e-6);
}

TEST_F(PointerPredictorTest, NewContactDropsHistory) {
    PointerPredictor predictor(PredictionParameters(), mapping_);
    ASSERT_TRUE(predictor.predict(pose_, contact(10, 300, 100), at(0)).has_output);

    auto result = predictor.predict(pose_, contact(11, 300, 420), at(10));
    EXPECT_EQ(result.confidence, PredictionConfidence::OCCLUDED);
    EXPECT_FALSE(result.has_output);
    EXPECT_FALSE(predictor.has_last_good());
}

TEST_F(PointerPredictorTest, ContactSizeStrategy) {
    PredictionParameters params;
    params.occlusion_strategy = OcclusionStrategy::CONTACT_SIZE;
    params.pred_min_ellipse_a_px = 20.0;
    params.pred_min_ellipse_b_px = 20.0;
    PointerPredictor predictor(params, mapping_);

    Contact small = contact(10, 300, 100);
    small.touch_major = 10;
    small.touch_minor = 10;
    EXPECT_EQ(predictor.predict(pose_, small, at(0)).confidence,
              PredictionConfidence::INVALID);

    Contact large = contact(10, 300, 100);
    large.touch_major = 60;
    large.touch_minor = 50;
    EXPECT_EQ(predictor.predict(pose_, large, at(10)).confidence,
              PredictionConfidence::NORMAL);
}

TEST_F(PointerPredictorTest, DescribeSamplesBothEllipses) {
    PointerPredictor predictor(PredictionParameters(), mapping_);
    auto geometry = predictor.describe(pose_);

    ASSERT_TRUE(geometry.valid);
    EXPECT_EQ(geometry.outer_outline.size(), 72u);
    EXPECT_EQ(geometry.pointer_outline.size(), 72u);

    // First sample lies on the perpendicular, outer radius = max(|thumb - C|)
    double reach = std::sqrt(100.0 * 100.0 + 40.0 * 40.0);
    EXPECT_NEAR(geometry.outer_outline[0].x, 300.0, 1e-9);
    EXPECT_NEAR(geometry.outer_outline[0].y, 460.0 - reach, 1e-9);
    EXPECT_NEAR(geometry.pointer_outline[0].y, 460.0 - 0.62 * reach, 1e-9);

    EXPECT_FALSE(predictor.describe(ReferencePose()).valid);
}

TEST_F(PointerPredictorTest, InvalidParametersFallBack) {
    PredictionParameters params;
    params.pointer_ellipse_ratio = 1.5;
    PointerPredictor predictor(params, mapping_);
    EXPECT_DOUBLE_EQ(predictor.get_parameters().pointer_ellipse_ratio, 0.62);
}
