/**
 * @file PointerPredictor.cpp
 * @brief Implementation of the elliptical sector pointer model
 */

#include "padpoint/prediction/PointerPredictor.hpp"
#include "padpoint/core/Logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>

namespace padpoint {
namespace prediction {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr int kOutlineSamples = 72;

double deg2rad(double deg) { return deg * kPi / 180.0; }
double rad2deg(double rad) { return rad * 180.0 / kPi; }

/**
 * @brief Ellipse with the aspect of (a_lim, b_lim) through an offset
 *
 * The result is the limit ellipse scaled so that the offset lies on it.
 */
cv::Point2d derived_ellipse(const cv::Point2d& offset_px, double a_lim, double b_lim) {
    if (a_lim <= 0.0 || b_lim <= 0.0) {
        return cv::Point2d(std::abs(offset_px.x), std::abs(offset_px.y));
    }
    double nx = offset_px.x / a_lim;
    double ny = offset_px.y / b_lim;
    double k = std::sqrt(nx * nx + ny * ny);
    return cv::Point2d(k * a_lim, k * b_lim);
}

bool within_limit(const cv::Point2d& ellipse, double a_lim, double b_lim) {
    return ellipse.x <= a_lim || ellipse.y <= b_lim;
}

} // namespace

/**
 * @brief Reference frame of the sector model for one pose
 */
struct SectorFrame {
    cv::Point2d center;
    cv::Point2d axis_u;     ///< Baseline unit
    cv::Point2d axis_v;     ///< Perpendicular unit
    double outer_a = 0.0;
    double outer_b = 0.0;
    double pointer_a = 0.0;
    double pointer_b = 0.0;

    cv::Point2d at(double u, double v) const {
        return center + axis_u * u + axis_v * v;
    }
};

class PointerPredictor::Impl {
public:
    PredictionParameters params;
    ScreenMapping mapping;

    bool has_last_good = false;
    std::uint64_t last_contact_id = 0;
    cv::Point2d last_good_screen;
    core::TimePoint last_good_time;
    cv::Point2d velocity;           ///< Screen px per second
    cv::Point2d held_screen;
    core::TimePoint held_time;
    int occluded_streak = 0;

    // Inputs of the previous call; occlusion only advances when they change
    bool has_last_input = false;
    std::uint64_t last_input_id = 0;
    cv::Point last_input_position;
    cv::Point2d last_input_centroid;

    bool same_input(const tracking::ReferencePose& pose, const tracking::Contact& pointing) const {
        return has_last_input && last_input_id == pointing.id &&
               last_input_position == pointing.position &&
               last_input_centroid == pose.centroid;
    }

    void remember_input(const tracking::ReferencePose& pose, const tracking::Contact& pointing) {
        has_last_input = true;
        last_input_id = pointing.id;
        last_input_position = pointing.position;
        last_input_centroid = pose.centroid;
    }

    bool build_frame(const tracking::ReferencePose& pose, SectorFrame& frame) const {
        frame.center = pose.centroid;
        frame.axis_u = pose.baseline_unit();
        frame.axis_v = pose.perpendicular_axis;

        cv::Point2d dt = pose.thumb.position_d() - pose.centroid;
        cv::Point2d dp = pose.pinky.position_d() - pose.centroid;
        double reach = std::max(std::sqrt(dt.dot(dt)), std::sqrt(dp.dot(dp)));

        frame.outer_a = params.outer_ellipse_scale * reach;
        frame.outer_b = params.outer_ellipse_aspect * frame.outer_a;
        double ratio = params.clamped_ratio();
        frame.pointer_a = ratio * frame.outer_a;
        frame.pointer_b = ratio * frame.outer_b;
        return frame.pointer_a > 1e-9 && frame.pointer_b > 1e-9;
    }

    cv::Point2d to_screen_px(const cv::Point2d& pad_offset) const {
        cv::Point2d s = mapping.scale();
        return cv::Point2d(pad_offset.x * s.x, pad_offset.y * s.y);
    }

    /// Unclamped affine mapping, for outlines that leave the pad
    cv::Point2d project(const cv::Point2d& pad) const {
        cv::Point2d s = mapping.scale();
        return cv::Point2d((pad.x - mapping.bounds().min_x) * s.x,
                           (pad.y - mapping.bounds().min_y) * s.y);
    }

    PredictionConfidence classify(const tracking::ReferencePose& pose,
                                  const SectorFrame& frame,
                                  const tracking::Contact& pointing) const {
        const cv::Point2d q = pointing.position_d();
        const cv::Point2d m = pose.middle.position_d();

        cv::Point2d against_c;
        cv::Point2d against_m;
        if (params.occlusion_strategy == OcclusionStrategy::CONTACT_SIZE) {
            cv::Point2d s = mapping.scale();
            if (pointing.has_size()) {
                int minor = pointing.touch_minor > 0 ? pointing.touch_minor : pointing.touch_major;
                against_c = cv::Point2d(0.5 * pointing.touch_major * s.x, 0.5 * minor * s.y);
            } else {
                against_c = cv::Point2d(params.default_contact_ellipse_a_px,
                                        params.default_contact_ellipse_b_px);
            }
            against_m = against_c;
        } else {
            against_c = derived_ellipse(to_screen_px(q - frame.center),
                                        params.pred_min_ellipse_a_px,
                                        params.pred_min_ellipse_b_px);
            against_m = derived_ellipse(to_screen_px(q - m),
                                        params.pred_minM_ellipse_a_px,
                                        params.pred_minM_ellipse_b_px);
        }

        if (within_limit(against_m, params.pred_minM_ellipse_a_px, params.pred_minM_ellipse_b_px)) {
            cv::Point2d dm = m - frame.center;
            double mu = dm.dot(frame.axis_u) / frame.outer_a;
            double mv = dm.dot(frame.axis_v) / frame.outer_b;
            bool inside_outer = (mu * mu + mv * mv) <= 1.0;
            bool between = (m - q).dot(q - frame.center) > 0.0;
            if (inside_outer && between) {
                return PredictionConfidence::OCCLUDED;
            }
        }

        if (within_limit(against_c, params.pred_min_ellipse_a_px, params.pred_min_ellipse_b_px)) {
            return PredictionConfidence::INVALID;
        }
        return PredictionConfidence::NORMAL;
    }
};

PointerPredictor::PointerPredictor()
    : pImpl(std::make_unique<Impl>()) {
}

PointerPredictor::PointerPredictor(const PredictionParameters& params,
                                   const ScreenMapping& mapping)
    : pImpl(std::make_unique<Impl>()) {
    if (params.is_valid()) {
        pImpl->params = params;
    } else {
        LOG_WARNING("PointerPredictor: invalid prediction parameters, using defaults");
    }
    pImpl->mapping = mapping;
}

PointerPredictor::~PointerPredictor() = default;

PredictedPointer PointerPredictor::predict(const tracking::ReferencePose& pose,
                                           const tracking::Contact& pointing,
                                           core::TimePoint now) {
    PredictedPointer result;
    result.timestamp = now;
    result.contact_id = pointing.id;

    SectorFrame frame;
    if (!pose.valid || !pImpl->build_frame(pose, frame)) {
        result.confidence = PredictionConfidence::INVALID;
        return result;
    }

    // Polar coordinates in the pointer ellipse, angle 0 along the perpendicular
    cv::Point2d d = pointing.position_d() - frame.center;
    double u = d.dot(frame.axis_u);
    double v = d.dot(frame.axis_v);
    double phi = std::atan2(u, v);
    double nu = u / frame.pointer_a;
    double nv = v / frame.pointer_b;
    double r = std::min(1.0, std::sqrt(nu * nu + nv * nv));

    double r_warped = std::pow(r, pImpl->params.clamped_gamma());
    double theta = pImpl->params.pointer_mark_slope * phi + deg2rad(pImpl->params.pointer_mark_deg);

    result.sector_angle = rad2deg(theta);
    result.pad_point = frame.at(r_warped * frame.outer_a * std::sin(theta),
                                r_warped * frame.outer_b * std::cos(theta));
    result.screen_point = pImpl->mapping.pad_to_screen(result.pad_point);
    result.confidence = pImpl->classify(pose, frame, pointing);

    if (pImpl->has_last_good && pImpl->last_contact_id != pointing.id) {
        reset();
    }
    const bool unchanged = pImpl->same_input(pose, pointing);
    pImpl->remember_input(pose, pointing);

    switch (result.confidence) {
        case PredictionConfidence::NORMAL: {
            if (pImpl->has_last_good) {
                double dt = std::chrono::duration<double>(now - pImpl->last_good_time).count();
                pImpl->velocity = dt > 0.0
                    ? (result.screen_point - pImpl->last_good_screen) * (1.0 / dt)
                    : cv::Point2d(0.0, 0.0);
            } else {
                pImpl->velocity = cv::Point2d(0.0, 0.0);
            }
            pImpl->has_last_good = true;
            pImpl->last_contact_id = pointing.id;
            pImpl->last_good_screen = result.screen_point;
            pImpl->last_good_time = now;
            pImpl->held_screen = result.screen_point;
            pImpl->held_time = now;
            pImpl->occluded_streak = 0;
            result.has_output = true;
            break;
        }

        case PredictionConfidence::OCCLUDED: {
            if (!pImpl->has_last_good) {
                PADPOINT_LOG_TRACE("Predictor") << "Occluded without history, suppressing";
                break;
            }
            if (!unchanged || pImpl->occluded_streak == 0) {
                pImpl->occluded_streak++;
                double factor = std::pow(pImpl->params.occlusion_velocity_decay,
                                         pImpl->occluded_streak);
                double dt = std::chrono::duration<double>(now - pImpl->held_time).count();
                if (dt > 0.0) {
                    pImpl->held_screen = pImpl->mapping.clamp_to_screen(
                        pImpl->held_screen + pImpl->velocity * (factor * dt));
                }
            }
            pImpl->held_time = now;
            result.screen_point = pImpl->held_screen;
            result.pad_point = pImpl->mapping.screen_to_pad(result.screen_point);
            result.has_output = true;
            break;
        }

        case PredictionConfidence::INVALID:
            PADPOINT_LOG_TRACE("Predictor") << "Contact " << pointing.id
                << " too close to the centroid, output suppressed";
            break;
    }

    return result;
}

PredictionGeometry PointerPredictor::describe(const tracking::ReferencePose& pose) const {
    PredictionGeometry geometry;
    SectorFrame frame;
    if (!pose.valid || !pImpl->build_frame(pose, frame)) {
        return geometry;
    }

    geometry.outer_outline.reserve(kOutlineSamples);
    geometry.pointer_outline.reserve(kOutlineSamples);
    for (int i = 0; i < kOutlineSamples; ++i) {
        double t = 2.0 * kPi * i / kOutlineSamples;
        geometry.outer_outline.push_back(pImpl->project(
            frame.at(frame.outer_a * std::sin(t), frame.outer_b * std::cos(t))));
        geometry.pointer_outline.push_back(pImpl->project(
            frame.at(frame.pointer_a * std::sin(t), frame.pointer_b * std::cos(t))));
    }
    geometry.valid = true;
    return geometry;
}

void PointerPredictor::set_screen_mapping(const ScreenMapping& mapping) {
    pImpl->mapping = mapping;
    reset();
}

const ScreenMapping& PointerPredictor::get_screen_mapping() const {
    return pImpl->mapping;
}

void PointerPredictor::reset() {
    pImpl->has_last_good = false;
    pImpl->last_contact_id = 0;
    pImpl->velocity = cv::Point2d(0.0, 0.0);
    pImpl->occluded_streak = 0;
    pImpl->has_last_input = false;
}

bool PointerPredictor::has_last_good() const {
    return pImpl->has_last_good;
}

PredictionParameters PointerPredictor::get_parameters() const {
    return pImpl->params;
}

} // namespace prediction
} // namespace padpoint
