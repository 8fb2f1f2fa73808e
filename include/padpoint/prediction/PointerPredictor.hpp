/**
 * @file PointerPredictor.hpp
 * @brief Elliptical sector model mapping the pointing contact to the screen
 *
 * The pointing contact is expressed in polar coordinates of a pointer
 * ellipse around the reference centroid, warped, rotated and re-projected
 * onto the outer (reach) ellipse. The result is mapped to the screen through
 * the pad calibration.
 *
 * Confidence handling:
 * - OCCLUDED: middle finger between the contact and the reach arc; the last
 *   good screen point is extrapolated with a decaying velocity, one step
 *   per tick whose input differs from the previous tick
 * - INVALID: the contact is too close to the centroid; output suppressed
 */

#ifndef PADPOINT_PREDICTION_POINTER_PREDICTOR_HPP
#define PADPOINT_PREDICTION_POINTER_PREDICTOR_HPP

#include <memory>
#include "PredictionTypes.hpp"
#include "ScreenMapping.hpp"
#include "padpoint/tracking/TouchTypes.hpp"

namespace padpoint {
namespace prediction {

class PointerPredictor {
public:
    PointerPredictor();
    PointerPredictor(const PredictionParameters& params, const ScreenMapping& mapping);
    ~PointerPredictor();

    PointerPredictor(const PointerPredictor&) = delete;
    PointerPredictor& operator=(const PointerPredictor&) = delete;

    /**
     * @brief Predict the screen location for the pointing contact
     *
     * @param pose Valid reference pose
     * @param pointing The pointing (non-reference) contact
     * @param now Tick time
     */
    PredictedPointer predict(const tracking::ReferencePose& pose,
                             const tracking::Contact& pointing,
                             core::TimePoint now);

    /**
     * @brief Outer and pointer ellipse outlines in screen pixels
     */
    PredictionGeometry describe(const tracking::ReferencePose& pose) const;

    /**
     * @brief Replace the pad calibration (after auto-calibration)
     */
    void set_screen_mapping(const ScreenMapping& mapping);
    const ScreenMapping& get_screen_mapping() const;

    /**
     * @brief Forget the last good sample and velocity estimate
     */
    void reset();

    bool has_last_good() const;

    PredictionParameters get_parameters() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace prediction
} // namespace padpoint

#endif // PADPOINT_PREDICTION_POINTER_PREDICTOR_HPP
