#pragma once

#include <QWidget>
#include <QTimer>
#include <QElapsedTimer>

#include "padpoint/core/Configuration.hpp"
#include "padpoint/pipeline/LatestValueMailbox.hpp"
#include "padpoint/pipeline/OutputSinks.hpp"

namespace padpoint {
namespace gui {

/**
 * @brief Full-screen transparent overlay showing the pointer model
 *
 * Frameless, translucent, always on top and transparent to input. A timer
 * polls the overlay mailbox and repaints with the newest snapshot:
 * - optional guide grid
 * - reference finger dots (fade out after the pose is lost)
 * - outer ellipse (dashed orange) and pointer ellipse (amethyst)
 * - predicted marker: gold, red when Invalid, grey when Occluded
 * - action dot (green) while armed
 */
class OverlayWidget : public QWidget {
    Q_OBJECT

public:
    OverlayWidget(pipeline::LatestValueMailbox<pipeline::OverlaySnapshot>& mailbox,
                  const core::OverlayConfig& config,
                  QWidget* parent = nullptr);
    ~OverlayWidget() override;

    /**
     * @brief Number of snapshots drawn so far
     */
    quint64 frameCount() const { return frame_count_; }

protected:
    void paintEvent(QPaintEvent* event) override;

private slots:
    void pollSnapshot();

private:
    void drawGrid(QPainter& painter);
    void drawReferences(QPainter& painter);
    void drawPrediction(QPainter& painter);

    pipeline::LatestValueMailbox<pipeline::OverlaySnapshot>& mailbox_;
    core::OverlayConfig config_;
    QTimer* poll_timer_;

    pipeline::OverlaySnapshot snapshot_;
    bool has_snapshot_;
    quint64 frame_count_;

    // Last reference dots, kept for the fade-out after pose loss
    std::vector<cv::Point2d> fading_refs_;
    QElapsedTimer fade_clock_;
    bool fading_;
};

} // namespace gui
} // namespace padpoint
