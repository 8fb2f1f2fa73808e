#include "padpoint/gui/overlay_widget.hpp"
#include "padpoint/core/Logger.hpp"

#include <QGuiApplication>
#include <QPainter>
#include <QPainterPath>
#include <QPen>
#include <QScreen>

namespace padpoint {
namespace gui {

namespace {

const QColor kGridColor(200, 200, 200, 60);
const QColor kReferenceColor(25, 132, 255, 220);
const QColor kOuterColor(255, 160, 0, 200);
const QColor kPointerColor(155, 89, 182, 200);
const QColor kMarkerColor(241, 196, 15, 240);
const QColor kInvalidColor(231, 76, 60, 240);
const QColor kOccludedColor(150, 150, 150, 220);
const QColor kActionColor(46, 204, 113, 240);

constexpr int kPollIntervalMs = 8;

QPainterPath outlinePath(const std::vector<cv::Point2d>& outline) {
    QPainterPath path;
    if (outline.empty()) {
        return path;
    }
    path.moveTo(outline.front().x, outline.front().y);
    for (size_t i = 1; i < outline.size(); ++i) {
        path.lineTo(outline[i].x, outline[i].y);
    }
    path.closeSubpath();
    return path;
}

} // namespace

OverlayWidget::OverlayWidget(pipeline::LatestValueMailbox<pipeline::OverlaySnapshot>& mailbox,
                             const core::OverlayConfig& config,
                             QWidget* parent)
    : QWidget(parent)
    , mailbox_(mailbox)
    , config_(config)
    , poll_timer_(new QTimer(this))
    , has_snapshot_(false)
    , frame_count_(0)
    , fading_(false) {

    setWindowFlags(Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint |
                   Qt::Tool | Qt::WindowTransparentForInput);
    setAttribute(Qt::WA_TranslucentBackground);
    setAttribute(Qt::WA_TransparentForMouseEvents);
    setAttribute(Qt::WA_ShowWithoutActivating);

    if (QScreen* screen = QGuiApplication::primaryScreen()) {
        setGeometry(screen->geometry());
    }

    connect(poll_timer_, &QTimer::timeout, this, &OverlayWidget::pollSnapshot);
    poll_timer_->start(kPollIntervalMs);

    PADPOINT_LOG_DEBUG("Overlay") << "Overlay widget created " << width() << "x" << height();
}

OverlayWidget::~OverlayWidget() {
    poll_timer_->stop();
}

void OverlayWidget::pollSnapshot() {
    pipeline::OverlaySnapshot next;
    if (mailbox_.tryTake(next)) {
        if (has_snapshot_ && snapshot_.hasPose && !next.hasPose) {
            fading_refs_ = snapshot_.referencePoints;
            fading_ = config_.fade_ms > 0;
            fade_clock_.start();
        } else if (next.hasPose) {
            fading_ = false;
        }
        snapshot_ = std::move(next);
        has_snapshot_ = true;
        frame_count_++;
        update();
    } else if (fading_) {
        update();
    }
}

void OverlayWidget::paintEvent(QPaintEvent* /*event*/) {
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setCompositionMode(QPainter::CompositionMode_Source);
    painter.fillRect(rect(), Qt::transparent);
    painter.setCompositionMode(QPainter::CompositionMode_SourceOver);

    if (config_.grid > 0) {
        drawGrid(painter);
    }
    if (!has_snapshot_) {
        return;
    }

    // Snapshot coordinates are in screen pixels; scale if the widget differs
    if (snapshot_.screenWidth > 0 && snapshot_.screenHeight > 0) {
        painter.scale(static_cast<double>(width()) / snapshot_.screenWidth,
                      static_cast<double>(height()) / snapshot_.screenHeight);
    }

    drawReferences(painter);
    drawPrediction(painter);
}

void OverlayWidget::drawGrid(QPainter& painter) {
    QPen pen(kGridColor);
    pen.setWidth(1);
    painter.setPen(pen);
    for (int i = 1; i < config_.grid; ++i) {
        int x = i * width() / config_.grid;
        painter.drawLine(x, 0, x, height());
    }
    for (int j = 1; j < config_.grid; ++j) {
        int y = j * height() / config_.grid;
        painter.drawLine(0, y, width(), y);
    }
}

void OverlayWidget::drawReferences(QPainter& painter) {
    const double radius = config_.indicator_size * 0.5;
    const std::vector<cv::Point2d>* refs = nullptr;
    double opacity = 1.0;

    if (snapshot_.hasPose) {
        refs = &snapshot_.referencePoints;
    } else if (fading_) {
        qint64 elapsed = fade_clock_.elapsed();
        if (elapsed >= config_.fade_ms) {
            fading_ = false;
            return;
        }
        opacity = 1.0 - static_cast<double>(elapsed) / config_.fade_ms;
        refs = &fading_refs_;
    }
    if (refs == nullptr) {
        return;
    }

    painter.save();
    painter.setOpacity(opacity);
    painter.setPen(Qt::NoPen);
    painter.setBrush(kReferenceColor);
    for (const auto& p : *refs) {
        painter.drawEllipse(QPointF(p.x, p.y), radius, radius);
    }
    painter.restore();
}

void OverlayWidget::drawPrediction(QPainter& painter) {
    if (snapshot_.hasPose && snapshot_.geometry.valid) {
        QPen outer(kOuterColor);
        outer.setWidth(2);
        outer.setStyle(Qt::DashLine);
        painter.setPen(outer);
        painter.setBrush(Qt::NoBrush);
        painter.drawPath(outlinePath(snapshot_.geometry.outer_outline));

        QPen inner(kPointerColor);
        inner.setWidth(2);
        painter.setPen(inner);
        painter.drawPath(outlinePath(snapshot_.geometry.pointer_outline));
    }

    if (snapshot_.hasPrediction) {
        QColor color = kMarkerColor;
        if (snapshot_.prediction.confidence == prediction::PredictionConfidence::INVALID) {
            color = kInvalidColor;
        } else if (snapshot_.prediction.confidence == prediction::PredictionConfidence::OCCLUDED) {
            color = kOccludedColor;
        }
        const double r = config_.indicator_size * 0.5;
        QPen pen(color.darker(130));
        pen.setWidth(2);
        painter.setPen(pen);
        painter.setBrush(color);
        const auto& s = snapshot_.prediction.screen_point;
        painter.drawEllipse(QPointF(s.x, s.y), r, r);
    }

    if (config_.show_action_dot && snapshot_.actionActive) {
        const double r = config_.indicator_size * 0.35;
        painter.setPen(Qt::NoPen);
        painter.setBrush(kActionColor);
        painter.drawEllipse(QPointF(snapshot_.actionPoint.x, snapshot_.actionPoint.y), r, r);
    }
}

} // namespace gui
} // namespace padpoint
