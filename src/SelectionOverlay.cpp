// SelectionOverlay.cpp
#include "SelectionOverlay.h"
#include "Logging.h"
#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QPainterPath>
#include <opencv2/imgproc.hpp>
#include <algorithm>

static QImage MatBGRToQImage(const cv::Mat& bgr) {
    cv::Mat rgb;
    cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
    return QImage(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888).copy();
}

SelectionOverlay::SelectionOverlay(const cv::Mat& bgr, QWidget* parent)
    : QWidget(parent), frame_(MatBGRToQImage(bgr)) {
    setWindowFlags(Qt::FramelessWindowHint | Qt::WindowStaysOnTopHint | Qt::Tool);
    setAttribute(Qt::WA_DeleteOnClose);
    setCursor(Qt::CrossCursor);
    setFocusPolicy(Qt::StrongFocus);
    setMouseTracking(false);
}

cv::Point SelectionOverlay::toImage(const QPointF& p) const {
    const double sx = width() > 0 ? static_cast<double>(frame_.width()) / width() : 1.0;
    const double sy = height() > 0 ? static_cast<double>(frame_.height()) / height() : 1.0;
    const int x = std::clamp(static_cast<int>(p.x() * sx), 0, std::max(0, frame_.width() - 1));
    const int y = std::clamp(static_cast<int>(p.y() * sy), 0, std::max(0, frame_.height() - 1));
    return { x, y };
}

void SelectionOverlay::paintEvent(QPaintEvent*) {
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing);
    painter.drawImage(rect(), frame_);
    painter.fillRect(rect(), QColor(0, 0, 0, 90));

    if (stroke_.size() < 2) return;
    QPainterPath path(stroke_.front());
    for (int i = 1; i < stroke_.size(); ++i) path.lineTo(stroke_[i]);
    if (recorder_.state() != RegionRecorder::State::Drawing) path.closeSubpath();

    // selected area shown undimmed
    painter.save();
    painter.setClipPath(path);
    painter.drawImage(rect(), frame_);
    painter.restore();

    painter.setPen(QPen(QColor(90, 174, 240), 3, Qt::SolidLine, Qt::RoundCap, Qt::RoundJoin));
    painter.drawPath(path);
}

void SelectionOverlay::mousePressEvent(QMouseEvent* e) {
    if (e->button() != Qt::LeftButton) return;
    stroke_ = { e->position() };
    recorder_.press(toImage(e->position()));
    update();
}

void SelectionOverlay::mouseMoveEvent(QMouseEvent* e) {
    if (recorder_.state() != RegionRecorder::State::Drawing) return;
    stroke_ << e->position();
    recorder_.move(toImage(e->position()));
    update();
}

void SelectionOverlay::mouseReleaseEvent(QMouseEvent* e) {
    if (e->button() != Qt::LeftButton) return;
    stroke_ << e->position();
    const auto state = recorder_.release(toImage(e->position()));
    update();
    hide();
    if (state == RegionRecorder::State::Finished) emit selectionFinished(recorder_.path());
    else emit selectionCancelled();
    close();
}

void SelectionOverlay::keyPressEvent(QKeyEvent* e) {
    if (e->key() != Qt::Key_Escape) { QWidget::keyPressEvent(e); return; }
    qCInfo(lcRegion) << "selection aborted";
    recorder_.abort();
    hide();
    emit selectionCancelled();
    close();
}
