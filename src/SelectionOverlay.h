// SelectionOverlay.h
#pragma once
#include <QImage>
#include <QPointF>
#include <QVector>
#include <QWidget>
#include <opencv2/core.hpp>
#include "RegionPath.h"

class QKeyEvent;
class QMouseEvent;
class QPaintEvent;

// Full-screen window showing the captured frame; the user draws a freehand
// loop around what they want searched. Coordinates handed to the recorder are
// image pixels, not widget pixels.
class SelectionOverlay : public QWidget {
    Q_OBJECT
public:
    explicit SelectionOverlay(const cv::Mat& bgr, QWidget* parent = nullptr);

signals:
    void selectionFinished(const RegionPath& path);
    void selectionCancelled();

protected:
    void paintEvent(QPaintEvent* e) override;
    void mousePressEvent(QMouseEvent* e) override;
    void mouseMoveEvent(QMouseEvent* e) override;
    void mouseReleaseEvent(QMouseEvent* e) override;
    void keyPressEvent(QKeyEvent* e) override;

private:
    cv::Point toImage(const QPointF& widgetPos) const;

    QImage frame_;
    RegionRecorder recorder_;
    QVector<QPointF> stroke_;   // widget coordinates, for painting only
};
