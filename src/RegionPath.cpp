// RegionPath.cpp
#include "RegionPath.h"
#include "Logging.h"
#include <QStringList>
#include <algorithm>
#include <set>
#include <utility>

RegionPath RegionPath::fromRect(const cv::Rect& r) {
    const int x1 = r.x + std::max(r.width, 1) - 1;
    const int y1 = r.y + std::max(r.height, 1) - 1;
    return RegionPath({ { r.x, r.y }, { x1, r.y }, { x1, y1 }, { r.x, y1 } });
}

void RegionPath::add(const cv::Point& p) {
    if (!pts_.empty() && pts_.back() == p) return;
    pts_.push_back(p);
}

int RegionPath::distinctCount() const {
    std::set<std::pair<int, int>> seen;
    for (const auto& p : pts_) seen.emplace(p.x, p.y);
    return static_cast<int>(seen.size());
}

cv::Rect RegionPath::boundingBox() const {
    if (pts_.empty()) return {};
    int x0 = pts_[0].x, y0 = pts_[0].y, x1 = x0, y1 = y0;
    for (const auto& p : pts_) {
        x0 = std::min(x0, p.x); x1 = std::max(x1, p.x);
        y0 = std::min(y0, p.y); y1 = std::max(y1, p.y);
    }
    return { x0, y0, x1 - x0 + 1, y1 - y0 + 1 };
}

double RegionPath::signedArea() const {
    const size_t n = pts_.size();
    if (n < 3) return 0.0;
    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const cv::Point& a = pts_[i];
        const cv::Point& b = pts_[(i + 1) % n];
        acc += static_cast<double>(a.x) * b.y - static_cast<double>(b.x) * a.y;
    }
    return acc * 0.5;
}

bool parseRegionPath(const QString& text, RegionPath& out) {
    RegionPath path;
    const QStringList pairs = text.split(';', Qt::SkipEmptyParts);
    for (const QString& pair : pairs) {
        const QStringList xy = pair.split(',');
        if (xy.size() != 2) return false;
        bool okX = false, okY = false;
        const int x = xy[0].trimmed().toInt(&okX);
        const int y = xy[1].trimmed().toInt(&okY);
        if (!okX || !okY) return false;
        path.add({ x, y });
    }
    out = std::move(path);
    return true;
}

void RegionRecorder::press(const cv::Point& p) {
    path_ = RegionPath();
    path_.add(p);
    state_ = State::Drawing;
}

void RegionRecorder::move(const cv::Point& p) {
    if (state_ == State::Drawing) path_.add(p);
}

RegionRecorder::State RegionRecorder::release(const cv::Point& p) {
    if (state_ != State::Drawing) return state_;
    path_.add(p);
    state_ = path_.isDegenerate() ? State::Degenerate : State::Finished;
    qCDebug(lcRegion) << "selection closed with" << path_.size() << "points"
                      << (state_ == State::Degenerate ? "(degenerate)" : "");
    return state_;
}

void RegionRecorder::abort() {
    state_ = State::Aborted;
    path_ = RegionPath();
}

void RegionRecorder::reset() {
    state_ = State::Idle;
    path_ = RegionPath();
}
