// RegionPath.h
#pragma once
#include <QString>
#include <opencv2/core.hpp>
#include <utility>
#include <vector>

// Freehand selection in image coordinates, implicitly closed (last -> first).
class RegionPath {
public:
    RegionPath() = default;
    explicit RegionPath(std::vector<cv::Point> pts) : pts_(std::move(pts)) {}

    static RegionPath fromRect(const cv::Rect& r);

    void add(const cv::Point& p);
    const std::vector<cv::Point>& points() const { return pts_; }
    size_t size() const { return pts_.size(); }

    int distinctCount() const;
    bool isDegenerate() const { return distinctCount() < 3; }

    // Inclusive min/max over the points: width = maxX - minX + 1.
    cv::Rect boundingBox() const;
    // Shoelace area; signed by orientation.
    double signedArea() const;

private:
    std::vector<cv::Point> pts_;
};

// "x,y;x,y;..." as used by --region. Returns false on malformed input.
bool parseRegionPath(const QString& text, RegionPath& out);

// Pointer event sink fed by the overlay.
class RegionRecorder {
public:
    enum class State { Idle, Drawing, Finished, Degenerate, Aborted };

    void press(const cv::Point& p);
    void move(const cv::Point& p);
    State release(const cv::Point& p);
    void abort();
    void reset();

    State state() const { return state_; }
    const RegionPath& path() const { return path_; }

private:
    State state_{ State::Idle };
    RegionPath path_;
};
