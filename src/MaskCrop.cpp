// MaskCrop.cpp
#include "MaskCrop.h"
#include "Logging.h"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace {

// > 0: p left of a->b, < 0: right, 0: collinear
int64_t isLeft(const cv::Point& a, const cv::Point& b, const cv::Point& p) {
    return static_cast<int64_t>(b.x - a.x) * (p.y - a.y) - static_cast<int64_t>(p.x - a.x) * (b.y - a.y);
}

bool onSegment(const cv::Point& a, const cv::Point& b, const cv::Point& p) {
    if (isLeft(a, b, p) != 0) return false;
    return p.x >= std::min(a.x, b.x) && p.x <= std::max(a.x, b.x)
        && p.y >= std::min(a.y, b.y) && p.y <= std::max(a.y, b.y);
}

cv::Mat toBgra(const cv::Mat& src) {
    cv::Mat out;
    switch (src.channels()) {
        case 1: cv::cvtColor(src, out, cv::COLOR_GRAY2BGRA); break;
        case 3: cv::cvtColor(src, out, cv::COLOR_BGR2BGRA); break;
        case 4: out = src.clone(); break;
        default: CV_Error(cv::Error::StsBadArg, "unsupported channel count");
    }
    return out;
}

} // namespace

PolygonCoverage::PolygonCoverage(const std::vector<cv::Point>& pts, FillRule rule) : rule_(rule) {
    const size_t n = pts.size();
    for (size_t i = 0; i < n; ++i) {
        const cv::Point& a = pts[i];
        const cv::Point& b = pts[(i + 1) % n];
        if (n > 1 && a == b) continue;
        edges_.push_back({ a, b, std::min(a.y, b.y), std::max(a.y, b.y) });
    }
}

bool PolygonCoverage::containsWith(const std::vector<const Edge*>& edges, const cv::Point& p) const {
    int winding = 0, crossings = 0;
    for (const Edge* e : edges) {
        if (onSegment(e->a, e->b, p)) return true;
        // half-open in y so a vertex shared by two edges counts once
        if (e->a.y <= p.y && e->b.y > p.y) {
            if (isLeft(e->a, e->b, p) > 0) { ++winding; ++crossings; }
        } else if (e->b.y <= p.y && e->a.y > p.y) {
            if (isLeft(e->a, e->b, p) < 0) { --winding; ++crossings; }
        }
    }
    return rule_ == FillRule::EvenOdd ? (crossings & 1) != 0 : winding != 0;
}

bool PolygonCoverage::contains(const cv::Point& p) const {
    std::vector<const Edge*> active;
    active.reserve(edges_.size());
    for (const auto& e : edges_)
        if (p.y >= e.yMin && p.y <= e.yMax) active.push_back(&e);
    return containsWith(active, p);
}

cv::Mat PolygonCoverage::rasterize(const cv::Rect& area) const {
    cv::Mat mask = cv::Mat::zeros(area.height, area.width, CV_8UC1);
    std::vector<const Edge*> active;
    for (int row = 0; row < area.height; ++row) {
        const int y = area.y + row;
        active.clear();
        for (const auto& e : edges_)
            if (y >= e.yMin && y <= e.yMax) active.push_back(&e);
        if (active.empty()) continue;

        uchar* dst = mask.ptr<uchar>(row);
        for (int col = 0; col < area.width; ++col)
            if (containsWith(active, { area.x + col, y })) dst[col] = 255;
    }
    return mask;
}

MaskedImage applyMask(const cv::Mat& image, const RegionPath& path, const MaskSettings& settings) {
    MaskedImage out;
    const cv::Rect full = path.boundingBox();
    const cv::Rect box = full & cv::Rect(0, 0, image.cols, image.rows);
    if (image.empty() || box.empty()) {
        qCWarning(lcMask) << "selection lies outside the captured image";
        return out;
    }

    const PolygonCoverage coverage(path.points(), settings.fillRule);
    cv::Mat mask = coverage.rasterize(box);

    // covered pixels rather than shoelace area: a figure-eight stroke has
    // lobes of opposite sign that cancel out
    const int covered = cv::countNonZero(mask);
    const bool sliver = full.width <= 2 || full.height <= 2;
    if (sliver || covered < settings.minAreaFraction * static_cast<double>(box.area())) {
        cv::Mat ellipse = cv::Mat::zeros(box.size(), CV_8UC1);
        if (sliver) {
            ellipse.setTo(255);
        } else {
            const cv::Point center(full.x + (full.width - 1) / 2 - box.x, full.y + (full.height - 1) / 2 - box.y);
            const cv::Size axes((full.width - 1) / 2, (full.height - 1) / 2);
            cv::ellipse(ellipse, center, axes, 0.0, 0.0, 360.0, cv::Scalar(255), cv::FILLED);
        }
        cv::bitwise_or(mask, ellipse, mask);
        out.ellipseFallback = true;
        qCDebug(lcMask) << "polygon covers" << covered << "px (area" << std::abs(path.signedArea())
                        << ") of a" << full.width << "x" << full.height << "box, using inscribed ellipse";
    }

    const cv::Mat src = toBgra(image(box));
    out.bgra = cv::Mat::zeros(box.size(), CV_8UC4);
    src.copyTo(out.bgra, mask);
    out.coverage = mask;
    out.bounds = box;
    qCDebug(lcMask) << "masked" << box.width << "x" << box.height << "at" << box.x << box.y
                    << "covered" << cv::countNonZero(mask);
    return out;
}

MaskedImage applyMask(const RawImage& raw, const RegionPath& path, const MaskSettings& settings) {
    return applyMask(raw.bgr, path, settings);
}

bool writeMaskedPng(const MaskedImage& masked, const QString& path) {
    if (masked.empty()) return false;
    try {
        return cv::imwrite(path.toStdString(), masked.bgra);
    }
    catch (const cv::Exception& e) {
        qCWarning(lcMask) << "cannot write" << path << ":" << e.what();
        return false;
    }
}
