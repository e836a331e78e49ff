// MaskCrop.h
#pragma once
#include <QString>
#include <opencv2/core.hpp>
#include <vector>
#include "CaptureChain.h"
#include "Config.h"
#include "RegionPath.h"

// Point-in-polygon over the closed path. Points lying on an edge are inside;
// everything else follows the fill rule. Self-intersecting loops differ
// between the rules: even-odd leaves doubly wound lobes empty.
class PolygonCoverage {
public:
    PolygonCoverage(const std::vector<cv::Point>& pts, FillRule rule);

    bool contains(const cv::Point& p) const;

    // CV_8UC1 of area.size(), 255 where contains() holds. area is absolute.
    cv::Mat rasterize(const cv::Rect& area) const;

private:
    struct Edge {
        cv::Point a, b;
        int yMin, yMax;
    };
    bool containsWith(const std::vector<const Edge*>& edges, const cv::Point& p) const;

    std::vector<Edge> edges_;
    FillRule rule_;
};

struct MaskedImage {
    cv::Mat bgra;          // outside pixels: B=G=R=A=0
    cv::Mat coverage;      // CV_8UC1, 255 inside
    cv::Rect bounds;       // absolute position in the raw image
    bool ellipseFallback{ false };

    bool empty() const { return bgra.empty(); }
};

// Crop to the path's bounding box (clamped to the image) and blank every pixel
// outside the polygon. A sliver polygon is widened to the inscribed ellipse.
// Returns an empty MaskedImage when the box misses the image entirely.
MaskedImage applyMask(const cv::Mat& image, const RegionPath& path, const MaskSettings& settings);
MaskedImage applyMask(const RawImage& raw, const RegionPath& path, const MaskSettings& settings);

bool writeMaskedPng(const MaskedImage& masked, const QString& path);
