// FrameProcessor.h
#pragma once
#include <opencv2/core.hpp>
#include <stdexcept>
#include <vector>
#include "Config.h"
#include "MaskCrop.h"

// Fixed generation order; consensus ties go to the earlier id.
enum class StrategyId {
    AdaptiveThreshold,
    OtsuThreshold,
    ContrastBoost,
    InvertedAdaptive,
    InvertedOtsu,
    InvertedContrast,
};

const char* strategyName(StrategyId id);

struct CandidateImage {
    StrategyId id;
    cv::Mat gray;   // CV_8UC1
};

class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Builds the OCR candidates for one masked selection. Every candidate is derived
// from the flattened grayscale crop, never from another candidate, so dark and
// light backgrounds are both covered without knowing which one we have.
class FrameProcessor {
public:
    explicit FrameProcessor(PreprocessSettings s = {}) : s_(s) {}

    // Throws DecodeError when the masked buffer itself is unusable.
    std::vector<CandidateImage> generate(const MaskedImage& masked) const;

    // Grayscale crop with the blank area painted in the median covered gray.
    cv::Mat flatten(const MaskedImage& masked) const;

    cv::Mat adaptive(const cv::Mat& gray) const;
    cv::Mat otsu(const cv::Mat& gray) const;
    cv::Mat contrast(const cv::Mat& gray) const;

private:
    PreprocessSettings s_;
};
