// FrameProcessor.cpp
#include "FrameProcessor.h"
#include "Logging.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <functional>
#include <utility>

namespace {

uchar medianUnderMask(const cv::Mat& gray, const cv::Mat& mask) {
    std::array<int, 256> hist{};
    int total = 0;
    for (int y = 0; y < gray.rows; ++y) {
        const uchar* g = gray.ptr<uchar>(y);
        const uchar* m = mask.ptr<uchar>(y);
        for (int x = 0; x < gray.cols; ++x)
            if (m[x]) { ++hist[g[x]]; ++total; }
    }
    if (total == 0) return 255;
    int acc = 0;
    for (int v = 0; v < 256; ++v) {
        acc += hist[v];
        if (acc * 2 >= total) return static_cast<uchar>(v);
    }
    return 255;
}

} // namespace

const char* strategyName(StrategyId id) {
    switch (id) {
        case StrategyId::AdaptiveThreshold: return "adaptive";
        case StrategyId::OtsuThreshold:     return "otsu";
        case StrategyId::ContrastBoost:     return "contrast";
        case StrategyId::InvertedAdaptive:  return "inverted-adaptive";
        case StrategyId::InvertedOtsu:      return "inverted-otsu";
        case StrategyId::InvertedContrast:  return "inverted-contrast";
    }
    return "?";
}

cv::Mat FrameProcessor::flatten(const MaskedImage& masked) const {
    if (masked.bgra.empty() || masked.bgra.type() != CV_8UC4)
        throw DecodeError("masked image is empty or not 8-bit BGRA");
    if (masked.coverage.size() != masked.bgra.size() || masked.coverage.type() != CV_8UC1)
        throw DecodeError("coverage mask does not match masked image");

    cv::Mat gray;
    try {
        cv::cvtColor(masked.bgra, gray, cv::COLOR_BGRA2GRAY);
    }
    catch (const cv::Exception& e) {
        throw DecodeError(std::string("cannot convert masked image: ") + e.what());
    }

    cv::Mat outside;
    cv::bitwise_not(masked.coverage, outside);
    gray.setTo(cv::Scalar(medianUnderMask(gray, masked.coverage)), outside);

    // tesseract wants roughly 20px+ glyphs; small selections get doubled
    if (s_.upscaleBelowHeight > 0 && gray.rows < s_.upscaleBelowHeight) {
        cv::Mat big;
        cv::resize(gray, big, cv::Size(), 2.0, 2.0, cv::INTER_CUBIC);
        gray = big;
    }
    return gray;
}

cv::Mat FrameProcessor::adaptive(const cv::Mat& gray) const {
    cv::Mat denoised, bin;
    cv::medianBlur(gray, denoised, 3);
    const int block = (s_.adaptiveBlock % 2 == 0) ? s_.adaptiveBlock + 1 : std::max(3, s_.adaptiveBlock);
    cv::adaptiveThreshold(denoised, bin, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, block, s_.adaptiveC);
    return bin;
}

cv::Mat FrameProcessor::otsu(const cv::Mat& gray) const {
    cv::Mat bin;
    cv::threshold(gray, bin, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);
    return bin;
}

cv::Mat FrameProcessor::contrast(const cv::Mat& gray) const {
    // scale distance from mid-gray: v' = f * (v - 128) + 128
    cv::Mat out;
    gray.convertTo(out, CV_8UC1, s_.contrastFactor, 128.0 * (1.0 - s_.contrastFactor));
    return out;
}

std::vector<CandidateImage> FrameProcessor::generate(const MaskedImage& masked) const {
    const cv::Mat gray = flatten(masked);

    using Transform = std::function<cv::Mat(const cv::Mat&)>;
    const std::array<std::pair<StrategyId, bool>, 3> bases = { {
        { StrategyId::AdaptiveThreshold, true },
        { StrategyId::OtsuThreshold, s_.useOtsu },
        { StrategyId::ContrastBoost, s_.useContrast },
    } };
    const std::array<Transform, 3> transforms = {
        [this](const cv::Mat& g) { return adaptive(g); },
        [this](const cv::Mat& g) { return otsu(g); },
        [this](const cv::Mat& g) { return contrast(g); },
    };

    std::vector<CandidateImage> base, inverted;
    for (size_t i = 0; i < bases.size(); ++i) {
        if (!bases[i].second) continue;
        const StrategyId id = bases[i].first;
        const StrategyId invId = static_cast<StrategyId>(static_cast<int>(id) + 3);
        try {
            cv::Mat img = transforms[i](gray);
            if (id == StrategyId::AdaptiveThreshold || s_.useInverted) {
                cv::Mat inv;
                cv::bitwise_not(img, inv);
                inverted.push_back({ invId, inv });
            }
            base.push_back({ id, img });
        }
        catch (const cv::Exception& e) {
            qCWarning(lcPreprocess) << "dropping" << strategyName(id) << ":" << e.what();
        }
    }

    base.insert(base.end(), inverted.begin(), inverted.end());
    qCDebug(lcPreprocess) << base.size() << "candidates from" << gray.cols << "x" << gray.rows << "crop";
    return base;
}
