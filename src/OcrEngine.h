// OcrEngine.h
#pragma once
#include <opencv2/core.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include "Config.h"

namespace tesseract { class TessBaseAPI; }

struct WordObservation {
    std::string text;
    int confidence;   // 0..100
};

class OcrError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// OCR capability seen by the consensus step: one 8-bit image in, the words in
// reading order out.
class TextRecognizer {
public:
    virtual ~TextRecognizer() = default;
    virtual std::vector<WordObservation> recognize(const cv::Mat& gray) = 0;
};

// Tesseract behind TextRecognizer. One engine per session; Init is expensive.
class OcrEngine : public TextRecognizer {
public:
    // Throws OcrError when the language data cannot be loaded.
    explicit OcrEngine(const OcrSettings& settings);
    ~OcrEngine() override;

    OcrEngine(const OcrEngine&) = delete;
    OcrEngine& operator=(const OcrEngine&) = delete;

    std::vector<WordObservation> recognize(const cv::Mat& gray) override;

private:
    std::unique_ptr<tesseract::TessBaseAPI> api_;
};
