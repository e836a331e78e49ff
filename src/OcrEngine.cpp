// OcrEngine.cpp
#include "OcrEngine.h"
#include "Logging.h"
#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>
#include <leptonica/allheaders.h>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace {

constexpr int kSourceDpi = 150;

struct PixDeleter {
    void operator()(Pix* p) const { pixDestroy(&p); }
};
using PixPtr = std::unique_ptr<Pix, PixDeleter>;

// Leptonica packs 8bpp pixels into 32-bit words; SET_DATA_BYTE handles the
// byte order, a straight memcpy of the row does not.
PixPtr toPix(const cv::Mat& gray) {
    PixPtr pix(pixCreate(gray.cols, gray.rows, 8));
    if (!pix) return pix;
    l_uint32* data = pixGetData(pix.get());
    const int wpl = pixGetWpl(pix.get());
    for (int y = 0; y < gray.rows; ++y) {
        l_uint32* line = data + y * wpl;
        const uchar* src = gray.ptr<uchar>(y);
        for (int x = 0; x < gray.cols; ++x) SET_DATA_BYTE(line, x, src[x]);
    }
    pixSetResolution(pix.get(), kSourceDpi, kSourceDpi);
    return pix;
}

} // namespace

OcrEngine::OcrEngine(const OcrSettings& settings)
    : api_(std::make_unique<tesseract::TessBaseAPI>()) {
    const char* datapath = settings.tessdataDir.empty() ? nullptr : settings.tessdataDir.c_str();
    if (api_->Init(datapath, settings.languages.c_str()) != 0) {
        api_.reset();
        throw OcrError("tesseract init failed for languages '" + settings.languages + "'"
            + (datapath ? " in " + settings.tessdataDir : std::string()));
    }
    api_->SetPageSegMode(static_cast<tesseract::PageSegMode>(settings.pageSegMode));
    api_->SetVariable("debug_file", "/dev/null");
    qCDebug(lcOcr) << "tesseract" << tesseract::TessBaseAPI::Version()
                   << "languages" << settings.languages.c_str();
}

OcrEngine::~OcrEngine() {
    if (api_) api_->End();
}

std::vector<WordObservation> OcrEngine::recognize(const cv::Mat& gray) {
    std::vector<WordObservation> words;
    if (gray.empty()) return words;

    cv::Mat g = gray;
    if (g.type() != CV_8UC1) {
        if (g.channels() == 3)      cv::cvtColor(gray, g, cv::COLOR_BGR2GRAY);
        else if (g.channels() == 4) cv::cvtColor(gray, g, cv::COLOR_BGRA2GRAY);
        else throw OcrError("unsupported image type for OCR");
    }

    PixPtr pix = toPix(g);
    if (!pix) throw OcrError("pixCreate failed");

    api_->SetImage(pix.get());
    if (api_->Recognize(nullptr) != 0) {
        api_->Clear();
        throw OcrError("tesseract Recognize failed");
    }

    std::unique_ptr<tesseract::ResultIterator> ri(api_->GetIterator());
    if (ri) {
        do {
            if (ri->Empty(tesseract::RIL_WORD)) continue;
            std::unique_ptr<char[]> text(ri->GetUTF8Text(tesseract::RIL_WORD));
            if (!text) continue;
            const float conf = ri->Confidence(tesseract::RIL_WORD);
            const int c = std::clamp(static_cast<int>(std::lround(conf)), 0, 100);
            words.push_back({ text.get(), c });
        } while (ri->Next(tesseract::RIL_WORD));
    }
    api_->Clear();
    return words;
}
