// Pipeline.cpp
#include "Pipeline.h"
#include "FrameProcessor.h"
#include "Logging.h"
#include <QDir>
#include <QFileInfo>
#include <utility>

int SessionOutcome::exitCode() const {
    switch (kind) {
        case Kind::Completed:
        case Kind::Cancelled:     return 0;
        case Kind::CaptureFailed: return 2;
        case Kind::Failed:        return 3;
    }
    return 3;
}

LensSession::LensSession(const LensixConfig& cfg, CaptureRunner& runner, TextRecognizer* recognizer)
    : LensSession(cfg, runner, [](const OcrSettings& s) { return std::make_unique<OcrEngine>(s); }) {
    recognizer_ = recognizer;
}

LensSession::LensSession(const LensixConfig& cfg, CaptureRunner& runner, RecognizerFactory factory)
    : cfg_(cfg), runner_(runner), recognizer_(nullptr), factory_(std::move(factory)),
      dir_(QDir(QDir::tempPath()).filePath(QStringLiteral("lensix-XXXXXX"))) {
    if (!dir_.isValid())
        qCWarning(lcApp) << "cannot create session directory:" << dir_.errorString();
}

bool LensSession::stopBefore(const char* stage, SessionOutcome& out) const {
    if (!abort_) return false;
    qCInfo(lcApp) << "aborted before" << stage;
    out.kind = SessionOutcome::Kind::Cancelled;
    out.message = QStringLiteral("Cancelled.");
    return true;
}

TextRecognizer& LensSession::recognizer() {
    if (recognizer_) return *recognizer_;
    if (!ownRecognizer_) {
        if (!factory_) throw OcrError("no text recognizer configured");
        ownRecognizer_ = factory_(cfg_.ocr);
        if (!ownRecognizer_) throw OcrError("text recognizer could not be created");
    }
    return *ownRecognizer_;
}

CaptureResult LensSession::capture(const EnvironmentProfile& profile) {
    CaptureChain chain(runner_, cfg_.capture);
    return chain.capture(profile, workDir());
}

SessionOutcome LensSession::process(const RawImage& raw, const RegionPath& path, SearchMode requested) {
    SessionOutcome out;

    if (path.isDegenerate()) {
        out.message = QStringLiteral("No area selected.");
        qCInfo(lcRegion) << "selection has" << path.distinctCount() << "distinct points, nothing to do";
        return out;
    }
    if (stopBefore("masking", out)) return out;

    out.masked = applyMask(raw, path, cfg_.mask);
    if (out.masked.empty()) {
        out.message = QStringLiteral("The selection is outside the screen image.");
        return out;
    }
    const QString maskedPath = QDir(workDir()).filePath(QStringLiteral("masked.png"));
    if (isValid() && !writeMaskedPng(out.masked, maskedPath))
        qCWarning(lcMask) << "cannot keep masked selection at" << maskedPath;

    bool ocrUnavailable = false;
    if (requested != SearchMode::VisualSearch) {
        if (stopBefore("preprocessing", out)) return out;

        std::vector<CandidateImage> candidates;
        try {
            candidates = FrameProcessor(cfg_.preprocess).generate(out.masked);
        }
        catch (const DecodeError& e) {
            out.kind = SessionOutcome::Kind::Failed;
            out.message = QStringLiteral("Cannot read the selected area: %1").arg(e.what());
            return out;
        }

        if (stopBefore("recognition", out)) return out;
        try {
            ConsensusExtractor extractor(recognizer(), cfg_.ocr);
            out.consensus = extractor.extract(candidates, isValid() ? workDir() : QString());
        }
        catch (const OcrError& e) {
            // the image is still good for a visual search
            qCWarning(lcOcr) << "text recognition unavailable:" << e.what();
            ocrUnavailable = true;
        }
    }

    out.decision = route(out.consensus, requested, cfg_.routing);
    if (ocrUnavailable) out.decision.reason = QStringLiteral("text recognition unavailable");
    out.kind = SessionOutcome::Kind::Completed;
    if (out.decision.mode == SearchMode::VisualSearch) {
        out.message = out.decision.reason;
    } else {
        out.url = buildUrl(out.decision.mode, out.decision.text, cfg_.routing);
        out.message = out.decision.text;
    }
    return out;
}

SessionOutcome LensSession::run(const EnvironmentProfile& profile, const RegionPath& path, SearchMode requested) {
    const CaptureResult cap = capture(profile);
    if (!cap.ok) return captureFailure(cap);
    return process(cap.image, path, requested);
}

SessionOutcome captureFailure(const CaptureResult& capture) {
    SessionOutcome out;
    out.kind = SessionOutcome::Kind::CaptureFailed;
    out.message = capture.failureReport();
    return out;
}

bool deliver(SessionOutcome& outcome, Launcher& launcher, const RoutingSettings& routing) {
    if (outcome.kind != SessionOutcome::Kind::Completed) return false;

    if (outcome.decision.mode != SearchMode::VisualSearch) {
        if (!outcome.url.isValid()) outcome.url = buildUrl(outcome.decision.mode, outcome.decision.text, routing);
        return launcher.openUrl(outcome.url);
    }

    const QString target = Launcher::handoffPath();
    if (!QDir().mkpath(QFileInfo(target).absolutePath()) || !writeMaskedPng(outcome.masked, target)) {
        qCWarning(lcApp) << "cannot write visual search image" << target;
        return false;
    }
    return launcher.visualSearch(target);
}
