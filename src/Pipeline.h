// Pipeline.h
#pragma once
#include <QString>
#include <QTemporaryDir>
#include <QUrl>
#include <functional>
#include <memory>
#include "CaptureChain.h"
#include "Config.h"
#include "Consensus.h"
#include "Environment.h"
#include "Launcher.h"
#include "MaskCrop.h"
#include "OcrEngine.h"
#include "RegionPath.h"
#include "Router.h"

struct SessionOutcome {
    enum class Kind {
        Completed,      // decision made (text or visual search)
        Cancelled,      // degenerate selection, abort, selection off-image
        CaptureFailed,  // no image at all
        Failed,         // masked crop cannot be decoded
    };

    Kind kind{ Kind::Cancelled };
    QString message;
    RouteDecision decision;
    ConsensusResult consensus;
    MaskedImage masked;
    QUrl url;

    int exitCode() const;
};

// One user-initiated capture. Owns the session directory, which is removed
// with the session whatever the outcome. Stages run synchronously; an abort
// request is honoured between stages only.
class LensSession {
public:
    // Called once, on first recognition. May throw OcrError.
    using RecognizerFactory = std::function<std::unique_ptr<TextRecognizer>(const OcrSettings&)>;

    // recognizer may be null: a Tesseract engine is then created on first use.
    LensSession(const LensixConfig& cfg, CaptureRunner& runner, TextRecognizer* recognizer = nullptr);
    LensSession(const LensixConfig& cfg, CaptureRunner& runner, RecognizerFactory factory);

    bool isValid() const { return dir_.isValid(); }
    QString workDir() const { return dir_.path(); }

    CaptureResult capture(const EnvironmentProfile& profile);

    SessionOutcome process(const RawImage& raw, const RegionPath& path, SearchMode requested);

    // Non-GUI path: capture, then process the given selection.
    SessionOutcome run(const EnvironmentProfile& profile, const RegionPath& path, SearchMode requested);

    void requestAbort() { abort_ = true; }
    bool abortRequested() const { return abort_; }

private:
    bool stopBefore(const char* stage, SessionOutcome& out) const;
    TextRecognizer& recognizer();

    const LensixConfig& cfg_;
    CaptureRunner& runner_;
    TextRecognizer* recognizer_;
    RecognizerFactory factory_;
    std::unique_ptr<TextRecognizer> ownRecognizer_;
    QTemporaryDir dir_;
    bool abort_{ false };
};

SessionOutcome captureFailure(const CaptureResult& capture);

// Opens the search URL or performs the visual-search handoff.
bool deliver(SessionOutcome& outcome, Launcher& launcher, const RoutingSettings& routing);
