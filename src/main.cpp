// main.cpp
// - lensix entry point: capture, draw, recognize, search
#include <QApplication>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QTextStream>
#include <QTimer>
#include <stdexcept>
#include "CaptureChain.h"
#include "Config.h"
#include "Environment.h"
#include "Launcher.h"
#include "Logging.h"
#include "Pipeline.h"
#include "SelectionOverlay.h"

namespace {

int finish(SessionOutcome& outcome, const LensixConfig& cfg) {
    switch (outcome.kind) {
        case SessionOutcome::Kind::CaptureFailed:
        case SessionOutcome::Kind::Failed:
            QTextStream(stderr) << "Error: " << outcome.message << Qt::endl;
            break;
        case SessionOutcome::Kind::Cancelled:
            QTextStream(stdout) << outcome.message << Qt::endl;
            break;
        case SessionOutcome::Kind::Completed: {
            if (outcome.decision.mode == SearchMode::VisualSearch)
                QTextStream(stdout) << "No readable text, using visual search." << Qt::endl;
            else
                QTextStream(stdout) << "Found text: " << outcome.decision.text << Qt::endl;
            Launcher launcher(cfg.handoff);
            if (!deliver(outcome, launcher, cfg.routing))
                qCWarning(lcApp) << "handoff to" << searchModeName(outcome.decision.mode) << "failed";
            break;
        }
    }
    return outcome.exitCode();
}

} // namespace

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QApplication::setApplicationName(QStringLiteral("lensix"));
    QApplication::setApplicationVersion(QStringLiteral(LENSIX_VERSION));
    app.setQuitOnLastWindowClosed(false);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Draw around anything on screen to search its text or the image."));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption modeOption({ QStringLiteral("m"), QStringLiteral("mode") },
        QStringLiteral("text, translate, visual or homework (default text)."), QStringLiteral("mode"), QStringLiteral("text"));
    QCommandLineOption imageOption({ QStringLiteral("i"), QStringLiteral("image") },
        QStringLiteral("Use this image instead of capturing the screen."), QStringLiteral("file"));
    QCommandLineOption regionOption({ QStringLiteral("r"), QStringLiteral("region") },
        QStringLiteral("Selection as \"x,y;x,y;...\" in image pixels; skips the overlay."), QStringLiteral("points"));
    QCommandLineOption langOption({ QStringLiteral("l"), QStringLiteral("lang") },
        QStringLiteral("Tesseract languages, e.g. eng+deu."), QStringLiteral("langs"));
    QCommandLineOption tessdataOption(QStringLiteral("tessdata"),
        QStringLiteral("Directory holding *.traineddata."), QStringLiteral("dir"));
    QCommandLineOption configOption({ QStringLiteral("c"), QStringLiteral("config") },
        QStringLiteral("Configuration file (default %1).").arg(defaultConfigPath()), QStringLiteral("file"));
    QCommandLineOption fillOption(QStringLiteral("fill-rule"),
        QStringLiteral("evenodd or nonzero."), QStringLiteral("rule"));
    QCommandLineOption printOnlyOption(QStringLiteral("print-only"),
        QStringLiteral("Print the URL or command instead of launching it."));
    QCommandLineOption saveCandidatesOption(QStringLiteral("save-candidates"),
        QStringLiteral("Write the preprocessed OCR candidates into the session directory."));
    QCommandLineOption verboseOption({ QStringLiteral("v"), QStringLiteral("verbose") },
        QStringLiteral("Debug logging."));

    parser.addOption(modeOption);
    parser.addOption(imageOption);
    parser.addOption(regionOption);
    parser.addOption(langOption);
    parser.addOption(tessdataOption);
    parser.addOption(configOption);
    parser.addOption(fillOption);
    parser.addOption(printOnlyOption);
    parser.addOption(saveCandidatesOption);
    parser.addOption(verboseOption);
    parser.process(app);

    installLensixMessageHandler(parser.isSet(verboseOption));

    LensixConfig cfg;
    try {
        loadConfigFile(parser.isSet(configOption) ? parser.value(configOption) : defaultConfigPath(), cfg);
    }
    catch (const std::runtime_error& e) {
        QTextStream(stderr) << "Config error: " << e.what() << Qt::endl;
        return 1;
    }

    SearchMode mode = SearchMode::TextSearch;
    if (!parseSearchMode(parser.value(modeOption), mode)) {
        QTextStream(stderr) << "Invalid value for --mode: " << parser.value(modeOption) << Qt::endl;
        return 1;
    }
    if (parser.isSet(fillOption) && !parseFillRule(parser.value(fillOption), cfg.mask.fillRule)) {
        QTextStream(stderr) << "Invalid value for --fill-rule: " << parser.value(fillOption) << Qt::endl;
        return 1;
    }
    if (parser.isSet(langOption))     cfg.ocr.languages = parser.value(langOption).toStdString();
    if (parser.isSet(tessdataOption)) cfg.ocr.tessdataDir = parser.value(tessdataOption).toStdString();
    if (parser.isSet(printOnlyOption)) cfg.handoff.printOnly = true;
    if (parser.isSet(saveCandidatesOption)) cfg.ocr.saveCandidates = true;

    RegionPath region;
    const bool headless = parser.isSet(regionOption);
    if (headless && !parseRegionPath(parser.value(regionOption), region)) {
        QTextStream(stderr) << "Invalid value for --region: " << parser.value(regionOption) << Qt::endl;
        return 1;
    }

    const EnvironmentProfile profile = detectEnvironment();
    qCInfo(lcApp) << "lensix" << LENSIX_VERSION << "on" << profile.toString();

    ProcessCaptureRunner runner;
    LensSession session(cfg, runner);
    if (!session.isValid()) {
        QTextStream(stderr) << "Error: cannot create a temporary directory." << Qt::endl;
        return 3;
    }

    const CaptureResult cap = parser.isSet(imageOption)
        ? loadImageFile(parser.value(imageOption))
        : session.capture(profile);
    if (!cap.ok) {
        SessionOutcome failed = captureFailure(cap);
        return finish(failed, cfg);
    }

    if (headless) {
        SessionOutcome outcome = session.process(cap.image, region, mode);
        return finish(outcome, cfg);
    }

    int exitCode = 0;
    auto* overlay = new SelectionOverlay(cap.image.bgr);
    QObject::connect(overlay, &SelectionOverlay::selectionFinished, &app, [&](const RegionPath& path) {
        SessionOutcome outcome = session.process(cap.image, path, mode);
        exitCode = finish(outcome, cfg);
        QTimer::singleShot(0, &app, [&app, &exitCode] { app.exit(exitCode); });
    });
    QObject::connect(overlay, &SelectionOverlay::selectionCancelled, &app, [&] {
        session.requestAbort();
        QTextStream(stdout) << "Selection cancelled." << Qt::endl;
        QTimer::singleShot(0, &app, [&app] { app.exit(0); });
    });
    overlay->showFullScreen();
    overlay->activateWindow();
    return app.exec();
}
