// CaptureChain.cpp
#include "CaptureChain.h"
#include "Logging.h"
#include <QDir>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>

namespace {

const QString kOutPlaceholder = QStringLiteral("{out}");

QString lastLine(const QByteArray& bytes) {
    const QStringList lines = QString::fromLocal8Bit(bytes).split('\n', Qt::SkipEmptyParts);
    return lines.isEmpty() ? QString() : lines.last().trimmed();
}

} // namespace

QStringList CaptureToolSpec::argumentsFor(const QString& outputPath) const {
    QStringList out;
    out.reserve(arguments.size());
    for (const QString& a : arguments)
        out << (a == kOutPlaceholder ? outputPath : a);
    return out;
}

bool CaptureToolSpec::suits(const EnvironmentProfile& profile) const {
    if (requirement == ToolRequirement::X11 && profile.displayServer != DisplayServer::X11) return false;
    if (requirement == ToolRequirement::Wayland && profile.displayServer != DisplayServer::Wayland) return false;
    if (desktopHint.isEmpty() || !profile.hasHint()) return true;
    return profile.compositorHint.contains(desktopHint);
}

const std::vector<CaptureToolSpec>& captureCatalogue() {
    static const std::vector<CaptureToolSpec> catalogue = {
        { QStringLiteral("flameshot"), QStringLiteral("flameshot"),
          { QStringLiteral("full"), QStringLiteral("-p"), kOutPlaceholder },
          ToolRequirement::Any, QString(), ToolTier::Portal, 15000,
          QStringLiteral("install the 'flameshot' package") },
        { QStringLiteral("gnome-screenshot"), QStringLiteral("gnome-screenshot"),
          { QStringLiteral("-f"), kOutPlaceholder },
          ToolRequirement::Any, QStringLiteral("gnome"), ToolTier::Desktop, 0,
          QStringLiteral("install the 'gnome-screenshot' package") },
        { QStringLiteral("spectacle"), QStringLiteral("spectacle"),
          { QStringLiteral("-b"), QStringLiteral("-n"), QStringLiteral("-f"), QStringLiteral("-o"), kOutPlaceholder },
          ToolRequirement::Any, QStringLiteral("kde"), ToolTier::Desktop, 0,
          QStringLiteral("install the 'spectacle' package") },
        { QStringLiteral("grim"), QStringLiteral("grim"),
          { kOutPlaceholder },
          ToolRequirement::Wayland, QString(), ToolTier::Compositor, 0,
          QStringLiteral("install the 'grim' package (wlroots compositors: sway, hyprland, river)") },
        { QStringLiteral("maim"), QStringLiteral("maim"),
          { kOutPlaceholder },
          ToolRequirement::X11, QString(), ToolTier::LegacyX11, 0,
          QStringLiteral("install the 'maim' package") },
        { QStringLiteral("scrot"), QStringLiteral("scrot"),
          { QStringLiteral("-o"), kOutPlaceholder },
          ToolRequirement::X11, QString(), ToolTier::LegacyX11, 0,
          QStringLiteral("install the 'scrot' package") },
        { QStringLiteral("import"), QStringLiteral("import"),
          { QStringLiteral("-window"), QStringLiteral("root"), kOutPlaceholder },
          ToolRequirement::X11, QString(), ToolTier::LegacyX11, 0,
          QStringLiteral("install the 'imagemagick' package") },
    };
    return catalogue;
}

std::vector<CaptureToolSpec> selectTools(const EnvironmentProfile& profile,
                                         const std::vector<CaptureToolSpec>& catalogue) {
    std::vector<CaptureToolSpec> out;
    for (const auto& spec : catalogue)
        if (spec.suits(profile)) out.push_back(spec);
    return out;
}

QString attemptStatusName(AttemptStatus s) {
    switch (s) {
        case AttemptStatus::Succeeded:   return QStringLiteral("ok");
        case AttemptStatus::Missing:     return QStringLiteral("not installed");
        case AttemptStatus::Failed:      return QStringLiteral("failed");
        case AttemptStatus::TimedOut:    return QStringLiteral("timed out");
        case AttemptStatus::EmptyOutput: return QStringLiteral("no output");
        case AttemptStatus::Undecodable: return QStringLiteral("unreadable output");
    }
    return QStringLiteral("?");
}

AttemptStatus ProcessCaptureRunner::attempt(const CaptureToolSpec& spec, const QString& outputPath,
                                            int timeoutMs, QString& detail) {
    const QString exe = QStandardPaths::findExecutable(spec.program);
    if (exe.isEmpty()) {
        detail = spec.program + QStringLiteral(" not found on PATH");
        return AttemptStatus::Missing;
    }

    QProcess proc;
    proc.setProgram(exe);
    proc.setArguments(spec.argumentsFor(outputPath));
    proc.setStandardInputFile(QProcess::nullDevice());
    // one budget covers start and run
    QElapsedTimer clock;
    clock.start();
    proc.start();
    if (!proc.waitForStarted(timeoutMs)) {
        detail = proc.errorString();
        return AttemptStatus::Missing;
    }
    const int remaining = static_cast<int>(std::max<qint64>(0, timeoutMs - clock.elapsed()));
    if (!proc.waitForFinished(remaining)) {
        proc.kill();
        proc.waitForFinished(1000);
        detail = QStringLiteral("no exit after %1 ms").arg(timeoutMs);
        return AttemptStatus::TimedOut;
    }
    if (proc.exitStatus() != QProcess::NormalExit || proc.exitCode() != 0) {
        detail = QStringLiteral("exit code %1").arg(proc.exitCode());
        const QString err = lastLine(proc.readAllStandardError());
        if (!err.isEmpty()) detail += QStringLiteral(": ") + err;
        return AttemptStatus::Failed;
    }
    return AttemptStatus::Succeeded;
}

QString CaptureResult::failureReport() const {
    QString out = QStringLiteral("Could not obtain a screen image.\nTried:\n");
    if (attempts.empty())
        out += QStringLiteral("  (no tool matches this session; install flameshot, grim or maim)\n");
    for (const auto& a : attempts) {
        out += QStringLiteral("  %1: %2").arg(a.tool, attemptStatusName(a.status));
        if (!a.detail.isEmpty()) out += QStringLiteral(" (%1)").arg(a.detail);
        if (a.status == AttemptStatus::Missing && !a.installHint.isEmpty())
            out += QStringLiteral(" -> ") + a.installHint;
        out += '\n';
    }
    return out;
}

CaptureChain::CaptureChain(CaptureRunner& runner, CaptureSettings settings)
    : runner_(runner), settings_(settings) {}

CaptureResult CaptureChain::capture(const EnvironmentProfile& profile, const QString& outputDir) {
    return capture(selectTools(profile), outputDir);
}

CaptureResult CaptureChain::capture(const std::vector<CaptureToolSpec>& tools, const QString& outputDir) {
    CaptureResult result;
    const QDir dir(outputDir);
    int n = 0;
    for (const auto& spec : tools) {
        const QString out = dir.filePath(QStringLiteral("capture-%1-%2.png").arg(++n).arg(spec.program));
        const int timeout = spec.timeoutMs > 0 ? spec.timeoutMs : settings_.timeoutMs;

        CaptureAttempt at{ spec.name, AttemptStatus::Failed, QString(), spec.installHint };
        at.status = runner_.attempt(spec, out, timeout, at.detail);

        if (at.status == AttemptStatus::Succeeded) {
            const QFileInfo fi(out);
            if (!fi.exists() || fi.size() == 0) {
                at.status = AttemptStatus::EmptyOutput;
            } else {
                cv::Mat img = cv::imread(out.toStdString(), cv::IMREAD_COLOR);
                if (img.empty()) {
                    at.status = AttemptStatus::Undecodable;
                } else {
                    result.attempts.push_back(at);
                    result.ok = true;
                    result.image = RawImage{ img, out, spec.name };
                    qCInfo(lcCapture) << "captured" << img.cols << "x" << img.rows << "with" << spec.name;
                    return result;
                }
            }
        }
        qCDebug(lcCapture) << spec.name << attemptStatusName(at.status) << at.detail;
        result.attempts.push_back(at);
    }
    qCWarning(lcCapture) << "capture chain exhausted after" << result.attempts.size() << "tools";
    return result;
}

CaptureResult loadImageFile(const QString& path) {
    CaptureResult result;
    CaptureAttempt at{ QStringLiteral("file"), AttemptStatus::Succeeded, path, QString() };
    cv::Mat img = cv::imread(path.toStdString(), cv::IMREAD_COLOR);
    if (img.empty()) {
        at.status = QFileInfo::exists(path) ? AttemptStatus::Undecodable : AttemptStatus::Missing;
        at.installHint.clear();
        result.attempts.push_back(at);
        return result;
    }
    result.attempts.push_back(at);
    result.ok = true;
    result.image = RawImage{ img, path, QStringLiteral("file") };
    return result;
}
