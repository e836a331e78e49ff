// CaptureChain.h
#pragma once
#include <QString>
#include <QStringList>
#include <opencv2/core.hpp>
#include <vector>
#include "Config.h"
#include "Environment.h"

enum class ToolRequirement { Any, X11, Wayland };
// Priority order of the catalogue, highest first.
enum class ToolTier { Portal, Desktop, Compositor, LegacyX11 };

struct CaptureToolSpec {
    QString name;               // shown to the user
    QString program;            // looked up on PATH
    QStringList arguments;      // "{out}" is replaced by the output path
    ToolRequirement requirement{ ToolRequirement::Any };
    QString desktopHint;        // substring of the compositor hint, empty = any desktop
    ToolTier tier{ ToolTier::LegacyX11 };
    int timeoutMs{ 0 };         // 0: CaptureSettings::timeoutMs
    QString installHint;

    QStringList argumentsFor(const QString& outputPath) const;
    bool suits(const EnvironmentProfile& profile) const;
};

const std::vector<CaptureToolSpec>& captureCatalogue();

// Order-preserving filter of the catalogue by display server and desktop.
std::vector<CaptureToolSpec> selectTools(const EnvironmentProfile& profile,
                                         const std::vector<CaptureToolSpec>& catalogue = captureCatalogue());

enum class AttemptStatus { Succeeded, Missing, Failed, TimedOut, EmptyOutput, Undecodable };
QString attemptStatusName(AttemptStatus s);

struct CaptureAttempt {
    QString tool;
    AttemptStatus status;
    QString detail;
    QString installHint;
};

// One tool invocation. Implementations must return within roughly timeoutMs.
class CaptureRunner {
public:
    virtual ~CaptureRunner() = default;
    virtual AttemptStatus attempt(const CaptureToolSpec& spec, const QString& outputPath,
                                  int timeoutMs, QString& detail) = 0;
};

class ProcessCaptureRunner : public CaptureRunner {
public:
    AttemptStatus attempt(const CaptureToolSpec& spec, const QString& outputPath,
                          int timeoutMs, QString& detail) override;
};

struct RawImage {
    cv::Mat bgr;
    QString filePath;
    QString provenance;   // tool name, or "file" for --image

    bool empty() const { return bgr.empty(); }
};

struct CaptureResult {
    bool ok{ false };
    RawImage image;
    std::vector<CaptureAttempt> attempts;

    // Multi-line, user facing: every tool tried and how to install it.
    QString failureReport() const;
};

class CaptureChain {
public:
    explicit CaptureChain(CaptureRunner& runner, CaptureSettings settings = {});

    CaptureResult capture(const EnvironmentProfile& profile, const QString& outputDir);
    CaptureResult capture(const std::vector<CaptureToolSpec>& tools, const QString& outputDir);

private:
    CaptureRunner& runner_;
    CaptureSettings settings_;
};

// --image: an existing file takes the place of the capture step.
CaptureResult loadImageFile(const QString& path);
