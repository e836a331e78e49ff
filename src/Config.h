// Config.h
#pragma once
#include <QString>
#include <QStringList>
#include <string>
#include <vector>

class QSettings;

enum class FillRule { EvenOdd, NonZero };

struct CaptureSettings {
    int timeoutMs{ 8000 };
};

struct MaskSettings {
    FillRule fillRule{ FillRule::EvenOdd };
    double minAreaFraction{ 0.02 };   // covered / box pixels below this -> ellipse
};

struct PreprocessSettings {
    int adaptiveBlock{ 11 };          // odd, >= 3
    double adaptiveC{ 2.0 };
    double contrastFactor{ 1.8 };
    int upscaleBelowHeight{ 48 };     // 0 disables
    bool useOtsu{ true };
    bool useContrast{ true };
    bool useInverted{ true };         // inverted Otsu/contrast; inverted adaptive is always on
};

struct OcrSettings {
    std::string tessdataDir;          // empty: tesseract default
    std::string languages{ "eng" };   // "eng+deu"
    int pageSegMode{ 6 };
    int wordFloor{ 10 };              // accept confidence > floor
    bool saveCandidates{ false };
};

struct RoutingSettings {
    double acceptConfidence{ 55.0 };
    int minChars{ 3 };
    QString searchUrl{ QStringLiteral("https://www.google.com/search?q=%1") };
    QString translateUrl{ QStringLiteral("https://translate.google.com/?sl=auto&tl=%2&text=%1&op=translate") };
    QString homeworkUrl{ QStringLiteral("https://www.google.com/search?q=solve+%1") };
    QString translateTarget{ QStringLiteral("en") };
};

struct HandoffSettings {
    QString visualSearchUrl{ QStringLiteral("https://lens.google.com/") };
    QString visualSearchCommand;      // "{image}" is replaced by the handoff file
    bool printOnly{ false };
};

struct LensixConfig {
    CaptureSettings capture;
    MaskSettings mask;
    PreprocessSettings preprocess;
    OcrSettings ocr;
    RoutingSettings routing;
    HandoffSettings handoff;
};

// ~/.config/lensix/lensix.conf
QString defaultConfigPath();

// Missing keys keep the values already in cfg. Throws std::runtime_error on
// values that cannot be parsed.
void loadConfig(QSettings& settings, LensixConfig& cfg);
void loadConfigFile(const QString& path, LensixConfig& cfg);

QString fillRuleName(FillRule rule);
bool parseFillRule(const QString& text, FillRule& out);
