// Config.cpp
#include "Config.h"
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>
#include <stdexcept>

namespace {

QString keyError(const QString& key, const QVariant& v) {
    return QStringLiteral("invalid value for %1: %2").arg(key, v.toString());
}

void readInt(QSettings& s, const QString& key, int& target, int minValue) {
    if (!s.contains(key)) return;
    bool ok = false;
    const QVariant v = s.value(key);
    const int value = v.toInt(&ok);
    if (!ok || value < minValue) throw std::runtime_error(keyError(key, v).toStdString());
    target = value;
}

void readDouble(QSettings& s, const QString& key, double& target, double minValue) {
    if (!s.contains(key)) return;
    bool ok = false;
    const QVariant v = s.value(key);
    const double value = v.toDouble(&ok);
    if (!ok || value < minValue) throw std::runtime_error(keyError(key, v).toStdString());
    target = value;
}

void readBool(QSettings& s, const QString& key, bool& target) {
    if (s.contains(key)) target = s.value(key).toBool();
}

void readString(QSettings& s, const QString& key, QString& target) {
    if (s.contains(key)) target = s.value(key).toString();
}

void readString(QSettings& s, const QString& key, std::string& target) {
    if (s.contains(key)) target = s.value(key).toString().toStdString();
}

} // namespace

QString defaultConfigPath() {
    return QDir(QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation))
        .filePath(QStringLiteral("lensix/lensix.conf"));
}

QString fillRuleName(FillRule rule) {
    return rule == FillRule::NonZero ? QStringLiteral("nonzero") : QStringLiteral("evenodd");
}

bool parseFillRule(const QString& text, FillRule& out) {
    const QString t = text.trimmed().toLower();
    if (t == QLatin1String("evenodd") || t == QLatin1String("even-odd")) { out = FillRule::EvenOdd; return true; }
    if (t == QLatin1String("nonzero") || t == QLatin1String("winding")) { out = FillRule::NonZero; return true; }
    return false;
}

void loadConfig(QSettings& s, LensixConfig& cfg) {
    readInt(s, QStringLiteral("capture/timeout_ms"), cfg.capture.timeoutMs, 100);

    if (s.contains(QStringLiteral("mask/fill_rule"))) {
        const QVariant v = s.value(QStringLiteral("mask/fill_rule"));
        if (!parseFillRule(v.toString(), cfg.mask.fillRule))
            throw std::runtime_error(keyError(QStringLiteral("mask/fill_rule"), v).toStdString());
    }
    readDouble(s, QStringLiteral("mask/min_area_fraction"), cfg.mask.minAreaFraction, 0.0);

    readInt(s, QStringLiteral("preprocess/adaptive_block"), cfg.preprocess.adaptiveBlock, 3);
    if (cfg.preprocess.adaptiveBlock % 2 == 0) cfg.preprocess.adaptiveBlock += 1;
    readDouble(s, QStringLiteral("preprocess/adaptive_c"), cfg.preprocess.adaptiveC, -255.0);
    readDouble(s, QStringLiteral("preprocess/contrast_factor"), cfg.preprocess.contrastFactor, 1.0);
    readInt(s, QStringLiteral("preprocess/upscale_below_height"), cfg.preprocess.upscaleBelowHeight, 0);
    readBool(s, QStringLiteral("preprocess/otsu"), cfg.preprocess.useOtsu);
    readBool(s, QStringLiteral("preprocess/contrast"), cfg.preprocess.useContrast);
    readBool(s, QStringLiteral("preprocess/inverted"), cfg.preprocess.useInverted);

    readString(s, QStringLiteral("ocr/tessdata"), cfg.ocr.tessdataDir);
    readString(s, QStringLiteral("ocr/languages"), cfg.ocr.languages);
    readInt(s, QStringLiteral("ocr/psm"), cfg.ocr.pageSegMode, 0);
    readInt(s, QStringLiteral("ocr/word_floor"), cfg.ocr.wordFloor, 0);
    readBool(s, QStringLiteral("ocr/save_candidates"), cfg.ocr.saveCandidates);

    readDouble(s, QStringLiteral("routing/accept_confidence"), cfg.routing.acceptConfidence, 0.0);
    readInt(s, QStringLiteral("routing/min_chars"), cfg.routing.minChars, 0);
    readString(s, QStringLiteral("routing/search_url"), cfg.routing.searchUrl);
    readString(s, QStringLiteral("routing/translate_url"), cfg.routing.translateUrl);
    readString(s, QStringLiteral("routing/homework_url"), cfg.routing.homeworkUrl);
    readString(s, QStringLiteral("routing/translate_target"), cfg.routing.translateTarget);

    readString(s, QStringLiteral("handoff/visual_search_url"), cfg.handoff.visualSearchUrl);
    readString(s, QStringLiteral("handoff/visual_search_command"), cfg.handoff.visualSearchCommand);
}

void loadConfigFile(const QString& path, LensixConfig& cfg) {
    if (!QFileInfo::exists(path)) return;
    QSettings s(path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError)
        throw std::runtime_error("cannot read config file: " + path.toStdString());
    loadConfig(s, cfg);
}
