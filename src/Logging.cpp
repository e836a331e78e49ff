// Logging.cpp
#include "Logging.h"

#include <QtCore/QByteArray>
#include <QtCore/QDateTime>
#include <QtCore/QString>

#include <cstdio>

Q_LOGGING_CATEGORY(lcEnv,        "lensix.env")
Q_LOGGING_CATEGORY(lcCapture,    "lensix.capture")
Q_LOGGING_CATEGORY(lcRegion,     "lensix.region")
Q_LOGGING_CATEGORY(lcMask,       "lensix.mask")
Q_LOGGING_CATEGORY(lcPreprocess, "lensix.preprocess")
Q_LOGGING_CATEGORY(lcOcr,        "lensix.ocr")
Q_LOGGING_CATEGORY(lcRoute,      "lensix.route")
Q_LOGGING_CATEGORY(lcApp,        "lensix.app")

static void lensixMessageHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
    const char* lvl = "???";
    switch (type) {
        case QtDebugMsg:    lvl = "DBG"; break;
        case QtInfoMsg:     lvl = "INF"; break;
        case QtWarningMsg:  lvl = "WRN"; break;
        case QtCriticalMsg: lvl = "ERR"; break;
        case QtFatalMsg:    lvl = "FTL"; break;
    }

    const QString timestamp = QDateTime::currentDateTime().toString("HH:mm:ss.zzz");
    const char* cat = ctx.category ? ctx.category : "default";

    const QByteArray line = QStringLiteral("[%1] [%2] [%3] %4\n")
        .arg(timestamp, QLatin1String(lvl), QLatin1String(cat), msg)
        .toUtf8();

    fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    fflush(stderr);

    if (type == QtFatalMsg)
        abort();
}

void installLensixMessageHandler(bool verbose) {
    qInstallMessageHandler(lensixMessageHandler);
    // debug is off unless asked for; info and up always reach stderr
    QLoggingCategory::setFilterRules(verbose
        ? QStringLiteral("lensix.*.debug=true")
        : QStringLiteral("lensix.*.debug=false"));
}
