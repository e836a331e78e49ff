// Launcher.cpp
#include "Launcher.h"
#include "Logging.h"
#include <QDesktopServices>
#include <QDir>
#include <QProcess>
#include <QStandardPaths>
#include <QTextStream>

QString Launcher::handoffPath() {
    return QDir(QStandardPaths::writableLocation(QStandardPaths::GenericCacheLocation))
        .filePath(QStringLiteral("lensix/last-selection.png"));
}

bool Launcher::openUrl(const QUrl& url) {
    if (!url.isValid()) {
        qCWarning(lcApp) << "refusing to open invalid url" << url.toString();
        return false;
    }
    QTextStream(stdout) << url.toString(QUrl::FullyEncoded) << Qt::endl;
    if (s_.printOnly) return true;
    const bool ok = QDesktopServices::openUrl(url);
    if (!ok) qCWarning(lcApp) << "no browser accepted" << url.toString();
    return ok;
}

bool Launcher::visualSearch(const QString& imagePath) {
    if (!s_.visualSearchCommand.isEmpty()) {
        QStringList args = QProcess::splitCommand(s_.visualSearchCommand);
        if (args.isEmpty()) return false;
        for (QString& a : args) a.replace(QStringLiteral("{image}"), imagePath);
        const QString program = args.takeFirst();
        if (s_.printOnly) {
            QTextStream(stdout) << program << ' ' << args.join(' ') << Qt::endl;
            return true;
        }
        const bool ok = QProcess::startDetached(program, args);
        if (!ok) qCWarning(lcApp) << "could not start visual search command" << program;
        return ok;
    }

    QTextStream(stdout) << "Image for visual search: " << imagePath << Qt::endl;
    return openUrl(QUrl(s_.visualSearchUrl));
}
