// Router.cpp
#include "Router.h"
#include "Logging.h"
#include <QRegularExpression>
#include <QStringList>

QString searchModeName(SearchMode m) {
    switch (m) {
        case SearchMode::TextSearch:     return QStringLiteral("text");
        case SearchMode::Translate:      return QStringLiteral("translate");
        case SearchMode::VisualSearch:   return QStringLiteral("visual");
        case SearchMode::HomeworkSearch: return QStringLiteral("homework");
    }
    return QStringLiteral("?");
}

bool parseSearchMode(const QString& text, SearchMode& out) {
    const QString t = text.trimmed().toLower();
    if (t == QLatin1String("text") || t == QLatin1String("search")) { out = SearchMode::TextSearch; return true; }
    if (t == QLatin1String("translate"))                             { out = SearchMode::Translate; return true; }
    if (t == QLatin1String("visual") || t == QLatin1String("lens"))  { out = SearchMode::VisualSearch; return true; }
    if (t == QLatin1String("homework"))                              { out = SearchMode::HomeworkSearch; return true; }
    return false;
}

QString normalizeWhitespace(const QString& text) {
    return text.simplified();
}

bool isDegenerateText(const QString& normalized) {
    int alnum = 0;
    bool numeric = true;
    for (const QChar c : normalized) {
        if (c.isLetterOrNumber()) ++alnum;
        if (c.isSpace()) continue;
        if (!c.isDigit() && c != QLatin1Char('.') && c != QLatin1Char(',')) numeric = false;
    }
    if (alnum < 3 || numeric) return true;

    const QStringList tokens = normalized.split(' ', Qt::SkipEmptyParts);
    for (const QString& t : tokens)
        if (t.size() > 1) return false;
    return true;
}

RouteDecision route(const ConsensusResult& consensus, SearchMode requested, const RoutingSettings& settings) {
    RouteDecision d;
    if (requested == SearchMode::VisualSearch) {
        d.reason = QStringLiteral("visual search requested");
        return d;
    }

    const QString text = normalizeWhitespace(QString::fromStdString(consensus.text()));
    if (text.isEmpty())
        d.reason = QStringLiteral("no text recognized");
    else if (text.size() < settings.minChars)
        d.reason = QStringLiteral("text shorter than %1 characters").arg(settings.minChars);
    else if (consensus.confidence() < settings.acceptConfidence)
        d.reason = QStringLiteral("confidence %1 below %2").arg(consensus.confidence(), 0, 'f', 1).arg(settings.acceptConfidence);
    else if (isDegenerateText(text))
        d.reason = QStringLiteral("text is numeric or single characters");

    if (!d.reason.isEmpty()) {
        qCInfo(lcRoute) << "falling back to visual search:" << d.reason;
        return d;
    }

    d.mode = requested;
    d.text = text;
    qCInfo(lcRoute) << "routing to" << searchModeName(requested);
    return d;
}

QUrl buildUrl(SearchMode mode, const QString& text, const RoutingSettings& settings) {
    QString pattern;
    switch (mode) {
        case SearchMode::TextSearch:     pattern = settings.searchUrl; break;
        case SearchMode::Translate:      pattern = settings.translateUrl; break;
        case SearchMode::HomeworkSearch: pattern = settings.homeworkUrl; break;
        case SearchMode::VisualSearch:   return {};
    }
    const QString encoded = QString::fromLatin1(QUrl::toPercentEncoding(text));
    // %2 first: the encoded text may itself contain "%2"
    QString url = pattern;
    url.replace(QStringLiteral("%2"), QString::fromLatin1(QUrl::toPercentEncoding(settings.translateTarget)));
    url.replace(QStringLiteral("%1"), encoded);
    return QUrl::fromEncoded(url.toLatin1());
}
