// Router.h
#pragma once
#include <QString>
#include <QUrl>
#include "Config.h"
#include "Consensus.h"

enum class SearchMode { TextSearch, Translate, VisualSearch, HomeworkSearch };

QString searchModeName(SearchMode m);
bool parseSearchMode(const QString& text, SearchMode& out);

struct RouteDecision {
    SearchMode mode{ SearchMode::VisualSearch };
    QString text;     // normalized; empty for VisualSearch
    QString reason;   // why a fallback happened, for the log
};

// Trim and collapse whitespace runs to one space.
QString normalizeWhitespace(const QString& text);

// Fewer than 3 letters or digits, a bare number (digits with '.' or ','),
// or every token a single character. "12 + 35 =" is not degenerate.
bool isDegenerateText(const QString& normalized);

// VisualSearch when asked for, or when the text is missing, short, degenerate
// or below the acceptance confidence; the requested mode otherwise.
RouteDecision route(const ConsensusResult& consensus, SearchMode requested, const RoutingSettings& settings);

// Empty QUrl for VisualSearch.
QUrl buildUrl(SearchMode mode, const QString& text, const RoutingSettings& settings);
