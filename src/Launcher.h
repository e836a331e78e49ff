// Launcher.h
#pragma once
#include <QString>
#include <QUrl>
#include <utility>
#include "Config.h"

// Hands results to the desktop: the browser for URLs, the visual-search
// command (or page) for images. Outcomes are only logged.
class Launcher {
public:
    explicit Launcher(HandoffSettings settings) : s_(std::move(settings)) {}

    bool openUrl(const QUrl& url);
    bool visualSearch(const QString& imagePath);

    // Fixed file overwritten on every visual-search handoff; survives the
    // session directory.
    static QString handoffPath();

private:
    HandoffSettings s_;
};
