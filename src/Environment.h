// Environment.h
#pragma once
#include <QProcessEnvironment>
#include <QString>

enum class DisplayServer { X11, Wayland };

struct EnvironmentProfile {
    DisplayServer displayServer{ DisplayServer::X11 };
    QString compositorHint;   // lower-case, empty when unknown

    bool hasHint() const { return !compositorHint.isEmpty(); }
    QString toString() const;
};

QString displayServerName(DisplayServer ds);

// Unknown or missing values fall back to X11 so the legacy tools still get a try.
EnvironmentProfile detectEnvironment(const QProcessEnvironment& env);
EnvironmentProfile detectEnvironment();
