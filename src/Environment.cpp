// Environment.cpp
#include "Environment.h"
#include "Logging.h"

QString displayServerName(DisplayServer ds) {
    return ds == DisplayServer::Wayland ? QStringLiteral("wayland") : QStringLiteral("x11");
}

QString EnvironmentProfile::toString() const {
    return QStringLiteral("%1 (%2)").arg(displayServerName(displayServer),
        hasHint() ? compositorHint : QStringLiteral("unknown compositor"));
}

EnvironmentProfile detectEnvironment(const QProcessEnvironment& env) {
    EnvironmentProfile p;

    const QString session = env.value(QStringLiteral("XDG_SESSION_TYPE")).trimmed().toLower();
    if (session == QLatin1String("wayland") || !env.value(QStringLiteral("WAYLAND_DISPLAY")).isEmpty())
        p.displayServer = DisplayServer::Wayland;

    for (const char* key : { "XDG_CURRENT_DESKTOP", "XDG_SESSION_DESKTOP", "DESKTOP_SESSION" }) {
        const QString v = env.value(QLatin1String(key)).trimmed();
        if (!v.isEmpty()) { p.compositorHint = v.toLower(); break; }
    }
    if (p.compositorHint.isEmpty()) {
        if (env.contains(QStringLiteral("HYPRLAND_INSTANCE_SIGNATURE"))) p.compositorHint = QStringLiteral("hyprland");
        else if (env.contains(QStringLiteral("SWAYSOCK")))              p.compositorHint = QStringLiteral("sway");
    }
    return p;
}

EnvironmentProfile detectEnvironment() {
    const EnvironmentProfile p = detectEnvironment(QProcessEnvironment::systemEnvironment());
    qCDebug(lcEnv) << "environment:" << p.toString();
    return p;
}
