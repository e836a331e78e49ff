// Logging.h
#pragma once
#include <QtCore/QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcEnv)
Q_DECLARE_LOGGING_CATEGORY(lcCapture)
Q_DECLARE_LOGGING_CATEGORY(lcRegion)
Q_DECLARE_LOGGING_CATEGORY(lcMask)
Q_DECLARE_LOGGING_CATEGORY(lcPreprocess)
Q_DECLARE_LOGGING_CATEGORY(lcOcr)
Q_DECLARE_LOGGING_CATEGORY(lcRoute)
Q_DECLARE_LOGGING_CATEGORY(lcApp)

// stderr: [HH:mm:ss.zzz] [LVL] [category] message
void installLensixMessageHandler(bool verbose);
