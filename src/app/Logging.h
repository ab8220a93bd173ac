#pragma once

#include <QLoggingCategory>

// Enable with QT_LOGGING_RULES="mixcut.*.debug=true"
Q_DECLARE_LOGGING_CATEGORY(mixcutProbe)
Q_DECLARE_LOGGING_CATEGORY(mixcutPlan)
Q_DECLARE_LOGGING_CATEGORY(mixcutExport)
Q_DECLARE_LOGGING_CATEGORY(mixcutSession)
