#include "Logging.h"

Q_LOGGING_CATEGORY(mixcutProbe, "mixcut.probe", QtInfoMsg)
Q_LOGGING_CATEGORY(mixcutPlan, "mixcut.plan", QtInfoMsg)
Q_LOGGING_CATEGORY(mixcutExport, "mixcut.export", QtInfoMsg)
Q_LOGGING_CATEGORY(mixcutSession, "mixcut.session", QtInfoMsg)
