#pragma once

#include <QLoggingCategory>

// Enable with QT_LOGGING_RULES="anchor.recurrence.debug=true".
Q_DECLARE_LOGGING_CATEGORY(ANCHOR_RECURRENCE_LOG)
