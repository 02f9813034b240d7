#include "anchor/core/Logging.hpp"

Q_LOGGING_CATEGORY(ANCHOR_RECURRENCE_LOG, "anchor.recurrence", QtInfoMsg)
