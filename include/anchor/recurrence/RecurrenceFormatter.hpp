#pragma once

#include <QString>

#include "anchor/recurrence/RecurrenceRule.hpp"

namespace anchor {
namespace recurrence {

// Human readable description, e.g. "Every weekday" or "Monthly on the last Friday".
QString formatRecurrence(const RecurrenceRule &rule);

// English ordinal: 1st, 2nd, 3rd, 4th, 11th, 21st.
QString ordinal(int n);

QString weekdayName(Qt::DayOfWeek day);
QString shortWeekdayName(Qt::DayOfWeek day);

} // namespace recurrence
} // namespace anchor
