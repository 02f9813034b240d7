#pragma once

#include <QDate>
#include <QDateTime>
#include <optional>

#include "anchor/recurrence/Anchor.hpp"
#include "anchor/recurrence/RecurrenceRule.hpp"

namespace anchor {
namespace recurrence {

// First occurrence strictly after reference, compared as naive wall clock.
// nullopt once the series has no further occurrence.
std::optional<QDateTime> nextOccurrence(const Anchor &anchor,
                                        const RecurrenceRule &rule,
                                        const QDateTime &reference);

// True when the series has an occurrence on date, the anchor's own date included.
bool occursOn(const Anchor &anchor, const RecurrenceRule &rule, const QDate &date);

int daysInMonth(int year, int month);

// Date of the n-th weekday in the month, or the last one for n == -1.
// Invalid when the month has fewer than n such weekdays.
QDate nthWeekdayOfMonth(int year, int month, int n, Qt::DayOfWeek weekday);

} // namespace recurrence
} // namespace anchor
