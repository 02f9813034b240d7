#pragma once

#include <QDateTime>
#include <QVector>

#include "anchor/recurrence/Anchor.hpp"
#include "anchor/recurrence/RecurrenceRule.hpp"

namespace anchor {
namespace recurrence {

// Up to count occurrences, anchor first; stops early when the series ends.
QVector<QDateTime> generateOccurrences(const Anchor &anchor, const RecurrenceRule &rule, int count);

} // namespace recurrence
} // namespace anchor
