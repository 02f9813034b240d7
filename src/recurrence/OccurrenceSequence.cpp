#include "anchor/recurrence/OccurrenceSequence.hpp"

#include "anchor/recurrence/OccurrenceCalculator.hpp"

#include <optional>

namespace anchor {
namespace recurrence {

QVector<QDateTime> generateOccurrences(const Anchor &anchor, const RecurrenceRule &rule, int count)
{
    QVector<QDateTime> occurrences;
    if (count <= 0 || !anchor.date.isValid()) {
        return occurrences;
    }
    if (rule.isNone()) {
        occurrences.append(anchor.toDateTime());
        return occurrences;
    }

    occurrences.reserve(count);
    QDateTime current = anchor.toDateTime();
    for (int i = 0; i < count; ++i) {
        occurrences.append(current);
        const std::optional<QDateTime> next = nextOccurrence(anchor, rule, current);
        if (!next) {
            break;
        }
        current = *next;
    }
    return occurrences;
}

} // namespace recurrence
} // namespace anchor
