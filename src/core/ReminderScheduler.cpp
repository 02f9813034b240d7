#include "anchor/core/ReminderScheduler.hpp"

#include "anchor/core/Logging.hpp"
#include "anchor/recurrence/OccurrenceCalculator.hpp"
#include "anchor/recurrence/OccurrenceSequence.hpp"

namespace anchor {
namespace core {

int ReminderScheduler::previewCount(const QVariant &stored)
{
    if (!stored.isValid()) {
        return DefaultPreviewCount;
    }
    bool ok = false;
    const int count = stored.toInt(&ok);
    if (!ok || count < 1) {
        qCWarning(ANCHOR_RECURRENCE_LOG) << "Ignoring invalid preview count" << stored;
        return DefaultPreviewCount;
    }
    return count;
}

recurrence::Anchor ReminderScheduler::anchorOf(const data::Reminder &reminder)
{
    return {reminder.dueDate, reminder.dueTime};
}

bool ReminderScheduler::recurs(const data::Reminder &reminder)
{
    return reminder.isRecurring && !reminder.recurrenceRule.isNone();
}

std::optional<QDateTime> ReminderScheduler::calculateNextOccurrence(const data::Reminder &reminder)
{
    if (!recurs(reminder)) {
        return std::nullopt;
    }
    const recurrence::Anchor anchor = anchorOf(reminder);
    const QDateTime last = reminder.nextOccurrence.value_or(anchor.toDateTime());
    return recurrence::nextOccurrence(anchor, reminder.recurrenceRule, last);
}

QVector<QDateTime> ReminderScheduler::previewOccurrences(const data::Reminder &reminder, int count)
{
    const recurrence::Anchor anchor = anchorOf(reminder);
    if (!recurs(reminder)) {
        if (count <= 0 || !anchor.date.isValid()) {
            return {};
        }
        return {anchor.toDateTime()};
    }
    return recurrence::generateOccurrences(anchor, reminder.recurrenceRule, count);
}

bool ReminderScheduler::shouldRecurOn(const data::Reminder &reminder, const QDate &date)
{
    if (!recurs(reminder)) {
        return false;
    }
    return recurrence::occursOn(anchorOf(reminder), reminder.recurrenceRule, date);
}

} // namespace core
} // namespace anchor
