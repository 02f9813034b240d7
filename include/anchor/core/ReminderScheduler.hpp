#pragma once

#include <QDate>
#include <QDateTime>
#include <QVariant>
#include <QVector>
#include <optional>

#include "anchor/data/Reminder.hpp"
#include "anchor/recurrence/Anchor.hpp"

namespace anchor {
namespace core {

class ReminderScheduler
{
public:
    static constexpr int DefaultPreviewCount = 5;

    // Stored preview length; falls back to DefaultPreviewCount unless a positive integer.
    static int previewCount(const QVariant &stored);

    static recurrence::Anchor anchorOf(const data::Reminder &reminder);

    // Next occurrence after the stored one, or after the anchor when none is stored.
    static std::optional<QDateTime> calculateNextOccurrence(const data::Reminder &reminder);

    static QVector<QDateTime> previewOccurrences(const data::Reminder &reminder, int count = DefaultPreviewCount);

    static bool shouldRecurOn(const data::Reminder &reminder, const QDate &date);

private:
    static bool recurs(const data::Reminder &reminder);
};

} // namespace core
} // namespace anchor
