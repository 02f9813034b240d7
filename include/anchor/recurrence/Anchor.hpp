#pragma once

#include <QDate>
#include <QDateTime>
#include <QTime>

namespace anchor {
namespace recurrence {

// Naive wall-clock instant. Built without a local zone so that times inside a
// DST gap stay valid; only date() and time() carry meaning.
inline QDateTime wallClock(const QDate &date, const QTime &time)
{
    return QDateTime(date, time, Qt::UTC);
}

// The reminder's original date and wall-clock time of day.
struct Anchor
{
    QDate date;
    QTime time;

    static Anchor fromDateTime(const QDateTime &dateTime) { return {dateTime.date(), dateTime.time()}; }

    // Hour and minute carried by every occurrence; midnight when unset.
    QTime timeOfDay() const { return time.isValid() ? QTime(time.hour(), time.minute()) : QTime(0, 0); }

    QDateTime toDateTime() const { return wallClock(date, timeOfDay()); }
};

} // namespace recurrence
} // namespace anchor
