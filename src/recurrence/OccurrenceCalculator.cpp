#include "anchor/recurrence/OccurrenceCalculator.hpp"

#include "anchor/core/Overloaded.hpp"

#include <QTime>
#include <algorithm>

namespace anchor {
namespace recurrence {

namespace {
constexpr int WEEKLY_SCAN_DAYS = 14;
// Every weekday occurs five times in some month of any 14 month span.
constexpr int NTH_WEEKDAY_SCAN_MONTHS = 14;

// Wall-clock ordering; time zone and DST of the reference are ignored.
bool isAfter(const QDate &date, const QTime &time, const QDateTime &reference)
{
    const QDate referenceDate = reference.date();
    if (date != referenceDate) {
        return date > referenceDate;
    }
    return time > reference.time();
}

QDate clampedDate(int year, int month, int day)
{
    return QDate(year, month, std::min(day, daysInMonth(year, month)));
}

QDate firstOfNextMonth(const QDate &date)
{
    return QDate(date.year(), date.month(), 1).addMonths(1);
}

std::optional<QDate> scanWeek(const WeekdaySet &days, const QTime &time, const QDateTime &reference)
{
    if (days.isEmpty()) {
        return std::nullopt;
    }
    const QDate start = reference.date();
    for (int offset = 0; offset < WEEKLY_SCAN_DAYS; ++offset) {
        const QDate candidate = start.addDays(offset);
        if (days.contains(candidate.dayOfWeek()) && isAfter(candidate, time, reference)) {
            return candidate;
        }
    }
    return std::nullopt;
}

std::optional<QDate> nextDaily(int interval, const QTime &time, const QDateTime &reference)
{
    QDate candidate = reference.date();
    if (!isAfter(candidate, time, reference)) {
        candidate = candidate.addDays(interval);
    }
    return candidate;
}

std::optional<QDate> nextMonthly(int dayOfMonth, const QTime &time, const QDateTime &reference)
{
    const QDate referenceDate = reference.date();
    QDate candidate = clampedDate(referenceDate.year(), referenceDate.month(), dayOfMonth);
    if (!isAfter(candidate, time, reference)) {
        const QDate month = firstOfNextMonth(referenceDate);
        candidate = clampedDate(month.year(), month.month(), dayOfMonth);
    }
    return candidate;
}

std::optional<QDate> nextYearly(const QDate &anchorDate, const QTime &time, const QDateTime &reference)
{
    const int year = reference.date().year();
    QDate candidate = clampedDate(year, anchorDate.month(), anchorDate.day());
    if (!isAfter(candidate, time, reference)) {
        candidate = clampedDate(year + 1, anchorDate.month(), anchorDate.day());
    }
    return candidate;
}

std::optional<QDate> nextCustomDays(const QDate &anchorDate, int interval, const QTime &time, const QDateTime &reference)
{
    QDate candidate = anchorDate;
    if (isAfter(candidate, time, reference)) {
        return candidate;
    }
    // Jump whole strides up to the reference day, then step past it.
    const qint64 behind = candidate.daysTo(reference.date());
    candidate = candidate.addDays((behind / interval) * interval);
    while (!isAfter(candidate, time, reference)) {
        candidate = candidate.addDays(interval);
    }
    return candidate;
}

std::optional<QDate> nextNthWeekday(const NthWeekdayPattern &pattern, const QTime &time, const QDateTime &reference)
{
    QDate month = QDate(reference.date().year(), reference.date().month(), 1);
    for (int i = 0; i < NTH_WEEKDAY_SCAN_MONTHS; ++i) {
        const QDate candidate = nthWeekdayOfMonth(month.year(), month.month(), pattern.n, pattern.weekday);
        if (candidate.isValid() && isAfter(candidate, time, reference)) {
            return candidate;
        }
        month = month.addMonths(1);
    }
    return std::nullopt;
}
} // namespace

int daysInMonth(int year, int month)
{
    return QDate(year, month, 1).daysInMonth();
}

QDate nthWeekdayOfMonth(int year, int month, int n, Qt::DayOfWeek weekday)
{
    if (n == NthWeekdayPattern::Last) {
        const QDate last(year, month, daysInMonth(year, month));
        const int back = (last.dayOfWeek() - weekday + 7) % 7;
        return last.addDays(-back);
    }
    if (n < 1) {
        return {};
    }
    const QDate first(year, month, 1);
    const int forward = (weekday - first.dayOfWeek() + 7) % 7;
    const QDate candidate = first.addDays(forward + (n - 1) * 7);
    if (candidate.month() != month) {
        return {};
    }
    return candidate;
}

std::optional<QDateTime> nextOccurrence(const Anchor &anchor,
                                        const RecurrenceRule &rule,
                                        const QDateTime &reference)
{
    if (rule.isNone() || !anchor.date.isValid() || !reference.isValid()) {
        return std::nullopt;
    }
    const std::optional<QDate> &endDate = rule.endDate();
    if (endDate && *endDate < reference.date()) {
        return std::nullopt;
    }

    const QTime time = anchor.timeOfDay();
    const std::optional<QDate> date = std::visit(
        core::Overloaded{
            [](const NoRecurrence &) -> std::optional<QDate> { return std::nullopt; },
            [&](const DailyPattern &p) { return nextDaily(p.interval, time, reference); },
            [&](const WeeklyPattern &p) {
                const WeekdaySet days = p.daysOfWeek.value_or(
                    WeekdaySet{static_cast<Qt::DayOfWeek>(anchor.date.dayOfWeek())});
                return scanWeek(days, time, reference);
            },
            [&](const MonthlyPattern &p) {
                return nextMonthly(p.dayOfMonth.value_or(anchor.date.day()), time, reference);
            },
            [&](const YearlyPattern &) { return nextYearly(anchor.date, time, reference); },
            [&](const CustomDaysPattern &p) { return nextCustomDays(anchor.date, p.interval, time, reference); },
            [&](const NthWeekdayPattern &p) { return nextNthWeekday(p, time, reference); },
            [&](const SpecificDaysPattern &p) { return scanWeek(p.daysOfWeek, time, reference); },
        },
        rule.pattern());

    if (!date || (endDate && *date > *endDate)) {
        return std::nullopt;
    }
    return wallClock(*date, time);
}

bool occursOn(const Anchor &anchor, const RecurrenceRule &rule, const QDate &date)
{
    if (!date.isValid() || !anchor.date.isValid() || date < anchor.date) {
        return false;
    }
    if (date == anchor.date) {
        return true;
    }
    const QDateTime endOfPreviousDay = wallClock(date.addDays(-1), QTime(23, 59, 59, 999));
    const std::optional<QDateTime> next = nextOccurrence(anchor, rule, endOfPreviousDay);
    return next && next->date() == date;
}

} // namespace recurrence
} // namespace anchor
