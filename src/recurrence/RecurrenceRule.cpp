#include "anchor/recurrence/RecurrenceRule.hpp"

#include "anchor/core/Overloaded.hpp"

#include <QObject>
#include <utility>

namespace anchor {
namespace recurrence {

namespace {
QString validateInterval(int interval)
{
    if (interval < 1) {
        return QObject::tr("Interval must be at least 1 day");
    }
    return {};
}
} // namespace

RecurrenceRule::RecurrenceRule() = default;

RecurrenceRule::RecurrenceRule(RecurrencePattern pattern)
    : m_pattern(std::move(pattern))
{
}

RecurrenceRule RecurrenceRule::none()
{
    return RecurrenceRule(NoRecurrence{});
}

RecurrenceRule RecurrenceRule::yearly()
{
    return RecurrenceRule(YearlyPattern{});
}

RecurrenceRule RecurrenceRule::weekly(std::optional<WeekdaySet> daysOfWeek)
{
    WeeklyPattern pattern;
    pattern.daysOfWeek = std::move(daysOfWeek);
    return RecurrenceRule(pattern);
}

std::optional<RecurrenceRule> RecurrenceRule::daily(int interval)
{
    return fromPattern(DailyPattern{interval});
}

std::optional<RecurrenceRule> RecurrenceRule::customDays(int interval)
{
    return fromPattern(CustomDaysPattern{interval});
}

std::optional<RecurrenceRule> RecurrenceRule::monthly(std::optional<int> dayOfMonth)
{
    return fromPattern(MonthlyPattern{dayOfMonth});
}

std::optional<RecurrenceRule> RecurrenceRule::nthWeekday(int n, Qt::DayOfWeek weekday)
{
    return fromPattern(NthWeekdayPattern{n, weekday});
}

std::optional<RecurrenceRule> RecurrenceRule::specificDays(const WeekdaySet &daysOfWeek)
{
    return fromPattern(SpecificDaysPattern{daysOfWeek});
}

std::optional<RecurrenceRule> RecurrenceRule::fromPattern(RecurrencePattern pattern)
{
    if (!validate(pattern).isEmpty()) {
        return std::nullopt;
    }
    return RecurrenceRule(std::move(pattern));
}

QString RecurrenceRule::validate(const RecurrencePattern &pattern)
{
    return std::visit(
        core::Overloaded{
            [](const NoRecurrence &) { return QString(); },
            [](const DailyPattern &p) { return validateInterval(p.interval); },
            [](const WeeklyPattern &p) { return validateInterval(p.interval); },
            [](const MonthlyPattern &p) {
                if (p.dayOfMonth && (*p.dayOfMonth < 1 || *p.dayOfMonth > 31)) {
                    return QObject::tr("Day of month must be 1-31");
                }
                return QString();
            },
            [](const YearlyPattern &) { return QString(); },
            [](const CustomDaysPattern &p) { return validateInterval(p.interval); },
            [](const NthWeekdayPattern &p) {
                if (p.n != NthWeekdayPattern::Last && (p.n < 1 || p.n > 5)) {
                    return QObject::tr("N must be -1 (last) or 1-5");
                }
                if (p.weekday < Qt::Monday || p.weekday > Qt::Sunday) {
                    return QObject::tr("Weekday must be 1-7");
                }
                return QString();
            },
            [](const SpecificDaysPattern &p) {
                if (p.daysOfWeek.isEmpty()) {
                    return QObject::tr("At least one day of week must be specified");
                }
                return QString();
            },
        },
        pattern);
}

bool RecurrenceRule::isNone() const
{
    return std::holds_alternative<NoRecurrence>(m_pattern);
}

RecurrenceRule RecurrenceRule::withEndDate(std::optional<QDate> endDate) const
{
    RecurrenceRule copy = *this;
    if (endDate && !endDate->isValid()) {
        endDate.reset();
    }
    copy.m_endDate = endDate;
    return copy;
}

RecurrenceRule RecurrenceRule::withCount(std::optional<int> count) const
{
    RecurrenceRule copy = *this;
    if (count && *count < 1) {
        count.reset();
    }
    copy.m_count = count;
    return copy;
}

bool RecurrenceRule::operator==(const RecurrenceRule &other) const
{
    return m_pattern == other.m_pattern && m_endDate == other.m_endDate && m_count == other.m_count;
}

} // namespace recurrence
} // namespace anchor
