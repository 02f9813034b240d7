#pragma once

#include <QDate>
#include <QString>
#include <optional>
#include <variant>

#include "anchor/recurrence/WeekdaySet.hpp"

namespace anchor {
namespace recurrence {

struct NoRecurrence
{
    bool operator==(const NoRecurrence &) const { return true; }
};

struct DailyPattern
{
    int interval = 1;

    bool operator==(const DailyPattern &other) const { return interval == other.interval; }
};

struct WeeklyPattern
{
    // Stored but not applied: weekly rules always repeat every week.
    int interval = 1;
    // Unset means the anchor's own weekday.
    std::optional<WeekdaySet> daysOfWeek;

    bool operator==(const WeeklyPattern &other) const
    {
        return interval == other.interval && daysOfWeek == other.daysOfWeek;
    }
};

struct MonthlyPattern
{
    // Unset means the anchor's own day of month.
    std::optional<int> dayOfMonth;

    bool operator==(const MonthlyPattern &other) const { return dayOfMonth == other.dayOfMonth; }
};

struct YearlyPattern
{
    bool operator==(const YearlyPattern &) const { return true; }
};

struct CustomDaysPattern
{
    int interval = 1;

    bool operator==(const CustomDaysPattern &other) const { return interval == other.interval; }
};

struct NthWeekdayPattern
{
    static constexpr int Last = -1;

    int n = 1;
    Qt::DayOfWeek weekday = Qt::Monday;

    bool operator==(const NthWeekdayPattern &other) const
    {
        return n == other.n && weekday == other.weekday;
    }
};

struct SpecificDaysPattern
{
    WeekdaySet daysOfWeek;

    bool operator==(const SpecificDaysPattern &other) const { return daysOfWeek == other.daysOfWeek; }
};

using RecurrencePattern = std::variant<NoRecurrence,
                                       DailyPattern,
                                       WeeklyPattern,
                                       MonthlyPattern,
                                       YearlyPattern,
                                       CustomDaysPattern,
                                       NthWeekdayPattern,
                                       SpecificDaysPattern>;

// Immutable pattern plus optional bounds. Named constructors reject invalid patterns.
class RecurrenceRule
{
public:
    RecurrenceRule();

    static RecurrenceRule none();
    static RecurrenceRule yearly();
    static RecurrenceRule weekly(std::optional<WeekdaySet> daysOfWeek = std::nullopt);
    static std::optional<RecurrenceRule> daily(int interval = 1);
    static std::optional<RecurrenceRule> customDays(int interval);
    static std::optional<RecurrenceRule> monthly(std::optional<int> dayOfMonth = std::nullopt);
    static std::optional<RecurrenceRule> nthWeekday(int n, Qt::DayOfWeek weekday);
    static std::optional<RecurrenceRule> specificDays(const WeekdaySet &daysOfWeek);
    static std::optional<RecurrenceRule> fromPattern(RecurrencePattern pattern);

    // Empty when the pattern is well formed.
    static QString validate(const RecurrencePattern &pattern);

    const RecurrencePattern &pattern() const { return m_pattern; }
    bool isNone() const;

    const std::optional<QDate> &endDate() const { return m_endDate; }
    // Carried for storage only; the occurrence engine does not consume it.
    const std::optional<int> &count() const { return m_count; }

    RecurrenceRule withEndDate(std::optional<QDate> endDate) const;
    RecurrenceRule withCount(std::optional<int> count) const;

    bool operator==(const RecurrenceRule &other) const;
    bool operator!=(const RecurrenceRule &other) const { return !(*this == other); }

private:
    explicit RecurrenceRule(RecurrencePattern pattern);

    RecurrencePattern m_pattern;
    std::optional<QDate> m_endDate;
    std::optional<int> m_count;
};

} // namespace recurrence
} // namespace anchor
