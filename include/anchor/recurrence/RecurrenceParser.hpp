#pragma once

#include <QString>
#include <optional>
#include <vector>

#include "anchor/recurrence/RecurrenceRule.hpp"

namespace anchor {
namespace recurrence {

using RecurrenceMatchFunction = std::optional<RecurrenceRule> (*)(const QString &text);

struct RecurrenceMatcher
{
    const char *name;
    RecurrenceMatchFunction match;
};

// Best-effort rule from text like "every 3 days" or "last Friday"; first matcher hit wins.
std::optional<RecurrenceRule> parseRecurrence(const QString &text);

// Ordered from most to least specific.
const std::vector<RecurrenceMatcher> &recurrenceMatchers();

// Individual matchers, all case-insensitive.
std::optional<RecurrenceRule> matchEveryNDays(const QString &text);
std::optional<RecurrenceRule> matchDaily(const QString &text);
std::optional<RecurrenceRule> matchWeekdays(const QString &text);
std::optional<RecurrenceRule> matchWeekend(const QString &text);
std::optional<RecurrenceRule> matchNamedWeekdays(const QString &text);
std::optional<RecurrenceRule> matchNthWeekday(const QString &text);
std::optional<RecurrenceRule> matchWeekly(const QString &text);
std::optional<RecurrenceRule> matchMonthly(const QString &text);
std::optional<RecurrenceRule> matchYearly(const QString &text);

} // namespace recurrence
} // namespace anchor
