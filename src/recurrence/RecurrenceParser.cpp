#include "anchor/recurrence/RecurrenceParser.hpp"

#include <QRegularExpression>
#include <array>
#include <initializer_list>
#include <utility>

namespace anchor {
namespace recurrence {

namespace {
const std::array<std::pair<const char *, Qt::DayOfWeek>, 7> DAY_LOOKUP = {{
    {"monday", Qt::Monday},
    {"tuesday", Qt::Tuesday},
    {"wednesday", Qt::Wednesday},
    {"thursday", Qt::Thursday},
    {"friday", Qt::Friday},
    {"saturday", Qt::Saturday},
    {"sunday", Qt::Sunday},
}};

const std::array<std::pair<const char *, int>, 11> ORDINAL_LOOKUP = {{
    {"first", 1},
    {"1st", 1},
    {"second", 2},
    {"2nd", 2},
    {"third", 3},
    {"3rd", 3},
    {"fourth", 4},
    {"4th", 4},
    {"fifth", 5},
    {"5th", 5},
    {"last", NthWeekdayPattern::Last},
}};

constexpr auto DAY_ALTERNATION = "monday|tuesday|wednesday|thursday|friday|saturday|sunday";
constexpr auto CASE_INSENSITIVE = QRegularExpression::CaseInsensitiveOption;

std::optional<Qt::DayOfWeek> dayFromName(const QString &name)
{
    const QString lower = name.toLower();
    for (const auto &entry : DAY_LOOKUP) {
        if (lower == QLatin1String(entry.first)) {
            return entry.second;
        }
    }
    return std::nullopt;
}

std::optional<int> ordinalFromName(const QString &name)
{
    const QString lower = name.toLower();
    for (const auto &entry : ORDINAL_LOOKUP) {
        if (lower == QLatin1String(entry.first)) {
            return entry.second;
        }
    }
    return std::nullopt;
}

bool containsAny(const QString &text, std::initializer_list<const char *> needles)
{
    for (const char *needle : needles) {
        if (text.contains(QLatin1String(needle), Qt::CaseInsensitive)) {
            return true;
        }
    }
    return false;
}
} // namespace

std::optional<RecurrenceRule> matchEveryNDays(const QString &text)
{
    static const QRegularExpression everyN(QStringLiteral("\\bevery\\s+(\\d+)\\s+days?\\b"), CASE_INSENSITIVE);
    static const QRegularExpression everyOther(QStringLiteral("\\bevery\\s+other\\s+day\\b"), CASE_INSENSITIVE);

    const QRegularExpressionMatch match = everyN.match(text);
    if (match.hasMatch()) {
        bool ok = false;
        const int interval = match.captured(1).toInt(&ok);
        if (!ok) {
            return std::nullopt;
        }
        return RecurrenceRule::customDays(interval);
    }
    if (everyOther.match(text).hasMatch()) {
        return RecurrenceRule::customDays(2);
    }
    return std::nullopt;
}

std::optional<RecurrenceRule> matchDaily(const QString &text)
{
    if (containsAny(text, {"every day", "daily"})) {
        return RecurrenceRule::daily(1);
    }
    return std::nullopt;
}

std::optional<RecurrenceRule> matchWeekdays(const QString &text)
{
    if (containsAny(text, {"weekday", "week day"})) {
        return RecurrenceRule::specificDays(WeekdaySet::weekdays());
    }
    return std::nullopt;
}

std::optional<RecurrenceRule> matchWeekend(const QString &text)
{
    if (containsAny(text, {"weekend"})) {
        return RecurrenceRule::specificDays(WeekdaySet::weekend());
    }
    return std::nullopt;
}

std::optional<RecurrenceRule> matchNamedWeekdays(const QString &text)
{
    // "every monday", "every tuesday, thursday and saturday", "every mondays & fridays"
    static const QRegularExpression dayList(
        QStringLiteral("\\bevery\\s+((?:%1)s?\\b(?:(?:\\s*,\\s*(?:and\\s+)?|\\s+and\\s+|\\s*&\\s*)(?:%1)s?\\b)*)")
            .arg(QLatin1String(DAY_ALTERNATION)),
        CASE_INSENSITIVE);
    static const QRegularExpression dayName(QStringLiteral("(%1)").arg(QLatin1String(DAY_ALTERNATION)),
                                            CASE_INSENSITIVE);

    WeekdaySet days;
    QRegularExpressionMatchIterator lists = dayList.globalMatch(text);
    while (lists.hasNext()) {
        const QString list = lists.next().captured(1);
        QRegularExpressionMatchIterator names = dayName.globalMatch(list);
        while (names.hasNext()) {
            if (const auto day = dayFromName(names.next().captured(1))) {
                days.insert(*day);
            }
        }
    }

    if (days.isEmpty()) {
        return std::nullopt;
    }
    if (days.size() == 1) {
        return RecurrenceRule::weekly(days);
    }
    return RecurrenceRule::specificDays(days);
}

std::optional<RecurrenceRule> matchNthWeekday(const QString &text)
{
    static const QRegularExpression nth(
        QStringLiteral("\\b(first|second|third|fourth|fifth|last|1st|2nd|3rd|4th|5th)\\s+(%1)\\b")
            .arg(QLatin1String(DAY_ALTERNATION)),
        CASE_INSENSITIVE);

    const QRegularExpressionMatch match = nth.match(text);
    if (!match.hasMatch()) {
        return std::nullopt;
    }
    const std::optional<int> n = ordinalFromName(match.captured(1));
    const std::optional<Qt::DayOfWeek> weekday = dayFromName(match.captured(2));
    if (!n || !weekday) {
        return std::nullopt;
    }
    return RecurrenceRule::nthWeekday(*n, *weekday);
}

std::optional<RecurrenceRule> matchWeekly(const QString &text)
{
    if (containsAny(text, {"weekly", "every week"})) {
        return RecurrenceRule::weekly();
    }
    return std::nullopt;
}

std::optional<RecurrenceRule> matchMonthly(const QString &text)
{
    if (containsAny(text, {"monthly", "every month"})) {
        return RecurrenceRule::monthly();
    }
    return std::nullopt;
}

std::optional<RecurrenceRule> matchYearly(const QString &text)
{
    if (containsAny(text, {"yearly", "annually", "every year"})) {
        return RecurrenceRule::yearly();
    }
    return std::nullopt;
}

const std::vector<RecurrenceMatcher> &recurrenceMatchers()
{
    static const std::vector<RecurrenceMatcher> matchers = {
        {"every-n-days", &matchEveryNDays},
        {"daily", &matchDaily},
        {"weekdays", &matchWeekdays},
        {"weekend", &matchWeekend},
        {"named-weekdays", &matchNamedWeekdays},
        {"nth-weekday", &matchNthWeekday},
        {"weekly", &matchWeekly},
        {"monthly", &matchMonthly},
        {"yearly", &matchYearly},
    };
    return matchers;
}

std::optional<RecurrenceRule> parseRecurrence(const QString &text)
{
    const QString trimmed = text.simplified();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }
    for (const RecurrenceMatcher &matcher : recurrenceMatchers()) {
        if (auto rule = matcher.match(trimmed)) {
            return rule;
        }
    }
    return std::nullopt;
}

} // namespace recurrence
} // namespace anchor
