#include "anchor/recurrence/RecurrenceFormatter.hpp"

#include "anchor/core/Overloaded.hpp"

#include <QObject>
#include <QStringList>
#include <array>

namespace anchor {
namespace recurrence {

namespace {
// Indexed by Qt::DayOfWeek - 1.
constexpr std::array<const char *, 7> DAY_NAMES = {
    "Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday",
};
constexpr std::array<const char *, 7> SHORT_DAY_NAMES = {
    "Mon", "Tue", "Wed", "Thu", "Fri", "Sat", "Sun",
};

QString joinShortNames(const WeekdaySet &days)
{
    QStringList names;
    for (const Qt::DayOfWeek day : days.toList()) {
        names << shortWeekdayName(day);
    }
    return names.join(QLatin1String(", "));
}

// Shared shortcuts for complete weeks and Monday to Friday.
QString dayShortcut(const WeekdaySet &days)
{
    if (days.size() == 7) {
        return QObject::tr("Every day");
    }
    if (days == WeekdaySet::weekdays()) {
        return QObject::tr("Every weekday");
    }
    return {};
}

QString formatInterval(int interval)
{
    if (interval > 1) {
        return QObject::tr("Every %1 days").arg(interval);
    }
    return QObject::tr("Every day");
}
} // namespace

QString ordinal(int n)
{
    const int lastTwo = n % 100;
    const int last = n % 10;
    QLatin1String suffix("th");
    if (lastTwo < 11 || lastTwo > 13) {
        if (last == 1) {
            suffix = QLatin1String("st");
        } else if (last == 2) {
            suffix = QLatin1String("nd");
        } else if (last == 3) {
            suffix = QLatin1String("rd");
        }
    }
    return QString::number(n) + suffix;
}

QString weekdayName(Qt::DayOfWeek day)
{
    if (day < Qt::Monday || day > Qt::Sunday) {
        return QObject::tr("Unknown");
    }
    return QString::fromLatin1(DAY_NAMES[static_cast<std::size_t>(day - 1)]);
}

QString shortWeekdayName(Qt::DayOfWeek day)
{
    if (day < Qt::Monday || day > Qt::Sunday) {
        return QStringLiteral("?");
    }
    return QString::fromLatin1(SHORT_DAY_NAMES[static_cast<std::size_t>(day - 1)]);
}

QString formatRecurrence(const RecurrenceRule &rule)
{
    return std::visit(
        core::Overloaded{
            [](const NoRecurrence &) { return QObject::tr("Does not repeat"); },
            [](const DailyPattern &p) { return formatInterval(p.interval); },
            [](const WeeklyPattern &p) {
                if (!p.daysOfWeek || p.daysOfWeek->isEmpty()) {
                    return QObject::tr("Every week");
                }
                const QString shortcut = dayShortcut(*p.daysOfWeek);
                if (!shortcut.isEmpty()) {
                    return shortcut;
                }
                return QObject::tr("Weekly on %1").arg(joinShortNames(*p.daysOfWeek));
            },
            [](const MonthlyPattern &p) {
                if (!p.dayOfMonth) {
                    return QObject::tr("Every month");
                }
                return QObject::tr("Monthly on the %1").arg(ordinal(*p.dayOfMonth));
            },
            [](const YearlyPattern &) { return QObject::tr("Every year"); },
            [](const CustomDaysPattern &p) { return formatInterval(p.interval); },
            [](const NthWeekdayPattern &p) {
                const QString position = p.n == NthWeekdayPattern::Last ? QObject::tr("last") : ordinal(p.n);
                return QObject::tr("Monthly on the %1 %2").arg(position, weekdayName(p.weekday));
            },
            [](const SpecificDaysPattern &p) {
                if (p.daysOfWeek.isEmpty()) {
                    return QObject::tr("Selected days");
                }
                const QString shortcut = dayShortcut(p.daysOfWeek);
                if (!shortcut.isEmpty()) {
                    return shortcut;
                }
                return QObject::tr("Every %1").arg(joinShortNames(p.daysOfWeek));
            },
        },
        rule.pattern());
}

} // namespace recurrence
} // namespace anchor
