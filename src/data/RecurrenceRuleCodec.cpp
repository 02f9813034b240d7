#include "anchor/data/RecurrenceRuleCodec.hpp"

#include "anchor/core/Logging.hpp"
#include "anchor/core/Overloaded.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonValue>
#include <cmath>
#include <limits>

namespace anchor {
namespace data {

using namespace recurrence;

namespace {
constexpr auto TYPE_KEY = "type";
constexpr auto INTERVAL_KEY = "interval";
constexpr auto DAYS_OF_WEEK_KEY = "daysOfWeek";
constexpr auto DAY_OF_MONTH_KEY = "dayOfMonth";
constexpr auto NTH_WEEKDAY_KEY = "nthWeekday";
constexpr auto N_KEY = "n";
constexpr auto WEEKDAY_KEY = "weekday";
constexpr auto END_DATE_KEY = "endDate";
constexpr auto COUNT_KEY = "count";

QString key(const char *name)
{
    return QString::fromLatin1(name);
}

std::optional<int> readInt(const QJsonValue &value)
{
    if (!value.isDouble()) {
        return std::nullopt;
    }
    const double number = value.toDouble();
    if (std::floor(number) != number || number < std::numeric_limits<int>::min()
        || number > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(number);
}

std::optional<RecurrenceRule> reject(const QString &reason, const QJsonObject &object)
{
    qCWarning(ANCHOR_RECURRENCE_LOG) << "Rejected recurrence rule:" << reason
                                     << QJsonDocument(object).toJson(QJsonDocument::Compact);
    return std::nullopt;
}
} // namespace

QString RecurrenceRuleCodec::typeName(const RecurrencePattern &pattern)
{
    return std::visit(
        core::Overloaded{
            [](const NoRecurrence &) { return QStringLiteral("none"); },
            [](const DailyPattern &) { return QStringLiteral("daily"); },
            [](const WeeklyPattern &) { return QStringLiteral("weekly"); },
            [](const MonthlyPattern &) { return QStringLiteral("monthly"); },
            [](const YearlyPattern &) { return QStringLiteral("yearly"); },
            [](const CustomDaysPattern &) { return QStringLiteral("custom_days"); },
            [](const NthWeekdayPattern &) { return QStringLiteral("nth_weekday"); },
            [](const SpecificDaysPattern &) { return QStringLiteral("specific_days"); },
        },
        pattern);
}

int RecurrenceRuleCodec::weekdayToJson(Qt::DayOfWeek day)
{
    return static_cast<int>(day) % 7;
}

std::optional<Qt::DayOfWeek> RecurrenceRuleCodec::weekdayFromJson(const QJsonValue &value)
{
    const std::optional<int> day = readInt(value);
    if (!day || *day < 0 || *day > 6) {
        return std::nullopt;
    }
    return static_cast<Qt::DayOfWeek>(*day == 0 ? Qt::Sunday : *day);
}

QJsonObject RecurrenceRuleCodec::toJson(const RecurrenceRule &rule)
{
    QJsonObject object;
    object.insert(key(TYPE_KEY), typeName(rule.pattern()));

    auto writeDays = [&object](const WeekdaySet &days) {
        QJsonArray array;
        for (const Qt::DayOfWeek day : days.toList()) {
            array.append(weekdayToJson(day));
        }
        object.insert(key(DAYS_OF_WEEK_KEY), array);
    };

    std::visit(
        core::Overloaded{
            [](const NoRecurrence &) {},
            [&](const DailyPattern &p) { object.insert(key(INTERVAL_KEY), p.interval); },
            [&](const WeeklyPattern &p) {
                object.insert(key(INTERVAL_KEY), p.interval);
                if (p.daysOfWeek) {
                    writeDays(*p.daysOfWeek);
                }
            },
            [&](const MonthlyPattern &p) {
                if (p.dayOfMonth) {
                    object.insert(key(DAY_OF_MONTH_KEY), *p.dayOfMonth);
                }
            },
            [](const YearlyPattern &) {},
            [&](const CustomDaysPattern &p) { object.insert(key(INTERVAL_KEY), p.interval); },
            [&](const NthWeekdayPattern &p) {
                QJsonObject nth;
                nth.insert(key(N_KEY), p.n);
                nth.insert(key(WEEKDAY_KEY), weekdayToJson(p.weekday));
                object.insert(key(NTH_WEEKDAY_KEY), nth);
            },
            [&](const SpecificDaysPattern &p) { writeDays(p.daysOfWeek); },
        },
        rule.pattern());

    if (rule.endDate()) {
        object.insert(key(END_DATE_KEY), rule.endDate()->toString(Qt::ISODate));
    }
    if (rule.count()) {
        object.insert(key(COUNT_KEY), *rule.count());
    }
    return object;
}

std::optional<RecurrenceRule> RecurrenceRuleCodec::fromJson(const QJsonObject &object)
{
    const QString type = object.value(key(TYPE_KEY)).toString();

    int interval = 1;
    if (object.contains(key(INTERVAL_KEY))) {
        const std::optional<int> value = readInt(object.value(key(INTERVAL_KEY)));
        if (!value) {
            return reject(QStringLiteral("interval is not an integer"), object);
        }
        interval = *value;
    }

    std::optional<WeekdaySet> days;
    if (object.contains(key(DAYS_OF_WEEK_KEY))) {
        const QJsonValue value = object.value(key(DAYS_OF_WEEK_KEY));
        if (!value.isArray()) {
            return reject(QStringLiteral("daysOfWeek is not an array"), object);
        }
        WeekdaySet set;
        for (const QJsonValue &entry : value.toArray()) {
            const std::optional<Qt::DayOfWeek> day = weekdayFromJson(entry);
            if (!day) {
                return reject(QStringLiteral("daysOfWeek entry must be 0-6"), object);
            }
            set.insert(*day);
        }
        days = set;
    }

    RecurrencePattern pattern;
    if (type == QLatin1String("none")) {
        pattern = NoRecurrence{};
    } else if (type == QLatin1String("daily")) {
        pattern = DailyPattern{interval};
    } else if (type == QLatin1String("weekly")) {
        pattern = WeeklyPattern{interval, days};
    } else if (type == QLatin1String("monthly")) {
        MonthlyPattern monthly;
        if (object.contains(key(DAY_OF_MONTH_KEY))) {
            monthly.dayOfMonth = readInt(object.value(key(DAY_OF_MONTH_KEY)));
            if (!monthly.dayOfMonth) {
                return reject(QStringLiteral("dayOfMonth is not an integer"), object);
            }
        }
        pattern = monthly;
    } else if (type == QLatin1String("yearly")) {
        pattern = YearlyPattern{};
    } else if (type == QLatin1String("custom_days")) {
        pattern = CustomDaysPattern{interval};
    } else if (type == QLatin1String("nth_weekday")) {
        const QJsonObject nth = object.value(key(NTH_WEEKDAY_KEY)).toObject();
        const std::optional<int> n = readInt(nth.value(key(N_KEY)));
        const std::optional<Qt::DayOfWeek> weekday = weekdayFromJson(nth.value(key(WEEKDAY_KEY)));
        if (!n || !weekday) {
            return reject(QStringLiteral("nthWeekday configuration is required"), object);
        }
        pattern = NthWeekdayPattern{*n, *weekday};
    } else if (type == QLatin1String("specific_days")) {
        pattern = SpecificDaysPattern{days.value_or(WeekdaySet())};
    } else {
        return reject(QStringLiteral("unknown type \"%1\"").arg(type), object);
    }

    std::optional<RecurrenceRule> rule = RecurrenceRule::fromPattern(pattern);
    if (!rule) {
        return reject(RecurrenceRule::validate(pattern), object);
    }

    if (object.contains(key(END_DATE_KEY))) {
        const QDate endDate = QDate::fromString(object.value(key(END_DATE_KEY)).toString(), Qt::ISODate);
        if (!endDate.isValid()) {
            return reject(QStringLiteral("endDate is not an ISO date"), object);
        }
        rule = rule->withEndDate(endDate);
    }
    if (object.contains(key(COUNT_KEY))) {
        const std::optional<int> count = readInt(object.value(key(COUNT_KEY)));
        if (!count || *count < 1) {
            return reject(QStringLiteral("count must be a positive integer"), object);
        }
        rule = rule->withCount(count);
    }
    return rule;
}

QByteArray RecurrenceRuleCodec::toJsonString(const RecurrenceRule &rule)
{
    return QJsonDocument(toJson(rule)).toJson(QJsonDocument::Compact);
}

std::optional<RecurrenceRule> RecurrenceRuleCodec::fromJsonString(const QByteArray &json)
{
    QJsonParseError error;
    const QJsonDocument document = QJsonDocument::fromJson(json, &error);
    if (error.error != QJsonParseError::NoError || !document.isObject()) {
        qCWarning(ANCHOR_RECURRENCE_LOG) << "Invalid recurrence JSON:" << error.errorString();
        return std::nullopt;
    }
    return fromJson(document.object());
}

} // namespace data
} // namespace anchor
