#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <optional>

#include "anchor/recurrence/RecurrenceRule.hpp"

namespace anchor {
namespace data {

// Stored JSON shape, e.g. {"type": "nth_weekday", "nthWeekday": {"n": -1, "weekday": 5}}.
// Weekdays are numbered 0 (Sunday) to 6 (Saturday).
class RecurrenceRuleCodec
{
public:
    static QJsonObject toJson(const recurrence::RecurrenceRule &rule);
    static std::optional<recurrence::RecurrenceRule> fromJson(const QJsonObject &object);

    static QByteArray toJsonString(const recurrence::RecurrenceRule &rule);
    static std::optional<recurrence::RecurrenceRule> fromJsonString(const QByteArray &json);

    static QString typeName(const recurrence::RecurrencePattern &pattern);

private:
    static int weekdayToJson(Qt::DayOfWeek day);
    static std::optional<Qt::DayOfWeek> weekdayFromJson(const QJsonValue &value);
};

} // namespace data
} // namespace anchor
