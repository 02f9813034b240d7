#pragma once

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTime>
#include <QUuid>
#include <optional>

#include "anchor/recurrence/RecurrenceRule.hpp"

namespace anchor {
namespace data {

struct Reminder
{
    QUuid id = QUuid::createUuid();
    QString title;
    QDate dueDate;
    QTime dueTime;
    recurrence::RecurrenceRule recurrenceRule;
    bool isRecurring = false;
    std::optional<QDateTime> nextOccurrence;
};

} // namespace data
} // namespace anchor
