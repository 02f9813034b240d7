#pragma once

#include <QDate>
#include <QVector>
#include <cstdint>
#include <initializer_list>

namespace anchor {
namespace recurrence {

// Ordered set of weekdays, iterated Monday first.
class WeekdaySet
{
public:
    WeekdaySet() = default;
    WeekdaySet(std::initializer_list<Qt::DayOfWeek> days);

    static WeekdaySet weekdays();
    static WeekdaySet weekend();
    static WeekdaySet everyDay();

    void insert(Qt::DayOfWeek day);
    bool contains(Qt::DayOfWeek day) const;
    bool contains(int day) const;
    int size() const;
    bool isEmpty() const;
    QVector<Qt::DayOfWeek> toList() const;

    bool operator==(const WeekdaySet &other) const { return m_mask == other.m_mask; }
    bool operator!=(const WeekdaySet &other) const { return m_mask != other.m_mask; }

private:
    static bool isValidDay(int day);

    std::uint8_t m_mask = 0;
};

} // namespace recurrence
} // namespace anchor
