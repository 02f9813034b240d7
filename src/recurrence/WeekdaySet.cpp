#include "anchor/recurrence/WeekdaySet.hpp"

namespace anchor {
namespace recurrence {

WeekdaySet::WeekdaySet(std::initializer_list<Qt::DayOfWeek> days)
{
    for (const Qt::DayOfWeek day : days) {
        insert(day);
    }
}

WeekdaySet WeekdaySet::weekdays()
{
    return {Qt::Monday, Qt::Tuesday, Qt::Wednesday, Qt::Thursday, Qt::Friday};
}

WeekdaySet WeekdaySet::weekend()
{
    return {Qt::Saturday, Qt::Sunday};
}

WeekdaySet WeekdaySet::everyDay()
{
    WeekdaySet set = weekdays();
    set.insert(Qt::Saturday);
    set.insert(Qt::Sunday);
    return set;
}

void WeekdaySet::insert(Qt::DayOfWeek day)
{
    if (!isValidDay(day)) {
        return;
    }
    m_mask |= static_cast<std::uint8_t>(1u << (day - 1));
}

bool WeekdaySet::contains(Qt::DayOfWeek day) const
{
    return contains(static_cast<int>(day));
}

bool WeekdaySet::contains(int day) const
{
    if (!isValidDay(day)) {
        return false;
    }
    return (m_mask & (1u << (day - 1))) != 0;
}

int WeekdaySet::size() const
{
    int count = 0;
    for (int day = Qt::Monday; day <= Qt::Sunday; ++day) {
        if (contains(day)) {
            ++count;
        }
    }
    return count;
}

bool WeekdaySet::isEmpty() const
{
    return m_mask == 0;
}

QVector<Qt::DayOfWeek> WeekdaySet::toList() const
{
    QVector<Qt::DayOfWeek> days;
    for (int day = Qt::Monday; day <= Qt::Sunday; ++day) {
        if (contains(day)) {
            days.append(static_cast<Qt::DayOfWeek>(day));
        }
    }
    return days;
}

bool WeekdaySet::isValidDay(int day)
{
    return day >= Qt::Monday && day <= Qt::Sunday;
}

} // namespace recurrence
} // namespace anchor
