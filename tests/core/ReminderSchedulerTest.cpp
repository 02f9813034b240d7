#include <QtTest/QtTest>

#include "anchor/core/ReminderScheduler.hpp"

using namespace anchor;

namespace {
data::Reminder makeReminder(const recurrence::RecurrenceRule &rule, bool recurring = true)
{
    data::Reminder reminder;
    reminder.title = QStringLiteral("Stretch");
    reminder.dueDate = QDate(2024, 3, 4);
    reminder.dueTime = QTime(8, 0);
    reminder.recurrenceRule = rule;
    reminder.isRecurring = recurring;
    return reminder;
}
} // namespace

class ReminderSchedulerTest : public QObject
{
    Q_OBJECT

private slots:
    void nextOccurrenceStartsFromAnchor();
    void nextOccurrenceContinuesFromStoredOccurrence();
    void nonRecurringRemindersDoNotAdvance();
    void previewUsesGenerator();
    void recursOnMatchingDays();
    void previewCountFallsBackWhenStoredValueIsInvalid();
};

void ReminderSchedulerTest::nextOccurrenceStartsFromAnchor()
{
    const auto reminder = makeReminder(*recurrence::RecurrenceRule::specificDays(
        {Qt::Monday, Qt::Wednesday, Qt::Friday}));
    const auto next = core::ReminderScheduler::calculateNextOccurrence(reminder);
    QVERIFY(next.has_value());
    QCOMPARE(*next, recurrence::wallClock(QDate(2024, 3, 6), QTime(8, 0)));
}

void ReminderSchedulerTest::nextOccurrenceContinuesFromStoredOccurrence()
{
    auto reminder = makeReminder(*recurrence::RecurrenceRule::specificDays({Qt::Monday, Qt::Wednesday, Qt::Friday}));
    reminder.nextOccurrence = recurrence::wallClock(QDate(2024, 3, 8), QTime(8, 0));
    const auto next = core::ReminderScheduler::calculateNextOccurrence(reminder);
    QVERIFY(next.has_value());
    QCOMPARE(*next, recurrence::wallClock(QDate(2024, 3, 11), QTime(8, 0)));
}

void ReminderSchedulerTest::nonRecurringRemindersDoNotAdvance()
{
    QVERIFY(!core::ReminderScheduler::calculateNextOccurrence(makeReminder(recurrence::RecurrenceRule::none()))
                 .has_value());
    QVERIFY(!core::ReminderScheduler::calculateNextOccurrence(makeReminder(*recurrence::RecurrenceRule::daily(), false))
                 .has_value());

    const auto preview = core::ReminderScheduler::previewOccurrences(makeReminder(*recurrence::RecurrenceRule::daily(), false));
    QCOMPARE(preview.size(), 1);
    QCOMPARE(preview.front(), recurrence::wallClock(QDate(2024, 3, 4), QTime(8, 0)));
}

void ReminderSchedulerTest::previewUsesGenerator()
{
    const auto reminder = makeReminder(*recurrence::RecurrenceRule::daily());
    const auto preview = core::ReminderScheduler::previewOccurrences(reminder);
    QCOMPARE(preview.size(), core::ReminderScheduler::DefaultPreviewCount);
    QCOMPARE(preview.back(), recurrence::wallClock(QDate(2024, 3, 8), QTime(8, 0)));
}

void ReminderSchedulerTest::recursOnMatchingDays()
{
    const auto reminder = makeReminder(*recurrence::RecurrenceRule::nthWeekday(recurrence::NthWeekdayPattern::Last,
                                                                                Qt::Friday));
    QVERIFY(core::ReminderScheduler::shouldRecurOn(reminder, QDate(2024, 3, 4)));
    QVERIFY(core::ReminderScheduler::shouldRecurOn(reminder, QDate(2024, 3, 29)));
    QVERIFY(core::ReminderScheduler::shouldRecurOn(reminder, QDate(2024, 4, 26)));
    QVERIFY(!core::ReminderScheduler::shouldRecurOn(reminder, QDate(2024, 3, 22)));
    QVERIFY(!core::ReminderScheduler::shouldRecurOn(makeReminder(recurrence::RecurrenceRule::none()), QDate(2024, 3, 4)));
}

void ReminderSchedulerTest::previewCountFallsBackWhenStoredValueIsInvalid()
{
    const int fallback = core::ReminderScheduler::DefaultPreviewCount;
    QCOMPARE(core::ReminderScheduler::previewCount(QVariant()), fallback);
    QCOMPARE(core::ReminderScheduler::previewCount(QVariant(0)), fallback);
    QCOMPARE(core::ReminderScheduler::previewCount(QVariant(-3)), fallback);
    QCOMPARE(core::ReminderScheduler::previewCount(QVariant(QStringLiteral("soon"))), fallback);
    QCOMPARE(core::ReminderScheduler::previewCount(QVariant(12)), 12);
    QCOMPARE(core::ReminderScheduler::previewCount(QVariant(QStringLiteral("7"))), 7);
}

QTEST_GUILESS_MAIN(ReminderSchedulerTest)
#include "ReminderSchedulerTest.moc"
