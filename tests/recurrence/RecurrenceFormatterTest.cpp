#include <QtTest/QtTest>

#include "anchor/recurrence/RecurrenceFormatter.hpp"

using namespace anchor::recurrence;

class RecurrenceFormatterTest : public QObject
{
    Q_OBJECT

private slots:
    void formatsSimpleRules();
    void formatsWeekdaySets();
    void formatsMonthlyRules();
    void formatsDegenerateRules();
    void ordinalSuffixes();
};

void RecurrenceFormatterTest::formatsSimpleRules()
{
    QCOMPARE(formatRecurrence(RecurrenceRule::none()), QStringLiteral("Does not repeat"));
    QCOMPARE(formatRecurrence(*RecurrenceRule::daily()), QStringLiteral("Every day"));
    QCOMPARE(formatRecurrence(*RecurrenceRule::daily(2)), QStringLiteral("Every 2 days"));
    QCOMPARE(formatRecurrence(*RecurrenceRule::customDays(3)), QStringLiteral("Every 3 days"));
    QCOMPARE(formatRecurrence(RecurrenceRule::yearly()), QStringLiteral("Every year"));
    QCOMPARE(formatRecurrence(RecurrenceRule::weekly()), QStringLiteral("Every week"));
}

void RecurrenceFormatterTest::formatsWeekdaySets()
{
    QCOMPARE(formatRecurrence(*RecurrenceRule::specificDays(WeekdaySet::weekdays())), QStringLiteral("Every weekday"));
    QCOMPARE(formatRecurrence(RecurrenceRule::weekly(WeekdaySet::weekdays())), QStringLiteral("Every weekday"));
    QCOMPARE(formatRecurrence(RecurrenceRule::weekly(WeekdaySet::everyDay())), QStringLiteral("Every day"));
    QCOMPARE(formatRecurrence(*RecurrenceRule::specificDays(WeekdaySet::everyDay())), QStringLiteral("Every day"));
    QCOMPARE(formatRecurrence(*RecurrenceRule::specificDays({Qt::Friday, Qt::Monday, Qt::Wednesday})),
             QStringLiteral("Every Mon, Wed, Fri"));
    QCOMPARE(formatRecurrence(*RecurrenceRule::specificDays(WeekdaySet::weekend())), QStringLiteral("Every Sat, Sun"));
    QCOMPARE(formatRecurrence(RecurrenceRule::weekly(WeekdaySet{Qt::Friday})), QStringLiteral("Weekly on Fri"));

    // Five days that are not Monday to Friday.
    const WeekdaySet mixed{Qt::Monday, Qt::Tuesday, Qt::Wednesday, Qt::Thursday, Qt::Saturday};
    QCOMPARE(formatRecurrence(RecurrenceRule::weekly(mixed)), QStringLiteral("Weekly on Mon, Tue, Wed, Thu, Sat"));
}

void RecurrenceFormatterTest::formatsMonthlyRules()
{
    QCOMPARE(formatRecurrence(*RecurrenceRule::monthly()), QStringLiteral("Every month"));
    QCOMPARE(formatRecurrence(*RecurrenceRule::monthly(31)), QStringLiteral("Monthly on the 31st"));
    QCOMPARE(formatRecurrence(*RecurrenceRule::monthly(12)), QStringLiteral("Monthly on the 12th"));
    QCOMPARE(formatRecurrence(*RecurrenceRule::nthWeekday(2, Qt::Monday)), QStringLiteral("Monthly on the 2nd Monday"));
    QCOMPARE(formatRecurrence(*RecurrenceRule::nthWeekday(NthWeekdayPattern::Last, Qt::Friday)),
             QStringLiteral("Monthly on the last Friday"));
}

void RecurrenceFormatterTest::formatsDegenerateRules()
{
    QCOMPARE(formatRecurrence(RecurrenceRule::weekly(WeekdaySet())), QStringLiteral("Every week"));
    QCOMPARE(formatRecurrence(RecurrenceRule()), QStringLiteral("Does not repeat"));
}

void RecurrenceFormatterTest::ordinalSuffixes()
{
    QCOMPARE(ordinal(1), QStringLiteral("1st"));
    QCOMPARE(ordinal(2), QStringLiteral("2nd"));
    QCOMPARE(ordinal(3), QStringLiteral("3rd"));
    QCOMPARE(ordinal(4), QStringLiteral("4th"));
    QCOMPARE(ordinal(11), QStringLiteral("11th"));
    QCOMPARE(ordinal(12), QStringLiteral("12th"));
    QCOMPARE(ordinal(13), QStringLiteral("13th"));
    QCOMPARE(ordinal(21), QStringLiteral("21st"));
    QCOMPARE(ordinal(22), QStringLiteral("22nd"));
    QCOMPARE(ordinal(23), QStringLiteral("23rd"));
    QCOMPARE(ordinal(101), QStringLiteral("101st"));
    QCOMPARE(ordinal(111), QStringLiteral("111th"));
}

QTEST_GUILESS_MAIN(RecurrenceFormatterTest)
#include "RecurrenceFormatterTest.moc"
