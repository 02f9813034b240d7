#include <QtTest/QtTest>

#include <ctime>
#include <vector>

#include "anchor/recurrence/OccurrenceSequence.hpp"

using namespace anchor::recurrence;

namespace {
// Switches the process time zone for the lifetime of the object.
class ScopedTimeZone
{
public:
    explicit ScopedTimeZone(const QByteArray &zone)
        : m_previous(qgetenv("TZ"))
        , m_hadPrevious(qEnvironmentVariableIsSet("TZ"))
    {
        qputenv("TZ", zone);
        tzset();
    }

    ~ScopedTimeZone()
    {
        if (m_hadPrevious) {
            qputenv("TZ", m_previous);
        } else {
            qunsetenv("TZ");
        }
        tzset();
    }

private:
    QByteArray m_previous;
    bool m_hadPrevious;
};
} // namespace

class OccurrenceSequenceTest : public QObject
{
    Q_OBJECT

private slots:
    void noneYieldsAnchorOnly();
    void monthlySequenceClampsMonthEnds();
    void specificDaysSequence();
    void stopsAtEndDate();
    void emptyWeekdaySetYieldsAnchorOnly();
    void nonPositiveCountYieldsNothing();
    void sequencesAreStrictlyIncreasingAndRepeatable();
    void dailySeriesCrossesDaylightSavingGap();
};

void OccurrenceSequenceTest::noneYieldsAnchorOnly()
{
    const Anchor anchor{QDate(2024, 3, 4), QTime(8, 0)};
    const auto occurrences = generateOccurrences(anchor, RecurrenceRule::none(), 5);
    QCOMPARE(occurrences.size(), 1);
    QCOMPARE(occurrences.front(), wallClock(QDate(2024, 3, 4), QTime(8, 0)));
}

void OccurrenceSequenceTest::monthlySequenceClampsMonthEnds()
{
    const Anchor anchor{QDate(2024, 1, 31), QTime(9, 0)};
    const auto occurrences = generateOccurrences(anchor, *RecurrenceRule::monthly(31), 5);

    const QVector<QDateTime> expected = {
        wallClock(QDate(2024, 1, 31), QTime(9, 0)),
        wallClock(QDate(2024, 2, 29), QTime(9, 0)),
        wallClock(QDate(2024, 3, 31), QTime(9, 0)),
        wallClock(QDate(2024, 4, 30), QTime(9, 0)),
        wallClock(QDate(2024, 5, 31), QTime(9, 0)),
    };
    QCOMPARE(occurrences, expected);
}

void OccurrenceSequenceTest::specificDaysSequence()
{
    const Anchor anchor{QDate(2024, 3, 4), QTime(8, 0)};
    const auto rule = RecurrenceRule::specificDays({Qt::Monday, Qt::Wednesday, Qt::Friday});
    const auto occurrences = generateOccurrences(anchor, *rule, 5);

    QCOMPARE(occurrences.size(), 5);
    QCOMPARE(occurrences.at(1).date(), QDate(2024, 3, 6));
    QCOMPARE(occurrences.at(2).date(), QDate(2024, 3, 8));
    QCOMPARE(occurrences.at(3).date(), QDate(2024, 3, 11));
    QCOMPARE(occurrences.at(4).date(), QDate(2024, 3, 13));
}

void OccurrenceSequenceTest::stopsAtEndDate()
{
    const Anchor anchor{QDate(2024, 3, 4), QTime(8, 0)};
    const RecurrenceRule rule = RecurrenceRule::daily()->withEndDate(QDate(2024, 3, 6));
    const auto occurrences = generateOccurrences(anchor, rule, 10);

    QCOMPARE(occurrences.size(), 3);
    QCOMPARE(occurrences.back(), wallClock(QDate(2024, 3, 6), QTime(8, 0)));
}

void OccurrenceSequenceTest::emptyWeekdaySetYieldsAnchorOnly()
{
    const Anchor anchor{QDate(2024, 3, 4), QTime(8, 0)};
    const auto occurrences = generateOccurrences(anchor, RecurrenceRule::weekly(WeekdaySet()), 10);
    QCOMPARE(occurrences.size(), 1);
}

void OccurrenceSequenceTest::nonPositiveCountYieldsNothing()
{
    const Anchor anchor{QDate(2024, 3, 4), QTime(8, 0)};
    QVERIFY(generateOccurrences(anchor, *RecurrenceRule::daily(), 0).isEmpty());
    QVERIFY(generateOccurrences(anchor, RecurrenceRule::none(), -1).isEmpty());
}

void OccurrenceSequenceTest::sequencesAreStrictlyIncreasingAndRepeatable()
{
    const Anchor anchor{QDate(2024, 1, 31), QTime(7, 45)};
    const std::vector<RecurrenceRule> rules = {
        *RecurrenceRule::daily(2),
        RecurrenceRule::weekly(WeekdaySet{Qt::Tuesday, Qt::Saturday}),
        *RecurrenceRule::monthly(30),
        RecurrenceRule::yearly(),
        *RecurrenceRule::customDays(10),
        *RecurrenceRule::nthWeekday(NthWeekdayPattern::Last, Qt::Sunday),
        *RecurrenceRule::nthWeekday(5, Qt::Thursday),
        *RecurrenceRule::specificDays(WeekdaySet::weekdays()),
    };

    for (const RecurrenceRule &rule : rules) {
        const auto first = generateOccurrences(anchor, rule, 40);
        const auto second = generateOccurrences(anchor, rule, 40);
        QCOMPARE(first.size(), 40);
        QCOMPARE(first, second);
        for (int i = 1; i < first.size(); ++i) {
            QVERIFY(first.at(i - 1) < first.at(i));
        }
    }
}

void OccurrenceSequenceTest::dailySeriesCrossesDaylightSavingGap()
{
    const ScopedTimeZone berlin("Europe/Berlin");
    const Anchor anchor{QDate(2024, 3, 29), QTime(2, 30)};
    const auto occurrences = generateOccurrences(anchor, *RecurrenceRule::daily(), 5);

    QCOMPARE(occurrences.size(), 5);
    for (int i = 0; i < occurrences.size(); ++i) {
        QVERIFY(occurrences.at(i).isValid());
        QCOMPARE(occurrences.at(i).date(), QDate(2024, 3, 29).addDays(i));
        QCOMPARE(occurrences.at(i).time(), QTime(2, 30));
    }
}

QTEST_GUILESS_MAIN(OccurrenceSequenceTest)
#include "OccurrenceSequenceTest.moc"
