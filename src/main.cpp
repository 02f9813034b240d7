#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <optional>

#include "version.h"

#include "anchor/core/Logging.hpp"
#include "anchor/core/ReminderScheduler.hpp"
#include "anchor/data/RecurrenceRuleCodec.hpp"
#include "anchor/recurrence/OccurrenceCalculator.hpp"
#include "anchor/recurrence/OccurrenceSequence.hpp"
#include "anchor/recurrence/RecurrenceFormatter.hpp"
#include "anchor/recurrence/RecurrenceParser.hpp"

using namespace anchor;

namespace {
constexpr auto PREVIEW_COUNT_KEY = "preview/count";

constexpr auto WALL_CLOCK_FORMAT = "yyyy-MM-dd'T'HH:mm:ss";

// Reads "YYYY-MM-DD[THH:MM[:SS]]" as a zone-free wall-clock instant.
std::optional<QDateTime> parseWallClock(const QString &text)
{
    const int separator = text.indexOf(QLatin1Char('T'));
    const QDate date = QDate::fromString(separator < 0 ? text : text.left(separator), Qt::ISODate);
    const QTime time = separator < 0 ? QTime(0, 0) : QTime::fromString(text.mid(separator + 1), Qt::ISODate);
    if (!date.isValid() || !time.isValid()) {
        return std::nullopt;
    }
    return recurrence::wallClock(date, time);
}

QString formatWallClock(const QDateTime &dateTime)
{
    return dateTime.toString(QString::fromLatin1(WALL_CLOCK_FORMAT));
}

int fail(const QString &message)
{
    QTextStream(stderr) << message << '\n';
    return 1;
}

std::optional<recurrence::RecurrenceRule> readRule(const QCommandLineParser &parser,
                                                   const QCommandLineOption &textOption,
                                                   const QCommandLineOption &jsonOption)
{
    if (parser.isSet(jsonOption)) {
        return data::RecurrenceRuleCodec::fromJsonString(parser.value(jsonOption).toUtf8());
    }
    if (parser.isSet(textOption)) {
        return recurrence::parseRecurrence(parser.value(textOption));
    }
    return recurrence::RecurrenceRule::none();
}
} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Anchor"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("anchor.app"));
    QCoreApplication::setApplicationName(QStringLiteral("anchor-recurrence"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(kAnchorRecurrenceVersion));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Preview the occurrences of a recurring reminder."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption anchorOption(QStringLiteral("anchor"),
                                          QObject::tr("Reminder date and time (ISO 8601)."),
                                          QStringLiteral("datetime"));
    const QCommandLineOption textOption(QStringLiteral("rule-text"),
                                        QObject::tr("Recurrence phrase, e.g. \"every weekday\"."),
                                        QStringLiteral("phrase"));
    const QCommandLineOption jsonOption(QStringLiteral("rule-json"),
                                        QObject::tr("Recurrence rule in stored JSON form."),
                                        QStringLiteral("json"));
    const QCommandLineOption untilOption(QStringLiteral("until"),
                                         QObject::tr("Last date of the series (ISO 8601)."),
                                         QStringLiteral("date"));
    const QCommandLineOption countOption(QStringLiteral("count"),
                                         QObject::tr("Number of occurrences to preview."),
                                         QStringLiteral("n"));
    const QCommandLineOption fromOption(QStringLiteral("from"),
                                        QObject::tr("Print only the next occurrence after this instant."),
                                        QStringLiteral("datetime"));
    const QCommandLineOption jsonOutputOption(QStringLiteral("print-json"),
                                              QObject::tr("Also print the rule in stored JSON form."));
    parser.addOptions({anchorOption, textOption, jsonOption, untilOption, countOption, fromOption, jsonOutputOption});
    parser.process(app);

    if (!parser.isSet(anchorOption)) {
        return fail(QObject::tr("Missing --anchor"));
    }
    const std::optional<QDateTime> anchorDateTime = parseWallClock(parser.value(anchorOption));
    if (!anchorDateTime) {
        return fail(QObject::tr("Invalid anchor \"%1\"").arg(parser.value(anchorOption)));
    }
    const recurrence::Anchor anchor = recurrence::Anchor::fromDateTime(*anchorDateTime);

    std::optional<recurrence::RecurrenceRule> rule = readRule(parser, textOption, jsonOption);
    if (!rule) {
        return fail(QObject::tr("Unrecognised recurrence rule"));
    }
    if (parser.isSet(untilOption)) {
        const QDate until = QDate::fromString(parser.value(untilOption), Qt::ISODate);
        if (!until.isValid()) {
            return fail(QObject::tr("Invalid end date \"%1\"").arg(parser.value(untilOption)));
        }
        rule = rule->withEndDate(until);
    }
    qCDebug(ANCHOR_RECURRENCE_LOG) << "Rule:" << data::RecurrenceRuleCodec::toJsonString(*rule);

    QTextStream out(stdout);
    out << recurrence::formatRecurrence(*rule) << '\n';
    if (parser.isSet(jsonOutputOption)) {
        out << data::RecurrenceRuleCodec::toJsonString(*rule) << '\n';
    }

    if (parser.isSet(fromOption)) {
        const std::optional<QDateTime> reference = parseWallClock(parser.value(fromOption));
        if (!reference) {
            return fail(QObject::tr("Invalid reference \"%1\"").arg(parser.value(fromOption)));
        }
        const std::optional<QDateTime> next = recurrence::nextOccurrence(anchor, *rule, *reference);
        if (!next) {
            out << QObject::tr("No further occurrences") << '\n';
            return 0;
        }
        out << formatWallClock(*next) << '\n';
        return 0;
    }

    QSettings settings;
    int count = core::ReminderScheduler::previewCount(settings.value(QLatin1String(PREVIEW_COUNT_KEY)));
    if (parser.isSet(countOption)) {
        bool ok = false;
        count = parser.value(countOption).toInt(&ok);
        if (!ok || count < 1) {
            return fail(QObject::tr("Invalid count \"%1\"").arg(parser.value(countOption)));
        }
    }
    qCDebug(ANCHOR_RECURRENCE_LOG) << "Previewing" << count << "occurrences";

    for (const QDateTime &occurrence : recurrence::generateOccurrences(anchor, *rule, count)) {
        out << formatWallClock(occurrence) << '\n';
    }
    return 0;
}
