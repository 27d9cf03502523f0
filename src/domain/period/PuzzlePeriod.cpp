#include "domain/period/PuzzlePeriod.hpp"

#include <QDateTime>
#include <QRegularExpression>
#include <QString>
#include <QTime>

#include <stdexcept>

namespace puzzlelog::domain::period {

namespace {

QTime resetClock(const Game& game) {
    return QTime(game.resetTime.hour, game.resetTime.minute);
}

QDateTime inFrame(TimePoint tp, const QTimeZone& frame) {
    return QDateTime::fromMSecsSinceEpoch(toUnixMs(tp), frame);
}

// Today's reset, as a wall-clock instant in the game's frame.
QDateTime todaysReset(const Game& game, const PeriodContext& ctx) {
    const QTimeZone frame = frameFor(game, ctx.localZone);
    const QDateTime now = inFrame(ctx.now, frame);
    return QDateTime(now.date(), resetClock(game), frame);
}

bool isBareDate(const QString& s) {
    static const QRegularExpression re(QStringLiteral("^\\d{4}-\\d{2}-\\d{2}$"));
    return re.match(s).hasMatch();
}

} // namespace

qint64 toUnixMs(TimePoint tp) {
    return static_cast<qint64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count());
}

TimePoint fromUnixMs(qint64 ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

ResetTime parseResetTime(const std::string& hhmm) {
    static const QRegularExpression re(QStringLiteral("^\\s*(\\d{1,2}):(\\d{2})\\s*$"));
    const auto m = re.match(QString::fromStdString(hhmm));
    if (!m.hasMatch()) {
        throw std::invalid_argument("Invalid reset time '" + hhmm + "', expected HH:MM");
    }

    ResetTime t;
    t.hour   = m.captured(1).toInt();
    t.minute = m.captured(2).toInt();
    if (t.hour > 23 || t.minute > 59) {
        throw std::invalid_argument("Reset time out of range: '" + hhmm + "'");
    }
    return t;
}

std::string formatResetTime(const ResetTime& t) {
    return QTime(t.hour, t.minute).toString(QStringLiteral("HH:mm")).toStdString();
}

QTimeZone frameFor(const Game& game, const QTimeZone& localZone) {
    return game.isAsynchronous ? localZone : QTimeZone::utc();
}

QDate puzzleDay(TimePoint ts, const Game& game, const QTimeZone& localZone) {
    const QDateTime dt = inFrame(ts, frameFor(game, localZone));
    if (dt.time() < resetClock(game)) {
        return dt.date().addDays(-1);
    }
    return dt.date();
}

bool isCurrentPuzzle(const std::string& recordTimestamp, const Game& game,
                     const PeriodContext& ctx) {
    const QString raw = QString::fromStdString(recordTimestamp).trimmed();

    if (isBareDate(raw)) {
        const QDate day = QDate::fromString(raw, QStringLiteral("yyyy-MM-dd"));
        if (!day.isValid()) {
            throw std::invalid_argument("Invalid record date '" + recordTimestamp + "'");
        }
        return day == inFrame(ctx.now, QTimeZone::utc()).date();
    }

    const auto ts = parseTimestamp(recordTimestamp);
    if (!ts) {
        throw std::invalid_argument("Invalid record timestamp '" + recordTimestamp + "'");
    }
    return isCurrentPuzzle(*ts, game, ctx);
}

bool isCurrentPuzzle(TimePoint recordTs, const Game& game, const PeriodContext& ctx) {
    return puzzleDay(recordTs, game, ctx.localZone) == puzzleDay(ctx.now, game, ctx.localZone);
}

TimePoint lastResetInstant(const Game& game, const PeriodContext& ctx) {
    QDateTime reset = todaysReset(game, ctx);
    if (toUnixMs(ctx.now) < reset.toMSecsSinceEpoch()) {
        reset = reset.addDays(-1);
    }
    return fromUnixMs(reset.toMSecsSinceEpoch());
}

TimePoint nextResetInstant(const Game& game, const PeriodContext& ctx) {
    QDateTime reset = todaysReset(game, ctx);
    if (reset.toMSecsSinceEpoch() <= toUnixMs(ctx.now)) {
        reset = reset.addDays(1);
    }
    return fromUnixMs(reset.toMSecsSinceEpoch());
}

TimeUntilReset timeUntilReset(const Game& game, const PeriodContext& ctx) {
    const qint64 diffMs = toUnixMs(nextResetInstant(game, ctx)) - toUnixMs(ctx.now);
    const qint64 totalMinutes = diffMs / 60000;

    TimeUntilReset out;
    out.hours   = static_cast<int>(totalMinutes / 60);
    out.minutes = static_cast<int>(totalMinutes % 60);
    return out;
}

std::string formatTimeUntilReset(const Game& game, const PeriodContext& ctx) {
    const auto t = timeUntilReset(game, ctx);
    return QStringLiteral("%1:%2")
        .arg(t.hours)
        .arg(t.minutes, 2, 10, QLatin1Char('0'))
        .toStdString();
}

int daysBetween(const QDate& from, const QDate& to) {
    return static_cast<int>(from.daysTo(to));
}

std::string formatPuzzleDay(const QDate& day) {
    return day.toString(QStringLiteral("yyyy-MM-dd")).toStdString();
}

std::optional<TimePoint> parseTimestamp(const std::string& iso) {
    const QDateTime dt =
        QDateTime::fromString(QString::fromStdString(iso).trimmed(), Qt::ISODateWithMs);
    if (!dt.isValid()) {
        return std::nullopt;
    }
    return fromUnixMs(dt.toMSecsSinceEpoch());
}

std::string formatTimestamp(TimePoint tp) {
    return inFrame(tp, QTimeZone::utc()).toString(Qt::ISODateWithMs).toStdString();
}

} // namespace puzzlelog::domain::period
