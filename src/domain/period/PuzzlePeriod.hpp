#pragma once

#include <QDate>
#include <QTimeZone>

#include <optional>
#include <string>

#include "domain/domain_model.hpp"

namespace puzzlelog::domain::period {

// "Now" and the user's zone, injectable so callers and tests can pin them.
struct PeriodContext {
    TimePoint now{Clock::now()};
    QTimeZone localZone{QTimeZone::systemTimeZone()};
};

struct TimeUntilReset {
    int hours{0};
    int minutes{0};
};

// Parses a 24-hour "HH:MM" reset time.
// Throws std::invalid_argument: a bad reset time is a caller bug and would
// silently corrupt streaks if defaulted.
ResetTime parseResetTime(const std::string& hhmm);
std::string formatResetTime(const ResetTime& t);

// UTC for synchronous games, the local zone for asynchronous ones.
QTimeZone frameFor(const Game& game, const QTimeZone& localZone);

// The calendar day (in the game's frame) a timestamp belongs to. Before the
// reset time it is still the previous day's puzzle.
QDate puzzleDay(TimePoint ts, const Game& game, const QTimeZone& localZone);

// Record timestamps arrive as ISO-8601 strings. A bare "yyyy-MM-dd" is a
// legacy value and is compared to today's UTC date without reset math.
// Throws std::invalid_argument if the timestamp cannot be parsed.
bool isCurrentPuzzle(const std::string& recordTimestamp, const Game& game,
                     const PeriodContext& ctx = {});
bool isCurrentPuzzle(TimePoint recordTs, const Game& game, const PeriodContext& ctx = {});

TimePoint lastResetInstant(const Game& game, const PeriodContext& ctx = {});
TimePoint nextResetInstant(const Game& game, const PeriodContext& ctx = {});

TimeUntilReset timeUntilReset(const Game& game, const PeriodContext& ctx = {});
// "H:MM", e.g. "5:07".
std::string formatTimeUntilReset(const Game& game, const PeriodContext& ctx = {});

// Whole calendar days from `from` to `to` (negative if `to` is earlier).
int daysBetween(const QDate& from, const QDate& to);

std::string formatPuzzleDay(const QDate& day);

// ISO-8601 with milliseconds; output is always UTC ("...Z").
std::optional<TimePoint> parseTimestamp(const std::string& iso);
std::string formatTimestamp(TimePoint tp);

qint64 toUnixMs(TimePoint tp);
TimePoint fromUnixMs(qint64 ms);

} // namespace puzzlelog::domain::period
