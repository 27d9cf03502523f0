#pragma once

#include <QDate>
#include <QTimeZone>

#include <optional>

#include "domain/domain_model.hpp"
#include "domain/period/PuzzlePeriod.hpp"

namespace puzzlelog::domain::streak {

// The one prior record a new attempt is compared against: the most recent
// record of the same (owner, game).
struct PriorRecord {
    StreakState streaks;
    bool        failed{false};
    TimePoint   createdAt;
};

PriorRecord priorFrom(const GameRecord& record);

// Streak fields for a new record. Consecutive puzzle days extend the play
// streak; anything else (a gap, or a same/earlier day) restarts it at 1.
StreakState accumulate(bool failed,
                       TimePoint createdAt,
                       const std::optional<PriorRecord>& prior,
                       const Game& game,
                       const QTimeZone& localZone = QTimeZone::systemTimeZone());

// Presentation view of the latest stored record. Never written back.
struct StreakSummary {
    StreakState          streaks;
    bool                 streakAtRisk{false}; // last played yesterday, not yet today
    std::optional<QDate> lastPlayedDay;
};

StreakSummary summarize(const std::optional<PriorRecord>& latest,
                        const Game& game,
                        const period::PeriodContext& ctx = {});

} // namespace puzzlelog::domain::streak
