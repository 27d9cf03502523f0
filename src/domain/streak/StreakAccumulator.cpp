#include "domain/streak/StreakAccumulator.hpp"

#include <algorithm>

namespace puzzlelog::domain::streak {

PriorRecord priorFrom(const GameRecord& record) {
    PriorRecord p;
    p.streaks   = record.metadata.streaks;
    p.failed    = record.failed;
    p.createdAt = record.createdAt;
    return p;
}

StreakState accumulate(bool failed,
                       TimePoint createdAt,
                       const std::optional<PriorRecord>& prior,
                       const Game& game,
                       const QTimeZone& localZone) {
    StreakState s;
    s.playstreak   = 1;
    s.winstreak    = failed ? 0 : 1;
    s.maxWinstreak = s.winstreak;

    if (!prior) {
        return s;
    }

    const QDate prevDay = period::puzzleDay(prior->createdAt, game, localZone);
    const QDate curDay  = period::puzzleDay(createdAt, game, localZone);
    const int daysDiff  = period::daysBetween(prevDay, curDay);

    if (daysDiff == 1) {
        s.playstreak = prior->streaks.playstreak + 1;
        if (failed) {
            s.winstreak = 0;
        } else if (prior->failed) {
            s.winstreak = 1;
        } else {
            s.winstreak = prior->streaks.winstreak + 1;
        }
    }

    s.maxWinstreak = std::max(prior->streaks.maxWinstreak, s.winstreak);
    return s;
}

StreakSummary summarize(const std::optional<PriorRecord>& latest,
                        const Game& game,
                        const period::PeriodContext& ctx) {
    StreakSummary out;
    if (!latest) {
        return out;
    }

    out.streaks = latest->streaks;

    const QDate lastDay   = period::puzzleDay(latest->createdAt, game, ctx.localZone);
    const QDate yesterday = period::puzzleDay(ctx.now, game, ctx.localZone).addDays(-1);
    out.lastPlayedDay     = lastDay;

    if (lastDay == yesterday) {
        out.streakAtRisk = true;
    } else if (lastDay < yesterday) {
        // Broken: a whole puzzle day went by without a record.
        out.streaks.playstreak = 0;
        out.streaks.winstreak  = 0;
    }
    return out;
}

} // namespace puzzlelog::domain::streak
