#include <algorithm>
#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <QTimeZone>

#include "domain/period/PuzzlePeriod.hpp"
#include "domain/streak/StreakAccumulator.hpp"

using namespace puzzlelog::domain;
using namespace puzzlelog::domain::streak;

namespace {

const QTimeZone kUtc = QTimeZone::utc();

TimePoint at(const std::string& iso) {
    const auto tp = period::parseTimestamp(iso);
    assert(tp);
    return *tp;
}

Game utcGame() {
    Game g;
    g.id             = "wordle";
    g.displayName    = "Wordle";
    g.resetTime      = {0, 0};
    g.isAsynchronous = false;
    return g;
}

// Noon UTC on 2025-01-01 plus the given number of days.
TimePoint noonOnDay(int day) {
    return at("2025-01-01T12:00:00Z") + std::chrono::hours(24 * day);
}

PriorRecord record(const StreakState& s, bool failed, TimePoint createdAt) {
    PriorRecord p;
    p.streaks   = s;
    p.failed    = failed;
    p.createdAt = createdAt;
    return p;
}

struct Play {
    int  day;
    bool failed;
};

// Straight integer-day rendition of the recurrence, used to check the real one.
std::vector<StreakState> replay(const std::vector<Play>& plays) {
    std::vector<StreakState> out;
    for (std::size_t i = 0; i < plays.size(); ++i) {
        StreakState s;
        const bool won = !plays[i].failed;
        if (i == 0) {
            s.playstreak   = 1;
            s.winstreak    = won ? 1 : 0;
            s.maxWinstreak = s.winstreak;
        } else {
            const StreakState& p = out.back();
            const bool prevWon   = !plays[i - 1].failed;
            const int diff       = plays[i].day - plays[i - 1].day;
            s.playstreak         = diff == 1 ? p.playstreak + 1 : 1;
            if (diff == 1 && won && prevWon) {
                s.winstreak = p.winstreak + 1;
            } else {
                s.winstreak = won ? 1 : 0;
            }
            s.maxWinstreak = std::max(p.maxWinstreak, s.winstreak);
        }
        out.push_back(s);
    }
    return out;
}

} // namespace

int main() {
    const Game g = utcGame();

    // First record for a key
    {
        assert((accumulate(false, noonOnDay(0), std::nullopt, g, kUtc) == StreakState{1, 1, 1}));
        assert((accumulate(true, noonOnDay(0), std::nullopt, g, kUtc) == StreakState{1, 0, 0}));
    }

    // Consecutive wins extend, a loss resets the win streak and keeps the max
    {
        StreakState s = accumulate(false, noonOnDay(0), std::nullopt, g, kUtc);
        s = accumulate(false, noonOnDay(1), record(s, false, noonOnDay(0)), g, kUtc);
        assert((s == StreakState{2, 2, 2}));
        s = accumulate(false, noonOnDay(2), record(s, false, noonOnDay(1)), g, kUtc);
        assert((s == StreakState{3, 3, 3}));

        const StreakState lost = accumulate(true, noonOnDay(3), record(s, false, noonOnDay(2)), g, kUtc);
        assert((lost == StreakState{4, 0, 3}));

        const StreakState again = accumulate(false, noonOnDay(4), record(lost, true, noonOnDay(3)), g, kUtc);
        assert((again == StreakState{5, 1, 3}));
    }

    // A gap restarts the play streak whatever the outcome
    {
        const StreakState prior{7, 5, 9};
        const StreakState won = accumulate(false, noonOnDay(3), record(prior, false, noonOnDay(0)), g, kUtc);
        assert((won == StreakState{1, 1, 9}));
        const StreakState lost = accumulate(true, noonOnDay(3), record(prior, false, noonOnDay(0)), g, kUtc);
        assert((lost == StreakState{1, 0, 9}));
    }

    // Days are puzzle days, not 24-hour spans
    {
        const StreakState prior{2, 2, 2};
        const auto late  = at("2025-01-01T23:59:00Z");
        const auto early = at("2025-01-02T00:01:00Z");
        assert((accumulate(false, early, record(prior, false, late), g, kUtc) == StreakState{3, 3, 3}));

        // 47 hours apart but still consecutive puzzle days
        const auto first  = at("2025-01-01T00:00:00Z");
        const auto second = at("2025-01-02T23:00:00Z");
        assert((accumulate(false, second, record(prior, false, first), g, kUtc) == StreakState{3, 3, 3}));
    }

    // Same-day resubmission restarts at 1 and never lowers the max
    {
        const StreakState prior{4, 4, 4};
        const StreakState s = accumulate(false, noonOnDay(0), record(prior, false, noonOnDay(0)), g, kUtc);
        assert((s == StreakState{1, 1, 4}));
    }

    // Asynchronous games read the day in the caller's zone
    {
        Game a           = g;
        a.isAsynchronous = true;
        const QTimeZone minus5(-5 * 3600);
        const StreakState prior{1, 1, 1};
        // 18:00 and 23:00 on the 1st at UTC-5, but different UTC days
        const auto first  = at("2025-01-01T23:00:00Z");
        const auto second = at("2025-01-02T04:00:00Z");
        assert((accumulate(false, second, record(prior, false, first), a, minus5) == StreakState{1, 1, 1}));
        assert((accumulate(false, second, record(prior, false, first), g, minus5) == StreakState{2, 2, 2}));
        // Next local evening is the next puzzle day
        const auto next = at("2025-01-03T01:00:00Z");
        assert((accumulate(false, next, record(prior, false, first), a, minus5) == StreakState{2, 2, 2}));
    }

    // Long history matches the recurrence step by step
    {
        const std::vector<Play> plays = {
            {0, false}, {1, false}, {2, true},  {3, false}, {4, false}, {5, false}, {6, false},
            {9, false}, {10, true}, {11, true}, {12, false}, {12, false}, {13, false}, {14, false},
            {15, false}, {16, false}, {17, false}, {20, true}, {21, false}, {22, false},
        };
        const auto expected = replay(plays);

        std::optional<PriorRecord> prior;
        int lastMax = 0;
        for (std::size_t i = 0; i < plays.size(); ++i) {
            const TimePoint ts    = noonOnDay(plays[i].day);
            const StreakState got = accumulate(plays[i].failed, ts, prior, g, kUtc);
            if (got != expected[i]) {
                std::cerr << "step " << i << ": got " << got.playstreak << "/" << got.winstreak << "/"
                          << got.maxWinstreak << "\n";
            }
            assert(got == expected[i]);
            assert(got.winstreak <= got.maxWinstreak);
            assert(got.maxWinstreak >= lastMax);
            assert(got.playstreak >= 1);
            lastMax = got.maxWinstreak;
            prior   = record(got, plays[i].failed, ts);
        }
        assert(lastMax == 6);
    }

    // priorFrom lifts the fields it needs out of a stored record
    {
        GameRecord r;
        r.failed           = true;
        r.createdAt        = noonOnDay(5);
        r.metadata.streaks = StreakState{3, 0, 2};
        const PriorRecord p = priorFrom(r);
        assert(p.failed);
        assert(p.createdAt == noonOnDay(5));
        assert((p.streaks == StreakState{3, 0, 2}));
    }

    // Summary view
    {
        period::PeriodContext ctx;
        ctx.now       = noonOnDay(10);
        ctx.localZone = kUtc;

        const StreakSummary none = summarize(std::nullopt, g, ctx);
        assert((none.streaks == StreakState{0, 0, 0}));
        assert(!none.streakAtRisk && !none.lastPlayedDay);

        const StreakState s{4, 3, 5};
        const StreakSummary today = summarize(record(s, false, noonOnDay(10)), g, ctx);
        assert(today.streaks == s && !today.streakAtRisk);
        assert(today.lastPlayedDay == QDate(2025, 1, 11));

        const StreakSummary risk = summarize(record(s, false, noonOnDay(9)), g, ctx);
        assert(risk.streaks == s && risk.streakAtRisk);

        const StreakSummary broken = summarize(record(s, false, noonOnDay(7)), g, ctx);
        assert((broken.streaks == StreakState{0, 0, 5}));
        assert(!broken.streakAtRisk);
        assert(broken.lastPlayedDay == QDate(2025, 1, 8));
    }

    std::cout << "streak accumulator tests passed\n";
    return 0;
}
