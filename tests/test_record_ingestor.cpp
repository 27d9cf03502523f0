#include <atomic>
#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <variant>
#include <vector>

#include <QTimeZone>

#include "app/IGameCatalog.hpp"
#include "app/IRecordRepository.hpp"
#include "app/RecordIngestor.hpp"
#include "domain/period/PuzzlePeriod.hpp"
#include "domain/sharetext/ShareTextParser.hpp"

using namespace puzzlelog;
using namespace puzzlelog::domain;

namespace {

Game makeGame(const std::string& id, const std::string& name) {
    Game g;
    g.id             = id;
    g.displayName    = name;
    g.resetTime      = {0, 0};
    g.isAsynchronous = false;
    g.isFailable     = true;
    return g;
}

class FakeCatalog : public app::IGameCatalog {
public:
    std::vector<Game> load() const override {
        Game loldle       = makeGame("loldle", "LoLdle");
        loldle.isFailable = false;
        loldle.scoreTypes = {{"classic", {{"attempts", -1}}}, {"quote", {{"attempts", -1}}},
                             {"ability", {{"attempts", -1}}}, {"emoji", {{"attempts", -1}}},
                             {"splash", {{"attempts", -1}}}};
        return {makeGame("wordle", "Wordle"), makeGame("connections", "Connections"),
                makeGame("mystery", "Mystery Game"), loldle};
    }
    void save(const std::vector<Game>&) const override {}
};

class MemoryRecords : public app::IRecordRepository {
public:
    std::optional<GameRecord> latestRecord(const OwnerId& owner, const GameId& game) const override {
        std::lock_guard<std::mutex> guard(mutex_);
        std::optional<GameRecord> latest;
        for (const auto& r : records_) {
            if (r.ownerId == owner && r.gameId == game && (!latest || r.createdAt >= latest->createdAt)) {
                latest = r;
            }
        }
        return latest;
    }

    void append(const GameRecord& record) override {
        if (failNext) {
            failNext = false;
            throw std::runtime_error("disk full");
        }
        std::lock_guard<std::mutex> guard(mutex_);
        // Widen the read/append window so unsynchronised callers would race.
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        records_.push_back(record);
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> guard(mutex_);
        return records_.size();
    }

    bool failNext{false};

private:
    mutable std::mutex      mutex_;
    std::vector<GameRecord> records_;
};

TimePoint at(const std::string& iso) {
    const auto tp = period::parseTimestamp(iso);
    assert(tp);
    return *tp;
}

struct FakeClock {
    TimePoint now;
};

app::RecordIngestor makeIngestor(const FakeCatalog& catalog, MemoryRecords& records,
                                 const std::shared_ptr<FakeClock>& clock) {
    sharetext::ShareTextParser parser(
        std::make_shared<const sharetext::GrammarRegistry>(sharetext::GrammarRegistry::withDefaultGrammars()),
        [clock] { return clock->now; }, QTimeZone::utc());
    return app::RecordIngestor(catalog, records, std::move(parser), [clock] {
        period::PeriodContext ctx;
        ctx.now       = clock->now;
        ctx.localZone = QTimeZone::utc();
        return ctx;
    });
}

app::IngestRequest request(const std::string& owner, const std::string& game, const std::string& text) {
    app::IngestRequest r;
    r.ownerId   = owner;
    r.gameId    = game;
    r.shareText = text;
    return r;
}

const std::string kWordleWin  = "Wordle 1,643 4/6\n\n⬛🟨⬛⬛⬛\n⬛⬛🟩🟨⬛\n🟩🟩🟩⬛⬛\n🟩🟩🟩🟩🟩";
const std::string kWordleLoss = "Wordle 1,644 X/6\n⬛⬛⬛⬛⬛";

} // namespace

int main() {
    const FakeCatalog catalog;

    // Unknown game and mismatched share text are rejected without writing
    {
        MemoryRecords records;
        auto clock = std::make_shared<FakeClock>(FakeClock{at("2025-01-15T12:00:00Z")});
        auto ingestor = makeIngestor(catalog, records, clock);

        const auto unknown = ingestor.ingest(request("alice", "tetris", kWordleWin));
        assert(!unknown.ok);
        assert(unknown.error == "Unknown game 'tetris'");

        const auto mismatch = ingestor.ingest(request("alice", "connections", kWordleWin));
        assert(!mismatch.ok);
        assert(!mismatch.error.empty());

        const auto empty = ingestor.ingest(request("alice", "wordle", "   "));
        assert(!empty.ok);
        assert(records.size() == 0);
    }

    // Display names resolve too, and without validation any grammar may claim the text
    {
        MemoryRecords records;
        auto clock = std::make_shared<FakeClock>(FakeClock{at("2025-01-15T12:00:00Z")});
        auto ingestor = makeIngestor(catalog, records, clock);

        assert(ingestor.ingest(request("alice", "WORDLE", kWordleWin)).ok);

        auto loose         = request("bob", "connections", kWordleWin);
        loose.validateGame = false;
        const auto r       = ingestor.ingest(loose);
        assert(r.ok);
        assert(r.record.gameId == "connections");
    }

    // A game with no grammar goes through detection and the generic fallback
    {
        MemoryRecords records;
        auto clock = std::make_shared<FakeClock>(FakeClock{at("2025-01-15T12:00:00Z")});
        auto ingestor = makeIngestor(catalog, records, clock);

        const auto r = ingestor.ingest(request("alice", "Mystery Game", "Mystery Game 12 3/5\n🟨⬛🟨\n🟩🟩🟩"));
        assert(r.ok);
        assert(r.record.gameId == "mystery");
        assert(!r.record.failed);
    }

    // First record, then the next puzzle day extends it
    {
        MemoryRecords records;
        auto clock = std::make_shared<FakeClock>(FakeClock{at("2025-01-15T12:00:00Z")});
        auto ingestor = makeIngestor(catalog, records, clock);

        auto first  = request("alice", "wordle", "  " + kWordleWin + "\n\n");
        first.notes = std::string("lucky second guess");
        const auto a = ingestor.ingest(first);
        assert(a.ok);
        assert(!a.record.recordId.empty());
        assert(a.record.ownerId == "alice");
        assert(a.record.createdAt == clock->now);
        assert(!a.record.failed);
        assert((a.record.metadata.streaks == StreakState{1, 1, 1}));
        assert(a.record.metadata.shareText == kWordleWin);
        assert(a.record.metadata.puzzleNumber == std::string("1,643"));
        assert(a.record.metadata.notes == std::string("lucky second guess"));
        assert(a.record.metadata.grid);
        assert(a.record.scores && a.record.scores->count(kMainPuzzle));
        assert(a.warnings.empty());

        clock->now = at("2025-01-16T08:00:00Z");
        const auto b = ingestor.ingest(request("alice", "wordle", kWordleWin));
        assert(b.ok);
        assert((b.record.metadata.streaks == StreakState{2, 2, 2}));
        assert(b.record.recordId != a.record.recordId);

        clock->now = at("2025-01-17T08:00:00Z");
        const auto c = ingestor.ingest(request("alice", "wordle", kWordleLoss));
        assert(c.ok && c.record.failed);
        assert((c.record.metadata.streaks == StreakState{3, 0, 2}));

        // Another owner's history is independent
        const auto other = ingestor.ingest(request("bob", "wordle", kWordleWin));
        assert(other.ok);
        assert((other.record.metadata.streaks == StreakState{1, 1, 1}));

        // Three days later the play streak restarts
        clock->now = at("2025-01-20T08:00:00Z");
        const auto d = ingestor.ingest(request("alice", "wordle", kWordleWin));
        assert(d.ok);
        assert((d.record.metadata.streaks == StreakState{1, 1, 2}));
        assert(records.size() == 5);
    }

    // One record per owner, game and puzzle day
    {
        MemoryRecords records;
        auto clock = std::make_shared<FakeClock>(FakeClock{at("2025-01-15T00:30:00Z")});
        auto ingestor = makeIngestor(catalog, records, clock);

        assert(ingestor.ingest(request("alice", "wordle", kWordleWin)).ok);
        clock->now = at("2025-01-15T23:59:00Z");
        const auto dup = ingestor.ingest(request("alice", "wordle", kWordleLoss));
        assert(!dup.ok);
        assert(dup.error == "A result for Wordle is already recorded for 2025-01-15");
        assert(records.size() == 1);
    }

    // Storage failures are reported, and the next attempt still works
    {
        MemoryRecords records;
        auto clock = std::make_shared<FakeClock>(FakeClock{at("2025-01-15T12:00:00Z")});
        auto ingestor = makeIngestor(catalog, records, clock);

        records.failNext = true;
        const auto failed = ingestor.ingest(request("alice", "wordle", kWordleWin));
        assert(!failed.ok);
        assert(failed.error == "Failed to store record: disk full");
        assert(records.size() == 0);

        const auto retry = ingestor.ingest(request("alice", "wordle", kWordleWin));
        assert(retry.ok);
        assert((retry.record.metadata.streaks == StreakState{1, 1, 1}));
    }

    // Warnings from the parser come back with the record
    {
        MemoryRecords records;
        auto clock = std::make_shared<FakeClock>(FakeClock{at("2025-01-15T12:00:00Z")});
        auto ingestor = makeIngestor(catalog, records, clock);

        const auto r = ingestor.ingest(request("alice", "wordle", "Wordle 1,643 X5/6\n🟩🟩🟩🟩🟩"));
        assert(r.ok);
        assert(r.warnings.size() == 1);
    }

    // Concurrent submissions for one key: exactly one wins the day
    {
        MemoryRecords records;
        auto clock = std::make_shared<FakeClock>(FakeClock{at("2025-01-15T12:00:00Z")});
        auto ingestor = makeIngestor(catalog, records, clock);

        std::atomic<int> accepted{0};
        std::vector<std::thread> workers;
        for (int i = 0; i < 8; ++i) {
            workers.emplace_back([&] {
                if (ingestor.ingest(request("alice", "wordle", kWordleWin)).ok) {
                    ++accepted;
                }
            });
        }
        for (int i = 0; i < 4; ++i) {
            workers.emplace_back([&, i] {
                const std::string owner = "owner" + std::to_string(i);
                const auto r = ingestor.ingest(request(owner, "wordle", kWordleWin));
                assert(r.ok);
            });
        }
        for (auto& w : workers) {
            w.join();
        }
        assert(accepted == 1);
        assert(records.size() == 5);
        assert(records.latestRecord("alice", "wordle"));
        assert(ingestor.lockedKeyCount() == 0);
    }

    // Multi-mode games store the daily summary as one record
    {
        MemoryRecords records;
        auto clock = std::make_shared<FakeClock>(FakeClock{at("2025-01-15T12:00:00Z")});
        auto ingestor = makeIngestor(catalog, records, clock);

        const auto r = ingestor.ingest(request("alice", "LoLdle",
                                               "I've completed all the modes of #LoLdle #1261 today:\n"
                                               "❓ Classic: 8\n"
                                               "💬 Quote: 5\n"
                                               "🔥 Ability: 1 🧠 ✓\n"
                                               "😀 Emoji: 4\n"
                                               "🎨 Splash: 1 ✓\n"
                                               "https://loldle.net"));
        assert(r.ok);
        assert(r.record.gameId == "loldle");
        assert(!r.record.failed);
        assert(r.record.scores && r.record.scores->size() == 5);
        assert(std::get<std::int64_t>(r.record.scores->at("classic").at("attempts")) == 8);
        assert(std::get<std::int64_t>(r.record.scores->at("splash").at("attempts")) == 1);
        assert(r.record.metadata.puzzleNumber == std::string("1261"));
        assert((r.record.metadata.streaks == StreakState{1, 1, 1}));
        assert(records.size() == 1);
        assert(ingestor.lockedKeyCount() == 0);
    }

    std::cout << "record ingestor tests passed\n";
    return 0;
}
