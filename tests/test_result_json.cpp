#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>

#include <QJsonArray>
#include <QJsonObject>

#include "domain/period/PuzzlePeriod.hpp"
#include "infra/ResultJson.hpp"

using namespace puzzlelog::domain;
using namespace puzzlelog::infra;

int main() {
    // Parsed results: unset optionals are left out, warnings become an array
    {
        ParsedResult r;
        r.gameName     = "Colorfle";
        r.scores       = ScoreMap{{kMainPuzzle, {{"attempts", std::int64_t{3}}, {"accuracy", 92.5}}}};
        r.completed    = true;
        r.puzzleNumber = "1021";
        r.maxAttempts  = 6;
        r.percentage   = 92.5;
        r.parseWarnings.push_back("odd token");

        const QJsonObject o = parsedResultToJson(r);
        assert(o.value("game").toString() == "Colorfle");
        assert(o.value("puzzle_number").toString() == "1021");
        assert(o.value("max_attempts").toInt() == 6);
        assert(o.value("percentage").toDouble() == 92.5);
        assert(!o.value("failed").toBool());
        assert(!o.contains("grid"));
        assert(!o.contains("time_ms"));
        assert(o.value("warnings").toArray().size() == 1);

        const QJsonObject puzzle = o.value("scores").toObject().value("puzzle1").toObject();
        assert(puzzle.value("attempts").toInt() == 3);
        assert(puzzle.value("accuracy").toDouble() == 92.5);
    }

    // Scores keep integers, fractions and grades apart when read back
    {
        const ScoreMap scores{{kMainPuzzle, {{"attempts", std::int64_t{-1}},
                                             {"accuracy", 92.5},
                                             {"grade", std::string("B")}}}};
        const ScoreMap back = scoresFromJson(scoresToJson(scores));
        assert(std::get<std::int64_t>(back.at(kMainPuzzle).at("attempts")) == -1);
        assert(std::get<double>(back.at(kMainPuzzle).at("accuracy")) == 92.5);
        assert(std::get<std::string>(back.at(kMainPuzzle).at("grade")) == "B");
    }

    // Stored records
    {
        GameRecord r;
        r.recordId  = "5b8e1f0c-0000-4000-8000-000000000001";
        r.ownerId   = "alice";
        r.gameId    = "wordle";
        r.createdAt = *period::parseTimestamp("2025-01-15T12:00:00.250Z");
        r.updatedAt = r.createdAt;
        r.scores    = ScoreMap{{kMainPuzzle, {{"attempts", std::int64_t{4}}}}};
        r.failed    = false;
        r.metadata.streaks      = StreakState{3, 2, 5};
        r.metadata.shareText    = "Wordle 1,643 4/6";
        r.metadata.puzzleNumber = "1,643";
        r.metadata.notes        = "close one";

        const QJsonObject o = recordToJson(r);
        assert(o.value("created_at").toString() == "2025-01-15T12:00:00.250Z");
        assert(o.value("metadata").toObject().value("max_winstreak").toInt() == 5);
        assert(!o.value("metadata").toObject().contains("grid"));

        const GameRecord back = recordFromJson(toCompactJson(o));
        assert(back.recordId == r.recordId);
        assert(back.ownerId == "alice" && back.gameId == "wordle");
        assert(back.createdAt == r.createdAt);
        assert((back.metadata.streaks == StreakState{3, 2, 5}));
        assert(back.metadata.puzzleNumber == std::string("1,643"));
        assert(back.metadata.notes == std::string("close one"));
        assert(!back.metadata.grid);
        assert(back.scores && std::get<std::int64_t>(back.scores->at(kMainPuzzle).at("attempts")) == 4);
    }

    // Unknown keys are ignored and optional ones may be missing
    {
        const GameRecord partial = recordFromJson(
            R"({"game_id": "nerdle", "created_at": "2025-01-15T12:00:00Z", "failed": true, "extra": 1})");
        assert(partial.gameId == "nerdle");
        assert(partial.failed);
        assert(!partial.scores);
        assert(partial.createdAt == *period::parseTimestamp("2025-01-15T12:00:00Z"));
        assert(partial.updatedAt == partial.createdAt);
        assert((partial.metadata.streaks == StreakState{0, 0, 0}));
    }

    // A record without a usable creation time is rejected, never dated "now"
    {
        for (const char* json : {"not json", "[1, 2]", R"({"game_id": "nerdle"})",
                                 R"({"game_id": "nerdle", "created_at": "yesterday"})",
                                 R"({"game_id": "nerdle", "created_at": 1736942400000})"}) {
            bool threw = false;
            try {
                (void)recordFromJson(QString::fromUtf8(json));
            } catch (const std::invalid_argument&) {
                threw = true;
            }
            assert(threw);
        }
    }

    // Numbers beyond int64 stay doubles
    {
        const QJsonObject big{{"puzzle1", QJsonObject{{"points", 1e20},
                                                      {"low", -1e19},
                                                      {"edge", 9223372036854775808.0}}}};
        const ScoreMap back = scoresFromJson(big);
        assert(std::get<double>(back.at(kMainPuzzle).at("points")) == 1e20);
        assert(std::get<double>(back.at(kMainPuzzle).at("low")) == -1e19);
        assert(std::holds_alternative<double>(back.at(kMainPuzzle).at("edge")));

        const QJsonObject small{{"puzzle1", QJsonObject{{"points", 4096.0}}}};
        assert(std::get<std::int64_t>(scoresFromJson(small).at(kMainPuzzle).at("points")) == 4096);
    }

    // Auto-fill output
    {
        sharetext::AutoFill fill;
        fill.ok        = true;
        fill.completed = true;
        fill.failed    = true;
        fill.shareText = "Wordle 1,643 X/6";
        const QJsonObject o = autoFillToJson(fill);
        assert(o.value("completed").toBool() && o.value("failed").toBool());
        assert(o.value("share_text").toString() == "Wordle 1,643 X/6");

        sharetext::AutoFill bad;
        bad.error = "Share text is empty";
        assert(autoFillToJson(bad).value("error").toString() == "Share text is empty");
        assert(toCompactJson(autoFillToJson(bad)) == R"({"error":"Share text is empty"})");
    }

    std::cout << "result json tests passed\n";
    return 0;
}
