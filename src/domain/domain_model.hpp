#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace puzzlelog::domain {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using GameId    = std::string;
using OwnerId   = std::string;

// --- Game -------------------------------------------------------------------

struct ResetTime {
    int hour{0};
    int minute{0};
};

// Per sub-puzzle ("puzzle1", "classic", ...) map of score field -> max value.
// A max of -1 means the field has no upper bound.
using ScoreTypes = std::map<std::string, std::map<std::string, int>>;

struct Game {
    GameId      id;
    std::string displayName;

    ResetTime resetTime;
    // true: reset evaluated in the user's local zone; false: one UTC instant.
    bool isAsynchronous{false};
    bool isFailable{true};

    std::string url;
    ScoreTypes  scoreTypes;
};

// --- Scores -----------------------------------------------------------------

// Numbers are the norm. Strings are only expected for letter grades.
using ScoreValue = std::variant<std::int64_t, double, std::string>;
using ScoreFields = std::map<std::string, ScoreValue>;
using ScoreMap    = std::map<std::string, ScoreFields>;

inline constexpr const char* kMainPuzzle = "puzzle1";

inline bool isNumeric(const ScoreValue& v) {
    return !std::holds_alternative<std::string>(v);
}

inline std::optional<double> numericValue(const ScoreValue& v) {
    if (const auto* i = std::get_if<std::int64_t>(&v)) return static_cast<double>(*i);
    if (const auto* d = std::get_if<double>(&v)) return *d;
    return std::nullopt;
}

// --- Parsed share text ------------------------------------------------------

struct ParsedResult {
    std::optional<std::string> gameName;

    std::optional<ScoreMap> scores;
    bool failed{false};
    bool completed{false};

    std::optional<std::string> puzzleNumber;
    std::optional<std::string> grid; // verbatim marker lines, display only

    // Derived metrics; presence depends on the grammar.
    std::optional<int>         maxAttempts;
    std::optional<double>      percentage;
    std::optional<int>         guessCount;
    std::optional<std::int64_t> timeMs;
    std::optional<int>         uniqueness;
    std::optional<int>         maxUniqueness;
    std::optional<int>         maxGuessNumber;
    std::optional<std::string> grade;

    std::vector<std::string> parseWarnings;
};

// --- Streaks & records ------------------------------------------------------

struct StreakState {
    int playstreak{0};
    int winstreak{0};
    int maxWinstreak{0};
};

inline bool operator==(const StreakState& a, const StreakState& b) {
    return a.playstreak == b.playstreak &&
           a.winstreak == b.winstreak &&
           a.maxWinstreak == b.maxWinstreak;
}

inline bool operator!=(const StreakState& a, const StreakState& b) {
    return !(a == b);
}

struct RecordMetadata {
    StreakState streaks;

    std::string                shareText;
    std::optional<std::string> puzzleNumber;
    std::optional<std::string> grid;
    std::optional<std::string> notes;
};

struct GameRecord {
    std::string recordId;
    OwnerId     ownerId;
    GameId      gameId;

    // Full instant, not a date: the puzzle day is reset-time relative.
    TimePoint createdAt{Clock::now()};
    TimePoint updatedAt{Clock::now()};

    std::optional<ScoreMap> scores;
    bool                    failed{false};

    RecordMetadata metadata;
};

// --- Helpers ----------------------------------------------------------------

inline std::string to_string(const ScoreValue& v) {
    if (const auto* i = std::get_if<std::int64_t>(&v)) return std::to_string(*i);
    if (const auto* s = std::get_if<std::string>(&v)) return *s;

    std::string out = std::to_string(std::get<double>(v));
    // std::to_string pads doubles to six decimals.
    while (!out.empty() && out.back() == '0') out.pop_back();
    if (!out.empty() && out.back() == '.') out.pop_back();
    return out;
}

inline std::string to_string(const StreakState& s) {
    return "play " + std::to_string(s.playstreak) +
           ", win " + std::to_string(s.winstreak) +
           ", max win " + std::to_string(s.maxWinstreak);
}

} // namespace puzzlelog::domain
