#pragma once

#include <map>
#include <optional>
#include <string>

#include "domain/domain_model.hpp"

namespace puzzlelog::domain::sharetext {

// Daily summaries of multi-mode games ("I've completed all the modes of
// #LoLdle #1261 today: ..."). Each returns nullopt when the summary header is
// missing. Mode names are the game's own spelling ("Classic", "Cover art").

struct LoLdleSummary {
    std::string                puzzleNumber;
    std::map<std::string, int> modes;  // mode -> attempts
    ScoreMap                   scores; // lower-case mode -> {attempts}
};

struct PokedleSummary {
    std::string                puzzleNumber;
    std::map<std::string, int> modes;
};

// Every Gamedle mode has its own puzzle number. A mode without a hit is
// recorded with -1 attempts.
struct GamedleSummary {
    std::map<std::string, std::string> puzzleNumbers;
    std::map<std::string, int>         modes;
};

std::optional<LoLdleSummary>  parseLoLdleSummary(const std::string& text);
std::optional<PokedleSummary> parsePokedleSummary(const std::string& text);
std::optional<GamedleSummary> parseGamedleSummary(const std::string& text);

// The summary of a multi-mode game as one result: a sub-puzzle per mode key
// of `game.scoreTypes` (matched to the summary's mode names ignoring case),
// each with {attempts}. Failed if any mode went unsolved. nullopt unless the
// game is LoLdle, Pokedle or Gamedle, the text is that game's summary, and at
// least one mode was found.
std::optional<ParsedResult> parseModeSummary(const std::string& text, const Game& game);

} // namespace puzzlelog::domain::sharetext
