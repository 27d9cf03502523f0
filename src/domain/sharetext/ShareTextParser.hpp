#pragma once

#include <QTimeZone>

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "domain/domain_model.hpp"
#include "domain/sharetext/Grammar.hpp"

namespace puzzlelog::domain::sharetext {

// Turns pasted share text into a ParsedResult.
//
// With an expected game only that game's grammar runs and a header mismatch
// is an error. Without one, the first grammar whose signature matches is used
// and unrecognised text goes through the generic fallback.
//
// The clock and zone only feed the default puzzle number (today's local
// date), so a fixed clock makes parsing fully deterministic.
class ShareTextParser {
public:
    using NowFn = std::function<TimePoint()>;

    ShareTextParser();
    explicit ShareTextParser(std::shared_ptr<const GrammarRegistry> registry,
                             NowFn now = [] { return Clock::now(); },
                             QTimeZone localZone = QTimeZone::systemTimeZone());

    ParseOutcome parse(const std::string& text,
                       const std::optional<std::string>& expectedGame = std::nullopt) const;

    // Multi-mode daily summary of `game`, normalized like parse() output.
    // nullopt when the text is not a summary of that game.
    std::optional<ParsedResult> parseSummary(const std::string& text, const Game& game) const;

    // True if a grammar exists for the id or display name.
    bool supports(const std::string& game) const;

    const GrammarRegistry& registry() const noexcept { return *registry_; }

private:
    void normalize(ParsedResult& r) const;

    std::shared_ptr<const GrammarRegistry> registry_;
    NowFn     now_;
    QTimeZone localZone_;
};

// Form pre-fill: just enough to tick "completed"/"failed" boxes.
struct AutoFill {
    bool        ok{false};
    std::string error;

    bool        completed{false};
    bool        failed{false};
    std::string shareText; // trimmed
};

AutoFill autoFill(const ShareTextParser& parser,
                  const std::string& text,
                  const std::optional<std::string>& expectedGame = std::nullopt);

} // namespace puzzlelog::domain::sharetext
