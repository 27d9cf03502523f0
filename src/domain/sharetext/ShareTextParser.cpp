#include "domain/sharetext/ShareTextParser.hpp"

#include <QDateTime>

#include <algorithm>
#include <stdexcept>

#include "domain/period/PuzzlePeriod.hpp"
#include "domain/sharetext/SummaryParsers.hpp"

namespace puzzlelog::domain::sharetext {

namespace {

// Only letter grades are expected to be text.
bool allowsText(const std::string& field) {
    return field == "grade";
}

void addWarning(ParsedResult& r, std::string warning) {
    if (std::find(r.parseWarnings.begin(), r.parseWarnings.end(), warning) == r.parseWarnings.end()) {
        r.parseWarnings.push_back(std::move(warning));
    }
}

} // namespace

ShareTextParser::ShareTextParser()
    : ShareTextParser(std::make_shared<const GrammarRegistry>(GrammarRegistry::withDefaultGrammars())) {
}

ShareTextParser::ShareTextParser(std::shared_ptr<const GrammarRegistry> registry,
                                 NowFn now,
                                 QTimeZone localZone)
    : registry_(std::move(registry))
    , now_(std::move(now))
    , localZone_(std::move(localZone)) {
    if (!registry_) {
        throw std::invalid_argument("ShareTextParser requires a grammar registry");
    }
    if (!now_) {
        now_ = [] { return Clock::now(); };
    }
}

bool ShareTextParser::supports(const std::string& game) const {
    return registry_->find(game) != nullptr;
}

ParseOutcome ShareTextParser::parse(const std::string& text,
                                    const std::optional<std::string>& expectedGame) const {
    const ShareText st = ShareText::fromUtf8(text);
    if (st.lines.isEmpty()) {
        return parseError("Share text is empty");
    }

    ParseOutcome out;
    if (expectedGame) {
        const IGrammar* g = registry_->find(*expectedGame);
        if (!g) {
            return parseError("Unknown game '" + *expectedGame + "'");
        }
        out = g->parse(st);
    } else if (const IGrammar* g = registry_->detect(st.text)) {
        out = g->parse(st);
    } else {
        out = parseGeneric(st);
    }

    if (out.ok) {
        normalize(out.result);
    }
    return out;
}

std::optional<ParsedResult> ShareTextParser::parseSummary(const std::string& text, const Game& game) const {
    auto r = parseModeSummary(text, game);
    if (r) {
        normalize(*r);
    }
    return r;
}

void ShareTextParser::normalize(ParsedResult& r) const {
    if (r.scores) {
        ScoreMap& scores = *r.scores;
        for (auto it = scores.begin(); it != scores.end();) {
            if (it->second.empty()) {
                it = scores.erase(it);
                continue;
            }
            for (const auto& [field, value] : it->second) {
                if (!isNumeric(value) && !allowsText(field)) {
                    addWarning(r, "Parsed non-numeric score value for '" + field + "' in '" +
                                      it->first + "': \"" + to_string(value) + "\"");
                }
            }
            ++it;
        }
        if (scores.empty()) {
            r.scores.reset();
        }
    }

    if (!r.puzzleNumber || r.puzzleNumber->empty()) {
        const QDateTime local = QDateTime::fromMSecsSinceEpoch(period::toUnixMs(now_()), localZone_);
        r.puzzleNumber = period::formatPuzzleDay(local.date());
    }
}

AutoFill autoFill(const ShareTextParser& parser,
                  const std::string& text,
                  const std::optional<std::string>& expectedGame) {
    AutoFill fill;
    const ParseOutcome out = parser.parse(text, expectedGame);
    if (!out.ok) {
        fill.error = out.error;
        return fill;
    }

    fill.ok        = true;
    fill.completed = out.result.completed;
    fill.failed    = out.result.failed;
    fill.shareText = QString::fromStdString(text).trimmed().toStdString();
    return fill;
}

} // namespace puzzlelog::domain::sharetext
