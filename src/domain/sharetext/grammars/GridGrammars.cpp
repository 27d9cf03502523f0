// Games whose score is derived from the marker grid rather than stated in a
// header: counted rows, counted glyphs, or glyphs before the first success.

#include "domain/sharetext/Grammar.hpp"

#include <algorithm>
#include <map>

namespace puzzlelog::domain::sharetext {

namespace {

QString withoutSpaces(QString line) {
    line.remove(QRegularExpression(QStringLiteral("\\s+")));
    return line;
}

// Glyphs of a line, dropping variation selectors and whitespace.
std::vector<char32_t> glyphsOf(const QString& line) {
    std::vector<char32_t> out;
    for (const char32_t cp : codePoints(withoutSpaces(line))) {
        if (!isGlyphModifier(cp)) out.push_back(cp);
    }
    return out;
}

class GenshindleGrammar : public GrammarBase {
public:
    GenshindleGrammar()
        : GrammarBase("genshindle", "Genshindle",
                      QStringLiteral("I (found|couldn['\\x{2019}]t find) today['\\x{2019}]s #Genshindle"),
                      "I found today's #Genshindle in 3 tries!",
                      GlyphAlphabet{glyph::PurpleSquare, glyph::GreenSquare, glyph::RedSquare}) {
    }

    ParseOutcome parse(const ShareText& st) const override {
        if (!signature().match(st.text).hasMatch()) {
            return mismatch();
        }

        ParsedResult r = start();
        r.maxAttempts = 5;

        const QStringList grid = alphabet().gridLines(st.lines);
        if (grid.isEmpty()) {
            return mismatch("No emoji grid found.");
        }

        // A solved game leads with the all-correct row.
        static const QString solvedRow = QString::fromUcs4(
            U"\U0001F7EA\U0001F7E9\U0001F7E9\U0001F7E9\U0001F7E9\U0001F7E9\U0001F7E9");
        const bool solved = grid.front().trimmed() == solvedRow;

        r.completed = true;
        r.failed    = !solved;
        r.scores    = ScoreMap{{kMainPuzzle, {
            {"attempts", solved ? static_cast<std::int64_t>(grid.size()) : std::int64_t{-1}}}}};
        r.grid = joinGrid(grid);

        return parsed(std::move(r));
    }
};

class GamedleGrammar : public GrammarBase {
public:
    GamedleGrammar()
        : GrammarBase("gamedle", "Gamedle",
                      QStringLiteral("Gamedle\\s+\\((Cover art|Artwork|Character|Keywords|Guess)\\):"),
                      "Gamedle (Cover art): #1337 \U0001F7E5\U0001F7E5\U0001F7E9",
                      GlyphAlphabet{glyph::RedSquare, glyph::GreenSquare, glyph::WhiteSquare})
        , header_(pattern(QStringLiteral(
              "Gamedle\\s+\\((Cover art|Artwork|Character|Keywords|Guess)\\):\\s+#([\\d,]+)\\s+"
              "([\\x{1F7E5}\\x{1F7E9}\\x{2B1C}]+)"))) {
    }

    ParseOutcome parse(const ShareText& st) const override {
        const auto m = header_.match(st.text);
        if (!m.hasMatch()) {
            return mismatch();
        }

        static const std::map<QString, int> kMaxAttempts = {
            {QStringLiteral("cover art"), 6},
            {QStringLiteral("artwork"), 6},
            {QStringLiteral("character"), 4},
            {QStringLiteral("keywords"), 6},
            {QStringLiteral("guess"), 10},
        };

        ParsedResult r = start();
        r.puzzleNumber = m.captured(2).toStdString();
        const auto it  = kMaxAttempts.find(m.captured(1).toLower());
        r.maxAttempts  = it != kMaxAttempts.end() ? it->second : 6;

        const QString run = m.captured(3);
        const auto glyphs = codePoints(run);
        const auto green  = std::find(glyphs.begin(), glyphs.end(), glyph::GreenSquare);

        if (green == glyphs.end()) {
            r.failed    = true;
            r.completed = false;
            r.scores    = ScoreMap{{kMainPuzzle, {{"attempts", std::int64_t{-1}}}}};
        } else {
            // Misses before the first hit, plus the hit itself.
            const auto misses = std::count(glyphs.begin(), green, glyph::RedSquare);
            r.failed    = false;
            r.completed = true;
            r.scores    = ScoreMap{{kMainPuzzle, {{"attempts", static_cast<std::int64_t>(misses) + 1}}}};
        }
        r.grid = run.toStdString();

        return parsed(std::move(r));
    }

private:
    QRegularExpression header_;
};

class ConnectionsGrammar : public GrammarBase {
public:
    ConnectionsGrammar()
        : GrammarBase("connections", "Connections",
                      QStringLiteral("Connections[\\s\\S]*?Puzzle #[\\d,]+"),
                      "Connections\nPuzzle #512",
                      GlyphAlphabet{glyph::BlueSquare, glyph::GreenSquare, glyph::YellowSquare,
                                    glyph::PurpleSquare})
        , header_(pattern(QStringLiteral("Connections[\\s\\S]*?Puzzle #([\\d,]+)"))) {
    }

    ParseOutcome parse(const ShareText& st) const override {
        const auto m = header_.match(st.text);
        if (!m.hasMatch()) {
            return mismatch();
        }

        ParsedResult r = start();
        r.puzzleNumber = m.captured(1).toStdString();

        // Every guess is a row of exactly four group colours; a solved group
        // is a row of one colour.
        QStringList rows;
        int solved = 0;
        for (const auto& line : st.lines) {
            const auto g = glyphsOf(line);
            if (g.size() != 4) continue;
            if (!std::all_of(g.begin(), g.end(), [this](char32_t c) { return alphabet().contains(c); })) {
                continue;
            }
            rows.push_back(line);
            if (std::all_of(g.begin(), g.end(), [&g](char32_t c) { return c == g.front(); })) {
                ++solved;
            }
        }

        r.maxAttempts = 4;
        r.completed   = true;
        r.failed      = solved < 4;
        r.scores      = ScoreMap{{kMainPuzzle, {{"solved", std::int64_t{solved}}}}};
        r.grid        = joinGrid(rows);

        return parsed(std::move(r));
    }

private:
    QRegularExpression header_;
};

// Four words per day. Solved words show as keycap digits (the guess that
// solved them), unsolved ones as red squares.
class QuordleGrammar : public GrammarBase {
public:
    QuordleGrammar()
        : GrammarBase("quordle", "Quordle",
                      QStringLiteral("Daily Quordle\\s+[\\d,]+"),
                      "Daily Quordle 1234",
                      GlyphAlphabet{glyph::RedSquare, glyph::BlackSquare, glyph::WhiteSquare,
                                    glyph::YellowSquare, glyph::GreenSquare})
        , header_(pattern(QStringLiteral("Daily Quordle\\s+([\\d,]+)")))
        , keycap_(QStringLiteral("([1-9])\\x{FE0F}?\\x{20E3}")) {
    }

    ParseOutcome parse(const ShareText& st) const override {
        const auto m = header_.match(st.text);
        if (!m.hasMatch()) {
            return mismatch();
        }

        ParsedResult r = start();
        r.puzzleNumber = m.captured(1).toStdString();

        int solved     = 0;
        int totalWords = 0;
        int maxGuess   = 0;
        QStringList grid;

        for (const auto& line : st.lines) {
            int keycaps = 0;
            auto it = keycap_.globalMatch(line);
            while (it.hasNext()) {
                const auto k = it.next();
                ++keycaps;
                maxGuess = std::max(maxGuess, k.captured(1).toInt());
            }
            const int misses = countOf(line, glyph::RedSquare);

            if (keycaps > 0 || misses > 0) {
                solved     += keycaps;
                totalWords += keycaps + misses;
            }

            if (header_.match(line).hasMatch()) continue;
            if (keycaps > 0 || alphabet().occursIn(line)) grid.push_back(line);
        }

        const bool allSolved = solved == 4;
        r.maxAttempts    = totalWords;
        r.maxGuessNumber = maxGuess;
        r.completed      = true;
        r.failed         = solved < 4;
        r.scores         = ScoreMap{{kMainPuzzle, {
            {"solved", std::int64_t{solved}},
            {"attempts", allSolved ? std::int64_t{maxGuess} : std::int64_t{-1}},
        }}};
        r.grid = joinGrid(grid);

        return parsed(std::move(r));
    }

private:
    static int countOf(const QString& line, char32_t g) {
        const auto cps = codePoints(line);
        return static_cast<int>(std::count(cps.begin(), cps.end(), g));
    }

    QRegularExpression header_;
    QRegularExpression keycap_;
};

class SpellcheckGrammar : public GrammarBase {
public:
    SpellcheckGrammar()
        : GrammarBase("spellcheck", "Spellcheck",
                      QStringLiteral("Spellcheck\\s+#[\\d,]+"),
                      "Spellcheck #123",
                      GlyphAlphabet{glyph::RedSquare, glyph::GreenSquare, glyph::BlueSquare,
                                    glyph::YellowSquare, glyph::OrangeSquare, glyph::PurpleSquare,
                                    glyph::BrownSquare, glyph::Star, glyph::CheckMark,
                                    glyph::CrossMark})
        , header_(pattern(QStringLiteral("Spellcheck\\s+#([\\d,]+)")))
        , correct_{glyph::GreenSquare, glyph::BlueSquare, glyph::YellowSquare, glyph::OrangeSquare,
                   glyph::PurpleSquare, glyph::BrownSquare, glyph::Star, glyph::CheckMark} {
    }

    ParseOutcome parse(const ShareText& st) const override {
        const auto m = header_.match(st.text);
        if (!m.hasMatch()) {
            return mismatch();
        }

        ParsedResult r = start();
        r.puzzleNumber = m.captured(1).toStdString();

        const QStringList grid = alphabet().gridLines(st.lines);
        int correct = 0;
        for (const auto& line : grid) {
            correct += correct_.count(line);
        }

        r.maxAttempts = 15;
        r.completed   = true;
        r.failed      = false;
        r.scores      = ScoreMap{{kMainPuzzle, {{"solved", std::int64_t{correct}}}}};
        r.grid        = joinGrid(grid);

        return parsed(std::move(r));
    }

private:
    QRegularExpression header_;
    GlyphAlphabet      correct_;
};

// Solved: "I got Hexcodle #869 in 4! Score: 85%"
// Missed: "I didn't get Hexcodle #869. Score: 69%"
class HexcodleGrammar : public GrammarBase {
public:
    HexcodleGrammar()
        : GrammarBase("hexcodle", "Hexcodle",
                      QStringLiteral("Hexcodle\\s+#[\\d,]+"),
                      "I got Hexcodle #869 in 4! Score: 85%",
                      GlyphAlphabet{glyph::DoubleUp, glyph::DoubleDown, glyph::SmallUp,
                                    glyph::SmallDown, glyph::CheckMark})
        , solved_(pattern(QStringLiteral("Hexcodle\\s+#([\\d,]+)\\s+in\\s+(\\d+)!.*?Score:\\s*(\\d+)%"), true))
        , missed_(pattern(QStringLiteral("Hexcodle\\s+#([\\d,]+).*?Score:\\s*(\\d+)%"), true))
        , skip_(pattern(QStringLiteral("^(Hexcodle\\s+#[\\d,]+|I\\s+(didn't\\s+get|got)\\s+Hexcodle)|Score:|hexcodle\\.com")))
        , checks_{glyph::CheckMark} {
    }

    ParseOutcome parse(const ShareText& st) const override {
        std::optional<std::int64_t> attempts;
        QString puzzle;
        int percent = 0;

        const auto s = solved_.match(st.text);
        if (s.hasMatch()) {
            puzzle   = s.captured(1);
            attempts = s.captured(2).toLongLong();
            percent  = s.captured(3).toInt();
        } else {
            const auto f = missed_.match(st.text);
            if (!f.hasMatch()) {
                return mismatch();
            }
            puzzle  = f.captured(1);
            percent = f.captured(2).toInt();
        }

        ParsedResult r = start();
        r.puzzleNumber = puzzle.toStdString();
        r.percentage   = percent;
        r.completed    = true;

        QStringList rows;
        for (const auto& line : st.lines) {
            if (skip_.match(line).hasMatch()) continue;
            if (alphabet().occursIn(line)) rows.push_back(line);
        }

        const bool lastRowSolved = !rows.isEmpty() && checks_.composes(rows.back());
        r.failed      = (rows.size() == 5 && !lastRowSolved) || !attempts;
        r.maxAttempts = 5;
        if (!r.failed) {
            r.guessCount = static_cast<int>(rows.size());
        }

        ScoreFields fields{{"accuracy", std::int64_t{percent}}};
        if (attempts) {
            fields.emplace("attempts", *attempts);
        }
        r.scores = ScoreMap{{kMainPuzzle, std::move(fields)}};
        r.grid   = joinGrid(rows);

        return parsed(std::move(r));
    }

private:
    QRegularExpression solved_;
    QRegularExpression missed_;
    QRegularExpression skip_;
    GlyphAlphabet      checks_;
};

class PokedokuGrammar : public GrammarBase {
public:
    PokedokuGrammar()
        : GrammarBase("pokedoku", "Pokedoku",
                      QStringLiteral("Pok[e\\x{E9}]Doku\\s+(Summary|#[\\d,]+)"),
                      "PokeDoku Summary 2025-01-15\nScore: 7/9",
                      GlyphAlphabet{glyph::CheckMark, glyph::RedSquare})
        , header_(pattern(QStringLiteral(
              "Pok[e\\x{E9}]Doku\\s+(?:Summary|#([\\d,]+))(?:.*?(\\d{4}-\\d{2}-\\d{2}))?.*?Score:\\s*(\\d+)\\s*/\\s*(\\d+)"),
              true))
        , uniqueness_(pattern(QStringLiteral("Uniqueness:\\s*(\\d+)\\s*/\\s*(\\d+)"))) {
    }

    ParseOutcome parse(const ShareText& st) const override {
        const auto m = header_.match(st.text);
        if (!m.hasMatch()) {
            return mismatch();
        }

        ParsedResult r = start();
        if (m.hasCaptured(2)) {
            r.puzzleNumber = m.captured(2).toStdString();
        } else if (m.hasCaptured(1)) {
            r.puzzleNumber = m.captured(1).toStdString();
        }

        const std::int64_t solved = m.captured(3).toLongLong();
        r.maxAttempts = m.captured(4).toInt();

        std::int64_t uniqueness = 0;
        std::int64_t maxUniqueness = 0;
        const auto u = uniqueness_.match(st.text);
        if (u.hasMatch()) {
            uniqueness      = u.captured(1).toLongLong();
            maxUniqueness   = u.captured(2).toLongLong();
            r.uniqueness    = static_cast<int>(uniqueness);
            r.maxUniqueness = static_cast<int>(maxUniqueness);
        }

        r.scores = ScoreMap{{kMainPuzzle, {
            {"solved", solved},
            {"uniqueness", uniqueness},
            {"maxUniqueness", maxUniqueness},
        }}};

        // The board: the first three consecutive rows of hits and misses.
        QStringList board;
        for (const auto& line : st.lines) {
            if (alphabet().composes(line)) {
                board.push_back(line.trimmed());
                if (board.size() == 3) break;
            } else {
                board.clear();
            }
        }
        if (board.size() == 3) {
            r.grid = joinGrid(board);
        }

        r.completed = true;
        r.failed    = false;

        return parsed(std::move(r));
    }

private:
    QRegularExpression header_;
    QRegularExpression uniqueness_;
};

} // namespace

std::unique_ptr<IGrammar> makeGenshindleGrammar() {
    return std::make_unique<GenshindleGrammar>();
}

std::unique_ptr<IGrammar> makeGamedleGrammar() {
    return std::make_unique<GamedleGrammar>();
}

std::unique_ptr<IGrammar> makeConnectionsGrammar() {
    return std::make_unique<ConnectionsGrammar>();
}

std::unique_ptr<IGrammar> makeQuordleGrammar() {
    return std::make_unique<QuordleGrammar>();
}

std::unique_ptr<IGrammar> makeSpellcheckGrammar() {
    return std::make_unique<SpellcheckGrammar>();
}

std::unique_ptr<IGrammar> makeHexcodleGrammar() {
    return std::make_unique<HexcodleGrammar>();
}

std::unique_ptr<IGrammar> makePokedokuGrammar() {
    return std::make_unique<PokedokuGrammar>();
}

} // namespace puzzlelog::domain::sharetext
