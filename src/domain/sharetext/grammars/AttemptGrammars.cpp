// Games whose header states the attempt count directly: "<name> <n> 4/6",
// with "X" in place of the count on failure.

#include "domain/sharetext/Grammar.hpp"

namespace puzzlelog::domain::sharetext {

namespace {

// Header groups: 1 = puzzle number, 2 = attempt token, 3 = max attempts.
class AttemptHeaderGrammar : public GrammarBase {
public:
    AttemptHeaderGrammar(std::string id,
                         std::string displayName,
                         const QString& signature,
                         const QString& header,
                         std::string expectedFormat,
                         GlyphAlphabet alphabet)
        : GrammarBase(std::move(id), std::move(displayName), signature,
                      std::move(expectedFormat), std::move(alphabet))
        , header_(pattern(header)) {
    }

    ParseOutcome parse(const ShareText& st) const override {
        const auto m = header_.match(st.text);
        if (!m.hasMatch()) {
            return mismatch();
        }

        ParsedResult r = start();
        r.puzzleNumber = m.captured(1).toStdString();
        r.maxAttempts  = m.captured(3).toInt();

        const AttemptToken t = readAttempts(m.captured(2));
        r.failed    = t.failed;
        r.completed = true;
        r.scores    = ScoreMap{{kMainPuzzle, {{"attempts", t.attempts}}}};

        QStringList grid;
        for (const auto& line : st.lines) {
            if (header_.match(line).hasMatch()) continue;
            if (alphabet().occursIn(line)) grid.push_back(line);
        }
        r.grid = joinGrid(grid);

        return parsed(std::move(r));
    }

private:
    QRegularExpression header_;
};

class ColorfleGrammar : public GrammarBase {
public:
    ColorfleGrammar()
        : GrammarBase("colorfle", "Colorfle",
                      QStringLiteral("Colorfle\\s+[\\d,]+"),
                      "Colorfle 123 4/6",
                      GlyphAlphabet{glyph::BlackSquare, glyph::WhiteSquare, glyph::YellowSquare,
                                    glyph::GreenSquare, glyph::BlueSquare, glyph::OrangeSquare,
                                    glyph::RedSquare, glyph::PurpleSquare, glyph::BrownSquare})
        , header_(pattern(QStringLiteral("Colorfle\\s+([\\d,]+)\\s+([X\\d]+)/(\\d+)")))
        , accuracy_(pattern(QStringLiteral("accuracy of\\s*([\\d.]+)%"))) {
    }

    ParseOutcome parse(const ShareText& st) const override {
        const auto m = header_.match(st.text);
        if (!m.hasMatch()) {
            return mismatch();
        }

        ParsedResult r = start();
        r.puzzleNumber = m.captured(1).toStdString();
        r.maxAttempts  = m.captured(3).toInt();

        double accuracy = 0.0;
        const auto acc = accuracy_.match(st.text);
        if (acc.hasMatch()) {
            accuracy     = acc.captured(1).toDouble();
            r.percentage = accuracy;
        }

        const AttemptToken t = readAttempts(m.captured(2));
        r.failed    = t.failed;
        r.completed = true;
        r.scores    = ScoreMap{{kMainPuzzle, {{"attempts", t.attempts}, {"accuracy", accuracy}}}};

        QStringList grid;
        for (const auto& line : st.lines) {
            if (header_.match(line).hasMatch()) continue;
            if (alphabet().occursIn(line)) grid.push_back(line);
        }
        r.grid = joinGrid(grid);

        return parsed(std::move(r));
    }

private:
    QRegularExpression header_;
    QRegularExpression accuracy_;
};

// Worldle scores on proximity: only a 100% result is a win, even when the
// guess count is given.
class WorldleGrammar : public GrammarBase {
public:
    WorldleGrammar()
        : GrammarBase("worldle", "Worldle",
                      QStringLiteral("#Worldle\\s+#[\\d,]+"),
                      "#Worldle #1234 (15.01.2025) 4/6 (100%)",
                      GlyphAlphabet{glyph::ArrowUp, glyph::ArrowDown, glyph::ArrowLeft,
                                    glyph::ArrowRight, glyph::ArrowUpRight, glyph::ArrowDownRight,
                                    glyph::ArrowDownLeft, glyph::ArrowUpLeft, glyph::GreenSquare,
                                    glyph::YellowSquare, glyph::RedSquare, glyph::WhiteSquare,
                                    glyph::PartyPopper})
        , header_(pattern(QStringLiteral(
              "#Worldle\\s+#([\\d,]+)(?:\\s+\\([^)]+\\))?\\s+([X\\d]+)/(\\d+)(?:\\s+\\((\\d+)%\\))?")))
        , headerLine_(pattern(QStringLiteral("^#Worldle\\s+#[\\d,]+")))
        , streakLine_(pattern(QStringLiteral("streak")))
        , bonusLine_(pattern(QStringLiteral("Worldle has a new bonus round"))) {
    }

    ParseOutcome parse(const ShareText& st) const override {
        const auto m = header_.match(st.text);
        if (!m.hasMatch()) {
            return mismatch();
        }

        ParsedResult r = start();
        r.puzzleNumber = m.captured(1).toStdString();
        r.maxAttempts  = m.captured(3).toInt();
        if (m.hasCaptured(4)) {
            r.percentage = m.captured(4).toInt();
        }

        const AttemptToken t = readAttempts(m.captured(2));
        if (!t.failed) {
            if (const auto* n = std::get_if<std::int64_t>(&t.attempts)) {
                r.guessCount = static_cast<int>(*n);
            }
        }

        r.completed = true;
        r.failed    = !r.percentage || *r.percentage != 100.0;

        ScoreValue attempts = std::int64_t{-1};
        if (!r.failed && !t.failed) {
            attempts = t.attempts;
        }
        r.scores = ScoreMap{{kMainPuzzle, {
            {"accuracy", static_cast<std::int64_t>(r.percentage.value_or(0.0))},
            {"attempts", attempts},
        }}};

        QStringList grid;
        for (const auto& line : st.lines) {
            if (headerLine_.match(line).hasMatch()) continue;
            if (streakLine_.match(line).hasMatch()) continue;
            if (line.trimmed().startsWith(QStringLiteral("\U0001F525"))) continue; // 🔥
            if (bonusLine_.match(line).hasMatch()) continue;
            if (alphabet().composes(line)) grid.push_back(line);
        }
        r.grid = joinGrid(grid);

        return parsed(std::move(r));
    }

private:
    QRegularExpression header_;
    QRegularExpression headerLine_;
    QRegularExpression streakLine_;
    QRegularExpression bonusLine_;
};

} // namespace

std::unique_ptr<IGrammar> makeWordleGrammar() {
    return std::make_unique<AttemptHeaderGrammar>(
        "wordle", "Wordle",
        QStringLiteral("Wordle\\s+[\\d,]+"),
        QStringLiteral("Wordle\\s+([\\d,]+)\\s+([X\\d]+)/(\\d+)"),
        "Wordle 1,643 X/6",
        GlyphAlphabet{glyph::BlackSquare, glyph::WhiteSquare, glyph::YellowSquare, glyph::GreenSquare});
}

std::unique_ptr<IGrammar> makeNerdleGrammar() {
    return std::make_unique<AttemptHeaderGrammar>(
        "nerdle", "Nerdle",
        QStringLiteral("nerdlegame\\s+[\\d,]+"),
        QStringLiteral("nerdlegame\\s+([\\d,]+)\\s+([X\\d]+)/(\\d+)"),
        "nerdlegame 1,234 3/6",
        GlyphAlphabet{glyph::BlackSquare, glyph::WhiteSquare, glyph::PurpleSquare, glyph::GreenSquare});
}

std::unique_ptr<IGrammar> makeAngleGrammar() {
    return std::make_unique<AttemptHeaderGrammar>(
        "angle", "Angle",
        QStringLiteral("#Angle\\s+#[\\d,]+"),
        QStringLiteral("#Angle\\s+#([\\d,]+)\\s+([X\\d]+)/(\\d+)"),
        "#Angle #681 3/4",
        GlyphAlphabet{glyph::ArrowUp, glyph::ArrowDown, glyph::PartyPopper});
}

std::unique_ptr<IGrammar> makeBandleGrammar() {
    return std::make_unique<AttemptHeaderGrammar>(
        "bandle", "Bandle",
        QStringLiteral("Bandle\\s+#[\\d,]+"),
        QStringLiteral("Bandle\\s+#([\\d,]+)\\s+([X\\d]+)/(\\d+)"),
        "Bandle #1227 4/6",
        GlyphAlphabet{glyph::BlackSquare, glyph::WhiteSquare, glyph::YellowSquare,
                      glyph::GreenSquare, glyph::RedSquare});
}

std::unique_ptr<IGrammar> makeColorfleGrammar() {
    return std::make_unique<ColorfleGrammar>();
}

std::unique_ptr<IGrammar> makeWorldleGrammar() {
    return std::make_unique<WorldleGrammar>();
}

} // namespace puzzlelog::domain::sharetext
