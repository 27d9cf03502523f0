// Games that report a score, a tally or a time instead of an attempt count.

#include "domain/sharetext/Grammar.hpp"

#include <cmath>

namespace puzzlelog::domain::sharetext {

namespace {

std::int64_t secondsToMs(const QString& seconds) {
    return static_cast<std::int64_t>(std::llround(seconds.toDouble() * 1000.0));
}

// I got a score of 342 on today's Chronophoto: 12/25/2025
// Round 1: 0❌
// ...
class ChronophotoGrammar : public GrammarBase {
public:
    ChronophotoGrammar()
        : GrammarBase("chronophoto", "Chronophoto",
                      QStringLiteral("Chronophoto"),
                      "I got a score of 342 on today's Chronophoto: 12/25/2025",
                      GlyphAlphabet{glyph::CrossMark, glyph::CheckMark})
        , header_(pattern(QStringLiteral("I got a score of (\\d+) on today['\\x{2019}]s Chronophoto")))
        , date_(QStringLiteral("Chronophoto: (\\d{1,2}/\\d{1,2}/\\d{4})"))
        , round_(QStringLiteral("Round (\\d+): (\\d+(?:\\x{274C}|\\x{2705})?)")) {
    }

    ParseOutcome parse(const ShareText& st) const override {
        if (!header_.match(st.text).hasMatch()) {
            return mismatch();
        }

        ParsedResult r = start();
        r.completed = true;

        std::int64_t total = 0;
        QStringList rounds;
        for (const auto& line : st.lines) {
            const auto m = round_.match(line);
            if (!m.hasMatch()) continue;
            const QString result = m.captured(2);
            rounds.push_back(result);

            // The digits lead the captured result; the marker glyph is display only.
            QString digits;
            for (const QChar c : result) {
                if (!c.isDigit()) break;
                digits.append(c);
            }
            total += digits.toLongLong();
        }

        r.scores = ScoreMap{{kMainPuzzle, {{"points", total}}}};
        r.failed = total == 0;

        const auto d = date_.match(st.text);
        if (d.hasMatch()) {
            r.puzzleNumber = d.captured(1).toStdString();
        }
        r.grid = joinGrid(rounds);

        return parsed(std::move(r));
    }

private:
    QRegularExpression header_;
    QRegularExpression date_;
    QRegularExpression round_;
};

// WANTEDLE #123 - Hard
// B - 19.2s
// 🤠🐎
class WantedleGrammar : public GrammarBase {
public:
    WantedleGrammar()
        : GrammarBase("wantedle", "Wantedle",
                      QStringLiteral("WANTEDLE\\s+#[\\d,]+"),
                      "WANTEDLE #123 - Hard\nB - 19.2s",
                      GlyphAlphabet::pictographs())
        , header_(pattern(QStringLiteral("WANTEDLE\\s+#([\\d,]+)")))
        , score_(pattern(QStringLiteral("\\b([SABCDF])\\s*-\\s*([\\d.]+)s"))) {
    }

    ParseOutcome parse(const ShareText& st) const override {
        const auto h = header_.match(st.text);
        if (!h.hasMatch()) {
            return mismatch();
        }
        const auto s = score_.match(st.text);
        if (!s.hasMatch()) {
            return mismatch("Could not find score line (e.g. \"S - 9.4s\", \"A - 12.3s\", \"F - 30.0s\").");
        }

        ParsedResult r = start();
        r.puzzleNumber = h.captured(1).toStdString();

        const QString grade = s.captured(1).toUpper();
        const std::int64_t timeMs = secondsToMs(s.captured(2));

        r.completed = true;
        r.failed    = grade == QLatin1String("D") || grade == QLatin1String("F");
        r.grade     = grade.toStdString();
        r.timeMs    = timeMs;
        r.scores    = ScoreMap{{kMainPuzzle, {{"time", timeMs}, {"grade", grade.toStdString()}}}};

        QStringList emoji;
        for (const auto& line : st.lines) {
            if (alphabet().composes(line)) emoji.push_back(line.trimmed());
        }
        r.grid = joinGrid(emoji).value_or(std::string{});

        return parsed(std::move(r));
    }

private:
    QRegularExpression header_;
    QRegularExpression score_;
};

// Rule34dle Daily 2025-01-15
// 7/10
class R34dleGrammar : public GrammarBase {
public:
    R34dleGrammar()
        : GrammarBase("r34dle", "r34dle",
                      QStringLiteral("Rule34dle Daily [\\d-]+"),
                      "Rule34dle Daily 2025-01-15\n7/10",
                      GlyphAlphabet{glyph::GreenSquare, glyph::RedSquare})
        , header_(pattern(QStringLiteral("Rule34dle Daily ([\\d-]+)")))
        , fraction_(QStringLiteral("(\\d+)/10")) {
    }

    ParseOutcome parse(const ShareText& st) const override {
        const auto h = header_.match(st.text);
        if (!h.hasMatch()) {
            return mismatch();
        }
        const auto f = fraction_.match(st.text, h.capturedEnd(0));
        if (!f.hasMatch()) {
            return mismatch("Could not find score in format \"n/10\".");
        }

        ParsedResult r = start();
        r.puzzleNumber = h.captured(1).toStdString();

        const std::int64_t solved = f.captured(1).toLongLong();
        r.maxAttempts = 10;
        r.completed   = true;
        r.failed      = solved < 10;
        r.scores      = ScoreMap{{kMainPuzzle, {{"solved", solved}}}};
        r.grid        = joinGrid(alphabet().gridLines(st.lines));

        return parsed(std::move(r));
    }

private:
    QRegularExpression header_;
    QRegularExpression fraction_;
};

// 🟩🟩🟥🟩🟩🟩🟥🟩🟩🟩 8/10 | 2025-01-15 | https://scrandle.com
class ScrandleGrammar : public GrammarBase {
public:
    ScrandleGrammar()
        : GrammarBase("scrandle", "Scrandle",
                      QStringLiteral("[\\x{1F7E9}\\x{1F7E5}]+\\s+\\d+/10\\s*\\|\\s*[\\d-]+\\s*\\|\\s*https://scrandle\\.com"),
                      "\U0001F7E9\U0001F7E5... n/10 | 2025-01-15 | https://scrandle.com",
                      GlyphAlphabet{glyph::GreenSquare, glyph::RedSquare})
        , header_(pattern(QStringLiteral(
              "([\\x{1F7E9}\\x{1F7E5}]+)\\s+(\\d+)/10\\s*\\|\\s*([\\d-]+)\\s*\\|\\s*https://scrandle\\.com"))) {
    }

    ParseOutcome parse(const ShareText& st) const override {
        const auto m = header_.match(st.text);
        if (!m.hasMatch()) {
            return mismatch();
        }

        ParsedResult r = start();
        r.puzzleNumber = m.captured(3).toStdString();

        const std::int64_t correct = m.captured(2).toLongLong();
        r.maxAttempts = 10;
        r.completed   = true;
        r.failed      = correct < 10;
        r.scores      = ScoreMap{{kMainPuzzle, {{"solved", correct}}}};
        r.grid        = m.captured(1).toStdString();

        return parsed(std::move(r));
    }

private:
    QRegularExpression header_;
};

class ColorGuesserGrammar : public GrammarBase {
public:
    ColorGuesserGrammar()
        : GrammarBase("colorguesser", "ColorGuesser",
                      QStringLiteral("ColorGuesser\\s+#[\\d,]+"),
                      "ColorGuesser #123 ... Score: 412/500",
                      GlyphAlphabet{})
        , header_(pattern(QStringLiteral("ColorGuesser\\s+#([\\d,]+).*?Score:\\s*(\\d+)/(\\d+)"), true)) {
    }

    ParseOutcome parse(const ShareText& st) const override {
        const auto m = header_.match(st.text);
        if (!m.hasMatch()) {
            return mismatch();
        }

        ParsedResult r = start();
        r.puzzleNumber = m.captured(1).toStdString();
        r.maxAttempts  = m.captured(3).toInt();
        r.completed    = true;
        r.failed       = false;
        r.scores       = ScoreMap{{kMainPuzzle, {{"points", m.captured(2).toLongLong()}}}};

        return parsed(std::move(r));
    }

private:
    QRegularExpression header_;
};

// Timingle #123 ... 2.4 seconds
// A missing time leaves the score empty; the result is still a completed play.
class TimingleGrammar : public GrammarBase {
public:
    TimingleGrammar()
        : GrammarBase("timingle", "Timingle",
                      QStringLiteral("Timingle\\s+#[\\d,]+"),
                      "Timingle #123 ... 2.4 seconds",
                      GlyphAlphabet{})
        , header_(pattern(QStringLiteral("Timingle\\s+#([\\d,]+)")))
        , seconds_(pattern(QStringLiteral("([-+]?\\d+\\.?\\d*)\\s*seconds"))) {
    }

    ParseOutcome parse(const ShareText& st) const override {
        const auto h = header_.match(st.text);
        if (!h.hasMatch()) {
            return mismatch();
        }

        ParsedResult r = start();
        r.puzzleNumber = h.captured(1).toStdString();
        r.completed    = true;
        r.failed       = false;
        r.grid         = std::string{};

        ScoreFields fields;
        const auto s = seconds_.match(st.text, h.capturedEnd(0));
        if (s.hasMatch()) {
            const std::int64_t ms = secondsToMs(s.captured(1));
            r.timeMs = ms;
            fields.emplace("time", ms);
        }
        r.scores = ScoreMap{{kMainPuzzle, std::move(fields)}};

        return parsed(std::move(r));
    }

private:
    QRegularExpression header_;
    QRegularExpression seconds_;
};

} // namespace

std::unique_ptr<IGrammar> makeChronophotoGrammar() {
    return std::make_unique<ChronophotoGrammar>();
}

std::unique_ptr<IGrammar> makeWantedleGrammar() {
    return std::make_unique<WantedleGrammar>();
}

std::unique_ptr<IGrammar> makeR34dleGrammar() {
    return std::make_unique<R34dleGrammar>();
}

std::unique_ptr<IGrammar> makeScrandleGrammar() {
    return std::make_unique<ScrandleGrammar>();
}

std::unique_ptr<IGrammar> makeColorGuesserGrammar() {
    return std::make_unique<ColorGuesserGrammar>();
}

std::unique_ptr<IGrammar> makeTimingleGrammar() {
    return std::make_unique<TimingleGrammar>();
}

} // namespace puzzlelog::domain::sharetext
