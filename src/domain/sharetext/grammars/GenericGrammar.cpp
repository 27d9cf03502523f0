#include "domain/sharetext/Grammar.hpp"

namespace puzzlelog::domain::sharetext {

namespace {

const GlyphAlphabet& markerGlyphs() {
    static const GlyphAlphabet a{
        glyph::BlackSquare, glyph::WhiteSquare, glyph::YellowSquare, glyph::GreenSquare,
        glyph::BlueSquare, glyph::OrangeSquare, glyph::RedSquare, glyph::PurpleSquare,
        glyph::BrownSquare, glyph::Star, glyph::CheckMark, glyph::CrossMark,
        glyph::RedCircle, glyph::BlueCircle, glyph::GreenCircle, glyph::YellowCircle,
        glyph::WhiteCircle,
    };
    return a;
}

const GlyphAlphabet& successGlyphs() {
    static const GlyphAlphabet a{glyph::GreenSquare, glyph::CheckMark, glyph::GreenCircle};
    return a;
}

bool isLinkOrBlank(const QString& line) {
    return line.trimmed().isEmpty() ||
           line.contains(QLatin1String("http://")) ||
           line.contains(QLatin1String("https://")) ||
           line.contains(QLatin1String(".com"));
}

void applyAttempts(ParsedResult& r, const QString& token, const QString& max) {
    const AttemptToken t = readAttempts(token);
    r.maxAttempts = max.toInt();
    r.failed      = t.failed;
    r.completed   = true;
    r.scores      = ScoreMap{{kMainPuzzle, {{"attempts", t.attempts}}}};
}

} // namespace

ParseOutcome parseGeneric(const ShareText& st) {
    static const QRegularExpression labelled =
        pattern(QStringLiteral("([\\w\\s]+?)\\s+([\\d,]+)\\s+([X\\d]+)/(\\d+)"));
    static const QRegularExpression bare = pattern(QStringLiteral("([X\\d]+)/(\\d+)"));

    ParsedResult r;

    // The first line carrying a score wins; a labelled header is preferred
    // over a bare fraction on the same line.
    bool scoreFound = false;
    for (const auto& line : st.lines) {
        const auto full = labelled.match(line);
        if (full.hasMatch()) {
            r.gameName     = full.captured(1).trimmed().toStdString();
            r.puzzleNumber = full.captured(2).toStdString();
            applyAttempts(r, full.captured(3), full.captured(4));
            scoreFound = true;
            break;
        }
        const auto simple = bare.match(line);
        if (simple.hasMatch()) {
            applyAttempts(r, simple.captured(1), simple.captured(2));
            scoreFound = true;
            break;
        }
    }

    QStringList grid;
    for (const auto& line : st.lines) {
        if (isLinkOrBlank(line)) continue;
        if (markerGlyphs().occursIn(line)) grid.push_back(line);
    }

    if (!grid.isEmpty()) {
        r.grid = joinGrid(grid);

        if (!scoreFound) {
            // Solved only when the last row is all success glyphs.
            const bool solved = successGlyphs().composes(grid.back());

            r.maxAttempts = static_cast<int>(grid.size());
            r.completed   = true;
            r.failed      = !solved;
            r.scores      = ScoreMap{{kMainPuzzle, {
                {"attempts", solved ? static_cast<std::int64_t>(grid.size()) : std::int64_t{-1}}}}};
        }
    }

    return parsed(std::move(r));
}

} // namespace puzzlelog::domain::sharetext
