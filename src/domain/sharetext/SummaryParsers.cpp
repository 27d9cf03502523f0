#include "domain/sharetext/SummaryParsers.hpp"

#include <QRegularExpression>
#include <QString>
#include <QStringList>

#include <algorithm>
#include <cctype>
#include <initializer_list>

#include "domain/sharetext/GlyphAlphabet.hpp"

namespace puzzlelog::domain::sharetext {

namespace {

QRegularExpression caseless(const QString& re) {
    return QRegularExpression(re, QRegularExpression::CaseInsensitiveOption);
}

// "<Mode>: <n>" lines. A later line for the same mode overrides an earlier one.
std::map<std::string, int> readModeCounts(const QString& text,
                                          std::initializer_list<const char*> modes) {
    std::map<std::string, int> out;
    const QStringList lines = text.split(QLatin1Char('\n'));
    for (const char* mode : modes) {
        const QRegularExpression re = caseless(QString::fromLatin1(mode) + QStringLiteral(":\\s*(\\d+)"));
        for (const auto& line : lines) {
            const auto m = re.match(line);
            if (m.hasMatch()) {
                out[mode] = m.captured(1).toInt();
            }
        }
    }
    return out;
}

bool sameName(const std::string& a, const char* b) {
    return QString::fromStdString(a).trimmed().compare(QLatin1String(b), Qt::CaseInsensitive) == 0;
}

bool isGame(const Game& game, const char* name) {
    return sameName(game.id, name) || sameName(game.displayName, name);
}

} // namespace

std::optional<LoLdleSummary> parseLoLdleSummary(const std::string& text) {
    const QString t = QString::fromStdString(text);
    if (t.trimmed().isEmpty()) {
        return std::nullopt;
    }

    static const QRegularExpression header = caseless(QStringLiteral("#LoLdle\\s+#([\\d,]+)"));
    const auto m = header.match(t);
    if (!m.hasMatch()) {
        return std::nullopt;
    }

    LoLdleSummary s;
    s.puzzleNumber = m.captured(1).toStdString();
    s.modes = readModeCounts(t, {"Classic", "Quote", "Ability", "Emoji", "Splash"});
    for (const auto& [mode, attempts] : s.modes) {
        std::string key = mode;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        s.scores[key] = {{"attempts", std::int64_t{attempts}}};
    }
    return s;
}

std::optional<PokedleSummary> parsePokedleSummary(const std::string& text) {
    const QString t = QString::fromStdString(text);
    if (t.trimmed().isEmpty()) {
        return std::nullopt;
    }

    static const QRegularExpression header = caseless(QStringLiteral("#Pokedle\\s+#([\\d,]+)"));
    const auto m = header.match(t);
    if (!m.hasMatch()) {
        return std::nullopt;
    }

    PokedleSummary s;
    s.puzzleNumber = m.captured(1).toStdString();
    s.modes = readModeCounts(t, {"Classic", "Card", "Description", "Silhouette"});
    return s;
}

// Gamedle
// 🕹️ (Cover art) #1337:
// 🟥🟥🟥🟥🟥🟩
std::optional<GamedleSummary> parseGamedleSummary(const std::string& text) {
    const QString t = QString::fromStdString(text);
    if (t.trimmed().isEmpty()) {
        return std::nullopt;
    }

    static const QRegularExpression header(QStringLiteral("^Gamedle\\s*$"),
                                           QRegularExpression::MultilineOption);
    if (!header.match(t).hasMatch()) {
        return std::nullopt;
    }

    GamedleSummary s;
    for (const char* mode : {"Cover art", "Artwork", "Character", "Keywords", "Guess"}) {
        const QRegularExpression re = caseless(
            QStringLiteral("\\(") + QString::fromLatin1(mode) +
            QStringLiteral("\\)\\s+#([\\d,]+):\\s*([\\x{1F7E5}\\x{1F7E9}\\x{2B1C}]+)"));
        const auto m = re.match(t);
        if (!m.hasMatch()) continue;

        const auto glyphs = codePoints(m.captured(2));
        const auto green  = std::find(glyphs.begin(), glyphs.end(), glyph::GreenSquare);
        int attempts = -1;
        if (green != glyphs.end()) {
            attempts = static_cast<int>(std::count(glyphs.begin(), green, glyph::RedSquare)) + 1;
        }

        s.puzzleNumbers[mode] = m.captured(1).toStdString();
        s.modes[mode]         = attempts;
    }
    return s;
}

std::optional<ParsedResult> parseModeSummary(const std::string& text, const Game& game) {
    std::map<std::string, int> modes;
    std::optional<std::string> puzzleNumber;

    if (isGame(game, "LoLdle")) {
        const auto s = parseLoLdleSummary(text);
        if (!s) return std::nullopt;
        modes        = s->modes;
        puzzleNumber = s->puzzleNumber;
    } else if (isGame(game, "Pokedle")) {
        const auto s = parsePokedleSummary(text);
        if (!s) return std::nullopt;
        modes        = s->modes;
        puzzleNumber = s->puzzleNumber;
    } else if (isGame(game, "Gamedle")) {
        // Each mode has its own puzzle number, so the record keeps none.
        const auto s = parseGamedleSummary(text);
        if (!s) return std::nullopt;
        modes = s->modes;
    } else {
        return std::nullopt;
    }

    ParsedResult r;
    r.gameName     = game.displayName;
    r.puzzleNumber = puzzleNumber;

    ScoreMap scores;
    for (const auto& entry : game.scoreTypes) {
        const std::string& key = entry.first;
        for (const auto& [mode, attempts] : modes) {
            if (!sameName(key, mode.c_str())) continue;
            scores[key] = {{"attempts", std::int64_t{attempts}}};
            if (attempts < 0) r.failed = true;
        }
    }
    if (scores.empty()) {
        return std::nullopt;
    }

    r.scores    = std::move(scores);
    r.completed = true;
    return r;
}

} // namespace puzzlelog::domain::sharetext
