#include "domain/sharetext/GlyphAlphabet.hpp"

#include <QChar>

#include <algorithm>

namespace puzzlelog::domain::sharetext {

std::vector<char32_t> codePoints(const QString& s) {
    std::vector<char32_t> out;
    out.reserve(static_cast<std::size_t>(s.size()));
    for (const auto ucs4 : s.toUcs4()) {
        out.push_back(static_cast<char32_t>(ucs4));
    }
    return out;
}

bool isGlyphModifier(char32_t cp) {
    return cp == glyph::VariationSelector16 ||
           cp == glyph::ZeroWidthJoiner ||
           cp == 0xFE0E;
}

GlyphAlphabet::GlyphAlphabet(std::initializer_list<char32_t> glyphs) {
    ranges_.reserve(glyphs.size());
    for (const char32_t g : glyphs) {
        ranges_.emplace_back(g, g);
    }
}

GlyphAlphabet GlyphAlphabet::ranges(std::initializer_list<std::pair<char32_t, char32_t>> ranges) {
    GlyphAlphabet a;
    a.ranges_.assign(ranges.begin(), ranges.end());
    return a;
}

GlyphAlphabet GlyphAlphabet::pictographs() {
    return ranges({
        {0x2190, 0x21FF},   // arrows
        {0x2300, 0x23FF},   // misc technical (⌛, ⏫, ...)
        {0x2460, 0x27BF},   // enclosed, shapes, misc symbols, dingbats
        {0x2B00, 0x2BFF},   // misc symbols and arrows (⬛, ⭐, ...)
        {0x1F000, 0x1FAFF}, // supplementary pictographs
    });
}

bool GlyphAlphabet::contains(char32_t cp) const {
    return std::any_of(ranges_.begin(), ranges_.end(), [cp](const auto& r) {
        return cp >= r.first && cp <= r.second;
    });
}

bool GlyphAlphabet::occursIn(const QString& line) const {
    for (const char32_t cp : codePoints(line)) {
        if (contains(cp)) return true;
    }
    return false;
}

bool GlyphAlphabet::composes(const QString& line) const {
    bool any = false;
    for (const char32_t cp : codePoints(line)) {
        if (isGlyphModifier(cp)) continue;
        if (cp <= 0xFFFF && QChar(static_cast<char16_t>(cp)).isSpace()) continue;
        if (!contains(cp)) return false;
        any = true;
    }
    return any;
}

int GlyphAlphabet::count(const QString& line) const {
    int n = 0;
    for (const char32_t cp : codePoints(line)) {
        if (contains(cp)) ++n;
    }
    return n;
}

QStringList GlyphAlphabet::gridLines(const QStringList& lines) const {
    QStringList out;
    for (const auto& line : lines) {
        if (occursIn(line)) out.push_back(line);
    }
    return out;
}

} // namespace puzzlelog::domain::sharetext
