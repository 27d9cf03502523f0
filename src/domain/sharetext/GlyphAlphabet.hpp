#pragma once

#include <QString>
#include <QStringList>

#include <initializer_list>
#include <utility>
#include <vector>

namespace puzzlelog::domain::sharetext {

// Marker glyphs used in share-text grids.
namespace glyph {
constexpr char32_t BlackSquare  = 0x2B1B; // ⬛
constexpr char32_t WhiteSquare  = 0x2B1C; // ⬜
constexpr char32_t RedSquare    = 0x1F7E5;
constexpr char32_t OrangeSquare = 0x1F7E7;
constexpr char32_t YellowSquare = 0x1F7E8;
constexpr char32_t GreenSquare  = 0x1F7E9;
constexpr char32_t BlueSquare   = 0x1F7E6;
constexpr char32_t PurpleSquare = 0x1F7EA;
constexpr char32_t BrownSquare  = 0x1F7EB;

constexpr char32_t RedCircle    = 0x1F534;
constexpr char32_t BlueCircle   = 0x1F535;
constexpr char32_t GreenCircle  = 0x1F7E2;
constexpr char32_t YellowCircle = 0x1F7E1;
constexpr char32_t WhiteCircle  = 0x26AA;

constexpr char32_t Star       = 0x2B50;
constexpr char32_t CheckMark  = 0x2705;
constexpr char32_t CrossMark  = 0x274C;
constexpr char32_t PartyPopper = 0x1F389;

constexpr char32_t ArrowUp        = 0x2B06;
constexpr char32_t ArrowDown      = 0x2B07;
constexpr char32_t ArrowLeft      = 0x2B05;
constexpr char32_t ArrowRight     = 0x27A1;
constexpr char32_t ArrowUpRight   = 0x2197;
constexpr char32_t ArrowDownRight = 0x2198;
constexpr char32_t ArrowDownLeft  = 0x2199;
constexpr char32_t ArrowUpLeft    = 0x2196;

constexpr char32_t DoubleUp   = 0x23EB; // ⏫
constexpr char32_t DoubleDown = 0x23EC; // ⏬
constexpr char32_t SmallUp    = 0x1F53C;
constexpr char32_t SmallDown  = 0x1F53D;

constexpr char32_t VariationSelector16 = 0xFE0F;
constexpr char32_t ZeroWidthJoiner     = 0x200D;
constexpr char32_t CombiningKeycap     = 0x20E3;
} // namespace glyph

std::vector<char32_t> codePoints(const QString& s);

// A fixed set of marker glyphs (single code points or inclusive ranges).
// Variation selectors and joiners never count as glyphs or as foreign
// characters, so "⬆️" and "⬆" are treated alike.
class GlyphAlphabet {
public:
    GlyphAlphabet() = default;
    GlyphAlphabet(std::initializer_list<char32_t> glyphs);

    static GlyphAlphabet ranges(std::initializer_list<std::pair<char32_t, char32_t>> ranges);
    // Emoji-like symbols (arrows, dingbats, the supplementary pictographs).
    static GlyphAlphabet pictographs();

    bool empty() const noexcept { return ranges_.empty(); }
    bool contains(char32_t cp) const;

    // At least one glyph of the alphabet appears in the line.
    bool occursIn(const QString& line) const;
    // The line is non-empty and holds nothing but glyphs (whitespace ignored).
    bool composes(const QString& line) const;
    int  count(const QString& line) const;

    // Lines in which a glyph occurs, in input order.
    QStringList gridLines(const QStringList& lines) const;

private:
    std::vector<std::pair<char32_t, char32_t>> ranges_;
};

bool isGlyphModifier(char32_t cp);

} // namespace puzzlelog::domain::sharetext
