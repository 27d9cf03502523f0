#pragma once

#include <QRegularExpression>
#include <QString>
#include <QStringList>

#include <memory>
#include <string>
#include <vector>

#include "domain/domain_model.hpp"
#include "domain/sharetext/GlyphAlphabet.hpp"

namespace puzzlelog::domain::sharetext {

// Raw pasted text plus its lines. Only the text as a whole is trimmed;
// each line keeps its own spacing and loses a trailing CR.
struct ShareText {
    QString     text;
    QStringList lines;

    static ShareText fromUtf8(const std::string& utf8);
};

struct ParseOutcome {
    bool         ok{false};
    std::string  error;
    ParsedResult result;
};

inline ParseOutcome parseError(std::string message) {
    ParseOutcome o;
    o.ok    = false;
    o.error = std::move(message);
    return o;
}

inline ParseOutcome parsed(ParsedResult result) {
    ParseOutcome o;
    o.ok     = true;
    o.result = std::move(result);
    return o;
}

// One game's share-text format.
//
// The signature only has to recognise the game; parse() then applies the
// full header and scoring rules and may still reject the text. Signatures of
// different grammars must never match the same valid share text.
class IGrammar {
public:
    virtual ~IGrammar() = default;

    virtual const std::string& id() const = 0;
    virtual const std::string& displayName() const = 0;
    virtual const QRegularExpression& signature() const = 0;
    // Example of a valid header, shown to users on mismatch.
    virtual const std::string& expectedFormat() const = 0;
    virtual const GlyphAlphabet& alphabet() const = 0;

    virtual ParseOutcome parse(const ShareText& text) const = 0;
};

// Ordered {signature, grammar} table. Detection walks it front to back.
class GrammarRegistry {
public:
    GrammarRegistry() = default;
    GrammarRegistry(GrammarRegistry&&) noexcept = default;
    GrammarRegistry& operator=(GrammarRegistry&&) noexcept = default;
    GrammarRegistry(const GrammarRegistry&) = delete;
    GrammarRegistry& operator=(const GrammarRegistry&) = delete;

    // Every supported game, in detection order.
    static GrammarRegistry withDefaultGrammars();

    void add(std::unique_ptr<IGrammar> grammar);

    // First grammar whose signature matches, or nullptr.
    const IGrammar* detect(const QString& text) const;
    // Lookup by id or display name; case and surrounding whitespace ignored.
    const IGrammar* find(const std::string& name) const;

    const std::vector<std::unique_ptr<IGrammar>>& grammars() const noexcept {
        return grammars_;
    }

private:
    std::vector<std::unique_ptr<IGrammar>> grammars_;
};

// --- Building blocks shared by the grammar implementations ------------------

// Common plumbing: identity, signature, mismatch messages.
class GrammarBase : public IGrammar {
public:
    const std::string& id() const override { return id_; }
    const std::string& displayName() const override { return displayName_; }
    const QRegularExpression& signature() const override { return signature_; }
    const std::string& expectedFormat() const override { return expectedFormat_; }
    const GlyphAlphabet& alphabet() const override { return alphabet_; }

protected:
    GrammarBase(std::string id,
                std::string displayName,
                const QString& signaturePattern,
                std::string expectedFormat,
                GlyphAlphabet alphabet);

    // "Incorrect share text for <Game>. Expected format: "<example>""
    ParseOutcome mismatch() const;
    ParseOutcome mismatch(const std::string& detail) const;

    ParsedResult start() const;

private:
    std::string        id_;
    std::string        displayName_;
    QRegularExpression signature_;
    std::string        expectedFormat_;
    GlyphAlphabet      alphabet_;
};

// Case-insensitive; `dotAll` lets '.' span lines.
QRegularExpression pattern(const QString& re, bool dotAll = false);

// "X" (any case) is the failure marker and maps to -1. Anything else that is
// not an integer is kept verbatim so normalization can flag it.
struct AttemptToken {
    bool       failed{false};
    ScoreValue attempts{std::int64_t{-1}};
};
AttemptToken readAttempts(const QString& token);

std::optional<std::string> joinGrid(const QStringList& lines);

// Best-effort parse of text no signature recognised: an optional
// "<label> <number> <n>/<max>" header plus any lines of common marker glyphs.
// Never fails; an unrecognisable text yields an uncompleted result.
ParseOutcome parseGeneric(const ShareText& text);

// Factories for the built-in grammars.
std::unique_ptr<IGrammar> makeWantedleGrammar();
std::unique_ptr<IGrammar> makeChronophotoGrammar();
std::unique_ptr<IGrammar> makeAngleGrammar();
std::unique_ptr<IGrammar> makeGenshindleGrammar();
std::unique_ptr<IGrammar> makeGamedleGrammar();
std::unique_ptr<IGrammar> makeR34dleGrammar();
std::unique_ptr<IGrammar> makeScrandleGrammar();
std::unique_ptr<IGrammar> makeConnectionsGrammar();
std::unique_ptr<IGrammar> makeQuordleGrammar();
std::unique_ptr<IGrammar> makeWorldleGrammar();
std::unique_ptr<IGrammar> makeNerdleGrammar();
std::unique_ptr<IGrammar> makeColorfleGrammar();
std::unique_ptr<IGrammar> makeHexcodleGrammar();
std::unique_ptr<IGrammar> makeColorGuesserGrammar();
std::unique_ptr<IGrammar> makeTimingleGrammar();
std::unique_ptr<IGrammar> makeSpellcheckGrammar();
std::unique_ptr<IGrammar> makePokedokuGrammar();
std::unique_ptr<IGrammar> makeBandleGrammar();
std::unique_ptr<IGrammar> makeWordleGrammar();

} // namespace puzzlelog::domain::sharetext
