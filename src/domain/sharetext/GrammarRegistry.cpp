#include "domain/sharetext/Grammar.hpp"

namespace puzzlelog::domain::sharetext {

ShareText ShareText::fromUtf8(const std::string& utf8) {
    ShareText st;
    st.text = QString::fromStdString(utf8);

    const QString trimmed = st.text.trimmed();
    if (trimmed.isEmpty()) {
        return st;
    }
    for (QString line : trimmed.split(QLatin1Char('\n'))) {
        if (line.endsWith(QLatin1Char('\r'))) line.chop(1);
        st.lines.push_back(line);
    }
    return st;
}

// --- GrammarRegistry --------------------------------------------------------

GrammarRegistry GrammarRegistry::withDefaultGrammars() {
    GrammarRegistry r;
    // Order only matters for formats that could overlap; keep the more
    // specific signatures first.
    r.add(makeWantedleGrammar());
    r.add(makeChronophotoGrammar());
    r.add(makeAngleGrammar());
    r.add(makeGenshindleGrammar());
    r.add(makeGamedleGrammar());
    r.add(makeR34dleGrammar());
    r.add(makeScrandleGrammar());
    r.add(makeConnectionsGrammar());
    r.add(makeQuordleGrammar());
    r.add(makeWorldleGrammar());
    r.add(makeNerdleGrammar());
    r.add(makeColorfleGrammar());
    r.add(makeHexcodleGrammar());
    r.add(makeColorGuesserGrammar());
    r.add(makeTimingleGrammar());
    r.add(makeSpellcheckGrammar());
    r.add(makePokedokuGrammar());
    r.add(makeBandleGrammar());
    r.add(makeWordleGrammar());
    return r;
}

void GrammarRegistry::add(std::unique_ptr<IGrammar> grammar) {
    if (grammar) {
        grammars_.push_back(std::move(grammar));
    }
}

const IGrammar* GrammarRegistry::detect(const QString& text) const {
    for (const auto& g : grammars_) {
        if (g->signature().match(text).hasMatch()) {
            return g.get();
        }
    }
    return nullptr;
}

const IGrammar* GrammarRegistry::find(const std::string& name) const {
    const QString wanted = QString::fromStdString(name).trimmed();
    if (wanted.isEmpty()) {
        return nullptr;
    }
    for (const auto& g : grammars_) {
        if (wanted.compare(QString::fromStdString(g->id()), Qt::CaseInsensitive) == 0 ||
            wanted.compare(QString::fromStdString(g->displayName()), Qt::CaseInsensitive) == 0) {
            return g.get();
        }
    }
    return nullptr;
}

// --- GrammarBase ------------------------------------------------------------

GrammarBase::GrammarBase(std::string id,
                         std::string displayName,
                         const QString& signaturePattern,
                         std::string expectedFormat,
                         GlyphAlphabet alphabet)
    : id_(std::move(id))
    , displayName_(std::move(displayName))
    , signature_(pattern(signaturePattern))
    , expectedFormat_(std::move(expectedFormat))
    , alphabet_(std::move(alphabet)) {
}

ParseOutcome GrammarBase::mismatch() const {
    return parseError("Incorrect share text for " + displayName_ +
                      ". Expected format: \"" + expectedFormat_ + "\"");
}

ParseOutcome GrammarBase::mismatch(const std::string& detail) const {
    return parseError("Incorrect share text for " + displayName_ + ". " + detail);
}

ParsedResult GrammarBase::start() const {
    ParsedResult r;
    r.gameName = displayName_;
    return r;
}

// --- Helpers ----------------------------------------------------------------

QRegularExpression pattern(const QString& re, bool dotAll) {
    QRegularExpression::PatternOptions opts = QRegularExpression::CaseInsensitiveOption;
    if (dotAll) {
        opts |= QRegularExpression::DotMatchesEverythingOption;
    }
    return QRegularExpression(re, opts);
}

AttemptToken readAttempts(const QString& token) {
    AttemptToken t;
    if (token.compare(QStringLiteral("X"), Qt::CaseInsensitive) == 0) {
        t.failed   = true;
        t.attempts = std::int64_t{-1};
        return t;
    }

    bool ok = false;
    const qint64 v = token.toLongLong(&ok);
    if (ok) {
        t.attempts = static_cast<std::int64_t>(v);
    } else {
        t.attempts = token.toStdString();
    }
    return t;
}

std::optional<std::string> joinGrid(const QStringList& lines) {
    if (lines.isEmpty()) {
        return std::nullopt;
    }
    return lines.join(QLatin1Char('\n')).toStdString();
}

} // namespace puzzlelog::domain::sharetext
