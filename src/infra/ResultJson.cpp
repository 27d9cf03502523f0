#include "infra/ResultJson.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

#include <cmath>
#include <stdexcept>

#include "domain/period/PuzzlePeriod.hpp"

namespace puzzlelog::infra {

using puzzlelog::domain::Game;
using puzzlelog::domain::GameRecord;
using puzzlelog::domain::ParsedResult;
using puzzlelog::domain::ScoreMap;
using puzzlelog::domain::ScoreValue;
using puzzlelog::domain::StreakState;
namespace period = puzzlelog::domain::period;

namespace {

QJsonValue scoreToJson(const ScoreValue& v) {
    if (const auto* i = std::get_if<std::int64_t>(&v)) return QJsonValue(static_cast<qint64>(*i));
    if (const auto* d = std::get_if<double>(&v)) return QJsonValue(*d);
    return QJsonValue(QString::fromStdString(std::get<std::string>(v)));
}

ScoreValue scoreFromJson(const QJsonValue& v) {
    if (v.isString()) {
        return v.toString().toStdString();
    }
    const double d = v.toDouble();
    // [-2^63, 2^63): the doubles that convert to int64 without overflow.
    constexpr double kInt64Bound = 9223372036854775808.0;
    if (std::isfinite(d) && d >= -kInt64Bound && d < kInt64Bound) {
        const auto i = static_cast<std::int64_t>(d);
        if (static_cast<double>(i) == d) {
            return i;
        }
    }
    return d;
}

void insertIf(QJsonObject& o, const char* key, const std::optional<std::string>& v) {
    if (v) o.insert(QLatin1String(key), QString::fromStdString(*v));
}

void insertIf(QJsonObject& o, const char* key, const std::optional<int>& v) {
    if (v) o.insert(QLatin1String(key), *v);
}

std::optional<std::string> optString(const QJsonObject& o, const char* key) {
    const auto v = o.value(QLatin1String(key));
    if (!v.isString()) return std::nullopt;
    return v.toString().toStdString();
}

} // namespace

QJsonObject scoresToJson(const ScoreMap& scores) {
    QJsonObject o;
    for (const auto& [puzzle, fields] : scores) {
        QJsonObject fo;
        for (const auto& [field, value] : fields) {
            fo.insert(QString::fromStdString(field), scoreToJson(value));
        }
        o.insert(QString::fromStdString(puzzle), fo);
    }
    return o;
}

ScoreMap scoresFromJson(const QJsonObject& o) {
    ScoreMap out;
    for (auto it = o.begin(); it != o.end(); ++it) {
        if (!it.value().isObject()) continue;
        auto& fields = out[it.key().toStdString()];
        const auto fo = it.value().toObject();
        for (auto f = fo.begin(); f != fo.end(); ++f) {
            fields.emplace(f.key().toStdString(), scoreFromJson(f.value()));
        }
    }
    return out;
}

QJsonObject parsedResultToJson(const ParsedResult& r) {
    QJsonObject o;
    insertIf(o, "game", r.gameName);
    if (r.scores) o.insert(QStringLiteral("scores"), scoresToJson(*r.scores));
    o.insert(QStringLiteral("failed"), r.failed);
    o.insert(QStringLiteral("completed"), r.completed);
    insertIf(o, "puzzle_number", r.puzzleNumber);
    insertIf(o, "grid", r.grid);

    insertIf(o, "max_attempts", r.maxAttempts);
    if (r.percentage) o.insert(QStringLiteral("percentage"), *r.percentage);
    insertIf(o, "guess_count", r.guessCount);
    if (r.timeMs) o.insert(QStringLiteral("time_ms"), static_cast<qint64>(*r.timeMs));
    insertIf(o, "uniqueness", r.uniqueness);
    insertIf(o, "max_uniqueness", r.maxUniqueness);
    insertIf(o, "max_guess_number", r.maxGuessNumber);
    insertIf(o, "grade", r.grade);

    if (!r.parseWarnings.empty()) {
        QJsonArray warnings;
        for (const auto& w : r.parseWarnings) {
            warnings.push_back(QString::fromStdString(w));
        }
        o.insert(QStringLiteral("warnings"), warnings);
    }
    return o;
}

QJsonObject streaksToJson(const StreakState& s) {
    QJsonObject o;
    o.insert(QStringLiteral("playstreak"), s.playstreak);
    o.insert(QStringLiteral("winstreak"), s.winstreak);
    o.insert(QStringLiteral("max_winstreak"), s.maxWinstreak);
    return o;
}

QJsonObject gameToJson(const Game& g) {
    QJsonObject o;
    o.insert(QStringLiteral("id"), QString::fromStdString(g.id));
    o.insert(QStringLiteral("display_name"), QString::fromStdString(g.displayName));
    o.insert(QStringLiteral("reset_time"), QString::fromStdString(period::formatResetTime(g.resetTime)));
    o.insert(QStringLiteral("asynchronous"), g.isAsynchronous);
    o.insert(QStringLiteral("failable"), g.isFailable);
    if (!g.url.empty()) o.insert(QStringLiteral("url"), QString::fromStdString(g.url));
    return o;
}

QJsonObject recordToJson(const GameRecord& r) {
    QJsonObject meta = streaksToJson(r.metadata.streaks);
    meta.insert(QStringLiteral("share_text"), QString::fromStdString(r.metadata.shareText));
    insertIf(meta, "puzzle_number", r.metadata.puzzleNumber);
    insertIf(meta, "grid", r.metadata.grid);
    insertIf(meta, "notes", r.metadata.notes);

    QJsonObject o;
    o.insert(QStringLiteral("record_id"), QString::fromStdString(r.recordId));
    o.insert(QStringLiteral("owner_id"), QString::fromStdString(r.ownerId));
    o.insert(QStringLiteral("game_id"), QString::fromStdString(r.gameId));
    o.insert(QStringLiteral("created_at"), QString::fromStdString(period::formatTimestamp(r.createdAt)));
    o.insert(QStringLiteral("updated_at"), QString::fromStdString(period::formatTimestamp(r.updatedAt)));
    if (r.scores) o.insert(QStringLiteral("scores"), scoresToJson(*r.scores));
    o.insert(QStringLiteral("failed"), r.failed);
    o.insert(QStringLiteral("metadata"), meta);
    return o;
}

GameRecord recordFromJson(const QString& json) {
    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(json.toUtf8(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        throw std::invalid_argument("Stored record is not a JSON object");
    }

    const auto o = doc.object();
    GameRecord r;
    r.recordId = o.value(QStringLiteral("record_id")).toString().toStdString();
    r.ownerId  = o.value(QStringLiteral("owner_id")).toString().toStdString();
    r.gameId   = o.value(QStringLiteral("game_id")).toString().toStdString();

    // The puzzle day and every later streak hang off created_at.
    const std::string created = o.value(QStringLiteral("created_at")).toString().toStdString();
    const auto createdAt      = period::parseTimestamp(created);
    if (!createdAt) {
        throw std::invalid_argument("Stored record " + r.recordId + " has no valid created_at: '" +
                                    created + "'");
    }
    r.createdAt = *createdAt;
    r.updatedAt = period::parseTimestamp(o.value(QStringLiteral("updated_at")).toString().toStdString())
                      .value_or(r.createdAt);
    if (o.value(QStringLiteral("scores")).isObject()) {
        r.scores = scoresFromJson(o.value(QStringLiteral("scores")).toObject());
    }
    r.failed = o.value(QStringLiteral("failed")).toBool(false);

    const auto meta = o.value(QStringLiteral("metadata")).toObject();
    r.metadata.streaks.playstreak   = meta.value(QStringLiteral("playstreak")).toInt(0);
    r.metadata.streaks.winstreak    = meta.value(QStringLiteral("winstreak")).toInt(0);
    r.metadata.streaks.maxWinstreak = meta.value(QStringLiteral("max_winstreak")).toInt(0);
    r.metadata.shareText    = meta.value(QStringLiteral("share_text")).toString().toStdString();
    r.metadata.puzzleNumber = optString(meta, "puzzle_number");
    r.metadata.grid         = optString(meta, "grid");
    r.metadata.notes        = optString(meta, "notes");

    return r;
}

QJsonObject autoFillToJson(const puzzlelog::domain::sharetext::AutoFill& fill) {
    QJsonObject o;
    if (!fill.ok) {
        o.insert(QStringLiteral("error"), QString::fromStdString(fill.error));
        return o;
    }
    o.insert(QStringLiteral("completed"), fill.completed);
    o.insert(QStringLiteral("failed"), fill.failed);
    o.insert(QStringLiteral("share_text"), QString::fromStdString(fill.shareText));
    return o;
}

QString toCompactJson(const QJsonObject& o) {
    return QString::fromUtf8(QJsonDocument(o).toJson(QJsonDocument::Compact));
}

} // namespace puzzlelog::infra
