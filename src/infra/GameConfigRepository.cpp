#include "infra/GameConfigRepository.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QDebug>

#include <stdexcept>

#include "domain/period/PuzzlePeriod.hpp"

namespace puzzlelog::infra {

using puzzlelog::domain::Game;
using puzzlelog::domain::ScoreTypes;

namespace {

Game makeGame(const char* id, const char* name, bool failable, ScoreTypes scoreTypes,
              const char* url = "") {
    Game g;
    g.id             = id;
    g.displayName    = name;
    g.resetTime      = {0, 0};
    g.isAsynchronous = true;
    g.isFailable     = failable;
    g.url            = url;
    g.scoreTypes     = std::move(scoreTypes);
    return g;
}

ScoreTypes scoreTypesFromJson(const QJsonObject& o) {
    ScoreTypes out;
    for (auto it = o.begin(); it != o.end(); ++it) {
        if (!it.value().isObject()) continue;
        auto& fields = out[it.key().toStdString()];
        const auto fo = it.value().toObject();
        for (auto f = fo.begin(); f != fo.end(); ++f) {
            fields[f.key().toStdString()] = f.value().toInt(-1);
        }
    }
    return out;
}

QJsonObject scoreTypesToJson(const ScoreTypes& types) {
    QJsonObject o;
    for (const auto& [puzzle, fields] : types) {
        QJsonObject fo;
        for (const auto& [field, max] : fields) {
            fo.insert(QString::fromStdString(field), max);
        }
        o.insert(QString::fromStdString(puzzle), fo);
    }
    return o;
}

} // namespace

GameConfigRepository::GameConfigRepository(std::string path)
    : path_(std::move(path)) {
}

std::vector<Game> GameConfigRepository::defaultGames() {
    return {
        makeGame("wantedle", "Wantedle", true, {{"puzzle1", {{"time", -1}, {"grade", -1}}}}),
        makeGame("chronophoto", "Chronophoto", true, {{"puzzle1", {{"points", -1}}}},
                 "https://www.chronophoto.app/daily.html"),
        makeGame("angle", "Angle", true, {{"puzzle1", {{"attempts", 4}}}}),
        makeGame("genshindle", "Genshindle", true, {{"puzzle1", {{"attempts", 5}}}}),
        makeGame("gamedle", "Gamedle", true, {{"puzzle1", {{"attempts", 6}}}}),
        makeGame("r34dle", "r34dle", true, {{"puzzle1", {{"solved", 10}}}}),
        makeGame("scrandle", "Scrandle", true, {{"puzzle1", {{"solved", 10}}}}, "https://scrandle.com"),
        makeGame("connections", "Connections", true, {{"puzzle1", {{"solved", 4}}}}),
        makeGame("quordle", "Quordle", true, {{"puzzle1", {{"solved", 4}, {"attempts", 9}}}}),
        makeGame("worldle", "Worldle", true, {{"puzzle1", {{"accuracy", 100}, {"attempts", 6}}}}),
        makeGame("nerdle", "Nerdle", true, {{"puzzle1", {{"attempts", 6}}}}),
        makeGame("colorfle", "Colorfle", true, {{"puzzle1", {{"attempts", 6}, {"accuracy", 100}}}}),
        makeGame("hexcodle", "Hexcodle", true, {{"puzzle1", {{"accuracy", 100}, {"attempts", 5}}}},
                 "https://hexcodle.com"),
        makeGame("colorguesser", "ColorGuesser", false, {{"puzzle1", {{"points", 500}}}}),
        makeGame("timingle", "Timingle", false, {{"puzzle1", {{"time", -1}}}}),
        makeGame("spellcheck", "Spellcheck", false, {{"puzzle1", {{"solved", 15}}}}),
        makeGame("pokedoku", "Pokedoku", false,
                 {{"puzzle1", {{"solved", 9}, {"uniqueness", -1}, {"maxUniqueness", -1}}}}),
        makeGame("bandle", "Bandle", true, {{"puzzle1", {{"attempts", 6}}}}),
        makeGame("wordle", "Wordle", true, {{"puzzle1", {{"attempts", 6}}}}),
        // Multi-mode games, recorded from their daily summary.
        makeGame("loldle", "LoLdle", false,
                 {{"classic", {{"attempts", -1}}}, {"quote", {{"attempts", -1}}},
                  {"ability", {{"attempts", -1}}}, {"emoji", {{"attempts", -1}}},
                  {"splash", {{"attempts", -1}}}},
                 "https://loldle.net"),
        makeGame("pokedle", "Pokedle", false,
                 {{"classic", {{"attempts", -1}}}, {"card", {{"attempts", -1}}},
                  {"description", {{"attempts", -1}}}, {"silhouette", {{"attempts", -1}}}}),
    };
}

std::vector<Game> GameConfigRepository::load() const {
    QFile file(QString::fromStdString(path_));
    if (!file.exists()) {
        qWarning() << "Games config not found, using defaults:" << QString::fromStdString(path_);
        return defaultGames();
    }

    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning() << "Failed to open games config, using defaults:" << QString::fromStdString(path_);
        return defaultGames();
    }

    QJsonParseError parseErr{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &parseErr);
    if (parseErr.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "Invalid games config, using defaults:" << parseErr.errorString();
        return defaultGames();
    }

    const auto rootObj = doc.object();
    if (!rootObj.contains(QStringLiteral("games")) || !rootObj.value(QStringLiteral("games")).isArray()) {
        qWarning() << "Invalid games config, using defaults:" << "missing 'games' array";
        return defaultGames();
    }

    const auto arr = rootObj.value(QStringLiteral("games")).toArray();
    std::vector<Game> games;
    games.reserve(static_cast<std::size_t>(arr.size()));

    for (const auto& v : arr) {
        if (!v.isObject()) {
            continue;
        }
        const auto o = v.toObject();

        Game g;
        g.id          = o.value(QStringLiteral("id")).toString().trimmed().toLower().toStdString();
        g.displayName = o.value(QStringLiteral("display_name")).toString().toStdString();
        if (g.id.empty()) {
            qWarning() << "Invalid game entry in config (missing id), skipping.";
            continue;
        }
        if (g.displayName.empty()) {
            g.displayName = g.id;
        }

        // reset_time is required; there is no default.
        const auto resetValue = o.value(QStringLiteral("reset_time"));
        if (!resetValue.isString()) {
            qWarning() << "Invalid game entry" << QString::fromStdString(g.id)
                       << "skipping: missing reset_time";
            continue;
        }
        const auto reset = resetValue.toString();
        try {
            g.resetTime = puzzlelog::domain::period::parseResetTime(reset.toStdString());
        } catch (const std::invalid_argument& e) {
            qWarning() << "Invalid game entry" << QString::fromStdString(g.id) << "skipping:" << e.what();
            continue;
        }

        g.isAsynchronous = o.value(QStringLiteral("asynchronous")).toBool(false);
        g.isFailable     = o.value(QStringLiteral("failable")).toBool(true);
        g.url            = o.value(QStringLiteral("url")).toString().toStdString();
        g.scoreTypes     = scoreTypesFromJson(o.value(QStringLiteral("score_types")).toObject());

        games.push_back(std::move(g));
    }

    if (games.empty()) {
        qWarning() << "Invalid games config, using defaults:" << "no valid games";
        return defaultGames();
    }

    qDebug() << "Loaded" << games.size() << "games from" << QString::fromStdString(path_);
    return games;
}

void GameConfigRepository::save(const std::vector<Game>& games) const {
    QJsonArray arr;
    for (const auto& g : games) {
        QJsonObject o;
        o.insert(QStringLiteral("id"),           QString::fromStdString(g.id));
        o.insert(QStringLiteral("display_name"), QString::fromStdString(g.displayName));
        o.insert(QStringLiteral("reset_time"),
                 QString::fromStdString(puzzlelog::domain::period::formatResetTime(g.resetTime)));
        o.insert(QStringLiteral("asynchronous"), g.isAsynchronous);
        o.insert(QStringLiteral("failable"),     g.isFailable);
        o.insert(QStringLiteral("url"),          QString::fromStdString(g.url));
        o.insert(QStringLiteral("score_types"),  scoreTypesToJson(g.scoreTypes));
        arr.push_back(o);
    }

    QJsonObject root;
    root.insert(QStringLiteral("games"), arr);

    QFile file(QString::fromStdString(path_));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        qWarning() << "Failed to write games config:" << QString::fromStdString(path_);
        return;
    }

    QJsonDocument doc(root);
    file.write(doc.toJson(QJsonDocument::Indented));
    file.close();
}

} // namespace puzzlelog::infra
