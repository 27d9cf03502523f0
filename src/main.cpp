#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>
#include <QTextStream>

#include <cstdio>
#include <optional>
#include <string>

#include "app/IGameCatalog.hpp"
#include "domain/period/PuzzlePeriod.hpp"
#include "domain/sharetext/ShareTextParser.hpp"
#include "infra/GameConfigRepository.hpp"
#include "infra/ResultJson.hpp"

namespace period    = puzzlelog::domain::period;
namespace sharetext = puzzlelog::domain::sharetext;

namespace {

QTextStream& out() {
    static QTextStream s(stdout);
    return s;
}

QTextStream& err() {
    static QTextStream s(stderr);
    return s;
}

int fail(const QString& message) {
    err() << message << Qt::endl;
    return 1;
}

std::string readStdin() {
    QFile in;
    if (!in.open(stdin, QIODevice::ReadOnly)) {
        return {};
    }
    return in.readAll().toStdString();
}

int runParse(const QCommandLineParser& cli) {
    std::optional<std::string> expected;
    if (cli.isSet(QStringLiteral("game"))) {
        expected = cli.value(QStringLiteral("game")).toStdString();
    }

    const sharetext::ShareTextParser parser;
    const std::string text = readStdin();

    if (cli.isSet(QStringLiteral("brief"))) {
        const auto fill = sharetext::autoFill(parser, text, expected);
        if (!fill.ok) {
            return fail(QString::fromStdString(fill.error));
        }
        out() << puzzlelog::infra::toCompactJson(puzzlelog::infra::autoFillToJson(fill)) << Qt::endl;
        return 0;
    }

    const auto parsed = parser.parse(text, expected);
    if (!parsed.ok) {
        return fail(QString::fromStdString(parsed.error));
    }
    for (const auto& w : parsed.result.parseWarnings) {
        qWarning() << QString::fromStdString(w);
    }
    out() << puzzlelog::infra::toCompactJson(puzzlelog::infra::parsedResultToJson(parsed.result)) << Qt::endl;
    return 0;
}

int runDay(const QCommandLineParser& cli, const puzzlelog::domain::Game& game) {
    period::PeriodContext ctx;
    if (cli.isSet(QStringLiteral("at"))) {
        const auto at = period::parseTimestamp(cli.value(QStringLiteral("at")).toStdString());
        if (!at) {
            return fail(QStringLiteral("Invalid timestamp: ") + cli.value(QStringLiteral("at")));
        }
        ctx.now = *at;
    }

    const QDate day = period::puzzleDay(ctx.now, game, ctx.localZone);
    out() << QString::fromStdString(period::formatPuzzleDay(day)) << Qt::endl;
    return 0;
}

int runReset(const puzzlelog::domain::Game& game) {
    const period::PeriodContext ctx;
    out() << "last reset: " << QString::fromStdString(period::formatTimestamp(period::lastResetInstant(game, ctx)))
          << Qt::endl;
    out() << "next reset in: " << QString::fromStdString(period::formatTimeUntilReset(game, ctx)) << Qt::endl;
    return 0;
}

int runGames(const std::vector<puzzlelog::domain::Game>& games) {
    QJsonArray arr;
    for (const auto& g : games) {
        arr.push_back(puzzlelog::infra::gameToJson(g));
    }
    QJsonObject root;
    root.insert(QStringLiteral("games"), arr);
    out() << puzzlelog::infra::toCompactJson(root) << Qt::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("puzzlelog"));

    QCommandLineParser cli;
    cli.setApplicationDescription(QStringLiteral("Daily puzzle share-text parser and streak tools."));
    cli.addHelpOption();
    cli.addPositionalArgument(QStringLiteral("command"), QStringLiteral("parse | day | reset | games"));

    const QString appDir = QCoreApplication::applicationDirPath();
    cli.addOptions({
        {QStringLiteral("games"), QStringLiteral("Game catalogue JSON."), QStringLiteral("path"),
         appDir + QStringLiteral("/games.json")},
        {QStringLiteral("game"), QStringLiteral("Game id or display name."), QStringLiteral("name")},
        {QStringLiteral("at"), QStringLiteral("ISO-8601 instant (default: now)."), QStringLiteral("timestamp")},
        {QStringLiteral("brief"), QStringLiteral("Print only completed/failed (parse).")},
    });
    cli.process(app);

    const QStringList args = cli.positionalArguments();
    if (args.size() != 1) {
        cli.showHelp(1);
    }
    const QString command = args.front();

    if (command == QLatin1String("parse")) {
        return runParse(cli);
    }

    const QString gamesPath = cli.value(QStringLiteral("games"));
    qDebug() << "Games config path:" << gamesPath;
    const puzzlelog::infra::GameConfigRepository catalog(gamesPath.toStdString());
    const auto games = catalog.load();

    if (command == QLatin1String("games")) {
        return runGames(games);
    }

    if (command != QLatin1String("day") && command != QLatin1String("reset")) {
        return fail(QStringLiteral("Unknown command: ") + command);
    }
    if (!cli.isSet(QStringLiteral("game"))) {
        return fail(QStringLiteral("--game is required for ") + command);
    }
    const auto game = puzzlelog::app::findGame(games, cli.value(QStringLiteral("game")).toStdString());
    if (!game) {
        return fail(QStringLiteral("Unknown game '") + cli.value(QStringLiteral("game")) + QStringLiteral("'"));
    }

    return command == QLatin1String("day") ? runDay(cli, *game) : runReset(*game);
}
