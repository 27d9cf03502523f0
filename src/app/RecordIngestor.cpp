#include "app/RecordIngestor.hpp"

#include <QDebug>
#include <QString>
#include <QUuid>

#include <exception>

#include "app/IGameCatalog.hpp"
#include "app/IRecordRepository.hpp"
#include "domain/streak/StreakAccumulator.hpp"

namespace puzzlelog::app {

using puzzlelog::domain::GameRecord;
using puzzlelog::domain::StreakState;
namespace period    = puzzlelog::domain::period;
namespace sharetext = puzzlelog::domain::sharetext;
namespace streak    = puzzlelog::domain::streak;

namespace {

IngestResult failure(std::string error) {
    IngestResult r;
    r.ok    = false;
    r.error = std::move(error);
    return r;
}

std::string makeRecordId() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
}

} // namespace

RecordIngestor::RecordIngestor(const IGameCatalog& catalog,
                               IRecordRepository& records,
                               sharetext::ShareTextParser parser,
                               ContextFn context)
    : catalog_(catalog)
    , records_(records)
    , parser_(std::move(parser))
    , context_(std::move(context)) {
    if (!context_) {
        context_ = [] { return period::PeriodContext{}; };
    }
}

RecordIngestor::KeyLock::KeyLock(RecordIngestor& ingestor, Key key)
    : ingestor_(ingestor)
    , key_(std::move(key)) {
    {
        std::lock_guard<std::mutex> guard(ingestor_.locksMutex_);
        auto& slot = ingestor_.locks_[key_];
        if (!slot) {
            slot = std::make_shared<std::mutex>();
        }
        mutex_ = slot;
    }
    lock_ = std::unique_lock<std::mutex>(*mutex_);
}

RecordIngestor::KeyLock::~KeyLock() {
    lock_.unlock();

    // Copies are only handed out under locksMutex_, so a count of two (the
    // table and this lock) means nobody else holds or waits for the key.
    std::lock_guard<std::mutex> guard(ingestor_.locksMutex_);
    const auto it = ingestor_.locks_.find(key_);
    if (it != ingestor_.locks_.end() && it->second == mutex_ && mutex_.use_count() == 2) {
        ingestor_.locks_.erase(it);
    }
}

std::size_t RecordIngestor::lockedKeyCount() const {
    std::lock_guard<std::mutex> guard(locksMutex_);
    return locks_.size();
}

IngestResult RecordIngestor::ingest(const IngestRequest& request) {
    const auto game = findGame(catalog_.load(), request.gameId);
    if (!game) {
        qWarning() << "Ingest rejected, unknown game:" << QString::fromStdString(request.gameId);
        return failure("Unknown game '" + request.gameId + "'");
    }

    sharetext::ParseOutcome parsed;
    // Multi-mode games take the daily summary as one record, one score per mode.
    if (game->scoreTypes.size() > 1) {
        if (auto summary = parser_.parseSummary(request.shareText, *game)) {
            qDebug() << "Read" << QString::fromStdString(game->id) << "summary with"
                     << summary->scores->size() << "modes";
            parsed.ok     = true;
            parsed.result = std::move(*summary);
        }
    }

    if (!parsed.ok) {
        // Games without a grammar of their own go through detection/fallback.
        std::optional<std::string> expected;
        if (request.validateGame) {
            if (parser_.supports(game->id)) {
                expected = game->id;
            } else if (parser_.supports(game->displayName)) {
                expected = game->displayName;
            } else {
                qDebug() << "No share-text grammar for" << QString::fromStdString(game->id)
                         << ", using detection";
            }
        }

        parsed = parser_.parse(request.shareText, expected);
        if (!parsed.ok) {
            qWarning() << "Ingest rejected for" << QString::fromStdString(game->id) << ":"
                       << QString::fromStdString(parsed.error);
            return failure(parsed.error);
        }
    }

    const period::PeriodContext ctx = context_();

    const KeyLock keyLock(*this, {request.ownerId, game->id});

    std::optional<streak::PriorRecord> prior;
    if (const auto latest = records_.latestRecord(request.ownerId, game->id)) {
        prior = streak::priorFrom(*latest);

        const QDate day     = period::puzzleDay(ctx.now, *game, ctx.localZone);
        const QDate lastDay = period::puzzleDay(latest->createdAt, *game, ctx.localZone);
        if (lastDay == day) {
            qWarning() << "Ingest rejected, puzzle day already recorded:"
                       << QString::fromStdString(request.ownerId)
                       << QString::fromStdString(game->id) << day.toString(Qt::ISODate);
            return failure("A result for " + game->displayName + " is already recorded for " +
                           period::formatPuzzleDay(day));
        }
    }

    const StreakState streaks = streak::accumulate(parsed.result.failed, ctx.now, prior, *game,
                                                   ctx.localZone);

    GameRecord record;
    record.recordId  = makeRecordId();
    record.ownerId   = request.ownerId;
    record.gameId    = game->id;
    record.createdAt = ctx.now;
    record.updatedAt = ctx.now;
    record.scores    = parsed.result.scores;
    record.failed    = parsed.result.failed;

    record.metadata.streaks      = streaks;
    record.metadata.shareText    = QString::fromStdString(request.shareText).trimmed().toStdString();
    record.metadata.puzzleNumber = parsed.result.puzzleNumber;
    record.metadata.grid         = parsed.result.grid;
    record.metadata.notes        = request.notes;

    try {
        records_.append(record);
    } catch (const std::exception& e) {
        qWarning() << "Failed to store record for" << QString::fromStdString(game->id) << ":" << e.what();
        return failure(std::string("Failed to store record: ") + e.what());
    }

    qInfo() << "Recorded" << QString::fromStdString(game->id)
            << "for" << QString::fromStdString(request.ownerId)
            << (record.failed ? "(failed)" : "(won)")
            << QString::fromStdString(domain::to_string(streaks));

    IngestResult out;
    out.ok       = true;
    out.record   = std::move(record);
    out.warnings = parsed.result.parseWarnings;
    return out;
}

} // namespace puzzlelog::app
