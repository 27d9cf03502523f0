#pragma once

#include <QTimeZone>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "domain/domain_model.hpp"
#include "domain/period/PuzzlePeriod.hpp"
#include "domain/sharetext/ShareTextParser.hpp"

namespace puzzlelog::app {

class IGameCatalog;
class IRecordRepository;

struct IngestRequest {
    puzzlelog::domain::OwnerId ownerId;
    puzzlelog::domain::GameId  gameId;
    std::string                shareText;
    std::optional<std::string> notes;
    // Reject text that is not this game's share text.
    bool validateGame{true};
};

struct IngestResult {
    bool        ok{false};
    std::string error;

    puzzlelog::domain::GameRecord record;
    std::vector<std::string>      warnings;
};

// Parse -> streaks -> append, one record at a time per (owner, game).
//
// Reading the prior record and appending the new one happen under a lock
// keyed by (owner, game), so two concurrent submissions can never both
// extend the same prior streak. Different keys do not block each other.
class RecordIngestor {
public:
    using ContextFn = std::function<puzzlelog::domain::period::PeriodContext()>;

    RecordIngestor(const IGameCatalog& catalog,
                   IRecordRepository& records,
                   puzzlelog::domain::sharetext::ShareTextParser parser,
                   ContextFn context = [] { return puzzlelog::domain::period::PeriodContext{}; });

    IngestResult ingest(const IngestRequest& request);

    // Keys with an ingestion in flight. Entries go away with their last holder.
    std::size_t lockedKeyCount() const;

private:
    using Key = std::pair<std::string, std::string>;

    // Holds one key's mutex for a scope and drops the table entry when no
    // other ingestion holds or waits for it.
    class KeyLock {
    public:
        KeyLock(RecordIngestor& ingestor, Key key);
        ~KeyLock();
        KeyLock(const KeyLock&) = delete;
        KeyLock& operator=(const KeyLock&) = delete;

    private:
        RecordIngestor&              ingestor_;
        Key                          key_;
        std::shared_ptr<std::mutex>  mutex_;
        std::unique_lock<std::mutex> lock_;
    };

    const IGameCatalog&                            catalog_;
    IRecordRepository&                             records_;
    puzzlelog::domain::sharetext::ShareTextParser  parser_;
    ContextFn                                      context_;

    mutable std::mutex                        locksMutex_;
    std::map<Key, std::shared_ptr<std::mutex>> locks_;
};

} // namespace puzzlelog::app
