#pragma once

#include <optional>

#include "domain/domain_model.hpp"

namespace puzzlelog::app {

// Port/interface for the record store the ingestor feeds.
// Storage itself is an external collaborator.
class IRecordRepository {
public:
    virtual ~IRecordRepository() = default;

    // Most recent record (by createdAt) of this owner for this game.
    virtual std::optional<puzzlelog::domain::GameRecord>
    latestRecord(const puzzlelog::domain::OwnerId& owner,
                 const puzzlelog::domain::GameId& game) const = 0;

    virtual void append(const puzzlelog::domain::GameRecord& record) = 0;
};

} // namespace puzzlelog::app
