#pragma once

#include <optional>
#include <string>
#include <vector>

#include "domain/domain_model.hpp"

namespace puzzlelog::app {

// Port/interface for reading/writing the game catalogue.
// Implementations live in infra (e.g. JSON file).
class IGameCatalog {
public:
    virtual ~IGameCatalog() = default;

    virtual std::vector<puzzlelog::domain::Game> load() const = 0;
    virtual void save(const std::vector<puzzlelog::domain::Game>& games) const = 0;
};

// Lookup by id or display name, case-insensitive.
std::optional<puzzlelog::domain::Game> findGame(const std::vector<puzzlelog::domain::Game>& games,
                                                const std::string& idOrName);

} // namespace puzzlelog::app
