#pragma once

#include <string>
#include <vector>

#include "domain/domain_model.hpp"
#include "app/IGameCatalog.hpp"

namespace puzzlelog::infra {

class GameConfigRepository : public puzzlelog::app::IGameCatalog {
public:
    explicit GameConfigRepository(std::string path);

    // Load game definitions from JSON file.
    // If the file is missing or invalid, returns the built-in catalogue (one
    // entry per supported share-text format, plus the multi-mode summary
    // games) and logs a warning.
    std::vector<puzzlelog::domain::Game> load() const override;

    void save(const std::vector<puzzlelog::domain::Game>& games) const override;

    static std::vector<puzzlelog::domain::Game> defaultGames();

private:
    std::string path_;
};

} // namespace puzzlelog::infra
