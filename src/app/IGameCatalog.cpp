#include "app/IGameCatalog.hpp"

#include <QString>

namespace puzzlelog::app {

using puzzlelog::domain::Game;

std::optional<Game> findGame(const std::vector<Game>& games, const std::string& idOrName) {
    const QString wanted = QString::fromStdString(idOrName).trimmed();
    for (const auto& g : games) {
        if (wanted.compare(QString::fromStdString(g.id), Qt::CaseInsensitive) == 0 ||
            wanted.compare(QString::fromStdString(g.displayName), Qt::CaseInsensitive) == 0) {
            return g;
        }
    }
    return std::nullopt;
}

} // namespace puzzlelog::app
