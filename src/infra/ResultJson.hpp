#pragma once

#include <QJsonObject>
#include <QString>

#include "domain/domain_model.hpp"
#include "domain/sharetext/ShareTextParser.hpp"

namespace puzzlelog::infra {

// JSON shapes used by the CLI and by record stores that keep records as
// documents. Optional fields are omitted when unset.

QJsonObject scoresToJson(const puzzlelog::domain::ScoreMap& scores);
puzzlelog::domain::ScoreMap scoresFromJson(const QJsonObject& o);

QJsonObject parsedResultToJson(const puzzlelog::domain::ParsedResult& r);
QJsonObject streaksToJson(const puzzlelog::domain::StreakState& s);
QJsonObject gameToJson(const puzzlelog::domain::Game& g);

QJsonObject recordToJson(const puzzlelog::domain::GameRecord& r);
// Unknown keys are ignored and missing optional ones keep their defaults.
// Throws std::invalid_argument if the text is not a JSON object or
// created_at is missing or unparsable. A missing updated_at is created_at.
puzzlelog::domain::GameRecord recordFromJson(const QString& json);

QJsonObject autoFillToJson(const puzzlelog::domain::sharetext::AutoFill& fill);

QString toCompactJson(const QJsonObject& o);

} // namespace puzzlelog::infra
