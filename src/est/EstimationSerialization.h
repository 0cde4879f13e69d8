#pragma once

#include "est/EstimationResult.h"

#include <QtCore/QByteArray>
#include <QtCore/QJsonObject>

namespace est
{

QJsonObject featureToJson(const recon::ReconciledFeature& feature);
recon::ReconciledFeature featureFromJson(const QJsonObject& object, bool* ok = nullptr);

QJsonObject resultToJson(const EstimationResult& result);
EstimationResult resultFromJson(const QJsonObject& object, bool* ok = nullptr);

// Line-oriented rendering of every computed field (the hash itself and the store
// versions excluded) with numbers fixed to six decimals.
QByteArray canonicalText(const EstimationResult& result);

// Hex SHA-256 of canonicalText().
QString determinismHash(const EstimationResult& result);

} // namespace est
