#pragma once

#include "geom/GeometryTypes.h"

#include <QtCore/QByteArray>
#include <QtCore/QJsonObject>

namespace geom
{

QJsonObject faceToJson(const GeometryFace& face);
GeometryFace faceFromJson(const QJsonObject& object, bool* ok = nullptr);

QJsonObject summaryToJson(const GeometrySummary& summary);
GeometrySummary summaryFromJson(const QJsonObject& object, bool* ok = nullptr);

// Compact JSON with sorted keys; identical summaries give identical bytes.
QByteArray toCanonicalJson(const GeometrySummary& summary);

} // namespace geom
