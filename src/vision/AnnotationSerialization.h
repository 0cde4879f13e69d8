#pragma once

#include "vision/DrawingAnnotation.h"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonObject>

namespace vision
{

QJsonObject annotationToJson(const DrawingAnnotation& annotation);

// Lenient decode: absent or mistyped optional fields stay empty. Sets *ok to false
// only when the entry is not usable at all (no kind and no text).
DrawingAnnotation annotationFromJson(const QJsonObject& object, bool* ok = nullptr);

// Returns std::nullopt for an object without the required axial or planar fields.
std::optional<PositionHint> positionFromJson(const QJsonValue& value);

QJsonObject batchToJson(const AnnotationBatch& batch);
AnnotationBatch batchFromJson(const QJsonObject& object);

} // namespace vision
