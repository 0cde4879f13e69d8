#include "vision/AnnotationSerialization.h"

#include <QtCore/QJsonValue>

#include <algorithm>
#include <utility>

namespace vision
{

namespace
{

std::optional<double> optionalNumber(const QJsonObject& object, const QString& key)
{
    const QJsonValue value = object.value(key);
    if (value.isDouble())
    {
        return value.toDouble();
    }
    return std::nullopt;
}

std::optional<QString> optionalText(const QJsonObject& object, const QString& key)
{
    const QString text = object.value(key).toString().trimmed();
    if (text.isEmpty())
    {
        return std::nullopt;
    }
    return text;
}

QJsonValue toJson(const std::optional<double>& value)
{
    return value ? QJsonValue(*value) : QJsonValue();
}

QJsonValue toJson(const std::optional<QString>& value)
{
    return value ? QJsonValue(*value) : QJsonValue();
}

} // namespace

std::optional<PositionHint> positionFromJson(const QJsonValue& value)
{
    if (!value.isObject())
    {
        return std::nullopt;
    }
    const QJsonObject object = value.toObject();

    const auto start = optionalNumber(object, QStringLiteral("axial_start_mm"));
    const auto end = optionalNumber(object, QStringLiteral("axial_end_mm"));
    const auto point = optionalNumber(object, QStringLiteral("axial_mm"));
    if (start && end)
    {
        PositionHint hint;
        hint.type = PositionHint::Type::Axial;
        hint.axialStart_mm = std::min(*start, *end);
        hint.axialEnd_mm = std::max(*start, *end);
        return hint;
    }
    if (point)
    {
        PositionHint hint;
        hint.type = PositionHint::Type::Axial;
        hint.axialStart_mm = *point;
        hint.axialEnd_mm = *point;
        return hint;
    }

    const auto x = optionalNumber(object, QStringLiteral("x_mm"));
    const auto y = optionalNumber(object, QStringLiteral("y_mm"));
    if (x && y)
    {
        PositionHint hint;
        hint.type = PositionHint::Type::Planar;
        hint.xy_mm = {*x, *y};
        return hint;
    }
    return std::nullopt;
}

QJsonObject annotationToJson(const DrawingAnnotation& annotation)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("label"), annotation.label);
    obj.insert(QStringLiteral("kind"), toString(annotation.kind));
    obj.insert(QStringLiteral("text"), annotation.text);
    obj.insert(QStringLiteral("nominal_mm"), toJson(annotation.nominal_mm));
    obj.insert(QStringLiteral("tolerance"), toJson(annotation.toleranceClass));
    obj.insert(QStringLiteral("designation"), toJson(annotation.designation));
    obj.insert(QStringLiteral("length_mm"), toJson(annotation.length_mm));
    obj.insert(QStringLiteral("confidence"), annotation.confidence);
    obj.insert(QStringLiteral("region"), annotation.region);
    obj.insert(QStringLiteral("provenance"), annotation.provenance);

    if (annotation.position)
    {
        QJsonObject position;
        if (annotation.position->type == PositionHint::Type::Axial)
        {
            position.insert(QStringLiteral("axial_start_mm"), annotation.position->axialStart_mm);
            position.insert(QStringLiteral("axial_end_mm"), annotation.position->axialEnd_mm);
        }
        else
        {
            position.insert(QStringLiteral("x_mm"), annotation.position->xy_mm.x);
            position.insert(QStringLiteral("y_mm"), annotation.position->xy_mm.y);
        }
        obj.insert(QStringLiteral("position"), position);
    }
    else
    {
        obj.insert(QStringLiteral("position"), QJsonValue());
    }
    return obj;
}

DrawingAnnotation annotationFromJson(const QJsonObject& object, bool* ok)
{
    DrawingAnnotation annotation;
    const QString kindText = object.value(QStringLiteral("kind")).toString();
    annotation.kind = annotationKindFromString(kindText);
    annotation.label = object.value(QStringLiteral("label")).toString(kindText);
    annotation.text = object.value(QStringLiteral("text")).toString();
    annotation.nominal_mm = optionalNumber(object, QStringLiteral("nominal_mm"));
    annotation.toleranceClass = optionalText(object, QStringLiteral("tolerance"));
    annotation.designation = optionalText(object, QStringLiteral("designation"));
    annotation.position = positionFromJson(object.value(QStringLiteral("position")));
    annotation.length_mm = optionalNumber(object, QStringLiteral("length_mm"));
    annotation.confidence = object.value(QStringLiteral("confidence")).toDouble(0.0);
    annotation.region = object.value(QStringLiteral("region")).toString();
    annotation.provenance = object.value(QStringLiteral("provenance")).toString();

    if (ok)
    {
        *ok = !kindText.isEmpty() || !annotation.text.isEmpty();
    }
    return annotation;
}

QJsonObject batchToJson(const AnnotationBatch& batch)
{
    QJsonArray annotations;
    for (const DrawingAnnotation& annotation : batch.annotations)
    {
        annotations.append(annotationToJson(annotation));
    }

    QJsonObject obj;
    obj.insert(QStringLiteral("source_id"), batch.sourceId);
    obj.insert(QStringLiteral("drawing_version"), batch.drawingVersion);
    obj.insert(QStringLiteral("interpreter"), batch.interpreter);
    obj.insert(QStringLiteral("annotations"), annotations);
    return obj;
}

AnnotationBatch batchFromJson(const QJsonObject& object)
{
    AnnotationBatch batch;
    batch.sourceId = object.value(QStringLiteral("source_id")).toString();
    batch.drawingVersion = object.value(QStringLiteral("drawing_version")).toInt();
    batch.interpreter = object.value(QStringLiteral("interpreter")).toString();
    for (const QJsonValue& value : object.value(QStringLiteral("annotations")).toArray())
    {
        bool ok = false;
        DrawingAnnotation annotation = annotationFromJson(value.toObject(), &ok);
        if (ok)
        {
            batch.annotations.push_back(std::move(annotation));
        }
    }
    return batch;
}

} // namespace vision
