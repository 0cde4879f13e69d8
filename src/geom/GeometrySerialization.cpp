#include "geom/GeometrySerialization.h"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonValue>

namespace geom
{

namespace
{

QJsonArray vecToJson(const glm::dvec3& v)
{
    return QJsonArray{v.x, v.y, v.z};
}

glm::dvec3 vecFromJson(const QJsonValue& value, bool& valid)
{
    const QJsonArray array = value.toArray();
    if (array.size() != 3)
    {
        valid = false;
        return glm::dvec3(0.0);
    }
    return {array.at(0).toDouble(), array.at(1).toDouble(), array.at(2).toDouble()};
}

QJsonObject boundsToJson(const common::Bounds& bounds)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("min"), vecToJson(bounds.min));
    obj.insert(QStringLiteral("max"), vecToJson(bounds.max));
    return obj;
}

common::Bounds boundsFromJson(const QJsonObject& object, bool& valid)
{
    common::Bounds bounds;
    bounds.min = vecFromJson(object.value(QStringLiteral("min")), valid);
    bounds.max = vecFromJson(object.value(QStringLiteral("max")), valid);
    return bounds;
}

} // namespace

QJsonObject faceToJson(const GeometryFace& face)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("id"), face.id);
    obj.insert(QStringLiteral("surface_type"), toString(face.surfaceType));
    obj.insert(QStringLiteral("diameter_mm"), face.diameter_mm ? QJsonValue(*face.diameter_mm) : QJsonValue());
    obj.insert(QStringLiteral("axis"), vecToJson(face.axis));
    obj.insert(QStringLiteral("axis_origin"), vecToJson(face.axisOrigin));
    obj.insert(QStringLiteral("axial_min_mm"), face.axialMin_mm);
    obj.insert(QStringLiteral("axial_max_mm"), face.axialMax_mm);
    obj.insert(QStringLiteral("bounds"), boundsToJson(face.bounds));
    obj.insert(QStringLiteral("orientation"), toString(face.orientation));
    obj.insert(QStringLiteral("area_mm2"), face.area_mm2);
    return obj;
}

GeometryFace faceFromJson(const QJsonObject& object, bool* ok)
{
    GeometryFace face;
    bool valid = object.contains(QStringLiteral("id"));
    face.id = object.value(QStringLiteral("id")).toInt(-1);

    if (const auto type = surfaceTypeFromString(object.value(QStringLiteral("surface_type")).toString()))
    {
        face.surfaceType = *type;
    }
    else
    {
        valid = false;
    }

    const QJsonValue diameter = object.value(QStringLiteral("diameter_mm"));
    if (diameter.isDouble())
    {
        face.diameter_mm = diameter.toDouble();
    }
    face.axis = vecFromJson(object.value(QStringLiteral("axis")), valid);
    face.axisOrigin = vecFromJson(object.value(QStringLiteral("axis_origin")), valid);
    face.axialMin_mm = object.value(QStringLiteral("axial_min_mm")).toDouble();
    face.axialMax_mm = object.value(QStringLiteral("axial_max_mm")).toDouble();
    face.bounds = boundsFromJson(object.value(QStringLiteral("bounds")).toObject(), valid);
    face.orientation = object.value(QStringLiteral("orientation")).toString() == QLatin1String("inner")
                           ? FaceOrientation::Inner
                           : FaceOrientation::Outer;
    face.area_mm2 = object.value(QStringLiteral("area_mm2")).toDouble();

    if (ok)
    {
        *ok = valid;
    }
    return face;
}

QJsonObject summaryToJson(const GeometrySummary& summary)
{
    QJsonArray faces;
    for (const GeometryFace& face : summary.faces)
    {
        faces.append(faceToJson(face));
    }

    QJsonObject obj;
    obj.insert(QStringLiteral("source_id"), summary.sourceId);
    obj.insert(QStringLiteral("version"), summary.version);
    obj.insert(QStringLiteral("extractor"), summary.extractor);
    obj.insert(QStringLiteral("bounds"), boundsToJson(summary.bounds));
    obj.insert(QStringLiteral("volume_mm3"), summary.volume_mm3);
    obj.insert(QStringLiteral("faces"), faces);
    obj.insert(QStringLiteral("face_count"), summary.faceCount);
    obj.insert(QStringLiteral("principal_axis"), vecToJson(summary.principalAxis));
    obj.insert(QStringLiteral("rotational_score"), summary.rotationalScore);
    obj.insert(QStringLiteral("part_type"), toString(summary.partType));
    obj.insert(QStringLiteral("surface_area_raw_mm2"), summary.surfaceAreaRaw_mm2);
    obj.insert(QStringLiteral("surface_area_adjusted_mm2"), summary.surfaceAreaAdjusted_mm2);
    obj.insert(QStringLiteral("synthetic"), summary.synthetic);
    return obj;
}

GeometrySummary summaryFromJson(const QJsonObject& object, bool* ok)
{
    GeometrySummary summary;
    bool valid = object.contains(QStringLiteral("source_id"));
    summary.sourceId = object.value(QStringLiteral("source_id")).toString();
    summary.version = object.value(QStringLiteral("version")).toInt();
    summary.extractor = object.value(QStringLiteral("extractor")).toString();
    summary.bounds = boundsFromJson(object.value(QStringLiteral("bounds")).toObject(), valid);
    summary.volume_mm3 = object.value(QStringLiteral("volume_mm3")).toDouble();

    const QJsonArray faces = object.value(QStringLiteral("faces")).toArray();
    summary.faces.reserve(faces.size());
    for (const QJsonValue& value : faces)
    {
        bool faceOk = false;
        summary.faces.push_back(faceFromJson(value.toObject(), &faceOk));
        valid = valid && faceOk;
    }

    summary.faceCount = object.value(QStringLiteral("face_count")).toInt(static_cast<int>(summary.faces.size()));
    summary.principalAxis = vecFromJson(object.value(QStringLiteral("principal_axis")), valid);
    summary.rotationalScore = object.value(QStringLiteral("rotational_score")).toDouble();
    if (const auto type = partTypeFromString(object.value(QStringLiteral("part_type")).toString()))
    {
        summary.partType = *type;
    }
    else
    {
        valid = false;
    }
    summary.surfaceAreaRaw_mm2 = object.value(QStringLiteral("surface_area_raw_mm2")).toDouble();
    summary.surfaceAreaAdjusted_mm2 = object.value(QStringLiteral("surface_area_adjusted_mm2")).toDouble();
    summary.synthetic = object.value(QStringLiteral("synthetic")).toBool();

    if (ok)
    {
        *ok = valid;
    }
    return summary;
}

QByteArray toCanonicalJson(const GeometrySummary& summary)
{
    // QJsonObject keeps keys sorted, so compact output is already canonical.
    return QJsonDocument(summaryToJson(summary)).toJson(QJsonDocument::Compact);
}

} // namespace geom
