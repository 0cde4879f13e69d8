#include "geom/GeometryTypes.h"

namespace geom
{

QString toString(SurfaceType type)
{
    switch (type)
    {
    case SurfaceType::Planar: return QStringLiteral("planar");
    case SurfaceType::Cylindrical: return QStringLiteral("cylindrical");
    case SurfaceType::Conical: return QStringLiteral("conical");
    case SurfaceType::Toroidal: return QStringLiteral("toroidal");
    case SurfaceType::Freeform: return QStringLiteral("freeform");
    }
    return QStringLiteral("freeform");
}

QString toString(FaceOrientation orientation)
{
    return orientation == FaceOrientation::Inner ? QStringLiteral("inner") : QStringLiteral("outer");
}

QString toString(PartType type)
{
    return type == PartType::Rotational ? QStringLiteral("rotational") : QStringLiteral("prismatic");
}

std::optional<SurfaceType> surfaceTypeFromString(const QString& text)
{
    const QString lower = text.trimmed().toLower();
    if (lower == QStringLiteral("planar"))
    {
        return SurfaceType::Planar;
    }
    if (lower == QStringLiteral("cylindrical"))
    {
        return SurfaceType::Cylindrical;
    }
    if (lower == QStringLiteral("conical"))
    {
        return SurfaceType::Conical;
    }
    if (lower == QStringLiteral("toroidal"))
    {
        return SurfaceType::Toroidal;
    }
    if (lower == QStringLiteral("freeform"))
    {
        return SurfaceType::Freeform;
    }
    return std::nullopt;
}

std::optional<PartType> partTypeFromString(const QString& text)
{
    const QString lower = text.trimmed().toLower();
    if (lower == QStringLiteral("rotational") || lower == QStringLiteral("rot"))
    {
        return PartType::Rotational;
    }
    if (lower == QStringLiteral("prismatic") || lower == QStringLiteral("pri"))
    {
        return PartType::Prismatic;
    }
    return std::nullopt;
}

} // namespace geom
