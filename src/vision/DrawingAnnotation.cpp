#include "vision/DrawingAnnotation.h"

#include <QtCore/QRegularExpression>

namespace vision
{

namespace
{

struct KindName
{
    AnnotationKind kind;
    const char* name;
};

constexpr KindName kKindNames[] = {
    {AnnotationKind::OuterDiameter, "outer_diameter"},
    {AnnotationKind::Bore, "bore"},
    {AnnotationKind::Hole, "hole"},
    {AnnotationKind::Thread, "thread"},
    {AnnotationKind::Length, "length"},
    {AnnotationKind::Chamfer, "chamfer"},
    {AnnotationKind::SurfaceFinish, "surface_finish"},
    {AnnotationKind::Other, "other"},
};

double parseNumber(QString text)
{
    return text.replace(QLatin1Char(','), QLatin1Char('.')).toDouble();
}

} // namespace

QString toString(AnnotationKind kind)
{
    for (const KindName& entry : kKindNames)
    {
        if (entry.kind == kind)
        {
            return QString::fromLatin1(entry.name);
        }
    }
    return QStringLiteral("other");
}

AnnotationKind annotationKindFromString(const QString& text)
{
    const QString lower = text.trimmed().toLower();
    for (const KindName& entry : kKindNames)
    {
        if (lower == QLatin1String(entry.name))
        {
            return entry.kind;
        }
    }
    if (lower == QLatin1String("inner_diameter"))
    {
        return AnnotationKind::Bore;
    }
    if (lower == QLatin1String("through_hole"))
    {
        return AnnotationKind::Hole;
    }
    if (lower.startsWith(QLatin1String("thread")))
    {
        return AnnotationKind::Thread;
    }
    return AnnotationKind::Other;
}

ConfidenceBand confidenceBand(double confidence)
{
    if (confidence >= 0.95)
    {
        return ConfidenceBand::Printed;
    }
    if (confidence >= 0.80)
    {
        return ConfidenceBand::MinorAmbiguity;
    }
    if (confidence >= 0.50)
    {
        return ConfidenceBand::SpatialInference;
    }
    return ConfidenceBand::Guess;
}

QString toString(ConfidenceBand band)
{
    switch (band)
    {
    case ConfidenceBand::Printed: return QStringLiteral("printed");
    case ConfidenceBand::MinorAmbiguity: return QStringLiteral("minor_ambiguity");
    case ConfidenceBand::SpatialInference: return QStringLiteral("spatial_inference");
    case ConfidenceBand::Guess: return QStringLiteral("guess");
    }
    return QStringLiteral("guess");
}

std::optional<ThreadDesignation> parseThreadDesignation(const QString& text)
{
    static const QRegularExpression pattern(
        QStringLiteral("(?<![A-Za-z])M\\s?(\\d+(?:[.,]\\d+)?)(?:\\s*[xX\\x{00D7}*]\\s*(\\d+(?:[.,]\\d+)?))?"));

    const QRegularExpressionMatch match = pattern.match(text);
    if (!match.hasMatch())
    {
        return std::nullopt;
    }

    ThreadDesignation designation;
    designation.nominal_mm = parseNumber(match.captured(1));
    if (designation.nominal_mm <= 0.0)
    {
        return std::nullopt;
    }
    if (!match.captured(2).isEmpty())
    {
        const double pitch = parseNumber(match.captured(2));
        if (pitch > 0.0)
        {
            designation.pitch_mm = pitch;
        }
    }
    return designation;
}

bool isDiameterKind(AnnotationKind kind)
{
    return kind == AnnotationKind::OuterDiameter || kind == AnnotationKind::Bore || kind == AnnotationKind::Hole
           || kind == AnnotationKind::Thread;
}

} // namespace vision
