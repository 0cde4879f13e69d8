#include "common/Units.h"

namespace common
{

namespace
{
constexpr double kMmPerInch = 25.4;
}

double convertLength(double value, UnitSystem from, UnitSystem to)
{
    if (from == to)
    {
        return value;
    }
    if (from == UnitSystem::Inches && to == kInternalUnitSystem)
    {
        return value * kMmPerInch;
    }
    if (from == kInternalUnitSystem && to == UnitSystem::Inches)
    {
        return value / kMmPerInch;
    }
    return value;
}

double toMillimeters(double value, UnitSystem from)
{
    return convertLength(value, from, kInternalUnitSystem);
}

UnitSystem unitFromString(const QString& text, UnitSystem fallback)
{
    const QString lower = text.trimmed().toLower();
    if (lower == QStringLiteral("mm") || lower == QStringLiteral("millimeters") || lower == QStringLiteral("millimetres"))
    {
        return kInternalUnitSystem;
    }
    if (lower == QStringLiteral("inch") || lower == QStringLiteral("inches") || lower == QStringLiteral("in"))
    {
        return UnitSystem::Inches;
    }
    return fallback;
}

} // namespace common
