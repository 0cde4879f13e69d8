#pragma once

#include <QtCore/QString>

namespace common
{

enum class UnitSystem
{
    Millimeters,
    Inches
};

constexpr UnitSystem kInternalUnitSystem = UnitSystem::Millimeters;

double convertLength(double value, UnitSystem from, UnitSystem to);
double toMillimeters(double value, UnitSystem from);

// Accepts "mm", "millimeters", "in", "inch", "inches" (case-insensitive).
UnitSystem unitFromString(const QString& text, UnitSystem fallback = UnitSystem::Millimeters);

} // namespace common
