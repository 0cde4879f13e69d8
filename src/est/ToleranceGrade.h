#pragma once

#include <QtCore/QString>

#include <optional>

namespace est
{

// ISO 286 standard tolerance for grade `grade` at nominal size `nominal_mm`, in mm.
// Supports IT5 to IT16.
[[nodiscard]] std::optional<double> standardTolerance_mm(int grade, double nominal_mm);

// IT grade of a printed tolerance. Fit classes ("h6", "H7", "js6", "IT8") are read
// directly; deviations ("±0.01", "+0.02/-0.01", "0/-0.05") map to the finest grade
// whose band is at least as wide. Returns std::nullopt for text it cannot read.
[[nodiscard]] std::optional<int> itGrade(const QString& tolerance, double nominal_mm);

} // namespace est
