#pragma once

#include "geom/GeometryTypes.h"

#include <QtCore/QString>

namespace geom
{

// Capability seam for geometry kernels. Implementations are selected at runtime by
// isAvailable(), so callers never branch on build configuration.
class IGeometrySource
{
public:
    virtual ~IGeometrySource() = default;

    [[nodiscard]] virtual QString name() const = 0;
    [[nodiscard]] virtual bool isAvailable() const = 0;

    // Throws common::ExtractionError when the input cannot be turned into a summary.
    virtual GeometrySummary extract(const CadInput& input) = 0;
};

} // namespace geom
