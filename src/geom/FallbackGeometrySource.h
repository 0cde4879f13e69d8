#pragma once

#include "geom/GeometryTypes.h"
#include "geom/IGeometrySource.h"

#include <QtCore/QByteArray>

namespace geom
{

// Versioned name of the identifier-to-geometry mapping; bump when any formula changes.
inline constexpr const char* kFallbackHashName = "machest-fallback-v1";
// Part of the mapping: synthetic part types never follow the configured threshold.
inline constexpr double kFallbackRotationalThreshold = 0.6;

class FallbackGeometrySource : public IGeometrySource
{
public:
    [[nodiscard]] QString name() const override;
    [[nodiscard]] bool isAvailable() const override { return true; }

    GeometrySummary extract(const CadInput& input) override;

    [[nodiscard]] GeometrySummary generate(const QString& identifier) const;
};

// SHA-256 of the identifier's UTF-8 bytes, exactly as given.
[[nodiscard]] QByteArray fallbackDigest(const QString& identifier);

} // namespace geom
