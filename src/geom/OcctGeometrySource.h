#pragma once

#include "geom/GeometrySummarizer.h"
#include "geom/IGeometrySource.h"

#ifdef WITH_OCCT
class TopoDS_Shape;
#endif

namespace geom
{

// B-rep extraction through OpenCASCADE. Built without WITH_OCCT the source stays
// constructible but reports itself unavailable.
class OcctGeometrySource : public IGeometrySource
{
public:
    explicit OcctGeometrySource(SummaryOptions options = {});

    [[nodiscard]] QString name() const override;
    [[nodiscard]] bool isAvailable() const override;

    GeometrySummary extract(const CadInput& input) override;

#ifdef WITH_OCCT
    // Summarizes an in-memory shape, e.g. one built with BRepPrimAPI.
    [[nodiscard]] GeometrySummary extractShape(const QString& sourceId, const TopoDS_Shape& shape) const;
#endif

private:
    SummaryOptions m_options;
};

} // namespace geom
