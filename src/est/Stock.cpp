#include "est/Stock.h"

#include "geom/GeometrySummarizer.h"

#include <numbers>

namespace est
{

double Stock::volume_mm3() const
{
    if (shape == Shape::Bar)
    {
        return std::numbers::pi * 0.25 * diameter_mm * diameter_mm * length_mm;
    }
    return sizeXYZ_mm.x * sizeXYZ_mm.y * sizeXYZ_mm.z;
}

Stock makeStock(const geom::GeometrySummary& summary, const StockAllowance& allowance)
{
    Stock stock;
    if (summary.partType == geom::PartType::Rotational)
    {
        stock.shape = Stock::Shape::Bar;
        stock.diameter_mm = geom::maxCrossSection(summary) + allowance.barDiameter_mm;
        stock.length_mm = geom::axialLength(summary) + allowance.barLength_mm;
        return stock;
    }

    const glm::dvec3 size = summary.bounds.size();
    stock.shape = Stock::Shape::Block;
    stock.sizeXYZ_mm = {size.x + 2.0 * allowance.blockPerSide_mm,
                        size.y + 2.0 * allowance.blockPerSide_mm,
                        size.z + allowance.blockHeight_mm};
    return stock;
}

} // namespace est
