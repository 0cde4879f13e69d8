#include "geom/FallbackGeometrySource.h"

#include "common/Enforce.h"
#include "common/Hashing.h"
#include "common/log.h"

namespace geom
{

namespace
{

constexpr int kDigestBytesUsed = 10;

unsigned byteAt(const QByteArray& digest, int index)
{
    return static_cast<unsigned char>(digest.at(index));
}

unsigned u16At(const QByteArray& digest, int index)
{
    return byteAt(digest, index) * 256u + byteAt(digest, index + 1);
}

} // namespace

QString FallbackGeometrySource::name() const
{
    return QString::fromLatin1(kFallbackHashName);
}

GeometrySummary FallbackGeometrySource::extract(const CadInput& input)
{
    return generate(input.sourceId);
}

QByteArray fallbackDigest(const QString& identifier)
{
    return common::sha256(identifier.toUtf8());
}

GeometrySummary FallbackGeometrySource::generate(const QString& identifier) const
{
    const QByteArray digest = fallbackDigest(identifier);
    ENFORCE(digest.size() >= kDigestBytesUsed, "SHA-256 digest shorter than the mapping table needs.");

    const double sizeX = 40.0 + u16At(digest, 0) % 161u;
    const double sizeY = 30.0 + u16At(digest, 2) % 141u;
    const double sizeZ = 25.0 + u16At(digest, 4) % 126u;
    const unsigned removalPct = 30u + byteAt(digest, 6) % 50u;
    const int faceCount = 6 + static_cast<int>(byteAt(digest, 7) % 59u);
    const double score = static_cast<double>(u16At(digest, 8) % 1001u) / 1000.0;

    GeometrySummary summary;
    summary.sourceId = identifier;
    summary.extractor = name();
    summary.bounds.min = glm::dvec3(0.0);
    summary.bounds.max = glm::dvec3(sizeX, sizeY, sizeZ);
    summary.volume_mm3 = sizeX * sizeY * sizeZ * static_cast<double>(100u - removalPct) / 100.0;
    summary.faceCount = faceCount;
    summary.rotationalScore = score;
    summary.partType = score > kFallbackRotationalThreshold ? PartType::Rotational : PartType::Prismatic;

    glm::dvec3 axis(0.0);
    axis[common::dominantAxis(summary.bounds.size())] = 1.0;
    summary.principalAxis = axis;

    const double area = 2.0 * (sizeX * sizeY + sizeX * sizeZ + sizeY * sizeZ);
    summary.surfaceAreaRaw_mm2 = area;
    summary.surfaceAreaAdjusted_mm2 = area;
    summary.synthetic = true;

    LOG_WARN(Geom,
             QStringLiteral("Synthetic geometry for \"%1\" (%2): %3 x %4 x %5 mm, score %6")
                 .arg(identifier, name())
                 .arg(sizeX)
                 .arg(sizeY)
                 .arg(sizeZ)
                 .arg(score, 0, 'f', 3));
    return summary;
}

} // namespace geom
