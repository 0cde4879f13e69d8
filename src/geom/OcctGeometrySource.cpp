#include "geom/OcctGeometrySource.h"

#include "common/Errors.h"
#include "common/log.h"

#include <QtCore/QDir>
#include <QtCore/QTemporaryFile>

#include <cmath>

#ifdef WITH_OCCT
#    include <BRepAdaptor_Surface.hxx>
#    include <BRepBndLib.hxx>
#    include <BRepGProp.hxx>
#    include <Bnd_Box.hxx>
#    include <GProp_GProps.hxx>
#    include <GeomAbs_SurfaceType.hxx>
#    include <IFSelect_ReturnStatus.hxx>
#    include <IGESControl_Reader.hxx>
#    include <STEPControl_Reader.hxx>
#    include <Standard_Failure.hxx>
#    include <TopAbs_Orientation.hxx>
#    include <TopAbs_ShapeEnum.hxx>
#    include <TopExp_Explorer.hxx>
#    include <TopoDS.hxx>
#    include <TopoDS_Face.hxx>
#    include <TopoDS_Shape.hxx>
#    include <gp_Ax3.hxx>
#    include <gp_Cone.hxx>
#    include <gp_Cylinder.hxx>
#    include <gp_Torus.hxx>
#endif

namespace geom
{

namespace
{

#ifdef WITH_OCCT

bool isIgesFormat(const QString& format)
{
    const QString lower = format.toLower();
    return lower == QLatin1String("iges") || lower == QLatin1String("igs");
}

common::ExtractionError toExtractionError(const Standard_Failure& failure)
{
    const char* message = failure.GetMessageString();
    return common::ExtractionError(message && message[0]
                                       ? QStringLiteral("OpenCASCADE exception: %1").arg(QString::fromUtf8(message))
                                       : QStringLiteral("OpenCASCADE exception during extraction."));
}

const char* toString(IFSelect_ReturnStatus status)
{
    switch (status)
    {
    case IFSelect_RetDone:
        return "success";
    case IFSelect_RetError:
        return "error";
    case IFSelect_RetFail:
        return "failure";
    case IFSelect_RetVoid:
        return "void";
    default:
        return "unknown";
    }
}

template <typename Reader>
TopoDS_Shape readShape(const QString& path, const char* formatName)
{
    Reader reader;
    const QByteArray nativePath = QDir::toNativeSeparators(path).toUtf8();
    const IFSelect_ReturnStatus status = reader.ReadFile(nativePath.constData());
    if (status != IFSelect_RetDone)
    {
        throw common::ExtractionError(
            QStringLiteral("OpenCASCADE failed to read %1 data (%2).").arg(formatName, toString(status)));
    }
    if (reader.TransferRoots() <= 0)
    {
        throw common::ExtractionError(QStringLiteral("%1 data did not contain transferable solids.").arg(formatName));
    }
    TopoDS_Shape shape = reader.OneShape();
    if (shape.IsNull())
    {
        throw common::ExtractionError(QStringLiteral("%1 data produced an empty shape.").arg(formatName));
    }
    return shape;
}

glm::dvec3 toVec(const gp_Dir& dir)
{
    return {dir.X(), dir.Y(), dir.Z()};
}

glm::dvec3 toVec(const gp_Pnt& pnt)
{
    return {pnt.X(), pnt.Y(), pnt.Z()};
}

common::Bounds boundsOf(const TopoDS_Shape& shape)
{
    Bnd_Box box;
    BRepBndLib::AddOptimal(shape, box, false, false);
    common::Bounds bounds;
    if (box.IsVoid())
    {
        return bounds;
    }
    double xmin = 0.0, ymin = 0.0, zmin = 0.0, xmax = 0.0, ymax = 0.0, zmax = 0.0;
    box.Get(xmin, ymin, zmin, xmax, ymax, zmax);
    bounds.min = {xmin, ymin, zmin};
    bounds.max = {xmax, ymax, zmax};
    return bounds;
}

// A round face is inner when its material-side normal points toward the axis: the
// surface's natural normal points outward for a direct frame and the face winding may flip it.
void setRoundFrame(RawFace& raw, const gp_Ax3& position, bool faceReversed)
{
    raw.axis = toVec(position.Direction());
    raw.axisOrigin = toVec(position.Location());
    raw.reversed = position.Direct() == faceReversed;
}

RawFace describeFace(const TopoDS_Face& face)
{
    RawFace raw;
    const bool faceReversed = face.Orientation() == TopAbs_REVERSED;
    raw.reversed = faceReversed;

    BRepAdaptor_Surface surface(face, true);
    switch (surface.GetType())
    {
    case GeomAbs_Plane:
        raw.surfaceType = SurfaceType::Planar;
        break;
    case GeomAbs_Cylinder: {
        const gp_Cylinder cylinder = surface.Cylinder();
        raw.surfaceType = SurfaceType::Cylindrical;
        raw.diameter_mm = 2.0 * cylinder.Radius();
        setRoundFrame(raw, cylinder.Position(), faceReversed);
        break;
    }
    case GeomAbs_Cone: {
        const gp_Cone cone = surface.Cone();
        raw.surfaceType = SurfaceType::Conical;
        raw.diameter_mm = 2.0 * cone.RefRadius();
        setRoundFrame(raw, cone.Position(), faceReversed);
        break;
    }
    case GeomAbs_Torus: {
        const gp_Torus torus = surface.Torus();
        raw.surfaceType = SurfaceType::Toroidal;
        raw.diameter_mm = 2.0 * torus.MajorRadius();
        setRoundFrame(raw, torus.Position(), faceReversed);
        break;
    }
    default:
        raw.surfaceType = SurfaceType::Freeform;
        break;
    }

    GProp_GProps props;
    BRepGProp::SurfaceProperties(face, props);
    raw.area_mm2 = props.Mass();
    raw.bounds = boundsOf(face);
    return raw;
}

RawSolid measureShape(const TopoDS_Shape& shape)
{
    RawSolid solid;
    solid.bounds = boundsOf(shape);

    GProp_GProps volumeProps;
    BRepGProp::VolumeProperties(shape, volumeProps);
    solid.volume_mm3 = std::abs(volumeProps.Mass());

    for (TopExp_Explorer exp(shape, TopAbs_FACE); exp.More(); exp.Next())
    {
        solid.faces.push_back(describeFace(TopoDS::Face(exp.Current())));
    }
    return solid;
}

#else

constexpr const char* kOcctEnableHint =
    "STEP/IGES extraction requires OpenCASCADE. Reconfigure with -DWITH_OCCT=ON.";

#endif

} // namespace

OcctGeometrySource::OcctGeometrySource(SummaryOptions options)
    : m_options(options)
{
}

QString OcctGeometrySource::name() const
{
    return QStringLiteral("opencascade");
}

bool OcctGeometrySource::isAvailable() const
{
#ifdef WITH_OCCT
    return true;
#else
    return false;
#endif
}

GeometrySummary OcctGeometrySource::extract(const CadInput& input)
{
#ifdef WITH_OCCT
    if (input.bytes.isEmpty())
    {
        throw common::ExtractionError(QStringLiteral("CAD input for %1 is empty.").arg(input.sourceId));
    }

    const bool iges = isIgesFormat(input.format);
    QTemporaryFile file(QDir::tempPath() + (iges ? QStringLiteral("/machest-XXXXXX.igs")
                                                 : QStringLiteral("/machest-XXXXXX.step")));
    if (!file.open() || file.write(input.bytes) != input.bytes.size() || !file.flush())
    {
        throw common::ExtractionError(QStringLiteral("Could not stage CAD bytes for %1.").arg(input.sourceId));
    }
    file.close();

    TopoDS_Shape shape;
    try
    {
        shape = iges ? readShape<IGESControl_Reader>(file.fileName(), "IGES")
                     : readShape<STEPControl_Reader>(file.fileName(), "STEP");
    }
    catch (const Standard_Failure& failure)
    {
        throw toExtractionError(failure);
    }
    return extractShape(input.sourceId, shape);
#else
    Q_UNUSED(m_options);
    LOG_WARN(Geom, QStringLiteral("%1: %2").arg(input.sourceId, QString::fromLatin1(kOcctEnableHint)));
    throw common::ExtractionError(QString::fromLatin1(kOcctEnableHint));
#endif
}

#ifdef WITH_OCCT
GeometrySummary OcctGeometrySource::extractShape(const QString& sourceId, const TopoDS_Shape& shape) const
{
    if (shape.IsNull())
    {
        throw common::ExtractionError(QStringLiteral("Shape for %1 is empty.").arg(sourceId));
    }

    RawSolid solid;
    try
    {
        solid = measureShape(shape);
    }
    catch (const Standard_Failure& failure)
    {
        throw toExtractionError(failure);
    }

    GeometrySummary summary = summarize(sourceId, solid, m_options);
    summary.extractor = name();
    return summary;
}
#endif

} // namespace geom
