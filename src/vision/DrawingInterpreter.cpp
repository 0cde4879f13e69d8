#include "vision/DrawingInterpreter.h"

#include "common/Enforce.h"
#include "common/Errors.h"
#include "common/Units.h"
#include "common/log.h"
#include "vision/AnnotationSerialization.h"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QRegularExpression>
#include <QtCore/QStringList>

#include <algorithm>
#include <cmath>
#include <utility>

namespace vision
{

namespace
{

const char* const kSystemPrompt = R"(You are a CNC process engineer reading a manufacturing drawing.
Extract every dimension, diameter, bore, hole, thread, chamfer and surface-finish callout of the PART.

Confidence rubric (field "confidence", 0.0 to 1.0):
- 0.95-1.00: value printed unambiguously on the drawing
- 0.80-0.94: printed, minor ambiguity (overlapping text, unclear leader)
- 0.50-0.79: inferred from spatial reasoning, no explicit label
- below 0.50: a guess

Hard rules:
- Never report title block, header, revision table or parts-list entries as part features.
  If you transcribe one anyway, set "region" to "title_block", "header" or "revision_table".
- Never invent a tolerance. "tolerance" must be copied from the printed callout or be null.
- If a feature cannot be positioned confidently, set "position" to null. Do not guess locations.
- Report values exactly as printed and state the drawing units once in "units".
Answer with JSON only.)";

const char* const kUserPrompt = R"(Return one JSON object:
{
  "units": "mm" or "in",
  "annotations": [
    {
      "label": "short feature name",
      "kind": "outer_diameter|bore|hole|thread|length|chamfer|surface_finish|other",
      "text": "the callout exactly as printed, e.g. \"Ø12 H7\" or \"M30x2\"",
      "nominal_mm": number or null,
      "tolerance": "fit class or deviation as printed, e.g. \"H7\" or \"±0.02\"", or null,
      "designation": "thread designation as printed" or null,
      "length_mm": feature length or depth or null,
      "position": {"axial_start_mm": n, "axial_end_mm": n} measured from the left end face of the main view,
                  or {"x_mm": n, "y_mm": n} from the lower-left corner of the part outline, or null,
      "confidence": number,
      "region": "view|section|detail|note|title_block|header|revision_table",
      "provenance": "which view or note the value was read from"
    }
  ]
}
List features left to right along the main view.)";

const QStringList& nonFeatureRegions()
{
    static const QStringList regions = {QStringLiteral("title_block"), QStringLiteral("header"),
                                        QStringLiteral("revision_table"), QStringLiteral("revision_block"),
                                        QStringLiteral("parts_list"), QStringLiteral("bom")};
    return regions;
}

QByteArray stripMarkdownFences(const QByteArray& text)
{
    QByteArray body = text.trimmed();
    if (!body.startsWith("```"))
    {
        return body;
    }
    const int firstNewline = body.indexOf('\n');
    body = firstNewline < 0 ? QByteArray() : body.mid(firstNewline + 1);
    if (body.endsWith("```"))
    {
        body.chop(3);
    }
    return body.trimmed();
}

QString normalizeCallout(QString text)
{
    text.replace(QStringLiteral("+/-"), QStringLiteral("±"));
    text.remove(QRegularExpression(QStringLiteral("\\s")));
    return text;
}

bool toleranceIsPrinted(const DrawingAnnotation& annotation)
{
    if (!annotation.toleranceClass)
    {
        return true;
    }
    const QString tolerance = normalizeCallout(*annotation.toleranceClass);
    return !tolerance.isEmpty() && normalizeCallout(annotation.text).contains(tolerance);
}

bool requiresNominal(AnnotationKind kind)
{
    return kind == AnnotationKind::OuterDiameter || kind == AnnotationKind::Bore || kind == AnnotationKind::Hole
           || kind == AnnotationKind::Length;
}

void convertToMillimeters(DrawingAnnotation& annotation, common::UnitSystem units)
{
    if (units == common::UnitSystem::Millimeters)
    {
        return;
    }
    const auto convert = [units](double value) { return common::toMillimeters(value, units); };
    if (annotation.nominal_mm)
    {
        annotation.nominal_mm = convert(*annotation.nominal_mm);
    }
    if (annotation.length_mm)
    {
        annotation.length_mm = convert(*annotation.length_mm);
    }
    if (annotation.position)
    {
        annotation.position->axialStart_mm = convert(annotation.position->axialStart_mm);
        annotation.position->axialEnd_mm = convert(annotation.position->axialEnd_mm);
        annotation.position->xy_mm = {convert(annotation.position->xy_mm.x), convert(annotation.position->xy_mm.y)};
    }
}

QString describeHint(const geom::GeometrySummary& hint)
{
    const glm::dvec3 size = hint.bounds.size();
    return QStringLiteral("\nAdvisory context from the CAD model (may be wrong, never copy values from it): "
                          "bounding box %1 x %2 x %3 mm, part looks %4.")
        .arg(size.x, 0, 'f', 1)
        .arg(size.y, 0, 'f', 1)
        .arg(size.z, 0, 'f', 1)
        .arg(geom::toString(hint.partType));
}

} // namespace

DrawingInterpreter::DrawingInterpreter(std::shared_ptr<IVisionClient> client, RetryPolicy policy)
    : m_client(std::move(client))
    , m_policy(policy)
{
    ENFORCE(m_client != nullptr, "DrawingInterpreter requires a vision client.");
}

QString DrawingInterpreter::name() const
{
    return m_client->name();
}

VisionRequest DrawingInterpreter::buildRequest(const DrawingPage& page, const geom::GeometrySummary* hint) const
{
    VisionRequest request;
    request.systemPrompt = QString::fromUtf8(kSystemPrompt);
    request.userPrompt = QString::fromUtf8(kUserPrompt);
    if (hint && !hint->synthetic)
    {
        request.userPrompt += describeHint(*hint);
    }
    request.imagePng = page.pngBytes;
    return request;
}

std::vector<DrawingAnnotation> DrawingInterpreter::interpret(const DrawingPage& page,
                                                            const geom::GeometrySummary* hint,
                                                            const common::CancellationToken& cancel) const
{
    if (page.pngBytes.isEmpty())
    {
        throw common::InterpretationError(QStringLiteral("Drawing page for %1 is empty.").arg(page.sourceId));
    }

    const VisionRequest request = buildRequest(page, hint);
    const int maxAttempts = std::max(1, m_policy.maxAttempts);
    for (int attempt = 1;; ++attempt)
    {
        if (cancel.isCancelled())
        {
            throw common::CancelledError(QStringLiteral("Interpretation of %1 cancelled.").arg(page.sourceId));
        }

        QByteArray raw;
        try
        {
            raw = m_client->complete(request, cancel);
        }
        catch (const common::InterpretationError& error)
        {
            if (!error.isTransient())
            {
                throw;
            }
            if (attempt >= maxAttempts)
            {
                throw common::InterpretationError(
                    QStringLiteral("Vision service failed after %1 attempts: %2").arg(attempt).arg(error.message()),
                    true);
            }
            const int delay = m_policy.backoffMs(attempt);
            LOG_WARN(Vision,
                     QStringLiteral("%1: attempt %2/%3 failed (%4); retrying in %5 ms")
                         .arg(page.sourceId)
                         .arg(attempt)
                         .arg(maxAttempts)
                         .arg(error.message())
                         .arg(delay));
            if (!sleepUnlessCancelled(delay, cancel))
            {
                throw common::CancelledError(QStringLiteral("Interpretation of %1 cancelled.").arg(page.sourceId));
            }
            continue;
        }

        std::vector<DrawingAnnotation> annotations = parseResponse(raw);
        LOG_INFO(Vision,
                 QStringLiteral("%1: %2 annotations after %3 attempt(s)")
                     .arg(page.sourceId)
                     .arg(annotations.size())
                     .arg(attempt));
        return annotations;
    }
}

std::vector<DrawingAnnotation> DrawingInterpreter::parseResponse(const QByteArray& text)
{
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(stripMarkdownFences(text), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
    {
        throw common::InterpretationError(
            QStringLiteral("Vision output is not a JSON object: %1").arg(parseError.errorString()));
    }

    const QJsonObject root = doc.object();
    const QJsonValue entries = root.value(QStringLiteral("annotations"));
    if (!entries.isArray())
    {
        throw common::InterpretationError(QStringLiteral("Vision output lacks an \"annotations\" array."));
    }
    const common::UnitSystem units = common::unitFromString(root.value(QStringLiteral("units")).toString());

    std::vector<DrawingAnnotation> annotations;
    const QJsonArray array = entries.toArray();
    annotations.reserve(array.size());
    for (int i = 0; i < array.size(); ++i)
    {
        const QJsonValue entry = array.at(i);
        if (!entry.isObject())
        {
            throw common::InterpretationError(QStringLiteral("Annotation %1 is not a JSON object.").arg(i));
        }

        const QJsonObject object = entry.toObject();
        bool ok = false;
        DrawingAnnotation annotation = annotationFromJson(object, &ok);
        if (!ok)
        {
            LOG_WARN(Vision, QStringLiteral("Dropped annotation %1: neither kind nor text given").arg(i));
            continue;
        }
        if (nonFeatureRegions().contains(annotation.region.trimmed().toLower()))
        {
            LOG_WARN(Vision, QStringLiteral("Dropped annotation %1 (\"%2\"): %3 entity").arg(i).arg(annotation.text, annotation.region));
            continue;
        }

        if (!toleranceIsPrinted(annotation))
        {
            LOG_WARN(Vision,
                     QStringLiteral("Annotation %1: tolerance \"%2\" not present in \"%3\", removed")
                         .arg(i)
                         .arg(*annotation.toleranceClass, annotation.text));
            annotation.toleranceClass.reset();
        }

        if (!annotation.position && object.value(QStringLiteral("position")).isObject())
        {
            LOG_WARN(Vision, QStringLiteral("Annotation %1: incomplete position, treated as unmatched").arg(i));
        }

        const double confidence = annotation.confidence;
        annotation.confidence = std::isfinite(confidence) ? std::clamp(confidence, 0.0, 1.0) : 0.0;

        convertToMillimeters(annotation, units);

        if (annotation.kind == AnnotationKind::Thread)
        {
            const QString source = annotation.designation.value_or(annotation.text);
            if (const auto thread = parseThreadDesignation(source))
            {
                if (!annotation.designation)
                {
                    annotation.designation = source.trimmed();
                }
                if (!annotation.nominal_mm)
                {
                    annotation.nominal_mm = thread->nominal_mm;
                }
            }
        }

        if (requiresNominal(annotation.kind) && !(annotation.nominal_mm && *annotation.nominal_mm > 0.0))
        {
            LOG_WARN(Vision, QStringLiteral("Dropped annotation %1 (\"%2\"): no nominal value").arg(i).arg(annotation.text));
            continue;
        }

        annotation.provenance = annotation.provenance.isEmpty()
                                    ? toString(confidenceBand(annotation.confidence))
                                    : QStringLiteral("%1 [%2]").arg(annotation.provenance,
                                                                    toString(confidenceBand(annotation.confidence)));
        annotations.push_back(std::move(annotation));
    }
    return annotations;
}

} // namespace vision
