#include "est/EstimationSerialization.h"

#include "common/Hashing.h"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonValue>
#include <QtCore/QTextStream>

namespace est
{

namespace
{

using common::canonicalNumber;

QJsonValue toJson(const std::optional<double>& value)
{
    return value ? QJsonValue(*value) : QJsonValue();
}

QJsonValue toJson(const std::optional<int>& value)
{
    return value ? QJsonValue(*value) : QJsonValue();
}

QJsonValue toJson(const std::optional<QString>& value)
{
    return value ? QJsonValue(*value) : QJsonValue();
}

std::optional<double> optionalDouble(const QJsonValue& value)
{
    return value.isDouble() ? std::optional<double>(value.toDouble()) : std::nullopt;
}

std::optional<int> optionalInt(const QJsonValue& value)
{
    return value.isDouble() ? std::optional<int>(value.toInt()) : std::nullopt;
}

std::optional<QString> optionalString(const QJsonValue& value)
{
    return value.isString() ? std::optional<QString>(value.toString()) : std::nullopt;
}

QString canonical(const std::optional<double>& value)
{
    return value ? canonicalNumber(*value) : QStringLiteral("-");
}

QString canonical(const std::optional<int>& value)
{
    return value ? QString::number(*value) : QStringLiteral("-");
}

QJsonObject warningToJson(const recon::ReconciliationWarning& warning)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("annotation_index"), toJson(warning.annotationIndex));
    obj.insert(QStringLiteral("face_id"), toJson(warning.faceId));
    obj.insert(QStringLiteral("drawing_value_mm"), warning.drawingValue_mm);
    obj.insert(QStringLiteral("geometry_value_mm"), warning.geometryValue_mm);
    obj.insert(QStringLiteral("delta_pct"), warning.deltaPct);
    obj.insert(QStringLiteral("message"), warning.message);
    return obj;
}

recon::ReconciliationWarning warningFromJson(const QJsonObject& object)
{
    recon::ReconciliationWarning warning;
    warning.annotationIndex = optionalInt(object.value(QStringLiteral("annotation_index")));
    warning.faceId = optionalInt(object.value(QStringLiteral("face_id")));
    warning.drawingValue_mm = object.value(QStringLiteral("drawing_value_mm")).toDouble();
    warning.geometryValue_mm = object.value(QStringLiteral("geometry_value_mm")).toDouble();
    warning.deltaPct = object.value(QStringLiteral("delta_pct")).toDouble();
    warning.message = object.value(QStringLiteral("message")).toString();
    return warning;
}

QJsonObject operationToJson(const OperationEstimate& op)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("category"), toString(op.category));
    obj.insert(QStringLiteral("label"), op.label);
    obj.insert(QStringLiteral("key_dimension_mm"), op.keyDimension_mm);
    obj.insert(QStringLiteral("feed_mm_per_rev"), op.feed_mm_per_rev);
    obj.insert(QStringLiteral("rpm"), op.rpm);
    obj.insert(QStringLiteral("passes"), op.passes);
    obj.insert(QStringLiteral("time_min"), op.time_min);
    obj.insert(QStringLiteral("feature_index"), toJson(op.featureIndex));
    return obj;
}

OperationEstimate operationFromJson(const QJsonObject& object, bool& valid)
{
    OperationEstimate op;
    if (const auto category = operationCategoryFromString(object.value(QStringLiteral("category")).toString()))
    {
        op.category = *category;
    }
    else
    {
        valid = false;
    }
    op.label = object.value(QStringLiteral("label")).toString();
    op.keyDimension_mm = object.value(QStringLiteral("key_dimension_mm")).toDouble();
    op.feed_mm_per_rev = object.value(QStringLiteral("feed_mm_per_rev")).toDouble();
    op.rpm = object.value(QStringLiteral("rpm")).toDouble();
    op.passes = object.value(QStringLiteral("passes")).toInt(1);
    op.time_min = object.value(QStringLiteral("time_min")).toDouble();
    op.featureIndex = optionalInt(object.value(QStringLiteral("feature_index")));
    return op;
}

} // namespace

QJsonObject featureToJson(const recon::ReconciledFeature& feature)
{
    QJsonObject obj;
    obj.insert(QStringLiteral("face_id"), toJson(feature.faceId));
    obj.insert(QStringLiteral("annotation_index"), toJson(feature.annotationIndex));
    obj.insert(QStringLiteral("kind"), vision::toString(feature.kind));
    obj.insert(QStringLiteral("label"), feature.label);
    obj.insert(QStringLiteral("geometry_value_mm"), toJson(feature.geometryValue_mm));
    obj.insert(QStringLiteral("drawing_value_mm"), toJson(feature.drawingValue_mm));
    obj.insert(QStringLiteral("authoritative_value_mm"), feature.authoritativeValue_mm);
    obj.insert(QStringLiteral("value_source"), recon::toString(feature.valueSource));
    obj.insert(QStringLiteral("delta_pct"), toJson(feature.deltaPct));
    obj.insert(QStringLiteral("match_confidence"), recon::toString(feature.matchConfidence));
    obj.insert(QStringLiteral("axial_length_mm"), feature.axialLength_mm);
    obj.insert(QStringLiteral("tolerance"), toJson(feature.toleranceClass));
    obj.insert(QStringLiteral("designation"), toJson(feature.designation));
    return obj;
}

recon::ReconciledFeature featureFromJson(const QJsonObject& object, bool* ok)
{
    recon::ReconciledFeature feature;
    bool valid = true;
    feature.faceId = optionalInt(object.value(QStringLiteral("face_id")));
    feature.annotationIndex = optionalInt(object.value(QStringLiteral("annotation_index")));
    feature.kind = vision::annotationKindFromString(object.value(QStringLiteral("kind")).toString());
    feature.label = object.value(QStringLiteral("label")).toString();
    feature.geometryValue_mm = optionalDouble(object.value(QStringLiteral("geometry_value_mm")));
    feature.drawingValue_mm = optionalDouble(object.value(QStringLiteral("drawing_value_mm")));
    feature.authoritativeValue_mm = object.value(QStringLiteral("authoritative_value_mm")).toDouble();
    feature.deltaPct = optionalDouble(object.value(QStringLiteral("delta_pct")));
    feature.axialLength_mm = object.value(QStringLiteral("axial_length_mm")).toDouble();
    feature.toleranceClass = optionalString(object.value(QStringLiteral("tolerance")));
    feature.designation = optionalString(object.value(QStringLiteral("designation")));

    const auto source = recon::valueSourceFromString(object.value(QStringLiteral("value_source")).toString());
    const auto confidence = recon::matchConfidenceFromString(object.value(QStringLiteral("match_confidence")).toString());
    if (source && confidence)
    {
        feature.valueSource = *source;
        feature.matchConfidence = *confidence;
    }
    else
    {
        valid = false;
    }
    valid = valid && (feature.faceId || feature.annotationIndex);

    if (ok)
    {
        *ok = valid;
    }
    return feature;
}

QJsonObject resultToJson(const EstimationResult& result)
{
    QJsonArray operations;
    for (const OperationEstimate& op : result.operations)
    {
        operations.append(operationToJson(op));
    }
    QJsonArray features;
    for (const recon::ReconciledFeature& feature : result.features)
    {
        features.append(featureToJson(feature));
    }
    QJsonArray discrepancies;
    for (const recon::ReconciliationWarning& warning : result.discrepancies)
    {
        discrepancies.append(warningToJson(warning));
    }

    QJsonObject obj;
    obj.insert(QStringLiteral("source_id"), result.sourceId);
    obj.insert(QStringLiteral("geometry_version"), result.geometryVersion);
    obj.insert(QStringLiteral("drawing_version"), result.drawingVersion);
    obj.insert(QStringLiteral("material"), result.materialCode);
    obj.insert(QStringLiteral("operations"), operations);
    obj.insert(QStringLiteral("features"), features);
    obj.insert(QStringLiteral("machining_time_min"), result.machiningTime_min);
    obj.insert(QStringLiteral("setup_time_min"), result.setupTime_min);
    obj.insert(QStringLiteral("total_time_min"), result.totalTime_min);
    obj.insert(QStringLiteral("constraint_multiplier"), result.constraintMultiplier);
    obj.insert(QStringLiteral("determinism_hash"), result.determinismHash);
    obj.insert(QStringLiteral("confidence"), toString(result.confidence));
    obj.insert(QStringLiteral("synthetic"), result.synthetic);
    obj.insert(QStringLiteral("drawing_available"), result.drawingAvailable);
    obj.insert(QStringLiteral("warnings"), QJsonArray::fromStringList(result.warnings));
    obj.insert(QStringLiteral("discrepancies"), discrepancies);
    return obj;
}

EstimationResult resultFromJson(const QJsonObject& object, bool* ok)
{
    EstimationResult result;
    bool valid = object.contains(QStringLiteral("source_id"));
    result.sourceId = object.value(QStringLiteral("source_id")).toString();
    result.geometryVersion = object.value(QStringLiteral("geometry_version")).toInt();
    result.drawingVersion = object.value(QStringLiteral("drawing_version")).toInt();
    result.materialCode = object.value(QStringLiteral("material")).toString();

    for (const QJsonValue& value : object.value(QStringLiteral("operations")).toArray())
    {
        result.operations.push_back(operationFromJson(value.toObject(), valid));
    }
    for (const QJsonValue& value : object.value(QStringLiteral("features")).toArray())
    {
        bool featureOk = false;
        result.features.push_back(featureFromJson(value.toObject(), &featureOk));
        valid = valid && featureOk;
    }
    for (const QJsonValue& value : object.value(QStringLiteral("discrepancies")).toArray())
    {
        result.discrepancies.push_back(warningFromJson(value.toObject()));
    }

    result.machiningTime_min = object.value(QStringLiteral("machining_time_min")).toDouble();
    result.setupTime_min = object.value(QStringLiteral("setup_time_min")).toDouble();
    result.totalTime_min = object.value(QStringLiteral("total_time_min")).toDouble();
    result.constraintMultiplier = object.value(QStringLiteral("constraint_multiplier")).toDouble(1.0);
    result.determinismHash = object.value(QStringLiteral("determinism_hash")).toString();
    if (const auto confidence = confidenceFromString(object.value(QStringLiteral("confidence")).toString()))
    {
        result.confidence = *confidence;
    }
    else
    {
        valid = false;
    }
    result.synthetic = object.value(QStringLiteral("synthetic")).toBool();
    result.drawingAvailable = object.value(QStringLiteral("drawing_available")).toBool();
    for (const QJsonValue& value : object.value(QStringLiteral("warnings")).toArray())
    {
        result.warnings.push_back(value.toString());
    }

    if (ok)
    {
        *ok = valid;
    }
    return result;
}

QByteArray canonicalText(const EstimationResult& result)
{
    QString text;
    QTextStream out(&text);
    out << "machest-estimate-v1\n";
    out << "source " << result.sourceId << '\n';
    out << "material " << result.materialCode << '\n';
    out << "synthetic " << (result.synthetic ? 1 : 0) << " drawing " << (result.drawingAvailable ? 1 : 0) << '\n';
    out << "multiplier " << canonicalNumber(result.constraintMultiplier) << '\n';
    for (const OperationEstimate& op : result.operations)
    {
        out << "op " << toString(op.category) << '|' << op.label << '|' << canonicalNumber(op.keyDimension_mm) << '|'
            << canonicalNumber(op.feed_mm_per_rev) << '|' << canonicalNumber(op.rpm) << '|' << op.passes << '|'
            << canonicalNumber(op.time_min) << '|' << canonical(op.featureIndex) << '\n';
    }
    for (const recon::ReconciledFeature& feature : result.features)
    {
        out << "feature " << canonical(feature.faceId) << '|' << canonical(feature.annotationIndex) << '|'
            << vision::toString(feature.kind) << '|' << canonicalNumber(feature.authoritativeValue_mm) << '|'
            << recon::toString(feature.valueSource) << '|' << canonical(feature.deltaPct) << '|'
            << recon::toString(feature.matchConfidence) << '|' << canonicalNumber(feature.axialLength_mm) << '\n';
    }
    for (const recon::ReconciliationWarning& warning : result.discrepancies)
    {
        out << "discrepancy " << canonical(warning.annotationIndex) << '|' << canonical(warning.faceId) << '|'
            << canonicalNumber(warning.drawingValue_mm) << '|' << canonicalNumber(warning.geometryValue_mm) << '|'
            << canonicalNumber(warning.deltaPct) << '\n';
    }
    for (const QString& warning : result.warnings)
    {
        out << "warning " << warning << '\n';
    }
    out << "machining " << canonicalNumber(result.machiningTime_min) << '\n';
    out << "setup " << canonicalNumber(result.setupTime_min) << '\n';
    out << "total " << canonicalNumber(result.totalTime_min) << '\n';
    out << "confidence " << toString(result.confidence) << '\n';
    out.flush();
    return text.toUtf8();
}

QString determinismHash(const EstimationResult& result)
{
    return common::sha256Hex(canonicalText(result));
}

} // namespace est
