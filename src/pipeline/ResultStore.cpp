#include "pipeline/ResultStore.h"

#include "common/log.h"
#include "est/EstimationSerialization.h"
#include "geom/GeometrySerialization.h"
#include "vision/AnnotationSerialization.h"

#include <QtCore/QFile>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QMutexLocker>

#include <utility>

namespace pipeline
{

namespace
{
const QString kGeometryEntry = QStringLiteral("geometry");
const QString kAnnotationsEntry = QStringLiteral("annotations");
const QString kResultEntry = QStringLiteral("result");
} // namespace

ResultStore::ResultStore(QString journalPath)
    : m_journalPath(std::move(journalPath))
{
}

int ResultStore::appendGeometry(geom::GeometrySummary summary)
{
    QMutexLocker locker(&m_mutex);
    return appendGeometryLocked(summary, true);
}

void ResultStore::appendAnnotations(vision::AnnotationBatch batch)
{
    QMutexLocker locker(&m_mutex);
    appendAnnotationsLocked(batch, true);
}

bool ResultStore::appendResult(est::EstimationResult result)
{
    QMutexLocker locker(&m_mutex);
    return appendResultLocked(result, true);
}

bool ResultStore::commit(RunRecord& record, const common::CancellationToken& cancel)
{
    QMutexLocker locker(&m_mutex);
    if (cancel.isCancelled())
    {
        LOG_WARN(Store, QStringLiteral("%1: run cancelled, nothing stored").arg(record.result.sourceId));
        return false;
    }

    // Resolve the result key before appending anything so a duplicate leaves no partial record.
    const QString& sourceId = record.result.sourceId;
    int geometryVersion = record.result.geometryVersion;
    if (record.geometry)
    {
        const auto stored = m_geometry.find(record.geometry->sourceId);
        geometryVersion = (stored == m_geometry.end() ? 0 : static_cast<int>(stored->second.size())) + 1;
    }
    if (m_results.count(ResultKey{sourceId, geometryVersion, record.result.drawingVersion}))
    {
        LOG_WARN(Store,
                 QStringLiteral("%1 (geometry v%2, drawing v%3) already stored; nothing written")
                     .arg(sourceId)
                     .arg(geometryVersion)
                     .arg(record.result.drawingVersion));
        return false;
    }

    if (record.geometry)
    {
        record.result.geometryVersion = appendGeometryLocked(*record.geometry, true);
    }
    if (record.annotations)
    {
        appendAnnotationsLocked(*record.annotations, true);
    }
    return appendResultLocked(record.result, true);
}

int ResultStore::appendGeometryLocked(geom::GeometrySummary& summary, bool journal)
{
    std::vector<geom::GeometrySummary>& versions = m_geometry[summary.sourceId];
    if (!journal && summary.version > 0)
    {
        // Replayed entries keep their recorded version.
        versions.push_back(summary);
        return summary.version;
    }
    summary.version = static_cast<int>(versions.size()) + 1;
    versions.push_back(summary);
    if (journal)
    {
        writeJournal(kGeometryEntry, geom::summaryToJson(summary));
    }
    return summary.version;
}

void ResultStore::appendAnnotationsLocked(const vision::AnnotationBatch& batch, bool journal)
{
    m_annotations[batch.sourceId].push_back(batch);
    if (journal)
    {
        writeJournal(kAnnotationsEntry, vision::batchToJson(batch));
    }
}

bool ResultStore::appendResultLocked(const est::EstimationResult& result, bool journal)
{
    const ResultKey key{result.sourceId, result.geometryVersion, result.drawingVersion};
    if (m_results.count(key))
    {
        LOG_WARN(Store,
                 QStringLiteral("%1 (geometry v%2, drawing v%3) already stored; keeping the existing result")
                     .arg(key.sourceId)
                     .arg(key.geometryVersion)
                     .arg(key.drawingVersion));
        return false;
    }
    m_results.emplace(key, result);
    if (journal)
    {
        writeJournal(kResultEntry, est::resultToJson(result));
    }
    return true;
}

void ResultStore::writeJournal(const QString& type, const QJsonObject& data)
{
    if (m_journalPath.isEmpty())
    {
        return;
    }

    QFile file(m_journalPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append))
    {
        LOG_ERR(Store, QStringLiteral("Unable to open journal %1: %2").arg(m_journalPath, file.errorString()));
        return;
    }

    QJsonObject line;
    line.insert(QStringLiteral("type"), type);
    line.insert(QStringLiteral("data"), data);
    const QByteArray bytes = QJsonDocument(line).toJson(QJsonDocument::Compact) + '\n';
    if (file.write(bytes) != bytes.size())
    {
        LOG_ERR(Store, QStringLiteral("Short write to journal %1: %2").arg(m_journalPath, file.errorString()));
    }
}

bool ResultStore::replayJournal(QStringList& warnings)
{
    warnings.clear();
    QFile file(m_journalPath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        warnings.push_back(QStringLiteral("Unable to open journal: %1").arg(m_journalPath));
        return false;
    }

    QMutexLocker locker(&m_mutex);
    int lineNumber = 0;
    while (!file.atEnd())
    {
        ++lineNumber;
        const QByteArray raw = file.readLine().trimmed();
        if (raw.isEmpty())
        {
            continue;
        }

        const QJsonDocument doc = QJsonDocument::fromJson(raw);
        const QJsonObject line = doc.object();
        const QString type = line.value(QStringLiteral("type")).toString();
        const QJsonObject data = line.value(QStringLiteral("data")).toObject();
        bool ok = doc.isObject();
        if (ok && type == kGeometryEntry)
        {
            geom::GeometrySummary summary = geom::summaryFromJson(data, &ok);
            if (ok)
            {
                appendGeometryLocked(summary, false);
            }
        }
        else if (ok && type == kAnnotationsEntry)
        {
            appendAnnotationsLocked(vision::batchFromJson(data), false);
        }
        else if (ok && type == kResultEntry)
        {
            const est::EstimationResult result = est::resultFromJson(data, &ok);
            if (ok)
            {
                appendResultLocked(result, false);
            }
        }
        else
        {
            ok = false;
        }

        if (!ok)
        {
            warnings.push_back(QStringLiteral("Skipping malformed journal line %1.").arg(lineNumber));
        }
    }
    return true;
}

std::optional<geom::GeometrySummary> ResultStore::geometry(const QString& sourceId, int version) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_geometry.find(sourceId);
    if (it == m_geometry.end())
    {
        return std::nullopt;
    }
    for (const geom::GeometrySummary& summary : it->second)
    {
        if (summary.version == version)
        {
            return summary;
        }
    }
    return std::nullopt;
}

std::optional<geom::GeometrySummary> ResultStore::latestGeometry(const QString& sourceId) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_geometry.find(sourceId);
    if (it == m_geometry.end() || it->second.empty())
    {
        return std::nullopt;
    }
    return it->second.back();
}

int ResultStore::geometryVersionCount(const QString& sourceId) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_geometry.find(sourceId);
    return it == m_geometry.end() ? 0 : static_cast<int>(it->second.size());
}

std::vector<vision::AnnotationBatch> ResultStore::annotationBatches(const QString& sourceId) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_annotations.find(sourceId);
    return it == m_annotations.end() ? std::vector<vision::AnnotationBatch>{} : it->second;
}

std::optional<vision::AnnotationBatch> ResultStore::latestAnnotations(const QString& sourceId, int drawingVersion) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_annotations.find(sourceId);
    if (it == m_annotations.end())
    {
        return std::nullopt;
    }
    for (auto batch = it->second.rbegin(); batch != it->second.rend(); ++batch)
    {
        if (batch->drawingVersion == drawingVersion)
        {
            return *batch;
        }
    }
    return std::nullopt;
}

std::optional<est::EstimationResult> ResultStore::result(const ResultKey& key) const
{
    QMutexLocker locker(&m_mutex);
    const auto it = m_results.find(key);
    if (it == m_results.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::vector<est::EstimationResult> ResultStore::results(const QString& sourceId) const
{
    QMutexLocker locker(&m_mutex);
    std::vector<est::EstimationResult> found;
    for (const auto& [key, result] : m_results)
    {
        if (key.sourceId == sourceId)
        {
            found.push_back(result);
        }
    }
    return found;
}

std::size_t ResultStore::resultCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_results.size();
}

} // namespace pipeline
