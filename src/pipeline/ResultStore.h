#pragma once

#include "common/Cancellation.h"
#include "est/EstimationResult.h"
#include "geom/GeometryTypes.h"
#include "vision/DrawingAnnotation.h"

#include <QtCore/QJsonObject>
#include <QtCore/QMutex>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <map>
#include <optional>
#include <tuple>
#include <vector>

namespace pipeline
{

struct ResultKey
{
    QString sourceId;
    int geometryVersion{0};
    int drawingVersion{0};

    bool operator<(const ResultKey& other) const
    {
        return std::tie(sourceId, geometryVersion, drawingVersion)
               < std::tie(other.sourceId, other.geometryVersion, other.drawingVersion);
    }
};

// Everything one finished run wants to persist, written together or not at all.
struct RunRecord
{
    // Newly extracted geometry; its version is assigned on commit. Empty when the run reused a stored version.
    std::optional<geom::GeometrySummary> geometry;
    std::optional<vision::AnnotationBatch> annotations;
    est::EstimationResult result;
};

// Append-only, versioned log of geometry summaries, annotation batches and results.
// Entries are never edited; a new ingestion of the same source gets the next version.
class ResultStore
{
public:
    explicit ResultStore(QString journalPath = {});

    int appendGeometry(geom::GeometrySummary summary);
    void appendAnnotations(vision::AnnotationBatch batch);
    // Returns false (and keeps the stored entry) when a result already exists for the key.
    bool appendResult(est::EstimationResult result);

    // Commits the record unless `cancel` has fired or a result already exists for its key;
    // in both cases nothing is written. Assigns the geometry version to both the summary and the result.
    bool commit(RunRecord& record, const common::CancellationToken& cancel);

    [[nodiscard]] std::optional<geom::GeometrySummary> geometry(const QString& sourceId, int version) const;
    [[nodiscard]] std::optional<geom::GeometrySummary> latestGeometry(const QString& sourceId) const;
    [[nodiscard]] int geometryVersionCount(const QString& sourceId) const;

    [[nodiscard]] std::vector<vision::AnnotationBatch> annotationBatches(const QString& sourceId) const;
    [[nodiscard]] std::optional<vision::AnnotationBatch> latestAnnotations(const QString& sourceId, int drawingVersion) const;

    [[nodiscard]] std::optional<est::EstimationResult> result(const ResultKey& key) const;
    [[nodiscard]] std::vector<est::EstimationResult> results(const QString& sourceId) const;
    [[nodiscard]] std::size_t resultCount() const;

    // Rebuilds the in-memory log from the journal file; malformed lines are reported and skipped.
    bool replayJournal(QStringList& warnings);

    [[nodiscard]] const QString& journalPath() const noexcept { return m_journalPath; }

private:
    int appendGeometryLocked(geom::GeometrySummary& summary, bool journal);
    void appendAnnotationsLocked(const vision::AnnotationBatch& batch, bool journal);
    bool appendResultLocked(const est::EstimationResult& result, bool journal);
    void writeJournal(const QString& type, const QJsonObject& data);

    QString m_journalPath;
    mutable QMutex m_mutex;
    std::map<QString, std::vector<geom::GeometrySummary>> m_geometry;
    std::map<QString, std::vector<vision::AnnotationBatch>> m_annotations;
    std::map<ResultKey, est::EstimationResult> m_results;
};

} // namespace pipeline
