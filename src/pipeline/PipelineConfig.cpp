#include "pipeline/PipelineConfig.h"

#include "common/Errors.h"
#include "common/log.h"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>

namespace pipeline
{

namespace
{

QString resolvePath(const QString& path, const QString& baseDir)
{
    if (path.isEmpty() || QDir::isAbsolutePath(path) || baseDir.isEmpty())
    {
        return path;
    }
    return QDir(baseDir).filePath(path);
}

QJsonObject section(const QJsonObject& root, const char* name)
{
    const QJsonValue value = root.value(QLatin1String(name));
    if (!value.isUndefined() && !value.isObject())
    {
        throw common::ConfigError(QStringLiteral("Config section \"%1\" must be an object.").arg(QLatin1String(name)));
    }
    return value.toObject();
}

void readVision(const QJsonObject& obj, PipelineConfig& config)
{
    vision::VisionSettings& settings = config.vision;
    if (obj.contains(QStringLiteral("endpoint")))
    {
        const QUrl url(obj.value(QStringLiteral("endpoint")).toString());
        if (!url.isValid() || url.scheme().isEmpty())
        {
            throw common::ConfigError(QStringLiteral("vision.endpoint is not a valid URL."));
        }
        settings.endpoint = url;
    }
    settings.model = obj.value(QStringLiteral("model")).toString(settings.model);
    settings.apiKeyEnv = obj.value(QStringLiteral("api_key_env")).toString(settings.apiKeyEnv);
    settings.timeoutMs = obj.value(QStringLiteral("timeout_ms")).toInt(settings.timeoutMs);
    settings.maxOutputTokens = obj.value(QStringLiteral("max_output_tokens")).toInt(settings.maxOutputTokens);

    vision::RetryPolicy& retry = config.retry;
    retry.maxAttempts = obj.value(QStringLiteral("max_attempts")).toInt(retry.maxAttempts);
    retry.initialBackoffMs = obj.value(QStringLiteral("initial_backoff_ms")).toInt(retry.initialBackoffMs);
    retry.backoffMultiplier = obj.value(QStringLiteral("backoff_multiplier")).toDouble(retry.backoffMultiplier);
    retry.maxBackoffMs = obj.value(QStringLiteral("max_backoff_ms")).toInt(retry.maxBackoffMs);

    if (settings.timeoutMs <= 0 || retry.maxAttempts <= 0 || retry.initialBackoffMs < 0)
    {
        throw common::ConfigError(QStringLiteral("vision timeout and max_attempts must be positive."));
    }
}

void readClassification(const QJsonObject& obj, PipelineConfig& config)
{
    config.summary.rotationalThreshold =
        obj.value(QStringLiteral("rotational_threshold")).toDouble(config.summary.rotationalThreshold);
    config.summary.axisToleranceDeg =
        obj.value(QStringLiteral("axis_tolerance_deg")).toDouble(config.summary.axisToleranceDeg);
    config.reconcile.axisToleranceDeg = config.summary.axisToleranceDeg;
    config.rules.referenceGrade = obj.value(QStringLiteral("reference_grade")).toInt(config.rules.referenceGrade);

    if (config.summary.rotationalThreshold < 0.0 || config.summary.rotationalThreshold > 1.0)
    {
        throw common::ConfigError(QStringLiteral("classification.rotational_threshold must lie in [0, 1]."));
    }

    const QJsonObject overrides = obj.value(QStringLiteral("part_type_overrides")).toObject();
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        const auto type = geom::partTypeFromString(it.value().toString());
        if (!type)
        {
            throw common::ConfigError(
                QStringLiteral("Unknown part type \"%1\" for override \"%2\".").arg(it.value().toString(), it.key()));
        }
        config.partTypeOverrides[it.key()] = *type;
    }
}

} // namespace

PipelineConfig PipelineConfig::fromJson(const QByteArray& data, const QString& baseDir)
{
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
    {
        throw common::ConfigError(QStringLiteral("Failed to parse config: %1").arg(parseError.errorString()));
    }
    const QJsonObject root = doc.object();

    PipelineConfig config;
    readVision(section(root, "vision"), config);

    const QJsonObject machine = section(root, "machine");
    config.machine.name = machine.value(QStringLiteral("name")).toString(config.machine.name);
    config.machine.maxSpindleRPM = machine.value(QStringLiteral("max_spindle_rpm")).toDouble(config.machine.maxSpindleRPM);
    config.machine.ensureValid();

    const QJsonObject cutting = section(root, "cutting");
    config.cutting.feed_mm_per_rev = cutting.value(QStringLiteral("feed_mm_per_rev")).toDouble(config.cutting.feed_mm_per_rev);
    config.cutting.threadingSpeed_m_min =
        cutting.value(QStringLiteral("threading_speed_m_min")).toDouble(config.cutting.threadingSpeed_m_min);
    config.cutting.threadingPasses = cutting.value(QStringLiteral("threading_passes")).toInt(config.cutting.threadingPasses);
    if (config.cutting.feed_mm_per_rev <= 0.0 || config.cutting.threadingSpeed_m_min <= 0.0
        || config.cutting.threadingPasses <= 0)
    {
        throw common::ConfigError(QStringLiteral("cutting parameters must be positive."));
    }

    const QJsonObject tables = section(root, "tables");
    config.materialTablePath = resolvePath(tables.value(QStringLiteral("materials")).toString(config.materialTablePath), baseDir);
    config.threadTablePath = resolvePath(tables.value(QStringLiteral("threads")).toString(config.threadTablePath), baseDir);

    readClassification(section(root, "classification"), config);

    const QJsonObject workers = section(root, "workers");
    config.geometryWorkers = workers.value(QStringLiteral("geometry")).toInt(config.geometryWorkers);
    config.ioWorkers = workers.value(QStringLiteral("io")).toInt(config.ioWorkers);
    config.runWorkers = workers.value(QStringLiteral("runs")).toInt(config.runWorkers);
    if (config.geometryWorkers < 0 || config.ioWorkers <= 0 || config.runWorkers < 0)
    {
        throw common::ConfigError(QStringLiteral("workers.geometry and workers.runs must be >= 0 and workers.io > 0."));
    }

    const QJsonObject store = section(root, "store");
    config.journalPath = resolvePath(store.value(QStringLiteral("journal")).toString(), baseDir);
    return config;
}

PipelineConfig PipelineConfig::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists())
    {
        LOG_WARN(Pipeline, QStringLiteral("Config %1 not found, using defaults").arg(filePath));
        return PipelineConfig{};
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        throw common::ConfigError(QStringLiteral("Unable to open config file: %1").arg(filePath));
    }
    return fromJson(file.readAll(), QFileInfo(filePath).absolutePath());
}

} // namespace pipeline
