#include "est/ThreadTable.h"

#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>

#include <cmath>

namespace est
{

namespace
{

long nominalKey(double nominal_mm)
{
    return std::lround(nominal_mm * 100.0);
}

} // namespace

bool ThreadTable::loadFromJson(const QByteArray& data, QStringList& warnings)
{
    warnings.clear();
    m_coarse.clear();

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
    {
        warnings.push_back(QStringLiteral("Failed to parse thread table: %1").arg(parseError.errorString()));
        return false;
    }

    for (const QJsonValue& value : doc.object().value(QStringLiteral("metric_coarse")).toArray())
    {
        const QJsonObject entry = value.toObject();
        const double nominal = entry.value(QStringLiteral("nominal_mm")).toDouble(0.0);
        const double pitch = entry.value(QStringLiteral("pitch_mm")).toDouble(0.0);
        if (nominal <= 0.0 || pitch <= 0.0)
        {
            warnings.push_back(QStringLiteral("Skipping invalid thread entry (nominal %1, pitch %2).").arg(nominal).arg(pitch));
            continue;
        }
        m_coarse[nominalKey(nominal)] = pitch;
    }

    if (m_coarse.empty())
    {
        warnings.push_back(QStringLiteral("No valid thread pitches were loaded."));
        return false;
    }
    return true;
}

bool ThreadTable::loadFromFile(const QString& filePath, QStringList& warnings)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        warnings.clear();
        warnings.push_back(QStringLiteral("Unable to open thread table: %1").arg(filePath));
        return false;
    }
    return loadFromJson(file.readAll(), warnings);
}

std::optional<double> ThreadTable::coarsePitch(double nominal_mm) const
{
    const auto it = m_coarse.find(nominalKey(nominal_mm));
    if (it == m_coarse.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::optional<double> ThreadTable::resolvePitch(const vision::ThreadDesignation& designation) const
{
    if (designation.pitch_mm)
    {
        return designation.pitch_mm;
    }
    return coarsePitch(designation.nominal_mm);
}

} // namespace est
