#include "est/MaterialTable.h"

#include "common/Errors.h"

#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>

#include <utility>

namespace est
{

namespace
{

Material parseMaterial(const QJsonObject& obj, QStringList& warnings)
{
    Material material;
    material.code = obj.value(QStringLiteral("code")).toString().trimmed();
    material.name = obj.value(QStringLiteral("name")).toString();
    material.isoGroup = obj.value(QStringLiteral("iso_group")).toString().trimmed().toUpper();
    material.mrr_min_per_cm3 = obj.value(QStringLiteral("mrr_min_per_cm3")).toDouble(0.0);
    material.setup_min = obj.value(QStringLiteral("setup_min")).toDouble(-1.0);
    material.cuttingSpeed_m_min = obj.value(QStringLiteral("cutting_speed_m_min")).toDouble(0.0);
    material.finishingRate_cm2_min = obj.value(QStringLiteral("finishing_rate_cm2_min")).toDouble(material.finishingRate_cm2_min);
    for (const QJsonValue& alias : obj.value(QStringLiteral("aliases")).toArray())
    {
        const QString text = alias.toString().trimmed();
        if (!text.isEmpty())
        {
            material.aliases.push_back(text);
        }
    }

    if (!material.isValid())
    {
        warnings.push_back(QStringLiteral("Skipping invalid material entry: \"%1\"").arg(material.code));
    }
    return material;
}

} // namespace

bool MaterialTable::loadFromJson(const QByteArray& data, QStringList& warnings)
{
    warnings.clear();
    m_materials.clear();

    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
    {
        warnings.push_back(QStringLiteral("Failed to parse material table: %1").arg(parseError.errorString()));
        return false;
    }

    const QJsonArray entries = doc.object().value(QStringLiteral("materials")).toArray();
    for (const QJsonValue& value : entries)
    {
        if (!value.isObject())
        {
            warnings.push_back(QStringLiteral("Skipping malformed material entry (expected object)."));
            continue;
        }

        Material material = parseMaterial(value.toObject(), warnings);
        if (!material.isValid())
        {
            continue;
        }
        if (find(material.code))
        {
            warnings.push_back(QStringLiteral("Duplicate material code \"%1\" ignored.").arg(material.code));
            continue;
        }
        m_materials.push_back(std::move(material));
    }

    if (m_materials.isEmpty())
    {
        warnings.push_back(QStringLiteral("No valid materials were loaded."));
        return false;
    }
    return true;
}

bool MaterialTable::loadFromFile(const QString& filePath, QStringList& warnings)
{
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text))
    {
        warnings.clear();
        warnings.push_back(QStringLiteral("Unable to open material table: %1").arg(filePath));
        return false;
    }
    return loadFromJson(file.readAll(), warnings);
}

const Material* MaterialTable::find(const QString& code) const noexcept
{
    for (const Material& material : m_materials)
    {
        if (material.code.compare(code, Qt::CaseInsensitive) == 0)
        {
            return &material;
        }
    }
    return nullptr;
}

const Material& MaterialTable::require(const QString& code) const
{
    const Material* material = find(code.trimmed());
    if (!material)
    {
        throw common::MaterialNotFoundError(code);
    }
    return *material;
}

std::optional<QString> MaterialTable::detectCode(const QString& identifier) const
{
    for (const Material& material : m_materials)
    {
        if (identifier.contains(material.code, Qt::CaseInsensitive))
        {
            return material.code;
        }
    }
    for (const Material& material : m_materials)
    {
        for (const QString& alias : material.aliases)
        {
            if (identifier.contains(alias, Qt::CaseInsensitive))
            {
                return material.code;
            }
        }
    }
    return std::nullopt;
}

} // namespace est
