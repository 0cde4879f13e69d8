#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVector>

#include <optional>

namespace est
{

struct Material
{
    QString code;
    QString name;
    // ISO 513 group letter (P, M, K, N, S, H).
    QString isoGroup;
    double mrr_min_per_cm3{0.0};
    double setup_min{0.0};
    double cuttingSpeed_m_min{0.0};
    double finishingRate_cm2_min{50.0};
    QStringList aliases;

    [[nodiscard]] bool isValid() const noexcept
    {
        return !code.isEmpty() && mrr_min_per_cm3 > 0.0 && setup_min >= 0.0 && cuttingSpeed_m_min > 0.0
               && finishingRate_cm2_min > 0.0;
    }
};

// Read-only after loading; shared across pipeline threads.
class MaterialTable
{
public:
    bool loadFromJson(const QByteArray& data, QStringList& warnings);
    bool loadFromFile(const QString& filePath, QStringList& warnings);

    [[nodiscard]] const QVector<Material>& materials() const noexcept { return m_materials; }
    [[nodiscard]] const Material* find(const QString& code) const noexcept;

    // Throws common::MaterialNotFoundError; there is no default material.
    [[nodiscard]] const Material& require(const QString& code) const;

    // Material code named in an identifier such as "JR_810686_16MnCr5.step", by code
    // first and then by alias. Returns std::nullopt rather than guessing.
    [[nodiscard]] std::optional<QString> detectCode(const QString& identifier) const;

private:
    QVector<Material> m_materials;
};

} // namespace est
