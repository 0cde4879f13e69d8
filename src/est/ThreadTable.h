#pragma once

#include "vision/DrawingAnnotation.h"

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <map>
#include <optional>

namespace est
{

// ISO 261 metric coarse pitches keyed by nominal diameter.
class ThreadTable
{
public:
    bool loadFromJson(const QByteArray& data, QStringList& warnings);
    bool loadFromFile(const QString& filePath, QStringList& warnings);

    [[nodiscard]] std::optional<double> coarsePitch(double nominal_mm) const;

    // Explicit pitch from the designation ("M30x2"), else the coarse pitch of its nominal.
    [[nodiscard]] std::optional<double> resolvePitch(const vision::ThreadDesignation& designation) const;

    [[nodiscard]] std::size_t size() const noexcept { return m_coarse.size(); }

private:
    // Keyed by nominal in hundredths of a millimetre.
    std::map<long, double> m_coarse;
};

} // namespace est
