#include "common/Hashing.h"

#include <QtCore/QCryptographicHash>

#include <cmath>

namespace common
{

QByteArray sha256(const QByteArray& data)
{
    return QCryptographicHash::hash(data, QCryptographicHash::Sha256);
}

QString sha256Hex(const QByteArray& data)
{
    return QString::fromLatin1(sha256(data).toHex());
}

QString canonicalNumber(double value)
{
    if (!std::isfinite(value))
    {
        return QStringLiteral("nan");
    }
    QString text = QString::number(value, 'f', 6);
    if (text == QStringLiteral("-0.000000"))
    {
        text = QStringLiteral("0.000000");
    }
    return text;
}

} // namespace common
