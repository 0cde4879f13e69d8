#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>

namespace common
{

[[nodiscard]] QByteArray sha256(const QByteArray& data);
[[nodiscard]] QString sha256Hex(const QByteArray& data);

// Fixed-point rendering used wherever numbers feed a digest: six decimals,
// '.' separator, no exponent, and -0 folded to 0.
[[nodiscard]] QString canonicalNumber(double value);

} // namespace common
