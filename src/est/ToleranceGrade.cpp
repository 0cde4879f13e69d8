#include "est/ToleranceGrade.h"

#include <QtCore/QRegularExpression>

#include <algorithm>
#include <array>
#include <cmath>
#include <vector>

namespace est
{

namespace
{

constexpr int kFirstGrade = 5;
// Multiples of the tolerance unit i for IT5..IT16.
constexpr std::array<double, 12> kGradeFactors = {7, 10, 16, 25, 40, 64, 100, 160, 250, 400, 640, 1000};

double toleranceUnit_um(double nominal_mm)
{
    const double d = std::max(nominal_mm, 1.0);
    return 0.45 * std::cbrt(d) + 0.001 * d;
}

double parseNumber(QString text)
{
    text.replace(QLatin1Char(','), QLatin1Char('.'));
    text.replace(QChar(0x2212), QLatin1Char('-'));
    return text.toDouble();
}

std::optional<double> deviationBand_mm(const QString& tolerance)
{
    static const QRegularExpression symmetric(QStringLiteral("^(?:±|\\+/-|\\+-)(\\d*[.,]?\\d+)$"));
    static const QRegularExpression number(QStringLiteral("[+\\-\\x{2212}]?\\d*[.,]?\\d+"));

    const QRegularExpressionMatch sym = symmetric.match(tolerance);
    if (sym.hasMatch())
    {
        return 2.0 * std::abs(parseNumber(sym.captured(1)));
    }

    std::vector<double> values;
    auto it = number.globalMatch(tolerance);
    while (it.hasNext())
    {
        values.push_back(parseNumber(it.next().captured(0)));
    }
    if (values.empty() || values.size() > 2)
    {
        return std::nullopt;
    }
    // A single deviation is one-sided against zero.
    const double upper = values.size() == 2 ? std::max(values[0], values[1]) : std::max(values[0], 0.0);
    const double lower = values.size() == 2 ? std::min(values[0], values[1]) : std::min(values[0], 0.0);
    return upper - lower;
}

} // namespace

std::optional<double> standardTolerance_mm(int grade, double nominal_mm)
{
    const int index = grade - kFirstGrade;
    if (index < 0 || index >= static_cast<int>(kGradeFactors.size()))
    {
        return std::nullopt;
    }
    return kGradeFactors[static_cast<std::size_t>(index)] * toleranceUnit_um(nominal_mm) / 1000.0;
}

std::optional<int> itGrade(const QString& tolerance, double nominal_mm)
{
    static const QRegularExpression fitClass(QStringLiteral("^(?:IT|[A-Za-z]{1,2})(\\d{1,2})$"));

    QString text = tolerance;
    text.remove(QRegularExpression(QStringLiteral("\\s")));
    if (text.isEmpty())
    {
        return std::nullopt;
    }

    const QRegularExpressionMatch fit = fitClass.match(text);
    if (fit.hasMatch())
    {
        return fit.captured(1).toInt();
    }

    const auto band = deviationBand_mm(text);
    if (!band || *band <= 0.0)
    {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < kGradeFactors.size(); ++i)
    {
        const int grade = kFirstGrade + static_cast<int>(i);
        // Small epsilon keeps a band printed exactly at the grade limit in that grade.
        if (*standardTolerance_mm(grade, nominal_mm) + 1e-9 >= *band)
        {
            return grade;
        }
    }
    return kFirstGrade + static_cast<int>(kGradeFactors.size()) - 1;
}

} // namespace est
