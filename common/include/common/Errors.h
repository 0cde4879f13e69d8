#pragma once

#include <QtCore/QString>

#include <stdexcept>
#include <string>

namespace common
{

class EstimationError : public std::runtime_error
{
public:
    explicit EstimationError(const QString& message)
        : std::runtime_error(message.toStdString())
    {
    }

    [[nodiscard]] QString message() const
    {
        return QString::fromUtf8(what());
    }
};

// The geometry kernel rejected the input (corrupt, unsupported, empty solid).
class ExtractionError : public EstimationError
{
public:
    using EstimationError::EstimationError;
};

// The vision service was unreachable or returned output that could not be parsed.
class InterpretationError : public EstimationError
{
public:
    explicit InterpretationError(const QString& message, bool transient = false)
        : EstimationError(message)
        , m_transient(transient)
    {
    }

    [[nodiscard]] bool isTransient() const noexcept { return m_transient; }

private:
    bool m_transient{false};
};

class MaterialNotFoundError : public EstimationError
{
public:
    explicit MaterialNotFoundError(const QString& materialCode)
        : EstimationError(QStringLiteral("Material code \"%1\" is not in the material table.").arg(materialCode))
        , m_code(materialCode)
    {
    }

    [[nodiscard]] const QString& code() const noexcept { return m_code; }

private:
    QString m_code;
};

// A run was cancelled mid-flight; carries no partial result.
class CancelledError : public EstimationError
{
public:
    using EstimationError::EstimationError;
};

class ConfigError : public EstimationError
{
public:
    using EstimationError::EstimationError;
};

class TableLoadError : public EstimationError
{
public:
    using EstimationError::EstimationError;
};

} // namespace common
