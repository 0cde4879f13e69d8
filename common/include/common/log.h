#pragma once

#include <QtCore/QLoggingCategory>
#include <QtCore/QString>

#include <sstream>
#include <string>
#include <utility>

namespace common::log
{

enum class Level
{
    Info,
    Warning,
    Error
};

enum class Category
{
    Geom,
    Vision,
    Recon,
    Estimate,
    Pipeline,
    Store
};

constexpr const char* categoryName(Category category)
{
    switch (category)
    {
    case Category::Geom: return "geom";
    case Category::Vision: return "vision";
    case Category::Recon: return "recon";
    case Category::Estimate: return "estimate";
    case Category::Pipeline: return "pipeline";
    case Category::Store: return "store";
    }
    return "unknown";
}

namespace detail
{

using Message = QString;

inline QLoggingCategory& categoryHandle(Category category)
{
    switch (category)
    {
    case Category::Geom: {
        static QLoggingCategory instance("machest.geom");
        return instance;
    }
    case Category::Vision: {
        static QLoggingCategory instance("machest.vision");
        return instance;
    }
    case Category::Recon: {
        static QLoggingCategory instance("machest.recon");
        return instance;
    }
    case Category::Estimate: {
        static QLoggingCategory instance("machest.estimate");
        return instance;
    }
    case Category::Pipeline: {
        static QLoggingCategory instance("machest.pipeline");
        return instance;
    }
    case Category::Store: {
        static QLoggingCategory instance("machest.store");
        return instance;
    }
    }
    static QLoggingCategory fallback("machest.unknown");
    return fallback;
}

inline Message toMessage(const QString& message)
{
    return message;
}

inline Message toMessage(const char* message)
{
    return message ? QString::fromUtf8(message) : QString();
}

inline Message toMessage(const std::string& message)
{
    return QString::fromStdString(message);
}

template <typename T>
Message toMessage(const T& value)
{
    std::ostringstream stream;
    stream << value;
    return QString::fromStdString(stream.str());
}

} // namespace detail

inline void write(Level level, Category category, const detail::Message& message)
{
    QLoggingCategory& qtCategory = detail::categoryHandle(category);
    switch (level)
    {
    case Level::Info:
        qCInfo(qtCategory).noquote() << message;
        break;
    case Level::Warning:
        qCWarning(qtCategory).noquote() << message;
        break;
    case Level::Error:
        qCCritical(qtCategory).noquote() << message;
        break;
    }
}

template <typename Message>
void log(Level level, Category category, Message&& message)
{
    write(level, category, detail::toMessage(std::forward<Message>(message)));
}

} // namespace common::log

#define LOG_INFO(category, message)                                                           \
    do                                                                                        \
    {                                                                                         \
        ::common::log::log(::common::log::Level::Info, ::common::log::Category::category,     \
                           (message));                                                        \
    } while (false)

#define LOG_WARN(category, message)                                                           \
    do                                                                                        \
    {                                                                                         \
        ::common::log::log(::common::log::Level::Warning, ::common::log::Category::category,  \
                           (message));                                                        \
    } while (false)

#define LOG_ERR(category, message)                                                            \
    do                                                                                        \
    {                                                                                         \
        ::common::log::log(::common::log::Level::Error, ::common::log::Category::category,    \
                           (message));                                                        \
    } while (false)
