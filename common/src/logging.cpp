#include "common/logging.h"

#include <QtCore/QDateTime>
#include <QtCore/QLoggingCategory>
#include <QtCore/QString>
#include <QtCore/QTextStream>

#include <cstdlib>

namespace common
{

namespace
{

void outputMessage(QtMsgType type, const QMessageLogContext& context, const QString& message)
{
    QString level;
    switch (type)
    {
    case QtDebugMsg: level = QStringLiteral("DEBUG"); break;
    case QtInfoMsg: level = QStringLiteral("INFO"); break;
    case QtWarningMsg: level = QStringLiteral("WARN"); break;
    case QtCriticalMsg: level = QStringLiteral("CRITICAL"); break;
    case QtFatalMsg: level = QStringLiteral("FATAL"); break;
    }

    QTextStream stream(stderr);
    stream << '[' << QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs) << "] "
           << level << ' ';
    if (context.category != nullptr)
    {
        stream << '(' << context.category << ") ";
    }
    stream << message << Qt::endl;

    if (type == QtFatalMsg)
    {
        abort();
    }
}

} // namespace

void initLogging()
{
    qInstallMessageHandler(outputMessage);
}

} // namespace common
