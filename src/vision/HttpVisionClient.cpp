#include "vision/HttpVisionClient.h"

#include "common/Errors.h"
#include "common/log.h"

#include <QtCore/QEventLoop>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QTimer>
#include <QtCore/QtGlobal>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>

#include <memory>
#include <utility>

namespace vision
{

namespace
{

constexpr int kCancelPollMs = 100;

} // namespace

HttpVisionClient::HttpVisionClient(VisionSettings settings)
    : m_settings(std::move(settings))
{
}

QString HttpVisionClient::name() const
{
    return m_settings.model;
}

bool HttpVisionClient::isTransientStatus(int httpStatus)
{
    return httpStatus == 408 || httpStatus == 429 || (httpStatus >= 500 && httpStatus <= 599);
}

QByteArray HttpVisionClient::buildPayload(const VisionRequest& request) const
{
    const QString dataUrl = QStringLiteral("data:image/png;base64,") + QString::fromLatin1(request.imagePng.toBase64());

    QJsonObject imageUrl;
    imageUrl.insert(QStringLiteral("url"), dataUrl);
    imageUrl.insert(QStringLiteral("detail"), QStringLiteral("high"));

    QJsonObject imagePart;
    imagePart.insert(QStringLiteral("type"), QStringLiteral("image_url"));
    imagePart.insert(QStringLiteral("image_url"), imageUrl);

    QJsonObject textPart;
    textPart.insert(QStringLiteral("type"), QStringLiteral("text"));
    textPart.insert(QStringLiteral("text"), request.userPrompt);

    QJsonObject system;
    system.insert(QStringLiteral("role"), QStringLiteral("system"));
    system.insert(QStringLiteral("content"), request.systemPrompt);

    QJsonObject user;
    user.insert(QStringLiteral("role"), QStringLiteral("user"));
    user.insert(QStringLiteral("content"), QJsonArray{textPart, imagePart});

    QJsonObject responseFormat;
    responseFormat.insert(QStringLiteral("type"), QStringLiteral("json_object"));

    QJsonObject payload;
    payload.insert(QStringLiteral("model"), m_settings.model);
    payload.insert(QStringLiteral("messages"), QJsonArray{system, user});
    payload.insert(QStringLiteral("temperature"), 0.0);
    payload.insert(QStringLiteral("max_tokens"), m_settings.maxOutputTokens);
    payload.insert(QStringLiteral("response_format"), responseFormat);
    return QJsonDocument(payload).toJson(QJsonDocument::Compact);
}

QByteArray HttpVisionClient::extractContent(const QByteArray& body)
{
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
    {
        throw common::InterpretationError(
            QStringLiteral("Vision service returned a non-JSON envelope: %1").arg(parseError.errorString()));
    }

    const QJsonArray choices = doc.object().value(QStringLiteral("choices")).toArray();
    if (choices.isEmpty())
    {
        throw common::InterpretationError(QStringLiteral("Vision service response has no choices."));
    }
    const QJsonValue content =
        choices.first().toObject().value(QStringLiteral("message")).toObject().value(QStringLiteral("content"));
    if (!content.isString())
    {
        throw common::InterpretationError(QStringLiteral("Vision service response has no message content."));
    }
    return content.toString().toUtf8();
}

QByteArray HttpVisionClient::complete(const VisionRequest& request, const common::CancellationToken& cancel)
{
    const QByteArray apiKey = qgetenv(m_settings.apiKeyEnv.toLatin1().constData());
    if (apiKey.isEmpty())
    {
        throw common::InterpretationError(
            QStringLiteral("Vision API key is not configured (set %1).").arg(m_settings.apiKeyEnv));
    }

    QNetworkAccessManager manager;
    QNetworkRequest httpRequest(m_settings.endpoint);
    httpRequest.setTransferTimeout(m_settings.timeoutMs);
    httpRequest.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    httpRequest.setRawHeader("Authorization", "Bearer " + apiKey);

    QNetworkReply* reply = manager.post(httpRequest, buildPayload(request));
    std::unique_ptr<QNetworkReply, void (*)(QNetworkReply*)> guard(reply, [](QNetworkReply* r) { r->deleteLater(); });

    QEventLoop loop;
    QTimer cancelPoll;
    cancelPoll.setInterval(kCancelPollMs);
    QObject::connect(&cancelPoll, &QTimer::timeout, &loop, [&cancel, reply]() {
        if (cancel.isCancelled())
        {
            reply->abort();
        }
    });
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    cancelPoll.start();
    if (!reply->isFinished())
    {
        loop.exec();
    }
    cancelPoll.stop();

    if (cancel.isCancelled())
    {
        throw common::CancelledError(QStringLiteral("Vision request cancelled."));
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (reply->error() != QNetworkReply::NoError)
    {
        // Status 0 means the request never produced an HTTP response (DNS, refused, timeout).
        const bool transient = status == 0 || isTransientStatus(status);
        const QString message = QStringLiteral("Vision request failed (HTTP %1): %2").arg(status).arg(reply->errorString());
        LOG_WARN(Vision, message);
        throw common::InterpretationError(message, transient);
    }

    return extractContent(reply->readAll());
}

} // namespace vision
