#pragma once

#include "vision/IVisionClient.h"

#include <QtCore/QUrl>

namespace vision
{

struct VisionSettings
{
    QUrl endpoint{QStringLiteral("https://api.openai.com/v1/chat/completions")};
    QString model{QStringLiteral("gpt-4o")};
    // Name of the environment variable holding the bearer key.
    QString apiKeyEnv{QStringLiteral("MACHEST_VISION_API_KEY")};
    int timeoutMs{60000};
    int maxOutputTokens{4096};
};

// OpenAI-compatible chat-completions client. Each call runs a private event loop,
// so it is safe to use from pool threads that have none.
class HttpVisionClient : public IVisionClient
{
public:
    explicit HttpVisionClient(VisionSettings settings);

    [[nodiscard]] QString name() const override;
    QByteArray complete(const VisionRequest& request, const common::CancellationToken& cancel) override;

    [[nodiscard]] QByteArray buildPayload(const VisionRequest& request) const;

    // Pulls choices[0].message.content out of a chat-completions envelope.
    [[nodiscard]] static QByteArray extractContent(const QByteArray& body);

    [[nodiscard]] static bool isTransientStatus(int httpStatus);

private:
    VisionSettings m_settings;
};

} // namespace vision
