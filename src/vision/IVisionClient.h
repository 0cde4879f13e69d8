#pragma once

#include "common/Cancellation.h"

#include <QtCore/QByteArray>
#include <QtCore/QString>

namespace vision
{

struct VisionRequest
{
    QString systemPrompt;
    QString userPrompt;
    QByteArray imagePng;
};

// Seam to the external vision/language service.
class IVisionClient
{
public:
    virtual ~IVisionClient() = default;

    [[nodiscard]] virtual QString name() const = 0;

    // Returns the model's raw text output. Throws common::InterpretationError, marked
    // transient for faults worth retrying, and common::CancelledError when cancelled.
    virtual QByteArray complete(const VisionRequest& request, const common::CancellationToken& cancel) = 0;
};

} // namespace vision
