#pragma once

#include "common/Cancellation.h"
#include "geom/GeometryTypes.h"
#include "vision/DrawingAnnotation.h"
#include "vision/IVisionClient.h"
#include "vision/RetryPolicy.h"

#include <memory>
#include <vector>

namespace vision
{

// Turns a rendered drawing page into annotations via the vision service and
// enforces the output contract on whatever the service returns.
class DrawingInterpreter
{
public:
    explicit DrawingInterpreter(std::shared_ptr<IVisionClient> client, RetryPolicy policy = {});

    [[nodiscard]] QString name() const;

    // `hint` is advisory context for the model and never treated as ground truth.
    // Throws common::InterpretationError after exhausting retries or on malformed
    // output, and common::CancelledError when the token fires.
    std::vector<DrawingAnnotation> interpret(const DrawingPage& page,
                                             const geom::GeometrySummary* hint,
                                             const common::CancellationToken& cancel) const;

    [[nodiscard]] VisionRequest buildRequest(const DrawingPage& page, const geom::GeometrySummary* hint) const;

    // Parses raw model text (markdown fences allowed) and applies the contract:
    // title-block entities dropped, unprinted tolerances removed, incomplete
    // positions nulled, confidences clamped, inches converted to millimetres.
    static std::vector<DrawingAnnotation> parseResponse(const QByteArray& text);

private:
    std::shared_ptr<IVisionClient> m_client;
    RetryPolicy m_policy;
};

} // namespace vision
