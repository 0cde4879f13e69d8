#pragma once

namespace common
{

// Installs the process-wide message handler printing "[timestamp] LEVEL (category) message".
// Call once before the pipeline starts.
void initLogging();

} // namespace common
