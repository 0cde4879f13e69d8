#include "est/Machine.h"

#include <algorithm>

namespace est
{

namespace
{
constexpr double kMinSpindleRPM = 1.0;
}

void Machine::ensureValid()
{
    maxSpindleRPM = std::max(maxSpindleRPM, kMinSpindleRPM);
    if (name.isEmpty())
    {
        name = QStringLiteral("Generic lathe/mill");
    }
}

Machine makeDefaultMachine()
{
    Machine machine;
    machine.ensureValid();
    return machine;
}

} // namespace est
