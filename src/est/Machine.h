#pragma once

#include <QtCore/QString>

namespace est
{

struct Machine
{
    QString name;
    double maxSpindleRPM{4'000.0};

    void ensureValid();
};

Machine makeDefaultMachine();

} // namespace est
