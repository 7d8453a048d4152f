#pragma once

#include <QString>
#include <QStringList>

namespace honeyforge {

class ForgeCli
{
public:
    // CLI dispatcher for template materialization and snapshots.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int runList(const QStringList &args);
    int runMaterialize(const QStringList &args);
    int runSnapshot(const QStringList &args);
    int runInspect(const QStringList &args);
    int runDeploy(const QStringList &args);
    int runExport(const QStringList &args);
};

} // namespace honeyforge
