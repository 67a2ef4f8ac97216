/**
 * @file processspawner.cpp
 * @brief QProcessSpawner: resolve the program, then startDetached.
 */

#include "processspawner.h"

#include "../core/launchcommand.h"

#include <QProcess>

LaunchResult QProcessSpawner::spawn(const LaunchRequest &request)
{
    LaunchResult r;
    r.targetPath = request.targetPath;

    const QString program = LaunchCommand::resolveProgram(request.program);
    if (program.isEmpty())
    {
        r.error = LaunchError::RuntimeMissing;
        r.message = QStringLiteral("'%1' was not found. Please make sure Wine is installed.")
                        .arg(request.program);
        return r;
    }

    QProcess proc;
    proc.setProgram(program);
    proc.setArguments(request.arguments);
    proc.setWorkingDirectory(request.workingDirectory);
    proc.setStandardInputFile(QProcess::nullDevice());
    proc.setStandardOutputFile(QProcess::nullDevice());
    proc.setStandardErrorFile(QProcess::nullDevice());

    qint64 pid = -1;
    if (!proc.startDetached(&pid))
    {
        r.error = LaunchError::SpawnFailed;
        r.message = proc.errorString();
        if (r.message.isEmpty())
            r.message = QStringLiteral("Could not start '%1'").arg(program);
        return r;
    }

    r.ok = true;
    r.pid = pid;
    return r;
}
