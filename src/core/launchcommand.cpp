#include "launchcommand.h"

#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>

namespace
{
const char* kFlatpakInfoPath = "/.flatpak-info";

QString quoteIfNeeded(const QString& arg)
{
    if (arg.isEmpty())
        return QStringLiteral("\"\"");
    if (!arg.contains(QChar(' ')) && !arg.contains(QChar('"')) && !arg.contains(QChar('\t')))
        return arg;

    QString escaped = arg;
    escaped.replace(QStringLiteral("\""), QStringLiteral("\\\""));
    return QStringLiteral("\"%1\"").arg(escaped);
}
}

namespace LaunchCommand
{
bool isFlatpakSandbox()
{
    return QFileInfo::exists(QString::fromLatin1(kFlatpakInfoPath));
}

LaunchRequest build(const QString &targetPath, const RuntimeConfig &runtime, bool sandboxed)
{
    LaunchRequest req;
    req.targetPath = targetPath;

    if (sandboxed)
    {
        req.program = runtime.hostSpawnCommand;
        req.arguments << QStringLiteral("--host") << runtime.wineCommand << targetPath;
    }
    else
    {
        req.program = runtime.wineCommand;
        req.arguments << targetPath;
    }

    req.workingDirectory = QFileInfo(targetPath).absolutePath();
    return req;
}

QString resolveProgram(const QString &program)
{
    const QString p = program.trimmed();
    if (p.isEmpty())
        return QString();

    // Anything with a separator is a path, not a PATH lookup.
    if (p.contains(QChar('/')))
    {
        const QFileInfo fi(p);
        if (fi.isFile() && fi.isExecutable())
            return QDir::cleanPath(fi.absoluteFilePath());
        return QString();
    }

    return QStandardPaths::findExecutable(p);
}

QString findRuntime(const RuntimeConfig &runtime)
{
    return resolveProgram(runtime.wineCommand);
}

QString describe(const LaunchRequest &request)
{
    QStringList parts;
    parts.reserve(request.arguments.size() + 1);
    parts << quoteIfNeeded(request.program);
    for (const QString& a : request.arguments)
        parts << quoteIfNeeded(a);
    return parts.join(QChar(' '));
}
}
