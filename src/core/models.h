#pragma once
/**
 * @file models.h
 * @brief Core data models shared across the app.
 */

#include <QMetaType>
#include <QString>
#include <QStringList>

/**
 * @brief Why a launch did not produce a running process.
 */
enum class LaunchError
{
    None = 0,
    NoTarget,        ///< launch requested without a selected executable
    TargetMissing,   ///< selected path does not exist
    RuntimeMissing,  ///< Wine (or the host-spawn helper) not found
    SpawnFailed      ///< process creation itself failed
};

/**
 * @brief One fully-resolved process invocation.
 */
struct LaunchRequest
{
    QString targetPath;          ///< Windows executable
    QString program;             ///< wine, or flatpak-spawn inside the sandbox
    QStringList arguments;
    QString workingDirectory;    ///< directory containing targetPath
};

/**
 * @brief Outcome of a launch, delivered back to the UI thread.
 */
struct LaunchResult
{
    bool ok = false;
    LaunchError error = LaunchError::None;
    qint64 pid = -1;
    QString targetPath;
    QString message;             ///< user-readable failure reason (empty on success)
};

Q_DECLARE_METATYPE(LaunchResult)

inline QString launchErrorToString(LaunchError e)
{
    switch (e)
    {
    case LaunchError::None:           return QStringLiteral("None");
    case LaunchError::NoTarget:       return QStringLiteral("NoTarget");
    case LaunchError::TargetMissing:  return QStringLiteral("TargetMissing");
    case LaunchError::RuntimeMissing: return QStringLiteral("RuntimeMissing");
    case LaunchError::SpawnFailed:    return QStringLiteral("SpawnFailed");
    default: return QStringLiteral("?");
    }
}
