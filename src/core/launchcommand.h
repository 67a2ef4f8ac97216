#pragma once
/**
 * @file launchcommand.h
 * @brief Builds the Wine invocation for a selected executable.
 *
 * Command shapes:
 * - native  : <wineCommand> <target>
 * - Flatpak : <hostSpawnCommand> --host <wineCommand> <target>
 *
 * The target is always Wine's only argument; the working directory is the
 * directory that contains the target.
 */

#include <QString>

#include "../config/appsettings.h"
#include "models.h"

namespace LaunchCommand
{
    /**
     * @brief True when running inside a Flatpak sandbox (/.flatpak-info present).
     */
    bool isFlatpakSandbox();

    LaunchRequest build(const QString& targetPath, const RuntimeConfig& runtime, bool sandboxed);

    /**
     * @brief Resolve a program name the way execvp would.
     * @return absolute path, or empty if not found / not executable
     */
    QString resolveProgram(const QString& program);

    /**
     * @brief Resolve runtime.wineCommand on this host.
     */
    QString findRuntime(const RuntimeConfig& runtime);

    /**
     * @brief Single-line rendering for logs, e.g. wine "/games/My Game/setup.exe"
     */
    QString describe(const LaunchRequest& request);
}
