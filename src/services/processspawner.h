#pragma once
/**
 * @file processspawner.h
 * @brief Process creation seam: start one detached process per request.
 *
 * spawn() is called from a QThreadPool worker, so implementations must not
 * touch widgets or rely on the caller's event loop.
 */

#include "../core/models.h"

class ProcessSpawner
{
public:
    virtual ~ProcessSpawner() = default;

    virtual LaunchResult spawn(const LaunchRequest& request) = 0;
};

/**
 * @brief QProcess::startDetached based spawner.
 * stdout/stderr of the child go to the null device; the child outlives the app.
 */
class QProcessSpawner : public ProcessSpawner
{
public:
    LaunchResult spawn(const LaunchRequest& request) override;
};
