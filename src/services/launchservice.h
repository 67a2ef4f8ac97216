#pragma once
/**
 * @file launchservice.h
 * @brief Launch service: validate a target, spawn Wine off the GUI thread, report back.
 *
 * - Empty target    -> launchFinished(NoTarget), nothing spawned
 * - Missing file    -> launchFinished(TargetMissing), nothing spawned
 * - Otherwise       -> launchStarted, one spawn on QThreadPool, launchFinished on this object's thread
 *
 * Launches are independent: no queue, no cancellation, no retry.
 */

#include <QObject>
#include <QString>
#include <QFile>
#include <QTextStream>

#include <memory>
#include <utility>

#include "../config/appsettings.h"
#include "../core/models.h"

class ProcessSpawner;

class LaunchService : public QObject
{
    Q_OBJECT
public:
    explicit LaunchService(QObject* parent = nullptr);
    explicit LaunchService(std::shared_ptr<ProcessSpawner> spawner, QObject* parent = nullptr);
    ~LaunchService() override;

    void setRuntime(const RuntimeConfig& runtime) { m_runtime = runtime; }
    const RuntimeConfig& runtime() const { return m_runtime; }

    void setSandboxed(bool sandboxed) { m_sandboxed = sandboxed; }
    bool isSandboxed() const { return m_sandboxed; }

    /**
     * @brief Enable the per-session log file under <dir>/logs; empty disables it.
     */
    void setLogDirectory(const QString& dir);

    /**
     * @brief Launch the target through Wine.
     * @return true if a spawn was scheduled; false if the request was refused
     *         (launchFinished has then already been emitted)
     */
    bool launch(const QString& targetPath);

    int pendingCount() const { return m_pending; }

signals:
    void launchStarted(const QString& targetPath);
    void launchFinished(const LaunchResult& result);
    void logLine(const QString& line);

private:
    void refuse(const QString& targetPath, LaunchError error, const QString& message);
    void onSpawnFinished(const LaunchResult& result);
    void logLaunch(const QString& status, qint64 pid, const QString& path, const QString& detail);
    void writeLogLine(const QString& line);
    void startSessionLog();

private:
    std::shared_ptr<ProcessSpawner> m_spawner;
    RuntimeConfig m_runtime;
    bool m_sandboxed = false;
    int m_pending = 0;

    QString m_logDir;
    QFile m_logFile;
    QTextStream m_logStream;
    bool m_logReady = false;
};
