/**
 * @file launchservice.cpp
 * @brief Launch service: QtConcurrent spawn + QFutureWatcher hand-off to the GUI thread.
 */

#include "launchservice.h"

#include "processspawner.h"
#include "../core/launchcommand.h"

#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QFutureWatcher>
#include <QtConcurrent/QtConcurrentRun>

#include <exception>

#if (QT_VERSION >= QT_VERSION_CHECK(6, 0, 0))
    #include <QStringConverter>
#endif

LaunchService::LaunchService(QObject *parent)
    : LaunchService(std::make_shared<QProcessSpawner>(), parent)
{
}

LaunchService::LaunchService(std::shared_ptr<ProcessSpawner> spawner, QObject *parent)
    : QObject(parent)
    , m_spawner(std::move(spawner))
{
    qRegisterMetaType<LaunchResult>("LaunchResult");
}

LaunchService::~LaunchService()
{
    if (m_logFile.isOpen())
        m_logFile.close();
}

void LaunchService::setLogDirectory(const QString &dir)
{
    if (dir == m_logDir && m_logReady)
        return;

    m_logDir = dir;
    if (m_logFile.isOpen())
        m_logFile.close();
    m_logReady = false;

    if (!m_logDir.isEmpty())
        startSessionLog();
}

bool LaunchService::launch(const QString &targetPath)
{
    const QString trimmed = targetPath.trimmed();
    if (trimmed.isEmpty())
    {
        refuse(trimmed, LaunchError::NoTarget, tr("Please select an executable file first."));
        return false;
    }

    // Wine runs in the target's directory, so a relative argument would resolve twice.
    const QString path = QFileInfo(trimmed).absoluteFilePath();
    if (!QFileInfo::exists(path))
    {
        refuse(path, LaunchError::TargetMissing, tr("The specified file does not exist."));
        return false;
    }

    const LaunchRequest req = LaunchCommand::build(path, m_runtime, m_sandboxed);
    logLaunch(QStringLiteral("START"), -1, path, LaunchCommand::describe(req));
    emit launchStarted(path);

    ++m_pending;

    auto* watcher = new QFutureWatcher<LaunchResult>(this);
    connect(watcher, &QFutureWatcher<LaunchResult>::finished, this, [this, watcher]() {
        const LaunchResult result = watcher->result();
        watcher->deleteLater();
        onSpawnFinished(result);
    });

    // The task owns a reference to the spawner, so it may outlive this service.
    std::shared_ptr<ProcessSpawner> spawner = m_spawner;
    watcher->setFuture(QtConcurrent::run([spawner, req]() -> LaunchResult {
        try
        {
            return spawner->spawn(req);
        }
        catch (const std::exception& e)
        {
            LaunchResult r;
            r.targetPath = req.targetPath;
            r.error = LaunchError::SpawnFailed;
            r.message = QString::fromLocal8Bit(e.what());
            return r;
        }
        catch (...)
        {
            LaunchResult r;
            r.targetPath = req.targetPath;
            r.error = LaunchError::SpawnFailed;
            r.message = QStringLiteral("Unknown error while starting the process");
            return r;
        }
    }));

    return true;
}

void LaunchService::refuse(const QString &targetPath, LaunchError error, const QString &message)
{
    LaunchResult r;
    r.targetPath = targetPath;
    r.error = error;
    r.message = message;

    logLaunch(QStringLiteral("REFUSED"), -1, targetPath,
              QStringLiteral("%1: %2").arg(launchErrorToString(error), message));
    emit launchFinished(r);
}

void LaunchService::onSpawnFinished(const LaunchResult &result)
{
    --m_pending;

    if (result.ok)
        logLaunch(QStringLiteral("OK"), result.pid, result.targetPath, QString());
    else
        logLaunch(QStringLiteral("FAIL"), result.pid, result.targetPath,
                  QStringLiteral("%1: %2").arg(launchErrorToString(result.error), result.message));

    emit launchFinished(result);
}

void LaunchService::logLaunch(const QString &status, qint64 pid, const QString &path, const QString &detail)
{
    const QString ts = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");
    QString line = QStringLiteral("[%1] [LAUNCH] [%2] [%3] [%4]")
                       .arg(ts)
                       .arg(status)
                       .arg(pid)
                       .arg(path);
    if (!detail.isEmpty())
        line += QStringLiteral(" ") + detail;
    writeLogLine(line);
}

void LaunchService::writeLogLine(const QString &line)
{
    emit logLine(line);

    if (m_logReady && m_logFile.isOpen())
    {
        m_logStream << line << "\n";
        m_logStream.flush();
    }
}

void LaunchService::startSessionLog()
{
    QDir d(m_logDir);
    if (!d.exists("logs"))
        d.mkpath("logs");

    const QString ts = QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss_zzz");
    const QString filePath = d.filePath(QString("logs/%1.log").arg(ts));

    m_logFile.setFileName(filePath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Text))
    {
        m_logReady = false;
        qWarning() << "Cannot create launch log" << filePath << m_logFile.errorString();
        emit logLine(QStringLiteral("Failed to create log file: %1").arg(filePath));
        return;
    }

    m_logStream.setDevice(&m_logFile);
#if (QT_VERSION >= QT_VERSION_CHECK(6, 0, 0))
    m_logStream.setEncoding(QStringConverter::Utf8);
#else
    m_logStream.setCodec("UTF-8");
#endif

    m_logReady = true;
}
