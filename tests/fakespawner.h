#pragma once
/**
 * @file fakespawner.h
 * @brief Recording ProcessSpawner for tests; called from QThreadPool workers.
 */

#include <QMutex>
#include <QMutexLocker>
#include <QVector>

#include <stdexcept>

#include "src/services/processspawner.h"

class FakeSpawner : public ProcessSpawner
{
public:
    enum class Mode { Succeed, Fail, Throw, ThrowUnknown };

    explicit FakeSpawner(Mode mode = Mode::Succeed) : m_mode(mode) {}

    LaunchResult spawn(const LaunchRequest& request) override
    {
        {
            QMutexLocker lock(&m_mutex);
            m_requests.push_back(request);
        }

        if (m_mode == Mode::Throw)
            throw std::runtime_error("fork failed");
        if (m_mode == Mode::ThrowUnknown)
            throw 42;

        LaunchResult r;
        r.targetPath = request.targetPath;
        if (m_mode == Mode::Fail)
        {
            r.error = LaunchError::SpawnFailed;
            r.message = QStringLiteral("Permission denied");
            return r;
        }
        r.ok = true;
        r.pid = 4242;
        return r;
    }

    int callCount() const
    {
        QMutexLocker lock(&m_mutex);
        return m_requests.size();
    }

    QVector<LaunchRequest> requests() const
    {
        QMutexLocker lock(&m_mutex);
        return m_requests;
    }

private:
    Mode m_mode;
    mutable QMutex m_mutex;
    QVector<LaunchRequest> m_requests;
};
