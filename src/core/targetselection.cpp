#include "targetselection.h"

#include <QDir>
#include <QFileInfo>

TargetSelection::TargetSelection(QObject *parent)
    : QObject(parent)
{
}

QString TargetSelection::fileName() const
{
    return QFileInfo(m_path).fileName();
}

bool TargetSelection::applyDialogResult(const QString &chosen)
{
    if (chosen.isEmpty())
        return false; // cancelled

    const QString abs = QFileInfo(chosen).absoluteFilePath();
    if (abs != m_path)
    {
        m_path = abs;
        emit changed(m_path);
    }
    return true;
}

void TargetSelection::setPath(const QString &text)
{
    const QString trimmed = text.trimmed();
    const QString p = trimmed.isEmpty() ? QString() : QFileInfo(trimmed).absoluteFilePath();
    if (p == m_path)
        return;
    m_path = p;
    emit changed(m_path);
}

void TargetSelection::clear()
{
    setPath(QString());
}

QString TargetSelection::browseStartDir(const QString &lastBrowseDir) const
{
    if (hasTarget())
    {
        const QString dir = QFileInfo(m_path).absolutePath();
        if (QFileInfo(dir).isDir())
            return dir;
    }
    if (!lastBrowseDir.isEmpty() && QFileInfo(lastBrowseDir).isDir())
        return lastBrowseDir;
    return QDir::homePath();
}

QString TargetSelection::dialogFilter()
{
    return QStringLiteral("Executables (*.exe);;All Files (*)");
}
