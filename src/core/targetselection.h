#pragma once
/**
 * @file targetselection.h
 * @brief The executable currently selected for launch (session-only).
 *
 * Lifecycle: empty -> set by a confirmed file dialog (or a manual edit)
 * -> replaced by the next selection -> discarded with the window.
 * A cancelled dialog leaves the current selection untouched.
 */

#include <QObject>
#include <QString>

class TargetSelection : public QObject
{
    Q_OBJECT
public:
    explicit TargetSelection(QObject* parent = nullptr);

    bool hasTarget() const { return !m_path.isEmpty(); }
    QString path() const { return m_path; }
    QString fileName() const;

    /**
     * @brief Apply the return value of QFileDialog::getOpenFileName.
     * @param chosen chosen file, empty when the user cancelled
     * @return true if the selection was replaced
     */
    bool applyDialogResult(const QString& chosen);

    /**
     * @brief Manual edit of the path field; trimmed and made absolute, empty clears.
     */
    void setPath(const QString& text);
    void clear();

    /**
     * @brief Directory the file dialog should open in.
     * Current target's directory, else lastBrowseDir if it still exists, else home.
     */
    QString browseStartDir(const QString& lastBrowseDir) const;

    static QString dialogFilter();

signals:
    void changed(const QString& path);

private:
    QString m_path;
};
