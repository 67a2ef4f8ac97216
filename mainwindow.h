#pragma once
/**
 * @brief Main window: pick a Windows executable and launch it through Wine.
 */

#include <QMainWindow>
#include <QPointer>

#include "src/config/appsettings.h"
#include "src/core/models.h"
#include "src/ui/theme.h"

class QLineEdit;
class QLabel;

class ActionButton;
class TargetSelection;
class LaunchService;

class MainWindow : public QMainWindow
{
    Q_OBJECT
public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow() override;

private slots:
    void selectTarget();
    void launchTarget();
    void onPathEdited(const QString& text);
    void onTargetChanged(const QString& path);

    // Launch service callbacks
    void onLaunchStarted(const QString& targetPath);
    void onLaunchFinished(const LaunchResult& result);
    void onLaunchLogLine(const QString& line);

    void checkRuntime();

private:
    void buildUi();
    void wireSignals();
    void setStatus(const QString& text, Theme::StatusTone tone);

private:
    SettingsData m_settings;
    bool m_sandboxed = false;
    bool m_runtimeFound = true;

    QPointer<TargetSelection> m_target;
    QPointer<LaunchService>   m_launcher;

    QLineEdit* m_editPath = nullptr;
    ActionButton* m_btnBrowse = nullptr;
    ActionButton* m_btnLaunch = nullptr;
    QLabel* m_lblStatus = nullptr;
};
