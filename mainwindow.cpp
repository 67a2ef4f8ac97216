#include "mainwindow.h"

#include <QWidget>
#include <QFrame>
#include <QLineEdit>
#include <QLabel>
#include <QMessageBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QCoreApplication>
#include <QTimer>
#include <QDebug>

#include "src/core/launchcommand.h"
#include "src/core/targetselection.h"
#include "src/services/launchservice.h"
#include "src/ui/actionbutton.h"

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
{
    m_settings = AppSettings::load();
    m_sandboxed = LaunchCommand::isFlatpakSandbox();

    m_target   = new TargetSelection(this);
    m_launcher = new LaunchService(this);
    m_launcher->setRuntime(m_settings.runtime);
    m_launcher->setSandboxed(m_sandboxed);
    m_launcher->setLogDirectory(QCoreApplication::applicationDirPath());

    buildUi();
    wireSignals();

    if (!m_settings.windowGeometry.isEmpty())
        restoreGeometry(m_settings.windowGeometry);

    setStatus(tr("Ready"), Theme::StatusTone::Idle);

    // After show(), so the warning is parented to a visible window.
    QTimer::singleShot(0, this, &MainWindow::checkRuntime);
}

MainWindow::~MainWindow()
{
    AppSettings::saveWindowGeometry(saveGeometry());
}

void MainWindow::buildUi()
{
    setWindowTitle(tr("WUI - Wine User Interface"));
    setMinimumSize(600, 400);
    setStyleSheet(Theme::windowStyleSheet());

    QWidget* central = new QWidget(this);
    setCentralWidget(central);
    auto* root = new QVBoxLayout(central);
    root->setSpacing(20);
    root->setContentsMargins(40, 40, 40, 40);

    // Header
    auto* header = new QVBoxLayout();
    auto* title = new QLabel(tr("Wine Runner"), central);
    title->setStyleSheet(Theme::titleStyleSheet());
    auto* subtitle = new QLabel(tr("Select a Windows executable (.exe) to run seamlessly on Linux"), central);
    subtitle->setStyleSheet(Theme::subtitleStyleSheet());
    header->addWidget(title);
    header->addWidget(subtitle);
    root->addLayout(header);

    // Content
    auto* frame = new QFrame(central);
    frame->setObjectName("contentFrame");
    frame->setStyleSheet(Theme::contentFrameStyleSheet());
    auto* content = new QVBoxLayout(frame);
    content->setSpacing(15);
    content->setContentsMargins(20, 20, 20, 20);

    auto* fieldLabel = new QLabel(tr("Executable Path"), frame);
    fieldLabel->setStyleSheet(Theme::fieldLabelStyleSheet());
    content->addWidget(fieldLabel);

    auto* input = new QHBoxLayout();
    m_editPath = new QLineEdit(frame);
    m_editPath->setPlaceholderText(tr("Select .exe file..."));
    m_btnBrowse = new ActionButton(tr("Browse"), false, frame);
    m_btnBrowse->setFixedWidth(100);
    input->addWidget(m_editPath, 1);
    input->addWidget(m_btnBrowse);
    content->addLayout(input);

    m_lblStatus = new QLabel(frame);
    content->addWidget(m_lblStatus);

    root->addWidget(frame);

    // Actions
    auto* actions = new QHBoxLayout();
    actions->addStretch(1);
    m_btnLaunch = new ActionButton(tr("Launch Application"), true, central);
    m_btnLaunch->setMinimumWidth(150);
    actions->addWidget(m_btnLaunch);
    root->addLayout(actions);
    root->addStretch(1);
}

void MainWindow::wireSignals()
{
    connect(m_btnBrowse, &QPushButton::clicked, this, &MainWindow::selectTarget);
    connect(m_btnLaunch, &QPushButton::clicked, this, &MainWindow::launchTarget);
    connect(m_editPath, &QLineEdit::textEdited, this, &MainWindow::onPathEdited);
    connect(m_editPath, &QLineEdit::returnPressed, this, &MainWindow::launchTarget);

    connect(m_target, &TargetSelection::changed, this, &MainWindow::onTargetChanged);

    connect(m_launcher, &LaunchService::launchStarted, this, &MainWindow::onLaunchStarted);
    connect(m_launcher, &LaunchService::launchFinished, this, &MainWindow::onLaunchFinished);
    connect(m_launcher, &LaunchService::logLine, this, &MainWindow::onLaunchLogLine);
}

void MainWindow::setStatus(const QString &text, Theme::StatusTone tone)
{
    m_lblStatus->setText(text);
    m_lblStatus->setStyleSheet(Theme::statusStyleSheet(tone));
}

void MainWindow::checkRuntime()
{
    // The host runtime is invisible from inside the sandbox.
    if (m_sandboxed)
        return;

    const QString wine = LaunchCommand::findRuntime(m_settings.runtime);
    m_runtimeFound = !wine.isEmpty();
    if (m_runtimeFound)
    {
        qDebug() << "Wine runtime:" << wine;
        return;
    }

    qWarning() << "Wine runtime not found:" << m_settings.runtime.wineCommand;
    QMessageBox::warning(this, tr("Wine Not Found"),
                         tr("Wine is not detected in your system path.\n"
                            "Please make sure Wine is installed to use this application."));
    setStatus(tr("Error: Wine not found"), Theme::StatusTone::Error);
    m_btnLaunch->setEnabled(false);
}

void MainWindow::selectTarget()
{
    const QString startDir = m_target->browseStartDir(m_settings.lastBrowseDir);
    const QString path = QFileDialog::getOpenFileName(this, tr("Select Windows Executable"),
                                                      startDir, TargetSelection::dialogFilter());
    if (!m_target->applyDialogResult(path))
        return;

    m_editPath->setText(m_target->path());
    setStatus(tr("Ready to launch: %1").arg(m_target->fileName()), Theme::StatusTone::Ready);

    m_settings.lastBrowseDir = QFileInfo(m_target->path()).absolutePath();
    AppSettings::saveLastBrowseDir(m_settings.lastBrowseDir);
}

void MainWindow::onPathEdited(const QString &text)
{
    m_target->setPath(text);
}

void MainWindow::onTargetChanged(const QString &)
{
    if (!m_runtimeFound)
        return; // keep the runtime error visible

    // selectTarget() overwrites this with "Ready to launch" after a dialog pick.
    setStatus(tr("Ready"), Theme::StatusTone::Idle);
}

void MainWindow::launchTarget()
{
    if (!m_btnLaunch->isEnabled())
        return;
    m_launcher->launch(m_target->path());
}

void MainWindow::onLaunchStarted(const QString &targetPath)
{
    setStatus(tr("Starting: %1").arg(QFileInfo(targetPath).fileName()), Theme::StatusTone::Ready);
}

void MainWindow::onLaunchFinished(const LaunchResult &result)
{
    const QString name = QFileInfo(result.targetPath).fileName();

    switch (result.error)
    {
    case LaunchError::None:
        setStatus(tr("Running: %1").arg(name), Theme::StatusTone::Ready);
        return;
    case LaunchError::NoTarget:
        QMessageBox::warning(this, tr("No File Selected"), result.message);
        return;
    case LaunchError::TargetMissing:
        QMessageBox::critical(this, tr("File Not Found"), result.message);
        return;
    case LaunchError::RuntimeMissing:
    case LaunchError::SpawnFailed:
    default:
        setStatus(tr("Failed to launch: %1").arg(name), Theme::StatusTone::Error);
        QMessageBox::critical(this, tr("Execution Error"),
                              tr("Failed to run application:\n%1").arg(result.message));
        return;
    }
}

void MainWindow::onLaunchLogLine(const QString &line)
{
    qDebug() << line;
}
