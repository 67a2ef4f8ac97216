/**
 * @file main.cpp
 * @brief Entry point: Qt Widgets launcher that runs Windows executables through Wine.
 *
 * - Settings (runtime command, last browse dir, geometry) live in AppSettings (QSettings/ini)
 * - UI: MainWindow (path field + Browse, Launch)
 */

#include <QApplication>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QIcon>

#include "mainwindow.h"

namespace
{
const char* kDesktopId = "io.github.linuxpengueni1901.WUI";

QString findAppIcon()
{
    // Development tree first, then the installed (Flatpak) location.
    const QString local = QDir(QCoreApplication::applicationDirPath()).filePath("assets/icon.png");
    if (QFileInfo::exists(local))
        return local;

    const QString installed = QStringLiteral("/app/share/icons/hicolor/512x512/apps/%1.png")
                                  .arg(QString::fromLatin1(kDesktopId));
    if (QFileInfo::exists(installed))
        return installed;

    return QString();
}
}

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    // Organization/app names scope QSettings defaults; the ini path itself is fixed by AppSettings.
    QCoreApplication::setOrganizationName("WUI");
    QCoreApplication::setApplicationName("WUI");
    QApplication::setStyle("Fusion");
    QGuiApplication::setDesktopFileName(QString::fromLatin1(kDesktopId));

    const QString icon = findAppIcon();
    if (!icon.isEmpty())
        app.setWindowIcon(QIcon(icon));
    else
        qWarning() << "Warning: Icon not found";

    MainWindow w;
    w.show();

    return app.exec();
}
