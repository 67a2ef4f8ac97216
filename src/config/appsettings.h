#pragma once
/**
 * @file appsettings.h
 * @brief Local configuration (QSettings/ini) data structures and read/write interface.
 *
 * Stored in ./config.ini next to the executable:
 * - Wine runtime command and the host-spawn helper used inside Flatpak
 * - last directory the file dialog was confirmed in
 * - main window geometry
 *
 * The selected executable itself is session-only and never written here.
 */

#include <QString>
#include <QByteArray>

/**
 * @brief How the Wine runtime is invoked.
 * - wineCommand      : program name looked up on PATH, or an absolute path
 * - hostSpawnCommand : helper that runs a program on the host from inside Flatpak
 */
struct RuntimeConfig
{
    QString wineCommand = "wine";
    QString hostSpawnCommand = "flatpak-spawn";
};

/**
 * @brief Settings aggregate
 */
struct SettingsData
{
    QString lastBrowseDir;          ///< last directory confirmed in the file dialog
    RuntimeConfig runtime;
    QByteArray windowGeometry;      ///< QWidget::saveGeometry() blob
};

class AppSettings
{
public:
    // ---- full read/write ----
    static SettingsData load();
    static void save(const SettingsData& data);

    // ---- per-block saves ----
    static void saveLastBrowseDir(const QString& dir);
    static void saveRuntime(const RuntimeConfig& runtime);
    static void saveWindowGeometry(const QByteArray& geometry);

    /**
     * @brief Redirect the ini file; an empty path restores <appDir>/config.ini.
     */
    static void setIniPath(const QString& path);
    static QString iniPath();
};
